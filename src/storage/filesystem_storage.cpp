#include "cortex/storage/filesystem_storage.hpp"

#include "cortex/common/fs.hpp"
#include "cortex/config/config.hpp"

#include <filesystem>

namespace cortex::storage {

namespace {

namespace fs = std::filesystem;

StorageLayout normalized_layout(StorageLayout layout) {
  layout.memory_extension = normalize_extension(layout.memory_extension);
  layout.index_extension = normalize_extension(layout.index_extension);
  if (layout.memory_extension.empty()) {
    layout.memory_extension = ".md";
  }
  if (layout.index_extension.empty()) {
    layout.index_extension = ".yaml";
  }
  return layout;
}

} // namespace

FilesystemStorage::FilesystemStorage(FilesystemStorageOptions options)
    : layout_(normalized_layout(std::move(options.layout))),
      reindex_timeout_(options.reindex_timeout),
      indexes_(layout_, std::move(options.tokenizer), std::move(options.serializer),
               options.strict_reindex) {}

common::Result<std::unique_ptr<FilesystemStorage>>
FilesystemStorage::from_config(const config::Config &config,
                               std::shared_ptr<const memory::IMemorySerializer> serializer) {
  const auto validated = config::validate_config(config);
  if (!validated.ok()) {
    return common::Result<std::unique_ptr<FilesystemStorage>>::failure(validated.error());
  }

  FilesystemStorageOptions options{
      .layout = StorageLayout{.root = config::resolved_store_root(config),
                              .memory_extension = config.storage.memory_extension,
                              .index_extension = config.storage.index_extension},
      .strict_reindex = config.index.strict_reindex,
      .reindex_timeout = std::chrono::milliseconds(config.index.reindex_timeout_ms),
      .tokenizer = nullptr,
      .serializer = std::move(serializer)};
  return common::Result<std::unique_ptr<FilesystemStorage>>::success(
      std::make_unique<FilesystemStorage>(std::move(options)));
}

common::Result<std::optional<std::string>>
FilesystemStorage::read_memory_file(const std::string &slug_path) {
  const auto path = resolve_storage_path(layout_.root, memory_relative_path(layout_, slug_path),
                                         common::ErrorCode::ReadFailed);
  if (!path.ok()) {
    return common::Result<std::optional<std::string>>::failure(path.error());
  }
  return common::read_text_file(path.value(), common::ErrorCode::ReadFailed);
}

common::Status FilesystemStorage::write_memory_file(const std::string &slug_path,
                                                    const std::string &contents,
                                                    const WriteOptions &options) {
  const auto path = resolve_storage_path(layout_.root, memory_relative_path(layout_, slug_path),
                                         common::ErrorCode::WriteFailed);
  if (!path.ok()) {
    return common::Status::failure(path.error());
  }

  std::lock_guard<std::mutex> lock(mutex_);
  auto written = common::write_text_file_atomic(path.value(), contents,
                                                common::ErrorCode::WriteFailed);
  if (!written.ok() || !options.allow_index_update) {
    return written;
  }
  return indexes_.upsert_memory(slug_path, contents, options.allow_index_create);
}

common::Status FilesystemStorage::remove_memory_file(const std::string &slug_path) {
  const auto path = resolve_storage_path(layout_.root, memory_relative_path(layout_, slug_path),
                                         common::ErrorCode::WriteFailed);
  if (!path.ok()) {
    return common::Status::failure(path.error());
  }
  std::error_code ec;
  fs::remove(path.value(), ec);
  if (ec && ec != std::errc::no_such_file_or_directory) {
    return common::Status::failure(common::io_error(
        common::ErrorCode::WriteFailed, "Failed to remove memory file", path.value().string(), ec));
  }
  return common::Status::success();
}

common::Status FilesystemStorage::move_memory_file(const std::string &from, const std::string &to) {
  const auto source = resolve_storage_path(layout_.root, memory_relative_path(layout_, from),
                                           common::ErrorCode::WriteFailed);
  if (!source.ok()) {
    return common::Status::failure(source.error());
  }
  const auto destination = resolve_storage_path(layout_.root, memory_relative_path(layout_, to),
                                                common::ErrorCode::WriteFailed);
  if (!destination.ok()) {
    return common::Status::failure(destination.error());
  }

  std::error_code ec;
  if (!fs::is_directory(destination.value().parent_path(), ec)) {
    return common::Status::failure(
        common::make_error(common::ErrorCode::WriteFailed,
                           "Destination category directory does not exist",
                           destination.value().parent_path().string()));
  }
  fs::rename(source.value(), destination.value(), ec);
  if (ec) {
    return common::Status::failure(common::io_error(common::ErrorCode::WriteFailed,
                                                    "Failed to move memory file",
                                                    source.value().string(), ec));
  }
  return common::Status::success();
}

common::Result<std::optional<std::string>>
FilesystemStorage::read_index_file(const std::string &name) {
  const auto path = resolve_storage_path(layout_.root, index_relative_path(layout_, name),
                                         common::ErrorCode::ReadFailed);
  if (!path.ok()) {
    return common::Result<std::optional<std::string>>::failure(path.error());
  }
  return common::read_text_file(path.value(), common::ErrorCode::ReadFailed);
}

common::Status FilesystemStorage::write_index_file(const std::string &name,
                                                   const std::string &contents) {
  const auto path = resolve_storage_path(layout_.root, index_relative_path(layout_, name),
                                         common::ErrorCode::WriteFailed);
  if (!path.ok()) {
    return common::Status::failure(path.error());
  }
  std::lock_guard<std::mutex> lock(mutex_);
  return common::write_text_file_atomic(path.value(), contents, common::ErrorCode::WriteFailed);
}

common::Result<ReindexResult>
FilesystemStorage::reindex_category_indexes(const ReindexOptions &options) {
  const auto bound = options.timeout.value_or(reindex_timeout_);
  index::IndexStore::Deadline deadline;
  if (options.timeout.has_value() || bound.count() > 0) {
    deadline = std::chrono::steady_clock::now() + bound;
  }

  std::lock_guard<std::mutex> lock(mutex_);
  return indexes_.reindex(deadline);
}

common::Status FilesystemStorage::refresh_memory_index(const std::string &slug_path) {
  const auto path = resolve_storage_path(layout_.root, memory_relative_path(layout_, slug_path),
                                         common::ErrorCode::ReadFailed);
  if (!path.ok()) {
    return common::Status::failure(path.error());
  }

  std::lock_guard<std::mutex> lock(mutex_);
  const auto contents = common::read_text_file(path.value(), common::ErrorCode::ReadFailed);
  if (!contents.ok()) {
    return common::Status::failure(contents.error());
  }
  if (contents.value().has_value()) {
    return indexes_.upsert_memory(slug_path, *contents.value(), true);
  }
  return indexes_.remove_memory(slug_path);
}

common::Result<bool> FilesystemStorage::category_exists(const std::string &path) {
  const auto resolved =
      resolve_storage_path(layout_.root, path, common::ErrorCode::ReadFailed);
  if (!resolved.ok()) {
    return common::Result<bool>::failure(resolved.error());
  }
  std::error_code ec;
  const bool exists = fs::is_directory(resolved.value(), ec);
  if (ec && ec != std::errc::no_such_file_or_directory) {
    return common::Result<bool>::failure(common::io_error(
        common::ErrorCode::ReadFailed, "Failed to stat category", resolved.value().string(), ec));
  }
  return common::Result<bool>::success(exists);
}

common::Status FilesystemStorage::ensure_category_directory(const std::string &path) {
  const auto resolved =
      resolve_storage_path(layout_.root, path, common::ErrorCode::WriteFailed);
  if (!resolved.ok()) {
    return common::Status::failure(resolved.error());
  }
  const auto created = common::ensure_dir(resolved.value());
  if (!created.ok()) {
    return common::Status::failure(created.error());
  }
  return common::Status::success();
}

common::Status FilesystemStorage::delete_category_directory(const std::string &path) {
  const auto resolved =
      resolve_storage_path(layout_.root, path, common::ErrorCode::WriteFailed);
  if (!resolved.ok()) {
    return common::Status::failure(resolved.error());
  }
  const auto root = resolve_storage_path(layout_.root, ".", common::ErrorCode::WriteFailed);
  if (!root.ok()) {
    return common::Status::failure(root.error());
  }
  if (resolved.value() == root.value()) {
    return common::Status::failure(common::make_error(
        common::ErrorCode::WriteFailed, "Refusing to delete the storage root", path));
  }

  std::lock_guard<std::mutex> lock(mutex_);
  std::error_code ec;
  fs::remove_all(resolved.value(), ec);
  if (ec) {
    return common::Status::failure(common::io_error(common::ErrorCode::WriteFailed,
                                                    "Failed to delete category directory",
                                                    resolved.value().string(), ec));
  }
  return common::Status::success();
}

common::Status FilesystemStorage::register_category(const std::string &path) {
  std::lock_guard<std::mutex> lock(mutex_);
  return indexes_.register_category(path);
}

common::Status FilesystemStorage::unregister_category(const std::string &path) {
  std::lock_guard<std::mutex> lock(mutex_);
  return indexes_.unregister_category(path);
}

common::Status
FilesystemStorage::set_category_description(const std::string &path,
                                            const std::optional<std::string> &description) {
  std::lock_guard<std::mutex> lock(mutex_);
  return indexes_.set_description(path, description);
}

} // namespace cortex::storage
