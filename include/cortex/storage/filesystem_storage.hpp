#pragma once

#include "cortex/config/schema.hpp"
#include "cortex/index/index_store.hpp"
#include "cortex/memory/serializer.hpp"
#include "cortex/memory/tokenizer.hpp"
#include "cortex/storage/adapter.hpp"
#include "cortex/storage/paths.hpp"

#include <chrono>
#include <memory>
#include <mutex>

namespace cortex::storage {

struct FilesystemStorageOptions {
  StorageLayout layout;
  bool strict_reindex = true;
  /// Default reindex bound; zero means unbounded.
  std::chrono::milliseconds reindex_timeout{0};
  std::shared_ptr<const memory::ITokenizer> tokenizer;
  std::shared_ptr<const memory::IMemorySerializer> serializer;
};

class FilesystemStorage final : public IStorageAdapter {
public:
  explicit FilesystemStorage(FilesystemStorageOptions options);

  [[nodiscard]] static common::Result<std::unique_ptr<FilesystemStorage>>
  from_config(const config::Config &config,
              std::shared_ptr<const memory::IMemorySerializer> serializer);

  [[nodiscard]] const StorageLayout &layout() const { return layout_; }

  [[nodiscard]] common::Result<std::optional<std::string>>
  read_memory_file(const std::string &slug_path) override;
  [[nodiscard]] common::Status write_memory_file(const std::string &slug_path,
                                                 const std::string &contents,
                                                 const WriteOptions &options = {}) override;
  [[nodiscard]] common::Status remove_memory_file(const std::string &slug_path) override;
  [[nodiscard]] common::Status move_memory_file(const std::string &from,
                                                const std::string &to) override;

  [[nodiscard]] common::Result<std::optional<std::string>>
  read_index_file(const std::string &name) override;
  [[nodiscard]] common::Status write_index_file(const std::string &name,
                                                const std::string &contents) override;
  [[nodiscard]] common::Result<ReindexResult>
  reindex_category_indexes(const ReindexOptions &options = {}) override;
  [[nodiscard]] common::Status refresh_memory_index(const std::string &slug_path) override;

  [[nodiscard]] common::Result<bool> category_exists(const std::string &path) override;
  [[nodiscard]] common::Status ensure_category_directory(const std::string &path) override;
  [[nodiscard]] common::Status delete_category_directory(const std::string &path) override;

  [[nodiscard]] common::Status register_category(const std::string &path) override;
  [[nodiscard]] common::Status unregister_category(const std::string &path) override;
  [[nodiscard]] common::Status
  set_category_description(const std::string &path,
                           const std::optional<std::string> &description) override;

private:
  StorageLayout layout_;
  std::chrono::milliseconds reindex_timeout_;
  index::IndexStore indexes_;
  std::mutex mutex_;
};

} // namespace cortex::storage
