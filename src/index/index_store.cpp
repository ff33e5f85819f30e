#include "cortex/index/index_store.hpp"

#include "cortex/common/fs.hpp"
#include "cortex/index/index_builder.hpp"
#include "cortex/memory/identity.hpp"
#include "cortex/observability/global.hpp"

#include <algorithm>
#include <filesystem>
#include <vector>

namespace cortex::index {

namespace {

namespace fs = std::filesystem;
using SteadyClock = std::chrono::steady_clock;

common::Error index_failure(std::string message, const common::Error &cause) {
  return common::wrap_error(common::ErrorCode::IndexUpdateFailed, std::move(message), cause);
}

std::string label(const std::string &category) {
  return category.empty() ? std::string("<root>") : category;
}

std::size_t depth_of(const std::string &category) {
  if (category.empty()) {
    return 0;
  }
  return static_cast<std::size_t>(std::count(category.begin(), category.end(), '/')) + 1;
}

bool deadline_passed(const IndexStore::Deadline &deadline) {
  return deadline.has_value() && SteadyClock::now() >= *deadline;
}

common::Error timeout_error() {
  return common::make_error(common::ErrorCode::ReindexTimeout,
                            "Reindex exceeded its time bound; live indexes left untouched");
}

bool has_extension(const std::string &name, const std::string &extension) {
  return !extension.empty() && name.size() > extension.size() &&
         name.compare(name.size() - extension.size(), extension.size(), extension) == 0;
}

struct ScanResult {
  std::vector<fs::path> memory_files;
  std::vector<fs::path> category_dirs;
  std::vector<fs::path> index_files;
};

// Paths in the result are root-relative. Hidden entries and symlinks are
// never followed.
common::Result<ScanResult> scan_store(const fs::path &root, const storage::StorageLayout &layout) {
  ScanResult result;
  std::vector<fs::path> pending{fs::path()};
  const std::string index_name = layout.index_file_name();

  while (!pending.empty()) {
    const fs::path relative = pending.back();
    pending.pop_back();
    const fs::path absolute = relative.empty() ? root : root / relative;

    std::error_code ec;
    for (fs::directory_iterator it(absolute, ec), end; !ec && it != end; it.increment(ec)) {
      const std::string name = it->path().filename().string();
      if (name.empty() || name.front() == '.') {
        continue;
      }

      std::error_code status_ec;
      const auto status = it->symlink_status(status_ec);
      if (status_ec) {
        return common::Result<ScanResult>::failure(common::io_error(
            common::ErrorCode::ReadFailed, "Failed to stat store entry", it->path().string(),
            status_ec));
      }
      const fs::path child = relative.empty() ? fs::path(name) : relative / name;
      if (fs::is_symlink(status)) {
        continue;
      }
      if (fs::is_directory(status)) {
        result.category_dirs.push_back(child);
        pending.push_back(child);
        continue;
      }
      if (!fs::is_regular_file(status)) {
        continue;
      }
      if (name == index_name) {
        result.index_files.push_back(child);
      } else if (has_extension(name, layout.memory_extension)) {
        result.memory_files.push_back(child);
      }
    }
    if (ec) {
      return common::Result<ScanResult>::failure(common::io_error(
          common::ErrorCode::ReadFailed, "Failed to read store directory", absolute.string(), ec));
    }
  }

  const auto by_generic = [](const fs::path &a, const fs::path &b) {
    return a.generic_string() < b.generic_string();
  };
  std::sort(result.memory_files.begin(), result.memory_files.end(), by_generic);
  std::sort(result.category_dirs.begin(), result.category_dirs.end(), by_generic);
  std::sort(result.index_files.begin(), result.index_files.end(), by_generic);
  return common::Result<ScanResult>::success(std::move(result));
}

std::string normalize_relative_dir(const fs::path &relative) {
  std::vector<std::string> segments;
  for (const auto &part : common::split(relative.generic_string(), '/')) {
    std::string segment = common::to_lower(common::trim(part));
    if (!segment.empty()) {
      segments.push_back(std::move(segment));
    }
  }
  return common::join(segments, "/");
}

void remove_quietly(const fs::path &path) {
  std::error_code ec;
  fs::remove_all(path, ec);
  if (ec) {
    observability::record_warning("index", "Failed to clean up " + path.string() + ": " +
                                               ec.message());
  }
}

} // namespace

IndexStore::IndexStore(storage::StorageLayout layout,
                       std::shared_ptr<const memory::ITokenizer> tokenizer,
                       std::shared_ptr<const memory::IMemorySerializer> serializer,
                       const bool strict_reindex)
    : layout_(std::move(layout)), tokenizer_(std::move(tokenizer)),
      serializer_(std::move(serializer)), strict_reindex_(strict_reindex) {
  if (tokenizer_ == nullptr) {
    tokenizer_ = std::make_shared<memory::HeuristicTokenizer>();
  }
}

common::Result<CategoryIndex> IndexStore::load(const std::string &category,
                                               const bool create_when_missing) const {
  const auto path = storage::resolve_storage_path(
      layout_.root, storage::index_relative_path(layout_, category), common::ErrorCode::ReadFailed);
  if (!path.ok()) {
    return common::Result<CategoryIndex>::failure(
        index_failure("Failed to resolve category index", path.error()));
  }

  const auto contents = common::read_text_file(path.value(), common::ErrorCode::ReadFailed);
  if (!contents.ok()) {
    return common::Result<CategoryIndex>::failure(
        index_failure("Failed to read category index: " + label(category), contents.error()));
  }
  if (!contents.value().has_value()) {
    if (create_when_missing) {
      return common::Result<CategoryIndex>::success(CategoryIndex{});
    }
    return common::Result<CategoryIndex>::failure(common::make_error(
        common::ErrorCode::IndexUpdateFailed, "Category index not found: " + label(category),
        category));
  }

  auto parsed = parse_category_index(*contents.value());
  if (!parsed.ok()) {
    common::Error error =
        index_failure("Failed to parse category index: " + label(category), parsed.error());
    error.path = path.value().string();
    return common::Result<CategoryIndex>::failure(std::move(error));
  }
  return parsed;
}

common::Status IndexStore::store(const std::string &category, const CategoryIndex &index) const {
  const auto path = storage::resolve_storage_path(
      layout_.root, storage::index_relative_path(layout_, category), common::ErrorCode::WriteFailed);
  if (!path.ok()) {
    return common::Status::failure(index_failure("Failed to resolve category index", path.error()));
  }
  auto written = common::write_text_file_atomic(path.value(), serialize_category_index(index),
                                                common::ErrorCode::WriteFailed);
  if (!written.ok()) {
    return common::Status::failure(
        index_failure("Failed to write category index: " + label(category), written.error()));
  }
  return common::Status::success();
}

IndexMemoryEntry IndexStore::describe_memory(const std::string &slug_path,
                                             const std::string &contents) const {
  IndexMemoryEntry entry{.path = slug_path, .token_estimate = tokenizer_->estimate(contents)};
  if (serializer_ != nullptr) {
    if (auto parsed = serializer_->parse(contents); parsed.ok()) {
      entry.updated_at = parsed.value().metadata.updated_at;
    }
  }
  return entry;
}

common::Result<CategoryIndex *> IndexStore::working_index(WorkingSet &set,
                                                          const std::string &category,
                                                          const bool create_when_missing) const {
  if (auto it = set.indexes.find(category); it != set.indexes.end()) {
    return common::Result<CategoryIndex *>::success(&it->second);
  }

  const auto path = storage::resolve_storage_path(
      layout_.root, storage::index_relative_path(layout_, category), common::ErrorCode::ReadFailed);
  if (!path.ok()) {
    return common::Result<CategoryIndex *>::failure(
        index_failure("Failed to resolve category index", path.error()));
  }
  std::error_code ec;
  const bool exists = fs::exists(path.value(), ec);
  if (ec) {
    return common::Result<CategoryIndex *>::failure(common::io_error(
        common::ErrorCode::IndexUpdateFailed, "Failed to stat category index",
        path.value().string(), ec));
  }

  auto loaded = load(category, create_when_missing);
  if (!loaded.ok()) {
    return common::Result<CategoryIndex *>::failure(loaded.error());
  }
  if (!exists) {
    set.dirty.insert(category);
  }
  auto [it, inserted] = set.indexes.emplace(category, std::move(loaded.value()));
  return common::Result<CategoryIndex *>::success(&it->second);
}

common::Status IndexStore::register_chain(WorkingSet &set, const std::string &category,
                                          const bool create_when_missing) const {
  for (const auto &link : memory::category_chain(category)) {
    auto child = working_index(set, link, create_when_missing);
    if (!child.ok()) {
      return common::Status::failure(child.error());
    }
    const std::size_t count = child.value()->memories.size();

    const std::string parent_name = memory::parent_category(link);
    auto parent = working_index(set, parent_name, create_when_missing);
    if (!parent.ok()) {
      return common::Status::failure(parent.error());
    }
    const auto *existing = parent.value()->find_subcategory(link);
    if (existing == nullptr || existing->memory_count != count) {
      upsert_subcategory_entry(*parent.value(),
                               IndexSubcategoryEntry{.path = link, .memory_count = count});
      set.dirty.insert(parent_name);
    }
  }
  return common::Status::success();
}

common::Status IndexStore::flush(const WorkingSet &set) const {
  std::vector<std::string> order(set.dirty.begin(), set.dirty.end());
  // Children first, so a parent never lists a category whose index is missing.
  std::stable_sort(order.begin(), order.end(), [](const std::string &a, const std::string &b) {
    return depth_of(a) > depth_of(b);
  });
  for (const auto &category : order) {
    auto stored = store(category, set.indexes.at(category));
    if (!stored.ok()) {
      return stored;
    }
  }
  return common::Status::success();
}

common::Status IndexStore::upsert_memory(const std::string &slug_path, const std::string &contents,
                                         const bool allow_index_create) {
  const auto identity = memory::validate_slug_path(slug_path);
  if (!identity.ok()) {
    return common::Status::failure(index_failure("Invalid memory slug path", identity.error()));
  }
  const std::string category = identity.value().category_path();

  WorkingSet set;
  auto node = working_index(set, category, allow_index_create);
  if (!node.ok()) {
    return common::Status::failure(node.error());
  }
  upsert_memory_entry(*node.value(), describe_memory(identity.value().slug_path(), contents));
  set.dirty.insert(category);

  auto registered = register_chain(set, category, allow_index_create);
  if (!registered.ok()) {
    return registered;
  }
  auto flushed = flush(set);
  if (flushed.ok()) {
    observability::record_index_updated(category);
  }
  return flushed;
}

common::Status IndexStore::remove_memory(const std::string &slug_path) {
  const auto identity = memory::validate_slug_path(slug_path);
  if (!identity.ok()) {
    return common::Status::failure(index_failure("Invalid memory slug path", identity.error()));
  }
  const std::string category = identity.value().category_path();

  WorkingSet set;
  auto node = working_index(set, category, true);
  if (!node.ok()) {
    return common::Status::failure(node.error());
  }
  if (node.value()->find_memory(identity.value().slug_path()) != nullptr) {
    remove_memory_entry(*node.value(), identity.value().slug_path());
    set.dirty.insert(category);
  }

  auto registered = register_chain(set, category, true);
  if (!registered.ok()) {
    return registered;
  }
  auto flushed = flush(set);
  if (flushed.ok()) {
    observability::record_index_updated(category);
  }
  return flushed;
}

common::Status IndexStore::register_category(const std::string &category) {
  WorkingSet set;
  auto registered = register_chain(set, category, true);
  if (!registered.ok()) {
    return registered;
  }
  return flush(set);
}

common::Status IndexStore::unregister_category(const std::string &category) {
  const std::string parent_name = memory::parent_category(category);
  WorkingSet set;
  auto parent = working_index(set, parent_name, true);
  if (!parent.ok()) {
    return common::Status::failure(parent.error());
  }
  if (!remove_subcategory_entry(*parent.value(), category)) {
    return common::Status::success();
  }
  set.dirty.insert(parent_name);
  return flush(set);
}

common::Status IndexStore::set_description(const std::string &category,
                                           const std::optional<std::string> &description) {
  WorkingSet set;
  auto registered = register_chain(set, category, true);
  if (!registered.ok()) {
    return registered;
  }

  const std::string parent_name = memory::parent_category(category);
  auto parent = working_index(set, parent_name, true);
  if (!parent.ok()) {
    return common::Status::failure(parent.error());
  }
  for (auto &entry : parent.value()->subcategories) {
    if (entry.path == category) {
      entry.description = description;
    }
  }
  set.dirty.insert(parent_name);
  return flush(set);
}

common::Result<storage::ReindexResult> IndexStore::reindex(const Deadline deadline) {
  using Outcome = common::Result<storage::ReindexResult>;
  const auto started = SteadyClock::now();
  storage::ReindexResult result;

  std::error_code ec;
  if (!fs::exists(layout_.root, ec)) {
    if (ec) {
      return Outcome::failure(common::io_error(common::ErrorCode::ReadFailed,
                                               "Failed to stat storage root",
                                               layout_.root.string(), ec));
    }
    return Outcome::success(std::move(result));
  }
  auto root = fs::weakly_canonical(fs::absolute(layout_.root, ec), ec);
  if (ec) {
    return Outcome::failure(common::io_error(common::ErrorCode::ReadFailed,
                                             "Failed to resolve storage root",
                                             layout_.root.string(), ec));
  }

  auto scanned = scan_store(root, layout_);
  if (!scanned.ok()) {
    return Outcome::failure(index_failure("Failed to scan store", scanned.error()));
  }
  const ScanResult &scan = scanned.value();
  if (deadline_passed(deadline)) {
    return Outcome::failure(timeout_error());
  }

  // Summaries and descriptions only live in the index files, so carry them over.
  std::map<std::string, std::string> summaries;
  std::map<std::string, std::string> descriptions;
  for (const auto &relative : scan.index_files) {
    const auto contents = common::read_text_file(root / relative, common::ErrorCode::ReadFailed);
    if (!contents.ok() || !contents.value().has_value()) {
      continue;
    }
    const auto parsed = parse_category_index(*contents.value());
    if (!parsed.ok()) {
      result.warnings.push_back("Ignored unparsable index " + relative.generic_string() + ": " +
                                parsed.error().describe());
      continue;
    }
    for (const auto &entry : parsed.value().memories) {
      if (entry.summary.has_value()) {
        summaries[entry.path] = *entry.summary;
      }
    }
    for (const auto &entry : parsed.value().subcategories) {
      if (entry.description.has_value()) {
        descriptions[entry.path] = *entry.description;
      }
    }
  }

  IndexBuilder builder;
  for (const auto &relative : scan.category_dirs) {
    const auto category = memory::validate_category_path(normalize_relative_dir(relative));
    if (!category.ok()) {
      result.warnings.push_back("Skipped category directory " + relative.generic_string() +
                                " (" + category.error().message + ")");
      continue;
    }
    builder.add_category(category.value());
  }

  std::set<std::string> used;
  for (const auto &relative : scan.memory_files) {
    // Files directly under the root (README.md and the like) belong to no
    // category and are never memories, even in strict mode.
    if (!relative.has_parent_path()) {
      result.warnings.push_back("Skipped: " + relative.generic_string() +
                                " (not inside a category)");
      continue;
    }
    const auto raw_slug =
        storage::to_slug_path_from_relative(relative, layout_.memory_extension).value_or("");
    const auto identity = memory::validate_slug_path(raw_slug);
    if (!identity.ok()) {
      if (strict_reindex_) {
        common::Error error =
            index_failure("Invalid memory path: " + relative.generic_string(), identity.error());
        error.path = relative.generic_string();
        return Outcome::failure(std::move(error));
      }
      result.warnings.push_back("Skipped: " + relative.generic_string() + " (" +
                                identity.error().message + ")");
      continue;
    }

    std::string slug_path = identity.value().slug_path();
    if (used.contains(slug_path)) {
      if (strict_reindex_) {
        return Outcome::failure(common::make_error(common::ErrorCode::IndexUpdateFailed,
                                                   "Duplicate memory path after normalization: " +
                                                       slug_path,
                                                   relative.generic_string()));
      }
      int suffix = 2;
      while (used.contains(slug_path + "-" + std::to_string(suffix))) {
        ++suffix;
      }
      slug_path += "-" + std::to_string(suffix);
      result.warnings.push_back("Collision: " + relative.generic_string() + " indexed as " +
                                slug_path);
    }
    used.insert(slug_path);

    const auto contents = common::read_text_file(root / relative, common::ErrorCode::ReadFailed);
    if (!contents.ok()) {
      return Outcome::failure(index_failure("Failed to read memory file", contents.error()));
    }
    if (!contents.value().has_value()) {
      continue;
    }

    IndexMemoryEntry entry = describe_memory(slug_path, *contents.value());
    if (const auto it = summaries.find(slug_path); it != summaries.end()) {
      entry.summary = it->second;
    }
    builder.add_memory(identity.value().category_path(), std::move(entry));
  }

  for (auto &[category, description] : descriptions) {
    if (builder.has_category(category)) {
      builder.set_description(category, description);
    }
  }
  const auto tree = builder.build();
  if (deadline_passed(deadline)) {
    return Outcome::failure(timeout_error());
  }

  const std::string token = common::random_hex(6);
  const fs::path staging = root / (".reindex-staging-" + token);
  const fs::path backup = root / (".reindex-backup-" + token);

  std::set<std::string> fresh;
  for (const auto &[name, node] : tree) {
    const std::string relative = storage::index_relative_path(layout_, name);
    fresh.insert(relative);
    auto staged = common::write_text_file_atomic(staging / relative, serialize_category_index(node),
                                                 common::ErrorCode::WriteFailed);
    if (!staged.ok()) {
      remove_quietly(staging);
      return Outcome::failure(index_failure("Failed to stage index files", staged.error()));
    }
  }
  if (deadline_passed(deadline)) {
    remove_quietly(staging);
    return Outcome::failure(timeout_error());
  }

  std::vector<std::string> displaced(fresh.begin(), fresh.end());
  for (const auto &relative : scan.index_files) {
    if (!fresh.contains(relative.generic_string())) {
      displaced.push_back(relative.generic_string());
    }
  }

  std::vector<std::pair<fs::path, fs::path>> backed_up;
  std::vector<fs::path> installed;
  const auto rollback = [&]() {
    std::error_code undo_ec;
    for (auto it = installed.rbegin(); it != installed.rend(); ++it) {
      fs::remove(*it, undo_ec);
    }
    for (auto it = backed_up.rbegin(); it != backed_up.rend(); ++it) {
      fs::rename(it->second, it->first, undo_ec);
      if (undo_ec) {
        observability::record_error("index", "Failed to restore " + it->first.string() + ": " +
                                                 undo_ec.message());
      }
    }
    remove_quietly(staging);
    remove_quietly(backup);
  };
  const auto commit_failure = [&](common::Error cause) {
    rollback();
    return Outcome::failure(index_failure("Failed to commit rebuilt indexes", cause));
  };

  // Index files live beside memory files, so the generation swap is a
  // per-file backup and rename rather than one directory rename. Failures
  // inside this process roll back; a crash between renames can leave a mix
  // of generations until the next reindex.
  for (const auto &relative : displaced) {
    const fs::path live = root / relative;
    const auto status = fs::symlink_status(live, ec);
    if (ec && ec != std::errc::no_such_file_or_directory) {
      return commit_failure(
          common::io_error(common::ErrorCode::WriteFailed, "Failed to stat index file",
                           live.string(), ec));
    }
    ec.clear();
    if (!fs::exists(status)) {
      continue;
    }
    if (!fs::is_regular_file(status)) {
      return commit_failure(common::make_error(common::ErrorCode::WriteFailed,
                                               "Index path is not a regular file",
                                               live.string()));
    }
    const fs::path target = backup / relative;
    fs::create_directories(target.parent_path(), ec);
    if (!ec) {
      fs::rename(live, target, ec);
    }
    if (ec) {
      return commit_failure(common::io_error(common::ErrorCode::WriteFailed,
                                             "Failed to back up index file", live.string(), ec));
    }
    backed_up.emplace_back(live, target);
  }

  for (const auto &relative : fresh) {
    const fs::path live = root / relative;
    fs::create_directories(live.parent_path(), ec);
    if (!ec) {
      fs::rename(staging / relative, live, ec);
    }
    if (ec) {
      return commit_failure(common::io_error(common::ErrorCode::WriteFailed,
                                             "Failed to install index file", live.string(), ec));
    }
    installed.push_back(live);
  }

  remove_quietly(staging);
  remove_quietly(backup);

  result.memories_indexed = builder.memory_count();
  result.categories_indexed = builder.category_count();
  const auto elapsed =
      std::chrono::duration_cast<std::chrono::milliseconds>(SteadyClock::now() - started);
  for (const auto &warning : result.warnings) {
    observability::record_warning("index", warning);
  }
  observability::record_reindex(result.memories_indexed, result.categories_indexed,
                                result.warnings.size(), elapsed);
  return Outcome::success(std::move(result));
}

} // namespace cortex::index
