#include "cortex/memory/operations.hpp"

#include "cortex/common/fs.hpp"
#include "cortex/index/category_index.hpp"
#include "cortex/index/tree_walk.hpp"
#include "cortex/memory/identity.hpp"
#include "cortex/observability/global.hpp"

#include <algorithm>
#include <chrono>
#include <stdexcept>

namespace cortex::memory {

namespace {

constexpr const char *COMPONENT = "memory";

common::Timestamp resolve_now(const std::optional<common::Timestamp> &now) {
  return std::chrono::floor<std::chrono::milliseconds>(now.value_or(common::now()));
}

common::Error storage_error(std::string message, const std::string &path,
                            const common::Error &cause) {
  common::Error error = common::wrap_error(common::ErrorCode::StorageError, std::move(message), cause);
  error.path = path;
  return error;
}

common::Result<MemoryIdentity> parse_identity(const std::string &path) {
  auto identity = validate_slug_path(path);
  if (identity.ok()) {
    return identity;
  }
  common::Error error =
      common::wrap_error(common::ErrorCode::InvalidPath, identity.error().message, identity.error());
  error.path = path;
  return common::Result<MemoryIdentity>::failure(std::move(error));
}

common::Result<std::string> parse_category(const std::string &path) {
  auto category = validate_category_path(path);
  if (category.ok()) {
    return category;
  }
  common::Error error = common::wrap_error(common::ErrorCode::InvalidPath,
                                           "Invalid category path: " + path, category.error());
  error.path = path;
  return common::Result<std::string>::failure(std::move(error));
}

/// Index of `category`; a category without an index file reads as empty.
common::Result<index::CategoryIndex> load_index(storage::IStorageAdapter &storage,
                                                const std::string &category) {
  const auto raw = storage.read_index_file(category);
  if (!raw.ok()) {
    return common::Result<index::CategoryIndex>::failure(
        storage_error("Failed to read index: " + category, category, raw.error()));
  }
  if (!raw.value().has_value()) {
    return common::Result<index::CategoryIndex>::success(index::CategoryIndex{});
  }
  auto parsed = index::parse_category_index(*raw.value());
  if (!parsed.ok()) {
    return common::Result<index::CategoryIndex>::failure(
        storage_error("Failed to parse index: " + category, category, parsed.error()));
  }
  return parsed;
}

/// Entries listed under a node whose path does not belong to that node are
/// ignored; they point at another category's memory.
bool belongs_to(const std::string &entry_path, const std::string &category) {
  const auto identity = validate_slug_path(entry_path);
  return identity.ok() && identity.value().category_path() == category;
}

} // namespace

MemoryOperations::MemoryOperations(std::shared_ptr<storage::IStorageAdapter> storage,
                                   std::shared_ptr<const IMemorySerializer> serializer)
    : storage_(std::move(storage)), serializer_(std::move(serializer)) {
  if (!storage_ || !serializer_) {
    throw std::invalid_argument("MemoryOperations requires a storage adapter and a serializer");
  }
}

common::Result<std::optional<Memory>> MemoryOperations::load(const std::string &slug_path) {
  const auto raw = storage_->read_memory_file(slug_path);
  if (!raw.ok()) {
    return common::Result<std::optional<Memory>>::failure(
        storage_error("Failed to read memory: " + slug_path, slug_path, raw.error()));
  }
  if (!raw.value().has_value()) {
    return common::Result<std::optional<Memory>>::success(std::nullopt);
  }
  auto parsed = serializer_->parse(*raw.value());
  if (!parsed.ok()) {
    return common::Result<std::optional<Memory>>::failure(
        storage_error("Failed to parse memory: " + slug_path, slug_path, parsed.error()));
  }
  return common::Result<std::optional<Memory>>::success(std::move(parsed.value()));
}

common::Status MemoryOperations::write(const std::string &slug_path, const Memory &memory,
                                       const bool created) {
  const auto valid = validate_metadata(memory.metadata);
  if (!valid.ok()) {
    common::Error error =
        common::wrap_error(common::ErrorCode::InvalidInput, valid.error().message, valid.error());
    error.path = slug_path;
    error.field = valid.error().field;
    return common::Status::failure(std::move(error));
  }

  const auto serialized = serializer_->serialize(memory);
  if (!serialized.ok()) {
    return common::Status::failure(
        storage_error("Failed to serialize memory: " + slug_path, slug_path, serialized.error()));
  }

  const auto written = storage_->write_memory_file(slug_path, serialized.value());
  if (!written.ok()) {
    if (written.error().code == common::ErrorCode::IndexUpdateFailed) {
      const std::string message = "Memory written but index update failed for \"" + slug_path +
                                  "\": " + written.error().message +
                                  ". Run a reindex to rebuild indexes.";
      observability::record_error(COMPONENT, message);
      return common::Status::failure(storage_error(message, slug_path, written.error()));
    }
    return common::Status::failure(
        storage_error("Failed to write memory: " + slug_path, slug_path, written.error()));
  }

  observability::record_memory_written(slug_path, created);
  return common::Status::success();
}

common::Status MemoryOperations::rebuild_after(const std::string &action,
                                               const std::vector<std::string> &touched) {
  const auto rebuilt = storage_->reindex_category_indexes();
  if (rebuilt.ok()) {
    return common::Status::success();
  }

  // The file change already happened; keep the index in step with it even
  // when the full rebuild is blocked.
  for (const auto &slug_path : touched) {
    const auto repaired = storage_->refresh_memory_index(slug_path);
    if (!repaired.ok()) {
      const std::string message = "Failed to reindex after " + action;
      observability::record_error(COMPONENT, message + ": " + rebuilt.error().message + "; " +
                                                 repaired.error().message);
      return common::Status::failure(
          common::wrap_error(common::ErrorCode::StorageError, message, rebuilt.error()));
    }
  }
  observability::record_warning(COMPONENT, "Reindex after " + action +
                                               " failed, index entries repaired in place: " +
                                               rebuilt.error().describe());
  return common::Status::success();
}

common::Result<Memory> MemoryOperations::create(const std::string &path,
                                                const CreateMemoryInput &input) {
  const auto identity = parse_identity(path);
  if (!identity.ok()) {
    return common::Result<Memory>::failure(identity.error());
  }
  const std::string slug_path = identity.value().slug_path();

  const common::Timestamp timestamp = resolve_now(input.now);
  Memory memory{.metadata = {.created_at = timestamp,
                             .updated_at = timestamp,
                             .tags = input.tags,
                             .source = input.source,
                             .expires_at = input.expires_at,
                             .citations = input.citations},
                .content = input.content};

  auto written = write(slug_path, memory, true);
  if (!written.ok()) {
    return common::Result<Memory>::failure(written.error());
  }
  return common::Result<Memory>::success(std::move(memory));
}

common::Result<Memory> MemoryOperations::get(const std::string &path,
                                             const GetMemoryOptions &options) {
  const auto identity = parse_identity(path);
  if (!identity.ok()) {
    return common::Result<Memory>::failure(identity.error());
  }
  const std::string slug_path = identity.value().slug_path();

  auto loaded = load(slug_path);
  if (!loaded.ok()) {
    return common::Result<Memory>::failure(loaded.error());
  }
  if (!loaded.value().has_value()) {
    return common::Result<Memory>::failure(common::make_error(
        common::ErrorCode::MemoryNotFound, "Memory not found: " + slug_path, slug_path));
  }

  Memory memory = std::move(*loaded.value());
  if (!options.include_expired && memory.is_expired(resolve_now(options.now))) {
    return common::Result<Memory>::failure(common::make_error(
        common::ErrorCode::MemoryExpired, "Memory has expired: " + slug_path, slug_path));
  }
  return common::Result<Memory>::success(std::move(memory));
}

common::Result<Memory> MemoryOperations::update(const std::string &path,
                                                const UpdateMemoryInput &input) {
  const auto identity = parse_identity(path);
  if (!identity.ok()) {
    return common::Result<Memory>::failure(identity.error());
  }
  const std::string slug_path = identity.value().slug_path();

  if (!input.has_changes()) {
    return common::Result<Memory>::failure(
        common::make_error(common::ErrorCode::InvalidInput, "No updates provided", slug_path));
  }

  auto loaded = load(slug_path);
  if (!loaded.ok()) {
    return common::Result<Memory>::failure(loaded.error());
  }
  if (!loaded.value().has_value()) {
    return common::Result<Memory>::failure(common::make_error(
        common::ErrorCode::MemoryNotFound, "Memory not found: " + slug_path, slug_path));
  }

  Memory memory = std::move(*loaded.value());
  memory.metadata.updated_at = resolve_now(input.now);
  if (input.content.has_value()) {
    memory.content = *input.content;
  }
  if (input.tags.has_value()) {
    memory.metadata.tags = *input.tags;
  }
  if (input.citations.has_value()) {
    memory.metadata.citations = *input.citations;
  }
  switch (input.expires_at.action) {
  case ExpiryAction::Keep:
    break;
  case ExpiryAction::Clear:
    memory.metadata.expires_at.reset();
    break;
  case ExpiryAction::Set:
    memory.metadata.expires_at = input.expires_at.value;
    break;
  }

  auto written = write(slug_path, memory, false);
  if (!written.ok()) {
    return common::Result<Memory>::failure(written.error());
  }
  return common::Result<Memory>::success(std::move(memory));
}

common::Status MemoryOperations::remove(const std::string &path) {
  const auto identity = parse_identity(path);
  if (!identity.ok()) {
    return common::Status::failure(identity.error());
  }
  const std::string slug_path = identity.value().slug_path();

  const auto existing = storage_->read_memory_file(slug_path);
  if (!existing.ok()) {
    return common::Status::failure(
        storage_error("Failed to read memory: " + slug_path, slug_path, existing.error()));
  }
  if (!existing.value().has_value()) {
    return common::Status::failure(common::make_error(
        common::ErrorCode::MemoryNotFound, "Memory not found: " + slug_path, slug_path));
  }

  const auto removed = storage_->remove_memory_file(slug_path);
  if (!removed.ok()) {
    return common::Status::failure(
        storage_error("Failed to remove memory: " + slug_path, slug_path, removed.error()));
  }
  observability::record_memory_removed(slug_path);
  return rebuild_after("remove", {slug_path});
}

common::Status MemoryOperations::move(const std::string &from, const std::string &to) {
  const auto source = parse_identity(from);
  if (!source.ok()) {
    return common::Status::failure(source.error());
  }
  const auto destination = parse_identity(to);
  if (!destination.ok()) {
    return common::Status::failure(destination.error());
  }
  const std::string from_path = source.value().slug_path();
  const std::string to_path = destination.value().slug_path();
  if (from_path == to_path) {
    return common::Status::success();
  }

  const auto source_check = storage_->read_memory_file(from_path);
  if (!source_check.ok()) {
    return common::Status::failure(storage_error("Failed to read source memory: " + from_path,
                                                 from_path, source_check.error()));
  }
  if (!source_check.value().has_value()) {
    return common::Status::failure(common::make_error(
        common::ErrorCode::MemoryNotFound, "Source memory not found: " + from_path, from_path));
  }

  const auto destination_check = storage_->read_memory_file(to_path);
  if (!destination_check.ok()) {
    return common::Status::failure(storage_error("Failed to check destination: " + to_path,
                                                 to_path, destination_check.error()));
  }
  if (destination_check.value().has_value()) {
    return common::Status::failure(common::make_error(
        common::ErrorCode::DestinationExists, "Destination already exists: " + to_path, to_path));
  }

  const std::string destination_category = destination.value().category_path();
  const auto ensured = storage_->ensure_category_directory(destination_category);
  if (!ensured.ok()) {
    return common::Status::failure(
        storage_error("Failed to create destination category: " + destination_category,
                      destination_category, ensured.error()));
  }

  const auto moved = storage_->move_memory_file(from_path, to_path);
  if (!moved.ok()) {
    return common::Status::failure(storage_error(
        "Failed to move memory from " + from_path + " to " + to_path, from_path, moved.error()));
  }
  observability::record_memory_moved(from_path, to_path);
  return rebuild_after("move", {from_path, to_path});
}

common::Result<std::vector<std::string>> MemoryOperations::root_categories() {
  auto root = load_index(*storage_, "");
  if (!root.ok()) {
    return common::Result<std::vector<std::string>>::failure(root.error());
  }
  std::vector<std::string> categories;
  categories.reserve(root.value().subcategories.size());
  for (const auto &entry : root.value().subcategories) {
    categories.push_back(entry.path);
  }
  return common::Result<std::vector<std::string>>::success(std::move(categories));
}

common::Result<std::vector<ListedMemory>>
MemoryOperations::collect(const std::vector<std::string> &starts, const bool include_expired,
                          const common::Timestamp now) {
  std::vector<ListedMemory> memories;
  const auto walked = index::walk_category_tree(
      starts, [this](const std::string &category) { return load_index(*storage_, category); },
      [&](const std::string &category, const index::CategoryIndex &node) {
        for (const auto &entry : node.memories) {
          if (!belongs_to(entry.path, category)) {
            continue;
          }
          const auto loaded = load(entry.path);
          if (!loaded.ok() || !loaded.value().has_value()) {
            if (!loaded.ok()) {
              observability::record_warning(COMPONENT, "Skipped unreadable memory: " +
                                                           loaded.error().describe());
            }
            continue;
          }
          const Memory &memory = *loaded.value();
          const bool expired = memory.is_expired(now);
          if (expired && !include_expired) {
            continue;
          }
          memories.push_back(ListedMemory{.path = entry.path,
                                          .token_estimate = entry.token_estimate,
                                          .summary = entry.summary,
                                          .expires_at = memory.metadata.expires_at,
                                          .updated_at = entry.updated_at,
                                          .expired = expired});
        }
        return common::Status::success();
      });
  if (!walked.ok()) {
    return common::Result<std::vector<ListedMemory>>::failure(walked.error());
  }
  return common::Result<std::vector<ListedMemory>>::success(std::move(memories));
}

common::Result<ListMemoriesResult> MemoryOperations::list(const ListMemoriesOptions &options) {
  const common::Timestamp now = resolve_now(options.now);
  ListMemoriesResult result;

  std::vector<std::string> starts;
  std::string listed_node;
  if (options.category.has_value() && !common::trim(*options.category).empty()) {
    const auto category = parse_category(*options.category);
    if (!category.ok()) {
      return common::Result<ListMemoriesResult>::failure(category.error());
    }
    listed_node = category.value();
    starts.push_back(listed_node);
  } else {
    auto roots = root_categories();
    if (!roots.ok()) {
      return common::Result<ListMemoriesResult>::failure(roots.error());
    }
    starts = std::move(roots.value());
  }
  result.category = listed_node;

  auto memories = collect(starts, options.include_expired, now);
  if (!memories.ok()) {
    return common::Result<ListMemoriesResult>::failure(memories.error());
  }
  result.memories = std::move(memories.value());

  const auto node = load_index(*storage_, listed_node);
  if (!node.ok()) {
    return common::Result<ListMemoriesResult>::failure(node.error());
  }
  for (const auto &entry : node.value().subcategories) {
    result.subcategories.push_back(ListedSubcategory{.path = entry.path,
                                                     .memory_count = entry.memory_count,
                                                     .description = entry.description});
  }
  return common::Result<ListMemoriesResult>::success(std::move(result));
}

common::Result<PruneResult> MemoryOperations::prune(const PruneOptions &options) {
  const common::Timestamp now = resolve_now(options.now);

  const auto roots = root_categories();
  if (!roots.ok()) {
    return common::Result<PruneResult>::failure(roots.error());
  }
  const auto memories = collect(roots.value(), true, now);
  if (!memories.ok()) {
    return common::Result<PruneResult>::failure(memories.error());
  }

  PruneResult result;
  for (const auto &memory : memories.value()) {
    if (memory.expired && memory.expires_at.has_value()) {
      result.pruned.push_back(PrunedMemory{.path = memory.path, .expires_at = *memory.expires_at});
    }
  }

  if (options.dry_run) {
    observability::record_prune(result.pruned.size(), true);
    return common::Result<PruneResult>::success(std::move(result));
  }

  for (const auto &memory : result.pruned) {
    const auto removed = storage_->remove_memory_file(memory.path);
    if (!removed.ok()) {
      return common::Result<PruneResult>::failure(storage_error(
          "Failed to remove expired memory: " + memory.path, memory.path, removed.error()));
    }
  }
  if (!result.pruned.empty()) {
    std::vector<std::string> touched;
    touched.reserve(result.pruned.size());
    for (const auto &memory : result.pruned) {
      touched.push_back(memory.path);
    }
    const auto rebuilt = rebuild_after("prune", touched);
    if (!rebuilt.ok()) {
      return common::Result<PruneResult>::failure(rebuilt.error());
    }
  }
  observability::record_prune(result.pruned.size(), false);
  return common::Result<PruneResult>::success(std::move(result));
}

common::Result<storage::ReindexResult>
MemoryOperations::reindex(const storage::ReindexOptions &options) {
  auto rebuilt = storage_->reindex_category_indexes(options);
  if (!rebuilt.ok()) {
    observability::record_error(COMPONENT, "Reindex failed: " + rebuilt.error().message);
    return common::Result<storage::ReindexResult>::failure(common::wrap_error(
        common::ErrorCode::StorageError, "Failed to reindex store", rebuilt.error()));
  }
  return rebuilt;
}

common::Result<RecentMemoriesResult>
MemoryOperations::recent(const RecentMemoriesOptions &options) {
  const common::Timestamp now = resolve_now(options.now);
  RecentMemoriesResult result{.category = "all", .memories = {}};

  std::vector<std::string> starts;
  if (options.category.has_value() && !common::trim(*options.category).empty()) {
    const auto category = parse_category(*options.category);
    if (!category.ok()) {
      return common::Result<RecentMemoriesResult>::failure(category.error());
    }
    result.category = category.value();
    starts.push_back(category.value());
  } else {
    auto roots = root_categories();
    if (!roots.ok()) {
      return common::Result<RecentMemoriesResult>::failure(roots.error());
    }
    starts = std::move(roots.value());
  }

  std::vector<index::IndexMemoryEntry> entries;
  const auto walked = index::walk_category_tree(
      starts, [this](const std::string &category) { return load_index(*storage_, category); },
      [&entries](const std::string &category, const index::CategoryIndex &node) {
        for (const auto &entry : node.memories) {
          if (belongs_to(entry.path, category)) {
            entries.push_back(entry);
          }
        }
        return common::Status::success();
      });
  if (!walked.ok()) {
    return common::Result<RecentMemoriesResult>::failure(walked.error());
  }

  // Newest first; entries without updated_at sort last.
  std::stable_sort(entries.begin(), entries.end(),
                   [](const index::IndexMemoryEntry &a, const index::IndexMemoryEntry &b) {
                     if (!a.updated_at.has_value() || !b.updated_at.has_value()) {
                       return a.updated_at.has_value() && !b.updated_at.has_value();
                     }
                     return *a.updated_at > *b.updated_at;
                   });

  for (const auto &entry : entries) {
    if (result.memories.size() >= options.limit) {
      break;
    }
    const auto loaded = load(entry.path);
    if (!loaded.ok() || !loaded.value().has_value()) {
      continue;
    }
    const Memory &memory = *loaded.value();
    if (!options.include_expired && memory.is_expired(now)) {
      continue;
    }
    result.memories.push_back(RecentMemory{.path = entry.path,
                                           .content = memory.content,
                                           .updated_at = entry.updated_at,
                                           .token_estimate = entry.token_estimate,
                                           .tags = memory.metadata.tags});
  }
  return common::Result<RecentMemoriesResult>::success(std::move(result));
}

} // namespace cortex::memory
