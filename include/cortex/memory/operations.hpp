#pragma once

#include "cortex/common/result.hpp"
#include "cortex/common/time.hpp"
#include "cortex/memory/memory.hpp"
#include "cortex/memory/serializer.hpp"
#include "cortex/storage/adapter.hpp"

#include <cstddef>
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace cortex::memory {

struct CreateMemoryInput {
  std::string content;
  std::vector<std::string> tags;
  std::string source;
  std::optional<common::Timestamp> expires_at;
  std::vector<std::string> citations;
  std::optional<common::Timestamp> now;
};

struct GetMemoryOptions {
  bool include_expired = false;
  std::optional<common::Timestamp> now;
};

enum class ExpiryAction { Keep, Clear, Set };

/// Keep leaves the stored expiry alone, Clear drops it, Set replaces it.
struct ExpiryUpdate {
  ExpiryAction action = ExpiryAction::Keep;
  common::Timestamp value{};

  [[nodiscard]] static ExpiryUpdate keep() { return {}; }
  [[nodiscard]] static ExpiryUpdate clear() { return {.action = ExpiryAction::Clear}; }
  [[nodiscard]] static ExpiryUpdate set(common::Timestamp at) {
    return {.action = ExpiryAction::Set, .value = at};
  }
};

struct UpdateMemoryInput {
  std::optional<std::string> content;
  std::optional<std::vector<std::string>> tags;
  ExpiryUpdate expires_at;
  std::optional<std::vector<std::string>> citations;
  std::optional<common::Timestamp> now;

  [[nodiscard]] bool has_changes() const {
    return content.has_value() || tags.has_value() || expires_at.action != ExpiryAction::Keep ||
           citations.has_value();
  }
};

struct ListMemoriesOptions {
  std::optional<std::string> category;
  bool include_expired = false;
  std::optional<common::Timestamp> now;
};

struct ListedMemory {
  std::string path;
  std::size_t token_estimate = 0;
  std::optional<std::string> summary;
  std::optional<common::Timestamp> expires_at;
  std::optional<common::Timestamp> updated_at;
  bool expired = false;
};

struct ListedSubcategory {
  std::string path;
  std::size_t memory_count = 0;
  std::optional<std::string> description;
};

struct ListMemoriesResult {
  std::string category;
  std::vector<ListedMemory> memories;
  std::vector<ListedSubcategory> subcategories;
};

struct PruneOptions {
  bool dry_run = false;
  std::optional<common::Timestamp> now;
};

struct PrunedMemory {
  std::string path;
  common::Timestamp expires_at{};
};

struct PruneResult {
  std::vector<PrunedMemory> pruned;
};

struct RecentMemoriesOptions {
  std::optional<std::string> category;
  std::size_t limit = 5;
  bool include_expired = false;
  std::optional<common::Timestamp> now;
};

struct RecentMemory {
  std::string path;
  std::string content;
  std::optional<common::Timestamp> updated_at;
  std::size_t token_estimate = 0;
  std::vector<std::string> tags;
};

struct RecentMemoriesResult {
  std::string category;
  std::vector<RecentMemory> memories;
};

class MemoryOperations {
public:
  MemoryOperations(std::shared_ptr<storage::IStorageAdapter> storage,
                   std::shared_ptr<const IMemorySerializer> serializer);

  [[nodiscard]] common::Result<Memory> create(const std::string &path,
                                              const CreateMemoryInput &input);
  [[nodiscard]] common::Result<Memory> get(const std::string &path,
                                           const GetMemoryOptions &options = {});
  [[nodiscard]] common::Result<Memory> update(const std::string &path,
                                              const UpdateMemoryInput &input);
  /// MEMORY_NOT_FOUND when absent; a successful remove rebuilds the indexes.
  [[nodiscard]] common::Status remove(const std::string &path);
  [[nodiscard]] common::Status move(const std::string &from, const std::string &to);

  [[nodiscard]] common::Result<ListMemoriesResult> list(const ListMemoriesOptions &options = {});
  [[nodiscard]] common::Result<PruneResult> prune(const PruneOptions &options = {});
  [[nodiscard]] common::Result<storage::ReindexResult>
  reindex(const storage::ReindexOptions &options = {});
  [[nodiscard]] common::Result<RecentMemoriesResult>
  recent(const RecentMemoriesOptions &options = {});

private:
  [[nodiscard]] common::Result<std::optional<Memory>> load(const std::string &slug_path);
  [[nodiscard]] common::Status write(const std::string &slug_path, const Memory &memory,
                                     bool created);
  [[nodiscard]] common::Status rebuild_after(const std::string &action,
                                             const std::vector<std::string> &touched);
  [[nodiscard]] common::Result<std::vector<std::string>> root_categories();
  [[nodiscard]] common::Result<std::vector<ListedMemory>>
  collect(const std::vector<std::string> &starts, bool include_expired, common::Timestamp now);

  std::shared_ptr<storage::IStorageAdapter> storage_;
  std::shared_ptr<const IMemorySerializer> serializer_;
};

} // namespace cortex::memory
