#pragma once

#include "cortex/common/result.hpp"
#include "cortex/index/category_index.hpp"
#include "cortex/memory/serializer.hpp"
#include "cortex/memory/tokenizer.hpp"
#include "cortex/storage/adapter.hpp"
#include "cortex/storage/paths.hpp"

#include <chrono>
#include <map>
#include <memory>
#include <optional>
#include <set>
#include <string>

namespace cortex::index {

/// Reads and maintains the on-disk index tree of one store. Not synchronized;
/// the owning storage adapter serializes calls.
class IndexStore {
public:
  using Deadline = std::optional<std::chrono::steady_clock::time_point>;

  IndexStore(storage::StorageLayout layout, std::shared_ptr<const memory::ITokenizer> tokenizer,
             std::shared_ptr<const memory::IMemorySerializer> serializer, bool strict_reindex);

  /// Index of `category`. A missing file yields an empty index when
  /// `create_when_missing`, INDEX_UPDATE_FAILED otherwise.
  [[nodiscard]] common::Result<CategoryIndex> load(const std::string &category,
                                                   bool create_when_missing) const;
  [[nodiscard]] common::Status store(const std::string &category, const CategoryIndex &index) const;

  [[nodiscard]] IndexMemoryEntry describe_memory(const std::string &slug_path,
                                                 const std::string &contents) const;

  [[nodiscard]] common::Status upsert_memory(const std::string &slug_path,
                                             const std::string &contents,
                                             bool allow_index_create);

  [[nodiscard]] common::Status remove_memory(const std::string &slug_path);

  [[nodiscard]] common::Status register_category(const std::string &category);
  [[nodiscard]] common::Status unregister_category(const std::string &category);
  [[nodiscard]] common::Status set_description(const std::string &category,
                                               const std::optional<std::string> &description);

  [[nodiscard]] common::Result<storage::ReindexResult> reindex(Deadline deadline);

  [[nodiscard]] const storage::StorageLayout &layout() const { return layout_; }

private:
  struct WorkingSet {
    std::map<std::string, CategoryIndex> indexes;
    std::set<std::string> dirty;
  };

  common::Result<CategoryIndex *> working_index(WorkingSet &set, const std::string &category,
                                                bool create_when_missing) const;
  common::Status register_chain(WorkingSet &set, const std::string &category,
                                bool create_when_missing) const;
  common::Status flush(const WorkingSet &set) const;

  storage::StorageLayout layout_;
  std::shared_ptr<const memory::ITokenizer> tokenizer_;
  std::shared_ptr<const memory::IMemorySerializer> serializer_;
  bool strict_reindex_;
};

} // namespace cortex::index
