#pragma once

#include "cortex/common/result.hpp"
#include "cortex/common/time.hpp"

#include <cstddef>
#include <optional>
#include <string>
#include <vector>

namespace cortex::index {

inline constexpr std::size_t MAX_DESCRIPTION_LENGTH = 500;

struct IndexMemoryEntry {
  std::string path;
  std::size_t token_estimate = 0;
  std::optional<std::string> summary;
  std::optional<common::Timestamp> updated_at;

  bool operator==(const IndexMemoryEntry &) const = default;
};

struct IndexSubcategoryEntry {
  std::string path;
  /// Direct memories of that category, not a recursive total.
  std::size_t memory_count = 0;
  std::optional<std::string> description;

  bool operator==(const IndexSubcategoryEntry &) const = default;
};

struct CategoryIndex {
  std::vector<IndexMemoryEntry> memories;
  std::vector<IndexSubcategoryEntry> subcategories;

  [[nodiscard]] const IndexMemoryEntry *find_memory(const std::string &path) const;
  [[nodiscard]] const IndexSubcategoryEntry *find_subcategory(const std::string &path) const;

  bool operator==(const CategoryIndex &) const = default;
};

/// Parses the block format written by `serialize_category_index`. Errors carry
/// the 1-based line number.
[[nodiscard]] common::Result<CategoryIndex> parse_category_index(const std::string &raw);
[[nodiscard]] std::string serialize_category_index(const CategoryIndex &index);

void sort_entries(CategoryIndex &index);

void upsert_memory_entry(CategoryIndex &index, IndexMemoryEntry entry);

void upsert_subcategory_entry(CategoryIndex &index, IndexSubcategoryEntry entry);

bool remove_memory_entry(CategoryIndex &index, const std::string &path);
bool remove_subcategory_entry(CategoryIndex &index, const std::string &path);

} // namespace cortex::index
