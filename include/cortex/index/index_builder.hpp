#pragma once

#include "cortex/index/category_index.hpp"

#include <map>
#include <set>
#include <string>

namespace cortex::index {

class IndexBuilder {
public:
  void add_category(const std::string &category);
  void add_memory(const std::string &category, IndexMemoryEntry entry);
  void set_description(const std::string &category, std::string description);

  [[nodiscard]] std::map<std::string, CategoryIndex> build() const;

  [[nodiscard]] std::size_t memory_count() const { return memory_total_; }
  [[nodiscard]] std::size_t category_count() const { return categories_.size(); }
  [[nodiscard]] bool has_category(const std::string &category) const {
    return categories_.contains(category);
  }

private:
  std::set<std::string> categories_;
  std::map<std::string, std::vector<IndexMemoryEntry>> memories_;
  std::map<std::string, std::string> descriptions_;
  std::size_t memory_total_ = 0;
};

} // namespace cortex::index
