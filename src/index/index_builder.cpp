#include "cortex/index/index_builder.hpp"

#include "cortex/memory/identity.hpp"

namespace cortex::index {

void IndexBuilder::add_category(const std::string &category) {
  for (auto &link : memory::category_chain(category)) {
    categories_.insert(std::move(link));
  }
}

void IndexBuilder::add_memory(const std::string &category, IndexMemoryEntry entry) {
  add_category(category);
  memories_[category].push_back(std::move(entry));
  ++memory_total_;
}

void IndexBuilder::set_description(const std::string &category, std::string description) {
  descriptions_[category] = std::move(description);
}

std::map<std::string, CategoryIndex> IndexBuilder::build() const {
  std::map<std::string, CategoryIndex> tree;
  tree[""];

  for (const auto &category : categories_) {
    auto &node = tree[category];
    if (const auto it = memories_.find(category); it != memories_.end()) {
      node.memories = it->second;
    }
  }

  for (const auto &category : categories_) {
    IndexSubcategoryEntry entry{.path = category, .memory_count = tree[category].memories.size()};
    if (const auto it = descriptions_.find(category); it != descriptions_.end()) {
      entry.description = it->second;
    }
    tree[memory::parent_category(category)].subcategories.push_back(std::move(entry));
  }

  for (auto &[name, node] : tree) {
    sort_entries(node);
  }
  return tree;
}

} // namespace cortex::index
