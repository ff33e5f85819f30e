#pragma once

#include "cortex/common/result.hpp"
#include "cortex/index/category_index.hpp"

#include <string>
#include <unordered_set>
#include <vector>

namespace cortex::index {

/// Depth-first walk over the index graph starting at `starts`, following
/// subcategory entries. Uses an explicit stack and a visited set, so a
/// corrupted tree that links back to an ancestor (or lists a category twice)
/// is walked once per node instead of looping.
template <typename Load, typename Visit>
common::Status walk_category_tree(const std::vector<std::string> &starts, Load &&load,
                                  Visit &&visit) {
  std::unordered_set<std::string> visited;
  std::vector<std::string> pending(starts.rbegin(), starts.rend());

  while (!pending.empty()) {
    std::string category = std::move(pending.back());
    pending.pop_back();
    if (!visited.insert(category).second) {
      continue;
    }

    auto loaded = load(category);
    if (!loaded.ok()) {
      return common::Status::failure(loaded.error());
    }
    const CategoryIndex &node = loaded.value();

    auto visited_status = visit(category, node);
    if (!visited_status.ok()) {
      return visited_status;
    }

    for (auto it = node.subcategories.rbegin(); it != node.subcategories.rend(); ++it) {
      if (!visited.contains(it->path)) {
        pending.push_back(it->path);
      }
    }
  }
  return common::Status::success();
}

} // namespace cortex::index
