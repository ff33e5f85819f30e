#pragma once

#include "cortex/common/result.hpp"

#include <string>
#include <string_view>
#include <vector>

namespace cortex::memory {

inline constexpr std::string_view RESERVED_SLUG = "index";

struct MemoryIdentity {
  std::vector<std::string> categories;
  std::string slug;

  [[nodiscard]] std::string slug_path() const;
  [[nodiscard]] std::string category_path() const;

  bool operator==(const MemoryIdentity &) const = default;
};

[[nodiscard]] bool is_valid_slug(std::string_view segment);

[[nodiscard]] std::vector<std::string> normalize_segments(std::string_view raw);

/// INVALID_PATH for fewer than two segments, INVALID_SLUG for a bad segment
/// or the reserved terminal slug.
[[nodiscard]] common::Result<MemoryIdentity> validate_slug_path(std::string_view raw);

[[nodiscard]] common::Result<std::string> validate_category_path(std::string_view raw);

[[nodiscard]] std::string parent_category(std::string_view category);

[[nodiscard]] std::vector<std::string> category_chain(std::string_view category);

} // namespace cortex::memory
