#include "cortex/memory/identity.hpp"

#include "cortex/common/fs.hpp"

namespace cortex::memory {

namespace {

common::Error invalid_segment(const std::string &segment, const std::string &raw) {
  common::Error error = common::make_error(common::ErrorCode::InvalidSlug,
                                           "Path segments must be lowercase slugs: '" + segment +
                                               "'",
                                           raw);
  error.field = segment;
  return error;
}

} // namespace

std::string MemoryIdentity::slug_path() const {
  std::string out = category_path();
  out += '/';
  out += slug;
  return out;
}

std::string MemoryIdentity::category_path() const { return common::join(categories, "/"); }

bool is_valid_slug(const std::string_view segment) {
  if (segment.empty()) {
    return false;
  }
  for (const char ch : segment) {
    const bool allowed = (ch >= 'a' && ch <= 'z') || (ch >= '0' && ch <= '9') || ch == '-';
    if (!allowed) {
      return false;
    }
  }
  return true;
}

std::vector<std::string> normalize_segments(const std::string_view raw) {
  std::vector<std::string> segments;
  for (const auto &part : common::split(raw, '/')) {
    std::string trimmed = common::trim(part);
    if (!trimmed.empty()) {
      segments.push_back(std::move(trimmed));
    }
  }
  return segments;
}

common::Result<MemoryIdentity> validate_slug_path(const std::string_view raw) {
  auto segments = normalize_segments(raw);
  if (segments.size() < 2) {
    return common::Result<MemoryIdentity>::failure(common::make_error(
        common::ErrorCode::InvalidPath,
        "Memory slug path must include at least one category and a slug", std::string(raw)));
  }

  for (const auto &segment : segments) {
    if (!is_valid_slug(segment)) {
      return common::Result<MemoryIdentity>::failure(invalid_segment(segment, std::string(raw)));
    }
  }

  if (segments.back() == RESERVED_SLUG) {
    common::Error error = common::make_error(
        common::ErrorCode::InvalidSlug, "The slug 'index' is reserved", std::string(raw));
    error.field = segments.back();
    return common::Result<MemoryIdentity>::failure(std::move(error));
  }

  MemoryIdentity identity;
  identity.slug = std::move(segments.back());
  segments.pop_back();
  identity.categories = std::move(segments);
  return common::Result<MemoryIdentity>::success(std::move(identity));
}

common::Result<std::string> validate_category_path(const std::string_view raw) {
  const auto segments = normalize_segments(raw);
  if (segments.empty()) {
    return common::Result<std::string>::failure(common::make_error(
        common::ErrorCode::InvalidPath, "Category path must include at least one segment",
        std::string(raw)));
  }
  for (const auto &segment : segments) {
    if (!is_valid_slug(segment)) {
      return common::Result<std::string>::failure(invalid_segment(segment, std::string(raw)));
    }
  }
  return common::Result<std::string>::success(common::join(segments, "/"));
}

std::string parent_category(const std::string_view category) {
  const std::size_t pos = category.rfind('/');
  if (pos == std::string_view::npos) {
    return "";
  }
  return std::string(category.substr(0, pos));
}

std::vector<std::string> category_chain(const std::string_view category) {
  std::vector<std::string> chain;
  if (category.empty()) {
    return chain;
  }
  std::size_t pos = category.find('/');
  while (pos != std::string_view::npos) {
    chain.emplace_back(category.substr(0, pos));
    pos = category.find('/', pos + 1);
  }
  chain.emplace_back(category);
  return chain;
}

} // namespace cortex::memory
