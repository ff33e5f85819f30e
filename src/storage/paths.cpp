#include "cortex/storage/paths.hpp"

#include "cortex/common/fs.hpp"

#include <vector>

namespace cortex::storage {

std::string normalize_extension(const std::string_view extension) {
  const std::string trimmed = common::trim(std::string(extension));
  if (trimmed.empty() || trimmed.front() == '.') {
    return trimmed;
  }
  return "." + trimmed;
}

common::Result<std::filesystem::path> resolve_storage_path(const std::filesystem::path &root,
                                                           const std::string_view relative,
                                                           const common::ErrorCode failure_code) {
  std::error_code ec;
  auto base = std::filesystem::absolute(root, ec);
  if (ec) {
    return common::Result<std::filesystem::path>::failure(
        common::io_error(failure_code, "Failed to resolve storage root", root.string(), ec));
  }
  base = std::filesystem::weakly_canonical(base, ec);
  if (ec) {
    return common::Result<std::filesystem::path>::failure(
        common::io_error(failure_code, "Failed to resolve storage root", root.string(), ec));
  }

  auto candidate = std::filesystem::weakly_canonical(base / std::filesystem::path(relative), ec);
  if (ec) {
    return common::Result<std::filesystem::path>::failure(common::io_error(
        failure_code, "Failed to resolve storage path", std::string(relative), ec));
  }

  const auto rel = candidate.lexically_relative(base);
  const std::string rel_text = rel.generic_string();
  if (rel.empty() || rel.is_absolute() || rel_text == ".." || common::starts_with(rel_text, "../")) {
    return common::Result<std::filesystem::path>::failure(
        common::make_error(failure_code, "Path escapes storage root: " + std::string(relative),
                           std::string(relative)));
  }
  return common::Result<std::filesystem::path>::success(candidate);
}

std::string memory_relative_path(const StorageLayout &layout, const std::string_view slug_path) {
  return std::string(slug_path) + layout.memory_extension;
}

std::string index_relative_path(const StorageLayout &layout, const std::string_view name) {
  if (name.empty()) {
    return layout.index_file_name();
  }
  return std::string(name) + "/" + layout.index_file_name();
}

std::optional<std::string> to_slug_path_from_relative(const std::filesystem::path &relative,
                                                      const std::string_view extension) {
  const std::string generic = relative.generic_string();
  if (extension.empty() || generic.size() <= extension.size() ||
      generic.compare(generic.size() - extension.size(), extension.size(), extension) != 0) {
    return std::nullopt;
  }
  const std::string stem = generic.substr(0, generic.size() - extension.size());
  std::vector<std::string> segments;
  for (const auto &part : common::split(stem, '/')) {
    std::string segment = common::to_lower(common::trim(part));
    if (!segment.empty()) {
      segments.push_back(std::move(segment));
    }
  }
  return common::join(segments, "/");
}

} // namespace cortex::storage
