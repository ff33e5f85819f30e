#pragma once

#include "cortex/common/result.hpp"

#include <filesystem>
#include <optional>
#include <string>
#include <string_view>

namespace cortex::storage {

struct StorageLayout {
  std::filesystem::path root;
  std::string memory_extension = ".md";
  std::string index_extension = ".yaml";

  [[nodiscard]] std::string index_file_name() const { return "index" + index_extension; }
};

[[nodiscard]] std::string normalize_extension(std::string_view extension);

/// Resolves `relative` under `root`. Fails with `failure_code` and
/// "Path escapes storage root" when the root-relative form of the resolved
/// path starts with `..` or is absolute. Existing symlinks are resolved first.
[[nodiscard]] common::Result<std::filesystem::path>
resolve_storage_path(const std::filesystem::path &root, std::string_view relative,
                     common::ErrorCode failure_code);

[[nodiscard]] std::string memory_relative_path(const StorageLayout &layout,
                                               std::string_view slug_path);

[[nodiscard]] std::string index_relative_path(const StorageLayout &layout, std::string_view name);

[[nodiscard]] std::optional<std::string>
to_slug_path_from_relative(const std::filesystem::path &relative, std::string_view extension);

} // namespace cortex::storage
