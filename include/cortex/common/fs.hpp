#pragma once

#include "cortex/common/result.hpp"

#include <cstddef>
#include <filesystem>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace cortex::common {

[[nodiscard]] std::string trim(const std::string &input);
[[nodiscard]] bool starts_with(const std::string &value, const std::string &prefix);
[[nodiscard]] std::string to_lower(std::string value);
[[nodiscard]] std::vector<std::string> split(std::string_view value, char delimiter);
[[nodiscard]] std::string join(const std::vector<std::string> &parts, std::string_view separator,
                               std::size_t count = static_cast<std::size_t>(-1));
[[nodiscard]] Result<std::filesystem::path> home_dir();
[[nodiscard]] Result<std::filesystem::path> ensure_dir(const std::filesystem::path &path);
[[nodiscard]] std::string expand_path(std::string value);

[[nodiscard]] std::string random_hex(std::size_t bytes);

/// Reads a whole file. A missing file yields `std::nullopt`, not an error.
[[nodiscard]] Result<std::optional<std::string>>
read_text_file(const std::filesystem::path &path, ErrorCode failure_code);

[[nodiscard]] Status write_text_file_atomic(const std::filesystem::path &path,
                                            const std::string &contents, ErrorCode failure_code);

} // namespace cortex::common
