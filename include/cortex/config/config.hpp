#pragma once

#include "cortex/common/result.hpp"
#include "cortex/config/schema.hpp"

#include <filesystem>
#include <optional>
#include <string>
#include <vector>

namespace cortex::config {

[[nodiscard]] common::Result<std::filesystem::path> config_dir();
[[nodiscard]] common::Result<std::filesystem::path> config_path();
[[nodiscard]] bool config_exists();
void set_config_path_override(std::optional<std::filesystem::path> path);
void clear_config_path_override();
[[nodiscard]] std::optional<std::filesystem::path> config_path_override();

[[nodiscard]] common::Result<Config> load_config();
[[nodiscard]] common::Status save_config(const Config &config);

/// Returns warnings for suspicious but usable values; INVALID_CONFIG otherwise.
[[nodiscard]] common::Result<std::vector<std::string>> validate_config(const Config &config);

void apply_env_overrides(Config &config);

[[nodiscard]] std::filesystem::path resolved_store_root(const Config &config);

} // namespace cortex::config
