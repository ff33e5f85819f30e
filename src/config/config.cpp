#include "cortex/config/config.hpp"

#include "cortex/common/fs.hpp"
#include "cortex/common/toml.hpp"

#include <cstdlib>
#include <sstream>

namespace cortex::config {

namespace {

constexpr const char *CONFIG_FOLDER = ".cortex";
constexpr const char *CONFIG_FILENAME = "config.toml";
std::optional<std::filesystem::path> g_config_path_override;

std::optional<std::filesystem::path> resolved_config_path_override() {
  if (g_config_path_override.has_value()) {
    return g_config_path_override;
  }
  if (const char *env = std::getenv("CORTEX_CONFIG_PATH"); env != nullptr && *env != '\0') {
    return std::filesystem::path(common::expand_path(env));
  }
  return std::nullopt;
}

std::string bool_to_toml(bool value) { return value ? "true" : "false"; }

std::string normalize_extension(const std::string &value) {
  const std::string trimmed = common::trim(value);
  if (trimmed.empty() || trimmed.front() == '.') {
    return trimmed;
  }
  return "." + trimmed;
}

bool is_known_backend(const std::string &name) {
  return name == "log" || name == "none" || name == "noop";
}

common::Result<std::vector<std::string>> invalid(std::string message) {
  return common::Result<std::vector<std::string>>::failure(
      common::make_error(common::ErrorCode::InvalidConfig, std::move(message)));
}

} // namespace

common::Result<std::filesystem::path> config_dir() {
  if (const auto override_path = resolved_config_path_override(); override_path.has_value()) {
    std::error_code ec;
    if (std::filesystem::is_directory(*override_path, ec) || override_path->filename().empty()) {
      return common::Result<std::filesystem::path>::success(*override_path);
    }
    return common::Result<std::filesystem::path>::success(override_path->parent_path());
  }

  const auto home = common::home_dir();
  if (!home.ok()) {
    return common::Result<std::filesystem::path>::failure(home.error());
  }
  return common::Result<std::filesystem::path>::success(home.value() / CONFIG_FOLDER);
}

common::Result<std::filesystem::path> config_path() {
  if (const auto override_path = resolved_config_path_override(); override_path.has_value()) {
    std::error_code ec;
    if (std::filesystem::is_directory(*override_path, ec) || override_path->filename().empty()) {
      return common::Result<std::filesystem::path>::success(*override_path / CONFIG_FILENAME);
    }
    return common::Result<std::filesystem::path>::success(*override_path);
  }

  const auto cfg_dir = config_dir();
  if (!cfg_dir.ok()) {
    return common::Result<std::filesystem::path>::failure(cfg_dir.error());
  }
  return common::Result<std::filesystem::path>::success(cfg_dir.value() / CONFIG_FILENAME);
}

bool config_exists() {
  const auto path = config_path();
  std::error_code ec;
  return path.ok() && std::filesystem::exists(path.value(), ec);
}

void set_config_path_override(std::optional<std::filesystem::path> path) {
  if (!path.has_value()) {
    g_config_path_override = std::nullopt;
    return;
  }
  g_config_path_override = std::filesystem::path(common::expand_path(path->string()));
}

void clear_config_path_override() { g_config_path_override = std::nullopt; }

std::optional<std::filesystem::path> config_path_override() {
  return resolved_config_path_override();
}

void apply_env_overrides(Config &config) {
  if (const char *root = std::getenv("CORTEX_STORE_ROOT"); root != nullptr && *root) {
    config.storage.root = root;
  }
  if (const char *backend = std::getenv("CORTEX_OBSERVABILITY"); backend != nullptr && *backend) {
    config.observability.backend = backend;
  }
}

std::filesystem::path resolved_store_root(const Config &config) {
  return std::filesystem::path(common::expand_path(common::trim(config.storage.root)));
}

common::Result<Config> load_config() {
  Config config;

  const auto cfg_path_result = config_path();
  if (!cfg_path_result.ok()) {
    return common::Result<Config>::failure(cfg_path_result.error());
  }

  const auto path = cfg_path_result.value();
  const auto contents = common::read_text_file(path, common::ErrorCode::InvalidConfig);
  if (!contents.ok()) {
    return common::Result<Config>::failure(contents.error());
  }
  if (!contents.value().has_value()) {
    apply_env_overrides(config);
    return common::Result<Config>::success(std::move(config));
  }

  const auto parsed = common::parse_toml(*contents.value());
  if (!parsed.ok()) {
    common::Error error = parsed.error();
    error.path = path.string();
    return common::Result<Config>::failure(std::move(error));
  }
  const auto &doc = parsed.value();

  config.storage.root = doc.get_string("storage.root", config.storage.root);
  config.storage.memory_extension =
      normalize_extension(doc.get_string("storage.memory_extension", config.storage.memory_extension));
  config.storage.index_extension =
      normalize_extension(doc.get_string("storage.index_extension", config.storage.index_extension));

  if (doc.has("index.strict_reindex")) {
    const auto strict = doc.get_bool("index.strict_reindex");
    if (!strict.has_value()) {
      return common::Result<Config>::failure(common::make_error(
          common::ErrorCode::InvalidConfig, "index.strict_reindex must be a boolean", path.string()));
    }
    config.index.strict_reindex = *strict;
  }
  if (doc.has("index.reindex_timeout_ms")) {
    const auto timeout = doc.get_u64("index.reindex_timeout_ms");
    if (!timeout.has_value()) {
      return common::Result<Config>::failure(
          common::make_error(common::ErrorCode::InvalidConfig,
                             "index.reindex_timeout_ms must be a non-negative integer",
                             path.string()));
    }
    config.index.reindex_timeout_ms = *timeout;
  }

  config.memory.format = doc.get_string("memory.format", config.memory.format);
  config.observability.backend =
      doc.get_string("observability.backend", config.observability.backend);

  apply_env_overrides(config);
  return common::Result<Config>::success(std::move(config));
}

common::Status save_config(const Config &config) {
  const auto cfg_path_result = config_path();
  if (!cfg_path_result.ok()) {
    return common::Status::failure(cfg_path_result.error());
  }

  std::ostringstream file;
  file << "[storage]\n";
  file << "root = " << common::quote_toml_string(config.storage.root) << "\n";
  file << "memory_extension = " << common::quote_toml_string(config.storage.memory_extension)
       << "\n";
  file << "index_extension = " << common::quote_toml_string(config.storage.index_extension)
       << "\n";

  file << "\n[index]\n";
  file << "strict_reindex = " << bool_to_toml(config.index.strict_reindex) << "\n";
  file << "reindex_timeout_ms = " << config.index.reindex_timeout_ms << "\n";

  file << "\n[memory]\n";
  file << "format = " << common::quote_toml_string(config.memory.format) << "\n";

  file << "\n[observability]\n";
  file << "backend = " << common::quote_toml_string(config.observability.backend) << "\n";

  return common::write_text_file_atomic(cfg_path_result.value(), file.str(),
                                        common::ErrorCode::InvalidConfig);
}

common::Result<std::vector<std::string>> validate_config(const Config &config) {
  std::vector<std::string> warnings;

  if (common::trim(config.storage.root).empty()) {
    return invalid("storage.root must not be empty");
  }

  const std::string memory_ext = normalize_extension(config.storage.memory_extension);
  const std::string index_ext = normalize_extension(config.storage.index_extension);
  if (memory_ext.size() < 2 || index_ext.size() < 2) {
    return invalid("storage extensions must not be empty");
  }
  if (common::to_lower(memory_ext) == common::to_lower(index_ext)) {
    return invalid("storage.memory_extension and storage.index_extension must differ");
  }
  if (memory_ext.find('/') != std::string::npos || index_ext.find('/') != std::string::npos) {
    return invalid("storage extensions must not contain '/'");
  }

  if (common::to_lower(common::trim(config.memory.format)) != "frontmatter") {
    return invalid("Unknown memory.format: " + config.memory.format);
  }

  std::stringstream backends(common::to_lower(config.observability.backend));
  std::string part;
  while (std::getline(backends, part, ',')) {
    const std::string backend = common::trim(part);
    if (!backend.empty() && !is_known_backend(backend)) {
      return invalid("Unknown observability.backend: " + backend);
    }
  }

  if (!config.index.strict_reindex) {
    warnings.emplace_back("index.strict_reindex is disabled; invalid memory files will be "
                          "skipped during reindex");
  }
  if (config.index.reindex_timeout_ms > 0 && config.index.reindex_timeout_ms < 100) {
    warnings.emplace_back("index.reindex_timeout_ms is very low; reindex may time out");
  }

  return common::Result<std::vector<std::string>>::success(std::move(warnings));
}

} // namespace cortex::config
