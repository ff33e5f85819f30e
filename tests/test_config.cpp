#include "test_framework.hpp"

#include "tests/helpers/test_helpers.hpp"

#include "cortex/config/config.hpp"
#include "cortex/memory/frontmatter.hpp"
#include "cortex/storage/filesystem_storage.hpp"

#include <cstdlib>
#include <filesystem>
#include <fstream>

namespace {

struct EnvGuard {
  std::string key;
  std::optional<std::string> old_value;

  EnvGuard(std::string key_, std::optional<std::string> value) : key(std::move(key_)) {
    if (const char *existing = std::getenv(key.c_str()); existing != nullptr) {
      old_value = existing;
    }
    if (value.has_value()) {
      setenv(key.c_str(), value->c_str(), 1);
    } else {
      unsetenv(key.c_str());
    }
  }

  ~EnvGuard() {
    if (old_value.has_value()) {
      setenv(key.c_str(), old_value->c_str(), 1);
    } else {
      unsetenv(key.c_str());
    }
  }
};

struct ConfigOverrideGuard {
  std::optional<std::filesystem::path> old_override;

  explicit ConfigOverrideGuard(std::optional<std::filesystem::path> next = std::nullopt) {
    old_override = cortex::config::config_path_override();
    if (next.has_value()) {
      cortex::config::set_config_path_override(*next);
    } else {
      cortex::config::clear_config_path_override();
    }
  }

  ~ConfigOverrideGuard() {
    if (old_override.has_value()) {
      cortex::config::set_config_path_override(*old_override);
    } else {
      cortex::config::clear_config_path_override();
    }
  }
};

void write_file(const std::filesystem::path &path, const std::string &content) {
  std::error_code ec;
  std::filesystem::create_directories(path.parent_path(), ec);
  std::ofstream out(path);
  out << content;
}

} // namespace

void register_config_tests(std::vector<cortex::tests::TestCase> &tests) {
  using cortex::tests::require;
  namespace cfg = cortex::config;

  tests.push_back({"config_defaults_when_missing", [] {
                     cortex::testing::TempDir home;
                     EnvGuard root("CORTEX_STORE_ROOT", std::nullopt);
                     EnvGuard backend("CORTEX_OBSERVABILITY", std::nullopt);
                     ConfigOverrideGuard override_guard(home.path() / "config.toml");

                     require(!cfg::config_exists(), "config should not exist yet");
                     const auto loaded = cfg::load_config();
                     require(loaded.ok(), "missing config should load defaults");
                     require(loaded.value().storage.root == "~/.cortex/memory", "default root");
                     require(loaded.value().storage.memory_extension == ".md", "default extension");
                     require(loaded.value().index.strict_reindex, "strict by default");
                     require(loaded.value().index.reindex_timeout_ms == 0, "unbounded by default");
                     require(loaded.value().observability.backend == "log", "log by default");
                   }});

  tests.push_back({"config_parses_file", [] {
                     cortex::testing::TempDir home;
                     EnvGuard root("CORTEX_STORE_ROOT", std::nullopt);
                     EnvGuard backend("CORTEX_OBSERVABILITY", std::nullopt);
                     const auto path = home.path() / "config.toml";
                     write_file(path, "# store settings\n"
                                      "[storage]\n"
                                      "root = \"/srv/memory\"\n"
                                      "memory_extension = \"markdown\"\n"
                                      "\n"
                                      "[index]\n"
                                      "strict_reindex = false\n"
                                      "reindex_timeout_ms = 2500\n"
                                      "\n"
                                      "[observability]\n"
                                      "backend = \"none\"\n");
                     ConfigOverrideGuard override_guard(path);

                     const auto loaded = cfg::load_config();
                     require(loaded.ok(), loaded.ok() ? "" : loaded.error().describe());
                     const auto &config = loaded.value();
                     require(config.storage.root == "/srv/memory", "root mismatch");
                     require(config.storage.memory_extension == ".markdown",
                             "extension should gain a dot");
                     require(config.storage.index_extension == ".yaml", "index extension default");
                     require(!config.index.strict_reindex, "strict flag mismatch");
                     require(config.index.reindex_timeout_ms == 2500, "timeout mismatch");
                     require(config.observability.backend == "none", "backend mismatch");
                   }});

  tests.push_back({"config_rejects_bad_values", [] {
                     cortex::testing::TempDir home;
                     const auto path = home.path() / "config.toml";
                     ConfigOverrideGuard override_guard(path);

                     write_file(path, "[index]\nstrict_reindex = maybe\n");
                     const auto bad_bool = cfg::load_config();
                     require(cortex::testing::failed_with(bad_bool,
                                                          cortex::common::ErrorCode::InvalidConfig),
                             "non-boolean strict_reindex should be INVALID_CONFIG");
                     require(bad_bool.error().path == std::optional<std::string>(path.string()),
                             "error should name the file");

                     write_file(path, "[index]\nreindex_timeout_ms = -5\n");
                     require(cortex::testing::failed_with(cfg::load_config(),
                                                          cortex::common::ErrorCode::InvalidConfig),
                             "negative timeout should be INVALID_CONFIG");
                   }});

  tests.push_back({"config_env_overrides", [] {
                     cortex::testing::TempDir home;
                     const auto path = home.path() / "config.toml";
                     write_file(path, "[storage]\nroot = \"/from/file\"\n");
                     ConfigOverrideGuard override_guard(path);
                     EnvGuard root("CORTEX_STORE_ROOT", std::string("/from/env"));
                     EnvGuard backend("CORTEX_OBSERVABILITY", std::string("none"));

                     const auto loaded = cfg::load_config();
                     require(loaded.ok(), "load failed");
                     require(loaded.value().storage.root == "/from/env", "env should win");
                     require(loaded.value().observability.backend == "none",
                             "backend env override missing");
                   }});

  tests.push_back({"config_path_env_and_directory_override", [] {
                     cortex::testing::TempDir home;
                     ConfigOverrideGuard override_guard;
                     EnvGuard env_path("CORTEX_CONFIG_PATH", home.path().string());
                     const auto path = cfg::config_path();
                     require(path.ok() && path.value() == home.path() / "config.toml",
                             "directory override should resolve to config.toml inside it");
                     const auto dir = cfg::config_dir();
                     require(dir.ok() && dir.value() == home.path(), "config dir mismatch");
                   }});

  tests.push_back({"config_save_then_load", [] {
                     cortex::testing::TempDir home;
                     EnvGuard root("CORTEX_STORE_ROOT", std::nullopt);
                     EnvGuard backend("CORTEX_OBSERVABILITY", std::nullopt);
                     ConfigOverrideGuard override_guard(home.path() / "nested" / "config.toml");

                     cfg::Config config;
                     config.storage.root = "/data/\"quoted\" store";
                     config.index.strict_reindex = false;
                     config.index.reindex_timeout_ms = 750;
                     config.observability.backend = "log,none";
                     require(cfg::save_config(config).ok(), "save failed");
                     require(cfg::config_exists(), "config should exist after save");

                     const auto loaded = cfg::load_config();
                     require(loaded.ok(), loaded.ok() ? "" : loaded.error().describe());
                     require(loaded.value().storage.root == config.storage.root,
                             "root should survive quoting");
                     require(!loaded.value().index.strict_reindex, "strict flag lost");
                     require(loaded.value().index.reindex_timeout_ms == 750, "timeout lost");
                     require(loaded.value().observability.backend == "log,none", "backend lost");
                   }});

  tests.push_back({"config_validate", [] {
                     cfg::Config config;
                     const auto clean = cfg::validate_config(config);
                     require(clean.ok() && clean.value().empty(), "defaults should be clean");

                     config.index.strict_reindex = false;
                     config.index.reindex_timeout_ms = 10;
                     const auto warned = cfg::validate_config(config);
                     require(warned.ok() && warned.value().size() == 2,
                             "lenient reindex and a tiny timeout should warn");

                     cfg::Config same_ext;
                     same_ext.storage.index_extension = ".MD";
                     require(cortex::testing::failed_with(cfg::validate_config(same_ext),
                                                          cortex::common::ErrorCode::InvalidConfig),
                             "clashing extensions should be rejected");

                     cfg::Config empty_root;
                     empty_root.storage.root = "  ";
                     require(!cfg::validate_config(empty_root).ok(), "empty root rejected");

                     cfg::Config bad_format;
                     bad_format.memory.format = "json";
                     require(!cfg::validate_config(bad_format).ok(), "unknown format rejected");

                     cfg::Config bad_backend;
                     bad_backend.observability.backend = "log,prometheus";
                     require(!cfg::validate_config(bad_backend).ok(), "unknown backend rejected");
                   }});

  tests.push_back({"config_builds_filesystem_storage", [] {
                     cortex::testing::TempDir home;
                     cfg::Config config;
                     config.storage.root = home.path().string();
                     config.storage.memory_extension = ".txt";
                     const auto serializer =
                         std::make_shared<const cortex::memory::FrontmatterSerializer>();
                     const auto storage =
                         cortex::storage::FilesystemStorage::from_config(config, serializer);
                     require(storage.ok(), storage.ok() ? "" : storage.error().describe());
                     require(storage.value()->layout().root == home.path(), "root mismatch");
                     require(storage.value()
                                 ->write_memory_file("notes/first", "---\n"
                                                                    "created_at: 2024-01-01T00:00:00.000Z\n"
                                                                    "updated_at: 2024-01-01T00:00:00.000Z\n"
                                                                    "tags: []\n"
                                                                    "source: test\n"
                                                                    "---\n"
                                                                    "body")
                                 .ok(),
                             "write failed");
                     require(home.exists("notes/first.txt"), "configured extension not used");

                     cfg::Config invalid;
                     invalid.memory.format = "xml";
                     require(!cortex::storage::FilesystemStorage::from_config(invalid, serializer).ok(),
                             "invalid config should not build a store");
                   }});
}
