#pragma once

#include <cstdint>
#include <string>

namespace cortex::config {

struct StorageConfig {
  std::string root = "~/.cortex/memory";
  std::string memory_extension = ".md";
  std::string index_extension = ".yaml";
};

struct IndexConfig {
  bool strict_reindex = true;
  // 0 = unbounded
  std::uint64_t reindex_timeout_ms = 0;
};

struct MemoryConfig {
  std::string format = "frontmatter";
};

struct ObservabilityConfig {
  std::string backend = "log";
};

struct Config {
  StorageConfig storage;
  IndexConfig index;
  MemoryConfig memory;
  ObservabilityConfig observability;
};

} // namespace cortex::config
