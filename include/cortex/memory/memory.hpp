#pragma once

#include "cortex/common/result.hpp"
#include "cortex/common/time.hpp"

#include <optional>
#include <string>
#include <vector>

namespace cortex::memory {

struct MemoryMetadata {
  common::Timestamp created_at{};
  common::Timestamp updated_at{};
  std::vector<std::string> tags;
  std::string source;
  std::optional<common::Timestamp> expires_at;
  std::vector<std::string> citations;
};

struct Memory {
  MemoryMetadata metadata;
  std::string content;

  /// Expired once `expires_at <= now`; memories without an expiry never expire.
  [[nodiscard]] bool is_expired(common::Timestamp now) const;
};

[[nodiscard]] common::Status validate_metadata(const MemoryMetadata &metadata);

} // namespace cortex::memory
