#pragma once

#include "cortex/common/result.hpp"

#include <chrono>
#include <string>

namespace cortex::common {

using Clock = std::chrono::system_clock;
using Timestamp = Clock::time_point;

[[nodiscard]] Timestamp now();

[[nodiscard]] std::string format_iso8601(Timestamp value);

/// Accepts `YYYY-MM-DD`, or a date-time with optional fractional seconds
/// and a `Z` or `+HH:MM` / `-HH:MM` offset. Offsetless date-times are UTC.
[[nodiscard]] Result<Timestamp> parse_iso8601(const std::string &value);

} // namespace cortex::common
