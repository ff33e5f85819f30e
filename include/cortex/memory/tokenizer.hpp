#pragma once

#include <cstddef>
#include <string_view>

namespace cortex::memory {

class ITokenizer {
public:
  virtual ~ITokenizer() = default;

  [[nodiscard]] virtual std::size_t estimate(std::string_view text) const = 0;
};

/// Roughly four characters per token: 0 for blank text, otherwise
/// `max(1, ceil(len(trimmed) / 4))`.
class HeuristicTokenizer final : public ITokenizer {
public:
  [[nodiscard]] std::size_t estimate(std::string_view text) const override;
};

} // namespace cortex::memory
