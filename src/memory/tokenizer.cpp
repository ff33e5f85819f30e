#include "cortex/memory/tokenizer.hpp"

#include <algorithm>
#include <cctype>

namespace cortex::memory {

std::size_t HeuristicTokenizer::estimate(const std::string_view text) const {
  std::size_t first = 0;
  std::size_t last = text.size();
  while (first < last && std::isspace(static_cast<unsigned char>(text[first])) != 0) {
    ++first;
  }
  while (last > first && std::isspace(static_cast<unsigned char>(text[last - 1])) != 0) {
    --last;
  }
  const std::size_t length = last - first;
  if (length == 0) {
    return 0;
  }
  return std::max<std::size_t>(1, (length + 3) / 4);
}

} // namespace cortex::memory
