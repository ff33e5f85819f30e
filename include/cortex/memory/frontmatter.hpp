#pragma once

#include "cortex/memory/serializer.hpp"

namespace cortex::memory {

class FrontmatterSerializer final : public IMemorySerializer {
public:
  [[nodiscard]] common::Result<Memory> parse(const std::string &raw) const override;
  [[nodiscard]] common::Result<std::string> serialize(const Memory &memory) const override;
  [[nodiscard]] std::string_view format() const override { return "frontmatter"; }
};

} // namespace cortex::memory
