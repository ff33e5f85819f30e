#pragma once

#include "cortex/common/result.hpp"
#include "cortex/memory/memory.hpp"

#include <memory>
#include <string>
#include <string_view>

namespace cortex::memory {

class IMemorySerializer {
public:
  virtual ~IMemorySerializer() = default;

  [[nodiscard]] virtual common::Result<Memory> parse(const std::string &raw) const = 0;
  [[nodiscard]] virtual common::Result<std::string> serialize(const Memory &memory) const = 0;
  [[nodiscard]] virtual std::string_view format() const = 0;
};

[[nodiscard]] common::Result<std::shared_ptr<const IMemorySerializer>>
create_serializer(std::string_view format);

} // namespace cortex::memory
