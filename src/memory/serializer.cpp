#include "cortex/memory/serializer.hpp"

#include "cortex/common/fs.hpp"
#include "cortex/memory/frontmatter.hpp"

namespace cortex::memory {

common::Result<std::shared_ptr<const IMemorySerializer>>
create_serializer(const std::string_view format) {
  const std::string normalized = common::to_lower(common::trim(std::string(format)));
  if (normalized.empty() || normalized == "frontmatter") {
    return common::Result<std::shared_ptr<const IMemorySerializer>>::success(
        std::make_shared<FrontmatterSerializer>());
  }
  return common::Result<std::shared_ptr<const IMemorySerializer>>::failure(common::make_error(
      common::ErrorCode::InvalidConfig, "Unknown memory format: " + std::string(format)));
}

} // namespace cortex::memory
