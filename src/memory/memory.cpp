#include "cortex/memory/memory.hpp"

#include "cortex/common/fs.hpp"

namespace cortex::memory {

bool Memory::is_expired(const common::Timestamp now) const {
  return metadata.expires_at.has_value() && *metadata.expires_at <= now;
}

common::Status validate_metadata(const MemoryMetadata &metadata) {
  for (const auto &tag : metadata.tags) {
    if (common::trim(tag).empty()) {
      common::Error error =
          common::make_error(common::ErrorCode::InvalidTags, "Tags must be non-empty strings");
      error.field = "tags";
      return common::Status::failure(std::move(error));
    }
  }
  if (common::trim(metadata.source).empty()) {
    common::Error error =
        common::make_error(common::ErrorCode::InvalidSource, "Source must be a non-empty string");
    error.field = "source";
    return common::Status::failure(std::move(error));
  }
  for (const auto &citation : metadata.citations) {
    if (common::trim(citation).empty()) {
      common::Error error = common::make_error(common::ErrorCode::InvalidCitations,
                                               "Citations must be non-empty strings");
      error.field = "citations";
      return common::Status::failure(std::move(error));
    }
  }
  return common::Status::success();
}

} // namespace cortex::memory
