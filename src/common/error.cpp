#include "cortex/common/error.hpp"

namespace cortex::common {

std::string_view error_code_name(const ErrorCode code) {
  switch (code) {
  case ErrorCode::InvalidPath:
    return "INVALID_PATH";
  case ErrorCode::InvalidSlug:
    return "INVALID_SLUG";
  case ErrorCode::InvalidInput:
    return "INVALID_INPUT";
  case ErrorCode::MemoryNotFound:
    return "MEMORY_NOT_FOUND";
  case ErrorCode::MemoryExpired:
    return "MEMORY_EXPIRED";
  case ErrorCode::DestinationExists:
    return "DESTINATION_EXISTS";
  case ErrorCode::CategoryNotFound:
    return "CATEGORY_NOT_FOUND";
  case ErrorCode::RootCategoryRejected:
    return "ROOT_CATEGORY_REJECTED";
  case ErrorCode::DescriptionTooLong:
    return "DESCRIPTION_TOO_LONG";
  case ErrorCode::StorageError:
    return "STORAGE_ERROR";
  case ErrorCode::ReadFailed:
    return "READ_FAILED";
  case ErrorCode::WriteFailed:
    return "WRITE_FAILED";
  case ErrorCode::IndexUpdateFailed:
    return "INDEX_UPDATE_FAILED";
  case ErrorCode::ReindexTimeout:
    return "REINDEX_TIMEOUT";
  case ErrorCode::MissingFrontmatter:
    return "MISSING_FRONTMATTER";
  case ErrorCode::InvalidFrontmatter:
    return "INVALID_FRONTMATTER";
  case ErrorCode::MissingField:
    return "MISSING_FIELD";
  case ErrorCode::InvalidTimestamp:
    return "INVALID_TIMESTAMP";
  case ErrorCode::InvalidTags:
    return "INVALID_TAGS";
  case ErrorCode::InvalidSource:
    return "INVALID_SOURCE";
  case ErrorCode::InvalidCitations:
    return "INVALID_CITATIONS";
  case ErrorCode::InvalidIndexFormat:
    return "INVALID_INDEX_FORMAT";
  case ErrorCode::InvalidIndexSection:
    return "INVALID_INDEX_SECTION";
  case ErrorCode::InvalidIndexEntry:
    return "INVALID_INDEX_ENTRY";
  case ErrorCode::InvalidIndexNumber:
    return "INVALID_INDEX_NUMBER";
  case ErrorCode::InvalidConfig:
    return "INVALID_CONFIG";
  }
  return "STORAGE_ERROR";
}

std::string Error::describe() const {
  std::string out(error_code_name(code));
  out += ": ";
  out += message;
  if (path.has_value()) {
    out += " (" + *path + ")";
  }
  if (line.has_value()) {
    out += " at line " + std::to_string(*line);
  }
  if (system_error) {
    out += " [" + system_error.message() + "]";
  }
  if (cause != nullptr) {
    out += " <- " + cause->describe();
  }
  return out;
}

Error make_error(const ErrorCode code, std::string message) {
  return Error{.code = code, .message = std::move(message)};
}

Error make_error(const ErrorCode code, std::string message, std::string path) {
  return Error{.code = code, .message = std::move(message), .path = std::move(path)};
}

Error wrap_error(const ErrorCode code, std::string message, const Error &cause) {
  Error error{.code = code, .message = std::move(message)};
  error.path = cause.path;
  error.cause = std::make_shared<const Error>(cause);
  return error;
}

Error io_error(const ErrorCode code, std::string message, std::string path,
               const std::error_code ec) {
  return Error{.code = code,
               .message = std::move(message),
               .path = std::move(path),
               .system_error = ec};
}

} // namespace cortex::common
