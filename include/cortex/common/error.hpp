#pragma once

#include <cstddef>
#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <system_error>

namespace cortex::common {

enum class ErrorCode {
  // Input errors
  InvalidPath,
  InvalidSlug,
  InvalidInput,
  // Domain-state errors
  MemoryNotFound,
  MemoryExpired,
  DestinationExists,
  CategoryNotFound,
  RootCategoryRejected,
  DescriptionTooLong,
  // Infrastructure errors
  StorageError,
  ReadFailed,
  WriteFailed,
  IndexUpdateFailed,
  ReindexTimeout,
  // Corruption errors
  MissingFrontmatter,
  InvalidFrontmatter,
  MissingField,
  InvalidTimestamp,
  InvalidTags,
  InvalidSource,
  InvalidCitations,
  InvalidIndexFormat,
  InvalidIndexSection,
  InvalidIndexEntry,
  InvalidIndexNumber,
  // Configuration
  InvalidConfig,
};

[[nodiscard]] std::string_view error_code_name(ErrorCode code);

struct Error {
  ErrorCode code = ErrorCode::StorageError;
  std::string message;
  std::optional<std::string> path;
  std::optional<std::string> field;
  std::optional<std::size_t> line;
  std::error_code system_error;
  std::shared_ptr<const Error> cause;

  [[nodiscard]] std::string describe() const;
};

[[nodiscard]] Error make_error(ErrorCode code, std::string message);
[[nodiscard]] Error make_error(ErrorCode code, std::string message, std::string path);
[[nodiscard]] Error wrap_error(ErrorCode code, std::string message, const Error &cause);
[[nodiscard]] Error io_error(ErrorCode code, std::string message, std::string path,
                             std::error_code ec);

} // namespace cortex::common
