#pragma once

#include "cortex/common/result.hpp"

#include <chrono>
#include <cstddef>
#include <optional>
#include <string>
#include <vector>

namespace cortex::storage {

struct WriteOptions {
  bool allow_index_create = true;
  bool allow_index_update = true;
};

struct ReindexOptions {
  std::optional<std::chrono::milliseconds> timeout;
};

struct ReindexResult {
  std::size_t memories_indexed = 0;
  std::size_t categories_indexed = 0;
  std::vector<std::string> warnings;
};

class IStorageAdapter {
public:
  virtual ~IStorageAdapter() = default;

  /// nullopt when the memory does not exist.
  [[nodiscard]] virtual common::Result<std::optional<std::string>>
  read_memory_file(const std::string &slug_path) = 0;
  [[nodiscard]] virtual common::Status write_memory_file(const std::string &slug_path,
                                                         const std::string &contents,
                                                         const WriteOptions &options = {}) = 0;
  /// Idempotent.
  [[nodiscard]] virtual common::Status remove_memory_file(const std::string &slug_path) = 0;
  /// The destination category directory must already exist.
  [[nodiscard]] virtual common::Status move_memory_file(const std::string &from,
                                                        const std::string &to) = 0;

  [[nodiscard]] virtual common::Result<std::optional<std::string>>
  read_index_file(const std::string &name) = 0;
  [[nodiscard]] virtual common::Status write_index_file(const std::string &name,
                                                        const std::string &contents) = 0;
  [[nodiscard]] virtual common::Result<ReindexResult>
  reindex_category_indexes(const ReindexOptions &options = {}) = 0;

  /// Brings one memory's index entry in line with the file: upserted when
  /// the file exists, dropped otherwise. Counts along the chain follow.
  [[nodiscard]] virtual common::Status refresh_memory_index(const std::string &slug_path) = 0;

  [[nodiscard]] virtual common::Result<bool> category_exists(const std::string &path) = 0;
  [[nodiscard]] virtual common::Status ensure_category_directory(const std::string &path) = 0;
  /// Idempotent recursive delete.
  [[nodiscard]] virtual common::Status delete_category_directory(const std::string &path) = 0;

  [[nodiscard]] virtual common::Status register_category(const std::string &path) = 0;
  [[nodiscard]] virtual common::Status unregister_category(const std::string &path) = 0;
  [[nodiscard]] virtual common::Status
  set_category_description(const std::string &path,
                           const std::optional<std::string> &description) = 0;
};

} // namespace cortex::storage
