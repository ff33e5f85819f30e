#pragma once

#include "cortex/common/result.hpp"
#include "cortex/storage/adapter.hpp"

#include <memory>
#include <optional>
#include <string>

namespace cortex::category {

struct CreateCategoryResult {
  std::string path;
  bool created = false;
};

struct DeleteCategoryResult {
  std::string path;
  bool deleted = false;
};

struct SetDescriptionResult {
  std::string path;
  std::optional<std::string> description;
};

class CategoryOperations {
public:
  explicit CategoryOperations(std::shared_ptr<storage::IStorageAdapter> storage);

  [[nodiscard]] common::Result<CreateCategoryResult> create(const std::string &path);

  /// Recursively deletes a nested category and drops it from its parent
  /// index. Top-level categories are rejected.
  [[nodiscard]] common::Result<DeleteCategoryResult> remove(const std::string &path);

  [[nodiscard]] common::Result<SetDescriptionResult>
  set_description(const std::string &path, const std::string &description);

private:
  [[nodiscard]] common::Result<bool> exists(const std::string &path);

  std::shared_ptr<storage::IStorageAdapter> storage_;
};

} // namespace cortex::category
