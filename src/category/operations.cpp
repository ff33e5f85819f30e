#include "cortex/category/operations.hpp"

#include "cortex/common/fs.hpp"
#include "cortex/index/category_index.hpp"
#include "cortex/memory/identity.hpp"

#include <stdexcept>

namespace cortex::category {

namespace {

common::Result<std::string> normalize_path(const std::string &path) {
  auto normalized = memory::validate_category_path(path);
  if (normalized.ok()) {
    return normalized;
  }
  const std::string message = normalized.error().code == common::ErrorCode::InvalidPath
                                  ? "Category path cannot be empty"
                                  : normalized.error().message;
  common::Error error =
      common::wrap_error(common::ErrorCode::InvalidPath, message, normalized.error());
  error.path = path;
  return common::Result<std::string>::failure(std::move(error));
}

common::Error storage_error(std::string message, const std::string &path,
                            const common::Error &cause) {
  common::Error error =
      common::wrap_error(common::ErrorCode::StorageError, std::move(message), cause);
  error.path = path;
  return error;
}

common::Error not_found(const std::string &path) {
  return common::make_error(common::ErrorCode::CategoryNotFound, "Category not found: " + path,
                            path);
}

} // namespace

CategoryOperations::CategoryOperations(std::shared_ptr<storage::IStorageAdapter> storage)
    : storage_(std::move(storage)) {
  if (!storage_) {
    throw std::invalid_argument("CategoryOperations requires a storage adapter");
  }
}

common::Result<bool> CategoryOperations::exists(const std::string &path) {
  const auto found = storage_->category_exists(path);
  if (!found.ok()) {
    return common::Result<bool>::failure(
        storage_error("Failed to check category: " + path, path, found.error()));
  }
  return found;
}

common::Result<CreateCategoryResult> CategoryOperations::create(const std::string &path) {
  const auto normalized = normalize_path(path);
  if (!normalized.ok()) {
    return common::Result<CreateCategoryResult>::failure(normalized.error());
  }
  const std::string &category = normalized.value();

  const auto found = exists(category);
  if (!found.ok()) {
    return common::Result<CreateCategoryResult>::failure(found.error());
  }
  if (found.value()) {
    return common::Result<CreateCategoryResult>::success(
        CreateCategoryResult{.path = category, .created = false});
  }

  const auto ensured = storage_->ensure_category_directory(category);
  if (!ensured.ok()) {
    return common::Result<CreateCategoryResult>::failure(
        storage_error("Failed to create category: " + category, category, ensured.error()));
  }
  const auto registered = storage_->register_category(category);
  if (!registered.ok()) {
    return common::Result<CreateCategoryResult>::failure(
        storage_error("Category created but index update failed: " + category, category,
                      registered.error()));
  }
  return common::Result<CreateCategoryResult>::success(
      CreateCategoryResult{.path = category, .created = true});
}

common::Result<DeleteCategoryResult> CategoryOperations::remove(const std::string &path) {
  const auto normalized = normalize_path(path);
  if (!normalized.ok()) {
    return common::Result<DeleteCategoryResult>::failure(normalized.error());
  }
  const std::string &category = normalized.value();

  if (memory::parent_category(category).empty()) {
    return common::Result<DeleteCategoryResult>::failure(common::make_error(
        common::ErrorCode::RootCategoryRejected, "Cannot delete root category", category));
  }

  const auto found = exists(category);
  if (!found.ok()) {
    return common::Result<DeleteCategoryResult>::failure(found.error());
  }
  if (!found.value()) {
    return common::Result<DeleteCategoryResult>::failure(not_found(category));
  }

  const auto deleted = storage_->delete_category_directory(category);
  if (!deleted.ok()) {
    return common::Result<DeleteCategoryResult>::failure(
        storage_error("Failed to delete category: " + category, category, deleted.error()));
  }
  const auto unregistered = storage_->unregister_category(category);
  if (!unregistered.ok()) {
    return common::Result<DeleteCategoryResult>::failure(
        storage_error("Category deleted but index update failed: " + category, category,
                      unregistered.error()));
  }
  return common::Result<DeleteCategoryResult>::success(
      DeleteCategoryResult{.path = category, .deleted = true});
}

common::Result<SetDescriptionResult>
CategoryOperations::set_description(const std::string &path, const std::string &description) {
  const auto normalized = normalize_path(path);
  if (!normalized.ok()) {
    return common::Result<SetDescriptionResult>::failure(normalized.error());
  }
  const std::string &category = normalized.value();

  const std::string trimmed = common::trim(description);
  if (trimmed.size() > index::MAX_DESCRIPTION_LENGTH) {
    return common::Result<SetDescriptionResult>::failure(common::make_error(
        common::ErrorCode::DescriptionTooLong,
        "Description exceeds maximum length of " + std::to_string(index::MAX_DESCRIPTION_LENGTH) +
            " characters",
        category));
  }

  const auto found = exists(category);
  if (!found.ok()) {
    return common::Result<SetDescriptionResult>::failure(found.error());
  }
  if (!found.value()) {
    return common::Result<SetDescriptionResult>::failure(not_found(category));
  }

  std::optional<std::string> value;
  if (!trimmed.empty()) {
    value = trimmed;
  }
  const auto updated = storage_->set_category_description(category, value);
  if (!updated.ok()) {
    return common::Result<SetDescriptionResult>::failure(
        storage_error("Failed to update description: " + category, category, updated.error()));
  }
  return common::Result<SetDescriptionResult>::success(
      SetDescriptionResult{.path = category, .description = value});
}

} // namespace cortex::category
