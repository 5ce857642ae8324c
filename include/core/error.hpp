#pragma once

#include <stdexcept>
#include <string>

namespace ratekeeper {

/**
 * @brief Error categories for the admission stores
 */
enum class ErrorCategory {
    NONE,
    VALIDATION_ERROR,
    LIFECYCLE_ERROR,
    INFRASTRUCTURE_ERROR,
    BACKEND_ERROR,
    UNSUPPORTED_ERROR
};

inline const char* error_category_to_string(ErrorCategory category) {
    switch (category) {
        case ErrorCategory::VALIDATION_ERROR:     return "validation";
        case ErrorCategory::LIFECYCLE_ERROR:      return "lifecycle";
        case ErrorCategory::INFRASTRUCTURE_ERROR: return "infrastructure";
        case ErrorCategory::BACKEND_ERROR:        return "backend";
        case ErrorCategory::UNSUPPORTED_ERROR:    return "unsupported";
        default:                                  return "none";
    }
}

/**
 * @brief Base class for every fault raised by a rate limit store
 *
 * "Capacity exhausted" is never an error: can_proceed()/acquire() return
 * false for it. Only genuine faults are thrown.
 */
class RateLimitError : public std::runtime_error {
public:
    RateLimitError(ErrorCategory category, const std::string& message)
        : std::runtime_error(message), category_(category) {}

    [[nodiscard]] ErrorCategory category() const noexcept { return category_; }

private:
    ErrorCategory category_;
};

/**
 * @brief Invalid resource or origin key. Raised before any I/O.
 */
class ValidationError : public RateLimitError {
public:
    explicit ValidationError(const std::string& message)
        : RateLimitError(ErrorCategory::VALIDATION_ERROR, message) {}
};

/**
 * @brief Operation attempted after close()/destroy()
 */
class StoreDestroyedError : public RateLimitError {
public:
    StoreDestroyedError()
        : RateLimitError(ErrorCategory::LIFECYCLE_ERROR,
                         "Rate limit store has been destroyed") {}
};

/**
 * @brief Backing table or collection does not exist
 */
class TableMissingError : public RateLimitError {
public:
    explicit TableMissingError(const std::string& table_name)
        : RateLimitError(ErrorCategory::INFRASTRUCTURE_ERROR, build_message(table_name)),
          table_name_(table_name) {}

    [[nodiscard]] const std::string& table_name() const noexcept { return table_name_; }

private:
    static std::string build_message(const std::string& table_name) {
        return "Table \"" + table_name +
               "\" was not found. Create the table using your infrastructure "
               "(e.g. CloudFormation, CDK, Terraform) or set ensure_table_exists = true.";
    }

    std::string table_name_;
};

/**
 * @brief Unclassified failure reported by the storage medium
 */
class BackendError : public RateLimitError {
public:
    explicit BackendError(const std::string& message)
        : RateLimitError(ErrorCategory::BACKEND_ERROR, message) {}
};

/**
 * @brief Capability declined by the backend (e.g. listing on key-value stores)
 */
class UnsupportedOperationError : public RateLimitError {
public:
    explicit UnsupportedOperationError(const std::string& message)
        : RateLimitError(ErrorCategory::UNSUPPORTED_ERROR, message) {}
};

} // namespace ratekeeper
