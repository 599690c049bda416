#pragma once

#include <string>
#include <optional>

namespace rlsengine {

/**
 * @brief Error categories reported by the engine and its store
 */
enum class ErrorCategory {
    NONE,
    VALIDATION_ERROR,       // Rejected at save time (bad role reference, bad value shape)
    NOT_FOUND,
    CONFLICT,               // Duplicate id on create
    STORE_UNAVAILABLE,      // Persistence collaborator unreachable
    INTERNAL_ERROR
};

inline const char* error_category_to_string(ErrorCategory category) {
    switch (category) {
        case ErrorCategory::NONE:              return "none";
        case ErrorCategory::VALIDATION_ERROR:  return "validation_error";
        case ErrorCategory::NOT_FOUND:         return "not_found";
        case ErrorCategory::CONFLICT:          return "conflict";
        case ErrorCategory::STORE_UNAVAILABLE: return "store_unavailable";
        case ErrorCategory::INTERNAL_ERROR:    return "internal_error";
    }
    return "unknown";
}

/**
 * @brief Result type for operations that can fail
 */
template<typename T>
class Result {
public:
    static Result ok(T value) {
        Result r;
        r.success_ = true;
        r.value_ = std::move(value);
        return r;
    }

    static Result error(ErrorCategory category, std::string message) {
        Result r;
        r.success_ = false;
        r.error_category_ = category;
        r.error_message_ = std::move(message);
        return r;
    }

    bool is_ok() const { return success_; }
    bool is_error() const { return !success_; }

    const T& value() const { return *value_; }
    T& value() { return *value_; }

    ErrorCategory error_category() const { return error_category_; }
    const std::string& error_message() const { return error_message_; }

private:
    bool success_ = false;
    std::optional<T> value_;
    ErrorCategory error_category_ = ErrorCategory::NONE;
    std::string error_message_;
};

/// Unit payload for operations that return nothing on success
struct Done {};

} // namespace rlsengine
