#pragma once

/// @file error.h
/// @brief flaresignal error handling utilities using absl::Status

#include <string>
#include <string_view>

#include <absl/status/status.h>
#include <absl/status/statusor.h>
#include <absl/strings/str_cat.h>

namespace flaresignal {

/// @brief Error codes used at the library boundary
enum class ErrorCode {
    kOk = 0,
    kUnknown,
    kNotFound,

    // flaresignal-specific error codes
    kParseError,
    kValidationError,
};

/// @brief Convert error code to absl::StatusCode
absl::StatusCode ToAbslCode(ErrorCode code);

/// @brief Create an error status with the given code and message
absl::Status MakeError(ErrorCode code, std::string_view message);

/// @brief Prefix a non-OK status message with "<context>: ", keeping its code
///
/// OK statuses pass through unchanged.
absl::Status AnnotateStatus(const absl::Status& status, std::string_view context);

// Macros for status checking and propagation

/// @brief Return if status is not OK
#define FLARESIGNAL_RETURN_IF_ERROR(expr)                                      \
    do {                                                                        \
        auto _status = (expr);                                                  \
        if (!_status.ok()) {                                                    \
            return _status;                                                     \
        }                                                                       \
    } while (0)

/// @brief Assign or return if status is not OK
#define FLARESIGNAL_ASSIGN_OR_RETURN(lhs, rhs)                                 \
    FLARESIGNAL_ASSIGN_OR_RETURN_IMPL(                                         \
        FLARESIGNAL_CONCAT(_status_or_, __LINE__), lhs, rhs)

#define FLARESIGNAL_ASSIGN_OR_RETURN_IMPL(statusor, lhs, rhs)                  \
    auto statusor = (rhs);                                                      \
    if (!statusor.ok()) {                                                       \
        return statusor.status();                                               \
    }                                                                           \
    lhs = std::move(statusor).value()

#define FLARESIGNAL_CONCAT(a, b) FLARESIGNAL_CONCAT_IMPL(a, b)
#define FLARESIGNAL_CONCAT_IMPL(a, b) a##b

/// @brief Check condition and return error if false
#define FLARESIGNAL_CHECK_OR_RETURN(condition, error_status)                   \
    do {                                                                        \
        if (!(condition)) {                                                     \
            return (error_status);                                              \
        }                                                                       \
    } while (0)

}  // namespace flaresignal
