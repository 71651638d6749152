/**
 * @file result.hpp
 * @brief Result<T> type aliases and helpers for the job queue
 *
 * This file provides standardized Result<T> types and error handling
 * utilities for jobq, integrating with common_system's Result pattern.
 *
 * @see common_system/include/kcenon/common/patterns/result.h
 */

#pragma once

#include <kcenon/common/patterns/result.h>
#include <kcenon/common/error/error_codes.h>

#include <string>

namespace jobq {

/**
 * @brief Result type alias for jobq operations
 * @tparam T The success value type
 */
template <typename T>
using Result = kcenon::common::Result<T>;

/**
 * @brief Result type for void operations
 */
using VoidResult = kcenon::common::VoidResult;

/**
 * @brief Error information type
 */
using error_info = kcenon::common::error_info;

/**
 * @namespace error_codes
 * @brief jobq-specific error codes
 *
 * Error code range: -900 to -949
 * Provides access to both common error codes and queue-specific codes.
 */
namespace error_codes {
    // Import common error codes
    using namespace kcenon::common::error::codes::common_errors;

    constexpr int jobq_base = -900;

    // Store errors (-900 to -919)
    constexpr int store_open_error = jobq_base - 0;
    constexpr int store_query_error = jobq_base - 1;
    constexpr int store_write_error = jobq_base - 2;
    constexpr int store_migration_error = jobq_base - 3;
    constexpr int duplicate_job = jobq_base - 5;

    // Lifecycle errors (-920 to -939)
    constexpr int job_not_found = jobq_base - 20;
    constexpr int invalid_state = jobq_base - 21;
} // namespace error_codes

/**
 * @brief Check whether an error code belongs to the store range
 */
[[nodiscard]] constexpr bool is_store_error(int code) noexcept {
    return code <= error_codes::store_open_error &&
           code >= error_codes::jobq_base - 19;
}

// Re-export common utility functions
using kcenon::common::ok;
using kcenon::common::make_error;
using kcenon::common::is_ok;
using kcenon::common::is_error;

/**
 * @brief Create a jobq error result with module context
 * @tparam T The result value type
 * @param code Error code from jobq::error_codes
 * @param message Error message
 * @param details Optional additional details
 * @return Result<T> containing the error
 */
template <typename T>
inline Result<T> jobq_error(int code, const std::string& message,
                            const std::string& details = "") {
    if (details.empty()) {
        return kcenon::common::make_error<T>(code, message, "jobq");
    }
    return kcenon::common::make_error<T>(code, message, "jobq", details);
}

/**
 * @brief Create a jobq void error result
 * @param code Error code from jobq::error_codes
 * @param message Error message
 * @param details Optional additional details
 * @return VoidResult containing the error
 */
inline VoidResult jobq_void_error(int code, const std::string& message,
                                  const std::string& details = "") {
    if (details.empty()) {
        return VoidResult(error_info{code, message, "jobq"});
    }
    return VoidResult(error_info{code, message, "jobq", details});
}

} // namespace jobq
