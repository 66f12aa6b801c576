/**
 * @file result.hpp
 * @brief Result<T> type aliases and helpers for the CSA decoder
 *
 * This file provides standardized Result<T> types and error handling
 * utilities for CSA header decoding, integrating with common_system's
 * Result pattern.
 *
 * @see common_system/include/kcenon/common/patterns/result.h
 */

#pragma once

#include <kcenon/common/patterns/result.h>
#include <kcenon/common/error/error_codes.h>

#include <string>

namespace csa {

/**
 * @brief Result type alias for CSA operations
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
 * @brief CSA-specific error codes
 *
 * Error code range: -700 to -719
 * Every code except element_not_found aborts the whole decode.
 */
namespace error_codes {
    // Import common error codes
    using namespace kcenon::common::error::codes::common_errors;

    constexpr int csa_base = -700;

    // Binary stream errors (-700 to -709)
    constexpr int out_of_bounds = csa_base - 0;
    constexpr int malformed_header = csa_base - 1;
    constexpr int invalid_check_bit = csa_base - 2;
    constexpr int truncated_stream = csa_base - 3;
    constexpr int size_mismatch = csa_base - 4;

    // Element source errors (-710 to -719)
    constexpr int element_not_found = csa_base - 10;
} // namespace error_codes

// Re-export common utility functions
using kcenon::common::ok;
using kcenon::common::make_error;
using kcenon::common::is_ok;
using kcenon::common::is_error;
using kcenon::common::get_value;
using kcenon::common::get_error;

/**
 * @brief Create a CSA error result with module context
 * @tparam T The result value type
 * @param code Error code from csa::error_codes
 * @param message Error message
 * @param details Optional additional details (offset, tag index, tag name)
 * @return Result<T> containing the error
 */
template <typename T>
inline Result<T> csa_error(int code, const std::string& message,
                           const std::string& details = "") {
    if (details.empty()) {
        return kcenon::common::make_error<T>(code, message, "csa");
    }
    return kcenon::common::make_error<T>(code, message, "csa", details);
}

/**
 * @brief Create a CSA void error result
 * @param code Error code from csa::error_codes
 * @param message Error message
 * @param details Optional additional details
 * @return VoidResult containing the error
 */
inline VoidResult csa_void_error(int code, const std::string& message,
                                 const std::string& details = "") {
    if (details.empty()) {
        return VoidResult(error_info{code, message, "csa"});
    }
    return VoidResult(error_info{code, message, "csa", details});
}

/**
 * @brief Re-wrap an error from another result type
 * @tparam T The target result value type
 * @param error The error to forward
 * @return Result<T> carrying the same code, message and details
 */
template <typename T>
inline Result<T> forward_error(const error_info& error) {
    return Result<T>(error);
}

} // namespace csa

