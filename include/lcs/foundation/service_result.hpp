#pragma once

/// @file service_result.hpp
/// @brief ServiceResult<T> type alias for lobby service error handling.

#include "lcs/core/result.hpp"
#include "lcs/foundation/service_error.hpp"

namespace lcs::foundation {

/// Result type specialized with ServiceError.
///
/// Every registry, lobby and coordinator method that can fail returns
/// ServiceResult<T> instead of throwing exceptions.
///
/// Example:
/// @code
///   ServiceResult<void> validateRounds(const std::string& value) {
///       if (value.empty()) {
///           return ServiceResult<void>::err(
///               ServiceError(ErrorCode::PropertyRejected, "rounds is empty", "rounds"));
///       }
///       return ServiceResult<void>::ok();
///   }
/// @endcode
template <typename T>
using ServiceResult = lcs::Result<T, ServiceError>;

}  // namespace lcs::foundation
