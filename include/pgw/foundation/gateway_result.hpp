#pragma once

/// @file gateway_result.hpp
/// @brief GatewayResult<T> alias binding Result to GatewayError.

#include "pgw/core/result.hpp"
#include "pgw/foundation/gateway_error.hpp"

namespace pgw::foundation {

/// Result type used by every fallible gateway operation.
///
/// Example:
/// @code
///   GatewayResult<double> parseCost(std::string_view text) {
///       if (text.empty()) {
///           return GatewayResult<double>::err(
///               GatewayError(ErrorCode::InvalidArgument, "empty cost"));
///       }
///       return GatewayResult<double>::ok(std::stod(std::string(text)));
///   }
/// @endcode
template <typename T>
using GatewayResult = pgw::Result<T, GatewayError>;

}  // namespace pgw::foundation
