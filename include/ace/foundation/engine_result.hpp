#pragma once

/// @file engine_result.hpp
/// @brief EngineResult<T> alias for engine error handling.

#include "ace/core/result.hpp"
#include "ace/foundation/engine_error.hpp"

namespace ace::foundation {

/// Result type specialized with EngineError.
///
/// Example:
/// @code
///   EngineResult<void> registerJob(JobId job) {
///       if (!job.isValid()) {
///           return EngineResult<void>::err(
///               EngineError(ErrorCode::InvalidArgument, "job id 0 is reserved"));
///       }
///       return EngineResult<void>::ok();
///   }
/// @endcode
template <typename T>
using EngineResult = ace::Result<T, EngineError>;

} // namespace ace::foundation
