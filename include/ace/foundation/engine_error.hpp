#pragma once

/// @file engine_error.hpp
/// @brief Failure value returned by the lifecycle, registration and
///        configuration boundaries.

#include <any>
#include <string>
#include <string_view>
#include <utility>

#include "ace/foundation/error_code.hpp"

namespace ace::foundation {

/// What went wrong outside the resolution path.
///
/// The context slot carries whatever identifies the culprit: the job id of
/// a duplicate provider, the dotted key of a rejected setting. Readers ask
/// for it by type and get nullptr when the producer stored something else.
///
/// @code
///   auto r = engine.initialize(config, kProviders);
///   if (!r) {
///       if (const auto* key = r.error().context<std::string>()) { ... }
///   }
/// @endcode
class EngineError {
public:
    EngineError() = default;

    explicit EngineError(ErrorCode code)
        : code_(code) {}

    EngineError(ErrorCode code, std::string message)
        : code_(code), message_(std::move(message)) {}

    EngineError(ErrorCode code, std::string message, std::any context)
        : code_(code), message_(std::move(message)), context_(std::move(context)) {}

    [[nodiscard]] ErrorCode code() const noexcept { return code_; }

    [[nodiscard]] std::string_view message() const noexcept { return message_; }

    /// Engine area the code belongs to ("Rules", "Config", ...).
    [[nodiscard]] std::string_view subsystem() const noexcept {
        return errorSubsystem(code_);
    }

    /// "[Subsystem] message", the form lifecycle logs print.
    [[nodiscard]] std::string describe() const {
        std::string out = "[";
        out.append(subsystem());
        out.append("] ");
        out.append(message_);
        return out;
    }

    template <typename T>
    [[nodiscard]] const T* context() const noexcept {
        return std::any_cast<T>(&context_);
    }

    [[nodiscard]] bool hasContext() const noexcept { return context_.has_value(); }

private:
    ErrorCode code_ = ErrorCode::Unknown;
    std::string message_;
    std::any context_;
};

} // namespace ace::foundation
