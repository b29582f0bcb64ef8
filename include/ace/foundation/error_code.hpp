#pragma once

/// @file error_code.hpp
/// @brief Categorized error codes for the action resolution engine.

#include <cstdint>
#include <string_view>

namespace ace::foundation {

/// Error codes categorized by subsystem using hex ranges.
///
/// Each subsystem occupies a 256-value range (0x100), so the source of an
/// error can be read from the code value alone.
enum class ErrorCode : uint32_t {
    // General (0x0000 - 0x00FF)
    Success = 0x0000,
    Unknown = 0x0001,
    InvalidArgument = 0x0002,
    NotFound = 0x0003,
    AlreadyExists = 0x0004,

    // State (0x0100 - 0x01FF)
    StateError = 0x0100,

    // Targeting (0x0200 - 0x02FF)
    TargetingError = 0x0200,

    // Rules (0x0300 - 0x03FF)
    RuleError = 0x0300,
    DuplicateProvider = 0x0301,

    // Resolution (0x0400 - 0x04FF)
    ResolutionError = 0x0400,

    // Config (0x0600 - 0x06FF)
    ConfigLoadFailed = 0x0600,
    ConfigKeyNotFound = 0x0601,
    ConfigTypeMismatch = 0x0602,
    ConfigInvalidValue = 0x0603,

    // Lifecycle (0x0700 - 0x07FF)
    LifecycleError = 0x0700,
    AlreadyInitialized = 0x0701,
    NotInitialized = 0x0702,

    // Logger (0x0800 - 0x08FF)
    LoggerError = 0x0800,
    LoggerFlushFailed = 0x0801,
};

/// Return the subsystem name for a given error code.
constexpr std::string_view errorSubsystem(ErrorCode code) {
    auto value = static_cast<uint32_t>(code);
    auto category = value & 0xFF00;
    switch (category) {
        case 0x0000: return "General";
        case 0x0100: return "State";
        case 0x0200: return "Targeting";
        case 0x0300: return "Rules";
        case 0x0400: return "Resolution";
        case 0x0600: return "Config";
        case 0x0700: return "Lifecycle";
        case 0x0800: return "Logger";
        default: return "Unknown";
    }
}

} // namespace ace::foundation
