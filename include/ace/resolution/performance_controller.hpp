#pragma once

/// @file performance_controller.hpp
/// @brief Load tracking and the degraded-mode bypass switch.

#include <cstdint>
#include <string_view>

#include "ace/foundation/types.hpp"

namespace ace::resolution {

/// Load level derived from the engine's share of the frame.
enum class LoadLevel : uint8_t {
    Ok         = 0,
    Throttling = 1,
    Degraded   = 2
};

constexpr std::string_view loadLevelName(LoadLevel level) {
    switch (level) {
        case LoadLevel::Ok:         return "Ok";
        case LoadLevel::Throttling: return "Throttling";
        case LoadLevel::Degraded:   return "Degraded";
    }
    return "Unknown";
}

/// Tunables of the load controller.
struct PerformanceConfig {
    float alpha = 0.12f;                ///< EMA smoothing factor
    float combatThrottleRatio = 0.22f;
    float combatDegradedRatio = 0.35f;
    float idleThrottleRatio = 0.30f;
    float idleDegradedRatio = 0.50f;
    float hitchFrameMs = 40.0f;
    float hitchWorkMs = 1.5f;
    bool autoThrottle = false;
    uint32_t degradedScanInterval = 5;
};

/// Tracks exponential moving averages of frame time and engine work time
/// and classifies the engine's share of each frame.
///
/// Auto-throttling is opt-in. The caller-visible forced bypass switch is
/// independent of it. While bypassing, resolve() returns its input.
class PerformanceController {
public:
    explicit PerformanceController(PerformanceConfig config = {});

    /// Mark the start of a frame; the interval since the last call feeds
    /// the frame-time average.
    void beginFrame(foundation::TimePoint now = foundation::Clock::now());

    /// Report the engine work done during the frame.
    void endFrame(double workMs, bool inCombat);

    [[nodiscard]] float averageFrameMs() const noexcept { return emaFrameMs_; }
    [[nodiscard]] float averageWorkMs() const noexcept { return emaWorkMs_; }
    [[nodiscard]] float framesPerSecond() const noexcept;

    [[nodiscard]] LoadLevel level() const noexcept { return level_; }
    [[nodiscard]] bool isThrottling() const noexcept;
    [[nodiscard]] bool isDegraded() const noexcept;

    [[nodiscard]] bool autoThrottle() const noexcept { return config_.autoThrottle; }
    void setAutoThrottle(bool enabled) noexcept { config_.autoThrottle = enabled; }

    [[nodiscard]] bool forcedBypass() const noexcept { return forced_; }
    void setForcedBypass(bool bypass);

    /// True when rule evaluation should be skipped entirely.
    [[nodiscard]] bool shouldBypass(bool inCombat) const noexcept;

    /// Cadence for the driver's companion scan under load.
    [[nodiscard]] bool shouldRunCompanionScan(uint64_t frame);

    /// Cadence for optional out-of-combat driver work under load.
    [[nodiscard]] bool shouldRunOptionalWork(uint64_t frame, uint32_t throttledInterval = 2,
                                             uint32_t degradedInterval = 5) const noexcept;

    void reset() noexcept;

private:
    void recomputeLevel();

    PerformanceConfig config_;
    foundation::TimePoint lastFrame_{};
    bool haveFrame_ = false;
    float emaFrameMs_ = 0.0f;
    float emaWorkMs_ = 0.0f;
    LoadLevel level_ = LoadLevel::Ok;
    bool inCombat_ = false;
    bool forced_ = false;
    uint64_t lastCompanionScan_ = 0;
};

} // namespace ace::resolution
