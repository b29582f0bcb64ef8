/// @file performance_controller.cpp
/// @brief PerformanceController implementation.

#include "ace/resolution/performance_controller.hpp"

#include <chrono>
#include <string>

#include "ace/foundation/engine_logger.hpp"

namespace ace::resolution {

using foundation::LogCategory;

PerformanceController::PerformanceController(PerformanceConfig config) : config_(config) {}

void PerformanceController::beginFrame(foundation::TimePoint now) {
    if (haveFrame_) {
        auto dtMs = std::chrono::duration<float, std::milli>(now - lastFrame_).count();
        emaFrameMs_ = emaFrameMs_ <= 0.0f
                          ? dtMs
                          : (1.0f - config_.alpha) * emaFrameMs_ + config_.alpha * dtMs;
    }
    lastFrame_ = now;
    haveFrame_ = true;
}

void PerformanceController::endFrame(double workMs, bool inCombat) {
    inCombat_ = inCombat;
    auto w = static_cast<float>(workMs);
    emaWorkMs_ = emaWorkMs_ <= 0.0f ? w : (1.0f - config_.alpha) * emaWorkMs_ + config_.alpha * w;
    recomputeLevel();
}

void PerformanceController::recomputeLevel() {
    auto previous = level_;
    if (emaFrameMs_ <= 0.0f) {
        level_ = LoadLevel::Ok;
    } else {
        auto ratio = emaWorkMs_ / emaFrameMs_;
        auto throttleAt = inCombat_ ? config_.combatThrottleRatio : config_.idleThrottleRatio;
        auto degradedAt = inCombat_ ? config_.combatDegradedRatio : config_.idleDegradedRatio;
        // Long frames with real work escalate a step early.
        bool hitch = emaFrameMs_ > config_.hitchFrameMs && emaWorkMs_ > config_.hitchWorkMs;
        if (ratio >= degradedAt || (hitch && ratio >= throttleAt)) {
            level_ = LoadLevel::Degraded;
        } else if (ratio >= throttleAt) {
            level_ = LoadLevel::Throttling;
        } else {
            level_ = LoadLevel::Ok;
        }
    }
    if (level_ != previous && config_.autoThrottle) {
        ACE_LOG_INFO(LogCategory::Performance,
                     std::string("Load level ") + std::string(loadLevelName(previous)) +
                         " -> " + std::string(loadLevelName(level_)));
    }
}

float PerformanceController::framesPerSecond() const noexcept {
    return emaFrameMs_ > 0.0f ? 1000.0f / emaFrameMs_ : 0.0f;
}

bool PerformanceController::isThrottling() const noexcept {
    return config_.autoThrottle && level_ >= LoadLevel::Throttling;
}

bool PerformanceController::isDegraded() const noexcept {
    return config_.autoThrottle && level_ >= LoadLevel::Degraded;
}

void PerformanceController::setForcedBypass(bool bypass) {
    if (forced_ != bypass) {
        ACE_LOG_INFO(LogCategory::Performance,
                     bypass ? "Forced bypass enabled" : "Forced bypass disabled");
    }
    forced_ = bypass;
}

bool PerformanceController::shouldBypass(bool inCombat) const noexcept {
    return forced_ || (isDegraded() && !inCombat);
}

bool PerformanceController::shouldRunCompanionScan(uint64_t frame) {
    if (!config_.autoThrottle || level_ == LoadLevel::Ok) {
        return true;
    }
    if (!inCombat_) {
        return false;
    }
    if (level_ == LoadLevel::Throttling) {
        return true;
    }
    if (frame - lastCompanionScan_ >= config_.degradedScanInterval) {
        lastCompanionScan_ = frame;
        return true;
    }
    return false;
}

bool PerformanceController::shouldRunOptionalWork(uint64_t frame, uint32_t throttledInterval,
                                                  uint32_t degradedInterval) const noexcept {
    if (!config_.autoThrottle || inCombat_ || level_ == LoadLevel::Ok) {
        return true;
    }
    auto interval = level_ == LoadLevel::Throttling ? throttledInterval : degradedInterval;
    return interval == 0 || frame % interval == 0;
}

void PerformanceController::reset() noexcept {
    auto config = config_;
    auto forced = forced_;
    *this = PerformanceController(config);
    forced_ = forced;
}

} // namespace ace::resolution
