/// @file effect_expiry_registry.cpp
/// @brief EffectExpiryRegistry implementation.

#include "ace/state/effect_expiry_registry.hpp"

#include <algorithm>
#include <chrono>
#include <cmath>

namespace ace::state {

using foundation::TimePoint;

EffectExpiryRegistry::EffectExpiryRegistry() {
    for (auto& t : tables_) {
        t.reserve(32);
    }
}

EffectExpiryRegistry::ExpiryMap& EffectExpiryRegistry::table(EffectKind kind) {
    return tables_[static_cast<std::size_t>(kind)];
}

const EffectExpiryRegistry::ExpiryMap& EffectExpiryRegistry::table(EffectKind kind) const {
    return tables_[static_cast<std::size_t>(kind)];
}

TimePoint EffectExpiryRegistry::expiryFrom(float seconds, TimePoint now) {
    // NaN fails both comparisons and lands on zero.
    float clamped = seconds > 0.0f ? std::min(seconds, kMaxTrackedSeconds) : 0.0f;
    auto millis = std::chrono::milliseconds(static_cast<int64_t>(clamped * 1000.0f));
    return now + std::chrono::duration_cast<foundation::Duration>(millis);
}

void EffectExpiryRegistry::trackIfAbsent(EffectKind kind, uint32_t id) {
    table(kind).try_emplace(id, kUnobserved);
}

void EffectExpiryRegistry::update(EffectKind kind, const EffectRemainingMap& observed,
                                  TimePoint now) {
    auto& t = table(kind);
    for (const auto& [id, seconds] : observed) {
        t.try_emplace(id, kUnobserved);
    }

    for (auto& [id, expiry] : t) {
        auto it = observed.find(id);
        if (it != observed.end()) {
            expiry = it->second == kUnobservedSeconds || std::isnan(it->second)
                         ? kUnobserved
                         : expiryFrom(it->second, now);
        } else if (expiry != kUnobserved) {
            // No longer reported: expired as of this tick.
            expiry = now;
        }
    }
}

void EffectExpiryRegistry::recordUsage(EffectKind kind, uint32_t id, float seconds,
                                       TimePoint now) {
    table(kind)[id] = expiryFrom(seconds, now);
}

float EffectExpiryRegistry::remaining(EffectKind kind, uint32_t id, TimePoint now) const {
    const auto& t = table(kind);
    auto it = t.find(id);
    if (it == t.end()) {
        return 0.0f;
    }
    if (it->second == kUnobserved) {
        return kUnobservedSeconds;
    }
    if (it->second <= now) {
        return 0.0f;
    }
    return std::chrono::duration<float>(it->second - now).count();
}

bool EffectExpiryRegistry::isActive(EffectKind kind, uint32_t id, TimePoint now) const {
    return remaining(kind, id, now) > 0.0f;
}

bool EffectExpiryRegistry::ready(EffectKind kind, uint32_t id, TimePoint now) const {
    const auto& t = table(kind);
    auto it = t.find(id);
    // Unknown is never ready, whether untracked or unobserved.
    if (it == t.end() || it->second == kUnobserved) {
        return false;
    }
    return it->second <= now;
}

bool EffectExpiryRegistry::isTracked(EffectKind kind, uint32_t id) const {
    return table(kind).count(id) > 0;
}

bool EffectExpiryRegistry::isUnobserved(EffectKind kind, uint32_t id) const {
    const auto& t = table(kind);
    auto it = t.find(id);
    return it != t.end() && it->second == kUnobserved;
}

std::size_t EffectExpiryRegistry::trackedCount(EffectKind kind) const {
    return table(kind).size();
}

void EffectExpiryRegistry::clear() {
    for (auto& t : tables_) {
        t.clear();
    }
}

} // namespace ace::state
