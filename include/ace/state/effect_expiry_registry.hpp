#pragma once

/// @file effect_expiry_registry.hpp
/// @brief Absolute-expiry tracking for actor effects, target effects and cooldowns.

#include <array>
#include <cstddef>
#include <cstdint>
#include <unordered_map>

#include "ace/foundation/types.hpp"
#include "ace/state/state_types.hpp"

namespace ace::state {

/// Tracks per-id absolute expiry instants for the three effect kinds.
///
/// Every id is in exactly one of three states:
/// - not tracked: absent from the map, remaining() == 0
/// - tracked, unobserved: remaining() == kUnobservedSeconds
/// - tracked with a concrete expiry: remaining() == max(0, expiry - now)
///
/// ready() is pessimistic: an untracked or unobserved cooldown is never
/// reported ready. Not thread-safe; the driver thread owns it.
class EffectExpiryRegistry {
public:
    /// Longest remaining time an expiry is stamped with; larger, infinite
    /// or negative reports are clamped into [0, kMaxTrackedSeconds].
    static constexpr float kMaxTrackedSeconds = 86400.0f;

    EffectExpiryRegistry();

    /// Seed @p id as unobserved unless it is already tracked.
    void trackIfAbsent(EffectKind kind, uint32_t id);

    /// Fold one tick of observations into @p kind.
    ///
    /// Ids in @p observed become tracked; their remaining seconds turn into
    /// an absolute expiry (kUnobservedSeconds or NaN keeps them unobserved). Tracked
    /// ids missing from @p observed are expired at @p now unless unobserved.
    void update(EffectKind kind, const EffectRemainingMap& observed,
                foundation::TimePoint now = foundation::Clock::now());

    /// Stamp a concrete expiry @p seconds from @p now (e.g. after use).
    void recordUsage(EffectKind kind, uint32_t id, float seconds,
                     foundation::TimePoint now = foundation::Clock::now());

    /// Remaining seconds, kUnobservedSeconds, or 0 when not tracked.
    [[nodiscard]] float remaining(EffectKind kind, uint32_t id,
                                  foundation::TimePoint now = foundation::Clock::now()) const;

    /// True when remaining() > 0.
    [[nodiscard]] bool isActive(EffectKind kind, uint32_t id,
                                foundation::TimePoint now = foundation::Clock::now()) const;

    /// False for untracked or unobserved ids, true once the expiry has passed.
    [[nodiscard]] bool ready(EffectKind kind, uint32_t id,
                             foundation::TimePoint now = foundation::Clock::now()) const;

    [[nodiscard]] bool isTracked(EffectKind kind, uint32_t id) const;

    [[nodiscard]] bool isUnobserved(EffectKind kind, uint32_t id) const;

    [[nodiscard]] std::size_t trackedCount(EffectKind kind) const;

    /// Forget every id of every kind.
    void clear();

private:
    using ExpiryMap = std::unordered_map<uint32_t, foundation::TimePoint>;

    static constexpr foundation::TimePoint kUnobserved = foundation::TimePoint::min();

    [[nodiscard]] ExpiryMap& table(EffectKind kind);
    [[nodiscard]] const ExpiryMap& table(EffectKind kind) const;

    static foundation::TimePoint expiryFrom(float seconds, foundation::TimePoint now);

    std::array<ExpiryMap, kEffectKindCount> tables_;
};

} // namespace ace::state
