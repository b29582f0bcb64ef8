#pragma once

/// @file types.hpp
/// @brief Strong identifier types and the engine clock.

#include <chrono>
#include <cstdint>
#include <functional>

namespace ace::foundation {

/// Tag-based strong typedef for type-safe ID values.
///
/// Keeps action, effect, entity and job identifiers from being mixed up
/// while sharing the 32-bit representation the host hands us.
///
/// @tparam Tag A unique tag type to distinguish different ID types.
/// @tparam T The underlying integral type.
template <typename Tag, typename T = uint32_t>
class StrongId {
public:
    constexpr StrongId() = default;
    constexpr explicit StrongId(T value) : value_(value) {}

    [[nodiscard]] constexpr T value() const noexcept { return value_; }
    [[nodiscard]] constexpr bool isValid() const noexcept { return value_ != 0; }

    constexpr auto operator<=>(const StrongId&) const = default;

private:
    T value_ = 0;
};

struct ActionIdTag {};
struct EffectIdTag {};
struct EntityIdTag {};
struct JobIdTag {};
struct ZoneIdTag {};

/// Identifier of an action (trigger events and resolved outputs).
using ActionId = StrongId<ActionIdTag>;

/// Identifier of a persistent effect (status) on an actor or target.
using EffectId = StrongId<EffectIdTag>;

/// Identifier of a selectable entity in the world.
using EntityId = StrongId<EntityIdTag, uint64_t>;

/// Identifier of the actor's job (selects the active rule provider).
using JobId = StrongId<JobIdTag>;

/// Identifier of the zone the actor is in.
using ZoneId = StrongId<ZoneIdTag>;

/// Invalid/null sentinel for any ID type.
template <typename Tag, typename T>
constexpr StrongId<Tag, T> NULL_ID{};

/// Monotonic clock used for every expiry and TTL computation.
using Clock = std::chrono::steady_clock;
using TimePoint = Clock::time_point;
using Duration = Clock::duration;

} // namespace ace::foundation

// Hash support for use in unordered containers.
template <typename Tag, typename T>
struct std::hash<ace::foundation::StrongId<Tag, T>> {
    std::size_t operator()(const ace::foundation::StrongId<Tag, T>& id) const noexcept {
        return std::hash<T>{}(id.value());
    }
};
