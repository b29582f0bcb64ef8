#pragma once

/// @file action_resolution_cache.hpp
/// @brief Two-tier memoization of resolved actions.
///
/// Tier (a) is a 2-way set-associative cache with a TTL, used while the
/// active rules are deterministic. Tier (b) is an exact (input, frame)
/// memo used instead while any rule depends on time-sensitive state.

#include <array>
#include <chrono>
#include <cstddef>
#include <cstdint>
#include <optional>

#include "ace/foundation/types.hpp"

namespace ace::resolution {

using foundation::ActionId;

/// Which memoization tier a lookup goes through.
enum class CacheTier : uint8_t {
    Timed = 0, ///< tier (a): TTL-bounded associative cache
    Frame = 1  ///< tier (b): exact match within one frame stamp
};

struct ResolutionCacheConfig {
    std::chrono::milliseconds ttl{100};
};

/// Fixed-size memo of input -> resolved action.
///
/// Tier (a) has kSets x kWays slots, keyed by a mix of the input id. Way 0
/// always holds the most recently used entry of its set; inserting into a
/// full set evicts way 1. Entries carry the configuration version they
/// were computed under and are misses once it moves on, or once their TTL
/// has passed, even if still resident.
///
/// Tier (b) holds up to kFrameEntries entries for a single frame stamp and
/// empties itself the first time it sees a newer one.
///
/// Usage:
/// @code
///   ActionResolutionCache cache;
///   auto out = cache.resolve(input, CacheTier::Timed, frame, version, now,
///                            [&] { return evaluateChains(input); });
///   cache.clear(); // rule set or mode changed
/// @endcode
class ActionResolutionCache {
public:
    static constexpr std::size_t kSets = 32;
    static constexpr std::size_t kWays = 2;
    static constexpr std::size_t kFrameEntries = 8;

    explicit ActionResolutionCache(ResolutionCacheConfig config = {});

    // --- Tier (a) ---

    [[nodiscard]] std::optional<ActionId> lookup(ActionId input, uint64_t configVersion,
                                                 foundation::TimePoint now);

    void store(ActionId input, ActionId resolved, uint64_t configVersion,
               foundation::TimePoint now);

    // --- Tier (b) ---

    [[nodiscard]] std::optional<ActionId> lookupFrame(ActionId input, uint64_t frameStamp);

    void storeFrame(ActionId input, ActionId resolved, uint64_t frameStamp);

    /// Look up through @p tier, computing and storing on a miss.
    template <typename Compute>
    ActionId resolve(ActionId input, CacheTier tier, uint64_t frameStamp,
                     uint64_t configVersion, foundation::TimePoint now, Compute&& compute) {
        if (tier == CacheTier::Frame) {
            if (auto hit = lookupFrame(input, frameStamp)) {
                return *hit;
            }
            auto resolved = compute();
            storeFrame(input, resolved, frameStamp);
            return resolved;
        }
        if (auto hit = lookup(input, configVersion, now)) {
            return *hit;
        }
        auto resolved = compute();
        store(input, resolved, configVersion, now);
        return resolved;
    }

    /// Invalidate tier (a).
    void clear() noexcept;

    /// Invalidate tier (b).
    void clearFrameMemo() noexcept;

    /// Live (unexpired, current-version) entries in tier (a).
    [[nodiscard]] std::size_t size(uint64_t configVersion, foundation::TimePoint now) const noexcept;

    [[nodiscard]] std::size_t frameSize() const noexcept { return frameCount_; }

    [[nodiscard]] uint64_t hitCount() const noexcept { return hits_; }
    [[nodiscard]] uint64_t missCount() const noexcept { return misses_; }
    [[nodiscard]] double hitRate() const noexcept;

    [[nodiscard]] uint64_t frameHitCount() const noexcept { return frameHits_; }
    [[nodiscard]] uint64_t frameMissCount() const noexcept { return frameMisses_; }
    [[nodiscard]] double frameHitRate() const noexcept;

    void resetStatistics() noexcept;

    [[nodiscard]] const ResolutionCacheConfig& config() const noexcept { return config_; }
    void setTtl(std::chrono::milliseconds ttl) noexcept { config_.ttl = ttl; }

    /// Set index of @p input in tier (a).
    [[nodiscard]] static std::size_t setIndex(ActionId input) noexcept;

private:
    struct Slot {
        ActionId input;
        ActionId resolved;
        foundation::TimePoint expiresAt{};
        uint64_t configVersion = 0;
        bool occupied = false;
    };

    struct FrameEntry {
        ActionId input;
        ActionId resolved;
    };

    [[nodiscard]] static bool live(const Slot& slot, uint64_t configVersion,
                                   foundation::TimePoint now) noexcept;

    void syncFrame(uint64_t frameStamp) noexcept;

    ResolutionCacheConfig config_;
    std::array<std::array<Slot, kWays>, kSets> sets_{};

    std::array<FrameEntry, kFrameEntries> frame_{};
    std::size_t frameCount_ = 0;
    std::size_t frameNext_ = 0;
    uint64_t frameStamp_ = 0;

    uint64_t hits_ = 0;
    uint64_t misses_ = 0;
    uint64_t frameHits_ = 0;
    uint64_t frameMisses_ = 0;
};

} // namespace ace::resolution
