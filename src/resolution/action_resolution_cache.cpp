/// @file action_resolution_cache.cpp
/// @brief ActionResolutionCache implementation.

#include "ace/resolution/action_resolution_cache.hpp"

#include <utility>

namespace ace::resolution {

using foundation::TimePoint;

static_assert((ActionResolutionCache::kSets & (ActionResolutionCache::kSets - 1)) == 0,
              "set count must be a power of two");

ActionResolutionCache::ActionResolutionCache(ResolutionCacheConfig config)
    : config_(config) {}

std::size_t ActionResolutionCache::setIndex(ActionId input) noexcept {
    auto key = input.value();
    return static_cast<std::size_t>((key ^ (key >> 16)) & (kSets - 1));
}

bool ActionResolutionCache::live(const Slot& slot, uint64_t configVersion,
                                 TimePoint now) noexcept {
    return slot.occupied && slot.configVersion == configVersion && now < slot.expiresAt;
}

std::optional<ActionId> ActionResolutionCache::lookup(ActionId input, uint64_t configVersion,
                                                      TimePoint now) {
    auto& set = sets_[setIndex(input)];
    for (std::size_t way = 0; way < kWays; ++way) {
        if (set[way].occupied && set[way].input == input) {
            if (!live(set[way], configVersion, now)) {
                break;
            }
            auto resolved = set[way].resolved;
            if (way != 0) {
                std::swap(set[0], set[way]);
            }
            ++hits_;
            return resolved;
        }
    }
    ++misses_;
    return std::nullopt;
}

void ActionResolutionCache::store(ActionId input, ActionId resolved, uint64_t configVersion,
                                  TimePoint now) {
    auto& set = sets_[setIndex(input)];
    Slot fresh{input, resolved, now + config_.ttl, configVersion, true};

    // Same key already resident: overwrite in place and promote.
    for (std::size_t way = 0; way < kWays; ++way) {
        if (set[way].occupied && set[way].input == input) {
            set[way] = fresh;
            if (way != 0) {
                std::swap(set[0], set[way]);
            }
            return;
        }
    }

    if (!live(set[0], configVersion, now)) {
        set[0] = fresh;
        return;
    }
    // Way 0 is live: it becomes the older entry, evicting whatever way 1 held.
    set[1] = set[0];
    set[0] = fresh;
}

void ActionResolutionCache::syncFrame(uint64_t frameStamp) noexcept {
    if (frameStamp != frameStamp_) {
        frameStamp_ = frameStamp;
        frameCount_ = 0;
        frameNext_ = 0;
    }
}

std::optional<ActionId> ActionResolutionCache::lookupFrame(ActionId input, uint64_t frameStamp) {
    syncFrame(frameStamp);
    for (std::size_t i = 0; i < frameCount_; ++i) {
        if (frame_[i].input == input) {
            ++frameHits_;
            return frame_[i].resolved;
        }
    }
    ++frameMisses_;
    return std::nullopt;
}

void ActionResolutionCache::storeFrame(ActionId input, ActionId resolved, uint64_t frameStamp) {
    syncFrame(frameStamp);
    for (std::size_t i = 0; i < frameCount_; ++i) {
        if (frame_[i].input == input) {
            frame_[i].resolved = resolved;
            return;
        }
    }
    if (frameCount_ < kFrameEntries) {
        frame_[frameCount_++] = FrameEntry{input, resolved};
        return;
    }
    frame_[frameNext_] = FrameEntry{input, resolved};
    frameNext_ = (frameNext_ + 1) % kFrameEntries;
}

void ActionResolutionCache::clear() noexcept {
    for (auto& set : sets_) {
        set.fill(Slot{});
    }
}

void ActionResolutionCache::clearFrameMemo() noexcept {
    frameCount_ = 0;
    frameNext_ = 0;
}

std::size_t ActionResolutionCache::size(uint64_t configVersion, TimePoint now) const noexcept {
    std::size_t n = 0;
    for (const auto& set : sets_) {
        for (const auto& slot : set) {
            if (live(slot, configVersion, now)) {
                ++n;
            }
        }
    }
    return n;
}

double ActionResolutionCache::hitRate() const noexcept {
    auto total = hits_ + misses_;
    return total == 0 ? 0.0 : static_cast<double>(hits_) / static_cast<double>(total);
}

double ActionResolutionCache::frameHitRate() const noexcept {
    auto total = frameHits_ + frameMisses_;
    return total == 0 ? 0.0 : static_cast<double>(frameHits_) / static_cast<double>(total);
}

void ActionResolutionCache::resetStatistics() noexcept {
    hits_ = 0;
    misses_ = 0;
    frameHits_ = 0;
    frameMisses_ = 0;
}

} // namespace ace::resolution
