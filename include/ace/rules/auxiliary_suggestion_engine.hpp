#pragma once

/// @file auxiliary_suggestion_engine.hpp
/// @brief Opportunistic secondary-action suggestions within the weave window.

#include <array>
#include <cstddef>
#include <cstdint>
#include <span>
#include <string_view>

#include "ace/rules/rule_types.hpp"

namespace ace::rules {

/// Fixed-capacity result of one suggestion pass; never allocates.
class SuggestionBuffer {
public:
    static constexpr std::size_t kMaxSuggestions = 2;

    [[nodiscard]] std::size_t size() const noexcept { return size_; }
    [[nodiscard]] bool empty() const noexcept { return size_ == 0; }
    [[nodiscard]] ActionId operator[](std::size_t i) const noexcept { return items_[i]; }

    [[nodiscard]] std::span<const ActionId> view() const noexcept {
        return {items_.data(), size_};
    }

    [[nodiscard]] bool contains(ActionId action) const noexcept {
        for (std::size_t i = 0; i < size_; ++i) {
            if (items_[i] == action) {
                return true;
            }
        }
        return false;
    }

    bool push(ActionId action) noexcept {
        if (size_ >= kMaxSuggestions) {
            return false;
        }
        items_[size_++] = action;
        return true;
    }

    [[nodiscard]] const ActionId* begin() const noexcept { return items_.data(); }
    [[nodiscard]] const ActionId* end() const noexcept { return items_.data() + size_; }

private:
    std::array<ActionId, kMaxSuggestions> items_{};
    std::size_t size_ = 0;
};

/// Evaluates auxiliary rules in priority order and collects up to N
/// suggestions.
///
/// Three gates run before any rule: the snapshot must allow processing,
/// the feature must be enabled for the job, and at least one weave slot
/// must fit before the next primary action. Faulting rules are skipped.
class AuxiliarySuggestionEngine {
public:
    static constexpr float kDefaultWeaveBudgetSeconds = 0.8f;

    explicit AuxiliarySuggestionEngine(float weaveBudgetSeconds = kDefaultWeaveBudgetSeconds);

    /// Number of secondary actions that fit before the next primary one.
    /// Between primary actions (@p timeToNextPrimary <= 0) every slot fits.
    [[nodiscard]] static std::size_t weaveSlots(float timeToNextPrimary, float budgetPerSlot,
                                                std::size_t cap);

    /// @p rules must already be sorted by priority and filtered for
    /// configuration.
    SuggestionBuffer suggest(std::span<const AuxiliaryRule> rules, std::size_t maxCount,
                             const RuleContext& ctx, bool featureEnabled);

    [[nodiscard]] float weaveBudget() const noexcept { return weaveBudget_; }
    void setWeaveBudget(float seconds) noexcept { weaveBudget_ = seconds; }

    [[nodiscard]] uint64_t faultCount() const noexcept { return faults_; }

private:
    void recordFault(const AuxiliaryRule& rule, std::string_view what);

    float weaveBudget_;
    uint64_t faults_ = 0;
};

} // namespace ace::rules
