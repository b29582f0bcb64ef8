/// @file auxiliary_suggestion_engine.cpp
/// @brief AuxiliarySuggestionEngine implementation.

#include "ace/rules/auxiliary_suggestion_engine.hpp"

#include <algorithm>
#include <cmath>
#include <exception>
#include <string>

#include "ace/foundation/engine_logger.hpp"
#include "ace/state/state_store.hpp"

namespace ace::rules {

using foundation::EngineLogger;
using foundation::LogCategory;
using foundation::LogLevel;

AuxiliarySuggestionEngine::AuxiliarySuggestionEngine(float weaveBudgetSeconds)
    : weaveBudget_(weaveBudgetSeconds) {}

std::size_t AuxiliarySuggestionEngine::weaveSlots(float timeToNextPrimary, float budgetPerSlot,
                                                  std::size_t cap) {
    if (timeToNextPrimary <= 0.0f) {
        return cap;
    }
    if (budgetPerSlot <= 0.0f) {
        return cap;
    }
    auto slots = static_cast<std::size_t>(std::floor(timeToNextPrimary / budgetPerSlot));
    return std::min(slots, cap);
}

SuggestionBuffer AuxiliarySuggestionEngine::suggest(std::span<const AuxiliaryRule> rules,
                                                    std::size_t maxCount,
                                                    const RuleContext& ctx,
                                                    bool featureEnabled) {
    SuggestionBuffer out;
    if (rules.empty() || !featureEnabled || !ctx.state.canProcess()) {
        return out;
    }

    auto cap = std::min(maxCount, SuggestionBuffer::kMaxSuggestions);
    auto slots = weaveSlots(ctx.state.timeToNextPrimary(), weaveBudget_, cap);
    if (slots == 0) {
        return out;
    }

    for (const auto& rule : rules) {
        if (out.size() >= slots) {
            break;
        }
        try {
            if (!rule.predicate || !rule.action || !rule.predicate(ctx)) {
                continue;
            }
            auto action = rule.action(ctx);
            if (action.isValid() && !out.contains(action)) {
                out.push(action);
            }
        } catch (const std::exception& e) {
            recordFault(rule, e.what());
        } catch (...) {
            recordFault(rule, "non-standard exception");
        }
    }
    return out;
}

void AuxiliarySuggestionEngine::recordFault(const AuxiliaryRule& rule, std::string_view what) {
    ++faults_;
    auto& logger = EngineLogger::instance();
    if (logger.isEnabled(LogLevel::Debug, LogCategory::Rules)) {
        foundation::LogContext lc;
        lc.extra["auxiliary_rule"] = rule.label;
        lc.extra["error"] = std::string(what);
        logger.logWithContext(LogLevel::Debug, LogCategory::Rules, "Auxiliary rule faulted", lc);
    }
}

} // namespace ace::rules
