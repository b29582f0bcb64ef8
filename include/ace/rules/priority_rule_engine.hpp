#pragma once

/// @file priority_rule_engine.hpp
/// @brief Top-to-bottom, first-match evaluation of rule chains.

#include <cstdint>
#include <string_view>

#include "ace/rules/rule_types.hpp"

namespace ace::rules {

/// Evaluates a RuleChain against the current snapshot.
///
/// A rule whose predicate or resolver throws (anything, not only a
/// std::exception) is treated as not matching and
/// evaluation continues with the next rule; faults are counted and logged
/// at Debug. A resolver returning an invalid action id also falls through.
class PriorityRuleEngine {
public:
    /// @return The first matching rule's action, or @p trigger.
    ActionId evaluate(const RuleChain& chain, ActionId trigger, const RuleContext& ctx);

    [[nodiscard]] uint64_t faultCount() const noexcept { return faults_; }

    void resetFaultCount() noexcept { faults_ = 0; }

private:
    void recordFault(const RuleChain& chain, const Rule& rule, ActionId trigger,
                     std::string_view what);

    uint64_t faults_ = 0;
};

} // namespace ace::rules
