/// @file priority_rule_engine.cpp
/// @brief PriorityRuleEngine implementation.

#include "ace/rules/priority_rule_engine.hpp"

#include <exception>
#include <string>

#include "ace/foundation/engine_logger.hpp"

namespace ace::rules {

using foundation::EngineLogger;
using foundation::LogCategory;
using foundation::LogLevel;

ActionId PriorityRuleEngine::evaluate(const RuleChain& chain, ActionId trigger,
                                      const RuleContext& ctx) {
    for (const auto& rule : chain.rules()) {
        try {
            if (!rule.predicate || !rule.predicate(ctx)) {
                continue;
            }
            auto result = rule.resolver ? rule.resolver(ctx, trigger) : trigger;
            if (result.isValid()) {
                return result;
            }
        } catch (const std::exception& e) {
            recordFault(chain, rule, trigger, e.what());
        } catch (...) {
            recordFault(chain, rule, trigger, "non-standard exception");
        }
    }
    return trigger;
}

void PriorityRuleEngine::recordFault(const RuleChain& chain, const Rule& rule, ActionId trigger,
                                     std::string_view what) {
    ++faults_;
    auto& logger = EngineLogger::instance();
    if (logger.isEnabled(LogLevel::Debug, LogCategory::Rules)) {
        foundation::LogContext lc;
        lc.actionId = trigger;
        lc.extra["chain"] = chain.name();
        lc.extra["rule"] = rule.label;
        lc.extra["error"] = std::string(what);
        logger.logWithContext(LogLevel::Debug, LogCategory::Rules, "Rule faulted", lc);
    }
}

} // namespace ace::rules
