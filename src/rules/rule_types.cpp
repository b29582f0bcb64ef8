/// @file rule_types.cpp
/// @brief Rule and RuleChain construction helpers.

#include "ace/rules/rule_types.hpp"

#include <algorithm>

namespace ace::rules {

Rule Rule::fixed(std::string label, RulePredicate predicate, ActionId result, bool dynamic) {
    return Rule{std::move(label), std::move(predicate),
                [result](const RuleContext&, ActionId) { return result; }, dynamic};
}

Rule Rule::passThrough() {
    return Rule{std::string(kDefaultRuleLabel),
                [](const RuleContext&) { return true; },
                [](const RuleContext&, ActionId trigger) { return trigger; }, false};
}

RuleChain::RuleChain(std::string name, std::vector<ActionId> triggers, std::vector<Rule> rules)
    : name_(std::move(name)), triggers_(std::move(triggers)), rules_(std::move(rules)) {
    // A provider-supplied "default" anywhere but last is just a label clash.
    std::erase_if(rules_, [](const Rule& r) { return r.isDefault(); });
    rules_.push_back(Rule::passThrough());
}

bool RuleChain::claims(ActionId trigger) const noexcept {
    return std::find(triggers_.begin(), triggers_.end(), trigger) != triggers_.end();
}

bool RuleChain::hasDynamicRules() const noexcept {
    return std::any_of(rules_.begin(), rules_.end(), [](const Rule& r) { return r.dynamic; });
}

RuleChain RuleChain::filtered(const std::function<bool(std::string_view)>& enabled) const {
    std::vector<Rule> kept;
    kept.reserve(rules_.size());
    for (const auto& rule : rules_) {
        if (!rule.isDefault() && enabled(rule.label)) {
            kept.push_back(rule);
        }
    }
    return RuleChain(name_, triggers_, std::move(kept));
}

} // namespace ace::rules
