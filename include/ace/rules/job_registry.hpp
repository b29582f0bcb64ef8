#pragma once

/// @file job_registry.hpp
/// @brief Provider table and the active, configuration-filtered rule set.

#include <cstddef>
#include <cstdint>
#include <memory>
#include <span>
#include <string_view>
#include <unordered_map>
#include <vector>

#include "ace/foundation/engine_result.hpp"
#include "ace/rules/job_provider.hpp"
#include "ace/rules/rule_configuration.hpp"
#include "ace/state/effect_expiry_registry.hpp"

namespace ace::rules {

/// Rule arrays for one job, filtered through configuration.
struct ActiveRuleSet {
    JobId job;
    uint64_t configVersion = 0;
    uint64_t generation = 0; ///< bumped on every rebuild
    std::vector<RuleChain> chains;
    std::vector<AuxiliaryRule> auxiliary; ///< sorted by priority
    std::vector<targeting::TargetRule> targets;
    bool dynamic = false; ///< any chain rule or auxiliary rule is time-sensitive

    /// First chain claiming @p trigger, or nullptr.
    [[nodiscard]] const RuleChain* chainFor(ActionId trigger) const noexcept;
};

/// Holds every registered provider and the rule set of the active job.
///
/// Providers come from an explicit registration table walked once at
/// startup. The active set is rebuilt only when the job or the
/// configuration version differs from the ones it was built for.
class JobRegistry {
public:
    JobRegistry() = default;

    JobRegistry(const JobRegistry&) = delete;
    JobRegistry& operator=(const JobRegistry&) = delete;

    /// Instantiate every row of @p table.
    /// @return DuplicateProvider when a job appears twice, InvalidArgument
    ///         for a null factory or a provider reporting another job id,
    ///         RuleError when a factory or provider throws.
    foundation::EngineResult<void> registerProviders(std::span<const ProviderRegistration> table);

    foundation::EngineResult<void> registerProvider(std::unique_ptr<IJobProvider> provider);

    [[nodiscard]] const IJobProvider* provider(JobId job) const noexcept;
    [[nodiscard]] ProviderCapabilities capabilities(JobId job) const noexcept;
    [[nodiscard]] std::size_t size() const noexcept { return providers_.size(); }

    /// Seed every provider's tracked ids as unobserved.
    void seedTracking(state::EffectExpiryRegistry& effects) const;

    /// Active set for @p job under @p config, rebuilt if stale.
    const ActiveRuleSet& ruleSet(JobId job, const RuleConfiguration& config);

    [[nodiscard]] uint64_t rebuildCount() const noexcept { return rebuilds_; }

    /// Rebuilds abandoned because a provider threw while supplying rules.
    [[nodiscard]] uint64_t rebuildFaultCount() const noexcept { return rebuildFaults_; }

    /// Force a rebuild on the next ruleSet() call.
    void invalidate() noexcept;

    void clear();

private:
    struct Entry {
        std::unique_ptr<IJobProvider> provider;
        ProviderCapabilities capabilities = 0;
    };

    void rebuild(JobId job, const RuleConfiguration& config);
    void collect(ActiveRuleSet& out, JobId job, const RuleConfiguration& config) const;
    void discardFaulted(ActiveRuleSet& next, JobId job, std::string_view what);

    std::unordered_map<JobId, Entry> providers_;
    ActiveRuleSet active_;
    bool built_ = false;
    uint64_t rebuilds_ = 0;
    uint64_t rebuildFaults_ = 0;
};

} // namespace ace::rules
