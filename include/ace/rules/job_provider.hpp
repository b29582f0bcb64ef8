#pragma once

/// @file job_provider.hpp
/// @brief Interface implemented by per-job rule content.

#include <cstdint>
#include <functional>
#include <memory>
#include <string_view>
#include <vector>

#include "ace/foundation/types.hpp"
#include "ace/rules/rule_types.hpp"
#include "ace/state/state_types.hpp"
#include "ace/targeting/targeting_types.hpp"

namespace ace::rules {

using foundation::JobId;

/// What a provider contributes, derived from its non-empty collections.
enum class ProviderCapability : uint8_t {
    Combo     = 1 << 0,
    Auxiliary = 1 << 1,
    Targeting = 1 << 2,
    Tracking  = 1 << 3,
};

using ProviderCapabilities = uint8_t;

constexpr bool hasCapability(ProviderCapabilities caps, ProviderCapability c) {
    return (caps & static_cast<uint8_t>(c)) != 0;
}

/// Rule content for one job.
///
/// The engine only consumes what a provider returns here; the rules
/// themselves are data supplied from outside the library. Collections are
/// read once per rebuild, never on the resolution path.
class IJobProvider {
public:
    virtual ~IJobProvider() = default;

    [[nodiscard]] virtual JobId jobId() const = 0;
    [[nodiscard]] virtual std::string_view name() const = 0;

    [[nodiscard]] virtual std::vector<RuleChain> ruleChains() const = 0;

    [[nodiscard]] virtual std::vector<AuxiliaryRule> auxiliaryRules() const { return {}; }

    [[nodiscard]] virtual std::vector<targeting::TargetRule> targetRules() const { return {}; }

    /// Raw ids to seed as unobserved for @p kind at initialize.
    [[nodiscard]] virtual std::vector<uint32_t> trackedIds(state::EffectKind /*kind*/) const {
        return {};
    }
};

/// Creates a provider instance.
using ProviderFactory = std::function<std::unique_ptr<IJobProvider>()>;

/// One row of the startup registration table.
struct ProviderRegistration {
    JobId job;
    std::string_view name;
    ProviderFactory factory;
};

} // namespace ace::rules
