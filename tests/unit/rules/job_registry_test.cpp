#include <gtest/gtest.h>

#include <memory>
#include <span>
#include <stdexcept>
#include <string>
#include <vector>

#include "support/mock_logger.hpp"
#include "support/sample_healer_provider.hpp"

#include "ace/rules/job_registry.hpp"
#include "ace/state/effect_expiry_registry.hpp"

using namespace ace::rules;
using namespace ace::test::healer;
using ace::foundation::ErrorCode;
using ace::state::EffectExpiryRegistry;
using ace::state::EffectKind;

class JobRegistryTest : public ace::test::LoggingTest {
protected:
    void registerAll() {
        auto table = registrations();
        ASSERT_TRUE(registry_.registerProviders(table).hasValue());
    }

    JobRegistry registry_;
    RuleConfiguration config_;
};

// ---------------------------------------------------------------------------
// Registration
// ---------------------------------------------------------------------------

TEST_F(JobRegistryTest, RegistersEveryRow) {
    registerAll();
    EXPECT_EQ(registry_.size(), 2u);
    ASSERT_NE(registry_.provider(kJob), nullptr);
    EXPECT_EQ(registry_.provider(kJob)->name(), "sample_healer");
    EXPECT_EQ(registry_.provider(JobId(99)), nullptr);
    EXPECT_TRUE(mockLogger_->contains("Provider registered"));
}

TEST_F(JobRegistryTest, CapabilitiesFollowProviderContent) {
    registerAll();
    auto healer = registry_.capabilities(kJob);
    EXPECT_TRUE(hasCapability(healer, ProviderCapability::Combo));
    EXPECT_TRUE(hasCapability(healer, ProviderCapability::Auxiliary));
    EXPECT_TRUE(hasCapability(healer, ProviderCapability::Targeting));
    EXPECT_TRUE(hasCapability(healer, ProviderCapability::Tracking));

    auto tank = registry_.capabilities(kOtherJob);
    EXPECT_TRUE(hasCapability(tank, ProviderCapability::Combo));
    EXPECT_FALSE(hasCapability(tank, ProviderCapability::Auxiliary));
    EXPECT_FALSE(hasCapability(tank, ProviderCapability::Tracking));

    EXPECT_EQ(registry_.capabilities(JobId(99)), 0u);
}

TEST_F(JobRegistryTest, DuplicateJobIsRejected) {
    registerAll();
    auto result = registry_.registerProvider(std::make_unique<SampleHealerProvider>());
    ASSERT_TRUE(result.hasError());
    EXPECT_EQ(result.error().code(), ErrorCode::DuplicateProvider);
    EXPECT_EQ(registry_.size(), 2u);
}

TEST_F(JobRegistryTest, DuplicateRowInTableIsRejected) {
    std::vector<ProviderRegistration> table = {
        {kJob, "first", [] { return std::make_unique<SampleHealerProvider>(); }},
        {kJob, "second", [] { return std::make_unique<SampleHealerProvider>(); }},
    };
    auto result = registry_.registerProviders(table);
    ASSERT_TRUE(result.hasError());
    EXPECT_EQ(result.error().code(), ErrorCode::DuplicateProvider);
}

TEST_F(JobRegistryTest, NullFactoryIsRejected) {
    std::vector<ProviderRegistration> table = {{kJob, "missing", nullptr}};
    auto result = registry_.registerProviders(table);
    ASSERT_TRUE(result.hasError());
    EXPECT_EQ(result.error().code(), ErrorCode::InvalidArgument);
}

TEST_F(JobRegistryTest, MismatchedJobIsRejected) {
    std::vector<ProviderRegistration> table = {
        {kOtherJob, "liar", [] { return std::make_unique<SampleHealerProvider>(); }},
    };
    auto result = registry_.registerProviders(table);
    ASSERT_TRUE(result.hasError());
    EXPECT_EQ(result.error().code(), ErrorCode::InvalidArgument);
    EXPECT_EQ(registry_.size(), 0u);
}

TEST_F(JobRegistryTest, ThrowingFactoryIsReportedAsRuleError) {
    std::vector<ProviderRegistration> table = {
        {kJob, "exploding",
         []() -> std::unique_ptr<IJobProvider> { throw std::runtime_error("no data table"); }},
        {kOtherJob, "raw", []() -> std::unique_ptr<IJobProvider> { throw 5; }},
    };
    auto result = registry_.registerProviders(table);
    ASSERT_TRUE(result.hasError());
    EXPECT_EQ(result.error().code(), ErrorCode::RuleError);
    EXPECT_NE(result.error().message().find("no data table"), std::string_view::npos);

    auto raw = registry_.registerProviders(std::span(table).subspan(1));
    ASSERT_TRUE(raw.hasError());
    EXPECT_EQ(raw.error().code(), ErrorCode::RuleError);
    EXPECT_EQ(registry_.size(), 0u);
}

// ---------------------------------------------------------------------------
// Active rule set
// ---------------------------------------------------------------------------

TEST_F(JobRegistryTest, RuleSetForHealer) {
    registerAll();
    const auto& set = registry_.ruleSet(kJob, config_);
    EXPECT_EQ(set.job, kJob);
    EXPECT_EQ(set.chains.size(), 2u);
    EXPECT_EQ(set.targets.size(), 4u);
    EXPECT_TRUE(set.dynamic);

    ASSERT_EQ(set.auxiliary.size(), 2u);
    EXPECT_EQ(set.auxiliary[0].label, "assize");
    EXPECT_EQ(set.auxiliary[1].label, "lucid");

    ASSERT_NE(set.chainFor(kStone), nullptr);
    EXPECT_EQ(set.chainFor(kStone)->name(), "single_target");
    EXPECT_EQ(set.chainFor(kMedica)->name(), "area_heal");
    EXPECT_EQ(set.chainFor(kCure), nullptr);
}

TEST_F(JobRegistryTest, UnknownJobYieldsEmptySet) {
    registerAll();
    const auto& set = registry_.ruleSet(JobId(99), config_);
    EXPECT_TRUE(set.chains.empty());
    EXPECT_TRUE(set.auxiliary.empty());
    EXPECT_FALSE(set.dynamic);
}

TEST_F(JobRegistryTest, RebuildsOnlyOnJobOrVersionChange) {
    registerAll();
    auto first = registry_.ruleSet(kJob, config_).generation;
    (void)registry_.ruleSet(kJob, config_);
    EXPECT_EQ(registry_.rebuildCount(), 1u);
    EXPECT_EQ(registry_.ruleSet(kJob, config_).generation, first);

    (void)registry_.ruleSet(kOtherJob, config_);
    EXPECT_EQ(registry_.rebuildCount(), 2u);

    config_.setRuleEnabled(kOtherJob, "combo_step", false);
    (void)registry_.ruleSet(kOtherJob, config_);
    EXPECT_EQ(registry_.rebuildCount(), 3u);
    EXPECT_GT(registry_.ruleSet(kOtherJob, config_).generation, first);
}

TEST_F(JobRegistryTest, ThrowingProviderLeavesEmptySet) {
    RuleHooks hooks;
    auto table = registrations(&hooks);
    ASSERT_TRUE(registry_.registerProviders(table).hasValue());

    hooks.ruleChainsThrow = true;
    const auto& set = registry_.ruleSet(kJob, config_);
    EXPECT_EQ(set.job, kJob);
    EXPECT_TRUE(set.chains.empty());
    EXPECT_TRUE(set.auxiliary.empty());
    EXPECT_TRUE(set.targets.empty());
    EXPECT_FALSE(set.dynamic);
    EXPECT_EQ(registry_.rebuildFaultCount(), 1u);
    EXPECT_TRUE(mockLogger_->contains("Provider faulted during rebuild"));

    hooks.ruleChainsThrow = false;
    registry_.invalidate();
    EXPECT_EQ(registry_.ruleSet(kJob, config_).chains.size(), 2u);
    EXPECT_EQ(registry_.rebuildFaultCount(), 1u);
}

TEST_F(JobRegistryTest, InvalidateForcesRebuild) {
    registerAll();
    (void)registry_.ruleSet(kJob, config_);
    registry_.invalidate();
    (void)registry_.ruleSet(kJob, config_);
    EXPECT_EQ(registry_.rebuildCount(), 2u);
}

TEST_F(JobRegistryTest, DisabledRulesAreFilteredOut) {
    registerAll();
    config_.setRuleEnabled(kJob, "refresh_dot", false);
    config_.setRuleEnabled(kJob, "lucid", false);
    const auto& set = registry_.ruleSet(kJob, config_);

    const auto* chain = set.chainFor(kStone);
    ASSERT_NE(chain, nullptr);
    ASSERT_EQ(chain->rules().size(), 2u);
    EXPECT_EQ(chain->rules().front().label, "lily_spend");
    ASSERT_EQ(set.auxiliary.size(), 1u);
    EXPECT_EQ(set.auxiliary[0].label, "assize");
}

TEST_F(JobRegistryTest, StaticSetWhenDynamicRulesDisabled) {
    registerAll();
    config_.setRuleEnabled(kJob, "refresh_dot", false);
    config_.setFeatureEnabled(kJob, Feature::Auxiliary, false);
    const auto& set = registry_.ruleSet(kJob, config_);
    EXPECT_FALSE(set.dynamic);
    EXPECT_TRUE(set.auxiliary.empty());
}

TEST_F(JobRegistryTest, DisabledFeaturesDropWholeCollections) {
    registerAll();
    config_.setFeatureEnabled(kJob, Feature::Combo, false);
    config_.setFeatureEnabled(kJob, Feature::Targeting, false);
    const auto& set = registry_.ruleSet(kJob, config_);
    EXPECT_TRUE(set.chains.empty());
    EXPECT_TRUE(set.targets.empty());
    EXPECT_EQ(set.auxiliary.size(), 2u);
}

TEST_F(JobRegistryTest, SeedTrackingMarksIdsUnobserved) {
    registerAll();
    EffectExpiryRegistry effects;
    effects.recordUsage(EffectKind::Cooldown, kAssize.value(), 10.0f);
    registry_.seedTracking(effects);

    EXPECT_TRUE(effects.isUnobserved(EffectKind::TargetEffect, kDiaEffect.value()));
    EXPECT_TRUE(effects.isUnobserved(EffectKind::ActorEffect, kLiturgyReady.value()));
    EXPECT_TRUE(effects.isUnobserved(EffectKind::Cooldown, kLucid.value()));
    EXPECT_FALSE(effects.isUnobserved(EffectKind::Cooldown, kAssize.value()));
    EXPECT_EQ(effects.trackedCount(EffectKind::Cooldown), 2u);
}

TEST_F(JobRegistryTest, ClearDropsProvidersAndKeepsGenerationMonotonic) {
    registerAll();
    auto before = registry_.ruleSet(kJob, config_).generation;
    registry_.clear();
    EXPECT_EQ(registry_.size(), 0u);
    EXPECT_GT(registry_.ruleSet(kJob, config_).generation, before);
    EXPECT_TRUE(registry_.ruleSet(kJob, config_).chains.empty());
}
