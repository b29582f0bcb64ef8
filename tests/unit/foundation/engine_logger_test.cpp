#include <gtest/gtest.h>

#include <chrono>
#include <iostream>
#include <string>
#include <thread>
#include <vector>

#include "ace/foundation/engine_logger.hpp"
#include "ace/foundation/error_code.hpp"
#include "support/mock_logger.hpp"

using namespace ace::foundation;
using ace::test::LoggingTest;
using kcenon::common::interfaces::log_level;

// ---------------------------------------------------------------------------
// Test fixture: registers a MockLogger as the default logger
// ---------------------------------------------------------------------------

class EngineLoggerTest : public LoggingTest {};

// ---------------------------------------------------------------------------
// ErrorCode: Logger subsystem lookup
// ---------------------------------------------------------------------------

TEST(LoggerErrorCodeTest, SubsystemLookup) {
    EXPECT_EQ(errorSubsystem(ErrorCode::LoggerError), "Logger");
    EXPECT_EQ(errorSubsystem(ErrorCode::LoggerFlushFailed), "Logger");
}

// ---------------------------------------------------------------------------
// LogCategory / LogLevel helpers
// ---------------------------------------------------------------------------

TEST(LogCategoryTest, AllCategoryNamesAreValid) {
    EXPECT_EQ(logCategoryName(LogCategory::Core), "Core");
    EXPECT_EQ(logCategoryName(LogCategory::State), "State");
    EXPECT_EQ(logCategoryName(LogCategory::Targeting), "Targeting");
    EXPECT_EQ(logCategoryName(LogCategory::Rules), "Rules");
    EXPECT_EQ(logCategoryName(LogCategory::Resolution), "Resolution");
    EXPECT_EQ(logCategoryName(LogCategory::Config), "Config");
    EXPECT_EQ(logCategoryName(LogCategory::Lifecycle), "Lifecycle");
    EXPECT_EQ(logCategoryName(LogCategory::Performance), "Performance");
    EXPECT_EQ(logCategoryName(static_cast<LogCategory>(42)), "Unknown");
}

TEST(LogLevelTest, AllLevelNamesAreValid) {
    EXPECT_EQ(logLevelName(LogLevel::Trace), "TRACE");
    EXPECT_EQ(logLevelName(LogLevel::Debug), "DEBUG");
    EXPECT_EQ(logLevelName(LogLevel::Info), "INFO");
    EXPECT_EQ(logLevelName(LogLevel::Warning), "WARNING");
    EXPECT_EQ(logLevelName(LogLevel::Error), "ERROR");
    EXPECT_EQ(logLevelName(LogLevel::Critical), "CRITICAL");
    EXPECT_EQ(logLevelName(LogLevel::Off), "OFF");
}

// ---------------------------------------------------------------------------
// Default category levels
// ---------------------------------------------------------------------------

TEST(EngineLoggerBasicTest, DefaultCategoryLevels) {
    EngineLogger logger;
    EXPECT_EQ(logger.getCategoryLevel(LogCategory::Core), LogLevel::Info);
    EXPECT_EQ(logger.getCategoryLevel(LogCategory::State), LogLevel::Warning);
    EXPECT_EQ(logger.getCategoryLevel(LogCategory::Targeting), LogLevel::Warning);
    EXPECT_EQ(logger.getCategoryLevel(LogCategory::Rules), LogLevel::Info);
    EXPECT_EQ(logger.getCategoryLevel(LogCategory::Resolution), LogLevel::Warning);
    EXPECT_EQ(logger.getCategoryLevel(LogCategory::Config), LogLevel::Info);
    EXPECT_EQ(logger.getCategoryLevel(LogCategory::Lifecycle), LogLevel::Info);
    EXPECT_EQ(logger.getCategoryLevel(LogCategory::Performance), LogLevel::Info);
}

TEST(EngineLoggerBasicTest, MoveConstruction) {
    EngineLogger a;
    a.setCategoryLevel(LogCategory::Rules, LogLevel::Error);
    EngineLogger b(std::move(a));
    EXPECT_EQ(b.getCategoryLevel(LogCategory::Rules), LogLevel::Error);
}

// ---------------------------------------------------------------------------
// isEnabled / setCategoryLevel
// ---------------------------------------------------------------------------

TEST(EngineLoggerBasicTest, HotPathCategoriesAreQuietByDefault) {
    EngineLogger logger;
    EXPECT_FALSE(logger.isEnabled(LogLevel::Info, LogCategory::Resolution));
    EXPECT_FALSE(logger.isEnabled(LogLevel::Debug, LogCategory::Targeting));
    EXPECT_TRUE(logger.isEnabled(LogLevel::Warning, LogCategory::State));
}

TEST(EngineLoggerBasicTest, SetCategoryLevelChangesFiltering) {
    EngineLogger logger;
    logger.setCategoryLevel(LogCategory::Core, LogLevel::Trace);
    EXPECT_TRUE(logger.isEnabled(LogLevel::Trace, LogCategory::Core));

    logger.setCategoryLevel(LogCategory::Core, LogLevel::Error);
    EXPECT_FALSE(logger.isEnabled(LogLevel::Warning, LogCategory::Core));
    EXPECT_TRUE(logger.isEnabled(LogLevel::Error, LogCategory::Core));
}

TEST(EngineLoggerBasicTest, OffDisablesEverything) {
    EngineLogger logger;
    logger.setCategoryLevel(LogCategory::Rules, LogLevel::Off);
    EXPECT_FALSE(logger.isEnabled(LogLevel::Critical, LogCategory::Rules));

    // Off is never an emittable level either
    logger.setCategoryLevel(LogCategory::Core, LogLevel::Trace);
    EXPECT_FALSE(logger.isEnabled(LogLevel::Off, LogCategory::Core));
}

TEST(EngineLoggerBasicTest, InvalidCategoryReturnsOff) {
    EngineLogger logger;
    auto invalid = static_cast<LogCategory>(99);
    EXPECT_EQ(logger.getCategoryLevel(invalid), LogLevel::Off);
    EXPECT_FALSE(logger.isEnabled(LogLevel::Critical, invalid));
}

// ---------------------------------------------------------------------------
// Basic logging
// ---------------------------------------------------------------------------

TEST_F(EngineLoggerTest, LogFormatsMessageWithCategory) {
    EngineLogger logger;
    logger.log(LogLevel::Info, LogCategory::Lifecycle, "Decision engine initialized");

    auto records = mockLogger_->records();
    ASSERT_EQ(records.size(), 1u);
    EXPECT_EQ(records[0].level, log_level::info);
    EXPECT_EQ(records[0].message, "[Lifecycle] Decision engine initialized");
}

TEST_F(EngineLoggerTest, LogFiltersMessagesBelowLevel) {
    EngineLogger logger;
    logger.log(LogLevel::Debug, LogCategory::Resolution, "Should be filtered");

    EXPECT_TRUE(mockLogger_->records().empty());
}

TEST_F(EngineLoggerTest, LogAllLevels) {
    EngineLogger logger;
    logger.setCategoryLevel(LogCategory::Core, LogLevel::Trace);

    logger.log(LogLevel::Trace, LogCategory::Core, "trace");
    logger.log(LogLevel::Debug, LogCategory::Core, "debug");
    logger.log(LogLevel::Info, LogCategory::Core, "info");
    logger.log(LogLevel::Warning, LogCategory::Core, "warn");
    logger.log(LogLevel::Error, LogCategory::Core, "error");
    logger.log(LogLevel::Critical, LogCategory::Core, "critical");

    auto records = mockLogger_->records();
    ASSERT_EQ(records.size(), 6u);
    EXPECT_EQ(records[0].level, log_level::trace);
    EXPECT_EQ(records[1].level, log_level::debug);
    EXPECT_EQ(records[2].level, log_level::info);
    EXPECT_EQ(records[3].level, log_level::warning);
    EXPECT_EQ(records[4].level, log_level::error);
    EXPECT_EQ(records[5].level, log_level::critical);
}

// ---------------------------------------------------------------------------
// Structured logging with context
// ---------------------------------------------------------------------------

TEST_F(EngineLoggerTest, LogWithContextIncludesFields) {
    EngineLogger logger;
    logger.setCategoryLevel(LogCategory::Rules, LogLevel::Debug);

    LogContext ctx;
    ctx.jobId = JobId(24);
    ctx.actionId = ActionId(16532);
    ctx.entityId = EntityId(0x10000001);
    ctx.frameStamp = 77;
    ctx.extra["rule"] = "refresh_dot";

    logger.logWithContext(LogLevel::Debug, LogCategory::Rules, "Rule faulted", ctx);

    auto records = mockLogger_->records();
    ASSERT_EQ(records.size(), 1u);

    const auto& msg = records[0].message;
    EXPECT_EQ(msg.rfind("[Rules] Rule faulted {", 0), 0u);
    EXPECT_NE(msg.find("job=24"), std::string::npos);
    EXPECT_NE(msg.find("action=16532"), std::string::npos);
    EXPECT_NE(msg.find("entity=268435457"), std::string::npos);
    EXPECT_NE(msg.find("frame=77"), std::string::npos);
    EXPECT_NE(msg.find("rule=refresh_dot"), std::string::npos);
    EXPECT_EQ(msg.back(), '}');
}

TEST_F(EngineLoggerTest, InvalidIdsAreOmittedFromContext) {
    EngineLogger logger;

    LogContext ctx;
    ctx.jobId = JobId{};
    logger.logWithContext(LogLevel::Info, LogCategory::Core, "No context", ctx);

    auto records = mockLogger_->records();
    ASSERT_EQ(records.size(), 1u);
    EXPECT_EQ(records[0].message, "[Core] No context");
}

TEST_F(EngineLoggerTest, LogWithContextFilteredBelowLevel) {
    EngineLogger logger;

    LogContext ctx;
    ctx.entityId = EntityId(1);
    logger.logWithContext(LogLevel::Debug, LogCategory::Targeting, "filtered", ctx);

    EXPECT_TRUE(mockLogger_->records().empty());
}

// ---------------------------------------------------------------------------
// Named category loggers
// ---------------------------------------------------------------------------

TEST_F(EngineLoggerTest, CategoryLoggerTakesPrecedenceOverDefault) {
    auto rulesLogger = std::make_shared<ace::test::MockLogger>();
    auto& registry = kcenon::common::interfaces::GlobalLoggerRegistry::instance();
    (void)registry.register_logger("ace.Rules", rulesLogger);

    EngineLogger logger;
    logger.log(LogLevel::Info, LogCategory::Rules, "Rule set rebuilt");
    logger.log(LogLevel::Info, LogCategory::Core, "core msg");

    ASSERT_EQ(rulesLogger->records().size(), 1u);
    EXPECT_EQ(rulesLogger->records()[0].message, "[Rules] Rule set rebuilt");
    ASSERT_EQ(mockLogger_->records().size(), 1u);
    EXPECT_EQ(mockLogger_->records()[0].message, "[Core] core msg");
}

// ---------------------------------------------------------------------------
// Flush
// ---------------------------------------------------------------------------

TEST_F(EngineLoggerTest, FlushDelegatesToLogger) {
    EngineLogger logger;
    auto result = logger.flush();
    EXPECT_TRUE(result.hasValue());
    EXPECT_TRUE(mockLogger_->wasFlushed());
}

// ---------------------------------------------------------------------------
// Singleton instance and ACE_LOG macros
// ---------------------------------------------------------------------------

TEST(EngineLoggerSingletonTest, InstanceReturnsSameObject) {
    auto& a = EngineLogger::instance();
    auto& b = EngineLogger::instance();
    EXPECT_EQ(&a, &b);
}

TEST_F(EngineLoggerTest, MacroLogsWhenEnabled) {
    EngineLogger::instance().setCategoryLevel(LogCategory::Performance, LogLevel::Debug);

    ACE_LOG_DEBUG(LogCategory::Performance, "macro test");

    EXPECT_TRUE(mockLogger_->contains("[Performance] macro test"));
    EngineLogger::instance().setCategoryLevel(LogCategory::Performance, LogLevel::Info);
}

TEST_F(EngineLoggerTest, MacroSkipsWhenDisabled) {
    EngineLogger::instance().setCategoryLevel(LogCategory::Core, LogLevel::Error);
    mockLogger_->reset();

    ACE_LOG_WARN(LogCategory::Core, "should not appear");

    EXPECT_TRUE(mockLogger_->records().empty());
    EngineLogger::instance().setCategoryLevel(LogCategory::Core, LogLevel::Info);
}

// ---------------------------------------------------------------------------
// Thread safety: the level table is read concurrently with writes
// ---------------------------------------------------------------------------

TEST_F(EngineLoggerTest, ConcurrentLoggingIsSafe) {
    EngineLogger logger;
    logger.setCategoryLevel(LogCategory::Core, LogLevel::Trace);

    constexpr int kThreads = 4;
    constexpr int kMessagesPerThread = 100;

    std::vector<std::thread> threads;
    threads.reserve(kThreads);
    for (int t = 0; t < kThreads; ++t) {
        threads.emplace_back([&logger, t] {
            for (int i = 0; i < kMessagesPerThread; ++i) {
                logger.log(LogLevel::Info, LogCategory::Core,
                           "thread " + std::to_string(t) + " msg " + std::to_string(i));
            }
        });
    }
    for (auto& th : threads) {
        th.join();
    }

    EXPECT_EQ(mockLogger_->logCount(), static_cast<std::size_t>(kThreads * kMessagesPerThread));
}

// ---------------------------------------------------------------------------
// Filtered message throughput (disabled categories must be nearly free)
// ---------------------------------------------------------------------------

TEST(EngineLoggerBenchmarkTest, FilteredThroughputBenchmark) {
    EngineLogger logger;

    constexpr int kIterations = 10'000'000;

    auto start = std::chrono::steady_clock::now();
    for (int i = 0; i < kIterations; ++i) {
        logger.log(LogLevel::Debug, LogCategory::Resolution, "filtered message");
    }
    auto end = std::chrono::steady_clock::now();

    auto elapsed = std::chrono::duration_cast<std::chrono::microseconds>(end - start);
    double seconds = static_cast<double>(elapsed.count()) / 1'000'000.0;
    double msgPerSec = static_cast<double>(kIterations) / seconds;

    std::cout << "[Benchmark] " << kIterations << " filtered messages in "
              << elapsed.count() << " us (" << msgPerSec / 1'000'000.0
              << "M msg/sec)" << std::endl;

    // Conservative threshold for Debug builds on shared CI runners.
    EXPECT_GT(msgPerSec, 1'000'000.0);
}
