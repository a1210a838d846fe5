#include <gtest/gtest.h>

#include <atomic>
#include <mutex>
#include <string>
#include <vector>

#include "arank/foundation/error_code.hpp"
#include "arank/foundation/rank_logger.hpp"

// kcenon headers for test infrastructure (mock logger registration)
#include <kcenon/common/interfaces/global_logger_registry.h>
#include <kcenon/common/interfaces/logger_interface.h>

using namespace arank::foundation;
using kcenon::common::interfaces::log_level;
using kcenon::common::interfaces::ILogger;
using kcenon::common::interfaces::GlobalLoggerRegistry;

// ---------------------------------------------------------------------------
// MockLogger: captures log messages for assertion
// ---------------------------------------------------------------------------

struct LogRecord {
    log_level level;
    std::string message;
};

class MockLogger : public ILogger {
public:
    kcenon::common::VoidResult log(log_level level,
                                    const std::string& message) override {
        std::lock_guard lock(mutex_);
        records_.push_back({level, message});
        return kcenon::common::VoidResult::ok(std::monostate{});
    }

    kcenon::common::VoidResult log(
        log_level level, std::string_view message,
        const kcenon::common::interfaces::source_location& /*loc*/) override {
        return log(level, std::string(message));
    }

    kcenon::common::VoidResult log(
        const kcenon::common::interfaces::log_entry& entry) override {
        return log(entry.level, entry.message);
    }

    bool is_enabled(log_level level) const override {
        return level >= minLevel_.load(std::memory_order_acquire);
    }

    kcenon::common::VoidResult set_level(log_level level) override {
        minLevel_.store(level, std::memory_order_release);
        return kcenon::common::VoidResult::ok(std::monostate{});
    }

    log_level get_level() const override {
        return minLevel_.load(std::memory_order_acquire);
    }

    kcenon::common::VoidResult flush() override {
        flushed_.store(true, std::memory_order_release);
        return kcenon::common::VoidResult::ok(std::monostate{});
    }

    std::vector<LogRecord> records() const {
        std::lock_guard lock(mutex_);
        return records_;
    }

    bool wasFlushed() const {
        return flushed_.load(std::memory_order_acquire);
    }

private:
    mutable std::mutex mutex_;
    std::vector<LogRecord> records_;
    std::atomic<log_level> minLevel_{log_level::trace};
    std::atomic<bool> flushed_{false};
};

class RankLoggerTest : public ::testing::Test {
protected:
    void SetUp() override {
        auto& registry = GlobalLoggerRegistry::instance();
        registry.clear();
        mockLogger_ = std::make_shared<MockLogger>();
        registry.set_default_logger(mockLogger_);
    }

    void TearDown() override {
        GlobalLoggerRegistry::instance().clear();
    }

    std::shared_ptr<MockLogger> mockLogger_;
};

// ---------------------------------------------------------------------------
// Names and parsing
// ---------------------------------------------------------------------------

TEST(LoggerErrorCodeTest, SubsystemLookup) {
    EXPECT_EQ(errorSubsystem(ErrorCode::LoggerError), "Logger");
    EXPECT_EQ(errorSubsystem(ErrorCode::LoggerFlushFailed), "Logger");
}

TEST(LogCategoryTest, AllCategoryNamesAreValid) {
    EXPECT_EQ(logCategoryName(LogCategory::Core), "Core");
    EXPECT_EQ(logCategoryName(LogCategory::Fitter), "Fitter");
    EXPECT_EQ(logCategoryName(LogCategory::Selector), "Selector");
    EXPECT_EQ(logCategoryName(LogCategory::Stopping), "Stopping");
    EXPECT_EQ(logCategoryName(LogCategory::Orchestrator), "Orchestrator");
    EXPECT_EQ(logCategoryName(LogCategory::Backend), "Backend");
    EXPECT_EQ(logCategoryName(static_cast<LogCategory>(42)), "Unknown");
}

TEST(LogLevelTest, ParseAcceptsAnyCase) {
    EXPECT_EQ(parseLogLevel("debug"), LogLevel::Debug);
    EXPECT_EQ(parseLogLevel("INFO"), LogLevel::Info);
    EXPECT_EQ(parseLogLevel("warn"), LogLevel::Warning);
    EXPECT_EQ(parseLogLevel("Off"), LogLevel::Off);
    EXPECT_FALSE(parseLogLevel("verbose").has_value());
}

// ---------------------------------------------------------------------------
// Level control
// ---------------------------------------------------------------------------

TEST(RankLoggerBasicTest, DefaultCategoryLevels) {
    RankLogger logger;
    EXPECT_EQ(logger.getCategoryLevel(LogCategory::Core), LogLevel::Info);
    EXPECT_EQ(logger.getCategoryLevel(LogCategory::Fitter), LogLevel::Warning);
    EXPECT_EQ(logger.getCategoryLevel(LogCategory::Selector), LogLevel::Info);
    EXPECT_EQ(logger.getCategoryLevel(LogCategory::Backend), LogLevel::Info);
}

TEST(RankLoggerBasicTest, SetCategoryLevelChangesFiltering) {
    RankLogger logger;
    logger.setCategoryLevel(LogCategory::Fitter, LogLevel::Debug);
    EXPECT_TRUE(logger.isEnabled(LogLevel::Debug, LogCategory::Fitter));
    EXPECT_FALSE(logger.isEnabled(LogLevel::Trace, LogCategory::Fitter));

    logger.setAllLevels(LogLevel::Error);
    EXPECT_FALSE(logger.isEnabled(LogLevel::Warning, LogCategory::Orchestrator));
    EXPECT_TRUE(logger.isEnabled(LogLevel::Critical, LogCategory::Stopping));
}

TEST(RankLoggerBasicTest, OffLevelIsNeverEnabled) {
    RankLogger logger;
    logger.setCategoryLevel(LogCategory::Core, LogLevel::Trace);
    EXPECT_FALSE(logger.isEnabled(LogLevel::Off, LogCategory::Core));
}

TEST(RankLoggerBasicTest, InvalidCategoryReturnsOff) {
    RankLogger logger;
    auto invalid = static_cast<LogCategory>(99);
    EXPECT_EQ(logger.getCategoryLevel(invalid), LogLevel::Off);
    EXPECT_FALSE(logger.isEnabled(LogLevel::Critical, invalid));
}

// ---------------------------------------------------------------------------
// Output
// ---------------------------------------------------------------------------

TEST_F(RankLoggerTest, LogFormatsMessageWithCategory) {
    RankLogger logger;
    logger.log(LogLevel::Info, LogCategory::Backend, "worker backend started");

    auto records = mockLogger_->records();
    ASSERT_EQ(records.size(), 1u);
    EXPECT_EQ(records[0].level, log_level::info);
    EXPECT_EQ(records[0].message, "[Backend] worker backend started");
}

TEST_F(RankLoggerTest, LogFiltersMessagesBelowLevel) {
    RankLogger logger;
    logger.log(LogLevel::Info, LogCategory::Fitter, "filtered");
    EXPECT_TRUE(mockLogger_->records().empty());
}

TEST_F(RankLoggerTest, LogWithContextIncludesFields) {
    RankLogger logger;

    LogContext ctx;
    ctx.sessionId = SessionId(7);
    ctx.requestId = RequestId(42);
    ctx.round = 12;
    ctx.extra["reason"] = "stability";
    logger.logWithContext(LogLevel::Info, LogCategory::Orchestrator, "session stopped", ctx);

    auto records = mockLogger_->records();
    ASSERT_EQ(records.size(), 1u);
    const auto& msg = records[0].message;
    EXPECT_NE(msg.find("[Orchestrator] session stopped {"), std::string::npos);
    EXPECT_NE(msg.find("session_id=7"), std::string::npos);
    EXPECT_NE(msg.find("request_id=42"), std::string::npos);
    EXPECT_NE(msg.find("round=12"), std::string::npos);
    EXPECT_NE(msg.find("reason=stability"), std::string::npos);
}

TEST_F(RankLoggerTest, EmptyContextOmitsBraces) {
    RankLogger logger;
    logger.logWithContext(LogLevel::Info, LogCategory::Core, "no context", LogContext{});

    auto records = mockLogger_->records();
    ASSERT_EQ(records.size(), 1u);
    EXPECT_EQ(records[0].message, "[Core] no context");
}

TEST_F(RankLoggerTest, FlushDelegatesToLogger) {
    RankLogger logger;
    auto result = logger.flush();
    EXPECT_TRUE(result.hasValue());
    EXPECT_TRUE(mockLogger_->wasFlushed());
}

TEST_F(RankLoggerTest, MacroLogsThroughSingleton) {
    RankLogger::instance().setCategoryLevel(LogCategory::Selector, LogLevel::Debug);
    ARANK_LOG_DEBUG(LogCategory::Selector, "macro test");
    RankLogger::instance().setCategoryLevel(LogCategory::Selector, LogLevel::Info);

    bool found = false;
    for (const auto& r : mockLogger_->records()) {
        if (r.message == "[Selector] macro test") {
            found = true;
        }
    }
    EXPECT_TRUE(found);
}

TEST(RankLoggerSingletonTest, InstanceReturnsSameObject) {
    EXPECT_EQ(&RankLogger::instance(), &RankLogger::instance());
}
