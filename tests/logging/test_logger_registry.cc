#include <algorithm>

#include <gtest/gtest.h>

#include "mcplink/logging/logger_registry.h"

#define MCPLINK_LOG_COMPONENT "test.macros"
#include "mcplink/logging/log_macros.h"

using namespace mcplink::logging;

// Test sink for capturing
class TestCaptureSink : public LogSink {
 public:
  void log(const LogMessage& msg) override {
    std::lock_guard<std::mutex> lock(mutex_);
    messages.push_back(msg);
  }

  void flush() override {}
  SinkType type() const override { return SinkType::Null; }

  std::vector<LogMessage> getMessages() {
    std::lock_guard<std::mutex> lock(mutex_);
    return messages;
  }

 private:
  std::mutex mutex_;
  std::vector<LogMessage> messages;
};

class LoggerRegistryTest : public ::testing::Test {
 protected:
  void SetUp() override {
    registry_ = &LoggerRegistry::instance();
    previous_sink_ = registry_->getSink();
    test_sink_ = std::make_shared<TestCaptureSink>();
    registry_->setSink(test_sink_);
  }

  void TearDown() override {
    // The registry is process wide; leave it the way other tests expect
    registry_->clearPatterns();
    registry_->setGlobalLevel(LogLevel::Info);
    registry_->setSink(previous_sink_);
  }

  LoggerRegistry* registry_;
  std::shared_ptr<LogSink> previous_sink_;
  std::shared_ptr<TestCaptureSink> test_sink_;
};

TEST_F(LoggerRegistryTest, SingletonInstance) {
  auto& instance1 = LoggerRegistry::instance();
  auto& instance2 = LoggerRegistry::instance();

  EXPECT_EQ(&instance1, &instance2);
}

TEST_F(LoggerRegistryTest, DefaultLogger) {
  auto logger = registry_->getDefaultLogger();

  ASSERT_NE(logger, nullptr);
  EXPECT_EQ(logger->getName(), "default");
  EXPECT_EQ(logger->getLevel(), LogLevel::Info);
}

TEST_F(LoggerRegistryTest, GetOrCreateLogger) {
  auto logger1 = registry_->getOrCreateLogger("test.logger");
  auto logger2 = registry_->getOrCreateLogger("test.logger");

  EXPECT_EQ(logger1, logger2);
  EXPECT_EQ(logger1->getName(), "test.logger");

  auto names = registry_->getLoggerNames();
  EXPECT_NE(std::find(names.begin(), names.end(), "test.logger"), names.end());
}

TEST_F(LoggerRegistryTest, GlobalLevelAppliesToExistingLoggers) {
  auto logger = registry_->getOrCreateLogger("test.global");

  registry_->setGlobalLevel(LogLevel::Error);
  EXPECT_EQ(logger->getLevel(), LogLevel::Error);
  EXPECT_EQ(registry_->getGlobalLevel(), LogLevel::Error);

  auto later = registry_->getOrCreateLogger("test.global.later");
  EXPECT_EQ(later->getLevel(), LogLevel::Error);
}

TEST_F(LoggerRegistryTest, PatternOverridesGlobalLevel) {
  auto stdio = registry_->getOrCreateLogger("transport.stdio");
  auto registry_logger = registry_->getOrCreateLogger("registry");

  registry_->setPattern("transport.*", LogLevel::Debug);

  EXPECT_EQ(stdio->getLevel(), LogLevel::Debug);
  EXPECT_EQ(registry_logger->getLevel(), LogLevel::Info);
  EXPECT_EQ(registry_->getEffectiveLevel("transport.http"), LogLevel::Debug);

  // Loggers created after the pattern pick it up too
  auto http = registry_->getOrCreateLogger("transport.http");
  EXPECT_EQ(http->getLevel(), LogLevel::Debug);

  // Pattern keeps its level when the global level moves
  registry_->setGlobalLevel(LogLevel::Warning);
  EXPECT_EQ(stdio->getLevel(), LogLevel::Debug);
  EXPECT_EQ(registry_logger->getLevel(), LogLevel::Warning);
}

TEST_F(LoggerRegistryTest, LatestMatchingPatternWins) {
  registry_->setPattern("http.*", LogLevel::Debug);
  registry_->setPattern("http.curl", LogLevel::Error);

  EXPECT_EQ(registry_->getEffectiveLevel("http.curl"), LogLevel::Error);
  EXPECT_EQ(registry_->getEffectiveLevel("http.session"), LogLevel::Debug);
}

TEST_F(LoggerRegistryTest, ClearPatternsRestoresGlobalLevel) {
  auto logger = registry_->getOrCreateLogger("test.cleared");
  registry_->setPattern("test.*", LogLevel::Debug);
  ASSERT_EQ(logger->getLevel(), LogLevel::Debug);

  registry_->clearPatterns();

  EXPECT_EQ(logger->getLevel(), LogLevel::Info);
}

TEST_F(LoggerRegistryTest, PatternMetacharactersAreLiteral) {
  registry_->setPattern("a.b", LogLevel::Debug);

  EXPECT_EQ(registry_->getEffectiveLevel("a.b"), LogLevel::Debug);
  EXPECT_EQ(registry_->getEffectiveLevel("axb"), LogLevel::Info);
}

TEST_F(LoggerRegistryTest, SinkReplacedForEveryLogger) {
  auto logger = registry_->getOrCreateLogger("test.sink");
  EXPECT_EQ(logger->getSink(), test_sink_);

  auto other = std::make_shared<TestCaptureSink>();
  registry_->setSink(other);

  EXPECT_EQ(logger->getSink(), other);
  EXPECT_EQ(registry_->getOrCreateLogger("test.sink.new")->getSink(), other);
}

TEST_F(LoggerRegistryTest, MacrosUseComponentLogger) {
  registry_->setPattern("test.macros", LogLevel::Debug);

  MCPLINK_LOG_DEBUG("debug {}", 1);
  MCPLINK_LOG_WARNING("warning {}", "two");

  auto messages = test_sink_->getMessages();
  ASSERT_EQ(messages.size(), 2u);
  EXPECT_EQ(messages[0].logger_name, "test.macros");
  EXPECT_EQ(messages[0].level, LogLevel::Debug);
  EXPECT_EQ(messages[0].message, "debug 1");
  EXPECT_EQ(messages[1].message, "warning two");
  EXPECT_NE(messages[1].file, nullptr);
  EXPECT_GT(messages[1].line, 0);
}

TEST_F(LoggerRegistryTest, MacrosRespectLevel) {
  MCPLINK_LOG_DEBUG("not shown");
  MCPLINK_LOG_INFO("shown");

  auto messages = test_sink_->getMessages();
  ASSERT_EQ(messages.size(), 1u);
  EXPECT_EQ(messages[0].message, "shown");
}
