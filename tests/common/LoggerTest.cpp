#include <gtest/gtest.h>
#include <looptrace/common/Logger.h>

using namespace looptrace;

namespace {

struct Entry {
    LogLevel level;
    std::string message;
};

class RecordingBackend : public ILoggerBackend {
public:
    explicit RecordingBackend(std::vector<Entry>* entries) : entries_(entries) {}

    void log(LogLevel level, const std::string& message, const std::source_location&) override {
        if (level >= level_) entries_->push_back({level, message});
    }
    void setLevel(LogLevel level) override { level_ = level; }
    void flush() override {}

private:
    std::vector<Entry>* entries_;
    LogLevel level_ = LogLevel::Trace;
};

class LoggerTest : public ::testing::Test {
protected:
    void SetUp() override {
        Logger::setBackend(std::make_unique<RecordingBackend>(&entries_));
        Logger::clearCapturedLogs();
    }

    void TearDown() override {
        Logger::enableCapture(false);
        Logger::clearCapturedLogs();
        Logger::setBackend(nullptr);
    }

    std::vector<Entry> entries_;
};

}  // namespace

static void logFromHelper() {
    LOG_DEBUG("value {}", 7);
}

TEST_F(LoggerTest, InfoIsWrittenVerbatim) {
    LOG_INFO("TOTAL = {} cycles", 3);

    ASSERT_EQ(entries_.size(), 1u);
    EXPECT_EQ(entries_[0].level, LogLevel::Info);
    EXPECT_EQ(entries_[0].message, "TOTAL = 3 cycles");
}

TEST_F(LoggerTest, DebugIsPrefixedWithFunctionName) {
    logFromHelper();

    ASSERT_EQ(entries_.size(), 1u);
    EXPECT_NE(entries_[0].message.find("logFromHelper() - value 7"), std::string::npos);
}

TEST_F(LoggerTest, SetLevelReachesBackend) {
    Logger::setLevel(LogLevel::Warn);
    LOG_INFO("dropped");
    LOG_WARN("kept");
    LOG_ERROR("kept too");

    ASSERT_EQ(entries_.size(), 2u);
    EXPECT_EQ(entries_[0].message, "kept");
    EXPECT_EQ(entries_[1].level, LogLevel::Error);
}

TEST_F(LoggerTest, CaptureKeepsMessagesWithLevel) {
    EXPECT_FALSE(Logger::isCaptureEnabled());
    LOG_INFO("before capture");

    Logger::enableCapture(true);
    LOG_INFO("first");
    LOG_WARN("second");
    LOG_INFO("third");

    auto all = Logger::getCapturedLogs();
    ASSERT_EQ(all.size(), 3u);
    EXPECT_EQ(all[0], "[info] first");
    EXPECT_EQ(all[1], "[warn] second");

    auto filtered = Logger::getCapturedLogs("third");
    ASSERT_EQ(filtered.size(), 1u);

    auto last = Logger::getCapturedLogs("", 1);
    ASSERT_EQ(last.size(), 1u);
    EXPECT_EQ(last[0], "[info] third");

    Logger::clearCapturedLogs();
    EXPECT_TRUE(Logger::getCapturedLogs().empty());
}

TEST(LogLevelTest, NamesAndParsing) {
    EXPECT_STREQ(logLevelName(LogLevel::Debug), "debug");
    EXPECT_STREQ(logLevelName(LogLevel::Off), "off");

    EXPECT_EQ(parseLogLevel("INFO"), LogLevel::Info);
    EXPECT_EQ(parseLogLevel("warning"), LogLevel::Warn);
    EXPECT_EQ(parseLogLevel("err"), LogLevel::Error);
    EXPECT_EQ(parseLogLevel("Trace"), LogLevel::Trace);
    EXPECT_FALSE(parseLogLevel("verbose").has_value());

    for (auto level : {LogLevel::Trace, LogLevel::Debug, LogLevel::Info, LogLevel::Warn,
                       LogLevel::Error, LogLevel::Critical, LogLevel::Off}) {
        EXPECT_EQ(parseLogLevel(logLevelName(level)), level);
    }
}
