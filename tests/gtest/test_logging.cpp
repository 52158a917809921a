// =============================================================================
// Logging Tests
// =============================================================================

#include <sstream>
#include <gtest/gtest.h>
#include "mailclass/bayes_classifier.hpp"
#include "mailclass/logging.hpp"
#include "test_support.hpp"

using namespace mailclass;
using mailclass::testing::text_doc;

class LoggingTest : public ::testing::Test {
protected:
    void SetUp() override {
        set_log_output(out_);
        set_log_level(LogLevel::INFO);
    }

    void TearDown() override {
        set_log_output(std::clog);
        set_log_level(LogLevel::INFO);
    }

    bool logged(const std::string& text) const {
        return out_.str().find(text) != std::string::npos;
    }

    std::ostringstream out_;
};

// Test the trace steps of the debug option
TEST_F(LoggingTest, TraceSteps) {
    EXPECT_FALSE(trace_enabled(0, TraceLevel::Flow));
    EXPECT_TRUE(trace_enabled(1, TraceLevel::Flow));
    EXPECT_FALSE(trace_enabled(4, TraceLevel::Message));
    EXPECT_TRUE(trace_enabled(5, TraceLevel::Message));
    EXPECT_TRUE(trace_enabled(12, TraceLevel::Score));
    EXPECT_FALSE(trace_enabled(12, TraceLevel::Token));
    EXPECT_TRUE(trace_enabled(15, TraceLevel::Token));
}

// Test LOG_TRACE writes an INFO record only once debug reaches its step
TEST_F(LoggingTest, TraceGate) {
    LOG_TRACE(4, Message, "below the step");
    EXPECT_TRUE(out_.str().empty());

    LOG_TRACE(5, Message, "rebuilt ", 3, " predictors");
    EXPECT_TRUE(logged("INFO"));
    EXPECT_TRUE(logged("rebuilt 3 predictors"));
}

// Test the log level still filters traces
TEST_F(LoggingTest, LevelFiltersTraces) {
    set_log_level(LogLevel::WARN);
    LOG_TRACE(15, Flow, "hidden");
    EXPECT_TRUE(out_.str().empty());
    LOG_WARN("shown");
    EXPECT_TRUE(logged("WARN"));
}

// Test a classifier reports its work according to its debug option
TEST_F(LoggingTest, ClassifierDebugOption) {
    BayesClassifier classifier;
    classifier.learn("SPAM", text_doc("viagra"));
    EXPECT_TRUE(out_.str().empty());

    classifier.set_debug(1);
    classifier.learn("SPAM", text_doc("viagra"));
    EXPECT_TRUE(logged("Learning message as SPAM"));
    EXPECT_FALSE(logged("Token: viagra"));

    classifier.set_debug(15);
    classifier.learn("SPAM", text_doc("viagra"));
    EXPECT_TRUE(logged("Token: viagra"));
}

// Test level names
TEST_F(LoggingTest, ParseLevel) {
    LogLevel level = LogLevel::INFO;
    EXPECT_TRUE(parse_log_level("Debug", level));
    EXPECT_EQ(level, LogLevel::DEBUG);
    EXPECT_TRUE(parse_log_level("ERROR", level));
    EXPECT_EQ(level, LogLevel::ERROR);
    EXPECT_FALSE(parse_log_level("loud", level));
    EXPECT_EQ(level, LogLevel::ERROR);
}
