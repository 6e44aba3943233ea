#include <gtest/gtest.h>
#include <gmock/gmock.h>
#include "../src/core/Logging.h"
#include <iostream>
#include <sstream>
#include <thread>
#include <vector>

namespace ioc_sweep {

class LoggingTest : public ::testing::Test {
protected:
    void SetUp() override {
        Logger::instance().set_level(LogLevel::Info);
        old_ = std::cerr.rdbuf(captured_.rdbuf());
    }

    void TearDown() override {
        std::cerr.rdbuf(old_);
        Logger::instance().set_level(LogLevel::Info);
    }

    std::string output() const { return captured_.str(); }

    std::ostringstream captured_;
    std::streambuf* old_ = nullptr;
};

TEST_F(LoggingTest, SingletonInstance) {
    EXPECT_EQ(&Logger::instance(), &Logger::instance());
}

TEST_F(LoggingTest, PrefixesByLevel) {
    Logger& logger = Logger::instance();
    logger.set_level(LogLevel::Trace);
    logger.error("e1");
    logger.warn("w1");
    logger.info("i1");
    logger.debug("d1");
    logger.trace("t1");
    std::string out = output();
    EXPECT_THAT(out, ::testing::HasSubstr("[ERROR] e1"));
    EXPECT_THAT(out, ::testing::HasSubstr("[WARN] w1"));
    EXPECT_THAT(out, ::testing::HasSubstr("[INFO] i1"));
    EXPECT_THAT(out, ::testing::HasSubstr("[DEBUG] d1"));
    EXPECT_THAT(out, ::testing::HasSubstr("[TRACE] t1"));
}

TEST_F(LoggingTest, LevelFiltering) {
    Logger& logger = Logger::instance();
    logger.set_level(LogLevel::Warn);
    logger.error("kept-error");
    logger.warn("kept-warn");
    logger.info("dropped-info");
    logger.debug("dropped-debug");
    std::string out = output();
    EXPECT_THAT(out, ::testing::HasSubstr("kept-error"));
    EXPECT_THAT(out, ::testing::HasSubstr("kept-warn"));
    EXPECT_THAT(out, ::testing::Not(::testing::HasSubstr("dropped")));
}

TEST_F(LoggingTest, LinesCarryTimestamp) {
    Logger::instance().info("stamped");
    // 2024-01-01T00:00:00Z [INFO] stamped
    EXPECT_THAT(output(), ::testing::ContainsRegex("^[0-9]{4}-[0-9]{2}-[0-9]{2}T[0-9:]{8}Z \\[INFO\\] stamped"));
}

TEST_F(LoggingTest, ParseLogLevel) {
    LogLevel lvl = LogLevel::Info;
    EXPECT_TRUE(parse_log_level("debug", lvl));
    EXPECT_EQ(lvl, LogLevel::Debug);
    EXPECT_TRUE(parse_log_level(" WARNING ", lvl));
    EXPECT_EQ(lvl, LogLevel::Warn);
    EXPECT_TRUE(parse_log_level("Trace", lvl));
    EXPECT_EQ(lvl, LogLevel::Trace);
    EXPECT_FALSE(parse_log_level("loud", lvl));
    EXPECT_EQ(lvl, LogLevel::Trace);
}

TEST_F(LoggingTest, ConcurrentWritersKeepLinesWhole) {
    Logger& logger = Logger::instance();
    const int num_threads = 8;
    const int logs_per_thread = 50;
    std::vector<std::thread> threads;
    for(int i = 0; i < num_threads; ++i){
        threads.emplace_back([&, i]{
            for(int j = 0; j < logs_per_thread; ++j) logger.info("thread" + std::to_string(i) + "-" + std::to_string(j));
        });
    }
    for(auto& t : threads) t.join();

    std::istringstream in(output());
    std::string line;
    int count = 0;
    while(std::getline(in, line)){
        ++count;
        EXPECT_THAT(line, ::testing::HasSubstr("[INFO] thread"));
    }
    EXPECT_EQ(count, num_threads * logs_per_thread);
}

}
