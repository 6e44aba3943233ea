#include <gtest/gtest.h>
#include <gmock/gmock.h>
#include "../src/providers/LogPatternProvider.h"
#include "../src/providers/LogSource.h"
#include "TestSupport.h"
#include <chrono>
#include <sys/stat.h>

namespace ioc_sweep {

using testing_support::TempDir;
using testing_support::write_file;
using ::testing::_;
using ::testing::Return;

namespace {

class MockLogSource : public LogSource {
public:
    MOCK_METHOD(LogQueryResult, query, (const LogQuery& q), (override));
};

}

class LogProviderTest : public ::testing::Test {
protected:
    IndicatorDefinition def(std::vector<std::string> patterns){
        IndicatorDefinition d;
        d.id = "log";
        d.provider = ProviderKind::LogPattern;
        if(patterns.size() == 1) d.args.set("pattern", patterns.front());
        else d.args.set_list("patterns", std::move(patterns));
        return d;
    }
    // Shell script standing in for journalctl
    std::string fake_journal(const std::string& body){
        auto p = dir / "journalctl";
        write_file(p, "#!/bin/sh\n" + body + "\n");
        ::chmod(p.c_str(), 0755);
        return p.string();
    }

    TempDir dir{"ioc_sweep_logs"};
};

TEST_F(LogProviderTest, CountAndSamplesFromSource) {
    MockLogSource source;
    LogQueryResult r;
    r.count = 3;
    r.samples = {"line one dscl", "line two dscl"};
    LogQuery seen;
    EXPECT_CALL(source, query(_)).WillOnce([&](const LogQuery& q){ seen = q; return r; });

    LogPatternProvider provider(source, 2500, 5);
    auto d = def({"dscl"});
    d.args.set("window", "3600");
    auto ev = provider.query(d, ScopeContext::system());
    ASSERT_TRUE(ev.present);
    EXPECT_THAT(ev.values, ::testing::ElementsAre("3"));
    EXPECT_EQ(ev.metadata["count"], "3");
    EXPECT_EQ(ev.metadata["window_seconds"], "3600");
    EXPECT_EQ(ev.metadata["sample_0"], "line one dscl");
    EXPECT_EQ(ev.metadata["sample_1"], "line two dscl");
    EXPECT_THAT(seen.patterns, ::testing::ElementsAre("dscl"));
    EXPECT_EQ(seen.window_seconds, 3600);
    EXPECT_EQ(seen.timeout, std::chrono::milliseconds(2500));
    EXPECT_EQ(seen.sample_limit, 5u);
}

TEST_F(LogProviderTest, NoEventsIsAbsent) {
    MockLogSource source;
    EXPECT_CALL(source, query(_)).WillOnce(Return(LogQueryResult{}));
    LogPatternProvider provider(source, 1000, 5);
    auto ev = provider.query(def({"base64", "osascript"}), ScopeContext::system());
    EXPECT_FALSE(ev.present);
    EXPECT_FALSE(ev.query_failed);
}

TEST_F(LogProviderTest, SourceFailureDegradesToFailedQuery) {
    MockLogSource source;
    LogQueryResult r;
    r.ok = false;
    r.error = "log subsystem unavailable";
    EXPECT_CALL(source, query(_)).WillOnce(Return(r));
    LogPatternProvider provider(source, 1000, 5);
    auto ev = provider.query(def({"dscl"}), ScopeContext::system());
    EXPECT_TRUE(ev.query_failed);
    EXPECT_EQ(ev.failure_reason, "log subsystem unavailable");
}

TEST_F(LogProviderTest, JournalArgv) {
    JournalLogSource source("/usr/bin/journalctl");
    LogQuery q;
    q.window_seconds = 86400;
    EXPECT_THAT(source.build_argv(q), ::testing::ElementsAre("/usr/bin/journalctl", "--no-pager", "--quiet",
                                                             "--output=short-iso", "--since=-86400s"));
}

TEST_F(LogProviderTest, JournalAnyOfMatchingWithSampleLimit) {
    JournalLogSource source(fake_journal(
        "echo 'Jan 01 host sh[1]: echo x | base64 -d'\n"
        "echo 'Jan 01 host kernel: boring'\n"
        "echo 'Jan 01 host osascript[2]: do shell script'\n"
        "printf 'Jan 01 host sh[3]: base64 again'"));
    LogQuery q;
    q.patterns = {"base64", "osascript"};
    q.sample_limit = 2;
    q.timeout = std::chrono::milliseconds(5000);
    auto r = source.query(q);
    ASSERT_TRUE(r.ok) << r.error;
    EXPECT_EQ(r.count, 3u);
    ASSERT_EQ(r.samples.size(), 2u);
    EXPECT_THAT(r.samples[0], ::testing::HasSubstr("base64 -d"));
    EXPECT_THAT(r.samples[1], ::testing::HasSubstr("osascript"));
}

TEST_F(LogProviderTest, JournalRegexMatching) {
    JournalLogSource source(fake_journal("echo 'dscl . -create /Users/x'\necho 'nothing here'"));
    LogQuery q;
    q.patterns = {"^dscl \\. -create"};
    q.regex = true;
    auto r = source.query(q);
    ASSERT_TRUE(r.ok) << r.error;
    EXPECT_EQ(r.count, 1u);
}

TEST_F(LogProviderTest, JournalTimeoutKillsReaderAndFails) {
    JournalLogSource source(fake_journal("echo 'dscl early'\nexec sleep 30"));
    LogQuery q;
    q.patterns = {"dscl"};
    q.timeout = std::chrono::milliseconds(300);
    auto started = std::chrono::steady_clock::now();
    auto r = source.query(q);
    auto elapsed = std::chrono::steady_clock::now() - started;
    EXPECT_FALSE(r.ok);
    EXPECT_THAT(r.error, ::testing::HasSubstr("timed out"));
    EXPECT_LT(elapsed, std::chrono::seconds(10));
}

TEST_F(LogProviderTest, JournalMissingBinaryIsUnavailable) {
    JournalLogSource source((dir / "no-such-journalctl").string());
    LogQuery q;
    q.patterns = {"dscl"};
    auto r = source.query(q);
    EXPECT_FALSE(r.ok);
    EXPECT_THAT(r.error, ::testing::HasSubstr("unavailable"));
}

TEST_F(LogProviderTest, JournalNonZeroExitFails) {
    JournalLogSource source(fake_journal("echo 'dscl'\nexit 1"));
    LogQuery q;
    q.patterns = {"dscl"};
    auto r = source.query(q);
    EXPECT_FALSE(r.ok);
    EXPECT_THAT(r.error, ::testing::HasSubstr("abnormally"));
}

}
