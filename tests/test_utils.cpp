#include <gtest/gtest.h>
#include <gmock/gmock.h>
#include "../src/core/Utils.h"
#include "TestSupport.h"
#include <cerrno>
#include <chrono>

namespace ioc_sweep {
namespace utils {

using testing_support::TempDir;
using testing_support::write_file;

class UtilsTest : public ::testing::Test {
protected:
    TempDir dir{"ioc_sweep_utils"};
};

TEST_F(UtilsTest, ReadFileMissingReturnsNullopt) {
    EXPECT_FALSE(read_file((dir / "missing").string()).has_value());
}

TEST_F(UtilsTest, ReadFileRespectsLimit) {
    write_file(dir / "big.txt", std::string(10000, 'x'));
    auto text = read_file((dir / "big.txt").string(), 100);
    ASSERT_TRUE(text.has_value());
    EXPECT_EQ(text->size(), 100u);
    auto full = read_file((dir / "big.txt").string());
    ASSERT_TRUE(full.has_value());
    EXPECT_EQ(full->size(), 10000u);
}

TEST_F(UtilsTest, TrimAndLower) {
    EXPECT_EQ(trim("  a b \t\n"), "a b");
    EXPECT_EQ(trim("   "), "");
    EXPECT_EQ(to_lower("HeLLo"), "hello");
}

TEST_F(UtilsTest, SplitCsvTrimsAndDropsEmpty) {
    EXPECT_THAT(split_csv("a, b,,c ,"), ::testing::ElementsAre("a", "b", "c"));
    EXPECT_TRUE(split_csv("").empty());
    EXPECT_EQ(join({"x", "y", "z"}, ","), "x,y,z");
    EXPECT_EQ(join({}, ","), "");
}

TEST_F(UtilsTest, ValidPid) {
    int pid = 0;
    EXPECT_TRUE(is_valid_pid("1234", &pid));
    EXPECT_EQ(pid, 1234);
    EXPECT_FALSE(is_valid_pid("0"));
    EXPECT_FALSE(is_valid_pid("-5"));
    EXPECT_FALSE(is_valid_pid("12a"));
    EXPECT_FALSE(is_valid_pid(""));
    EXPECT_FALSE(is_valid_pid(nullptr));
    EXPECT_FALSE(is_valid_pid("99999999999"));
}

TEST_F(UtilsTest, ModeFormatting) {
    EXPECT_EQ(format_mode(0644), "0644");
    EXPECT_EQ(format_mode(0100600), "0600");
    EXPECT_EQ(format_mode(04755), "4755");
}

TEST_F(UtilsTest, ModeParsing) {
    unsigned m = 0;
    EXPECT_TRUE(parse_mode("0600", m));
    EXPECT_EQ(m, 0600u);
    EXPECT_TRUE(parse_mode("755", m));
    EXPECT_EQ(m, 0755u);
    EXPECT_TRUE(parse_mode("07777", m));
    EXPECT_FALSE(parse_mode("0800", m));
    EXPECT_FALSE(parse_mode("17777", m));
    EXPECT_FALSE(parse_mode("", m));
    EXPECT_FALSE(parse_mode("rw", m));
}

TEST_F(UtilsTest, TimeToIso) {
    auto epoch = std::chrono::system_clock::from_time_t(0);
    EXPECT_EQ(time_to_iso(epoch), "1970-01-01T00:00:00Z");
}

TEST_F(UtilsTest, ErrnoText) {
    EXPECT_FALSE(errno_text(ENOENT).empty());
    EXPECT_NE(errno_text(ENOENT), errno_text(EPERM));
}

}
}
