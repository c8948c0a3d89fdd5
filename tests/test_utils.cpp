#include <gtest/gtest.h>
#include <core/types.hpp>
#include <core/utils.hpp>

TEST(Utils, FormatRfc3339Utc) {
    auto tp = std::chrono::system_clock::from_time_t(1736935245);
    EXPECT_EQ(format_rfc3339(tp), "2025-01-15T10:00:45Z");
}

TEST(Utils, FormatRfc3339DropsSubseconds) {
    auto tp = std::chrono::system_clock::from_time_t(0) + std::chrono::milliseconds(999);
    EXPECT_EQ(format_rfc3339(tp), "1970-01-01T00:00:00Z");
}

TEST(Utils, SafeStoi) {
    EXPECT_EQ(safe_stoi("42"), 42);
    EXPECT_EQ(safe_stoi("abc", -1), -1);
    EXPECT_EQ(safe_stoi("", 7), 7);
    EXPECT_EQ(safe_stoi("99999999999999999999", -1), -1);
}

TEST(Utils, ShellQuotePlain) {
    EXPECT_EQ(shell_quote("kubectl"), "kubectl");
    EXPECT_EQ(shell_quote("--since-time=2025-01-15T10:00:45Z"), "--since-time=2025-01-15T10:00:45Z");
}

TEST(Utils, ShellQuoteSpecial) {
    EXPECT_EQ(shell_quote(""), "''");
    EXPECT_EQ(shell_quote("a b"), "'a b'");
    EXPECT_EQ(shell_quote("it's"), "'it'\\''s'");
    EXPECT_EQ(shell_quote("{.items[*]}"), "'{.items[*]}'");
}

TEST(Utils, ShellJoin) {
    EXPECT_EQ(shell_join({"kubectl", "logs", "my pod"}), "kubectl logs 'my pod'");
    EXPECT_EQ(shell_join({}), "");
}

TEST(Utils, SplitKeepsEmptyFields) {
    EXPECT_EQ(split("a\t\tb", '\t'), (std::vector<std::string>{"a", "", "b"}));
    EXPECT_EQ(split("", ';'), (std::vector<std::string>{""}));
    EXPECT_EQ(split("x;", ';'), (std::vector<std::string>{"x", ""}));
}

TEST(Utils, Trim) {
    std::string s = "  mute \r\n";
    trim(s);
    EXPECT_EQ(s, "mute");

    std::string blank = " \t ";
    trim(blank);
    EXPECT_EQ(blank, "");
}

TEST(Utils, WrapError) {
    EXPECT_EQ(wrap_error("getting pods", "timeout"), "getting pods: timeout");
    EXPECT_EQ(wrap_error("getting pods", ""), "getting pods");
}
