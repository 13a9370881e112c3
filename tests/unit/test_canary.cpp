/*
 * taintguard C++17 - Canary token tests
 */
#include <gtest/gtest.h>
#include <taintguard/leakage/canary.hpp>

#include <cctype>
#include <cstring>
#include <set>

using namespace taintguard;

class CanaryTest : public ::testing::Test {
protected:
    static size_t prefix_length() { return std::strlen(Canary::PREFIX); }
};

TEST_F(CanaryTest, Generate_HasPrefixAndRandomHex) {
    CanaryToken token = Canary::generate("s1");
    ASSERT_TRUE(token.valid());
    EXPECT_EQ("s1", token.session_id);
    EXPECT_GT(token.created_at_ms, 0);
    ASSERT_EQ(prefix_length() + Canary::RANDOM_HEX_CHARS, token.token.size());
    EXPECT_EQ(0u, token.token.find(Canary::PREFIX));

    for (size_t i = prefix_length(); i < token.token.size(); ++i) {
        EXPECT_TRUE(std::isxdigit(static_cast<unsigned char>(token.token[i])));
    }
}

TEST_F(CanaryTest, Generate_TokensAreUnique) {
    std::set<std::string> seen;
    for (int i = 0; i < 64; ++i) {
        EXPECT_TRUE(seen.insert(Canary::generate("s").token).second);
    }
}

TEST_F(CanaryTest, SystemInstruction_EmbedsToken) {
    CanaryToken token = Canary::generate("s3");
    std::string instruction = Canary::system_instruction(token);
    EXPECT_NE(std::string::npos, instruction.find(token.token));
    EXPECT_NE(std::string::npos, instruction.find("Never output"));
}

TEST_F(CanaryTest, DetectInOutput_ExactSubstringOnly) {
    CanaryToken token = Canary::generate("s1");
    EXPECT_TRUE(Canary::detect_in_output(token, "prefix " + token.token + " suffix"));
    EXPECT_FALSE(Canary::detect_in_output(token, "nothing here"));
    EXPECT_FALSE(Canary::detect_in_output(token, token.token.substr(0, token.token.size() - 1)));

    CanaryToken empty;
    EXPECT_FALSE(Canary::detect_in_output(empty, "anything"));
}

TEST_F(CanaryTest, ContainsPattern_MatchesAnyToken) {
    CanaryToken other = Canary::generate("other-session");
    EXPECT_TRUE(Canary::contains_canary_pattern("leaked: " + other.token));
    EXPECT_TRUE(Canary::contains_canary_pattern(std::string(Canary::PREFIX) + "deadbeef"));
    EXPECT_FALSE(Canary::contains_canary_pattern("taintguard-canary-lowercase"));
}

TEST_F(CanaryTest, PatternLength_CoversAlnumTail) {
    std::string text = std::string("x ") + Canary::PREFIX + "abc123, rest";
    size_t pos = Canary::find_pattern(text);
    ASSERT_EQ(2u, pos);
    EXPECT_EQ(prefix_length() + 6, Canary::pattern_length(text, pos));
}
