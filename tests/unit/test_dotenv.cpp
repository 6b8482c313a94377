#include <gtest/gtest.h>
#include "util/dotenv.hpp"
#include "error/ShrineError.hpp"

using namespace shrine::util;

TEST(DotenvTest, CommentsBlankLinesAndPaddingValues) {
    const auto pairs = parseDotenv("key1=val1#comment\n#a comment\n\nkey2=val2==\n");
    ASSERT_EQ(pairs.size(), 2u);
    EXPECT_EQ(pairs[0], (EnvPair{"key1", "val1"}));
    EXPECT_EQ(pairs[1], (EnvPair{"key2", "val2=="}));
}

TEST(DotenvTest, EscapedHashIsLiteral) {
    const auto pairs = parseDotenv("color=\\#ff0000 # red\n");
    ASSERT_EQ(pairs.size(), 1u);
    EXPECT_EQ(pairs[0].second, "#ff0000");
}

TEST(DotenvTest, TrimsAndUnquotes) {
    const auto pairs = parseDotenv("  NAME =  \"hello world\"  \r\nSINGLE='x y'\nEMPTY=\n");
    ASSERT_EQ(pairs.size(), 3u);
    EXPECT_EQ(pairs[0], (EnvPair{"NAME", "hello world"}));
    EXPECT_EQ(pairs[1], (EnvPair{"SINGLE", "x y"}));
    EXPECT_EQ(pairs[2], (EnvPair{"EMPTY", ""}));
}

TEST(DotenvTest, LastLineWithoutNewline) {
    const auto pairs = parseDotenv("a=1\nb=2");
    ASSERT_EQ(pairs.size(), 2u);
    EXPECT_EQ(pairs[1], (EnvPair{"b", "2"}));
}

TEST(DotenvTest, MalformedLinesNameTheirLineNumber) {
    try {
        (void)parseDotenv("a=1\n\njust text\n");
        FAIL() << "expected InvalidArgumentError";
    } catch (const shrine::error::InvalidArgumentError& e) {
        EXPECT_NE(std::string(e.what()).find("line 3"), std::string::npos);
    }
    EXPECT_THROW((void)parseDotenv("=value\n"), shrine::error::InvalidArgumentError);
}
