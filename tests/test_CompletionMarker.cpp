#include <gtest/gtest.h>
#include "shell/CompletionMarker.h"
#include <set>

TEST(CompletionMarkerTest, GeneratedTokensAreUniqueAndWellFormed) {
    std::set<std::string> seen;
    for (int i = 0; i < 100; ++i) {
        auto marker = CompletionMarker::generate();
        const auto& token = marker.token();
        EXPECT_EQ(token.rfind("__BASH_CMD_DONE_", 0), 0u);
        EXPECT_EQ(token.substr(token.size() - 2), "__");
        EXPECT_TRUE(seen.insert(token).second) << token;
    }
}

TEST(CompletionMarkerTest, FrameEchoesTokenWithExitStatus) {
    CompletionMarker marker("__TOKEN__");
    EXPECT_EQ(marker.frame("ls -la"), "ls -la\necho '__TOKEN__'$?\n");
}

TEST(CompletionMarkerTest, MatchesMarkerLine) {
    CompletionMarker marker("__TOKEN__");
    std::string leading, code;
    ASSERT_TRUE(marker.match("__TOKEN__0", leading, code));
    EXPECT_EQ(leading, "");
    EXPECT_EQ(code, "0");

    ASSERT_TRUE(marker.match("__TOKEN__127", leading, code));
    EXPECT_EQ(code, "127");
}

TEST(CompletionMarkerTest, KeepsOutputPrintedBeforeMarker) {
    CompletionMarker marker("__TOKEN__");
    std::string leading, code;
    ASSERT_TRUE(marker.match("no newline here__TOKEN__1", leading, code));
    EXPECT_EQ(leading, "no newline here");
    EXPECT_EQ(code, "1");
}

TEST(CompletionMarkerTest, RejectsLinesWithoutTrailingStatus) {
    CompletionMarker marker("__TOKEN__");
    std::string leading, code;
    EXPECT_FALSE(marker.match("plain output", leading, code));
    EXPECT_FALSE(marker.match("__TOKEN__", leading, code));
    EXPECT_FALSE(marker.match("__TOKEN__0 trailing", leading, code));
    EXPECT_FALSE(marker.match("__OTHER__0", leading, code));
}
