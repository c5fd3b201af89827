#include <string>
#include <gtest/gtest.h>
#include "mutation/unified_diff.hpp"

namespace {

using tollgate::mutation::unified_diff;

std::size_t count_of(const std::string& text, const std::string& needle) {
    std::size_t n = 0;
    for (auto pos = text.find(needle); pos != std::string::npos;
         pos = text.find(needle, pos + 1)) {
        ++n;
    }
    return n;
}

std::string numbered_lines(const int first, const int last) {
    std::string text;
    for (int i = first; i <= last; ++i) {
        text += "L" + std::to_string(i) + "\n";
    }
    return text;
}

TEST(UnifiedDiffTest, IdenticalTextsProduceNoDiff) {
    EXPECT_EQ(unified_diff("a\nb\n", "a\nb\n", "f.txt"), "");
}

TEST(UnifiedDiffTest, SingleLineReplacement) {
    const std::string expected =
        "--- a/f.txt\n"
        "+++ b/f.txt\n"
        "@@ -1,3 +1,3 @@\n"
        " a\n"
        "-b\n"
        "+B\n"
        " c\n";
    EXPECT_EQ(unified_diff("a\nb\nc\n", "a\nB\nc\n", "f.txt"), expected);
}

TEST(UnifiedDiffTest, DistantChangesBecomeSeparateHunks) {
    std::string old_text = numbered_lines(1, 20);
    std::string new_text = old_text;
    new_text.replace(new_text.find("L2\n"), 3, "X2\n");
    new_text.replace(new_text.find("L19\n"), 4, "X19\n");

    const auto diff = unified_diff(old_text, new_text, "f.txt");
    EXPECT_EQ(count_of(diff, "@@ -"), 2u);
    EXPECT_NE(diff.find("@@ -1,5 +1,5 @@"), std::string::npos);
    EXPECT_NE(diff.find("@@ -16,5 +16,5 @@"), std::string::npos);
    EXPECT_NE(diff.find("-L19\n+X19\n"), std::string::npos);
}

TEST(UnifiedDiffTest, NearbyChangesShareAHunk) {
    std::string old_text = numbered_lines(1, 12);
    std::string new_text = old_text;
    new_text.replace(new_text.find("L3\n"), 3, "X3\n");
    new_text.replace(new_text.find("L9\n"), 3, "X9\n");

    const auto diff = unified_diff(old_text, new_text, "f.txt");
    EXPECT_EQ(count_of(diff, "@@ -"), 1u);
}

TEST(UnifiedDiffTest, CreationFromEmptyText) {
    const auto diff = unified_diff("", "x\ny\n", "new.txt");
    EXPECT_NE(diff.find("@@ -0,0 +1,2 @@\n+x\n+y\n"), std::string::npos);
}

}  // namespace
