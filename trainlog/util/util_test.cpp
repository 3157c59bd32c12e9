#include <gtest/gtest.h>
#include <trainlog/util/util.hpp>

namespace trainlog {
namespace {

TEST(CollapseWhitespaceTest, CollapsesInnerRuns) {
    EXPECT_EQ(collapse_whitespace("bench   press"), "bench press");
    EXPECT_EQ(collapse_whitespace("  bench \t press \n"), "bench press");
    EXPECT_EQ(collapse_whitespace(""), "");
    EXPECT_EQ(collapse_whitespace(" \t "), "");
}

TEST(TrimTest, KeepsInnerWhitespace) {
    EXPECT_EQ(trim("  leg  press \r"), "leg  press");
    EXPECT_EQ(trim("squat"), "squat");
    EXPECT_EQ(trim("   "), "");
}

TEST(ReadLinesTest, StripsCarriageReturns) {
    std::vector<std::string> lines;
    in_temp_dir([&]() {
        {
            std::ofstream file("log.txt");
            file << "2024-01-15\r\nbp 60k: 5\r\n\r\nsquat 5\n";
        }
        lines = read_lines("log.txt");
    });
    const std::vector<std::string> expected = {"2024-01-15", "bp 60k: 5", "",
                                               "squat 5"};
    EXPECT_EQ(lines, expected);
}

TEST(InTempDirTest, RestoresWorkingDirectory) {
    char before[4096];
    char after[4096];
    ASSERT_TRUE(getcwd(before, sizeof(before)));
    std::string inside;
    in_temp_dir([&]() {
        char path[4096];
        ASSERT_TRUE(getcwd(path, sizeof(path)));
        inside = path;
    });
    ASSERT_TRUE(getcwd(after, sizeof(after)));
    EXPECT_EQ(std::string(before), std::string(after));
    EXPECT_NE(inside, std::string(before));
}

}  // namespace
}  // namespace trainlog
