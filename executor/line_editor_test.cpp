#include "executor/line_editor.hpp"
#include <fstream>
#include "gmock/gmock.h"
#include "gtest/gtest.h"
#include "util/file.hpp"

namespace {

using ::testing::ElementsAre;

const std::string test_tmpdir = "/tmp/task_relay_testdir";

void writeFile(const std::string& path, const std::string& content) {
  std::ofstream of(path);
  of << content;
}

std::string readFile(const std::string& path) {
  std::ifstream t(path);
  std::string str((std::istreambuf_iterator<char>(t)),
                  std::istreambuf_iterator<char>());
  return str;
}

class LineEditorTest : public ::testing::Test {
 protected:
  LineEditorTest() : tmp_(test_tmpdir + "/line_editor") {
    path_ = util::File::JoinPath(tmp_.Path(), "a.txt");
  }

  // Runs an update on a file with the given content and returns the new
  // content of the file.
  std::string Update(const std::string& before, const std::string& range,
                     const std::string& content) {
    writeFile(path_, before);
    success_ = executor::EditLines(path_, range, content, &message_);
    return readFile(path_);
  }

  util::TempDir tmp_;
  std::string path_;
  bool success_ = false;
  std::string message_;
};

/*
 * LineRange
 */

// NOLINTNEXTLINE
TEST(LineRange, ParseOverwrite) {
  executor::LineRange range;
  ASSERT_TRUE(executor::LineRange::Parse("0-999999", &range));
  EXPECT_EQ(range.mode, executor::LineRange::OVERWRITE);
}

// NOLINTNEXTLINE
TEST(LineRange, ParseAppend) {
  for (const char* spec : {"", "append", "APPEND", "Append"}) {
    executor::LineRange range;
    range.mode = executor::LineRange::LINES;
    ASSERT_TRUE(executor::LineRange::Parse(spec, &range)) << spec;
    EXPECT_EQ(range.mode, executor::LineRange::APPEND) << spec;
  }
}

// NOLINTNEXTLINE
TEST(LineRange, ParseLines) {
  executor::LineRange range;
  ASSERT_TRUE(executor::LineRange::Parse("2-5", &range));
  EXPECT_EQ(range.mode, executor::LineRange::LINES);
  EXPECT_EQ(range.start, 2);
  EXPECT_EQ(range.end, 5);
  ASSERT_TRUE(executor::LineRange::Parse(" 3 - 4 ", &range));
  EXPECT_EQ(range.start, 3);
  EXPECT_EQ(range.end, 4);
}

// NOLINTNEXTLINE
TEST(LineRange, ParseSingleLine) {
  executor::LineRange range;
  ASSERT_TRUE(executor::LineRange::Parse("7", &range));
  EXPECT_EQ(range.mode, executor::LineRange::LINES);
  EXPECT_EQ(range.start, 7);
  EXPECT_EQ(range.end, 7);
}

// NOLINTNEXTLINE
TEST(LineRange, ParseInvalid) {
  for (const char* spec : {"abc", "1-2-3", "-3", "1-", "1-x", "1.5"}) {
    executor::LineRange range;
    EXPECT_FALSE(executor::LineRange::Parse(spec, &range)) << spec;
  }
}

// NOLINTNEXTLINE
TEST(LineRange, ParseLinesHasNoSentinels) {
  executor::LineRange range;
  EXPECT_FALSE(executor::LineRange::ParseLines("append", &range));
  EXPECT_FALSE(executor::LineRange::ParseLines("", &range));
  ASSERT_TRUE(executor::LineRange::ParseLines("0-999999", &range));
  EXPECT_EQ(range.mode, executor::LineRange::LINES);
}

/*
 * NormalizeLines
 */

// NOLINTNEXTLINE
TEST(LineRange, NormalizeLines) {
  EXPECT_THAT(executor::NormalizeLines("X\r\nY\rZ\n"),
              ElementsAre("X\n", "Y\n", "Z\n"));
  EXPECT_THAT(executor::NormalizeLines("last"), ElementsAre("last\n"));
  EXPECT_TRUE(executor::NormalizeLines("").empty());
}

/*
 * EditLines
 */

// NOLINTNEXTLINE
TEST_F(LineEditorTest, ReplaceRange) {
  EXPECT_EQ(Update("1\n2\n3\n4\n", "2-3", "X\nY"), "1\nX\nY\n4\n");
  EXPECT_TRUE(success_);
  EXPECT_EQ(message_, "Lines 2-3 updated.");
}

// NOLINTNEXTLINE
TEST_F(LineEditorTest, ReplaceKeepsOtherLines) {
  std::string before = "a\r\n\n  b \nc\n";
  EXPECT_EQ(Update(before, "3-3", "new"), "a\r\n\nnew\nc\n");
}

// NOLINTNEXTLINE
TEST_F(LineEditorTest, ReplaceSingleLine) {
  EXPECT_EQ(Update("1\n2\n3\n", "2", "two"), "1\ntwo\n3\n");
}

// NOLINTNEXTLINE
TEST_F(LineEditorTest, ReplaceWithMoreLines) {
  EXPECT_EQ(Update("1\n2\n3\n", "1-1", "a\nb\nc"), "a\nb\nc\n2\n3\n");
}

// NOLINTNEXTLINE
TEST_F(LineEditorTest, ReplaceWithNothing) {
  EXPECT_EQ(Update("1\n2\n3\n", "2-2", ""), "1\n3\n");
}

// NOLINTNEXTLINE
TEST_F(LineEditorTest, ReplacePastEnd) {
  EXPECT_EQ(Update("1\n2\n3\n", "3-10", "Z"), "1\n2\nZ\n");
  EXPECT_TRUE(success_);
  EXPECT_EQ(Update("1\n2", "5-8", "Z"), "1\n2\nZ\n");
}

// NOLINTNEXTLINE
TEST_F(LineEditorTest, ReplaceAfterUnterminatedLine) {
  EXPECT_EQ(Update("1\n2", "3-3", "3"), "1\n2\n3\n");
}

// NOLINTNEXTLINE
TEST_F(LineEditorTest, InsertWhenEndBeforeStart) {
  EXPECT_EQ(Update("1\n2\n3\n", "2-1", "X"), "1\nX\n2\n3\n");
}

// NOLINTNEXTLINE
TEST_F(LineEditorTest, StartZeroIsFirstLine) {
  EXPECT_EQ(Update("1\n2\n", "0-1", "X"), "X\n2\n");
}

// NOLINTNEXTLINE
TEST_F(LineEditorTest, Overwrite) {
  EXPECT_EQ(Update("old\ncontent\n", "0-999999", "new\r\ncontent"),
            "new\r\ncontent");
  EXPECT_TRUE(success_);
  EXPECT_EQ(message_, "File overwritten successfully.");
  EXPECT_EQ(Update("x", "0-999999", ""), "");
}

// NOLINTNEXTLINE
TEST_F(LineEditorTest, Append) {
  EXPECT_EQ(Update("1\n2", "append", "Z"), "1\n2\nZ\n");
  EXPECT_TRUE(success_);
  EXPECT_EQ(message_, "Content successfully appended to end of file.");
}

// NOLINTNEXTLINE
TEST_F(LineEditorTest, AppendEmptyRange) {
  EXPECT_EQ(Update("1\n", "", "2\n3\n"), "1\n2\n3\n");
}

// NOLINTNEXTLINE
TEST_F(LineEditorTest, AppendEmptyFile) {
  EXPECT_EQ(Update("", "Append", "a"), "a\n");
}

// NOLINTNEXTLINE
TEST_F(LineEditorTest, InvalidRange) {
  EXPECT_EQ(Update("1\n2\n", "one-two", "X"), "1\n2\n");
  EXPECT_FALSE(success_);
  EXPECT_EQ(message_, "Invalid line range. Use 'start-end' or 'append'.");
}

// NOLINTNEXTLINE
TEST_F(LineEditorTest, MissingFile) {
  std::string message;
  EXPECT_FALSE(executor::EditLines(path_ + ".missing", "append", "X",
                                   &message));
  EXPECT_EQ(message, "File not found.");
  EXPECT_FALSE(util::File::Exists(path_ + ".missing"));
}

}  // namespace
