#include <signal.h>
#include <pyval/output.h>

#include "utils.h"

namespace {

std::string Lines(int count, size_t width, char c = 'x') {
  std::string ret;
  for (int i = 0; i < count; i++) {
    if (i) ret += '\n';
    ret += std::string(width, c);
  }
  return ret;
}

} // namespace

TEST(SafeOutputTest, Escaping) {
  EXPECT_EQ(SafeOutput("").text, "No output.");
  EXPECT_EQ(SafeOutput("okay").text, "okay");
  EXPECT_EQ(SafeOutput("a\nb").text, "a\\nb");
  EXPECT_EQ(SafeOutput("a\r\nb").text, "a\\r\\nb");
  EXPECT_EQ(SafeOutput(std::string("a\0b", 3)).text, "ab");
  EXPECT_FALSE(SafeOutput("a\nb").truncated);
}

TEST(SafeOutputTest, TooManyLines) {
  SafeText res = SafeOutput(Lines(100, 5));
  EXPECT_TRUE(res.truncated);
  std::string marker = "\\n(...truncated at 65 lines.)";
  ASSERT_GT(res.text.size(), marker.size());
  EXPECT_EQ(res.text.substr(res.text.size() - marker.size()), marker);
  EXPECT_EQ(res.text.substr(0, res.text.size() - marker.size()), SafeOutput(Lines(65, 5)).text);
}

TEST(SafeOutputTest, LongLine) {
  SafeText res = SafeOutput(std::string(300, 'y') + "\nshort");
  EXPECT_TRUE(res.truncated);
  EXPECT_EQ(res.text, std::string(240, 'y') + " (..truncated)\\nshort");
}

TEST(SafeOutputTest, TotalLength) {
  SafeText res = SafeOutput("abcdefghijklmnop", {0, 0, 10});
  EXPECT_TRUE(res.truncated);
  EXPECT_EQ(res.text, "abcdefghij (...truncated)");
  EXPECT_FALSE(SafeOutput("abc", {0, 0, 10}).truncated);
}

TEST(SafeOutputTest, Utf8NotSplit) {
  // 2-byte characters; a cut at 5 bytes keeps two of them
  SafeText res = SafeOutput("\xc3\xa9\xc3\xa9\xc3\xa9\xc3\xa9", {0, 5, 0});
  EXPECT_EQ(res.text, "\xc3\xa9\xc3\xa9 (..truncated)");
}

TEST(SafeOutputTest, Results) {
  EvaluationResult res;
  res.exit_status = ExitStatus::TIMED_OUT;
  EXPECT_EQ(SafeOutput(res, kDefaultOutputLimits, false).text, "error: operation timed out.");

  res.exit_status = ExitStatus::CRASHED;
  res.signal = SIGSEGV;
  res.stdout_text = "No output.";
  EXPECT_EQ(SafeOutput(res, kDefaultOutputLimits, false).text, "crash: No output.");

  res.signal = 0;
  res.stdout_text = "";
  EXPECT_EQ(SafeOutput(res, kDefaultOutputLimits, false).text, "crash: the interpreter choked.");

  res.exit_status = ExitStatus::SUCCESS;
  res.stdout_text = "1\n2";
  res.truncated = true;
  SafeText text = SafeOutput(res, kDefaultOutputLimits, false);
  EXPECT_EQ(text.text, "1\\n2");
  EXPECT_TRUE(text.truncated);
  EXPECT_EQ(SafeOutput(res, kDefaultOutputLimits, true).text, "1\n2");
}

TEST(SafePasteTest, Limits) {
  EXPECT_EQ(SafePaste("a\nb\n\n"), "a\nb");
  std::string res = SafePaste(Lines(70, 3));
  EXPECT_EQ(res, Lines(65, 3) + "\n..truncated at 65 lines.");
  EXPECT_EQ(SafePaste(std::string(300, 'z')), std::string(240, 'z') + " ..truncated (240 chars)");
}
