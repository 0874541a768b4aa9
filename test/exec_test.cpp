#include <chrono>
#include <signal.h>
#include <pyval/exec.h>
#include <pyval/output.h>
#include <pyval/blacklist.h>

#include "utils.h"

TEST(ParseInputTest, Newlines) {
  EXPECT_EQ(ParseInput("a = 1\\nprint(a)", true), "a = 1\nprint(a)\n");
  EXPECT_EQ(ParseInput("print('x\\\\ny')", true), "print('x\\ny')");
  EXPECT_EQ(ParseInput("a = 1\\nprint(a)", false), "a = 1\\nprint(a)");
  EXPECT_EQ(ParseInput("x = 1\n", true), "x = 1\n");
}

TEST(ParseInputTest, PrintShortcut) {
  EXPECT_EQ(ParseInput("?(1 + 1)", true), "print(1 + 1)");
  EXPECT_EQ(ParseInput("x = 2\\n?(x)", true), "x = 2\nprint(x)\n");
}

TEST(PickOutputTest, Stdout) {
  EXPECT_EQ(PickOutput("okay\n", "ignored"), "okay");
  EXPECT_EQ(PickOutput("a\nb\n\n", ""), "a\nb");
}

TEST(PickOutputTest, LastErrorLine) {
  std::string err = "'import site' failed\nTraceback (most recent call last):\n"
                    "  File \"<stdin>\", line 1\nNameError: name 'x' is not defined\n";
  EXPECT_EQ(PickOutput("", err), "NameError: name 'x' is not defined");
  EXPECT_EQ(PickOutput("", "'import site' failed\n"), "No output.");
  EXPECT_EQ(PickOutput("", ""), "No output.");
}

TEST(PickOutputTest, Translated) {
  EXPECT_EQ(PickOutput("", "Traceback (most recent call last):\nRuntimeError\n"),
            "operation not permitted in the sandbox.");
  EXPECT_EQ(PickOutput("", "[Subprocess killed by SIGIOT]\n"), "crash! the interpreter choked.");
}

TEST(PickOutputTest, UserErrorsKept) {
  EXPECT_EQ(PickOutput("", "Traceback (most recent call last):\nRuntimeError: boom\n"),
            "RuntimeError: boom");
  EXPECT_EQ(PickOutput("", "NameError: name 'RuntimeErrorX' is not defined\n"),
            "NameError: name 'RuntimeErrorX' is not defined");
  EXPECT_EQ(PickOutput("", "ValueError: [Subprocess killed by SIGIOT] is a string\n"),
            "ValueError: [Subprocess killed by SIGIOT] is a string");
}

TEST(CheckRequestTest, Rejects) {
  Blacklist blacklist;
  EXPECT_EQ(CheckRequest(EvaluationRequest(""), blacklist), "no input.");
  EXPECT_EQ(CheckRequest(EvaluationRequest(" \t "), blacklist), "only whitespace found.");
  EXPECT_EQ(CheckRequest(EvaluationRequest("print(1)"), blacklist), std::nullopt);

  EvaluationRequest req("import os");
  EXPECT_EQ(CheckRequest(req, blacklist), std::nullopt);
  req.use_blacklist = true;
  EXPECT_EQ(CheckRequest(req, blacklist), "no imports allowed.");
}

class ExecTest : public ::testing::Test {
 protected:
  SandboxSettings saved;
};

TEST_F(ExecTest, Command) {
  kSandboxExe = "/opt/sandbox/bin/pypy-c-sandbox";
  kSandboxDir = "/opt/sandbox/tmp";
  kSandboxScript = "/tmp/pyval_sandbox.py";
  std::vector<std::string> expected = {
    "/opt/sandbox/bin/pypy-c-sandbox", "--timeout=3", "--tmp=/opt/sandbox/tmp", "/tmp/pyval_sandbox.py"
  };
  EXPECT_EQ(SandboxCommand(2'500'000), expected);
  kSandboxDir.clear();
  kSandboxScript.clear();
  expected = {"/opt/sandbox/bin/pypy-c-sandbox", "--timeout=1"};
  EXPECT_EQ(SandboxCommand(10), expected);
}

TEST_F(ExecTest, NoSandbox) {
  kSandboxExe.clear();
  EXPECT_FALSE(SandboxAvailable());
  EvaluationResult res = Execute(EvaluationRequest("print('okay')"));
  EXPECT_EQ(res.exit_status, ExitStatus::CRASHED);
  EXPECT_EQ(res.stdout_text, "no sandbox executable.");
}

TEST_F(ExecTest, Success) {
  UseSandbox(EchoSandbox());
  ASSERT_TRUE(SandboxAvailable());
  EvaluationResult res = Execute(EvaluationRequest("print('okay')"));
  EXPECT_EQ(res.exit_status, ExitStatus::SUCCESS);
  EXPECT_EQ(res.stdout_text, "okay");
  EXPECT_EQ(res.parsed_source, "print('okay')");
  EXPECT_FALSE(res.truncated);
}

TEST_F(ExecTest, MultiLine) {
  UseSandbox(EchoSandbox());
  EvaluationRequest req("print('a')\\nprint('b')");
  EvaluationResult res = Execute(req);
  EXPECT_EQ(res.exit_status, ExitStatus::SUCCESS);
  EXPECT_EQ(res.stdout_text, "a\nb");
  EXPECT_EQ(SafeOutput(res, kDefaultOutputLimits, false).text, "a\\nb");
  EXPECT_EQ(SafeOutput(res, kDefaultOutputLimits, true).text, "a\nb");
}

TEST_F(ExecTest, EmptyOutput) {
  UseSandbox(EchoSandbox());
  EvaluationResult res = Execute(EvaluationRequest("x = 1"));
  EXPECT_EQ(res.exit_status, ExitStatus::SUCCESS);
  EXPECT_EQ(res.stdout_text, "No output.");
}

TEST_F(ExecTest, ErrorExit) {
  UseSandbox(WriteScript("error_sandbox.sh",
                         "cat >/dev/null\necho \"NameError: name 'x' is not defined\" >&2\nexit 1"));
  EvaluationResult res = Execute(EvaluationRequest("print(x)"));
  EXPECT_EQ(res.exit_status, ExitStatus::CRASHED);
  EXPECT_EQ(res.exit_code, 1);
  EXPECT_EQ(res.signal, 0);
  EXPECT_EQ(SafeOutput(res, kDefaultOutputLimits, false).text, "NameError: name 'x' is not defined");
}

TEST_F(ExecTest, Crash) {
  UseSandbox(CrashSandbox());
  EvaluationResult res = Execute(EvaluationRequest("print('okay')"));
  EXPECT_EQ(res.exit_status, ExitStatus::CRASHED);
  EXPECT_EQ(res.signal, SIGSEGV);
  std::string text = SafeOutput(res, kDefaultOutputLimits, false).text;
  EXPECT_EQ(text.rfind("crash: ", 0), 0u) << text;
}

TEST_F(ExecTest, TimeoutThenRecover) {
  UseSandbox(SlowSandbox());
  EvaluationRequest req("print('okay')");
  req.timeout = 1'000'000;
  auto start = std::chrono::steady_clock::now();
  EvaluationResult res = Execute(req);
  auto elapsed = std::chrono::steady_clock::now() - start;
  EXPECT_EQ(res.exit_status, ExitStatus::TIMED_OUT);
  EXPECT_LT(elapsed, std::chrono::seconds(10));
  EXPECT_EQ(SafeOutput(res, kDefaultOutputLimits, false).text, "error: operation timed out.");

  UseSandbox(EchoSandbox());
  res = Execute(EvaluationRequest("print('okay')"));
  EXPECT_EQ(res.exit_status, ExitStatus::SUCCESS);
  EXPECT_EQ(res.stdout_text, "okay");
}
