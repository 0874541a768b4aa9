#include <pyval/exec.h>

#include <unistd.h>
#include <sys/wait.h>
#include <cstring>
#include <algorithm>

#include <spdlog/spdlog.h>
#include <pyval/paths.h>
#include <pyval/blacklist.h>
#include "process.h"
#include "utils.h"

long kSandboxTimeout = 5'000'000;
size_t kMaxCapture = 1 << 20;

namespace {

const char kImportSiteFailed[] = "'import site' failed";

// whole-line matches only
std::string TranslateError(const std::string& line) {
  std::string trimmed = Trim(line);
  if (trimmed == "RuntimeError") return "operation not permitted in the sandbox.";
  if (trimmed == "[Subprocess killed by SIGIOT]") return "crash! the interpreter choked.";
  return line;
}

} // namespace

std::string ParseInput(const std::string& code, bool string_mode) {
  std::string ret;
  if (string_mode) {
    ret.reserve(code.size());
    for (size_t i = 0; i < code.size(); i++) {
      if (code.compare(i, 3, "\\\\n") == 0) {
        ret += "\\n";
        i += 2;
      } else if (code.compare(i, 2, "\\n") == 0) {
        ret += '\n';
        i += 1;
      } else {
        ret += code[i];
      }
    }
  } else {
    ret = code;
  }
  ReplaceAll(ret, "?(", "print(");
  if (ret.find('\n') != std::string::npos && ret.back() != '\n') ret += '\n';
  return ret;
}

std::string PickOutput(const std::string& out, const std::string& err) {
  std::string ret;
  if (out.size()) {
    ret = out;
  } else {
    std::string last;
    for (auto& line : SplitString(err, '\n')) {
      std::string stripped = Trim(line, "\r\n");
      if (stripped.empty() || stripped == kImportSiteFailed) continue;
      last = stripped;
    }
    ret = last.empty() ? "No output." : TranslateError(last);
  }
  return Trim(ret, "\n");
}

std::optional<std::string> CheckRequest(const EvaluationRequest& req, const Blacklist& blacklist) {
  if (req.source_code.empty()) return "no input.";
  if (Trim(req.source_code).empty()) return "only whitespace found.";
  if (req.use_blacklist) {
    if (auto msg = blacklist.Match(req.source_code)) return msg;
  }
  return std::nullopt;
}

std::vector<std::string> SandboxCommand(long timeout) {
  std::vector<std::string> ret{kSandboxExe.string()};
  // the sandbox takes whole seconds
  long secs = std::max(1L, (timeout + 999'999) / 1'000'000);
  ret.push_back("--timeout=" + std::to_string(secs));
  if (!kSandboxDir.empty()) ret.push_back("--tmp=" + kSandboxDir.string());
  if (kSandboxScript.size()) ret.push_back(kSandboxScript);
  return ret;
}

bool SandboxAvailable() {
  return !kSandboxExe.empty() && access(kSandboxExe.c_str(), X_OK) == 0;
}

EvaluationResult Execute(const EvaluationRequest& req) {
  EvaluationResult res;
  res.parsed_source = ParseInput(req.source_code, req.string_mode);
  if (kSandboxExe.empty()) {
    spdlog::warn("No sandbox executable configured");
    res.stdout_text = "no sandbox executable.";
    return res;
  }
  long timeout = req.timeout > 0 ? req.timeout : kSandboxTimeout;

  ProcessOptions opt;
  opt.command = SandboxCommand(timeout);
  opt.input = res.parsed_source;
  opt.wall_time = timeout;
  opt.max_output = kMaxCapture;
  spdlog::debug("Evaluating for {}: {}", req.requester.size() ? req.requester : "<local>",
                res.parsed_source);
  ProcessResult proc = RunProcess(opt);
  res.truncated = proc.output_truncated;

  if (proc.spawn_failed) {
    res.stdout_text = std::string("unable to start the sandbox: ") + strerror(proc.error);
    return res;
  }
  if (proc.timed_out) {
    res.exit_status = ExitStatus::TIMED_OUT;
    spdlog::info("Evaluation timed out after {} us", timeout);
    return res;
  }
  res.stdout_text = PickOutput(proc.out, proc.err);
  if (WIFSIGNALED(proc.status)) {
    res.signal = WTERMSIG(proc.status);
    res.exit_status = ExitStatus::CRASHED;
    spdlog::warn("Sandbox killed by signal {} ({})", res.signal, strsignal(res.signal));
  } else if (WIFEXITED(proc.status)) {
    res.exit_code = WEXITSTATUS(proc.status);
    res.exit_status = res.exit_code == 0 ? ExitStatus::SUCCESS : ExitStatus::CRASHED;
    if (res.exit_code) spdlog::info("Sandbox exited with code {}", res.exit_code);
  }
  return res;
}
