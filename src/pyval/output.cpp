#include <pyval/output.h>

#include <fmt/core.h>
#include "utils.h"

namespace {

std::string EscapeLine(const std::string& line) {
  std::string ret;
  ret.reserve(line.size());
  for (char c : line) {
    if (c == '\r') {
      ret += "\\r";
    } else if (c != '\0') {
      ret += c;
    }
  }
  return ret;
}

} // namespace

SafeText SafeOutput(const std::string& text, const OutputLimits& lim) {
  SafeText ret{"", false};
  if (text.empty()) {
    ret.text = "No output.";
    return ret;
  }
  std::vector<std::string> lines = SplitString(text, '\n');
  if (lim.max_lines > 0 && lines.size() > static_cast<size_t>(lim.max_lines)) {
    lines.resize(lim.max_lines);
    lines.push_back(fmt::format("(...truncated at {} lines.)", lim.max_lines));
    ret.truncated = true;
  }
  for (size_t i = 0; i < lines.size(); i++) {
    std::string line = EscapeLine(lines[i]);
    if (lim.max_line_length > 0 && line.size() > static_cast<size_t>(lim.max_line_length)) {
      line = Utf8Cut(line, lim.max_line_length) + " (..truncated)";
      ret.truncated = true;
    }
    if (i) ret.text += "\\n";
    ret.text += line;
  }
  if (lim.max_length > 0 && ret.text.size() > static_cast<size_t>(lim.max_length)) {
    ret.text = Utf8Cut(ret.text, lim.max_length) + " (...truncated)";
    ret.truncated = true;
  }
  return ret;
}

SafeText SafeOutput(const EvaluationResult& res, const OutputLimits& lim, bool raw_mode) {
  SafeText ret{"", false};
  switch (res.exit_status) {
    case ExitStatus::TIMED_OUT:
      ret.text = "error: operation timed out.";
      return ret;
    case ExitStatus::SUCCESS:
      if (raw_mode) {
        ret.text = res.stdout_text;
      } else {
        ret = SafeOutput(res.stdout_text, lim);
      }
      break;
    case ExitStatus::CRASHED:
      // a plain non-zero exit already carries the interpreter's error line
      if (raw_mode) {
        ret.text = res.stdout_text;
      } else {
        ret = SafeOutput(res.stdout_text.empty() ? "the interpreter choked." : res.stdout_text, lim);
      }
      if (res.signal || res.stdout_text.empty()) ret.text = "crash: " + ret.text;
      break;
  }
  ret.truncated = ret.truncated || res.truncated;
  return ret;
}

std::string SafePaste(const std::string& text, int max_lines, int max_line_length) {
  std::vector<std::string> lines = SplitString(text, '\n');
  bool cut_lines = false;
  if (max_lines > 0 && lines.size() > static_cast<size_t>(max_lines)) {
    lines.resize(max_lines);
    cut_lines = true;
  }
  std::string ret;
  for (auto& line : lines) {
    if (max_line_length > 0 && line.size() > static_cast<size_t>(max_line_length)) {
      ret += fmt::format("{} ..truncated ({} chars)\n", Utf8Cut(line, max_line_length), max_line_length);
    } else {
      ret += line + '\n';
    }
  }
  if (cut_lines) ret += fmt::format("..truncated at {} lines.\n", max_lines);
  return Trim(ret, "\n");
}
