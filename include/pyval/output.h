#ifndef INCLUDE_PYVAL_OUTPUT_H_
#define INCLUDE_PYVAL_OUTPUT_H_

#include <string>
#include "exec.h"

// 0 disables a limit
struct OutputLimits {
  int max_lines;
  int max_line_length;
  int max_length; // whole rendering, after escaping
};
constexpr OutputLimits kDefaultOutputLimits = {65, 240, 0};

struct SafeText {
  std::string text;
  bool truncated;
};

// One-line rendering for chat: newlines become the two characters "\n",
// carriage returns "\r", NUL bytes are dropped. Truncation markers are appended after the cut.
SafeText SafeOutput(const std::string& text, const OutputLimits& = kDefaultOutputLimits);
// Renders timeouts and crashes as notices; raw_mode returns the text untouched
SafeText SafeOutput(const EvaluationResult&, const OutputLimits&, bool raw_mode);

// Multi-line rendering for pastes
std::string SafePaste(const std::string& text, int max_lines = 65, int max_line_length = 240);

#endif  // INCLUDE_PYVAL_OUTPUT_H_
