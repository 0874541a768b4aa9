#ifndef INCLUDE_PYVAL_EXEC_H_
#define INCLUDE_PYVAL_EXEC_H_

#include <string>
#include <vector>
#include <optional>

// us
extern long kSandboxTimeout;
// bytes kept from each of stdout / stderr
extern size_t kMaxCapture;

#define ENUM_EXIT_STATUS_ \
  X(SUCCESS, "success") \
  X(CRASHED, "crashed") \
  X(TIMED_OUT, "timed out")
enum class ExitStatus {
#define X(name, desc) name,
  ENUM_EXIT_STATUS_
#undef X
};

class Blacklist;

class EvaluationRequest {
 public:
  std::string source_code;
  std::string requester; // nick, or empty for local use
  bool raw_mode; // skip escaping & truncation; never set from chat
  bool string_mode; // literal "\n" become newlines; false for code read from a file
  bool use_blacklist;
  long timeout; // us; 0 = kSandboxTimeout

  EvaluationRequest() :
      raw_mode(false),
      string_mode(true),
      use_blacklist(false),
      timeout(0) {}
  explicit EvaluationRequest(const std::string& code, const std::string& nick = "") :
      EvaluationRequest() {
    source_code = code;
    requester = nick;
  }
};

class EvaluationResult {
 public:
  std::string stdout_text;
  ExitStatus exit_status;
  bool truncated; // capture limit was hit
  int exit_code; // valid if the sandbox exited normally
  int signal; // valid if the sandbox was killed by a signal
  std::string parsed_source; // what was sent to the interpreter

  EvaluationResult() :
      exit_status(ExitStatus::CRASHED),
      truncated(false),
      exit_code(0),
      signal(0) {}
};

// Let the user write "\n" for newlines and "\\n" for an escaped newline;
// "?(" is a shortcut for "print(". Multi-line code always ends with a newline.
std::string ParseInput(const std::string& code, bool string_mode);

// stdout if there is any; otherwise the last meaningful stderr line
std::string PickOutput(const std::string& out, const std::string& err);

// Reject empty / whitespace-only input, and blacklisted input if request.use_blacklist.
// Returns the message for the requester, or nullopt if the request may run.
std::optional<std::string> CheckRequest(const EvaluationRequest&, const Blacklist&);

std::vector<std::string> SandboxCommand(long timeout);
bool SandboxAvailable();

// Run the request in the external sandbox. Never throws; crashes and timeouts
// are reported through EvaluationResult::exit_status.
EvaluationResult Execute(const EvaluationRequest&);

#endif  // INCLUDE_PYVAL_EXEC_H_
