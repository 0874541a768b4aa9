#ifndef PYVAL_PROCESS_H_
#define PYVAL_PROCESS_H_

#include <string>
#include <vector>

class ProcessOptions {
 public:
  std::vector<std::string> command; // argv; command[0] is looked up in $PATH
  std::string input; // becomes stdin
  long wall_time; // us; 0 = no limit
  size_t max_output; // bytes kept per stream

  ProcessOptions() : wall_time(0), max_output(1 << 20) {}
};

struct ProcessResult {
  std::string out;
  std::string err;
  int status; // from waitpid
  int error; // errno when spawning failed
  bool spawn_failed;
  bool timed_out;
  bool output_truncated;
  long elapsed; // us
};

// Run a command in its own process group. On timeout the whole group is
// killed with SIGKILL and reaped before returning.
ProcessResult RunProcess(const ProcessOptions&);

#endif  // PYVAL_PROCESS_H_
