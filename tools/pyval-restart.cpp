#include <signal.h>
#include <string.h>
#include <unistd.h>
#include <thread>
#include <chrono>
#include <fstream>
#include <iostream>
#include <filesystem>
#include <vector>

// Stop the running bot (found by its pid file) and start a new one with the
// given arguments.
//   pyval-restart [-f pidfile] [bot arguments...]

namespace fs = std::filesystem;

static bool Alive(pid_t pid) {
  return kill(pid, 0) == 0 || errno == EPERM;
}

int main(int argc, char** argv) {
  fs::path pid_file = "pyval_pid";
  int first = 1;
  if (argc > 2 && std::string("-f") == argv[1]) {
    pid_file = argv[2];
    first = 3;
  }

  std::ifstream fin(pid_file);
  long pid = 0;
  if (!fin || !(fin >> pid) || pid <= 0) {
    std::cerr << "No running bot found (pid file " << pid_file << " is missing or empty)." << std::endl;
    return 1;
  }
  if (!Alive(pid)) {
    std::cerr << "Process " << pid << " is not running." << std::endl;
    return 1;
  }
  if (kill(pid, SIGINT) < 0) {
    std::cerr << "Unable to signal process " << pid << ": " << strerror(errno) << std::endl;
    return 1;
  }
  std::cout << "Waiting for process " << pid << " to quit..." << std::endl;
  for (int i = 0; i < 100 && Alive(pid); i++) {
    std::this_thread::sleep_for(std::chrono::milliseconds(100));
  }
  if (Alive(pid)) {
    std::cerr << "Process " << pid << " did not quit in time." << std::endl;
    return 1;
  }

  std::string bot;
  if (const char* env = getenv("PYVAL_BOT")) {
    bot = env;
  } else {
    std::error_code ec;
    fs::path self = fs::read_symlink("/proc/self/exe", ec);
    bot = ec ? "pyval-bot" : (self.parent_path() / "pyval-bot").string();
  }
  std::vector<char*> args{bot.data()};
  for (int i = first; i < argc; i++) args.push_back(argv[i]);
  args.push_back(nullptr);
  execvp(args[0], args.data());
  std::cerr << "Unable to start " << bot << ": " << strerror(errno) << std::endl;
  return 1;
}
