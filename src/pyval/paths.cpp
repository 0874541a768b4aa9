#include <pyval/paths.h>

#include <cstdlib>
#include <unistd.h>

#include "utils.h"

fs::path kSandboxExe;
fs::path kSandboxDir;
std::string kSandboxScript = "/tmp/pyval_sandbox.py";

fs::path kStateDir = ".";
fs::path kPidFile = "pyval_pid";
fs::path kHelpFile;

namespace internal {
fs::path kDataDir = fs::path(PYVAL_DATA_DIR);
} // internal

namespace {

bool IsExecutable(const fs::path& path) {
  std::error_code ec;
  return fs::is_regular_file(path, ec) && access(path.c_str(), X_OK) == 0;
}

} // namespace

fs::path FindExecutable(const std::string& name) {
  if (name.empty()) return fs::path();
  if (name.find('/') != std::string::npos) {
    return IsExecutable(name) ? fs::path(name) : fs::path();
  }
  std::vector<fs::path> dirs;
  if (const char* env_path = getenv("PATH")) {
    for (auto& i : SplitString(env_path, ':')) {
      if (i.size()) dirs.emplace_back(i);
    }
  }
  if (const char* home = getenv("HOME")) {
    fs::path home_dir = home;
    dirs.push_back(home_dir / "bin");
    dirs.push_back(home_dir / ".local" / "bin");
    dirs.push_back(home_dir / "local" / "bin");
  }
  dirs.emplace_back("/usr/bin");
  dirs.emplace_back("/usr/local/bin");
  for (auto& dir : dirs) {
    fs::path candidate = dir / name;
    if (IsExecutable(candidate)) return candidate;
  }
  return fs::path();
}

fs::path DefaultSandboxDir() {
  return internal::kDataDir / "sandbox";
}

fs::path DefaultHelpFile() {
  return internal::kDataDir / "pyval_help.json";
}

fs::path DatabasePath() {
  return kStateDir / "pyval.sqlite";
}
