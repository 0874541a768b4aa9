#ifndef INCLUDE_PYVAL_PATHS_H_
#define INCLUDE_PYVAL_PATHS_H_

#include <string>
#include <filesystem>

namespace fs = std::filesystem;

// external sandbox runtime; empty if not found
extern fs::path kSandboxExe;
// handed to the sandbox as --tmp; holds the interpreter-side script
extern fs::path kSandboxDir;
// script path as seen from inside the sandbox
extern std::string kSandboxScript;

// sqlite database for admins / bans
extern fs::path kStateDir;
extern fs::path kPidFile;
extern fs::path kHelpFile;

namespace internal {

// does not meant to be publicly used; only for testing
extern fs::path kDataDir;

} // internal

// Search $PATH plus the usual per-user bin directories; empty path if not found.
// Names containing a slash are only checked for existence.
fs::path FindExecutable(const std::string& name);

fs::path DefaultSandboxDir();
fs::path DefaultHelpFile();
fs::path DatabasePath();

#endif  // INCLUDE_PYVAL_PATHS_H_
