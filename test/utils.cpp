#include "utils.h"

#include <fstream>
#include <pyval/exec.h>

fs::path WriteScript(const std::string& name, const std::string& body) {
  fs::path path = kStateDir / name;
  {
    std::ofstream fout(path);
    fout << "#!/bin/sh\n" << body << '\n';
  }
  fs::permissions(path, fs::perms::owner_all, fs::perm_options::replace);
  return path;
}

fs::path EchoSandbox() {
  return WriteScript("echo_sandbox.sh", R"(exec sed -n "s/^print('\(.*\)')\$/\1/p")");
}

fs::path CrashSandbox() {
  return WriteScript("crash_sandbox.sh", "cat >/dev/null\nkill -SEGV $$");
}

fs::path SlowSandbox() {
  return WriteScript("slow_sandbox.sh", "exec sleep 30");
}

fs::path MarkerSandbox(const fs::path& marker) {
  return WriteScript("marker_sandbox.sh", "touch '" + marker.string() + "'\ncat >/dev/null\necho ran");
}

void UseSandbox(const fs::path& exe) {
  kSandboxExe = exe;
  kSandboxDir.clear();
  kSandboxScript.clear();
}

SandboxSettings::SandboxSettings() :
    exe_(kSandboxExe), dir_(kSandboxDir), script_(kSandboxScript), timeout_(kSandboxTimeout) {}

SandboxSettings::~SandboxSettings() {
  kSandboxExe = exe_;
  kSandboxDir = dir_;
  kSandboxScript = script_;
  kSandboxTimeout = timeout_;
}
