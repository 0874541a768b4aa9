#include <unistd.h>
#include <fstream>
#include <sstream>
#include <iostream>

#include <fmt/core.h>
#include <spdlog/spdlog.h>
#include <argparse/argparse.hpp>
#include <pyval/exec.h>
#include <pyval/paths.h>
#include <pyval/utils.h>
#include <pyval/output.h>
#include <pyval/logger.h>
#include <pyval/blacklist.h>

namespace {

enum ExitCode {
  kExitSuccess = 0,
  kExitRejected = 1,
  kExitCrashed = 2,
  kExitTimedOut = 3,
  kExitNoSandbox = 4,
};

bool quiet = false;
bool raw_output = false;
bool print_blacklist = false;
EvaluationRequest request;

void PrintBlacklist(const Blacklist& blacklist) {
  for (auto& [str, entry] : blacklist.Entries()) {
    fmt::print("{:>16} : {}{}\n", str, entry.message, entry.active ? "" : " (inactive)");
  }
}

// CODE may name a file; its content is used unmodified
bool LoadCode(const std::string& arg) {
  std::error_code ec;
  if (arg.size() < 256 && fs::is_regular_file(arg, ec)) {
    std::ifstream fin(arg);
    if (!fin) {
      spdlog::error("Unable to read {}", arg);
      return false;
    }
    std::stringstream ss;
    ss << fin.rdbuf();
    request.source_code = ss.str();
    request.string_mode = false;
    spdlog::debug("Loaded code from {}", arg);
  } else {
    request.source_code = arg;
  }
  return true;
}

int ParseArgs(int argc, char** argv) {
  argparse::ArgumentParser parser(argc ? argv[0] : "pyval-exec", kVersionString,
                                  argparse::default_arguments::help);
  parser.add_argument("-b", "--blacklist")
    .default_value(false).implicit_value(true)
    .help("Use the blacklist");
  parser.add_argument("-d", "--debug")
    .default_value(false).implicit_value(true)
    .help("Print debug info");
  parser.add_argument("-p", "--printblacklist")
    .default_value(false).implicit_value(true)
    .help("Print the blacklist and exit");
  parser.add_argument("-q", "--quiet")
    .default_value(false).implicit_value(true)
    .help("Only print the output");
  parser.add_argument("-r", "--raw")
    .default_value(false).implicit_value(true)
    .help("Print raw output, no escaping or truncation");
  parser.add_argument("-t", "--timeout")
    .scan<'d', int>()
    .help("Timeout in seconds (default: 5)");
  parser.add_argument("--sandbox")
    .help("Path of the sandbox executable");
  parser.add_argument("--version")
    .default_value(false).implicit_value(true).nargs(0)
    .help("Print version and exit");
  parser.add_argument("code")
    .remaining()
    .help("Code to evaluate, or a file containing it (stdin if omitted)");

  try {
    parser.parse_args(argc, argv);
  } catch (const std::runtime_error& err) {
    std::cerr << err.what() << std::endl;
    std::cerr << parser;
    return kExitRejected;
  }
  if (parser.get<bool>("--version")) {
    fmt::print("pyval-exec {}\n", kVersionString);
    exit(kExitSuccess);
  }
  spdlog::set_level(parser.get<bool>("--debug") ? spdlog::level::debug : spdlog::level::warn);
  quiet = parser.get<bool>("--quiet");
  raw_output = parser.get<bool>("--raw");
  print_blacklist = parser.get<bool>("--printblacklist");
  request.raw_mode = raw_output;
  request.use_blacklist = parser.get<bool>("--blacklist");
  if (auto val = parser.present<int>("--timeout")) {
    if (val.value() <= 0) {
      std::cerr << "timeout must be positive" << std::endl;
      return kExitRejected;
    }
    request.timeout = val.value() * 1'000'000L;
  }
  if (auto val = parser.present("--sandbox")) {
    kSandboxExe = FindExecutable(val.value());
    if (kSandboxExe.empty()) kSandboxExe = val.value();
  } else {
    kSandboxExe = FindExecutable("pypy-sandbox");
  }
  kSandboxDir = DefaultSandboxDir();
  if (print_blacklist) return kExitSuccess;

  if (auto val = parser.present<std::vector<std::string>>("code")) {
    std::string code;
    for (auto& i : val.value()) code += (code.size() ? " " : "") + i;
    if (!LoadCode(code)) return kExitRejected;
  } else {
    std::stringstream ss;
    ss << std::cin.rdbuf();
    request.source_code = ss.str();
  }
  return kExitSuccess;
}

} // namespace

int main(int argc, char** argv) {
  spdlog::set_pattern("[%t] %+");
  InitLogger();
  if (int ret = ParseArgs(argc, argv); ret != kExitSuccess) return ret;

  Blacklist blacklist(true);
  if (print_blacklist) {
    PrintBlacklist(blacklist);
    return kExitSuccess;
  }
  if (auto msg = CheckRequest(request, blacklist)) {
    std::cerr << msg.value() << std::endl;
    return kExitRejected;
  }
  if (!SandboxAvailable()) {
    std::cerr << "sandbox executable not found: "
              << (kSandboxExe.empty() ? "pypy-sandbox" : kSandboxExe.string()) << std::endl;
    return kExitNoSandbox;
  }

  EvaluationResult res = Execute(request);
  SafeText out = SafeOutput(res, kDefaultOutputLimits, raw_output);
  if (!quiet) {
    fmt::print("Input:\n  {}\n", Trim(res.parsed_source, "\n"));
    fmt::print("Status: {}{}\n", ExitStatusName(res.exit_status),
               out.truncated ? " (truncated)" : "");
    fmt::print("Output:\n  ");
  }
  fmt::print("{}\n", out.text);
  switch (res.exit_status) {
    case ExitStatus::SUCCESS: return kExitSuccess;
    case ExitStatus::CRASHED: return kExitCrashed;
    case ExitStatus::TIMED_OUT: return kExitTimedOut;
  }
  __builtin_unreachable();
}
