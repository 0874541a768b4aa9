#include <fcntl.h>
#include <string.h>
#include <signal.h>
#include <unistd.h>
#include <fstream>
#include <iostream>
#include <filesystem>

#include <tortellini.hh>
#include <fmt/ranges.h>
#include <spdlog/spdlog.h>
#include <argparse/argparse.hpp>
#include <pyval/exec.h>
#include <pyval/paths.h>
#include <pyval/paste.h>
#include "pyval/utils.h"
#include <pyval/logger.h>
#include "bot.h"
#include "paste_http.h"

namespace {

BotOptions options;
std::string nickname = "pyval";
std::string command_char = "!";
std::string sandbox_name = "pypy-sandbox";
std::string paste_command = "pastebinit";
std::string paste_args = "-a {author} -t {title} -f {language}";
std::string paste_url;
std::string blacklist_file;
std::string log_file;
std::vector<std::string> default_admins;
bool use_blacklist = true;
bool limit_rate = true;
bool monitor = false;
bool monitor_data = false;
bool dump_config = false;

bool ParseConfig(const fs::path& conf_path) {
  std::ifstream fin(conf_path);
  if (!fin) return false;
  tortellini::ini ini;
  fin >> ini;
  options.server = ini[""]["server"] | options.server;
  options.port = ini[""]["port"] | options.port;
  nickname = ini[""]["nick"] | nickname;
  options.username = ini[""]["username"] | options.username;
  options.server_password = ini[""]["server_password"] | options.server_password;
  options.nickserv_password = ini[""]["nickserv_password"] | options.nickserv_password;
  std::string channels = ini[""]["channels"] | "";
  if (channels.size()) options.channels = ParseCommaArgs(channels);
  command_char = ini[""]["commandchar"] | command_char;

  sandbox_name = ini[""]["sandbox"] | sandbox_name;
  std::string sandbox_dir = ini[""]["sandbox_dir"] | "";
  if (sandbox_dir.size()) kSandboxDir = sandbox_dir;
  kSandboxScript = ini[""]["sandbox_script"] | kSandboxScript;
  kSandboxTimeout = (ini[""]["timeout"] | (kSandboxTimeout / 1'000'000)) * 1'000'000;

  paste_command = ini[""]["paste_command"] | paste_command;
  paste_args = ini[""]["paste_args"] | paste_args;
  paste_url = ini[""]["paste_url"] | paste_url;
  std::string help_file = ini[""]["help_file"] | "";
  if (help_file.size()) kHelpFile = help_file;
  blacklist_file = ini[""]["blacklist_file"] | blacklist_file;
  std::string state_dir = ini[""]["state_dir"] | "";
  if (state_dir.size()) kStateDir = state_dir;
  std::string pid_file = ini[""]["pid_file"] | "";
  if (pid_file.size()) kPidFile = pid_file;
  log_file = ini[""]["log_file"] | log_file;

  std::string admins = ini[""]["admins"] | "";
  if (admins.size()) default_admins = ParseCommaArgs(admins);
  use_blacklist = ini[""]["blacklist"] | use_blacklist;
  limit_rate = ini[""]["limit_rate"] | limit_rate;
  monitor = ini[""]["monitor"] | monitor;
  monitor_data = ini[""]["monitor_data"] | monitor_data;
  options.no_heartbeat = ini[""]["no_heartbeat"] | options.no_heartbeat;
  return true;
}

std::string Prompt(const char* prompt) {
  const char* pw = getpass(prompt);
  return pw ? pw : "";
}

void ParseArgs(int argc, char** argv) {
  int verbosity = 0;
  argparse::ArgumentParser parser(argc ? argv[0] : "pyval-bot", kVersionString,
                                  argparse::default_arguments::help);
  parser.add_argument("-f", "--config")
    .help("Path of configuration file (default: /etc/pyval.conf)");
  parser.add_argument("-v", "--verbose")
    .action([&](const auto &) { ++verbosity; })
    .append().default_value(false).implicit_value(true).nargs(0)
    .help("Verbose level");
  parser.add_argument("-s", "--server")
    .help("Server to connect to");
  parser.add_argument("-p", "--port")
    .help("Port to connect to");
  parser.add_argument("-n", "--nick")
    .help("Nickname for the bot");
  parser.add_argument("-U", "--username")
    .help("User name sent to the server");
  parser.add_argument("-c", "--channels")
    .help("Comma-separated list of channels to join");
  parser.add_argument("-C", "--commandchar")
    .help("Character that starts a command");
  parser.add_argument("-l", "--logfile")
    .help("Log to this file as well");
  parser.add_argument("-m", "--monitor")
    .default_value(false).implicit_value(true)
    .help("Log all chat messages");
  parser.add_argument("-d", "--data")
    .default_value(false).implicit_value(true)
    .help("Log all raw lines sent and received");
  parser.add_argument("-b", "--noheartbeat")
    .default_value(false).implicit_value(true)
    .help("Do not send periodic PINGs");
  parser.add_argument("-P", "--password")
    .default_value(false).implicit_value(true)
    .help("Prompt for the NickServ password");
  parser.add_argument("-L", "--loginpw")
    .default_value(false).implicit_value(true)
    .help("Prompt for the server password (user:password is accepted)");
  parser.add_argument("-D", "--dumpconfig")
    .default_value(false).implicit_value(true)
    .help("Print the configuration and exit");
  parser.add_argument("--version")
    .default_value(false).implicit_value(true).nargs(0)
    .help("Print version and exit");

  try {
    parser.parse_args(argc, argv);
  } catch (const std::runtime_error& err) {
    std::cerr << err.what() << std::endl;
    std::cerr << parser;
    exit(1);
  }
  if (parser.get<bool>("--version")) {
    std::cout << "PyVal " << kVersionString << std::endl;
    exit(0);
  }

  switch (verbosity) {
    case 0: spdlog::set_level(spdlog::level::warn); break;
    case 1: spdlog::set_level(spdlog::level::info); break;
    default: spdlog::set_level(spdlog::level::debug); break;
  }
  if (auto val = parser.present("--config")) {
    if (!ParseConfig(val.value())) {
      spdlog::error("Failed to parse configuration file {}", val.value());
      exit(1);
    }
  } else if (!ParseConfig("/etc/pyval.conf")) {
    spdlog::info("No configuration file, using defaults");
  }

  if (auto val = parser.present("--server")) options.server = val.value();
  if (auto val = parser.present("--port")) options.port = val.value();
  if (auto val = parser.present("--nick")) nickname = val.value();
  if (auto val = parser.present("--username")) options.username = val.value();
  if (auto val = parser.present("--channels")) options.channels = ParseCommaArgs(val.value());
  if (auto val = parser.present("--commandchar")) command_char = val.value();
  if (auto val = parser.present("--logfile")) log_file = val.value();
  if (parser.get<bool>("--monitor")) monitor = true;
  if (parser.get<bool>("--data")) monitor_data = true;
  if (parser.get<bool>("--noheartbeat")) options.no_heartbeat = true;
  dump_config = parser.get<bool>("--dumpconfig");
  if (parser.get<bool>("--password")) options.nickserv_password = Prompt("NickServ password: ");
  if (parser.get<bool>("--loginpw")) options.server_password = Prompt("Server password: ");

  if (command_char.size() != 1) {
    spdlog::error("Command character must be a single character: {}", command_char);
    exit(1);
  }
  if (options.channels.empty()) options.channels.push_back("##" + nickname);
  for (auto& chan : options.channels) {
    if (chan[0] != '#') chan = "#" + chan;
  }
  if (kSandboxDir.empty()) kSandboxDir = DefaultSandboxDir();
  if (kHelpFile.empty()) kHelpFile = DefaultHelpFile();
}

void DumpConfig() {
  auto masked = [](const std::string& str) { return str.empty() ? "" : "********"; };
  fmt::print("server            : {}\n", options.server);
  fmt::print("port              : {}\n", options.port);
  fmt::print("nick              : {}\n", nickname);
  fmt::print("username          : {}\n", options.username);
  fmt::print("channels          : {}\n", fmt::join(options.channels, ","));
  fmt::print("commandchar       : {}\n", command_char);
  fmt::print("sandbox           : {}\n", sandbox_name);
  fmt::print("sandbox_dir       : {}\n", kSandboxDir.string());
  fmt::print("sandbox_script    : {}\n", kSandboxScript);
  fmt::print("timeout           : {}\n", kSandboxTimeout / 1'000'000);
  fmt::print("paste_command     : {}\n", paste_command);
  fmt::print("paste_args        : {}\n", paste_args);
  fmt::print("paste_url         : {}\n", paste_url);
  fmt::print("help_file         : {}\n", kHelpFile.string());
  fmt::print("blacklist_file    : {}\n", blacklist_file);
  fmt::print("state_dir         : {}\n", kStateDir.string());
  fmt::print("pid_file          : {}\n", kPidFile.string());
  fmt::print("log_file          : {}\n", log_file);
  fmt::print("admins            : {}\n", fmt::join(default_admins, ","));
  fmt::print("blacklist         : {}\n", use_blacklist);
  fmt::print("limit_rate        : {}\n", limit_rate);
  fmt::print("monitor           : {}\n", monitor);
  fmt::print("monitor_data      : {}\n", monitor_data);
  fmt::print("no_heartbeat      : {}\n", options.no_heartbeat);
  fmt::print("nickserv_password : {}\n", masked(options.nickserv_password));
  fmt::print("server_password   : {}\n", masked(options.server_password));
}

// Holds the lock for the lifetime of the process
bool LockPidFile() {
  int fd = open(kPidFile.c_str(), O_RDWR | O_CREAT, 0644);
  if (fd < 0) return false;
  struct flock lock{};
  lock.l_type = F_WRLCK;
  lock.l_whence = SEEK_SET;
  lock.l_start = lock.l_len = 0;
  if (fcntl(fd, F_SETLK, &lock) < 0) return false;
  std::string pid = std::to_string(getpid()) + "\n";
  if (ftruncate(fd, 0) < 0 || write(fd, pid.data(), pid.size()) < 0) {
    spdlog::warn("Unable to write pid file {}: {}", kPidFile.c_str(), strerror(errno));
  }
  return true;
}

std::unique_ptr<PasteUploader> MakeUploader() {
  if (paste_url.size()) {
    auto ret = std::make_unique<HttpPasteUploader>(paste_url);
    if (ret->IsValid()) {
      spdlog::info("Uploading pastes to {}", paste_url);
      return ret;
    }
    spdlog::error("Invalid paste url: {}", paste_url);
    return nullptr;
  }
  fs::path exe = FindExecutable(paste_command);
  if (exe.empty()) {
    spdlog::error("Paste command not found: {}; long results will not be uploaded", paste_command);
    return nullptr;
  }
  std::vector<std::string> command{exe.string()};
  for (auto& i : SplitString(paste_args, ' ')) {
    if (i.size()) command.push_back(i);
  }
  spdlog::info("Uploading pastes with {}", fmt::format("{}", command));
  return std::make_unique<CommandPasteUploader>(std::move(command));
}

} // namespace

int main(int argc, char** argv) {
  spdlog::set_pattern("[%t] %+");
  InitLogger();
  ParseArgs(argc, argv);
  if (dump_config) {
    DumpConfig();
    return 0;
  }
  if (log_file.size() && !LogToFile(log_file)) return 1;
  if (!LockPidFile()) {
    spdlog::error("Another bot instance is running.");
    return 1;
  }
  signal(SIGPIPE, SIG_IGN);

  kSandboxExe = FindExecutable(sandbox_name);
  if (kSandboxExe.empty()) {
    spdlog::error("Sandbox executable not found: {}; evaluation is disabled", sandbox_name);
  }
  std::unique_ptr<PasteUploader> uploader = MakeUploader();
  if (!CreateDirs(kStateDir)) return 1;

  Database db;
  BotState state(db, nickname, command_char[0], default_admins);
  state.blacklist.SetEnabled(use_blacklist);
  if (blacklist_file.size()) state.blacklist.LoadFile(blacklist_file);
  state.limit_rate = limit_rate;
  state.monitor = monitor;
  state.monitor_data = monitor_data;
  state.LoadHelp(kHelpFile);

  boost::asio::io_context io;
  PyvalClient client(io, options, state, uploader.get());
  boost::asio::signal_set signals(io, SIGINT, SIGTERM);
  signals.async_wait([&client](const boost::system::error_code& ec, int sig) {
    if (ec) return;
    spdlog::warn("Caught signal {}, quitting", sig);
    client.Quit("shutting down...");
  });
  client.Connect();
  io.run();

  // workers use client and state; let them finish first
  if (int running = state.handling_count; running > 0) {
    spdlog::info("Waiting for {} running commands", running);
  }
  state.WaitIdle();
  spdlog::info("Handled {} commands", state.handled.load());
}
