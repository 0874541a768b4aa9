#include "commands.h"

#include <ctime>
#include <algorithm>

#include <fmt/ranges.h>
#include <spdlog/spdlog.h>
#include <pyval/exec.h>
#include <pyval/utils.h>

namespace {

inline std::string ToLower(std::string str) {
  std::transform(str.begin(), str.end(), str.begin(), ::tolower);
  return str;
}

inline std::vector<std::string> SplitWords(const std::string& str) {
  std::vector<std::string> ret;
  for (auto& i : SplitString(str, ' ')) {
    std::string word = Trim(i);
    if (word.size()) ret.push_back(std::move(word));
  }
  return ret;
}

// "on", "off", "-" (toggle), "?" or nothing (show)
std::optional<bool> ParseToggle(const std::string& rest, bool current) {
  if (rest.empty() || rest == "?") return current;
  if (rest == "-") return !current;
  if (ParseTrue(rest)) return true;
  if (ParseFalse(rest)) return false;
  return std::nullopt;
}

inline const char* BoolName(bool val) {
  return val ? "True" : "False";
}

} // namespace

const std::map<std::string, CommandHandler::Func> CommandHandler::kUserCommands = {
  {"help", &CommandHandler::CmdHelp},
  {"py", &CommandHandler::CmdPython},
  {"python", &CommandHandler::CmdPython},
  {"pyval", &CommandHandler::CmdPyval},
  {"time", &CommandHandler::CmdTime},
  {"uptime", &CommandHandler::CmdUptime},
  {"version", &CommandHandler::CmdVersion},
};

const std::map<std::string, CommandHandler::Func> CommandHandler::kAdminCommands = {
  {"adminadd", &CommandHandler::AdminAdminAdd},
  {"adminhelp", &CommandHandler::AdminAdminHelp},
  {"adminlist", &CommandHandler::AdminAdminList},
  {"adminreload", &CommandHandler::AdminAdminReload},
  {"adminrem", &CommandHandler::AdminAdminRemove},
  {"adminremove", &CommandHandler::AdminAdminRemove},
  {"ban", &CommandHandler::AdminBan},
  {"banned", &CommandHandler::AdminBanned},
  {"banwarns", &CommandHandler::AdminBanWarns},
  {"blacklist", &CommandHandler::AdminBlacklist},
  {"channels", &CommandHandler::AdminChannels},
  {"id", &CommandHandler::AdminIdentify},
  {"identify", &CommandHandler::AdminIdentify},
  {"join", &CommandHandler::AdminJoin},
  {"limitrate", &CommandHandler::AdminLimitRate},
  {"me", &CommandHandler::AdminMe},
  {"msg", &CommandHandler::AdminMsg},
  {"part", &CommandHandler::AdminPart},
  {"partall", &CommandHandler::AdminPartAll},
  {"say", &CommandHandler::AdminSay},
  {"sendline", &CommandHandler::AdminSendLine},
  {"shutdown", &CommandHandler::AdminShutdown},
  {"stats", &CommandHandler::AdminStats},
  {"unban", &CommandHandler::AdminUnban},
};

CommandHandler::CommandHandler(BotState& state, ChatTransport& transport, PasteUploader* uploader) :
    state_(state), transport_(transport), uploader_(uploader) {}

CommandHandler::Func CommandHandler::Find_(const std::string& name, const std::string& nick) const {
  if (state_.IsAdmin(nick)) {
    if (auto it = kAdminCommands.find(name); it != kAdminCommands.end()) return it->second;
  }
  if (auto it = kUserCommands.find(name); it != kUserCommands.end()) return it->second;
  return nullptr;
}

std::pair<std::string, std::string> CommandHandler::Split_(const std::string& message) const {
  // exactly one command character; "!!py" is not a command
  if (message.empty() || message[0] != state_.command_char) return {"", ""};
  size_t space = message.find(' ', 1);
  if (space == std::string::npos) return {message.substr(1), ""};
  return {message.substr(1, space - 1), Trim(message.substr(space + 1))};
}

std::string CommandHandler::Channel_(const std::string& name) const {
  if (name.size() && name[0] == '#') return name;
  return "#" + name;
}

std::string CommandHandler::Usage_(const std::string& cmd, const std::string& args) const {
  return fmt::format("usage: {}{} {}", state_.command_char, cmd, args);
}

std::optional<PendingCommand> CommandHandler::Accept(
    const std::string& nick, const std::string& channel, const std::string& message) {
  std::string msg = Trim(message);
  if (state_.IsBanned(nick)) return std::nullopt;
  if (msg.empty() || msg[0] != state_.command_char) return std::nullopt;

  PendingCommand cmd;
  cmd.nick = nick;
  if (channel == state_.Nickname()) {
    cmd.target = nick;
  } else {
    cmd.target = channel;
    cmd.prefix = nick;
  }
  if (auto flood = state_.CheckFlood(nick, msg)) {
    if (flood->empty()) return std::nullopt;
    spdlog::info("Flood warning for {}: {}", nick, *flood);
    cmd.notice = std::move(*flood);
  } else {
    std::tie(cmd.name, cmd.rest) = Split_(msg);
    if (!Find_(cmd.name, nick)) return std::nullopt;
    state_.MarkHandled(nick, msg);
  }
  if (state_.limit_rate && !state_.IsAdmin(nick) &&
      state_.handling_count > state_.banwarn_limit) {
    spdlog::info("Too busy, ignoring command: {}", msg);
    return std::nullopt;
  }
  state_.handling_count++;
  return cmd;
}

CommandHandler::Reply CommandHandler::Run(const PendingCommand& cmd) {
  if (cmd.notice) return cmd.notice;
  Func func = Find_(cmd.name, cmd.nick);
  if (!func) return std::nullopt;
  spdlog::debug("Running {} for {}: {}", cmd.name, cmd.nick, cmd.rest);
  try {
    return (this->*func)(cmd.rest, cmd.nick);
  } catch (const std::exception& err) {
    spdlog::warn("Error while handling {} from {}: {}", cmd.name, cmd.nick, err.what());
    return fmt::format("PyVal Error: {}", err.what());
  }
}

void CommandHandler::Deliver(const PendingCommand& cmd, const std::string& reply) {
  if (reply.empty()) return;
  transport_.SendMessage(cmd.target, cmd.prefix.size() ? cmd.prefix + ", " + reply : reply);
}

void CommandHandler::Release() {
  state_.FinishHandling();
}

CommandHandler::Reply CommandHandler::Handle(const std::string& nick, const std::string& message) {
  std::string msg = Trim(message);
  if (msg.empty() || msg[0] != state_.command_char) return std::nullopt;
  PendingCommand cmd;
  cmd.nick = cmd.target = nick;
  std::tie(cmd.name, cmd.rest) = Split_(msg);
  return Run(cmd);
}

std::vector<std::string> CommandHandler::GetCommands(const std::string& role,
                                                     const std::string& nick) const {
  std::vector<std::string> ret;
  if (role == "user") {
    if (nick.size() && state_.IsAdmin(nick)) ret.push_back("adminhelp");
    for (auto& i : {"help", "py", "python", "pyval", "time", "uptime", "version"}) {
      ret.push_back(i);
    }
  } else {
    for (auto& [name, func] : kAdminCommands) ret.push_back(name);
  }
  return ret;
}

std::string CommandHandler::GetHelp(const std::string& role, const std::string& cmdname,
                                    const std::string& nick) const {
  const nlohmann::json& help = state_.Help();
  if (!help.is_object() || !help.contains(role)) return "help isn't available right now.";

  // accepts "cmd", "help cmd", "help(cmd)" and "help('cmd')"
  std::string name = cmdname;
  for (char c : {'(', ')', '\'', '"'}) std::replace(name.begin(), name.end(), c, ' ');
  std::vector<std::string> words = SplitWords(ToLower(name));
  if (words.size() > 1 && words[0] == "help") words.erase(words.begin());
  if (words.size() == 1 && words[0] == "help" && cmdname.find('(') != std::string::npos) {
    words.clear();
  }
  name = fmt::format("{}", fmt::join(words, " "));

  if (name.empty()) {
    return fmt::format("{} commands: {}", role, fmt::join(GetCommands(role, nick), ", "));
  }
  const nlohmann::json& section = help[role];
  if (!section.contains(name)) return fmt::format("no {} command named: {}", role, name);
  const nlohmann::json& entry = section[name];
  // "args" is null for commands without arguments
  auto field = [&entry](const char* key) -> std::string {
    return entry.contains(key) && entry[key].is_string() ? entry[key].get<std::string>() : "";
  };
  std::string args = field("args"), desc = field("desc");
  if (args.size()) return fmt::format("{}{} {}: {}", state_.command_char, name, args, desc);
  return fmt::format("{}{}: {}", state_.command_char, name, desc);
}

CommandHandler::Reply CommandHandler::CmdHelp(const std::string& rest, const std::string& nick) {
  return GetHelp("user", rest, nick);
}

CommandHandler::Reply CommandHandler::CmdPython(const std::string& rest, const std::string& nick) {
  if (Trim(rest).empty()) return std::nullopt;
  if (ToLower(rest).rfind("help", 0) == 0) return GetHelp("user", rest, nick);
  if (!SandboxAvailable()) return "evaluation is unavailable right now.";

  EvaluationRequest req(rest, nick);
  req.use_blacklist = state_.blacklist.Enabled();
  if (auto msg = CheckRequest(req, state_.blacklist)) {
    spdlog::info("Rejected code from {}: {}", nick, *msg);
    return msg;
  }
  EvaluationResult res = Execute(req);
  ChatReply reply = RenderReply(req, res, uploader_, reply_limits_);
  spdlog::info("Evaluated for {}: {}{}", nick, ExitStatusName(res.exit_status),
               reply.truncated ? " (truncated)" : "");
  return reply.text;
}

CommandHandler::Reply CommandHandler::CmdPyval(const std::string& rest, const std::string& nick) {
  if (Trim(rest).size()) {
    spdlog::info("Message from {}: {}", nick, rest);
    return std::nullopt;
  }
  char cc = state_.command_char;
  return fmt::format("try {0}help, {0}py help, or {0}help py", cc);
}

CommandHandler::Reply CommandHandler::CmdTime(const std::string&, const std::string&) {
  return HumanTime(std::time(nullptr));
}

CommandHandler::Reply CommandHandler::CmdUptime(const std::string&, const std::string&) {
  return fmt::format("start: {}, up: {}", HumanTime(state_.start_time), TimeFromSecs(state_.Uptime()));
}

CommandHandler::Reply CommandHandler::CmdVersion(const std::string&, const std::string&) {
  return fmt::format("PyVal: {}, Compiler: {}", kVersionString, __VERSION__);
}

CommandHandler::Reply CommandHandler::AdminAdminAdd(const std::string& rest, const std::string&) {
  if (rest.empty()) return Usage_("adminadd", "<nick>");
  return state_.AdminsAdd(rest);
}

CommandHandler::Reply CommandHandler::AdminAdminHelp(const std::string& rest, const std::string&) {
  return GetHelp("admin", rest, "");
}

CommandHandler::Reply CommandHandler::AdminAdminList(const std::string&, const std::string&) {
  return fmt::format("admins: {}", fmt::join(state_.Admins(), ", "));
}

CommandHandler::Reply CommandHandler::AdminAdminReload(const std::string&, const std::string&) {
  state_.AdminsReload();
  return "admins loaded.";
}

CommandHandler::Reply CommandHandler::AdminAdminRemove(const std::string& rest, const std::string&) {
  if (rest.empty()) return Usage_("adminremove", "<nick>");
  return state_.AdminsRemove(rest);
}

CommandHandler::Reply CommandHandler::AdminBan(const std::string& rest, const std::string&) {
  std::vector<std::string> nicks = SplitWords(rest);
  if (nicks.empty()) return Usage_("ban", "<nick>");
  std::vector<std::string> already, failed;
  for (auto& i : nicks) {
    if (state_.IsBanned(i)) already.push_back(i);
  }
  std::vector<std::string> banned = state_.BanAdd(nicks);
  for (auto& i : nicks) {
    if (std::find(banned.begin(), banned.end(), i) == banned.end() &&
        std::find(already.begin(), already.end(), i) == already.end()) {
      failed.push_back(i);
    }
  }
  std::vector<std::string> msg;
  if (banned.size()) msg.push_back(fmt::format("banned: {}", fmt::join(banned, ", ")));
  if (already.size()) msg.push_back(fmt::format("already banned: {}", fmt::join(already, ", ")));
  if (failed.size()) msg.push_back(fmt::format("unable to ban: {}", fmt::join(failed, ", ")));
  return fmt::format("{}", fmt::join(msg, ", "));
}

CommandHandler::Reply CommandHandler::AdminBanned(const std::string&, const std::string&) {
  std::vector<std::string> banned = state_.Banned();
  if (banned.empty()) return "nobody is banned.";
  return fmt::format("currently banned: {}", fmt::join(banned, ", "));
}

CommandHandler::Reply CommandHandler::AdminBanWarns(const std::string&, const std::string&) {
  std::string ret;
  for (auto& [nick, count] : state_.BanWarnings()) ret += fmt::format("[{}: {}]", nick, count);
  if (ret.empty()) return "no ban warnings issued.";
  return ret;
}

CommandHandler::Reply CommandHandler::AdminBlacklist(const std::string& rest, const std::string&) {
  auto val = ParseToggle(rest, state_.blacklist.Enabled());
  if (!val) return "invalid value for blacklist option (true/false).";
  state_.blacklist.SetEnabled(*val);
  return fmt::format("blacklist enabled: {}", BoolName(*val));
}

CommandHandler::Reply CommandHandler::AdminChannels(const std::string&, const std::string&) {
  std::vector<std::string> channels = state_.Channels();
  if (channels.empty()) return "current channels: none";
  return fmt::format("current channels: {}", fmt::join(channels, ", "));
}

CommandHandler::Reply CommandHandler::AdminIdentify(const std::string& rest, const std::string&) {
  if (rest.empty()) return "no password supplied.";
  spdlog::info("Identifying with NickServ...");
  transport_.SendLine(fmt::format("PRIVMSG NickServ :IDENTIFY {} {}", state_.Nickname(), rest));
  return std::nullopt;
}

CommandHandler::Reply CommandHandler::AdminJoin(const std::string& rest, const std::string&) {
  std::vector<std::string> chans = ParseCommaArgs(rest);
  if (chans.empty()) return Usage_("join", "<channel>");
  std::vector<std::string> already;
  for (auto& i : chans) {
    std::string chan = Channel_(i);
    if (state_.InChannel(chan)) {
      already.push_back(chan);
    } else {
      spdlog::info("Joining: {}", chan);
      transport_.SendLine("JOIN " + chan);
    }
  }
  if (already.empty()) return std::nullopt;
  return fmt::format("Already in {}: {}", already.size() == 1 ? "channel" : "channels",
                     fmt::join(already, ", "));
}

CommandHandler::Reply CommandHandler::AdminLimitRate(const std::string& rest, const std::string&) {
  auto val = ParseToggle(rest, state_.limit_rate);
  if (!val) return "invalid value for limitrate option (true/false).";
  state_.limit_rate = *val;
  return fmt::format("limitrate enabled: {}", BoolName(*val));
}

CommandHandler::Reply CommandHandler::AdminMe(const std::string& rest, const std::string&) {
  std::vector<std::string> args = SplitWords(rest);
  if (args.size() < 2) return Usage_("me", "<channel> <text>");
  std::string channel = Channel_(args[0]);
  if (!state_.InChannel(channel)) return "not in that channel: " + channel;
  args.erase(args.begin());
  transport_.SendAction(channel, fmt::format("{}", fmt::join(args, " ")));
  return std::nullopt;
}

CommandHandler::Reply CommandHandler::AdminMsg(const std::string& rest, const std::string&) {
  std::vector<std::string> args = SplitWords(rest);
  if (args.size() < 2) return "need target and message.";
  std::string target = args[0];
  args.erase(args.begin());
  transport_.SendMessage(target, fmt::format("{}", fmt::join(args, " ")));
  return std::nullopt;
}

CommandHandler::Reply CommandHandler::AdminPart(const std::string& rest, const std::string&) {
  std::vector<std::string> chans = ParseCommaArgs(rest);
  if (chans.empty()) return Usage_("part", "<channel>");
  std::vector<std::string> not_in;
  for (auto& i : chans) {
    std::string chan = Channel_(i);
    if (state_.InChannel(chan)) {
      spdlog::info("Parting from: {}", chan);
      transport_.SendLine("PART " + chan);
      state_.RemoveChannel(chan);
    } else {
      not_in.push_back(chan);
    }
  }
  if (not_in.empty()) return std::nullopt;
  return fmt::format("Not in {}: {}", not_in.size() == 1 ? "channel" : "channels",
                     fmt::join(not_in, ", "));
}

CommandHandler::Reply CommandHandler::AdminPartAll(const std::string&, const std::string& nick) {
  std::vector<std::string> channels = state_.Channels();
  if (channels.empty()) return "not in any channels.";
  return AdminPart(fmt::format("{}", fmt::join(channels, ",")), nick);
}

CommandHandler::Reply CommandHandler::AdminSay(const std::string& rest, const std::string&) {
  spdlog::info("Saying: {}", rest);
  return rest;
}

CommandHandler::Reply CommandHandler::AdminSendLine(const std::string& rest, const std::string&) {
  if (rest.empty()) return Usage_("sendline", "<line>");
  spdlog::info("Sending line: {}", rest);
  transport_.SendLine(rest);
  return std::nullopt;
}

CommandHandler::Reply CommandHandler::AdminShutdown(const std::string&, const std::string& nick) {
  spdlog::warn("Shutdown requested by {}", nick);
  transport_.Quit("shutting down...");
  return std::nullopt;
}

CommandHandler::Reply CommandHandler::AdminStats(const std::string&, const std::string&) {
  return fmt::format("uptime: {}, handled: {}", TimeFromSecs(state_.Uptime()), state_.handled.load());
}

CommandHandler::Reply CommandHandler::AdminUnban(const std::string& rest, const std::string&) {
  std::vector<std::string> nicks = SplitWords(rest);
  if (nicks.empty()) return Usage_("unban", "<nick>");
  std::vector<std::string> unbanned = state_.BanRemove(nicks), not_banned;
  for (auto& i : nicks) {
    if (std::find(unbanned.begin(), unbanned.end(), i) == unbanned.end()) not_banned.push_back(i);
  }
  if (unbanned.empty()) {
    if (not_banned.size()) return fmt::format("not banned: {}", fmt::join(not_banned, ", "));
    return "unable to unban: " + rest;
  }
  std::string ret = fmt::format("unbanned: {}", fmt::join(unbanned, ", "));
  if (not_banned.size()) ret += fmt::format(", not banned: {}", fmt::join(not_banned, ", "));
  return ret;
}
