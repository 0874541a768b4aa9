#ifndef COMMANDS_H_
#define COMMANDS_H_

#include <map>
#include <string>
#include <vector>
#include <optional>

#include <pyval/reply.h>
#include "admin.h"
#include "transport.h"

// One accepted chat command, waiting for a worker thread
struct PendingCommand {
  std::string nick;
  std::string target; // channel, or the nick for private messages
  std::string prefix; // "<nick>, " is put in front of channel replies
  std::string name;
  std::string rest;
  std::optional<std::string> notice; // flood warning to send instead of running
};

class CommandHandler {
 public:
  using Reply = std::optional<std::string>;
  using Func = Reply (CommandHandler::*)(const std::string& rest, const std::string& nick);

 private:
  static const std::map<std::string, Func> kUserCommands;
  static const std::map<std::string, Func> kAdminCommands;

  BotState& state_;
  ChatTransport& transport_;
  PasteUploader* uploader_;
  ReplyLimits reply_limits_;

  Func Find_(const std::string& name, const std::string& nick) const;
  // "!cmd rest" -> {cmd, rest}
  std::pair<std::string, std::string> Split_(const std::string& message) const;
  std::string Channel_(const std::string& name) const;
  std::string Usage_(const std::string& cmd, const std::string& args) const;

  Reply CmdHelp(const std::string&, const std::string&);
  Reply CmdPython(const std::string&, const std::string&);
  Reply CmdPyval(const std::string&, const std::string&);
  Reply CmdTime(const std::string&, const std::string&);
  Reply CmdUptime(const std::string&, const std::string&);
  Reply CmdVersion(const std::string&, const std::string&);

  Reply AdminAdminAdd(const std::string&, const std::string&);
  Reply AdminAdminHelp(const std::string&, const std::string&);
  Reply AdminAdminList(const std::string&, const std::string&);
  Reply AdminAdminReload(const std::string&, const std::string&);
  Reply AdminAdminRemove(const std::string&, const std::string&);
  Reply AdminBan(const std::string&, const std::string&);
  Reply AdminBanned(const std::string&, const std::string&);
  Reply AdminBanWarns(const std::string&, const std::string&);
  Reply AdminBlacklist(const std::string&, const std::string&);
  Reply AdminChannels(const std::string&, const std::string&);
  Reply AdminIdentify(const std::string&, const std::string&);
  Reply AdminJoin(const std::string&, const std::string&);
  Reply AdminLimitRate(const std::string&, const std::string&);
  Reply AdminMe(const std::string&, const std::string&);
  Reply AdminMsg(const std::string&, const std::string&);
  Reply AdminPart(const std::string&, const std::string&);
  Reply AdminPartAll(const std::string&, const std::string&);
  Reply AdminSay(const std::string&, const std::string&);
  Reply AdminSendLine(const std::string&, const std::string&);
  Reply AdminShutdown(const std::string&, const std::string&);
  Reply AdminStats(const std::string&, const std::string&);
  Reply AdminUnban(const std::string&, const std::string&);

 public:
  CommandHandler(BotState& state, ChatTransport& transport, PasteUploader* uploader);

  void SetReplyLimits(const ReplyLimits& lim) { reply_limits_ = lim; }
  // may be null; uploads are then reported as failed
  void SetUploader(PasteUploader* uploader) { uploader_ = uploader; }

  // Look at one PRIVMSG. Applies bans, flood control and the in-flight limit.
  // An accepted command holds an in-flight slot until Release().
  std::optional<PendingCommand> Accept(const std::string& nick, const std::string& channel,
                                       const std::string& message);
  // Never throws; errors become "PyVal Error: ..." replies
  Reply Run(const PendingCommand&);
  void Deliver(const PendingCommand&, const std::string& reply);
  void Release();

  // Parse and run directly, without flood control
  Reply Handle(const std::string& nick, const std::string& message);

  std::vector<std::string> GetCommands(const std::string& role, const std::string& nick) const;
  std::string GetHelp(const std::string& role, const std::string& cmdname,
                      const std::string& nick) const;
};

#endif  // COMMANDS_H_
