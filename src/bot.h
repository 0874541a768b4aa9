#ifndef BOT_H_
#define BOT_H_

#include <string>
#include <vector>
#include <optional>
#include <functional>

#include "admin.h"
#include "commands.h"
#include "irc_client.h"

struct BotOptions {
  std::string server = "irc.libera.chat";
  std::string port = "6667";
  std::string username = "pyval";
  std::string realname = "PyVal";
  std::string server_password;
  std::string nickserv_password;
  std::vector<std::string> channels;
  bool no_heartbeat = false;
};

// "!ZNCAO RESPONSE <md5 hex>" for a ZNC autoop "!ZNCAO CHALLENGE <text>"
// notice; nullopt if the notice is something else or hashing failed
std::optional<std::string> ZncChallengeResponse(const std::string& notice);

class PyvalClient : public IrcClient {
  BotOptions opt_;
  BotState& state_;
  CommandHandler handler_;

  void OnWelcome_();
  void OnPrivmsg_(const IrcMessage&);
  void OnNotice_(const IrcMessage&);
  void OnMembership_(const IrcMessage&);
  void OnNickInUse_();
  void HandleAsync_(PendingCommand cmd);

 protected:
  // runs `work` on a detached thread; throws std::system_error if none can be started
  virtual void StartWorker_(std::function<void()> work);

 public:
  PyvalClient(boost::asio::io_context& io, const BotOptions& opt, BotState& state,
              PasteUploader* uploader);

  CommandHandler& Handler() { return handler_; }

  void OnOpen() override;
  void OnFail() override;
  void OnClose() override;
  void OnMessage(const IrcMessage&) override;
  void OnRawLine(const std::string& line, bool outgoing) override;
};

#endif  // BOT_H_
