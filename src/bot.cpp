#include "bot.h"

#include <thread>
#include <chrono>
#include <system_error>
#include <openssl/evp.h>

#include <fmt/core.h>
#include <spdlog/spdlog.h>
#include <pyval/utils.h>

namespace {

constexpr long kReconnectSecs = 3;
constexpr long kHeartbeatSecs = 120;

// hide passwords in the data log
std::string MaskLine(const std::string& line) {
  if (line.rfind("PASS ", 0) == 0) return "PASS ********";
  size_t pos = line.find("IDENTIFY ");
  if (pos != std::string::npos) return line.substr(0, pos) + "IDENTIFY ********";
  return line;
}

} // namespace

std::optional<std::string> ZncChallengeResponse(const std::string& notice) {
  static const std::string kChallenge = "!ZNCAO CHALLENGE";
  if (notice.find(kChallenge) == std::string::npos) return std::nullopt;
  std::string text = Trim(notice);
  text = text.substr(text.find_last_of(' ') + 1);
  if (text.empty() || text == "CHALLENGE") return std::nullopt;

  unsigned char digest[EVP_MAX_MD_SIZE];
  unsigned int len = 0;
  if (!EVP_Digest(text.data(), text.size(), digest, &len, EVP_md5(), nullptr)) {
    spdlog::warn("Unable to hash the ZNC challenge");
    return std::nullopt;
  }
  std::string hex;
  for (unsigned int i = 0; i < len; i++) hex += fmt::format("{:02x}", digest[i]);
  return "!ZNCAO RESPONSE " + hex;
}

PyvalClient::PyvalClient(boost::asio::io_context& io, const BotOptions& opt, BotState& state,
                         PasteUploader* uploader) :
    IrcClient(io, opt.server, opt.port),
    opt_(opt),
    state_(state),
    handler_(state, *this, uploader) {
  SetHeartbeat(opt.no_heartbeat ? 0 : kHeartbeatSecs);
}

void PyvalClient::OnOpen() {
  if (opt_.server_password.size()) SendLine("PASS " + opt_.server_password);
  SendLine("NICK " + state_.Nickname());
  SendLine("USER " + opt_.username + " 0 * :" + opt_.realname);
}

void PyvalClient::OnFail() {
  if (IsQuitting()) {
    IoContext().stop();
    return;
  }
  spdlog::warn("Failed to connect to server, reconnect in {} seconds", kReconnectSecs);
  ReconnectLater(kReconnectSecs);
}

void PyvalClient::OnClose() {
  state_.ClearChannels();
  if (IsQuitting()) {
    spdlog::info("Disconnected, shutting down");
    IoContext().stop();
    return;
  }
  spdlog::warn("Connection with server closed, reconnect in {} seconds", kReconnectSecs);
  ReconnectLater(kReconnectSecs);
}

void PyvalClient::OnRawLine(const std::string& line, bool outgoing) {
  if (!state_.monitor_data) return;
  spdlog::info("{} {}", outgoing ? ">>" : "<<", MaskLine(line));
}

void PyvalClient::OnMessage(const IrcMessage& msg) {
  if (msg.command == "PING") {
    SendLine("PONG :" + msg.Param(0));
  } else if (msg.command == "001") {
    OnWelcome_();
  } else if (msg.command == "433") {
    OnNickInUse_();
  } else if (msg.command == "JOIN" || msg.command == "PART" || msg.command == "KICK" ||
             msg.command == "NICK") {
    OnMembership_(msg);
  } else if (msg.command == "PRIVMSG") {
    OnPrivmsg_(msg);
  } else if (msg.command == "NOTICE") {
    OnNotice_(msg);
  } else if (msg.command == "ERROR") {
    spdlog::warn("Server error: {}", msg.Param(0));
  }
}

void PyvalClient::OnWelcome_() {
  spdlog::info("Signed on as {}", state_.Nickname());
  if (opt_.nickserv_password.size()) {
    spdlog::info("Identifying with NickServ...");
    SendMessage("NickServ", "IDENTIFY " + state_.Nickname() + " " + opt_.nickserv_password);
  }
  for (auto& chan : opt_.channels) {
    spdlog::info("Joining: {}", chan);
    SendLine("JOIN " + chan);
  }
}

void PyvalClient::OnNickInUse_() {
  std::string nick = state_.Nickname() + "_";
  spdlog::warn("Nickname in use, trying {}", nick);
  state_.SetNickname(nick);
  SendLine("NICK " + nick);
}

void PyvalClient::OnMembership_(const IrcMessage& msg) {
  std::string own = state_.Nickname();
  if (msg.command == "KICK") {
    if (msg.Param(1) != own) return;
    spdlog::warn("Kicked from {} by {}: {}", msg.Param(0), msg.Nick(), msg.Param(2));
    state_.RemoveChannel(msg.Param(0));
    return;
  }
  if (msg.Nick() != own) return;
  if (msg.command == "JOIN") {
    spdlog::info("Joined: {}", msg.Param(0));
    state_.AddChannel(msg.Param(0));
  } else if (msg.command == "PART") {
    spdlog::info("Left: {}", msg.Param(0));
    state_.RemoveChannel(msg.Param(0));
  } else {
    spdlog::info("Nickname changed to {}", msg.Param(0));
    state_.SetNickname(msg.Param(0));
  }
}

void PyvalClient::OnNotice_(const IrcMessage& msg) {
  // server notices have no user part
  if (msg.prefix.find('!') == std::string::npos) {
    spdlog::debug("Server notice: {}", msg.Param(1));
    return;
  }
  std::string nick = msg.Nick();
  spdlog::info("NOTICE from {}: {}", nick, msg.Param(1));
  if (msg.Param(0) != state_.Nickname()) return;
  if (auto response = ZncChallengeResponse(msg.Param(1))) {
    spdlog::info("Answering ZNC autoop challenge from {}", nick);
    SendLine("NOTICE " + nick + " :" + *response);
  }
  for (auto& admin : state_.Admins()) {
    if (admin == nick) continue;
    SendMessage(admin, "NOTICE from " + nick + ": " + msg.Param(1));
  }
}

void PyvalClient::OnPrivmsg_(const IrcMessage& msg) {
  std::string nick = msg.Nick(), channel = msg.Param(0), text = msg.Param(1);
  if (state_.monitor) {
    spdlog::info("[{}]\t{}:\t{}", channel, nick, text);
  } else if (channel == state_.Nickname() && (text.empty() || text[0] != state_.command_char)) {
    spdlog::info("Message from {}: {}", nick, text);
  }
  if (auto cmd = handler_.Accept(nick, channel, text)) HandleAsync_(std::move(*cmd));
}

void PyvalClient::StartWorker_(std::function<void()> work) {
  std::thread(std::move(work)).detach();
}

void PyvalClient::HandleAsync_(PendingCommand cmd) {
  std::string nick = cmd.nick;
  try {
    StartWorker_([this, cmd = std::move(cmd)]() {
      auto reply = handler_.Run(cmd);
      if (reply && reply->size()) {
        int pending = state_.handling_count;
        if (state_.limit_rate && pending > 1) {
          spdlog::info("Delaying reply to {} for {} seconds", cmd.nick, 2 * pending);
          std::this_thread::sleep_for(std::chrono::seconds(2 * pending));
        }
        handler_.Deliver(cmd, *reply);
      }
      handler_.Release();
    });
  } catch (const std::system_error& err) {
    spdlog::error("Unable to start a worker for {}: {}", nick, err.what());
    handler_.Release();
  }
}
