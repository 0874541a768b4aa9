#ifndef IRC_CLIENT_H_
#define IRC_CLIENT_H_

#include <deque>
#include <atomic>
#include <string>
#include <vector>
#include <utility>
#include <boost/asio.hpp>

#include "transport.h"

struct IrcMessage {
  std::string prefix;
  std::string command;
  std::vector<std::string> params; // trailing parameter included as the last one

  std::string Nick() const; // nick part of a nick!user@host prefix
  std::string Host() const;
  const std::string& Param(size_t idx) const;
};

// [':' prefix ' '] command {' ' param} [' :' trailing]
bool ParseIrcLine(const std::string& line, IrcMessage& msg);

// Line-based TCP client. All socket work happens on the io_context thread;
// SendLine / Quit / Connect may be called from anywhere.
class IrcClient : public ChatTransport {
 public:
  using Tcp = boost::asio::ip::tcp;
  using ErrorCode = boost::system::error_code;
  static constexpr size_t kMaxLineLength = 510;

 private:
  boost::asio::io_context& io_;
  Tcp::resolver resolver_;
  Tcp::socket socket_;
  boost::asio::steady_timer heartbeat_timer_;
  boost::asio::streambuf read_buf_;
  std::deque<std::string> write_queue_;

  std::string host_, port_;
  long heartbeat_secs_;
  std::atomic<bool> connected_, quitting_;

  void Resolve_();
  void OnResolve_(const ErrorCode&, Tcp::resolver::results_type);
  void OnConnect_(const ErrorCode&);
  void Read_();
  void OnRead_(const ErrorCode&, size_t);
  void Write_();
  void OnWrite_(const ErrorCode&, size_t);
  void Heartbeat_();
  void Disconnect_(const ErrorCode&);
  void Enqueue_(std::string line);

 protected:
  boost::asio::io_context& IoContext() { return io_; }

 public:
  IrcClient(boost::asio::io_context& io, const std::string& host, const std::string& port);
  virtual ~IrcClient() = default;

  bool IsQuitting() const { return quitting_; }
  // 0 disables the periodic PING
  void SetHeartbeat(long secs) { heartbeat_secs_ = secs; }

  // Note: these run on the io_context thread; do not block in them
  virtual void OnOpen() {}
  virtual void OnFail() {}
  virtual void OnClose() {}
  virtual void OnMessage(const IrcMessage&) {}
  virtual void OnRawLine(const std::string&, bool /* outgoing */) {}

  void Connect();
  void ReconnectLater(long secs);
  // \r and \n are stripped; lines are cut to kMaxLineLength
  void SendLine(const std::string& line) override;
  // Send QUIT, then close once it is written. No reconnect afterwards.
  void Quit(const std::string& message) override;
};

#endif  // IRC_CLIENT_H_
