#include "irc_client.h"

#include <istream>
#include <spdlog/spdlog.h>
#include <pyval/utils.h>

std::string IrcMessage::Nick() const {
  return prefix.substr(0, prefix.find('!'));
}

std::string IrcMessage::Host() const {
  size_t pos = prefix.find('@');
  return pos == std::string::npos ? "" : prefix.substr(pos + 1);
}

const std::string& IrcMessage::Param(size_t idx) const {
  static const std::string kEmpty;
  return idx < params.size() ? params[idx] : kEmpty;
}

bool ParseIrcLine(const std::string& line, IrcMessage& msg) {
  msg = IrcMessage();
  size_t pos = 0, len = line.size();
  while (len && (line[len - 1] == '\r' || line[len - 1] == '\n')) len--;
  auto skip_spaces = [&]() { while (pos < len && line[pos] == ' ') pos++; };
  auto next_word = [&]() {
    size_t end = line.find(' ', pos);
    if (end == std::string::npos || end > len) end = len;
    std::string ret = line.substr(pos, end - pos);
    pos = end;
    return ret;
  };

  if (pos < len && line[pos] == ':') {
    pos++;
    msg.prefix = next_word();
    skip_spaces();
  }
  msg.command = next_word();
  if (msg.command.empty()) return false;
  for (auto& c : msg.command) c = toupper(static_cast<unsigned char>(c));
  while (true) {
    skip_spaces();
    if (pos >= len) break;
    if (line[pos] == ':') {
      msg.params.push_back(line.substr(pos + 1, len - pos - 1));
      break;
    }
    msg.params.push_back(next_word());
  }
  return true;
}

IrcClient::IrcClient(boost::asio::io_context& io, const std::string& host, const std::string& port) :
    io_(io),
    resolver_(io),
    socket_(io),
    heartbeat_timer_(io),
    read_buf_(65536),
    host_(host),
    port_(port),
    heartbeat_secs_(0),
    connected_(false),
    quitting_(false) {}

void IrcClient::Connect() {
  boost::asio::post(io_, [this]() {
    if (quitting_ || connected_ || socket_.is_open()) return;
    Resolve_();
  });
}

void IrcClient::ReconnectLater(long secs) {
  auto timer = std::make_shared<boost::asio::steady_timer>(io_, std::chrono::seconds(secs));
  timer->async_wait([this, timer](const ErrorCode& ec) {
    if (!ec) Connect();
  });
}

void IrcClient::Resolve_() {
  spdlog::info("Connecting to {}:{}", host_, port_);
  resolver_.async_resolve(host_, port_,
      [this](const ErrorCode& ec, Tcp::resolver::results_type results) {
        OnResolve_(ec, std::move(results));
      });
}

void IrcClient::OnResolve_(const ErrorCode& ec, Tcp::resolver::results_type results) {
  if (ec) {
    spdlog::warn("Unable to resolve {}: {}", host_, ec.message());
    OnFail();
    return;
  }
  boost::asio::async_connect(socket_, results,
      [this](const ErrorCode& ec, const Tcp::endpoint&) { OnConnect_(ec); });
}

void IrcClient::OnConnect_(const ErrorCode& ec) {
  if (ec) {
    spdlog::warn("Unable to connect to {}:{}: {}", host_, port_, ec.message());
    ErrorCode ignored;
    socket_.close(ignored);
    OnFail();
    return;
  }
  connected_ = true;
  spdlog::info("Connected to {}:{}", host_, port_);
  OnOpen();
  Read_();
  Heartbeat_();
}

void IrcClient::Read_() {
  boost::asio::async_read_until(socket_, read_buf_, '\n',
      [this](const ErrorCode& ec, size_t bytes) { OnRead_(ec, bytes); });
}

void IrcClient::OnRead_(const ErrorCode& ec, size_t) {
  if (ec) {
    if (ec != boost::asio::error::operation_aborted) {
      spdlog::warn("Connection lost: {}", ec.message());
    }
    Disconnect_(ec);
    return;
  }
  std::istream is(&read_buf_);
  std::string line;
  std::getline(is, line);
  if (line.size() && line.back() == '\r') line.pop_back();
  if (line.size()) {
    OnRawLine(line, false);
    IrcMessage msg;
    if (ParseIrcLine(line, msg)) {
      OnMessage(msg);
    } else {
      spdlog::debug("Unparsable line: {}", line);
    }
  }
  if (socket_.is_open()) Read_();
}

void IrcClient::Enqueue_(std::string line) {
  OnRawLine(line, true);
  line += "\r\n";
  bool idle = write_queue_.empty();
  write_queue_.push_back(std::move(line));
  if (idle) Write_();
}

void IrcClient::Write_() {
  boost::asio::async_write(socket_, boost::asio::buffer(write_queue_.front()),
      [this](const ErrorCode& ec, size_t bytes) { OnWrite_(ec, bytes); });
}

void IrcClient::OnWrite_(const ErrorCode& ec, size_t) {
  if (ec) {
    if (ec != boost::asio::error::operation_aborted) {
      spdlog::warn("Write failed: {}", ec.message());
    }
    Disconnect_(ec);
    return;
  }
  write_queue_.pop_front();
  if (write_queue_.size()) {
    Write_();
  } else if (quitting_) {
    ErrorCode ignored;
    socket_.shutdown(Tcp::socket::shutdown_both, ignored);
    Disconnect_(ErrorCode());
  }
}

void IrcClient::Heartbeat_() {
  if (heartbeat_secs_ <= 0) return;
  heartbeat_timer_.expires_after(std::chrono::seconds(heartbeat_secs_));
  heartbeat_timer_.async_wait([this](const ErrorCode& ec) {
    if (ec || !connected_) return;
    Enqueue_("PING :" + host_);
    Heartbeat_();
  });
}

void IrcClient::Disconnect_(const ErrorCode& ec) {
  if (!socket_.is_open()) return;
  bool was_connected = connected_;
  connected_ = false;
  ErrorCode ignored;
  socket_.close(ignored);
  heartbeat_timer_.cancel();
  write_queue_.clear();
  read_buf_.consume(read_buf_.size());
  spdlog::debug("Socket closed: {}", ec ? ec.message() : "quit");
  if (was_connected) {
    OnClose();
  } else {
    OnFail();
  }
}

void IrcClient::SendLine(const std::string& line) {
  std::string clean;
  clean.reserve(line.size());
  for (char c : line) {
    if (c != '\r' && c != '\n') clean += c;
  }
  clean = Utf8Cut(clean, kMaxLineLength);
  boost::asio::post(io_, [this, clean = std::move(clean)]() mutable {
    if (!connected_) {
      spdlog::debug("Not connected, dropping: {}", clean);
      return;
    }
    Enqueue_(std::move(clean));
  });
}

void IrcClient::Quit(const std::string& message) {
  quitting_ = true;
  boost::asio::post(io_, [this, message]() {
    if (!connected_) {
      ErrorCode ignored;
      resolver_.cancel();
      socket_.close(ignored);
      OnClose();
      return;
    }
    Enqueue_("QUIT :" + message);
  });
}
