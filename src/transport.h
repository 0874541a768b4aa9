#ifndef TRANSPORT_H_
#define TRANSPORT_H_

#include <string>

// Outgoing side of the chat connection. Implementations must be callable
// from any thread.
class ChatTransport {
 public:
  virtual ~ChatTransport() = default;

  virtual void SendLine(const std::string& line) = 0;
  virtual void Quit(const std::string& message) = 0;

  void SendMessage(const std::string& target, const std::string& text) {
    SendLine("PRIVMSG " + target + " :" + text);
  }
  void SendAction(const std::string& target, const std::string& text) {
    SendLine("PRIVMSG " + target + " :\x01" "ACTION " + text + "\x01");
  }
};

#endif  // TRANSPORT_H_
