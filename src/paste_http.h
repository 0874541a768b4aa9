#ifndef PASTE_HTTP_H_
#define PASTE_HTTP_H_

#include <string>
#include <pyval/paste.h>

// Posts a form (author, title, language, content, private) to a paste
// server and reads {"status": ..., "url": ..., "message": ...} back.
class HttpPasteUploader : public PasteUploader {
  std::string server_; // scheme://host[:port]
  std::string path_;
  int retries_;
 public:
  explicit HttpPasteUploader(const std::string& url, int retries = 5);

  bool IsValid() const { return server_.size(); }
  std::optional<std::string> Upload(const PasteData&) override;

  // "https://host:8080/api/paste" -> {"https://host:8080", "/api/paste"}
  static std::pair<std::string, std::string> SplitUrl(const std::string& url);
  // nullopt for an error status or a reply without url
  static std::optional<std::string> ParseReply(const std::string& server, const std::string& body);
};

#endif  // PASTE_HTTP_H_
