#include "paste_http.h"

#include <nlohmann/json.hpp>
#include <spdlog/spdlog.h>
#include "http_utils.h"

HttpPasteUploader::HttpPasteUploader(const std::string& url, int retries) : retries_(retries) {
  std::tie(server_, path_) = SplitUrl(url);
}

std::pair<std::string, std::string> HttpPasteUploader::SplitUrl(const std::string& url) {
  size_t scheme = url.find("://");
  if (scheme == std::string::npos) return {"", ""};
  size_t slash = url.find('/', scheme + 3);
  if (slash == std::string::npos) return {url, "/"};
  return {url.substr(0, slash), url.substr(slash)};
}

std::optional<std::string> HttpPasteUploader::ParseReply(const std::string& server,
                                                         const std::string& body) {
  using nlohmann::json;
  try {
    json reply = json::parse(body);
    std::string status = reply.value("status", "");
    if (status == "error") {
      spdlog::warn("Paste server error: {}", reply.value("message", "(no message)"));
      return std::nullopt;
    }
    std::string url = reply.value("url", "");
    if (url.empty()) {
      spdlog::warn("Paste server sent no url");
      return std::nullopt;
    }
    if (url.rfind("http://", 0) != 0 && url.rfind("https://", 0) != 0) {
      url = server + (url[0] == '/' ? "" : "/") + url;
    }
    return url;
  } catch (const json::exception& err) {
    spdlog::warn("JSON decoding error: {}", err.what());
    return std::nullopt;
  }
}

std::optional<std::string> HttpPasteUploader::Upload(const PasteData& data) {
  if (!IsValid()) return std::nullopt;
  httplib::Client cli(server_);
  cli.set_connection_timeout(5);
  cli.set_read_timeout(10);
  httplib::Params params{
    {"author", data.author},
    {"title", data.title},
    {"language", data.language},
    {"content", data.content},
    {"private", data.is_private ? "1" : "0"},
  };
  auto res = RequestRetry<HTTPPost>(retries_, cli, path_, params);
  if (!res || !http_utils::IsSuccess(res->status)) {
    spdlog::warn("Paste upload to {} failed", server_);
    return std::nullopt;
  }
  return ParseReply(server_, res->body);
}
