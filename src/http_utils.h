#ifndef HTTP_UTILS_H_
#define HTTP_UTILS_H_

/// Log HTTP requests

#include <chrono>
#include <algorithm>
#include <thread>
#include <memory>
#include <httplib.h>
#include <spdlog/spdlog.h>

namespace http_utils {

std::string FormatOneParam(const char*);
std::string FormatOneParam(const std::string&);
// the paste content is left out of the log
std::string FormatOneParam(const httplib::Params&);
template <class T>
std::string FormatOneParam(const T&) { return "(unknown)"; }

std::string FormatParam();
template <class T, class... U>
std::string FormatParam(T&& head, U&&... tail) {
  return FormatOneParam(std::forward<T>(head)) + ' ' + FormatParam(std::forward<U>(tail)...);
}

bool IsSuccess(int code);

} // namespace http_utils

struct HTTPPost {
  constexpr static char method_name[] = "POST";
  template <class... T>
  auto operator()(httplib::Client& cli, const std::string& endpoint, T&&... params) {
    return cli.Post(endpoint.c_str(), std::forward<T>(params)...);
  }
};

template <class Method, class... T>
httplib::Result HTTPRequest(httplib::Client& cli, const std::string& endpoint, T&&... params) {
  spdlog::debug("{} {} params {}", Method::method_name, endpoint, http_utils::FormatParam(params...));
  return Method()(cli, endpoint, std::forward<T>(params)...);
}

template <class Method, class... T>
httplib::Result RequestRetry(int retries, httplib::Client& cli, const std::string& endpoint,
                             T&&... params) {
  using namespace std::chrono_literals;
  std::unique_ptr<httplib::Result> last_res;
  retries = std::max(retries, 1);
  for (int i = 0; i < retries; i++) {
    if (i) std::this_thread::sleep_for(1s);
    last_res = std::make_unique<httplib::Result>(HTTPRequest<Method>(cli, endpoint, params...));
    if (*last_res && http_utils::IsSuccess((*last_res)->status)) return std::move(*last_res);
    spdlog::debug("Error code={} status={}", (int)last_res->error(), *last_res ? (*last_res)->status : -1);
  }
  spdlog::warn("Request {} {} failed after {} retries", Method::method_name, endpoint, retries);
  return std::move(*last_res);
}

#endif  // HTTP_UTILS_H_
