#include "http_utils.h"
#include <fmt/ranges.h>

namespace http_utils {

std::string FormatOneParam(const char* str) {
  return str;
}
std::string FormatOneParam(const std::string& str) {
  return str;
}
std::string FormatOneParam(const httplib::Params& params) {
  std::vector<std::string> items;
  for (auto& [key, val] : params) {
    items.push_back(key == "content" ? fmt::format("{}=({} bytes)", key, val.size())
                                     : fmt::format("{}={}", key, val));
  }
  return fmt::format("{}", items);
}

std::string FormatParam() {
  return "(none)";
}

bool IsSuccess(int code) {
  return code >= 200 && code < 299;
}

} // namespace http_utils
