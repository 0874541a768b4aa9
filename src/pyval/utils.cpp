#include "utils.h"

#include <unistd.h>
#include <cstring>
#include <algorithm>

#include <fmt/core.h>
#include <spdlog/spdlog.h>

const char kVersionString[] = "2.0.0";

#if __has_include(<linux/close_range.h>)
#include <linux/close_range.h>
int CloseFrom(int minfd) {
  return close_range(minfd, ~0U, 0);
}
#else
#include <dirent.h>
int CloseFrom(int minfd) {
  DIR *fddir = opendir("/proc/self/fd");
  if (!fddir) goto error;
  {
    int dfd = dirfd(fddir);
    for (struct dirent *dent; (dent = readdir(fddir));) {
      if (!strcmp(dent->d_name, ".") || !strcmp(dent->d_name, "..")) continue;
      int fd = strtol(dent->d_name, NULL, 10);
      if (fd >= minfd && fd != dfd) {
        if (close(fd) && errno != EBADF) goto error_dir;
      }
    }
  }
  closedir(fddir);
  return 0;

error_dir:
  closedir(fddir);
error:
  return -1;
}
#endif // has_include(<linux/close_range.h>)

#define ENUM_SWITCH_FUNCTION(DEF, typ, mac) \
  DEF(typ param) { \
    switch (param) { \
      mac \
    } \
    __builtin_unreachable(); \
  }
#define X_RETURN_ARG2(cls, x, y, ...) case cls::x: return y;

#define X(...) X_RETURN_ARG2(ExitStatus, __VA_ARGS__)
ENUM_SWITCH_FUNCTION(const char* ExitStatusName, ExitStatus, ENUM_EXIT_STATUS_)
#undef X

#undef ENUM_SWITCH_FUNCTION
#undef X_RETURN_ARG2

std::vector<std::string> SplitString(const std::string& str, char delim) {
  std::vector<std::string> ret;
  size_t start = 0;
  while (true) {
    size_t pos = str.find(delim, start);
    if (pos == std::string::npos) {
      ret.push_back(str.substr(start));
      break;
    }
    ret.push_back(str.substr(start, pos - start));
    start = pos + 1;
  }
  return ret;
}

std::vector<std::string> ParseCommaArgs(const std::string& str) {
  std::vector<std::string> ret;
  for (auto& i : SplitString(str, ',')) {
    std::string item = Trim(i);
    if (item.size()) ret.push_back(std::move(item));
  }
  return ret;
}

std::string Trim(const std::string& str, const char* chars) {
  size_t first = str.find_first_not_of(chars);
  if (first == std::string::npos) return "";
  size_t last = str.find_last_not_of(chars);
  return str.substr(first, last - first + 1);
}

std::string Utf8Cut(const std::string& str, size_t max_bytes) {
  if (str.size() <= max_bytes) return str;
  size_t len = max_bytes;
  // back off over continuation bytes so the cut lands on a character start
  while (len > 0 && (static_cast<unsigned char>(str[len]) & 0xc0) == 0x80) len--;
  return str.substr(0, len);
}

bool ParseTrue(const std::string& str) {
  std::string val = Trim(str);
  std::transform(val.begin(), val.end(), val.begin(), ::tolower);
  return val == "true" || val == "on" || val == "yes" || val == "1";
}

bool ParseFalse(const std::string& str) {
  std::string val = Trim(str);
  std::transform(val.begin(), val.end(), val.begin(), ::tolower);
  return val == "false" || val == "off" || val == "no" || val == "0";
}

std::string TimeFromSecs(long secs, bool label) {
  if (secs < 0) secs = 0;
  long seconds = secs % 60, minutes = secs / 60 % 60;
  long hours = secs / 3600 % 24, days = secs / 86400;
  if (secs < 60) return label ? fmt::format("{}s", secs) : std::to_string(secs);
  if (secs < 3600) {
    if (label) return fmt::format("{}m:{}s", minutes, seconds);
    return fmt::format("{}:{}", minutes, seconds);
  }
  if (secs < 86400) {
    if (label) return fmt::format("{}h:{}m:{}s", hours, minutes, seconds);
    return fmt::format("{}:{}:{}", hours, minutes, seconds);
  }
  if (label) return fmt::format("{}d:{}h:{}m:{}s", days, hours, minutes, seconds);
  return fmt::format("{}:{}:{}:{}", days, hours, minutes, seconds);
}

std::string HumanTime(std::time_t t, bool short_names) {
  static const char* kDays[] = {
    "Sunday", "Monday", "Tuesday", "Wednesday", "Thursday", "Friday", "Saturday"
  };
  static const char* kMonths[] = {
    "January", "February", "March", "April", "May", "June", "July",
    "August", "September", "October", "November", "December"
  };
  struct tm tm_val{};
  localtime_r(&t, &tm_val);
  std::string day = kDays[tm_val.tm_wday], month = kMonths[tm_val.tm_mon];
  if (short_names) {
    day = day.substr(0, 3) + '.';
    month = month.substr(0, 3) + '.';
  }
  std::string date = fmt::format("{}, {} {} {}", day, month, tm_val.tm_mday, tm_val.tm_year + 1900);
  if (!tm_val.tm_hour && !tm_val.tm_min && !tm_val.tm_sec) return date;
  int hour = tm_val.tm_hour % 12;
  return fmt::format("{} {}:{:02}:{:02}{}", date, hour ? hour : 12, tm_val.tm_min, tm_val.tm_sec,
                     tm_val.tm_hour < 12 ? "am" : "pm");
}

void ReplaceAll(std::string& str, const std::string& from, const std::string& to) {
  if (from.empty()) return;
  size_t pos = 0;
  while ((pos = str.find(from, pos)) != std::string::npos) {
    str.replace(pos, from.size(), to);
    pos += to.size();
  }
}

std::string StripChars(const std::string& str, const char* chars) {
  std::string ret;
  ret.reserve(str.size());
  for (char c : str) {
    if (!strchr(chars, c) || c == '\0') ret.push_back(c);
  }
  return ret;
}

bool CreateDirs(const fs::path& path) {
  spdlog::debug("Create directories {}", path.c_str());
  std::error_code ec;
  fs::create_directories(path, ec);
  if (ec) {
    spdlog::warn("Failed creating directory {}: {}", path.c_str(), strerror(ec.value()));
    return false;
  }
  return true;
}
