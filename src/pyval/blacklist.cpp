#include <pyval/blacklist.h>

#include <fstream>

#include <nlohmann/json.hpp>
#include <spdlog/spdlog.h>
#include "utils.h"

namespace {

const std::pair<const char*, const char*> kDefaultEntries[] = {
  {"__bases__", "too complicated for this bot."},
  {"__import__", "no __import__ allowed."},
  {"__subclasses__", "too complicated for this bot."},
  {"builtin", "no builtins allowed."},
  {"eval(", "no eval() allowed."},
  {"exec(", "no exec() allowed."},
  {"exit", "no exit allowed."},
  {"help(", "no help() allowed."},
  {"import", "no imports allowed."},
  {"KABOOM", "no way."},
  {"kaboom", "no way."},
  {"open", "no open() allowed."},
  {"os.", "no os module allowed."},
  {"self", "no self allowed."},
  {"super", "no super() allowed."},
  {"sys", "no sys allowed."},
  {"SystemExit", "no SystemExit allowed."},
};

} // namespace

Blacklist::Blacklist(bool enabled) : enabled_(enabled) {
  for (auto& [str, msg] : kDefaultEntries) entries_[str] = {msg, true};
}

bool Blacklist::Enabled() const {
  std::lock_guard lck(mtx_);
  return enabled_;
}

void Blacklist::SetEnabled(bool enabled) {
  std::lock_guard lck(mtx_);
  enabled_ = enabled;
}

bool Blacklist::Toggle() {
  std::lock_guard lck(mtx_);
  return enabled_ = !enabled_;
}

void Blacklist::Add(const std::string& str, const std::string& message) {
  if (str.empty()) return;
  std::lock_guard lck(mtx_);
  entries_[str] = {message, true};
}

bool Blacklist::SetActive(const std::string& str, bool active) {
  std::lock_guard lck(mtx_);
  auto it = entries_.find(str);
  if (it == entries_.end()) return false;
  it->second.active = active;
  return true;
}

bool Blacklist::LoadFile(const std::filesystem::path& path) {
  std::ifstream fin(path);
  if (!fin) {
    spdlog::warn("Unable to open blacklist file {}", path.c_str());
    return false;
  }
  try {
    nlohmann::json obj = nlohmann::json::parse(fin);
    if (!obj.is_object()) {
      spdlog::warn("Blacklist file {} is not a JSON object", path.c_str());
      return false;
    }
    for (auto& [key, val] : obj.items()) {
      Add(key, val.get<std::string>());
    }
  } catch (const nlohmann::json::exception& ex) {
    spdlog::warn("Failed parsing blacklist file {}: {}", path.c_str(), ex.what());
    return false;
  }
  spdlog::info("Loaded blacklist entries from {}", path.c_str());
  return true;
}

std::optional<std::string> Blacklist::Match(const std::string& code) const {
  std::string compact = StripChars(code, " \t");
  std::lock_guard lck(mtx_);
  for (auto& [str, entry] : entries_) {
    if (!entry.active) continue;
    if (compact.find(str) != std::string::npos) return entry.message;
  }
  return std::nullopt;
}

std::vector<std::pair<std::string, Blacklist::Entry>> Blacklist::Entries() const {
  std::lock_guard lck(mtx_);
  return {entries_.begin(), entries_.end()};
}
