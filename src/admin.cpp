#include "admin.h"

#include <fstream>
#include <algorithm>

#include <fmt/ranges.h>
#include <spdlog/spdlog.h>

namespace {

inline bool Contains(const std::vector<std::string>& vec, const std::string& val) {
  return std::find(vec.begin(), vec.end(), val) != vec.end();
}

} // namespace

BotState::BotState(Database& db, const std::string& nickname, char cmdchar,
                   const std::vector<std::string>& default_admins) :
    db_(db),
    nickname_(nickname),
    default_admins_(default_admins),
    command_char(cmdchar),
    start_time(std::time(nullptr)),
    limit_rate(true),
    handling_count(0),
    handled(0),
    monitor(false),
    monitor_data(false),
    msg_timelimit(3000),
    banwarn_limit(3) {
  AdminsReload();
  banned_ = db_.Banned();
  spdlog::info("Loaded {} admins, {} banned", admins_.size(), banned_.size());
}

std::string BotState::Nickname() const {
  std::lock_guard lck(mtx_);
  return nickname_;
}

void BotState::SetNickname(const std::string& nick) {
  std::lock_guard lck(mtx_);
  nickname_ = nick;
}

std::vector<std::string> BotState::Channels() const {
  std::lock_guard lck(mtx_);
  return {channels_.begin(), channels_.end()};
}

bool BotState::InChannel(const std::string& chan) const {
  std::lock_guard lck(mtx_);
  return channels_.count(chan);
}

void BotState::AddChannel(const std::string& chan) {
  std::lock_guard lck(mtx_);
  channels_.insert(chan);
}

void BotState::RemoveChannel(const std::string& chan) {
  std::lock_guard lck(mtx_);
  channels_.erase(chan);
}

void BotState::ClearChannels() {
  std::lock_guard lck(mtx_);
  channels_.clear();
}

bool BotState::IsAdmin_(const std::string& nick) const {
  return Contains(admins_, nick);
}

bool BotState::IsAdmin(const std::string& nick) const {
  std::lock_guard lck(mtx_);
  return IsAdmin_(nick);
}

std::vector<std::string> BotState::Admins() const {
  std::lock_guard lck(mtx_);
  return admins_;
}

std::string BotState::AdminsAdd(const std::string& nick) {
  std::lock_guard lck(mtx_);
  if (IsAdmin_(nick)) return "already an admin: " + nick;
  admins_.push_back(nick);
  if (!db_.SaveAdmins(admins_)) {
    return fmt::format("unable to save admins, {} is not permanent.", nick);
  }
  spdlog::info("Added admin: {}", nick);
  return "added admin: " + nick;
}

std::string BotState::AdminsRemove(const std::string& nick) {
  std::lock_guard lck(mtx_);
  auto it = std::find(admins_.begin(), admins_.end(), nick);
  if (it == admins_.end()) return "not an admin: " + nick;
  admins_.erase(it);
  if (!db_.SaveAdmins(admins_)) {
    return fmt::format("unable to save admins, {} will be an admin after a restart.", nick);
  }
  spdlog::info("Removed admin: {}", nick);
  return "removed admin: " + nick;
}

void BotState::AdminsReload() {
  std::lock_guard lck(mtx_);
  std::vector<std::string> admins = db_.Admins();
  if (admins.empty() && default_admins_.size()) {
    admins = default_admins_;
    if (!db_.SaveAdmins(admins)) spdlog::warn("Unable to store the default admins");
  }
  admins_ = std::move(admins);
  spdlog::debug("Admins: {}", admins_);
}

bool BotState::IsBanned_(const std::string& nick) const {
  return Contains(banned_, nick);
}

bool BotState::IsBanned(const std::string& nick) const {
  std::lock_guard lck(mtx_);
  return IsBanned_(nick);
}

std::vector<std::string> BotState::Banned() const {
  std::lock_guard lck(mtx_);
  std::vector<std::string> ret = banned_;
  std::sort(ret.begin(), ret.end());
  return ret;
}

bool BotState::SaveBanned_() {
  if (db_.SaveBanned(banned_)) return true;
  spdlog::warn("Unable to save the ban list");
  return false;
}

std::string BotState::BanWarn_(const std::string& nick) {
  if (IsAdmin_(nick)) return "";
  auto now = Clock::now();
  auto it = ban_warnings_.find(nick);
  if (it == ban_warnings_.end()) {
    ban_warnings_[nick] = {1, now};
    return "slow down with your commands.";
  }
  it->second.last = now;
  int count = ++it->second.count;
  if (count >= banwarn_limit) {
    if (!IsBanned_(nick)) banned_.push_back(nick);
    SaveBanned_();
    spdlog::info("Banned {} after {} warnings", nick, count);
    return "no more.";
  }
  if (count == banwarn_limit - 1) return "really, slow down with your commands.";
  return "slow down with your commands.";
}

std::vector<std::string> BotState::BanAdd(const std::vector<std::string>& nicks) {
  std::lock_guard lck(mtx_);
  std::vector<std::string> banned;
  for (auto& nick : nicks) {
    if (nick.empty() || IsAdmin_(nick) || IsBanned_(nick)) continue;
    banned_.push_back(nick);
    banned.push_back(nick);
  }
  if (banned.size() && !SaveBanned_()) return {};
  return banned;
}

std::vector<std::string> BotState::BanRemove(const std::vector<std::string>& nicks) {
  std::lock_guard lck(mtx_);
  std::vector<std::string> removed;
  for (auto& nick : nicks) {
    if (!IsBanned_(nick)) continue;
    banned_.erase(std::remove(banned_.begin(), banned_.end(), nick), banned_.end());
    if (auto it = ban_warnings_.find(nick); it != ban_warnings_.end()) {
      it->second = {0, Clock::now()};
    }
    removed.push_back(nick);
  }
  if (removed.size() && !SaveBanned_()) return {};
  return removed;
}

std::map<std::string, int> BotState::BanWarnings() const {
  std::lock_guard lck(mtx_);
  std::map<std::string, int> ret;
  for (auto& [nick, warning] : ban_warnings_) ret[nick] = warning.count;
  return ret;
}

std::optional<std::string> BotState::CheckFlood(const std::string& nick, const std::string& message) {
  std::lock_guard lck(mtx_);
  if (IsAdmin_(nick)) return std::nullopt;
  auto now = Clock::now();
  std::string ban_msg;
  if (last_nick_.size()) {
    if (auto it = ban_warnings_.find(nick); it != ban_warnings_.end()) {
      if (now - it->second.last < msg_timelimit) {
        ban_msg = BanWarn_(nick);
      } else {
        it->second.last = now;
      }
    } else if (nick == last_nick_ && now - last_handle_ < msg_timelimit) {
      ban_msg = BanWarn_(nick);
    }
  }
  if (ban_msg.size()) {
    last_handle_ = now;
    last_nick_ = nick;
    return ban_msg;
  }
  if (message == last_command_) {
    spdlog::debug("Ignoring repeated command from {}", nick);
    return "";
  }
  return std::nullopt;
}

void BotState::MarkHandled(const std::string& nick, const std::string& message) {
  std::lock_guard lck(mtx_);
  last_handle_ = Clock::now();
  last_nick_ = nick;
  last_command_ = message;
}

bool BotState::LoadHelp(const fs::path& path) {
  std::ifstream fin(path);
  if (!fin) {
    spdlog::warn("Help file {} not found, no help commands will be available", path.c_str());
    return false;
  }
  try {
    nlohmann::json help = nlohmann::json::parse(fin);
    if (!help.is_object() || !help.contains("user") || !help.contains("admin")) {
      spdlog::warn("Help file {} has no user/admin sections", path.c_str());
      return false;
    }
    SetHelp(std::move(help));
  } catch (const nlohmann::json::exception& err) {
    spdlog::warn("JSON decoding error in {}: {}", path.c_str(), err.what());
    return false;
  }
  spdlog::info("Loaded help from {}", path.c_str());
  return true;
}

void BotState::SetHelp(nlohmann::json help) {
  std::lock_guard lck(mtx_);
  help_info_ = std::move(help);
}

void BotState::FinishHandling() {
  handled++;
  int count = handling_count.load();
  while (count > 0 && !handling_count.compare_exchange_weak(count, count - 1));
  std::lock_guard lck(idle_mtx_);
  idle_cv_.notify_all();
}

void BotState::WaitIdle() {
  std::unique_lock lck(idle_mtx_);
  idle_cv_.wait(lck, [this]() { return handling_count.load() <= 0; });
}

long BotState::Uptime() const {
  return static_cast<long>(std::difftime(std::time(nullptr), start_time));
}
