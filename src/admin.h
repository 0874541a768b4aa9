#ifndef ADMIN_H_
#define ADMIN_H_

#include <map>
#include <set>
#include <mutex>
#include <condition_variable>
#include <atomic>
#include <chrono>
#include <ctime>
#include <string>
#include <vector>
#include <optional>

#include <nlohmann/json.hpp>
#include <pyval/blacklist.h>
#include "database.h"

// Everything the command handlers share. Lists are guarded by one mutex;
// the admin/ban lists are written through to the database.
class BotState {
 public:
  using Clock = std::chrono::steady_clock;
  struct BanWarning {
    int count;
    Clock::time_point last;
  };

 private:
  mutable std::mutex mtx_;
  Database& db_;
  std::string nickname_;
  std::set<std::string> channels_;
  std::vector<std::string> admins_;
  std::vector<std::string> default_admins_;
  std::vector<std::string> banned_;
  std::map<std::string, BanWarning> ban_warnings_;
  Clock::time_point last_handle_;
  std::string last_nick_, last_command_;
  nlohmann::json help_info_;
  std::mutex idle_mtx_;
  std::condition_variable idle_cv_;

  bool IsAdmin_(const std::string& nick) const;
  bool IsBanned_(const std::string& nick) const;
  bool SaveBanned_();
  // one more warning; the limit-th warning bans for good
  std::string BanWarn_(const std::string& nick);

 public:
  const char command_char;
  const std::time_t start_time;
  Blacklist blacklist;
  std::atomic<bool> limit_rate;
  std::atomic<int> handling_count;
  std::atomic<long> handled;
  bool monitor, monitor_data;
  // commands closer than this are flooding
  std::chrono::milliseconds msg_timelimit;
  int banwarn_limit;

  BotState(Database& db, const std::string& nickname, char cmdchar,
           const std::vector<std::string>& default_admins);

  std::string Nickname() const;
  void SetNickname(const std::string&);

  // roster
  std::vector<std::string> Channels() const;
  bool InChannel(const std::string&) const;
  void AddChannel(const std::string&);
  void RemoveChannel(const std::string&);
  void ClearChannels();

  // admins
  bool IsAdmin(const std::string& nick) const;
  std::vector<std::string> Admins() const;
  std::string AdminsAdd(const std::string& nick);
  std::string AdminsRemove(const std::string& nick);
  // reload from the database, seeding it with the defaults if empty
  void AdminsReload();

  // bans
  bool IsBanned(const std::string& nick) const;
  std::vector<std::string> Banned() const;
  // returns the nicks actually banned (admins and already banned are skipped)
  std::vector<std::string> BanAdd(const std::vector<std::string>& nicks);
  // returns the nicks actually unbanned; empty if saving failed
  std::vector<std::string> BanRemove(const std::vector<std::string>& nicks);
  std::map<std::string, int> BanWarnings() const;

  // Flood control for one incoming command. Returns a warning to send back,
  // an empty string to drop the message silently, or nullopt to proceed.
  std::optional<std::string> CheckFlood(const std::string& nick, const std::string& message);
  // remember the command that is about to be handled
  void MarkHandled(const std::string& nick, const std::string& message);

  bool LoadHelp(const fs::path&);
  void SetHelp(nlohmann::json help);
  // null if no help is loaded
  const nlohmann::json& Help() const { return help_info_; }

  // a command accepted earlier is done; wakes WaitIdle
  void FinishHandling();
  // block until no accepted command is in flight
  void WaitIdle();

  long Uptime() const;
};

#endif  // ADMIN_H_
