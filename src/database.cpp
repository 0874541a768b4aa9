#include "database.h"

#include <spdlog/spdlog.h>

bool Database::Init() {
  if (db_) return true;
  try {
    db_ = std::make_unique<Storage>(InitStorage());
  } catch (const std::system_error& err) {
    spdlog::warn("Unable to open database {}: {}", DatabasePath().c_str(), err.what());
    return false;
  }
  return true;
}

template <class T> std::vector<std::string> Database::Load_() {
  std::vector<std::string> ret;
  if (!Init()) return ret;
  try {
    for (auto& i : db_->get_all<T>()) ret.push_back(i.nick);
  } catch (const std::system_error& err) {
    spdlog::warn("Failed loading from database: {}", err.what());
  }
  return ret;
}

template <class T> bool Database::Save_(const std::vector<std::string>& nicks) {
  if (!Init()) return false;
  try {
    db_->transaction([&]() {
      db_->remove_all<T>();
      for (auto& nick : nicks) db_->replace(T{nick});
      return true;
    });
  } catch (const std::system_error& err) {
    spdlog::warn("Failed saving to database: {}", err.what());
    return false;
  }
  return true;
}

std::vector<std::string> Database::Admins() {
  return Load_<AdminNick>();
}

bool Database::SaveAdmins(const std::vector<std::string>& nicks) {
  return Save_<AdminNick>(nicks);
}

std::vector<std::string> Database::Banned() {
  return Load_<BannedNick>();
}

bool Database::SaveBanned(const std::vector<std::string>& nicks) {
  return Save_<BannedNick>(nicks);
}
