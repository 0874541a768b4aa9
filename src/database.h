#ifndef DATABASE_H_
#define DATABASE_H_

#include <string>
#include <vector>
#include <memory>
#include <sqlite_orm/sqlite_orm.h>
#include <pyval/paths.h>

struct AdminNick {
  std::string nick;
};

struct BannedNick {
  std::string nick;
};

namespace {

inline auto InitStorage() {
  using namespace sqlite_orm;
  auto storage = make_storage(DatabasePath().string(),
      make_table("admins",
                 make_column("nick", &AdminNick::nick, primary_key())),
      make_table("banned",
                 make_column("nick", &BannedNick::nick, primary_key())));
  storage.sync_schema(true);
  return storage;
}

} // namespace

// Admin and ban lists; all methods report failures as false / empty results
class Database {
 public:
  using Storage = decltype(InitStorage());

 private:
  std::unique_ptr<Storage> db_;

  template <class T> std::vector<std::string> Load_();
  template <class T> bool Save_(const std::vector<std::string>&);

 public:
  bool Init();

  std::vector<std::string> Admins();
  bool SaveAdmins(const std::vector<std::string>&);
  std::vector<std::string> Banned();
  bool SaveBanned(const std::vector<std::string>&);
};

#endif  // DATABASE_H_
