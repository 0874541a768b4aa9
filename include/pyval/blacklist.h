#ifndef INCLUDE_PYVAL_BLACKLIST_H_
#define INCLUDE_PYVAL_BLACKLIST_H_

#include <map>
#include <mutex>
#include <string>
#include <vector>
#include <optional>
#include <filesystem>

// Forbidden substrings that stop code before it reaches the sandbox.
// The sandbox already refuses the dangerous parts; this is a cheaper first filter.
class Blacklist {
 public:
  struct Entry {
    std::string message;
    bool active;
  };

 private:
  mutable std::mutex mtx_;
  std::map<std::string, Entry> entries_;
  bool enabled_;

 public:
  explicit Blacklist(bool enabled = false);
  Blacklist(const Blacklist&) = delete;
  Blacklist& operator=(const Blacklist&) = delete;

  bool Enabled() const;
  void SetEnabled(bool);
  bool Toggle(); // returns the new value

  void Add(const std::string& str, const std::string& message);
  bool SetActive(const std::string& str, bool active);
  // JSON object {"substring": "message", ...}; entries are added to the defaults
  bool LoadFile(const std::filesystem::path&);

  // Refusal message of the first active entry found in code (spaces and tabs ignored).
  // Does not look at Enabled(); callers decide whether the list applies.
  std::optional<std::string> Match(const std::string& code) const;

  std::vector<std::pair<std::string, Entry>> Entries() const;
};

#endif  // INCLUDE_PYVAL_BLACKLIST_H_
