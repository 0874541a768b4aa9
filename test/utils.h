#ifndef TEST_UTILS_H_
#define TEST_UTILS_H_

#include <mutex>
#include <string>
#include <vector>
#include <optional>
#include <gtest/gtest.h>
#include <pyval/paths.h>
#include <pyval/paste.h>
#include "transport.h"

// Writes an executable /bin/sh script into kStateDir
fs::path WriteScript(const std::string& name, const std::string& body);

// Interpreter stand-ins. The echo sandbox prints the argument of every
// print('...') line it is fed, and nothing else.
fs::path EchoSandbox();
fs::path CrashSandbox();
fs::path SlowSandbox();
// creates `marker` whenever it is started
fs::path MarkerSandbox(const fs::path& marker);

// Point the evaluator at `exe`, without sandbox directory or script
void UseSandbox(const fs::path& exe);

class SandboxSettings {
  fs::path exe_, dir_;
  std::string script_;
  long timeout_;
 public:
  SandboxSettings();
  ~SandboxSettings();
};

class RecordingTransport : public ChatTransport {
  mutable std::mutex mtx_;
  std::vector<std::string> lines_;
  std::string quit_message_;
 public:
  void SendLine(const std::string& line) override {
    std::lock_guard lck(mtx_);
    lines_.push_back(line);
  }
  void Quit(const std::string& message) override {
    std::lock_guard lck(mtx_);
    quit_message_ = message;
  }
  std::vector<std::string> Lines() const {
    std::lock_guard lck(mtx_);
    return lines_;
  }
  std::string QuitMessage() const {
    std::lock_guard lck(mtx_);
    return quit_message_;
  }
};

class FakeUploader : public PasteUploader {
 public:
  std::optional<std::string> url;
  int calls = 0;
  PasteData last;

  explicit FakeUploader(std::optional<std::string> ret = std::nullopt) : url(std::move(ret)) {}
  std::optional<std::string> Upload(const PasteData& data) override {
    calls++;
    last = data;
    return url;
  }
};

#endif // TEST_UTILS_H_
