#include <pyval/logger.h>

#include <pthread.h>
#include <spdlog/spdlog.h>
#include <spdlog/sinks/ansicolor_sink.h>
#include <spdlog/sinks/basic_file_sink.h>
#include <cstdio>

using ansicolor_sink = spdlog::sinks::ansicolor_sink<spdlog::details::console_mutex>;
using file_sink = spdlog::sinks::basic_file_sink_mt;

namespace {

void Prepare() {
  for (auto& i : spdlog::default_logger()->sinks()) {
    if (auto ptr = dynamic_cast<ansicolor_sink*>(i.get())) {
      spdlog::details::console_mutex::mutex().lock();
    }
  }
}

void Release() {
  for (auto& i : spdlog::default_logger()->sinks()) {
    if (auto ptr = dynamic_cast<ansicolor_sink*>(i.get())) {
      spdlog::details::console_mutex::mutex().unlock();
    }
  }
}

} // namespace

void InitLogger() {
  spdlog::debug("Setup logger pthread_atfork");
  pthread_atfork(Prepare, Release, Release);
}

bool LogToFile(const std::filesystem::path& path) {
  try {
    auto sink = std::make_shared<file_sink>(path.string());
    sink->set_pattern("[%t] %+");
    spdlog::default_logger()->sinks().push_back(sink);
  } catch (const spdlog::spdlog_ex& ex) {
    spdlog::error("Failed opening log file {}: {}", path.c_str(), ex.what());
    return false;
  }
  spdlog::info("Logging to {}", path.c_str());
  return true;
}
