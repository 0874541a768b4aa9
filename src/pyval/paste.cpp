#include <pyval/paste.h>

#include <sys/wait.h>
#include <cstring>

#include <fmt/ranges.h>
#include <spdlog/spdlog.h>
#include "process.h"
#include "utils.h"

namespace {

std::string FormatArg(std::string arg, const PasteData& data) {
  ReplaceAll(arg, "{author}", data.author);
  ReplaceAll(arg, "{title}", data.title);
  ReplaceAll(arg, "{language}", data.language);
  return arg;
}

inline bool LooksLikeUrl(const std::string& str) {
  return str.rfind("http://", 0) == 0 || str.rfind("https://", 0) == 0;
}

} // namespace

CommandPasteUploader::CommandPasteUploader(std::vector<std::string> command, long timeout) :
    command_(std::move(command)), timeout_(timeout) {}

std::optional<std::string> CommandPasteUploader::Upload(const PasteData& data) {
  if (command_.empty()) return std::nullopt;
  ProcessOptions opt;
  for (auto& i : command_) opt.command.push_back(FormatArg(i, data));
  opt.input = data.content;
  opt.wall_time = timeout_;
  opt.max_output = 65536;
  spdlog::debug("Uploading paste with {}", fmt::format("{}", opt.command));
  ProcessResult res = RunProcess(opt);
  if (res.spawn_failed) {
    spdlog::warn("Unable to run paste command {}: {}", command_[0], strerror(res.error));
    return std::nullopt;
  }
  if (res.timed_out) {
    spdlog::warn("Paste command {} timed out", command_[0]);
    return std::nullopt;
  }
  if (!WIFEXITED(res.status) || WEXITSTATUS(res.status) != 0) {
    spdlog::warn("Paste command {} failed (status {}): {}", command_[0], res.status, Trim(res.err));
    return std::nullopt;
  }
  for (auto& line : SplitString(res.out, '\n')) {
    std::string url = Trim(line);
    if (LooksLikeUrl(url)) {
      spdlog::info("Pasted: {}", url);
      return url;
    }
  }
  spdlog::warn("Paste command {} gave no url: {}", command_[0], Trim(res.out));
  return std::nullopt;
}

std::vector<std::string> DefaultPasteCommand() {
  return {"pastebinit", "-a", "{author}", "-t", "{title}", "-f", "{language}"};
}

PasteData EvaluationPaste(const std::string& query, const std::string& result,
                          const std::string& nick) {
  const std::string divider(80, '-');
  PasteData ret;
  ret.author = nick.size() ? fmt::format("PyVal (for {})", nick) : "PyVal";
  ret.title = "PyVal Evaluation Results";
  ret.language = "python";
  ret.content = fmt::format("Query:\n{0}\n\n{1}\n\nResult:\n{0}\n\n{2}", divider, query, result);
  ret.is_private = true;
  return ret;
}
