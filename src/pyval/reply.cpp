#include <pyval/reply.h>

#include <spdlog/spdlog.h>
#include "utils.h"

ChatReply RenderReply(const EvaluationRequest& req, const EvaluationResult& res,
                      PasteUploader* uploader, const ReplyLimits& lim) {
  ChatReply ret{"", false, false};
  SafeText safe = SafeOutput(res, lim.inline_limits, false);
  bool overflow = res.exit_status != ExitStatus::TIMED_OUT &&
      (res.stdout_text.size() > lim.inline_threshold || safe.truncated);
  if (!overflow) {
    ret.text = safe.text;
    return ret;
  }

  ret.truncated = true;
  std::string excerpt = Utf8Cut(safe.text, lim.excerpt_length);
  std::optional<std::string> url;
  if (uploader) {
    std::string content = SafePaste(res.stdout_text, lim.paste_max_lines, lim.paste_max_line_length);
    url = uploader->Upload(EvaluationPaste(res.parsed_source, content, req.requester));
  }
  if (url) {
    ret.text = excerpt + " - full: " + *url;
    ret.pasted = true;
  } else {
    spdlog::info("Paste unavailable, sending excerpt only");
    ret.text = excerpt + " (...truncated, paste failed)";
  }
  return ret;
}
