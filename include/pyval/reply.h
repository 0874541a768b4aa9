#ifndef INCLUDE_PYVAL_REPLY_H_
#define INCLUDE_PYVAL_REPLY_H_

#include <string>

#include "exec.h"
#include "output.h"
#include "paste.h"

struct ReplyLimits {
  size_t inline_threshold = 160;
  OutputLimits inline_limits = {30, 140, 0};
  size_t excerpt_length = 100;
  int paste_max_lines = 65;
  int paste_max_line_length = 240;
};

struct ChatReply {
  std::string text;
  bool truncated;
  bool pasted;
};

// Short results go inline. Longer ones are cut to an excerpt and the full
// output goes to the uploader; the excerpt then carries the URL or a failure note.
// uploader may be null.
ChatReply RenderReply(const EvaluationRequest&, const EvaluationResult&,
                      PasteUploader* uploader, const ReplyLimits& = ReplyLimits());

#endif  // INCLUDE_PYVAL_REPLY_H_
