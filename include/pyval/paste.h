#ifndef INCLUDE_PYVAL_PASTE_H_
#define INCLUDE_PYVAL_PASTE_H_

#include <string>
#include <vector>
#include <optional>

struct PasteData {
  std::string author;
  std::string title;
  std::string language;
  std::string content;
  bool is_private;
};

class PasteUploader {
 public:
  virtual ~PasteUploader() = default;
  // Returns the paste URL, or nullopt on any failure
  virtual std::optional<std::string> Upload(const PasteData&) = 0;
};

// Pipes the content into an external paste client (pastebinit by default)
// and takes the first http(s) line of its output as the URL.
// "{author}", "{title}" and "{language}" in arguments are substituted.
class CommandPasteUploader : public PasteUploader {
  std::vector<std::string> command_;
  long timeout_;
 public:
  explicit CommandPasteUploader(std::vector<std::string> command, long timeout = 10'000'000);
  std::optional<std::string> Upload(const PasteData&) override;
};

std::vector<std::string> DefaultPasteCommand();

// Query / Result layout used for evaluation pastes
PasteData EvaluationPaste(const std::string& query, const std::string& result,
                          const std::string& nick);

#endif  // INCLUDE_PYVAL_PASTE_H_
