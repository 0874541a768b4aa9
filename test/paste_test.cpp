#include <fstream>
#include <sstream>
#include <pyval/paste.h>

#include "paste_http.h"
#include "utils.h"

namespace {

std::string ReadFile(const fs::path& path) {
  std::ifstream fin(path);
  std::stringstream ss;
  ss << fin.rdbuf();
  return ss.str();
}

PasteData SamplePaste() {
  return EvaluationPaste("print('hi')", "hi", "joe");
}

} // namespace

TEST(EvaluationPasteTest, Layout) {
  PasteData data = SamplePaste();
  std::string divider(80, '-');
  EXPECT_EQ(data.content, "Query:\n" + divider + "\n\nprint('hi')\n\nResult:\n" + divider + "\n\nhi");
  EXPECT_EQ(data.author, "PyVal (for joe)");
  EXPECT_EQ(EvaluationPaste("a", "b", "").author, "PyVal");
  EXPECT_EQ(DefaultPasteCommand()[0], "pastebinit");
}

TEST(CommandPasteUploaderTest, Upload) {
  fs::path content = kStateDir / "paste_content", args = kStateDir / "paste_args";
  fs::path script = WriteScript("paste_ok.sh",
      "cat > '" + content.string() + "'\n"
      "echo \"$1|$2|$3\" > '" + args.string() + "'\n"
      "echo 'uploading...'\n"
      "echo 'https://paste.example.org/xyz'");
  CommandPasteUploader uploader({script.string(), "{author}", "{title}", "lang={language}"});
  auto url = uploader.Upload(SamplePaste());
  ASSERT_TRUE(url);
  EXPECT_EQ(*url, "https://paste.example.org/xyz");
  EXPECT_EQ(ReadFile(content), SamplePaste().content);
  EXPECT_EQ(ReadFile(args), "PyVal (for joe)|PyVal Evaluation Results|lang=python\n");
}

TEST(CommandPasteUploaderTest, Failures) {
  fs::path failing = WriteScript("paste_fail.sh", "cat >/dev/null\necho 'server down' >&2\nexit 1");
  EXPECT_EQ(CommandPasteUploader({failing.string()}).Upload(SamplePaste()), std::nullopt);

  fs::path no_url = WriteScript("paste_nourl.sh", "cat >/dev/null\necho 'done'");
  EXPECT_EQ(CommandPasteUploader({no_url.string()}).Upload(SamplePaste()), std::nullopt);

  fs::path slow = WriteScript("paste_slow.sh", "exec sleep 30");
  EXPECT_EQ(CommandPasteUploader({slow.string()}, 500'000).Upload(SamplePaste()), std::nullopt);

  EXPECT_EQ(CommandPasteUploader({}).Upload(SamplePaste()), std::nullopt);
}

TEST(HttpPasteUploaderTest, SplitUrl) {
  using Pair = std::pair<std::string, std::string>;
  EXPECT_EQ(HttpPasteUploader::SplitUrl("https://paste.example.org:8080/api/create"),
            Pair("https://paste.example.org:8080", "/api/create"));
  EXPECT_EQ(HttpPasteUploader::SplitUrl("http://paste.example.org"),
            Pair("http://paste.example.org", "/"));
  EXPECT_EQ(HttpPasteUploader::SplitUrl("paste.example.org/api"), Pair("", ""));
  EXPECT_FALSE(HttpPasteUploader("not a url").IsValid());
  EXPECT_EQ(HttpPasteUploader("not a url").Upload(SamplePaste()), std::nullopt);
}

TEST(HttpPasteUploaderTest, ParseReply) {
  const std::string server = "https://paste.example.org";
  EXPECT_EQ(HttpPasteUploader::ParseReply(server, R"({"status": "ok", "url": "https://p.example/1"})"),
            "https://p.example/1");
  EXPECT_EQ(HttpPasteUploader::ParseReply(server, R"({"status": "ok", "url": "/view/2"})"),
            "https://paste.example.org/view/2");
  EXPECT_EQ(HttpPasteUploader::ParseReply(server, R"({"status": "ok", "url": "view/3"})"),
            "https://paste.example.org/view/3");
  EXPECT_EQ(HttpPasteUploader::ParseReply(server, R"({"status": "error", "message": "too big"})"),
            std::nullopt);
  EXPECT_EQ(HttpPasteUploader::ParseReply(server, R"({"status": "ok"})"), std::nullopt);
  EXPECT_EQ(HttpPasteUploader::ParseReply(server, "<html>"), std::nullopt);
}
