#include <cerrno>
#include <system_error>
#include <pyval/exec.h>

#include "bot.h"
#include "utils.h"

namespace {

// Never touches the network: outgoing lines are recorded instead
class OfflineClient : public PyvalClient {
  RecordingTransport sent_;
  bool fail_workers_ = false;

 protected:
  void StartWorker_(std::function<void()> work) override {
    if (fail_workers_) throw std::system_error(EAGAIN, std::generic_category(), "thread");
    PyvalClient::StartWorker_(std::move(work));
  }

 public:
  using PyvalClient::PyvalClient;

  void SendLine(const std::string& line) override { sent_.SendLine(line); }
  void Quit(const std::string& message) override { sent_.Quit(message); }
  std::vector<std::string> Lines() const { return sent_.Lines(); }
  void FailWorkers() { fail_workers_ = true; }

  void Feed(const std::string& line) {
    IrcMessage msg;
    ASSERT_TRUE(ParseIrcLine(line, msg)) << line;
    OnMessage(msg);
  }
};

BotOptions TestOptions() {
  BotOptions opt;
  opt.server = "irc.example.org";
  opt.channels = {"#a", "#b"};
  opt.nickserv_password = "secret";
  opt.no_heartbeat = true;
  return opt;
}

} // namespace

class BotTest : public ::testing::Test {
 protected:
  SandboxSettings saved;
  boost::asio::io_context io;
  std::unique_ptr<Database> db;
  std::unique_ptr<BotState> state;
  std::unique_ptr<OfflineClient> client;

  void SetUp() override {
    fs::remove(DatabasePath());
    db = std::make_unique<Database>();
    state = std::make_unique<BotState>(*db, "pyval", '!', std::vector<std::string>{"admin"});
    state->limit_rate = false;
    client = std::make_unique<OfflineClient>(io, TestOptions(), *state, nullptr);
    UseSandbox(EchoSandbox());
  }
  void TearDown() override {
    state->WaitIdle();
  }
};

TEST_F(BotTest, Ping) {
  client->Feed("PING :irc.example.org");
  EXPECT_EQ(client->Lines(), (std::vector<std::string>{"PONG :irc.example.org"}));
}

TEST_F(BotTest, Welcome) {
  client->Feed(":irc.example.org 001 pyval :Welcome");
  EXPECT_EQ(client->Lines(), (std::vector<std::string>{
    "PRIVMSG NickServ :IDENTIFY pyval secret",
    "JOIN #a",
    "JOIN #b",
  }));
  // joined only once the server says so
  EXPECT_TRUE(state->Channels().empty());
}

TEST_F(BotTest, NickInUse) {
  client->Feed(":irc.example.org 433 * pyval :Nickname is already in use.");
  EXPECT_EQ(state->Nickname(), "pyval_");
  client->Feed(":irc.example.org 433 * pyval_ :Nickname is already in use.");
  EXPECT_EQ(state->Nickname(), "pyval__");
  EXPECT_EQ(client->Lines(), (std::vector<std::string>{"NICK pyval_", "NICK pyval__"}));
}

TEST_F(BotTest, RosterFollowsOwnNick) {
  client->Feed(":pyval!pyval@host JOIN #a");
  client->Feed(":pyval!pyval@host JOIN :#b");
  client->Feed(":joe!joe@host JOIN #c");
  EXPECT_EQ(state->Channels(), (std::vector<std::string>{"#a", "#b"}));

  client->Feed(":pyval!pyval@host PART #a");
  client->Feed(":op!op@host KICK #b joe :bye");
  EXPECT_EQ(state->Channels(), (std::vector<std::string>{"#b"}));
  client->Feed(":op!op@host KICK #b pyval :bye");
  EXPECT_TRUE(state->Channels().empty());

  client->Feed(":pyval!pyval@host NICK :pyval2");
  EXPECT_EQ(state->Nickname(), "pyval2");
  client->Feed(":joe!joe@host NICK :pyval3");
  EXPECT_EQ(state->Nickname(), "pyval2");
}

TEST_F(BotTest, NoticeForwarded) {
  client->Feed(":irc.example.org NOTICE * :*** Looking up your hostname");
  client->Feed(":bob!bob@host NOTICE #a :channel notice");
  EXPECT_TRUE(client->Lines().empty());
  client->Feed(":bob!bob@host NOTICE pyval :hello there");
  EXPECT_EQ(client->Lines(), (std::vector<std::string>{"PRIVMSG admin :NOTICE from bob: hello there"}));
}

TEST_F(BotTest, ZncChallenge) {
  EXPECT_EQ(ZncChallengeResponse("!ZNCAO CHALLENGE abc"),
            "!ZNCAO RESPONSE 900150983cd24fb0d6963f7d28e17f72");
  EXPECT_EQ(ZncChallengeResponse("!ZNCAO CHALLENGE"), std::nullopt);
  EXPECT_EQ(ZncChallengeResponse("hello"), std::nullopt);

  client->Feed(":bob!bob@host NOTICE pyval :!ZNCAO CHALLENGE abc");
  auto lines = client->Lines();
  ASSERT_FALSE(lines.empty());
  EXPECT_EQ(lines[0], "NOTICE bob :!ZNCAO RESPONSE 900150983cd24fb0d6963f7d28e17f72");
}

TEST_F(BotTest, CommandRepliesAfterWorker) {
  client->Feed(":joe!joe@host PRIVMSG #a :!py print('okay')");
  state->WaitIdle();
  EXPECT_EQ(client->Lines(), (std::vector<std::string>{"PRIVMSG #a :joe, okay"}));
  EXPECT_EQ(state->handled.load(), 1);

  client->Feed(":ann!ann@host PRIVMSG pyval :hello");
  client->Feed(":ann!ann@host PRIVMSG #a :!nosuchcommand");
  state->WaitIdle();
  EXPECT_EQ(client->Lines().size(), 1u);
}

TEST_F(BotTest, WaitIdleOutlastsSlowCommands) {
  kSandboxTimeout = 2'000'000;
  UseSandbox(WriteScript("sleepy_sandbox.sh", "cat >/dev/null\nsleep 1\necho late"));
  client->Feed(":joe!joe@host PRIVMSG #a :!py print('x')");
  client->Feed(":ann!ann@host PRIVMSG #a :!py print('y')");
  EXPECT_EQ(state->handling_count.load(), 2);
  state->WaitIdle();
  EXPECT_EQ(state->handling_count.load(), 0);
  EXPECT_EQ(client->Lines().size(), 2u);
}

TEST_F(BotTest, WorkerStartFailure) {
  client->FailWorkers();
  client->Feed(":joe!joe@host PRIVMSG #a :!time");
  EXPECT_EQ(state->handling_count.load(), 0);
  EXPECT_TRUE(client->Lines().empty());
}
