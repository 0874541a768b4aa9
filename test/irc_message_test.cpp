#include "irc_client.h"
#include "utils.h"

TEST(IrcMessageTest, Privmsg) {
  IrcMessage msg;
  ASSERT_TRUE(ParseIrcLine(":joe!~joe@host.example.org PRIVMSG #pyval :!py print('a b')\r\n", msg));
  EXPECT_EQ(msg.prefix, "joe!~joe@host.example.org");
  EXPECT_EQ(msg.Nick(), "joe");
  EXPECT_EQ(msg.Host(), "host.example.org");
  EXPECT_EQ(msg.command, "PRIVMSG");
  ASSERT_EQ(msg.params.size(), 2u);
  EXPECT_EQ(msg.Param(0), "#pyval");
  EXPECT_EQ(msg.Param(1), "!py print('a b')");
  EXPECT_EQ(msg.Param(5), "");
}

TEST(IrcMessageTest, NoPrefix) {
  IrcMessage msg;
  ASSERT_TRUE(ParseIrcLine("PING :irc.example.org", msg));
  EXPECT_EQ(msg.prefix, "");
  EXPECT_EQ(msg.command, "PING");
  EXPECT_EQ(msg.Param(0), "irc.example.org");
}

TEST(IrcMessageTest, Numeric) {
  IrcMessage msg;
  ASSERT_TRUE(ParseIrcLine(":irc.example.org 433 * pyval :Nickname is already in use.", msg));
  EXPECT_EQ(msg.command, "433");
  ASSERT_EQ(msg.params.size(), 3u);
  EXPECT_EQ(msg.Param(1), "pyval");
  EXPECT_EQ(msg.Param(2), "Nickname is already in use.");
}

TEST(IrcMessageTest, Kick) {
  IrcMessage msg;
  ASSERT_TRUE(ParseIrcLine(":op!op@host KICK #pyval pyval :bye", msg));
  EXPECT_EQ(msg.command, "KICK");
  EXPECT_EQ(msg.Param(0), "#pyval");
  EXPECT_EQ(msg.Param(1), "pyval");
  EXPECT_EQ(msg.Param(2), "bye");
}

TEST(IrcMessageTest, CommandCase) {
  IrcMessage msg;
  ASSERT_TRUE(ParseIrcLine(":joe!j@h privmsg #pyval :hi", msg));
  EXPECT_EQ(msg.command, "PRIVMSG");
  // high bytes pass through untouched
  ASSERT_TRUE(ParseIrcLine("x\xe9y :z", msg));
  EXPECT_EQ(msg.command, "X\xe9Y");
}

TEST(IrcMessageTest, Invalid) {
  IrcMessage msg;
  EXPECT_FALSE(ParseIrcLine("", msg));
  EXPECT_FALSE(ParseIrcLine(":prefix.only", msg));
}
