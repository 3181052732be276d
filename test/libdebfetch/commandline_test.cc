#include <config.h>

#include <debfetch-pkg/cmndline.h>
#include <debfetch-pkg/configuration.h>
#include <debfetch-pkg/error.h>

#include <string>
#include <vector>

#include <gtest/gtest.h>

#include "file-helpers.h"

TEST(CommandLineTest,Parsing)
{
   CommandLine::Args Args[] = {
      { 't', 0, "Test::Worked", 0 },
      { 'T', "testing", "Test::Worked", CommandLine::HasArg },
      { 'z', "zero", "Test::Zero", 0 },
      { 'o', "option", 0, CommandLine::ArbItem },
      {0,0,0,0}
   };
   ::Configuration c;
   CommandLine CmdL(Args, &c);

   char const * argv[] = { "test", "--zero", "-t" };
   EXPECT_TRUE(CmdL.Parse(3 , argv));
   EXPECT_TRUE(c.FindB("Test::Worked", false));
   EXPECT_TRUE(c.FindB("Test::Zero", false));

   c.Clear("Test");
   EXPECT_FALSE(c.FindB("Test::Worked", false));
   EXPECT_FALSE(c.FindB("Test::Zero", false));

   c.Set("Test::Zero", true);
   EXPECT_TRUE(c.FindB("Test::Zero", false));

   char const * argv2[] = { "test", "--no-zero", "-t" };
   EXPECT_TRUE(CmdL.Parse(3 , argv2));
   EXPECT_TRUE(c.FindB("Test::Worked", false));
   EXPECT_FALSE(c.FindB("Test::Zero", false));

   c.Clear("Test");
   {
   char const * argv[] = { "test", "-T", "yes" };
   EXPECT_TRUE(CmdL.Parse(3 , argv));
   EXPECT_TRUE(c.FindB("Test::Worked", false));
   EXPECT_EQ("yes", c.Find("Test::Worked", "no"));
   EXPECT_EQ(0u, CmdL.FileSize());
   }
   c.Clear("Test");
   {
   char const * argv[] = { "test", "-T=yes" };
   EXPECT_TRUE(CmdL.Parse(2 , argv));
   EXPECT_TRUE(c.Exists("Test::Worked"));
   EXPECT_EQ("yes", c.Find("Test::Worked", "no"));
   EXPECT_EQ(0u, CmdL.FileSize());
   }
   c.Clear("Test");
   {
   char const * argv[] = { "test", "--testing=yes", "download" };
   EXPECT_TRUE(CmdL.Parse(3 , argv));
   EXPECT_EQ("yes", c.Find("Test::Worked", "no"));
   ASSERT_EQ(1u, CmdL.FileSize());
   EXPECT_STREQ("download", CmdL.FileList[0]);
   }
   c.Clear("Test");
   {
   char const * argv[] = { "test", "-o", "Test::Worked=Das ist ein Test", "--", "-t" };
   EXPECT_TRUE(CmdL.Parse(5 , argv));
   EXPECT_EQ("Das ist ein Test", c.Find("Test::Worked", "no"));
   EXPECT_FALSE(c.FindB("Test::Zero", false));
   ASSERT_EQ(1u, CmdL.FileSize());
   EXPECT_STREQ("-t", CmdL.FileList[0]);
   }
}
TEST(CommandLineTest,DebfetchOptions)
{
   CommandLine::Args Args[] = {
      {'q',"quiet","quiet",CommandLine::IntLevel},
      {'k',"key","Debfetch::Key",CommandLine::HasArg},
      {'a',"architecture","Debfetch::Architectures::",CommandLine::HasArg},
      {'d',"destination","Debfetch::Destination",CommandLine::HasArg},
      {'c',"config-file",0,CommandLine::ConfigFile},
      {0,0,0,0}
   };
   ::Configuration c;
   CommandLine CmdL(Args, &c);

   auto const conffile = createTemporaryFile("commandline", "Debfetch::Destination \"/var/cache/debfetch\";\n");
   std::string const conf = "--config-file=" + conffile.Name();
   char const * argv[] = { "debfetch", "-qq", "-k", "/usr/share/keyrings/debian-archive-keyring.gpg",
      "-a", "amd64", "--architecture=i386", conf.c_str(), "download",
      "deb http://deb.debian.org/debian bookworm main", "hello" };
   EXPECT_TRUE(CmdL.Parse(sizeof(argv)/sizeof(argv[0]), argv));
   EXPECT_EQ(2, c.FindI("quiet"));
   EXPECT_EQ("/usr/share/keyrings/debian-archive-keyring.gpg", c.Find("Debfetch::Key"));
   std::vector<std::string> const archs = c.FindVector("Debfetch::Architectures");
   ASSERT_EQ(2u, archs.size());
   EXPECT_EQ("amd64", archs[0]);
   EXPECT_EQ("i386", archs[1]);
   EXPECT_EQ("/var/cache/debfetch", c.Find("Debfetch::Destination"));
   ASSERT_EQ(3u, CmdL.FileSize());
   EXPECT_STREQ("download", CmdL.FileList[0]);
   EXPECT_STREQ("deb http://deb.debian.org/debian bookworm main", CmdL.FileList[1]);
   EXPECT_STREQ("hello", CmdL.FileList[2]);

   c.Clear("quiet");
   {
   char const * argv[] = { "debfetch", "-q=5", "-d", "/srv" };
   EXPECT_TRUE(CmdL.Parse(4, argv));
   EXPECT_EQ(5, c.FindI("quiet"));
   EXPECT_EQ("/srv", c.Find("Debfetch::Destination"));
   }
}
TEST(CommandLineTest,Errors)
{
   CommandLine::Args Args[] = {
      {'k',"key","Debfetch::Key",CommandLine::HasArg},
      {'q',"quiet","quiet",CommandLine::IntLevel},
      {'o',"option",0,CommandLine::ArbItem},
      {0,0,0,0}
   };
   ::Configuration c;
   CommandLine CmdL(Args, &c);
   std::string msg;

   {
   char const * argv[] = { "debfetch", "-x" };
   EXPECT_FALSE(CmdL.Parse(2, argv));
   EXPECT_TRUE(_error->PopMessage(msg));
   EXPECT_EQ("Command line option 'x' [from -x] is not understood in combination with the other options.", msg);
   }
   {
   char const * argv[] = { "debfetch", "--unknown" };
   EXPECT_FALSE(CmdL.Parse(2, argv));
   EXPECT_TRUE(_error->PopMessage(msg));
   EXPECT_EQ("Command line option --unknown is not understood in combination with the other options", msg);
   }
   {
   char const * argv[] = { "debfetch", "--key" };
   EXPECT_FALSE(CmdL.Parse(2, argv));
   EXPECT_TRUE(_error->PopMessage(msg));
   EXPECT_EQ("Option --key requires an argument.", msg);
   }
   {
   char const * argv[] = { "debfetch", "--quiet=loud" };
   EXPECT_FALSE(CmdL.Parse(2, argv));
   EXPECT_TRUE(_error->PopMessage(msg));
   EXPECT_EQ("Option --quiet=loud requires an integer argument, not 'loud'", msg);
   }
   {
   char const * argv[] = { "debfetch", "--no-key" };
   EXPECT_FALSE(CmdL.Parse(2, argv));
   EXPECT_TRUE(_error->PopMessage(msg));
   EXPECT_EQ("Command line option --no-key is not boolean", msg);
   }
   {
   char const * argv[] = { "debfetch", "-o", "Debug::Debfetch" };
   EXPECT_FALSE(CmdL.Parse(3, argv));
   EXPECT_TRUE(_error->PopMessage(msg));
   EXPECT_NE(std::string::npos, msg.find("must have an =<val>"));
   }
   EXPECT_TRUE(_error->empty());
}

static bool handlerCalled = false;
static bool DoSucceed(CommandLine &)
{
   handlerCalled = true;
   return true;
}
static bool DoFailSilently(CommandLine &)
{
   return false;
}
TEST(CommandLineTest,DispatchArg)
{
   CommandLine::Args Args[] = {{0,0,0,0}};
   CommandLine::Dispatch const Cmds[] = {
      {"download", &DoSucceed},
      {"find-package", &DoFailSilently},
      {nullptr, nullptr}
   };
   ::Configuration c;
   CommandLine CmdL(Args, &c);
   std::string msg;

   {
   char const * argv[] = { "debfetch" };
   EXPECT_TRUE(CmdL.Parse(1, argv));
   EXPECT_FALSE(CmdL.DispatchArg(Cmds));
   EXPECT_TRUE(_error->PopMessage(msg));
   EXPECT_EQ("No operation given", msg);
   EXPECT_FALSE(CmdL.DispatchArg(Cmds, false));
   EXPECT_TRUE(_error->empty());
   }
   {
   char const * argv[] = { "debfetch", "download", "repo", "hello" };
   EXPECT_TRUE(CmdL.Parse(4, argv));
   handlerCalled = false;
   EXPECT_TRUE(CmdL.DispatchArg(Cmds));
   EXPECT_TRUE(handlerCalled);
   }
   {
   char const * argv[] = { "debfetch", "find-package" };
   EXPECT_TRUE(CmdL.Parse(2, argv));
   EXPECT_FALSE(CmdL.DispatchArg(Cmds));
   EXPECT_TRUE(_error->PopMessage(msg));
   EXPECT_EQ("Handler silently failed", msg);
   }
   {
   char const * argv[] = { "debfetch", "upload" };
   EXPECT_TRUE(CmdL.Parse(2, argv));
   EXPECT_FALSE(CmdL.DispatchArg(Cmds));
   EXPECT_TRUE(_error->PopMessage(msg));
   EXPECT_EQ("Invalid operation upload", msg);
   }
   EXPECT_TRUE(_error->empty());
}
