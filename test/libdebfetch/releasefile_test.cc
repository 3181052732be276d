#include <config.h>

#include <debfetch-pkg/error.h>
#include <debfetch-pkg/fileutl.h>
#include <debfetch-pkg/hashes.h>
#include <debfetch-pkg/releasefile.h>

#include <string>

#include <gtest/gtest.h>

#include "file-helpers.h"

static char const * const sha256_main = "7ce4b6d5d1d29fe35a95b7a7d5cf1d43ba9b0c62ee8fce5c6bd1e8f1b8f80ab5";
static char const * const sha256_contrib = "44bd1e5e1c1a3cc2f09ec2bb2a9f0adb14dbbb0b1e8f4e1c0c6b8e4c9b46bd2a";
static char const * const sha512_main = "2f6b1b6e8d3b9c0a8d9e7a8c2c7d6e5f4a3b2c1d0e9f8a7b6c5d4e3f2a1b0c9d"
   "8e7f6a5b4c3d2e1f0a9b8c7d6e5f4a3b2c1d0e9f8a7b6c5d4e3f2a1b0c9d8e7f";

static std::string ReleaseContent(bool const WithSHA512)
{
   std::string Content = "Origin: Debian\n"
      "Suite: stable\n"
      "Codename: bookworm\n"
      "Architectures: amd64 arm64\n"
      "Components: main contrib\n";
   if (WithSHA512 == true)
      Content.append("SHA512:\n ").append(sha512_main).append("  1234 main/binary-amd64/Packages\n");
   Content.append("SHA256:\n ").append(sha256_main).append("  1234 main/binary-amd64/Packages\n")
      .append(" ").append(sha256_contrib).append("    42 contrib/binary-amd64/Packages.xz\n")
      .append(" ").append(sha256_main).append("    99 main/binary-amd64/Packages\n");
   return Content;
}

TEST(ReleaseFileTest,SHA256Only)
{
   FileFd fd;
   openTemporaryFile("sha256release", fd, ReleaseContent(false).c_str());

   pkgReleaseFile Release;
   ASSERT_TRUE(Release.Load(fd, "bookworm/Release"));
   EXPECT_TRUE(_error->empty());
   EXPECT_EQ("stable", Release.GetSuite());
   EXPECT_EQ("bookworm", Release.GetCodename());
   EXPECT_EQ("SHA256", Release.GetChecksumType());
   // the duplicate row for main is ignored
   ASSERT_EQ(2u, Release.GetEntries().size());

   auto const Main = Release.Lookup("main/binary-amd64/Packages");
   ASSERT_NE(nullptr, Main);
   EXPECT_EQ(1234u, Main->Size);
   EXPECT_EQ("SHA256", Main->Hash.HashType());
   EXPECT_EQ(sha256_main, Main->Hash.HashValue());
   HashStringList const Expected = Main->Hashes();
   EXPECT_EQ(1234u, Expected.FileSize());
   ASSERT_NE(nullptr, Expected.find("SHA256"));
   EXPECT_EQ(sha256_main, Expected.find("SHA256")->HashValue());

   auto const Contrib = Release.Lookup("contrib/binary-amd64/Packages.xz");
   ASSERT_NE(nullptr, Contrib);
   EXPECT_EQ(42u, Contrib->Size);

   EXPECT_EQ(nullptr, Release.Lookup("contrib/binary-amd64/Packages"));
   EXPECT_EQ(nullptr, Release.Lookup("Packages"));
}
TEST(ReleaseFileTest,StrongestSectionWins)
{
   auto const file = createTemporaryFile("sha512release", ReleaseContent(true).c_str());

   pkgReleaseFile Release;
   ASSERT_TRUE(Release.Load(file.Name()));
   EXPECT_EQ("SHA512", Release.GetChecksumType());
   // rows only listed in the weaker section are not visible
   ASSERT_EQ(1u, Release.GetEntries().size());
   EXPECT_EQ(nullptr, Release.Lookup("contrib/binary-amd64/Packages.xz"));

   auto const Main = Release.Lookup("main/binary-amd64/Packages");
   ASSERT_NE(nullptr, Main);
   EXPECT_EQ("SHA512", Main->Hash.HashType());
   EXPECT_EQ(sha512_main, Main->Hash.HashValue());
   EXPECT_EQ(nullptr, Main->Hashes().find("SHA256"));
}
TEST(ReleaseFileTest,EmptySectionIsSkipped)
{
   FileFd fd;
   openTemporaryFile("emptysha512", fd, (std::string("Suite: stable\n"
	 "SHA512:\n"
	 "SHA256:\n ") + sha256_main + " 10 main/binary-amd64/Packages.gz\n").c_str());

   pkgReleaseFile Release;
   ASSERT_TRUE(Release.Load(fd, "Release"));
   EXPECT_TRUE(_error->empty());
   EXPECT_EQ("SHA256", Release.GetChecksumType());
   ASSERT_EQ(1u, Release.GetEntries().size());
   auto const Main = Release.Lookup("main/binary-amd64/Packages.gz");
   ASSERT_NE(nullptr, Main);
   EXPECT_EQ(10u, Main->Size);

   FileFd empty;
   openTemporaryFile("emptysections", empty, "Suite: stable\nSHA512:\nSHA256:\n");
   EXPECT_FALSE(Release.Load(empty, "Release"));
   std::string msg;
   EXPECT_TRUE(_error->PopMessage(msg));
   EXPECT_EQ("Neither SHA512 nor SHA256 section found in release file Release", msg);
   EXPECT_TRUE(_error->empty());
}
TEST(ReleaseFileTest,NoChecksums)
{
   FileFd fd;
   openTemporaryFile("nochecksums", fd, "Suite: stable\n"
	 "Codename: bookworm\n"
	 "MD5Sum:\n"
	 " d41d8cd98f00b204e9800998ecf8427e 0 main/binary-amd64/Packages\n"
	 "SHA1:\n"
	 " da39a3ee5e6b4b0d3255bfef95601890afd80709 0 main/binary-amd64/Packages\n");

   pkgReleaseFile Release;
   EXPECT_FALSE(Release.Load(fd, "Release"));
   std::string msg;
   EXPECT_TRUE(_error->PopMessage(msg));
   EXPECT_EQ("Neither SHA512 nor SHA256 section found in release file Release", msg);
   EXPECT_TRUE(_error->empty());
}
TEST(ReleaseFileTest,MalformedRows)
{
   char const * const Rows[] = {
      "SHA256:\n 7ce4b6d5 1234\n",
      "SHA256:\n 7ce4b6d5 12x4 main/binary-amd64/Packages\n",
      "SHA256:\n 7ce4b6d5 -12 main/binary-amd64/Packages\n",
      nullptr
   };
   for (char const * const *Row = Rows; *Row != nullptr; ++Row)
   {
      SCOPED_TRACE(*Row);
      FileFd fd;
      openTemporaryFile("malformedrow", fd, (std::string("Suite: stable\n") + *Row).c_str());
      pkgReleaseFile Release;
      EXPECT_FALSE(Release.Load(fd, "Release"));
      std::string msg;
      EXPECT_TRUE(_error->PopMessage(msg));
      EXPECT_EQ("Invalid 'SHA256' entry in Release file Release", msg);
      EXPECT_TRUE(_error->empty());
   }
}
TEST(ReleaseFileTest,EmptyFile)
{
   FileFd fd;
   openTemporaryFile("emptyrelease", fd, "");
   pkgReleaseFile Release;
   EXPECT_FALSE(Release.Load(fd, "Release"));
   EXPECT_TRUE(_error->PendingError());
   _error->Discard();
}
TEST(ReleaseFileTest,CheckDist)
{
   FileFd fd;
   openTemporaryFile("checkdist", fd, ReleaseContent(false).c_str());
   pkgReleaseFile Release;
   ASSERT_TRUE(Release.Load(fd, "Release"));

   EXPECT_TRUE(Release.CheckDist("bookworm"));
   EXPECT_TRUE(Release.CheckDist("stable"));
   EXPECT_TRUE(_error->empty());

   EXPECT_FALSE(Release.CheckDist("trixie"));
   EXPECT_FALSE(_error->PendingError());
   std::string msg;
   EXPECT_FALSE(_error->PopMessage(msg));
   EXPECT_EQ("Conflicting distribution: Release (expected trixie but got bookworm)", msg);
   EXPECT_TRUE(_error->empty());
}
