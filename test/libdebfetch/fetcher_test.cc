#include <config.h>

#include <debfetch-pkg/error.h>
#include <debfetch-pkg/fetcher.h>
#include <debfetch-pkg/fileutl.h>
#include <debfetch-pkg/hashes.h>
#include <debfetch-pkg/strutl.h>

#include <memory>
#include <string>

#include <gtest/gtest.h>

#include "file-helpers.h"

static char const * const abc_sha256 = "ba7816bf8f01cfea414140de5dae2223b00361a396177a9cb410ff61f20015ad";

TEST(FetcherTest,ForURI)
{
   std::unique_ptr<pkgFetcher> Fetcher = pkgFetcher::ForURI("file:///srv/mirror/dists/bookworm/Release");
   ASSERT_NE(nullptr, Fetcher);
   EXPECT_STREQ("file", Fetcher->Name());

   Fetcher = pkgFetcher::ForURI("https://deb.debian.org/debian/dists/bookworm/Release");
   ASSERT_NE(nullptr, Fetcher);
   EXPECT_STREQ("http", Fetcher->Name());
   Fetcher = pkgFetcher::ForURI("http://deb.debian.org/debian/dists/bookworm/Release");
   ASSERT_NE(nullptr, Fetcher);
   EXPECT_TRUE(_error->empty());

   Fetcher = pkgFetcher::ForURI("ftp://ftp.debian.org/debian/dists/bookworm/Release");
   EXPECT_EQ(nullptr, Fetcher);
   std::string msg;
   EXPECT_TRUE(_error->PopMessage(msg));
   EXPECT_EQ("The method driver ftp could not be found.", msg);
   EXPECT_TRUE(_error->empty());
}
TEST(FetcherTest,FileFetcher)
{
   std::string tempdir;
   createTemporaryDirectory("filefetcher", tempdir);
   writeFile(tempdir, "abc", "abc");
   createDirectory(tempdir, "dir");

   FileFetcher Fetcher;
   HashStringList Result;
   std::string const Dest = flCombine(tempdir, "fetched");
   EXPECT_EQ(pkgFetcher::Ok, Fetcher.Fetch("file://" + tempdir + "/abc", Dest, Result));
   EXPECT_EQ("abc\n", readFile(Dest));
   EXPECT_EQ(3u, Result.FileSize());
   ASSERT_NE(nullptr, Result.find("SHA256"));
   EXPECT_EQ(abc_sha256, Result.find("SHA256")->HashValue());
   ASSERT_NE(nullptr, Result.find("SHA512"));

   // missing files and directories are not there, but not an error
   EXPECT_EQ(pkgFetcher::NotFound, Fetcher.Fetch("file://" + tempdir + "/missing", Dest, Result));
   EXPECT_FALSE(FileExists(Dest));
   EXPECT_EQ(pkgFetcher::NotFound, Fetcher.Fetch("file://" + tempdir + "/dir", Dest, Result));
   EXPECT_EQ(pkgFetcher::NotFound, Fetcher.Fetch("file://" + tempdir + "/abc/sub", Dest, Result));
   EXPECT_TRUE(_error->empty());

   EXPECT_EQ(pkgFetcher::TransportFailed, Fetcher.Fetch("file://example.org" + tempdir + "/abc", Dest, Result));
   std::string msg;
   EXPECT_TRUE(_error->PopMessage(msg));
   EXPECT_EQ("Invalid URI, local URIS must not start with //", msg);
   EXPECT_TRUE(_error->empty());

   removeDirectory(tempdir);
}
TEST(FetcherTest,VerifyFetched)
{
   Hashes abc;
   abc.Add("abc");
   HashStringList const Received = abc.GetHashStringList();

   HashStringList Expected;
   Expected.push_back(HashString("SHA256", abc_sha256));
   EXPECT_TRUE(VerifyFetched("abc", Expected, Received));
   Expected.FileSize(3);
   EXPECT_TRUE(VerifyFetched("abc", Expected, Received));
   EXPECT_TRUE(_error->empty());

   std::string msg;
   HashStringList WrongSize;
   WrongSize.push_back(HashString("SHA256", abc_sha256));
   WrongSize.FileSize(4);
   EXPECT_FALSE(VerifyFetched("abc", WrongSize, Received));
   EXPECT_TRUE(_error->PopMessage(msg));
   EXPECT_TRUE(Debfetch::String::Startswith(msg, "Checksum mismatch on repository item abc\n"));
   EXPECT_NE(std::string::npos, msg.find("Hashes of expected file: SHA256:" + std::string(abc_sha256) + " Size:4"));
   EXPECT_NE(std::string::npos, msg.find("Hashes of received file: SHA256:" + std::string(abc_sha256) + " Size:3"));

   HashStringList WrongHash;
   WrongHash.push_back(HashString("SHA256", "0000000000000000000000000000000000000000000000000000000000000000"));
   WrongHash.FileSize(3);
   EXPECT_FALSE(VerifyFetched("abc", WrongHash, Received));
   EXPECT_TRUE(_error->PopMessage(msg));
   EXPECT_TRUE(Debfetch::String::Startswith(msg, "Checksum mismatch on repository item abc\n"));

   // the received side has to carry the expected type
   HashStringList OnlySHA256;
   OnlySHA256.push_back(HashString("SHA256", abc_sha256));
   HashStringList WantSHA512;
   WantSHA512.push_back(abc.GetHashString(Hashes::SHA512SUM));
   EXPECT_FALSE(VerifyFetched("abc", WantSHA512, OnlySHA256));
   EXPECT_TRUE(_error->PopMessage(msg));

   HashStringList OnlySize;
   OnlySize.FileSize(3);
   EXPECT_FALSE(VerifyFetched("abc", OnlySize, Received));
   EXPECT_TRUE(_error->PopMessage(msg));
   EXPECT_EQ("No checksum found for abc", msg);
   EXPECT_TRUE(_error->empty());
}
