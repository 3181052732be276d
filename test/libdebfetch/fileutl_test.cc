#include <config.h>

#include <debfetch-pkg/error.h>
#include <debfetch-pkg/fileutl.h>
#include <debfetch-pkg/strutl.h>

#include <string>
#include <vector>
#include <stdlib.h>
#include <string.h>
#include <fcntl.h>
#include <sys/stat.h>
#include <unistd.h>

#include <gtest/gtest.h>

#include "file-helpers.h"

static void TestFileFd(std::string const &dir, FileFd::CompressMode const compress, char const * const ext)
{
   std::string trace;
   strprintf(trace, "TestFileFd: compression %c extension %s", static_cast<char>(compress), ext);
   SCOPED_TRACE(trace);

   std::string const fname = flCombine(dir, std::string("Packages") + ext);
   std::string const test = "Package: hello\nVersion: 2.10-3\n\nPackage: world\n";

   FileFd f;
   EXPECT_TRUE(f.Open(fname, FileFd::WriteEmpty, compress));
   EXPECT_TRUE(f.IsOpen());
   EXPECT_FALSE(f.Failed());
   EXPECT_EQ(compress != FileFd::None, f.IsCompressed());
   EXPECT_TRUE(f.Write(test.c_str(), test.size()));
   EXPECT_TRUE(f.Close());
   EXPECT_FALSE(f.IsOpen());
   EXPECT_FALSE(f.Failed());

   // the extension is enough to find the right decompressor
   EXPECT_TRUE(f.Open(fname, FileFd::ReadOnly, FileFd::Extension));
   EXPECT_TRUE(f.IsOpen());
   EXPECT_EQ(compress != FileFd::None, f.IsCompressed());
   EXPECT_NE(0u, f.FileSize());
   EXPECT_EQ(test.size(), f.Size());
   EXPECT_EQ(0u, f.Tell());

   char readback[20];
   memset(readback, 'D', sizeof(readback));
   EXPECT_TRUE(f.Read(readback, 7));
   EXPECT_EQ(0, strncmp("Package", readback, 7));
   EXPECT_EQ(7u, f.Tell());

   EXPECT_TRUE(f.Skip(2));
   std::string line;
   EXPECT_TRUE(f.ReadLine(line));
   EXPECT_EQ("hello", line);
   EXPECT_EQ(15u, f.Tell());

   // backwards
   EXPECT_TRUE(f.Seek(9));
   EXPECT_TRUE(f.ReadLine(line));
   EXPECT_EQ("hello", line);

   std::vector<std::string> lines;
   EXPECT_TRUE(f.Seek(0));
   while (f.ReadLine(line))
      lines.push_back(line);
   EXPECT_FALSE(f.Failed());
   ASSERT_EQ(4u, lines.size());
   EXPECT_EQ("Package: hello", lines[0]);
   EXPECT_EQ("Version: 2.10-3", lines[1]);
   EXPECT_EQ("", lines[2]);
   EXPECT_EQ("Package: world", lines[3]);

   unsigned long long actual = 0;
   EXPECT_TRUE(f.Seek(0));
   char all[200];
   EXPECT_TRUE(f.Read(all, sizeof(all), &actual));
   EXPECT_EQ(test.size(), actual);
   EXPECT_TRUE(f.Eof());
   EXPECT_EQ(test, std::string(all, actual));

   // reading too much without Actual is an error
   EXPECT_TRUE(f.Seek(0));
   EXPECT_FALSE(f.Read(all, sizeof(all)));
   EXPECT_TRUE(f.Failed());
   EXPECT_TRUE(_error->PendingError());
   _error->Discard();
   f.Close();
}
TEST(FileUtlTest, FileFD)
{
   std::string tempdir;
   createTemporaryDirectory("filefd", tempdir);
   TestFileFd(tempdir, FileFd::None, "");
   TestFileFd(tempdir, FileFd::Gzip, ".gz");
   TestFileFd(tempdir, FileFd::Bzip2, ".bz2");
   TestFileFd(tempdir, FileFd::Xz, ".xz");
   removeDirectory(tempdir);
}
TEST(FileUtlTest, UnknownExtensionIsUncompressed)
{
   std::string tempdir;
   createTemporaryDirectory("extension", tempdir);
   writeFile(tempdir, "Packages.zst", "Package: hello\n");
   FileFd f;
   EXPECT_TRUE(f.Open(flCombine(tempdir, "Packages.zst"), FileFd::ReadOnly, FileFd::Extension));
   EXPECT_FALSE(f.IsCompressed());
   std::string line;
   EXPECT_TRUE(f.ReadLine(line));
   EXPECT_EQ("Package: hello", line);
   EXPECT_FALSE(f.ReadLine(line));
   EXPECT_FALSE(f.Failed());
   f.Close();
   removeDirectory(tempdir);
}
TEST(FileUtlTest, CorruptCompressedFile)
{
   std::string tempdir;
   createTemporaryDirectory("corrupt", tempdir);
   writeFile(tempdir, "Packages.xz", "this is not xz compressed at all\n");
   FileFd f;
   ASSERT_TRUE(f.Open(flCombine(tempdir, "Packages.xz"), FileFd::ReadOnly, FileFd::Extension));
   std::string line;
   EXPECT_FALSE(f.ReadLine(line));
   EXPECT_TRUE(f.Failed());
   EXPECT_TRUE(_error->PendingError());
   _error->Discard();
   f.Close();
   _error->Discard();
   removeDirectory(tempdir);
}
TEST(FileUtlTest, DeleteOnFailure)
{
   std::string tempdir;
   createTemporaryDirectory("delonfail", tempdir);
   std::string const fname = flCombine(tempdir, "hello_2.10-3_amd64.deb");
   {
      FileFd f;
      ASSERT_TRUE(f.Open(fname, FileFd::WriteTemp, 0600));
      f.EraseOnFailure();
      EXPECT_TRUE(f.Write("partial", 7));
      EXPECT_TRUE(RealFileExists(fname));
      f.OpFail();
      f.Close();
   }
   EXPECT_FALSE(FileExists(fname));
   {
      FileFd f;
      ASSERT_TRUE(f.Open(fname, FileFd::WriteTemp, 0600));
      f.EraseOnFailure();
      EXPECT_TRUE(f.Write("complete", 8));
      EXPECT_TRUE(f.Close());
   }
   EXPECT_TRUE(RealFileExists(fname));
   struct stat st;
   ASSERT_EQ(0, stat(fname.c_str(), &st));
   EXPECT_EQ(0600u, st.st_mode & 0777);
   removeDirectory(tempdir);
}
TEST(FileUtlTest, FileNames)
{
   EXPECT_EQ("Packages.xz", flNotDir("main/binary-amd64/Packages.xz"));
   EXPECT_EQ("Packages.xz", flNotDir("Packages.xz"));
   EXPECT_EQ("main/binary-amd64/", flNotFile("main/binary-amd64/Packages.xz"));
   EXPECT_EQ("./", flNotFile("Packages.xz"));
   EXPECT_EQ("xz", flExtension("main/binary-amd64/Packages.xz"));
   EXPECT_EQ("Packages", flExtension("Packages"));
   EXPECT_EQ("/tmp/hello.deb", flCombine("/tmp", "hello.deb"));
   EXPECT_EQ("/tmp/hello.deb", flCombine("/tmp/", "hello.deb"));
   EXPECT_EQ("/srv/hello.deb", flCombine("/tmp", "/srv/hello.deb"));
   EXPECT_EQ("./hello.deb", flCombine("/tmp", "./hello.deb"));
   EXPECT_EQ("hello.deb", flCombine("", "hello.deb"));
   EXPECT_EQ("", flCombine("/tmp", ""));
}
TEST(FileUtlTest, flAbsPath)
{
   std::string tempdir;
   createTemporaryDirectory("abspath", tempdir);
   createDirectory(tempdir, "dest");
   std::string const real = flAbsPath(tempdir);
   ASSERT_FALSE(real.empty());
   EXPECT_EQ(real + "/dest", flAbsPath(tempdir + "/dest/../dest/"));

   EXPECT_EQ("", flAbsPath(tempdir + "/does-not-exist"));
   EXPECT_TRUE(_error->PendingError());
   _error->Discard();
   removeDirectory(tempdir);
}
TEST(FileUtlTest, GetTempFile)
{
   FileFd fd;
   EXPECT_NE(nullptr, GetTempFile("debfetch-unlinked", true, &fd));
   EXPECT_TRUE(fd.IsOpen());
   EXPECT_TRUE(fd.Name().empty());
   EXPECT_TRUE(fd.Write("x", 1));
   EXPECT_TRUE(fd.Close());

   auto const file = createTemporaryFile("gettempfile", "content");
   EXPECT_NE(std::string::npos, file.Name().find("/debfetch-gettempfile."));
   EXPECT_TRUE(RealFileExists(file.Name()));
   EXPECT_EQ("content\n", readFile(file.Name()));
}
TEST(FileUtlTest, TemporaryDirectory)
{
   std::string const dir = CreateTemporaryDirectory("debfetch-scratch");
   ASSERT_FALSE(dir.empty());
   EXPECT_TRUE(DirectoryExists(dir));
   EXPECT_EQ(GetTempDir(), flNotFile(dir).substr(0, flNotFile(dir).size() - 1));
   writeFile(dir, "InRelease", "content");
   writeFile(dir, "Packages.xz", "content");
   EXPECT_EQ(2u, GetListOfFilesInDir(dir, "").size());
   EXPECT_TRUE(RemoveTemporaryDirectory("TemporaryDirectory", dir));
   EXPECT_FALSE(DirectoryExists(dir));
   // already gone is fine
   EXPECT_TRUE(RemoveTemporaryDirectory("TemporaryDirectory", dir));
}
TEST(FileUtlTest, GetListOfFilesInDir)
{
   std::string tempdir;
   createTemporaryDirectory("listoffiles", tempdir);
   writeFile(tempdir, "50proxy.conf", "");
   writeFile(tempdir, "10keys.conf", "");
   writeFile(tempdir, ".hidden.conf", "");
   writeFile(tempdir, "notes.txt", "");
   createDirectory(tempdir, "sub.conf");

   std::vector<std::string> const files = GetListOfFilesInDir(tempdir, "conf");
   ASSERT_EQ(2u, files.size());
   EXPECT_EQ(tempdir + "/10keys.conf", files[0]);
   EXPECT_EQ(tempdir + "/50proxy.conf", files[1]);

   EXPECT_TRUE(GetListOfFilesInDir(tempdir + "/missing", "conf").empty());
   EXPECT_TRUE(_error->PendingError());
   _error->Discard();
   removeDirectory(tempdir);
}
TEST(FileUtlTest, CopyAndRename)
{
   std::string tempdir;
   createTemporaryDirectory("copy", tempdir);
   writeFile(tempdir, "source.deb", "debian-binary\n");

   FileFd From, To;
   ASSERT_TRUE(From.Open(flCombine(tempdir, "source.deb"), FileFd::ReadOnly));
   ASSERT_TRUE(To.Open(flCombine(tempdir, "copy.deb.partial"), FileFd::WriteEmpty));
   EXPECT_TRUE(CopyFile(From, To));
   EXPECT_TRUE(From.Close());
   EXPECT_TRUE(To.Close());

   EXPECT_TRUE(Rename(flCombine(tempdir, "copy.deb.partial"), flCombine(tempdir, "copy.deb")));
   EXPECT_FALSE(FileExists(flCombine(tempdir, "copy.deb.partial")));
   EXPECT_EQ("debian-binary\n", readFile(flCombine(tempdir, "copy.deb")));

   EXPECT_FALSE(Rename(flCombine(tempdir, "missing.deb"), flCombine(tempdir, "other.deb")));
   EXPECT_TRUE(_error->PendingError());
   _error->Discard();

   EXPECT_TRUE(RemoveFile("CopyAndRename", flCombine(tempdir, "copy.deb")));
   EXPECT_TRUE(RemoveFile("CopyAndRename", flCombine(tempdir, "copy.deb")));
   removeDirectory(tempdir);
}
TEST(FileUtlTest, StartsWithGPGClearTextSignature)
{
   auto const plain = createTemporaryFile("plain", "Origin: Debian\n");
   EXPECT_FALSE(StartsWithGPGClearTextSignature(plain.Name()));
   auto const signed_file = createTemporaryFile("signed", "-----BEGIN PGP SIGNED MESSAGE-----\r\nHash: SHA512\r\n");
   EXPECT_TRUE(StartsWithGPGClearTextSignature(signed_file.Name()));
   EXPECT_FALSE(StartsWithGPGClearTextSignature("/does/not/exist"));
   EXPECT_TRUE(_error->empty());
}
TEST(FileUtlTest, DescriptorFlags)
{
   int fd[2];
   ASSERT_EQ(0, pipe(fd));
   SetCloseExec(fd[0], true);
   EXPECT_NE(0, fcntl(fd[0], F_GETFD) & FD_CLOEXEC);
   SetCloseExec(fd[0], false);
   EXPECT_EQ(0, fcntl(fd[0], F_GETFD) & FD_CLOEXEC);
   close(fd[0]);
   close(fd[1]);
}
