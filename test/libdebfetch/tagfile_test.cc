#include <config.h>

#include <debfetch-pkg/error.h>
#include <debfetch-pkg/fileutl.h>
#include <debfetch-pkg/tagfile.h>

#include <string>
#include <string_view>

#include <gtest/gtest.h>

#include "file-helpers.h"

static std::string const packages = R"(Package: hello
Version: 2.10-3
Architecture: amd64
Filename: pool/main/h/hello/hello_2.10-3_amd64.deb
Size: 53052
SHA256: 35b1508eeee9c1dfba798c4c04304ef0f266990f936a51f165571edf53325cbc
Description: example package based on GNU hello
 The GNU hello program produces a familiar, friendly greeting.
 .
 It allows non-programmers to use a classic computer science tool.

Package: world
Version: 1.0
Size: -1
Priority: optional
priority: extra
)";

TEST(TagFileTest,SingleField)
{
   FileFd fd;
   openTemporaryFile("singlefield", fd, "FieldA-12345678: the value of the field");

   pkgTagFile tfile(&fd);
   pkgTagSection section;
   ASSERT_TRUE(tfile.Step(section));

   // It has one field
   EXPECT_EQ(1u, section.Count());
   // ... and it is called FieldA-12345678
   EXPECT_TRUE(section.Exists("FieldA-12345678"));
   // its value is correct
   EXPECT_EQ("the value of the field", section.FindS("FieldA-12345678"));
   // A non-existent field has an empty string as value
   EXPECT_EQ("", section.FindS("FieldB-12345678"));
   // ... and Exists does not lie about missing fields...
   EXPECT_FALSE(section.Exists("FieldB-12345678"));
   // There is only one section in this tag file
   EXPECT_FALSE(tfile.Step(section));
   EXPECT_EQ(1u, tfile.Index());
   EXPECT_TRUE(_error->empty());
}
TEST(TagFileTest,MultipleSections)
{
   auto const file = createTemporaryFile("packages", packages.c_str());
   FileFd fd;
   ASSERT_TRUE(fd.Open(file.Name(), FileFd::ReadOnly));
   pkgTagFile tfile(&fd);
   pkgTagSection section;

   ASSERT_TRUE(tfile.Step(section));
   EXPECT_EQ(7u, section.Count());
   EXPECT_EQ("hello", section.Find("Package"));
   EXPECT_EQ("pool/main/h/hello/hello_2.10-3_amd64.deb", section.FindS("filename"));
   EXPECT_EQ(53052u, section.FindULL("Size"));
   EXPECT_EQ(53052, section.FindI("SIZE"));
   std::string value;
   EXPECT_TRUE(section.Find("SHA256", value));
   EXPECT_EQ("35b1508eeee9c1dfba798c4c04304ef0f266990f936a51f165571edf53325cbc", value);
   EXPECT_FALSE(section.Find("SHA512", value));
   EXPECT_EQ("example package based on GNU hello\n"
	 " The GNU hello program produces a familiar, friendly greeting.\n"
	 " .\n"
	 " It allows non-programmers to use a classic computer science tool.",
	 section.FindS("Description"));

   std::string_view tag, raw;
   section.Get(tag, raw, 0);
   EXPECT_EQ("Package", tag);
   EXPECT_EQ(" hello", raw);

   ASSERT_TRUE(tfile.Step(section));
   EXPECT_EQ(5u, section.Count());
   EXPECT_EQ("world", section.FindS("Package"));
   // the last occurrence wins
   EXPECT_EQ("extra", section.FindS("Priority"));
   EXPECT_EQ(42u, section.FindULL("Size", 42));
   EXPECT_EQ(-1, section.FindI("Size", 42));
   EXPECT_EQ(7, section.FindI("Version", 7));
   EXPECT_EQ("Package: world\nVersion: 1.0\nSize: -1\nPriority: optional\npriority: extra\n", section.GetSection());

   EXPECT_FALSE(tfile.Step(section));
   EXPECT_EQ(2u, tfile.Index());
   EXPECT_TRUE(_error->empty());
}
TEST(TagFileTest,CompressedIndex)
{
   std::string tempdir;
   createTemporaryDirectory("compressedindex", tempdir);
   writeCompressedFile(tempdir, "Packages.xz", FileFd::Xz, packages);

   FileFd fd;
   ASSERT_TRUE(fd.Open(flCombine(tempdir, "Packages.xz"), FileFd::ReadOnly, FileFd::Extension));
   pkgTagFile tfile(&fd);
   pkgTagSection section;
   unsigned int count = 0;
   while (tfile.Step(section))
      ++count;
   EXPECT_EQ(2u, count);
   EXPECT_EQ("world", section.FindS("Package"));
   EXPECT_FALSE(fd.Failed());
   fd.Close();
   removeDirectory(tempdir);
}
TEST(TagFileTest,SeparatorLines)
{
   FileFd fd;
   openTemporaryFile("separators", fd, "\n\nOrigin: Debian\r\nLabel: Debian\r\n \t\r\n\n\nPackage: hello\n   \nPackage: world");

   pkgTagFile tfile(&fd);
   pkgTagSection section;
   ASSERT_TRUE(tfile.Step(section));
   EXPECT_EQ(2u, section.Count());
   EXPECT_EQ("Debian", section.FindS("Label"));
   ASSERT_TRUE(tfile.Step(section));
   EXPECT_EQ("hello", section.FindS("Package"));
   ASSERT_TRUE(tfile.Step(section));
   EXPECT_EQ("world", section.FindS("Package"));
   EXPECT_FALSE(tfile.Step(section));
   EXPECT_TRUE(_error->empty());
}
TEST(TagFileTest,Comments)
{
   char const * const content = "# a leading comment\nPackage: hello\n# Version: 1.0\nVersion: 2.0\n";
   {
      FileFd fd;
      openTemporaryFile("comments", fd, content);
      pkgTagFile tfile(&fd, pkgTagFile::SUPPORT_COMMENTS);
      pkgTagSection section;
      ASSERT_TRUE(tfile.Step(section));
      EXPECT_EQ(2u, section.Count());
      EXPECT_EQ("2.0", section.FindS("Version"));
   }
   {
      FileFd fd;
      openTemporaryFile("comments", fd, content);
      pkgTagFile tfile(&fd);
      pkgTagSection section;
      EXPECT_FALSE(tfile.Step(section));
      EXPECT_TRUE(_error->PendingError());
      std::string msg;
      EXPECT_TRUE(_error->PopMessage(msg));
      EXPECT_NE(std::string::npos, msg.find("Unable to parse package file"));
      EXPECT_TRUE(_error->empty());
   }
}
TEST(TagSectionTest,Scan)
{
   pkgTagSection section;
   std::string const valid = "Package: hello\nDepends: libc6 (>= 2.34),\n  libfoo\n";
   ASSERT_TRUE(section.Scan(valid.c_str(), valid.length()));
   EXPECT_EQ(2u, section.Count());
   EXPECT_EQ("libc6 (>= 2.34),\n  libfoo", section.FindS("Depends"));

   std::string const continuation = " starts with a continuation\n";
   EXPECT_FALSE(section.Scan(continuation.c_str(), continuation.length()));
   std::string const nocolon = "Package hello\n";
   EXPECT_FALSE(section.Scan(nocolon.c_str(), nocolon.length()));
   std::string const notag = ": hello\n";
   EXPECT_FALSE(section.Scan(notag.c_str(), notag.length()));

   std::string const spaced = "Package : hello\nEmpty:\n";
   ASSERT_TRUE(section.Scan(spaced.c_str(), spaced.length()));
   EXPECT_EQ("hello", section.FindS("Package"));
   EXPECT_TRUE(section.Exists("Empty"));
   EXPECT_EQ("", section.FindS("Empty"));
}
