#include <config.h>

#include <debfetch-pkg/configuration.h>
#include <debfetch-pkg/error.h>
#include <debfetch-pkg/fileutl.h>

#include <sstream>
#include <string>
#include <vector>

#include <gtest/gtest.h>

#include "file-helpers.h"

TEST(ConfigurationTest,Lists)
{
	Configuration Cnf;

	Cnf.Set("Debfetch::Architectures::", "amd64");
	Cnf.Set("Debfetch::Architectures::", "i386");
	Cnf.Set("Debfetch::Architectures::", "arm64");
	std::vector<std::string> vec = Cnf.FindVector("Debfetch::Architectures");
	ASSERT_EQ(3u, vec.size());
	EXPECT_EQ("amd64", vec[0]);
	EXPECT_EQ("i386", vec[1]);
	EXPECT_EQ("arm64", vec[2]);

	Cnf.Clear("Debfetch::Architectures", "i386");
	vec = Cnf.FindVector("Debfetch::Architectures");
	ASSERT_EQ(2u, vec.size());
	EXPECT_EQ("amd64", vec[0]);
	EXPECT_EQ("arm64", vec[1]);

	// a single value is split on commas
	Cnf.Set("Debfetch::Compression", "gz, bz2,xz");
	vec = Cnf.FindVector("Debfetch::Compression");
	ASSERT_EQ(3u, vec.size());
	EXPECT_EQ("gz", vec[0]);
	EXPECT_EQ(" bz2", vec[1]);
	EXPECT_EQ("xz", vec[2]);

	vec = Cnf.FindVector("Debfetch::Compressions", "gz,xz");
	ASSERT_EQ(2u, vec.size());
	EXPECT_EQ("gz", vec[0]);
	EXPECT_EQ("xz", vec[1]);

	Cnf.Clear("Debfetch::Architectures");
	EXPECT_TRUE(Cnf.FindVector("Debfetch::Architectures").empty());
}
TEST(ConfigurationTest,Integers)
{
	Configuration Cnf;

	EXPECT_FALSE(Cnf.Exists("Acquire::http::Timeout"));
	EXPECT_EQ(0, Cnf.FindI("Acquire::http::Timeout"));
	EXPECT_EQ(120, Cnf.FindI("Acquire::http::Timeout", 120));
	Cnf.CndSet("Acquire::http::Timeout", 30);
	EXPECT_TRUE(Cnf.Exists("Acquire::http::Timeout"));
	EXPECT_EQ(30, Cnf.FindI("Acquire::http::Timeout", 120));
	Cnf.CndSet("Acquire::http::Timeout", 60);
	EXPECT_EQ(30, Cnf.FindI("Acquire::http::Timeout", 120));
	Cnf.Set("Acquire::http::Timeout", 60);
	EXPECT_EQ(60, Cnf.FindI("Acquire::http::Timeout", 120));
	Cnf.Set("Acquire::http::Timeout", "nonsense");
	EXPECT_EQ(120, Cnf.FindI("Acquire::http::Timeout", 120));
}
TEST(ConfigurationTest,Booleans)
{
	Configuration Cnf;
	EXPECT_TRUE(Cnf.FindB("Acquire::https::Verify-Peer", true));
	for (auto const value : { "false", "no", "0", "off", "disable" })
	{
		Cnf.Set("Acquire::https::Verify-Peer", value);
		EXPECT_FALSE(Cnf.FindB("Acquire::https::Verify-Peer", true)) << value;
	}
	for (auto const value : { "true", "yes", "1", "on", "enable" })
	{
		Cnf.Set("Acquire::https::Verify-Peer", value);
		EXPECT_TRUE(Cnf.FindB("Acquire::https::Verify-Peer", false)) << value;
	}
	// case does not matter for tags
	EXPECT_TRUE(Cnf.FindB("acquire::HTTPS::verify-peer", false));
}
TEST(ConfigurationTest,Files)
{
	Configuration Cnf;
	Cnf.Set("Dir", "/");
	Cnf.Set("Dir::Etc", "etc/debfetch");
	Cnf.Set("Dir::Etc::main", "debfetch.conf");
	Cnf.Set("Dir::Etc::parts", "debfetch.conf.d");
	Cnf.Set("Dir::Bin::gpgv", "/usr/bin/gpgv");

	EXPECT_EQ("/etc/debfetch/debfetch.conf", Cnf.FindFile("Dir::Etc::main"));
	EXPECT_EQ("/etc/debfetch/debfetch.conf.d/", Cnf.FindDir("Dir::Etc::parts"));
	EXPECT_EQ("/usr/bin/gpgv", Cnf.FindFile("Dir::Bin::gpgv"));
	EXPECT_EQ("/dev/null", Cnf.FindDir("Dir::Etc::missing", "/dev/null"));

	Cnf.Set("Dir", "/srv/chroot");
	EXPECT_EQ("/srv/chroot/etc/debfetch/debfetch.conf", Cnf.FindFile("Dir::Etc::main"));
	Cnf.Set("Dir::Etc", "/etc/debfetch/");
	EXPECT_EQ("/etc/debfetch/debfetch.conf", Cnf.FindFile("Dir::Etc::main"));
}
TEST(ConfigurationTest,ReadFile)
{
	auto const file = createTemporaryFile("configuration", R"(// debfetch settings
Debfetch {
   Architectures { "amd64"; "i386"; };
   Destination "/var/cache/debfetch";
   Key "/usr/share/keyrings/debian-archive-keyring.gpg";
};
Acquire::http::Timeout "30";   # short
/* Debug::Debfetch "true"; */
Acquire::http::User-Agent "Debfetch tests";
#clear Debfetch::Architectures;
Debfetch::Architectures:: "arm64";
)");

	Configuration Cnf;
	ASSERT_TRUE(ReadConfigFile(Cnf, file.Name()));
	std::vector<std::string> const archs = Cnf.FindVector("Debfetch::Architectures");
	ASSERT_EQ(1u, archs.size());
	EXPECT_EQ("arm64", archs[0]);
	EXPECT_EQ("/var/cache/debfetch", Cnf.Find("Debfetch::Destination"));
	EXPECT_EQ("/usr/share/keyrings/debian-archive-keyring.gpg", Cnf.Find("Debfetch::Key"));
	EXPECT_EQ(30, Cnf.FindI("Acquire::http::Timeout"));
	EXPECT_EQ("Debfetch tests", Cnf.Find("Acquire::http::User-Agent"));
	EXPECT_FALSE(Cnf.Exists("Debug::Debfetch"));
}
TEST(ConfigurationTest,ReadFileSyntaxErrors)
{
	auto const file = createTemporaryFile("configuration", "Debfetch {\n  Destination \"/tmp\";\n};\n};\n");
	Configuration Cnf;
	EXPECT_FALSE(ReadConfigFile(Cnf, file.Name()));
	EXPECT_TRUE(_error->PendingError());
	std::string text;
	EXPECT_TRUE(_error->PopMessage(text));
	EXPECT_NE(std::string::npos, text.find("Unbalanced closing brace"));
	_error->Discard();
}
TEST(ConfigurationTest,Dump)
{
	Configuration Cnf;
	Cnf.Set("Debfetch::Destination", "/tmp");
	Cnf.Set("Debfetch::Architectures::", "amd64");
	std::ostringstream out;
	Cnf.Dump(out);
	EXPECT_EQ("Debfetch \"\";\nDebfetch::Destination \"/tmp\";\nDebfetch::Architectures \"\";\nDebfetch::Architectures:: \"amd64\";\n", out.str());
}
