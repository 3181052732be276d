// -*- mode: cpp; mode: fold -*-
// Description								/*{{{*/
/* #####################################################################
   debfetch - download a single package from a Debian repository
   ##################################################################### */
									/*}}}*/
// Include Files							/*{{{*/
#include <config.h>

#include <debfetch-pkg/cmndline.h>
#include <debfetch-pkg/configuration.h>
#include <debfetch-pkg/downloader.h>
#include <debfetch-pkg/error.h>
#include <debfetch-pkg/fileutl.h>
#include <debfetch-pkg/init.h>
#include <debfetch-pkg/macros.h>
#include <debfetch-pkg/releasefile.h>
#include <debfetch-pkg/strutl.h>
#include <debfetch-pkg/tagfile.h>
#include <debfetch-pkg/trustverifier.h>

#include <cstring>
#include <iostream>
#include <string>
#include <vector>

#include <debfetchi18n.h>
									/*}}}*/

static bool WrongUsage = false;

static bool ShowUsage(char const * const Command)			/*{{{*/
{
   WrongUsage = true;
   return _error->Error(_("Wrong number of arguments for %s, see debfetch --help"), Command);
}
									/*}}}*/
static bool DoDownload(CommandLine &CmdL)				/*{{{*/
{
   if (CmdL.FileSize() != 3)
      return ShowUsage("download");

   std::vector<std::string> const Archs = _config->FindVector("Debfetch::Architectures",
	 _config->Find("Debfetch::Architecture"));
   pkgDownloader Downloader(CmdL.FileList[1], _config->Find("Debfetch::Key"), Archs);

   std::string Path;
   if (Downloader.Download(CmdL.FileList[2], _config->Find("Debfetch::Destination", "/tmp"), Path) == false)
   {
      if (_config->FindB("Debug::Debfetch", false) == true)
	 std::clog << "Failure: " << Debfetch::FailureName(Downloader.Failure()) << std::endl;
      return false;
   }

   std::cout << Path << std::endl;
   return true;
}
									/*}}}*/
static bool DoVerifyRelease(CommandLine &CmdL)				/*{{{*/
{
   unsigned int const Count = CmdL.FileSize();
   if (Count != 2 && Count != 3)
      return ShowUsage("verify-release");

   std::string const Key = _config->Find("Debfetch::Key");
   if (Key.empty() == true)
      return _error->Error(_("A repository key is needed to verify %s"), CmdL.FileList[1]);

   std::string const ScratchDir = CreateTemporaryDirectory("debfetch");
   if (ScratchDir.empty() == true)
      return false;
   DEFER([&] { RemoveTemporaryDirectory("verify-release", ScratchDir); });

   pkgTrustVerifier Verifier(ScratchDir);
   if (Verifier.LoadKey(Key) == false)
      return false;

   std::string const File = CmdL.FileList[1];
   std::string Content = File;
   if (Count == 3)
   {
      if (Verifier.VerifyDetached(File, CmdL.FileList[2], File) == false)
	 return false;
   }
   else if (Verifier.VerifyInline(File, File, Content) == false)
      return false;

   pkgReleaseFile Release;
   if (Release.Load(Content) == false)
      return false;

   ioprintf(std::cout, _("Good signature on %s\n"), File.c_str());
   ioprintf(std::cout, "Suite: %s\nCodename: %s\n%s: %zu\n", Release.GetSuite().c_str(),
	 Release.GetCodename().c_str(), Release.GetChecksumType().c_str(), Release.GetEntries().size());
   return true;
}
									/*}}}*/
static bool DoFindPackage(CommandLine &CmdL)				/*{{{*/
{
   if (CmdL.FileSize() != 3)
      return ShowUsage("find-package");

   FileFd Index;
   if (Index.Open(CmdL.FileList[1], FileFd::ReadOnly, FileFd::Extension) == false)
      return false;

   pkgTagFile Tags(&Index);
   pkgTagSection Section;
   while (Tags.Step(Section) == true)
   {
      if (Section.Find("Package") != CmdL.FileList[2])
	 continue;
      std::cout << Section.GetSection() << std::endl;
      return true;
   }
   if (_error->PendingError() == true)
      return false;
   return _error->Error(_("Package %s not found."), CmdL.FileList[2]);
}
									/*}}}*/
static void ShowHelp()							/*{{{*/
{
   std::cout << PACKAGE " " PACKAGE_VERSION " (" COMMON_ARCH ")" << std::endl;
   std::cout <<
      _("Usage: debfetch [options] download <repository> <package>\n"
	"       debfetch [options] verify-release <file> [<signature>]\n"
	"       debfetch [options] find-package <index-file> <package>\n"
	"\n"
	"debfetch downloads a single binary package from a Debian style\n"
	"repository after verifying the signature of the repository metadata\n"
	"and the checksums of the index and of the package.\n"
	"\n"
	"The repository is given as one sources.list line, e.g.\n"
	"  \"deb [arch=amd64] http://deb.debian.org/debian bookworm main\"\n"
	"\n"
	"Options:\n"
	"  -h  This help text\n"
	"  -k  Repository key (path or URI), without it nothing is verified\n"
	"  -a  Architecture to look for, can be given more than once\n"
	"  -d  Destination directory, default /tmp\n"
	"  -q  Loggable output, no progress indicator\n"
	"  -c=? Read this configuration file\n"
	"  -o=? Set an arbitrary configuration option, eg -o Debug::Debfetch=1\n");
}
									/*}}}*/
int main(int argc,const char *argv[])					/*{{{*/
{
   CommandLine::Args Args[] = {
      {'h',"help","help",0},
      {'v',"version","version",0},
      {'q',"quiet","quiet",CommandLine::IntLevel},
      {'k',"key","Debfetch::Key",CommandLine::HasArg},
      {'a',"architecture","Debfetch::Architectures::",CommandLine::HasArg},
      {'d',"destination","Debfetch::Destination",CommandLine::HasArg},
      {'c',"config-file",0,CommandLine::ConfigFile},
      {'o',"option",0,CommandLine::ArbItem},
      {0,0,0,0}};
   CommandLine::Dispatch const Cmds[] = {
      {"download", &DoDownload},
      {"verify-release", &DoVerifyRelease},
      {"find-package", &DoFindPackage},
      {nullptr, nullptr}};

#ifdef USE_NLS
   setlocale(LC_ALL, "");
   textdomain(PACKAGE);
#endif

   if (pkgInitConfig(*_config) == false)
   {
      _error->DumpErrors();
      return 100;
   }

   CommandLine CmdL(Args, _config);
   if (CmdL.Parse(argc, argv) == false)
   {
      _error->DumpErrors();
      return 1;
   }

   if (_config->FindB("help") == true || _config->FindB("version") == true)
   {
      ShowHelp();
      return 0;
   }
   if (CmdL.FileSize() == 0)
   {
      ShowHelp();
      return 1;
   }

   bool const Res = CmdL.DispatchArg(Cmds);
   bool const Errors = _error->PendingError();
   if (_config->FindI("quiet", 0) > 0)
      _error->DumpErrors();
   else
      _error->DumpErrors(GlobalError::DEBUG);

   if (WrongUsage == true)
      return 1;
   if (Res == false)
   {
      // an unknown command is a usage error, too
      for (auto const *C = Cmds; C->Match != nullptr; ++C)
	 if (strcmp(C->Match, CmdL.FileList[0]) == 0)
	    return 100;
      return 1;
   }
   return Errors == true ? 100 : 0;
}
									/*}}}*/
