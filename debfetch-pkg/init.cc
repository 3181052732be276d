// -*- mode: cpp; mode: fold -*-
// Description								/*{{{*/
/* ######################################################################

   Init - Initialize the package library

   ##################################################################### */
									/*}}}*/
// Include files							/*{{{*/
#include <config.h>

#include <debfetch-pkg/configuration.h>
#include <debfetch-pkg/error.h>
#include <debfetch-pkg/fileutl.h>
#include <debfetch-pkg/init.h>
#include <debfetch-pkg/strutl.h>

#include <cstdlib>
#include <cstring>
#include <string>

#include <debfetchi18n.h>
									/*}}}*/

const char *pkgVersion = PACKAGE_VERSION;

// pkgInitConfig - Initialize the configuration class			/*{{{*/
// ---------------------------------------------------------------------
/* Directories are specified in such a way that the FindDir function will
   understand them. That is, if they don't start with a / then their parent
   is prepended. */
bool pkgInitConfig(Configuration &Cnf)
{
   // Debfetch::Architectures and Debfetch::Compressions default to these
   Cnf.CndSet("Debfetch::Architecture", COMMON_ARCH);
   Cnf.CndSet("Debfetch::Compression", "gz,bz2,xz");
   Cnf.CndSet("Debfetch::Destination", "/tmp");
   Cnf.CndSet("Debfetch::Gpgv::WeakDigests", "SHA1,RIPEMD160");

   Cnf.CndSet("Dir","/");
   Cnf.CndSet("Dir::Etc", CONF_DIR + 1);
   Cnf.CndSet("Dir::Etc::main","debfetch.conf");
   Cnf.CndSet("Dir::Etc::parts","debfetch.conf.d");
   Cnf.CndSet("Dir::Bin::gpgv","/usr/bin/gpgv");

   Cnf.CndSet("Acquire::http::Timeout", 120);
   Cnf.CndSet("Acquire::http::User-Agent", std::string("Debfetch/") + PACKAGE_VERSION);
   Cnf.CndSet("Acquire::https::Verify-Peer", true);
   Cnf.CndSet("Acquire::https::Verify-Host", true);

   bool Res = true;

   // Read an alternate config file
   const char *Cfg = getenv("DEBFETCH_CONFIG");
   if (Cfg != 0 && strlen(Cfg) != 0)
   {
      if (RealFileExists(Cfg) == true)
	 Res &= ReadConfigFile(Cnf,Cfg);
      else
	 _error->WarningE("RealFileExists",_("Unable to read %s"),Cfg);
   }

   std::string const Parts = Cnf.FindDir("Dir::Etc::parts", "/dev/null");
   if (DirectoryExists(Parts) == true)
      Res &= ReadConfigDir(Cnf,Parts);

   std::string const FName = Cnf.FindFile("Dir::Etc::main", "/dev/null");
   if (RealFileExists(FName) == true)
      Res &= ReadConfigFile(Cnf,FName);

   if (Res == false)
      return false;

   if (Cnf.FindB("Debug::pkgInitConfig",false) == true)
      Cnf.Dump();

#ifdef USE_NLS
   if (Cnf.Exists("Dir::Locale"))
      bindtextdomain(PACKAGE,Cnf.FindDir("Dir::Locale").c_str());
#endif

   return true;
}
									/*}}}*/
