// -*- mode: cpp; mode: fold -*-
// Description								/*{{{*/
/* ######################################################################

   Payload Fetcher - Download the package file itself

   ##################################################################### */
									/*}}}*/
// Include Files							/*{{{*/
#include <config.h>

#include <debfetch-pkg/configuration.h>
#include <debfetch-pkg/error.h>
#include <debfetch-pkg/fetcher.h>
#include <debfetch-pkg/fileutl.h>
#include <debfetch-pkg/hashes.h>
#include <debfetch-pkg/payload.h>
#include <debfetch-pkg/selectfirst.h>
#include <debfetch-pkg/sourceentry.h>
#include <debfetch-pkg/strutl.h>
#include <debfetch-pkg/tagfile.h>

#include <cerrno>
#include <cstdio>
#include <iostream>
#include <optional>
#include <string>

#include <debfetchi18n.h>
									/*}}}*/

using std::string;

pkgPayloadFetcher::ChecksumField const pkgPayloadFetcher::ChecksumFields[] = {
   { "SHA512", "SHA512" },
   { "sha512", "SHA512" },
   { "SHA256", "SHA256" },
   { "sha256", "SHA256" },
   { nullptr, nullptr }
};

pkgPayloadFetcher::pkgPayloadFetcher(pkgSourceEntry const &Source, pkgFetcher &Fetcher,
				     string const &ScratchDir) :
   Source(Source), Fetcher(Fetcher), ScratchDir(ScratchDir),
   Debug(_config->FindB("Debug::Debfetch", false))
{
}
pkgPayloadFetcher::~pkgPayloadFetcher() {}

// PayloadFetcher::ExpectedHashes - Pick the checksum field		/*{{{*/
// ---------------------------------------------------------------------
/* This table is separate from pkgReleaseFile::ChecksumSections even
   though both currently accept the same two algorithms. */
bool pkgPayloadFetcher::ExpectedHashes(pkgTagSection const &Control, HashStringList &Hashes)
{
   Hashes.clear();
   auto const Hash = Debfetch::select_first_available(ChecksumFields,
	 [&](ChecksumField const &F) -> std::optional<HashString> {
	    if (F.Field == nullptr)
	       return std::nullopt;
	    string const Value = Control.FindS(F.Field);
	    if (Value.empty() == true)
	       return std::nullopt;
	    return HashString(F.Type, Value);
	 });
   if (Hash.has_value() == false)
      return false;
   if (Hashes.push_back(*Hash) == false)
      return false;

   unsigned long long const Size = Control.FindULL("Size", 0);
   if (Control.Exists("Size") == true && Hashes.FileSize(Size) == false)
      return false;
   return true;
}
									/*}}}*/
// PayloadFetcher::Install - Move the verified file into place		/*{{{*/
// ---------------------------------------------------------------------
/* The scratch directory may live on another filesystem, in that case
   the file is copied next to its final name and renamed there. */
bool pkgPayloadFetcher::Install(string const &Staged, string const &Final) const
{
   if (rename(Staged.c_str(), Final.c_str()) == 0)
      return true;
   if (errno != EXDEV)
      return _error->Errno("rename", _("rename failed (%s -> %s)."), Staged.c_str(), Final.c_str());

   string const Partial = Final + ".partial";
   {
      FileFd From, To;
      if (From.Open(Staged, FileFd::ReadOnly) == false ||
	    To.Open(Partial, FileFd::WriteEmpty, 0644) == false)
	 return false;
      To.EraseOnFailure();
      if (CopyFile(From, To) == false)
      {
	 To.OpFail();
	 return false;
      }
      if (To.Close() == false)
	 return false;
   }
   return Rename(Partial, Final);
}
									/*}}}*/
// PayloadFetcher::Fetch - Download and verify the package		/*{{{*/
bool pkgPayloadFetcher::Fetch(pkgTagSection const &Control, string const &Dest, string &Path,
			      Debfetch::Failure &Why) const
{
   string const Package = Control.FindS("Package");
   string const Filename = Control.FindS("Filename");
   string const Base = flNotDir(Filename);
   if (Filename.empty() == true || Base.empty() == true || Base == "." || Base == "..")
   {
      Why = Debfetch::Failure::PackageNotFound;
      return _error->Error(_("The package index files are corrupted. No Filename: field for package %s."),
	    Package.c_str());
   }

   HashStringList Expected;
   if (ExpectedHashes(Control, Expected) == false)
   {
      Why = Debfetch::Failure::NoChecksumSection;
      return _error->Error(_("No checksum found for %s"), Package.c_str());
   }

   string const Uri = Source.ArchiveURI(Filename);
   string const Staged = flCombine(ScratchDir, Base);
   HashStringList Received;
   switch (Fetcher.Fetch(Uri, Staged, Received))
   {
      case pkgFetcher::Ok:
	 break;
      case pkgFetcher::NotFound:
      case pkgFetcher::TransportFailed:
	 Why = Debfetch::Failure::RepositoryUnreachable;
	 return _error->Error(_("Unable to fetch archive element '%s'"), URI::NoUserPassword(Uri).c_str());
   }

   if (VerifyFetched(URI::NoUserPassword(Uri), Expected, Received) == false)
   {
      RemoveFile("pkgPayloadFetcher::Fetch", Staged);
      Why = Debfetch::Failure::ChecksumMismatch;
      return false;
   }

   string const Final = flCombine(flAbsPath(Dest), Base);
   if (Install(Staged, Final) == false)
   {
      RemoveFile("pkgPayloadFetcher::Fetch", Staged);
      Why = Debfetch::Failure::InvalidDestination;
      return false;
   }

   if (Debug == true)
      std::clog << "Stored " << Package << " as " << Final << std::endl;
   Path = Final;
   return true;
}
									/*}}}*/
