// -*- mode: cpp; mode: fold -*-
// Description								/*{{{*/
/* ######################################################################

   Index Locator - Find the control stanza of a package

   ##################################################################### */
									/*}}}*/
// Include Files							/*{{{*/
#include <config.h>

#include <debfetch-pkg/configuration.h>
#include <debfetch-pkg/error.h>
#include <debfetch-pkg/fetcher.h>
#include <debfetch-pkg/fileutl.h>
#include <debfetch-pkg/hashes.h>
#include <debfetch-pkg/indexlocator.h>
#include <debfetch-pkg/releasefile.h>
#include <debfetch-pkg/selectfirst.h>
#include <debfetch-pkg/sourceentry.h>
#include <debfetch-pkg/strutl.h>
#include <debfetch-pkg/tagfile.h>

#include <algorithm>
#include <iostream>
#include <optional>
#include <string>
#include <vector>

#include <debfetchi18n.h>
									/*}}}*/

using std::string;
using std::vector;

pkgIndexLocator::pkgIndexLocator(pkgSourceEntry const &Source, pkgReleaseFile const &Release,
				 pkgFetcher &Fetcher, string const &ScratchDir) :
   Source(Source), Release(Release), Fetcher(Fetcher), ScratchDir(ScratchDir),
   Compressions(_config->FindVector("Debfetch::Compressions",
	    _config->Find("Debfetch::Compression", "gz,bz2,xz"))),
   Debug(_config->FindB("Debug::Debfetch", false))
{
}
pkgIndexLocator::~pkgIndexLocator() {}

// IndexLocator::Candidates - Listed variants of one index		/*{{{*/
vector<string> pkgIndexLocator::Candidates(string const &Component, string const &Arch) const
{
   string const Prefix = Component + "/binary-" + Arch + "/Packages";
   vector<string> List;
   for (auto const &Ext : Compressions)
   {
      // the uncompressed index is not a candidate
      if (Ext.empty() == true || Ext == ".")
	 continue;
      string const MetaKey = Prefix + "." + Ext;
      if (Release.Lookup(MetaKey) == nullptr)
      {
	 if (Debug == true)
	    std::clog << MetaKey << " is not listed in the Release file" << std::endl;
	 continue;
      }
      if (std::find(List.begin(), List.end(), MetaKey) == List.end())
	 List.push_back(MetaKey);
   }
   return List;
}
									/*}}}*/
// IndexLocator::ScanIndex - Look through one verified index		/*{{{*/
bool pkgIndexLocator::ScanIndex(string const &File, string const &Name,
				string const &Package, pkgTagSection &Control, bool &Found) const
{
   Found = false;
   FileFd Fd;
   if (Fd.Open(File, FileFd::ReadOnly, FileFd::Extension) == false)
      return false;

   pkgTagFile Tags(&Fd);
   pkgTagSection Section;
   while (Tags.Step(Section) == true)
   {
      if (Section.Find("Package") != Package)
	 continue;
      Control = Section;
      Found = true;
      if (Debug == true)
	 std::clog << "Found " << Package << " in stanza " << Tags.Index() << " of " << Name << std::endl;
      return true;
   }

   if (Fd.Failed() == true || _error->PendingError() == true)
      return _error->Error(_("Unable to read the index %s"), Name.c_str());
   return true;
}
									/*}}}*/
// IndexLocator::Find - Search the indices for a package		/*{{{*/
// ---------------------------------------------------------------------
/* A candidate which is missing on the server is skipped, everything else
   that goes wrong with a candidate ends the search. */
bool pkgIndexLocator::Find(string const &Package, vector<string> const &Archs,
			   pkgTagSection &Control, Debfetch::Failure &Why) const
{
   struct Fetched
   {
      Debfetch::Failure Why;
      string File;
      string Name;
   };

   for (auto const &Component : Source.GetComponents())
   {
      for (auto const &Arch : Archs)
      {
	 auto const Result = Debfetch::select_first_available(Candidates(Component, Arch),
	       [&](string const &MetaKey) -> std::optional<Fetched> {
		  pkgReleaseFile::IndexEntry const * const Entry = Release.Lookup(MetaKey);
		  string const Uri = Source.DistURI(MetaKey);
		  string Local = MetaKey;
		  std::replace(Local.begin(), Local.end(), '/', '_');
		  Local = flCombine(ScratchDir, Local);

		  HashStringList Received;
		  switch (Fetcher.Fetch(Uri, Local, Received))
		  {
		     case pkgFetcher::NotFound:
			if (Debug == true)
			   std::clog << "Skipping missing index " << Uri << std::endl;
			return std::nullopt;
		     case pkgFetcher::TransportFailed:
			_error->Error(_("Unable to fetch archive element '%s'"), URI::NoUserPassword(Uri).c_str());
			return Fetched{Debfetch::Failure::RepositoryUnreachable, "", Uri};
		     case pkgFetcher::Ok:
			break;
		  }

		  if (VerifyFetched(URI::NoUserPassword(Uri), Entry->Hashes(), Received) == false)
		  {
		     RemoveFile("pkgIndexLocator::Find", Local);
		     return Fetched{Debfetch::Failure::ChecksumMismatch, "", Uri};
		  }
		  return Fetched{Debfetch::Failure::None, Local, Uri};
	       });

	 if (Result.has_value() == false)
	    continue;
	 if (Result->Why != Debfetch::Failure::None)
	 {
	    Why = Result->Why;
	    return false;
	 }

	 bool Found = false;
	 bool const Scanned = ScanIndex(Result->File, Result->Name, Package, Control, Found);
	 RemoveFile("pkgIndexLocator::Find", Result->File);
	 if (Scanned == false)
	 {
	    Why = Debfetch::Failure::PackageNotFound;
	    return false;
	 }
	 if (Found == true)
	    return true;
      }
   }

   Why = Debfetch::Failure::PackageNotFound;
   return _error->Error(_("Package %s not found."), Package.c_str());
}
									/*}}}*/
