// -*- mode: cpp; mode: fold -*-
// Description								/*{{{*/
/* ######################################################################

   Downloader - Fetch one binary package from a repository

   ##################################################################### */
									/*}}}*/
// Include Files							/*{{{*/
#include <config.h>

#include <debfetch-pkg/configuration.h>
#include <debfetch-pkg/downloader.h>
#include <debfetch-pkg/error.h>
#include <debfetch-pkg/fetcher.h>
#include <debfetch-pkg/fileutl.h>
#include <debfetch-pkg/hashes.h>
#include <debfetch-pkg/indexlocator.h>
#include <debfetch-pkg/macros.h>
#include <debfetch-pkg/payload.h>
#include <debfetch-pkg/releasefile.h>
#include <debfetch-pkg/sourceentry.h>
#include <debfetch-pkg/strutl.h>
#include <debfetch-pkg/tagfile.h>
#include <debfetch-pkg/trustverifier.h>

#include <iostream>
#include <memory>
#include <string>
#include <vector>

#include <debfetchi18n.h>
									/*}}}*/

using std::string;
using std::vector;

pkgDownloader::pkgDownloader(string const &Repository, string const &RepositoryKey,
			     vector<string> const &Architectures) :
   Repository(Repository), RepositoryKey(RepositoryKey), Architectures(Architectures),
   LastFailure(Debfetch::Failure::None), Debug(_config->FindB("Debug::Debfetch", false))
{
}
pkgDownloader::~pkgDownloader() {}

// Downloader::Fail - Remember the first failure			/*{{{*/
bool pkgDownloader::Fail(Debfetch::Failure const Why)
{
   if (LastFailure == Debfetch::Failure::None)
      LastFailure = Why;
   if (Debug == true)
      std::clog << "Download failed: " << Debfetch::FailureName(Why) << std::endl;
   return false;
}
									/*}}}*/
// Downloader::FetchRelease - Get and authenticate the metadata		/*{{{*/
// ---------------------------------------------------------------------
/* InRelease is optional, any failure to get it falls back to Release.
   Release is mandatory and so is Release.gpg if there is a key to
   check it with. */
bool pkgDownloader::FetchRelease(pkgSourceEntry const &Source, pkgFetcher &Fetcher,
				 pkgTrustVerifier &Verifier, string const &Package,
				 string const &ScratchDir, pkgReleaseFile &Release)
{
   HashStringList Ignored;
   string const InRelease = flCombine(ScratchDir, "InRelease");
   string const InReleaseURI = Source.DistURI("InRelease");

   _error->PushToStack();
   bool const HaveInRelease = Fetcher.Fetch(InReleaseURI, InRelease, Ignored) == pkgFetcher::Ok;
   if (HaveInRelease == true)
      _error->MergeWithStack();
   else
   {
      if (Debug == true)
      {
	 std::clog << "No InRelease at " << URI::NoUserPassword(InReleaseURI) << std::endl;
	 _error->DumpErrors(std::clog, GlobalError::DEBUG, false);
      }
      _error->RevertToStack();
   }

   string Signed = InRelease;
   string SignedURI = InReleaseURI;
   string Signature;
   if (HaveInRelease == false)
   {
      Signed = flCombine(ScratchDir, "Release");
      SignedURI = Source.DistURI("Release");
      if (Fetcher.Fetch(SignedURI, Signed, Ignored) != pkgFetcher::Ok)
      {
	 _error->Error(_("Unable to fetch archive element '%s'"), URI::NoUserPassword(SignedURI).c_str());
	 return Fail(Debfetch::Failure::RepositoryUnreachable);
      }
      if (Verifier.HasKey() == true)
      {
	 Signature = flCombine(ScratchDir, "Release.gpg");
	 string const SignatureURI = Source.DistURI("Release.gpg");
	 if (Fetcher.Fetch(SignatureURI, Signature, Ignored) != pkgFetcher::Ok)
	 {
	    _error->Error(_("Unable to fetch archive element '%s'"), URI::NoUserPassword(SignatureURI).c_str());
	    return Fail(Debfetch::Failure::RepositoryUnreachable);
	 }
      }
   }

   string Content;
   string const Name = URI::NoUserPassword(SignedURI);
   if (Verifier.HasKey() == true)
   {
      if (HaveInRelease == true)
      {
	 if (Verifier.VerifyInline(Signed, Name, Content) == false)
	    return Fail(Debfetch::Failure::SignatureVerificationFailed);
      }
      else
      {
	 if (Verifier.VerifyDetached(Signed, Signature, Name) == false)
	    return Fail(Debfetch::Failure::SignatureVerificationFailed);
	 Content = Signed;
      }
   }
   else
   {
      _error->Warning(_("Package %s will get downloaded without verification!"), Package.c_str());
      if (Verifier.ExtractUnverified(Signed, Name, Content) == false)
	 return Fail(Debfetch::Failure::SignatureVerificationFailed);
   }

   if (Release.Load(Content) == false)
      return Fail(Debfetch::Failure::NoChecksumSection);
   Release.CheckDist(Source.GetDist());
   return true;
}
									/*}}}*/
// Downloader::Download - Run all stages for one package		/*{{{*/
bool pkgDownloader::Download(string const &Package, string const &Dest, string &Path)
{
   LastFailure = Debfetch::Failure::None;
   Path.clear();

   if (Repository.empty() == true)
   {
      _error->Error(_("Missing argument 'repository'"));
      return Fail(Debfetch::Failure::InvalidRepositorySpec);
   }
   if (Package.empty() == true)
   {
      _error->Error(_("Missing argument package_name"));
      return Fail(Debfetch::Failure::InvalidRepositorySpec);
   }

   pkgSourceEntry Source;
   if (Source.Parse(Repository) == false)
      return Fail(Debfetch::Failure::InvalidRepositorySpec);

   vector<string> Archs = Source.GetArchitectures();
   if (Archs.empty() == true)
      for (auto const &A : Architectures)
	 if (A.empty() == false)
	    Archs.push_back(A);
   if (Archs.empty() == true)
   {
      _error->Error(_("Missing (non empty) list 'architectures'"));
      return Fail(Debfetch::Failure::InvalidRepositorySpec);
   }

   if (DirectoryExists(Dest) == false)
   {
      _error->Error(_("Destination directory %s does not exist"), Dest.c_str());
      return Fail(Debfetch::Failure::InvalidDestination);
   }

   std::unique_ptr<pkgFetcher> Fetcher = pkgFetcher::ForURI(Source.GetURI());
   if (Fetcher == nullptr)
      return Fail(Debfetch::Failure::InvalidRepositorySpec);

   string const ScratchDir = CreateTemporaryDirectory("debfetch");
   if (ScratchDir.empty() == true)
      return Fail(Debfetch::Failure::InvalidDestination);
   DEFER([&] { RemoveTemporaryDirectory("pkgDownloader::Download", ScratchDir); });

   if (Debug == true)
      std::clog << "Downloading " << Package << " from " << Source.Describe()
		<< " for " << Debfetch::String::Join(Archs, ",") << " via " << ScratchDir << std::endl;

   pkgTrustVerifier Verifier(ScratchDir);
   string const Key = RepositoryKey.empty() == false ? RepositoryKey : Source.GetSignedBy();
   if (Key.empty() == false && Verifier.LoadKey(Key) == false)
      return Fail(Debfetch::Failure::SignatureVerificationFailed);

   pkgReleaseFile Release;
   if (FetchRelease(Source, *Fetcher, Verifier, Package, ScratchDir, Release) == false)
      return false;

   pkgIndexLocator Locator(Source, Release, *Fetcher, ScratchDir);
   pkgTagSection Control;
   Debfetch::Failure Why = Debfetch::Failure::None;
   if (Locator.Find(Package, Archs, Control, Why) == false)
      return Fail(Why);

   pkgPayloadFetcher Payload(Source, *Fetcher, ScratchDir);
   if (Payload.Fetch(Control, Dest, Path, Why) == false)
      return Fail(Why);
   return true;
}
									/*}}}*/
