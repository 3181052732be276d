// -*- mode: cpp; mode: fold -*-
// Description								/*{{{*/
/* ######################################################################

   Downloader - Fetch one binary package from a repository

   A download runs the stages strictly one after the other:

     repository line -> Release metadata -> trust -> index -> package

   All intermediate files live in a scratch directory which is removed
   when Download returns, whatever the outcome. The first failing stage
   ends the download and its kind is available from Failure(), the
   messages are on the error stack.

   ##################################################################### */
									/*}}}*/
#ifndef DEBFETCH_DOWNLOADER_H
#define DEBFETCH_DOWNLOADER_H

#include <debfetch-pkg/failure.h>
#include <debfetch-pkg/macros.h>

#include <string>
#include <vector>

class pkgFetcher;
class pkgReleaseFile;
class pkgSourceEntry;
class pkgTrustVerifier;

class DEBFETCH_PUBLIC pkgDownloader
{
   std::string const Repository;
   std::string const RepositoryKey;
   std::vector<std::string> const Architectures;
   Debfetch::Failure LastFailure;
   bool const Debug;

   DEBFETCH_HIDDEN bool Fail(Debfetch::Failure const Why);
   DEBFETCH_HIDDEN bool FetchRelease(pkgSourceEntry const &Source, pkgFetcher &Fetcher,
	 pkgTrustVerifier &Verifier, std::string const &Package, std::string const &ScratchDir,
	 pkgReleaseFile &Release);

   public:
   /** \brief download a package into Dest
    *
    *  @param Package is the name of the binary package
    *  @param Dest is an existing directory
    *  @param[out] Path is the absolute path of the downloaded file
    *  @return \b false if any stage failed, see Failure()
    */
   bool Download(std::string const &Package, std::string const &Dest, std::string &Path);

   /** \brief the kind of the first failure of the last Download */
   Debfetch::Failure Failure() const { return LastFailure; }

   /**
    *  @param Repository is a line in the one-line sources.list format
    *  @param RepositoryKey is a path or URI of the key, empty to skip
    *  the verification
    *  @param Architectures are used if the line has no arch= option
    */
   pkgDownloader(std::string const &Repository, std::string const &RepositoryKey,
		 std::vector<std::string> const &Architectures);
   pkgDownloader(pkgDownloader const &) = delete;
   pkgDownloader &operator=(pkgDownloader const &) = delete;
   virtual ~pkgDownloader();
};

#endif
