// -*- mode: cpp; mode: fold -*-
// Description								/*{{{*/
/* ######################################################################

   Index Locator - Find the control stanza of a package

   The package indices are tried for every component and architecture
   in the order given, each in the first compressed variant the Release
   file lists and the repository serves. Every index is verified
   against the Release file before a single stanza of it is read.

   ##################################################################### */
									/*}}}*/
#ifndef DEBFETCH_INDEXLOCATOR_H
#define DEBFETCH_INDEXLOCATOR_H

#include <debfetch-pkg/failure.h>
#include <debfetch-pkg/macros.h>

#include <string>
#include <vector>

class pkgFetcher;
class pkgReleaseFile;
class pkgSourceEntry;
class pkgTagSection;

class DEBFETCH_PUBLIC pkgIndexLocator
{
   pkgSourceEntry const &Source;
   pkgReleaseFile const &Release;
   pkgFetcher &Fetcher;
   std::string const ScratchDir;
   std::vector<std::string> Compressions;
   bool const Debug;

   DEBFETCH_HIDDEN bool ScanIndex(std::string const &File, std::string const &Name,
	 std::string const &Package, pkgTagSection &Control, bool &Found) const;

   public:
   /** \brief candidate paths for one component and architecture
    *
    *  Only the compressed variants listed in the Release file are
    *  returned, in the preferred compression order.
    */
   std::vector<std::string> Candidates(std::string const &Component, std::string const &Arch) const;

   /** \brief look for the first stanza with Package: Package
    *
    *  @param Archs are the architectures to try, in order
    *  @param[out] Control receives the stanza
    *  @param[out] Why is set if \b false is returned
    */
   bool Find(std::string const &Package, std::vector<std::string> const &Archs,
	     pkgTagSection &Control, Debfetch::Failure &Why) const;

   void SetCompressions(std::vector<std::string> const &List) { Compressions = List; }
   std::vector<std::string> const &GetCompressions() const { return Compressions; }

   pkgIndexLocator(pkgSourceEntry const &Source, pkgReleaseFile const &Release,
		   pkgFetcher &Fetcher, std::string const &ScratchDir);
   virtual ~pkgIndexLocator();
};

#endif
