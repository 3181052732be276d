// -*- mode: cpp; mode: fold -*-
// Description								/*{{{*/
/* ######################################################################

   Payload Fetcher - Download the package file itself

   The package is fetched into the scratch directory and verified with
   the checksum of its control stanza. Only a verified file is moved
   into the destination directory.

   ##################################################################### */
									/*}}}*/
#ifndef DEBFETCH_PAYLOAD_H
#define DEBFETCH_PAYLOAD_H

#include <debfetch-pkg/failure.h>
#include <debfetch-pkg/macros.h>

#include <string>

class HashStringList;
class pkgFetcher;
class pkgSourceEntry;
class pkgTagSection;

class DEBFETCH_PUBLIC pkgPayloadFetcher
{
   pkgSourceEntry const &Source;
   pkgFetcher &Fetcher;
   std::string const ScratchDir;
   bool const Debug;

   DEBFETCH_HIDDEN bool Install(std::string const &Staged, std::string const &Final) const;

   public:
   /** \brief checksum fields of a control stanza in order of preference
    *
    *  Each entry pairs the field name with the hash type it carries,
    *  the list ends with a NULL field.
    */
   struct ChecksumField
   {
      char const *Field;
      char const *Type;
   };
   static ChecksumField const ChecksumFields[];

   /** \brief the expected hash (and size if given) of a control stanza
    *
    *  \return \b false if none of the ChecksumFields is present
    */
   static bool ExpectedHashes(pkgTagSection const &Control, HashStringList &Hashes);

   /** \brief download the package described by Control into Dest
    *
    *  @param Dest is an existing directory
    *  @param[out] Path is the absolute path of the stored package
    *  @param[out] Why is set if \b false is returned
    */
   bool Fetch(pkgTagSection const &Control, std::string const &Dest, std::string &Path,
	      Debfetch::Failure &Why) const;

   pkgPayloadFetcher(pkgSourceEntry const &Source, pkgFetcher &Fetcher, std::string const &ScratchDir);
   virtual ~pkgPayloadFetcher();
};

#endif
