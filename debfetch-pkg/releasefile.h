// -*- mode: cpp; mode: fold -*-
// Description								/*{{{*/
/* ######################################################################

   Release File - The checksum manifest of a distribution

   Only the first stanza of the (already verified) Release content is
   read. Of its checksum sections exactly one is used, the strongest
   one present, and every index file is verified against that one.

   ##################################################################### */
									/*}}}*/
#ifndef DEBFETCH_RELEASEFILE_H
#define DEBFETCH_RELEASEFILE_H

#include <debfetch-pkg/hashes.h>
#include <debfetch-pkg/macros.h>

#include <map>
#include <string>
#include <vector>

class FileFd;
class pkgTagSection;

class DEBFETCH_PUBLIC pkgReleaseFile
{
   public:
   /** \brief one row of the selected checksum section */
   struct IndexEntry
   {
      std::string MetaKey;
      unsigned long long Size;
      HashString Hash;

      /** the expected hash and size as a list for comparisons */
      HashStringList Hashes() const;
   };

   /** \brief checksum sections in order of preference, NULL terminated */
   static char const * const ChecksumSections[];

   private:
   std::string Filename;
   std::string Suite;
   std::string Codename;
   std::string ChecksumType;
   std::vector<IndexEntry> Entries;
   std::map<std::string, size_t> ByMetaKey;

   DEBFETCH_HIDDEN bool ParseSection(pkgTagSection const &Section, std::string const &Type);

   public:
   /** \brief read the Release content in Filename
    *
    *  Fails if the file can't be parsed, if it contains neither a
    *  SHA512 nor a SHA256 section or if a row of the selected section
    *  is malformed.
    */
   bool Load(std::string const &Filename);
   /** \brief read the Release content from an open file
    *  @param Name is used in messages instead of the name of Fd */
   bool Load(FileFd &Fd, std::string const &Name);

   std::string const &GetSuite() const { return Suite; }
   std::string const &GetCodename() const { return Codename; }
   /** \brief name of the selected section, e.g. SHA512 */
   std::string const &GetChecksumType() const { return ChecksumType; }
   std::vector<IndexEntry> const &GetEntries() const { return Entries; }

   /** \brief row for a path relative to the dists/<dist>/ directory
    *  \return NULL if the path is not listed */
   IndexEntry const *Lookup(std::string const &MetaKey) const;

   /** \brief warn if neither Codename nor Suite names Dist
    *  \return \b false if a warning was emitted */
   bool CheckDist(std::string const &Dist) const;

   pkgReleaseFile();
   virtual ~pkgReleaseFile();
};

#endif
