// -*- mode: cpp; mode: fold -*-
// Description								/*{{{*/
/* ######################################################################

   Fast scanner for RFC-822 type header information

   Release files and package indices consist of RFC-822 type header
   fields in groups separated by a blank line. pkgTagFile steps over
   these groups in document order, pkgTagSection indexes the fields of
   one group and provides lookups by field name.

   ##################################################################### */
									/*}}}*/
#ifndef DEBFETCH_TAGFILE_H
#define DEBFETCH_TAGFILE_H

#include <debfetch-pkg/macros.h>

#include <string>
#include <string_view>
#include <vector>

class FileFd;

/** \class pkgTagSection parses a single deb822 stanza
 *
 * Field names compare case-insensitive. If a field is given more than
 * once the last occurrence is the one found. Multi-line values keep
 * their continuation lines, Find only strips the whitespace around the
 * complete value.
 */
class DEBFETCH_PUBLIC pkgTagSection
{
   struct TagData {
      std::string::size_type StartTag;
      std::string::size_type EndTag;
      std::string::size_type StartValue;
      std::string::size_type EndValue;
   };

   std::string Section;
   std::vector<TagData> Tags;

   DEBFETCH_HIDDEN TagData const * FindTag(std::string_view Tag) const;

   public:

   std::string_view Find(std::string_view Tag) const;
   std::string FindS(std::string_view Tag) const { return std::string{Find(Tag)}; }
   bool Find(std::string_view Tag, std::string &Value) const;
   signed int FindI(std::string_view Tag, signed long Default = 0) const;
   unsigned long long FindULL(std::string_view Tag, unsigned long long const &Default = 0) const;
   bool Exists(std::string_view Tag) const;

   /** \brief parse the given text as one stanza
    *
    * The text may not contain an empty line. Comment lines starting
    * with # are expected to be removed already.
    *
    * @return \b false if a line is neither a field nor a continuation
    */
   [[nodiscard]] bool Scan(const char *Start, unsigned long MaxLength);

   /** \brief amount of Tags in the current section */
   unsigned int Count() const { return Tags.size(); }
   /** \brief name and raw value of the I-th field in stanza order */
   void Get(std::string_view &Tag, std::string_view &Value, unsigned int I) const;
   inline std::string const &GetSection() const { return Section; }

   pkgTagSection();
   virtual ~pkgTagSection();
};

/** \class pkgTagFile reads stanza after stanza from a FileFd
 *
 * The FileFd may be a compressed one, the stanzas are read line by line
 * so an index never has to fit into memory as a whole.
 */
class DEBFETCH_PUBLIC pkgTagFile
{
   FileFd * const Fd;
   unsigned long Mode;
   unsigned long long Stanzas;

   public:

   enum Flags
   {
      STRICT = 0,
      SUPPORT_COMMENTS = 1 << 0,
   };

   /** \brief parse the next stanza into Section
    *
    * @return \b false at the end of the file and on errors, which are
    *  reported on the error stack
    */
   bool Step(pkgTagSection &Section);
   /** \brief number of stanzas returned by Step so far */
   unsigned long long Index() const { return Stanzas; }

   pkgTagFile(FileFd * const F, pkgTagFile::Flags const pFlags = STRICT);
   pkgTagFile(pkgTagFile const &) = delete;
   pkgTagFile &operator=(pkgTagFile const &) = delete;
   virtual ~pkgTagFile();
};

#endif
