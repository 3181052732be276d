// -*- mode: cpp; mode: fold -*-
// Description								/*{{{*/
/* ######################################################################

   Source Entry - One repository line

   The repository is given in the one-line sources.list format:

     deb [arch=amd64,arm64 signed-by=/usr/share/keyrings/x.asc] URI DIST COMP...

   Only complete distributions below dists/ are supported, so a DIST
   ending in a slash (flat repository) is refused. The parsed entry is
   never modified afterwards.

   ##################################################################### */
									/*}}}*/
#ifndef DEBFETCH_SOURCEENTRY_H
#define DEBFETCH_SOURCEENTRY_H

#include <debfetch-pkg/macros.h>

#include <map>
#include <string>
#include <vector>

class DEBFETCH_PUBLIC pkgSourceEntry
{
   std::string URI;
   std::string Dist;
   std::vector<std::string> Components;
   std::map<std::string, std::string> Options;

   public:

   /** \brief parse a repository line
    *
    *  The leading type may be omitted, in which case deb is assumed.
    *  \return \b false with an error on the stack if the line is invalid
    */
   bool Parse(std::string const &Line);

   /** \brief the base URI without trailing slashes */
   std::string const &GetURI() const { return URI; }
   std::string const &GetDist() const { return Dist; }
   std::vector<std::string> const &GetComponents() const { return Components; }

   /** \brief architectures given with arch=, empty if none */
   std::vector<std::string> GetArchitectures() const;
   /** \brief key given with signed-by=, empty if none */
   std::string GetSignedBy() const;

   /** \brief URI of a file in the repository, relative to the base URI */
   std::string ArchiveURI(std::string const &File) const;
   /** \brief URI of a file below dists/<dist>/ */
   std::string DistURI(std::string const &File) const;

   /** \brief the entry in the one-line format again */
   std::string Describe() const;

   pkgSourceEntry();
   virtual ~pkgSourceEntry();
};

#endif
