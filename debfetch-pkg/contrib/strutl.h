// -*- mode: cpp; mode: fold -*-
// SPDX-License-Identifier: GPL-2.0+
// Description								/*{{{*/
/* ######################################################################

   String Util - Small string helpers used by the parsers

   Word splitting for the repository line and the configuration files,
   URI decomposition, case insensitive comparison of field names and
   the base64 codec needed to dearmor repository keys.

   ##################################################################### */
									/*}}}*/
#ifndef DEBFETCH_STRUTL_H
#define DEBFETCH_STRUTL_H

#include <cstddef>
#include <cstring>
#include <iostream>
#include <string>
#include <vector>

#include <debfetch-pkg/macros.h>

namespace Debfetch {
   namespace String {
      DEBFETCH_PUBLIC std::string Strip(const std::string &s);
      DEBFETCH_PUBLIC bool Endswith(const std::string &s, const std::string &ending);
      DEBFETCH_PUBLIC bool Startswith(const std::string &s, const std::string &starting);
      DEBFETCH_PUBLIC std::string Join(std::vector<std::string> const &list, const std::string &sep);
   }
}

DEBFETCH_PUBLIC bool ParseQuoteWord(const char *&String,std::string &Res);
DEBFETCH_PUBLIC bool ParseCWord(const char *&String,std::string &Res);
DEBFETCH_PUBLIC std::string QuoteString(const std::string &Str,const char *Bad);
DEBFETCH_PUBLIC std::string DeQuoteString(const std::string &Str);
DEBFETCH_PUBLIC std::string DeQuoteString(std::string::const_iterator const &begin, std::string::const_iterator const &end);
DEBFETCH_PUBLIC std::string SubstVar(const std::string &Str,const std::string &Subst,const std::string &Contents);
DEBFETCH_PUBLIC std::string Base64Encode(const std::string &Str);
/** \brief decode base64, an empty result signals malformed input */
DEBFETCH_PUBLIC std::string Base64Decode(const std::string &Str);
DEBFETCH_PUBLIC int StringToBool(const std::string &Text,int Default = -1);
DEBFETCH_PUBLIC std::vector<std::string> VectorizeString(std::string const &haystack, char const &split) DEBFETCH_PURE;
DEBFETCH_PUBLIC void ioprintf(std::ostream &out,const char *format,...) DEBFETCH_PRINTF(2);
DEBFETCH_PUBLIC void strprintf(std::string &out,const char *format,...) DEBFETCH_PRINTF(2);
DEBFETCH_PUBLIC int tolower_ascii(int const c) DEBFETCH_PURE;

DEBFETCH_PUBLIC int DEBFETCH_PURE stringcasecmp(const char *A,const char *AEnd,const char *B,const char *BEnd);
DEBFETCH_PUBLIC int DEBFETCH_PURE stringcasecmp(std::string::const_iterator A,std::string::const_iterator AEnd,
		  const char *B,const char *BEnd);
inline DEBFETCH_PURE int stringcasecmp(std::string const &A,const char *B) {return stringcasecmp(A.begin(),A.end(),B,B + strlen(B));}
inline DEBFETCH_PURE int stringcasecmp(std::string const &A,const char *B,const char *BEnd) {return stringcasecmp(A.begin(),A.end(),B,BEnd);}
inline DEBFETCH_PURE int stringcasecmp(std::string const &A,std::string const &B) {return stringcasecmp(A.begin(),A.end(),B.data(),B.data() + B.length());}

class DEBFETCH_PUBLIC URI
{
   void CopyFrom(const std::string &From);

   public:

   std::string Access;
   std::string User;
   std::string Password;
   std::string Host;
   std::string Path;
   unsigned int Port;

   operator std::string() const;
   inline void operator =(const std::string &From) {CopyFrom(From);}
   inline bool empty() const {return Access.empty();};
   static std::string SiteOnly(const std::string &URI);
   static std::string NoUserPassword(const std::string &URI);

   explicit URI(std::string const &Path) : Port(0) { CopyFrom(Path); }
   URI() : Port(0) {}
};

#endif
