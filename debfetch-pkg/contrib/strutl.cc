// -*- mode: cpp; mode: fold -*-
// Description								/*{{{*/
/* ######################################################################

   String Util - Small string helpers used by the parsers

   ##################################################################### */
									/*}}}*/
// Includes								/*{{{*/
#include <config.h>

#include <debfetch-pkg/strutl.h>

#include <algorithm>
#include <cctype>
#include <cstdarg>
#include <cstdio>
#include <cstdlib>
#include <cstring>
#include <sstream>
#include <string>
#include <vector>
#include <strings.h>
									/*}}}*/
using namespace std;

namespace Debfetch {
   namespace String {
// Strip - Remove white space from the front and back of a string	/*{{{*/
std::string Strip(const std::string &str)
{
   auto const start = std::find_if_not(str.begin(), str.end(), [](unsigned char c) { return isspace(c) != 0; });
   auto const end = std::find_if_not(str.rbegin(), str.rend(), [](unsigned char c) { return isspace(c) != 0; }).base();
   if (start >= end)
      return "";
   return std::string(start, end);
}
									/*}}}*/
bool Endswith(const std::string &s, const std::string &end)
{
   if (end.size() > s.size())
      return false;
   return (s.compare(s.size() - end.size(), end.size(), end) == 0);
}

bool Startswith(const std::string &s, const std::string &start)
{
   if (start.size() > s.size())
      return false;
   return (s.compare(0, start.size(), start) == 0);
}

std::string Join(std::vector<std::string> const &list, const std::string &sep)
{
   std::ostringstream oss;
   for (auto it = list.begin(); it != list.end(); ++it)
   {
      if (it != list.begin())
	 oss << sep;
      oss << *it;
   }
   return oss.str();
}
   }
}

// HexPair - Decode the two hex digits following a % sign		/*{{{*/
static bool HexPair(char const * const Start, char const * const End, char &Out)
{
   if (Start + 2 >= End || isxdigit(Start[1]) == 0 || isxdigit(Start[2]) == 0)
      return false;
   char const Tmp[3] = {Start[1], Start[2], '\0'};
   Out = static_cast<char>(strtol(Tmp, nullptr, 16));
   return true;
}
									/*}}}*/
// ParseQuoteWord - Parse a single word out of a string			/*{{{*/
// ---------------------------------------------------------------------
/* This grabs a single word, converts any % escaped characters to their
   proper values and advances the pointer. Double quotes are understood
   and striped out as well. Brackets are kept together so that option
   blocks like [arch=amd64 signed-by=/key] are returned as one word. */
bool ParseQuoteWord(const char *&String,string &Res)
{
   const char *C = String;
   for (;*C != 0 && *C == ' '; C++);
   if (*C == 0)
      return false;
   const char * const Start = C;

   for (;*C != 0 && isspace(*C) == 0; C++)
   {
      if (*C == '"' || *C == '[')
      {
	 C = strchr(C + 1, *C == '"' ? '"' : ']');
	 if (C == NULL)
	    return false;
      }
   }

   Res.clear();
   for (const char *I = Start; I != C; ++I)
   {
      char Decoded;
      if (*I == '%' && HexPair(I, C, Decoded) == true)
      {
	 Res.push_back(Decoded);
	 I += 2;
      }
      else if (*I != '"')
	 Res.push_back(*I);
   }

   for (;*C != 0 && isspace(*C) != 0; C++);
   String = C;
   return true;
}
									/*}}}*/
// ParseCWord - Parses a string like a C "" expression			/*{{{*/
// ---------------------------------------------------------------------
/* This expects a series of space separated strings enclosed in ""'s.
   It concatenates the ""'s into a single string. */
bool ParseCWord(const char *&String,string &Res)
{
   const char *C = String;
   for (;*C != 0 && *C == ' '; C++);
   if (*C == 0)
      return false;

   string Buffer;
   for (; *C != 0; C++)
   {
      if (*C == '"')
      {
	 for (C++; *C != 0 && *C != '"'; C++)
	    Buffer.push_back(*C);
	 if (*C == 0)
	    return false;
	 continue;
      }

      if (C != String && isspace(*C) != 0 && isspace(C[-1]) != 0)
	 continue;
      if (isspace(*C) == 0)
	 return false;
      Buffer.push_back(' ');
   }
   Res = Buffer;
   String = C;
   return true;
}
									/*}}}*/
// QuoteString - Convert a string into quoted from			/*{{{*/
string QuoteString(const string &Str, const char *Bad)
{
   std::string Res;
   for (unsigned char const C : Str)
   {
      if (strchr(Bad, C) != nullptr || C == '%' || C <= 0x20 || C >= 0x7F)
      {
	 char Buf[4];
	 snprintf(Buf, sizeof(Buf), "%%%02x", C);
	 Res.append(Buf);
      }
      else
	 Res.push_back(C);
   }
   return Res;
}
									/*}}}*/
// DeQuoteString - Convert a string from quoted from			/*{{{*/
// ---------------------------------------------------------------------
/* This undoes QuoteString */
string DeQuoteString(const string &Str)
{
   return DeQuoteString(Str.begin(),Str.end());
}
string DeQuoteString(string::const_iterator const &begin,
			string::const_iterator const &end)
{
   string Res;
   if (begin == end)
      return Res;
   char const * const End = &*begin + (end - begin);
   for (char const *I = &*begin; I < End; ++I)
   {
      char Decoded;
      if (*I == '%' && HexPair(I, End, Decoded) == true)
      {
	 Res.push_back(Decoded);
	 I += 2;
      }
      else
	 Res.push_back(*I);
   }
   return Res;
}
									/*}}}*/
// SubstVar - Substitute a string for another string			/*{{{*/
// ---------------------------------------------------------------------
/* This replaces all occurrences of Subst with Contents in Str. */
string SubstVar(const string &Str,const string &Subst,const string &Contents)
{
   if (Subst.empty() == true)
      return Str;

   string Temp;
   string::size_type OldPos = 0;
   for (string::size_type Pos = Str.find(Subst); Pos != string::npos; Pos = Str.find(Subst, OldPos))
   {
      Temp.append(Str, OldPos, Pos - OldPos).append(Contents);
      OldPos = Pos + Subst.length();
   }
   if (OldPos == 0)
      return Str;
   Temp.append(Str, OldPos, string::npos);
   return Temp;
}
									/*}}}*/
// Base64Encode - Base64 Encoding routine for short strings		/*{{{*/
// ---------------------------------------------------------------------
/* rfc2045 */
static char const Base64Table[] = "ABCDEFGHIJKLMNOPQRSTUVWXYZabcdefghijklmnopqrstuvwxyz0123456789+/";
string Base64Encode(const string &S)
{
   string Final;
   Final.reserve((4*S.length() + 2)/3 + 2);

   for (size_t I = 0; I < S.length(); I += 3)
   {
      unsigned char const Bits[3] = {
	 static_cast<unsigned char>(S[I]),
	 static_cast<unsigned char>(I + 1 < S.length() ? S[I + 1] : 0),
	 static_cast<unsigned char>(I + 2 < S.length() ? S[I + 2] : 0)};

      Final += Base64Table[Bits[0] >> 2];
      Final += Base64Table[((Bits[0] & 3) << 4) + (Bits[1] >> 4)];
      Final += I + 1 < S.length() ? Base64Table[((Bits[1] & 0xf) << 2) + (Bits[2] >> 6)] : '=';
      Final += I + 2 < S.length() ? Base64Table[Bits[2] & 0x3f] : '=';
   }
   return Final;
}
									/*}}}*/
// Base64Decode - Reverse of Base64Encode				/*{{{*/
// ---------------------------------------------------------------------
/* Whitespace is skipped, anything else outside of the alphabet or a
   truncated final group makes the whole input invalid. */
string Base64Decode(const string &S)
{
   string Final;
   Final.reserve(S.length() * 3 / 4);

   unsigned int Accumulator = 0;
   int Bits = 0;
   size_t Padding = 0;
   size_t Symbols = 0;
   for (char const C : S)
   {
      if (isspace(static_cast<unsigned char>(C)) != 0)
	 continue;
      ++Symbols;
      if (C == '=')
      {
	 ++Padding;
	 continue;
      }
      char const * const Pos = (C == '\0') ? nullptr : strchr(Base64Table, C);
      if (Pos == nullptr || Padding != 0)
	 return "";
      Accumulator = (Accumulator << 6) | static_cast<unsigned int>(Pos - Base64Table);
      Bits += 6;
      if (Bits >= 8)
      {
	 Bits -= 8;
	 Final.push_back(static_cast<char>((Accumulator >> Bits) & 0xff));
      }
   }
   if (Symbols % 4 != 0 || Padding > 2)
      return "";
   return Final;
}
									/*}}}*/
// stringcasecmp - Arbitrary case insensitive string compare		/*{{{*/
template <typename Iter>
static int stringcasecmp_impl(Iter A, Iter AEnd, const char *B, const char *BEnd)
{
   for (; A != AEnd && B != BEnd; A++, B++)
      if (tolower_ascii(*A) != tolower_ascii(*B))
	 break;

   if (A == AEnd && B == BEnd)
      return 0;
   if (A == AEnd)
      return 1;
   if (B == BEnd)
      return -1;
   if (tolower_ascii(*A) < tolower_ascii(*B))
      return -1;
   return 1;
}
int stringcasecmp(const char *A,const char *AEnd,const char *B,const char *BEnd)
{
   return stringcasecmp_impl(A, AEnd, B, BEnd);
}
int stringcasecmp(string::const_iterator A,string::const_iterator AEnd,
		  const char *B,const char *BEnd)
{
   return stringcasecmp_impl(A, AEnd, B, BEnd);
}
									/*}}}*/
// tolower_ascii - tolower() ignoring the locale			/*{{{*/
int tolower_ascii(int const c)
{
   if (c >= 'A' && c <= 'Z')
      return c + 32;
   return c;
}
									/*}}}*/
// StringToBool - Converts a string into a boolean			/*{{{*/
// ---------------------------------------------------------------------
/* This inspects the string to see if it is true or if it is false and
   then returns the result. Several variants on true/false are checked. */
int StringToBool(const string &Text,int Default)
{
   char *ParseEnd;
   int const Res = strtol(Text.c_str(),&ParseEnd,0);
   if (ParseEnd == Text.c_str() + Text.size() && Text.empty() == false && Res >= 0 && Res <= 1)
      return Res;

   static char const * const Negatives[] = {"no", "false", "without", "off", "disable"};
   static char const * const Positives[] = {"yes", "true", "with", "on", "enable"};
   for (auto const N : Negatives)
      if (strcasecmp(Text.c_str(), N) == 0)
	 return 0;
   for (auto const P : Positives)
      if (strcasecmp(Text.c_str(), P) == 0)
	 return 1;
   return Default;
}
									/*}}}*/
// VectorizeString - Split a string up into a vector of strings	/*{{{*/
vector<string> VectorizeString(string const &haystack, char const &split)
{
   vector<string> exploded;
   if (haystack.empty() == true)
      return exploded;
   string::size_type start = 0;
   while (true)
   {
      string::size_type const end = haystack.find(split, start);
      exploded.push_back(haystack.substr(start, end == string::npos ? string::npos : end - start));
      if (end == string::npos || end + 1 == haystack.length())
	 break;
      start = end + 1;
   }
   return exploded;
}
									/*}}}*/
// ioprintf - C format string outputter to C++ iostreams		/*{{{*/
// ---------------------------------------------------------------------
/* This is used to make the internationalization strings easier to translate
   and to allow reordering of parameters */
static string vstrprintf(const char *format, va_list args)
{
   va_list measure;
   va_copy(measure, args);
   int const n = vsnprintf(nullptr, 0, format, measure);
   va_end(measure);
   if (n <= 0)
      return "";
   string Res(n + 1, '\0');
   vsnprintf(&Res[0], Res.size(), format, args);
   Res.resize(n);
   return Res;
}
void ioprintf(ostream &out,const char *format,...)
{
   va_list args;
   va_start(args,format);
   out << vstrprintf(format, args);
   va_end(args);
}
void strprintf(string &out,const char *format,...)
{
   va_list args;
   va_start(args,format);
   out = vstrprintf(format, args);
   va_end(args);
}
									/*}}}*/
// URI::CopyFrom - Copy from an object					/*{{{*/
// ---------------------------------------------------------------------
/* This parses the URI into all of its components */
void URI::CopyFrom(const string &U)
{
   Access.clear();
   User.clear();
   Password.clear();
   Host.clear();
   Path.clear();
   Port = 0;

   string::size_type const FirstColon = U.find(':');
   if (FirstColon == string::npos)
   {
      Path = U;
      return;
   }
   Access = U.substr(0, FirstColon);

   // file:/path and file:///path carry no authority part
   string::size_type AuthStart = FirstColon + 1;
   bool const HasAuthority = U.compare(AuthStart, 2, "//") == 0;
   if (HasAuthority == true)
      AuthStart += 2;

   string::size_type SingleSlash = AuthStart;
   if (HasAuthority == true)
   {
      bool InBracket = false;
      for (; SingleSlash < U.length() && (U[SingleSlash] != '/' || InBracket == true); ++SingleSlash)
      {
	 if (U[SingleSlash] == '[')
	    InBracket = true;
	 else if (InBracket == true && U[SingleSlash] == ']')
	    InBracket = false;
      }
   }

   Path = SingleSlash < U.length() ? U.substr(SingleSlash) : "/";
   if (HasAuthority == false)
      return;

   string Authority = U.substr(AuthStart, SingleSlash - AuthStart);
   string::size_type const At = Authority.rfind('@');
   if (At != string::npos)
   {
      string const UserInfo = Authority.substr(0, At);
      string::size_type const SecondColon = UserInfo.find(':');
      // username and password must be encoded (RFC 3986)
      User = DeQuoteString(UserInfo.substr(0, SecondColon));
      if (SecondColon != string::npos)
	 Password = DeQuoteString(UserInfo.substr(SecondColon + 1));
      Authority.erase(0, At + 1);
   }

   // RFC 2732 [] hostnames
   string::size_type PortSearch = 0;
   if (Authority.empty() == false && Authority[0] == '[')
   {
      string::size_type const Close = Authority.find(']');
      if (Close == string::npos)
	 return;
      Host = Authority.substr(1, Close - 1);
      PortSearch = Close + 1;
   }

   string::size_type const PortColon = Authority.find(':', PortSearch);
   if (PortSearch == 0)
      Host = Authority.substr(0, PortColon);
   if (PortColon != string::npos)
      Port = atoi(Authority.c_str() + PortColon + 1);
}
									/*}}}*/
// URI::operator string - Convert the URI to a string			/*{{{*/
URI::operator string() const
{
   std::string Res;
   if (Access.empty() == false)
      Res.append(Access).append(":");

   if (Host.empty() == false)
   {
      if (Access.empty() == false)
	 Res.append("//");

      if (User.empty() == false)
      {
	 Res.append(QuoteString(User, ":/?#[]@"));
	 if (Password.empty() == false)
	    Res.append(":").append(QuoteString(Password, ":/?#[]@"));
	 Res.append("@");
      }

      if (Access.empty() == false && Host.find_first_of("/:") != string::npos)
	 Res.append("[").append(Host).append("]");
      else
	 Res.append(Host);

      if (Port != 0)
	 Res.append(":").append(std::to_string(Port));
   }

   if (Path.empty() == false)
   {
      if (Path[0] != '/')
	 Res.append("/");
      Res.append(Path);
   }
   return Res;
}
									/*}}}*/
// URI::SiteOnly - Return the schema and site for the URI		/*{{{*/
string URI::SiteOnly(const string &URI)
{
   ::URI U(URI);
   U.User.clear();
   U.Password.clear();
   U.Path.clear();
   return U;
}
									/*}}}*/
// URI::NoUserPassword - Return the schema, site and path for the URI	/*{{{*/
string URI::NoUserPassword(const string &URI)
{
   ::URI U(URI);
   U.User.clear();
   U.Password.clear();
   return U;
}
									/*}}}*/
