// -*- mode: cpp; mode: fold -*-
// Description								/*{{{*/
/* ######################################################################

   Source Entry - One repository line

   ##################################################################### */
									/*}}}*/
// Include Files							/*{{{*/
#include <config.h>

#include <debfetch-pkg/error.h>
#include <debfetch-pkg/sourceentry.h>
#include <debfetch-pkg/strutl.h>

#include <cctype>
#include <map>
#include <string>
#include <vector>

#include <debfetchi18n.h>
									/*}}}*/

using std::string;
using std::vector;

pkgSourceEntry::pkgSourceEntry() {}
pkgSourceEntry::~pkgSourceEntry() {}

#define MALFORMED(what) _error->Error(_("Malformed entry %u in list %s (%s)"), 1u, "repository", what)

// FixupURI - Normalise the base URI					/*{{{*/
// ---------------------------------------------------------------------
/* The URI needs an access method and a host, except for file: which
   needs a path instead. Trailing slashes are removed, they are added
   back when a path is appended. */
static bool FixupURI(string &Base)
{
   if (Base.empty() == true)
      return false;

   ::URI const U(Base);
   if (U.Access.empty() == true)
      return false;
   for (auto const C : U.Access)
      if (isalnum(C) == 0 && C != '+' && C != '-' && C != '.')
	 return false;

   if (U.Access == "file")
   {
      if (U.Host.empty() == false || U.Path.empty() == true || U.Path == "/")
	 return false;
   }
   else if (U.Host.empty() == true)
      return false;

   while (Base.length() > 1 && Base.back() == '/')
      Base.pop_back();
   return true;
}
									/*}}}*/
// SourceEntry::Parse - Parse a single line				/*{{{*/
bool pkgSourceEntry::Parse(string const &Line)
{
   URI.clear();
   Dist.clear();
   Components.clear();
   Options.clear();

   const char *Buffer = Line.c_str();
   for (; *Buffer != 0 && isspace(*Buffer); ++Buffer);
   if (*Buffer == 0)
      return _error->Error(_("Missing argument 'repository'"));

   // the type is optional, but if it is there it has to be deb
   if (isalpha(*Buffer) != 0)
   {
      const char *Peek = Buffer;
      string Type;
      if (ParseQuoteWord(Peek, Type) == true && Type.find(':') == string::npos)
      {
	 if (Type != "deb")
	    return _error->Error(_("Type '%s' is not known on line %u in source list %s"),
		  Type.c_str(), 1u, "repository");
	 Buffer = Peek;
	 for (; *Buffer != 0 && isspace(*Buffer); ++Buffer);
      }
   }

   // e.g.: [ option1=value1 option2=value2 ]
   if (*Buffer == '[')
   {
      ++Buffer;
      for (; *Buffer != 0 && isspace(*Buffer); ++Buffer);
      while (*Buffer != ']')
      {
	 if (*Buffer == 0)
	    return MALFORMED("[option] unterminated");

	 string option;
	 if (ParseQuoteWord(Buffer, option) == false)
	    return MALFORMED("[option] unparsable");

	 // accept options even if the last has no space before the ]-end marker
	 if (option.empty() == false && option.back() == ']')
	 {
	    for (; *Buffer != ']'; --Buffer);
	    option.pop_back();
	 }
	 if (option.length() < 3)
	    return MALFORMED("[option] too short");

	 size_t const needle = option.find('=');
	 if (needle == string::npos)
	    return MALFORMED("[option] not assignment");
	 string const key = option.substr(0, needle);
	 string const value = option.substr(needle + 1);
	 if (key.empty() == true)
	    return MALFORMED("[option] no key");
	 if (value.empty() == true)
	    return MALFORMED("[option] no value");
	 Options[key] = value;
      }
      ++Buffer;
      for (; *Buffer != 0 && isspace(*Buffer); ++Buffer);
   }

   if (ParseQuoteWord(Buffer, URI) == false)
      return MALFORMED("URI");
   if (ParseQuoteWord(Buffer, Dist) == false || Dist.empty() == true)
      return MALFORMED("Suite");
   if (FixupURI(URI) == false)
      return MALFORMED("URI parse");

   if (Dist.back() == '/')
      return MALFORMED("absolute Suite");

   string Section;
   while (ParseQuoteWord(Buffer, Section) == true)
      Components.push_back(Section);
   if (Components.empty() == true)
      return MALFORMED("Component");

   auto const Arch = Options.find("arch");
   if (Arch != Options.end() && GetArchitectures().empty() == true)
      return MALFORMED("[option] arch");

   return true;
}
									/*}}}*/
// SourceEntry::GetArchitectures - Values of arch=			/*{{{*/
vector<string> pkgSourceEntry::GetArchitectures() const
{
   vector<string> Archs;
   auto const Arch = Options.find("arch");
   if (Arch == Options.end())
      return Archs;
   for (auto const &A : VectorizeString(Arch->second, ','))
      if (A.empty() == false)
	 Archs.push_back(A);
   return Archs;
}
string pkgSourceEntry::GetSignedBy() const
{
   auto const Key = Options.find("signed-by");
   if (Key == Options.end())
      return "";
   return Key->second;
}
									/*}}}*/
// SourceEntry::ArchiveURI - URI of a file in the archive		/*{{{*/
string pkgSourceEntry::ArchiveURI(string const &File) const
{
   string Res = URI;
   if (File.empty() == false && File[0] == '/')
      return Res + File;
   return Res + "/" + File;
}
string pkgSourceEntry::DistURI(string const &File) const
{
   return ArchiveURI("dists/" + Dist + "/" + File);
}
									/*}}}*/
// SourceEntry::Describe - Format the entry as a line			/*{{{*/
string pkgSourceEntry::Describe() const
{
   string Res = "deb ";
   if (Options.empty() == false)
   {
      Res.append("[");
      bool First = true;
      for (auto const &O : Options)
      {
	 if (First == false)
	    Res.append(" ");
	 Res.append(O.first).append("=").append(O.second);
	 First = false;
      }
      Res.append("] ");
   }
   Res.append(URI).append(" ").append(Dist);
   for (auto const &C : Components)
      Res.append(" ").append(C);
   return Res;
}
									/*}}}*/
