// -*- mode: cpp; mode: fold -*-
// Description								/*{{{*/
/* ######################################################################

   Fast scanner for RFC-822 type header information

   ##################################################################### */
									/*}}}*/
// Include Files							/*{{{*/
#include <config.h>

#include <debfetch-pkg/error.h>
#include <debfetch-pkg/fileutl.h>
#include <debfetch-pkg/strutl.h>
#include <debfetch-pkg/tagfile.h>

#include <algorithm>
#include <cerrno>
#include <cstdlib>
#include <string>
#include <string_view>

#include <debfetchi18n.h>
									/*}}}*/

using std::string;
using std::string_view;

static bool isspace_ascii(char const c)
{
   return c == ' ' || c == '\t' || c == '\n' || c == '\r' || c == '\f' || c == '\v';
}

// TagSection::pkgTagSection - Constructor				/*{{{*/
pkgTagSection::pkgTagSection()
{
}
pkgTagSection::~pkgTagSection() {}
									/*}}}*/
// TagSection::Scan - Index the fields of one stanza			/*{{{*/
// ---------------------------------------------------------------------
/* A field starts at the beginning of a line and ends at the next line
   which does not start with a space or tab. */
bool pkgTagSection::Scan(const char *Start, unsigned long MaxLength)
{
   Section.assign(Start, MaxLength);
   Tags.clear();

   string::size_type Pos = 0;
   while (Pos < Section.length())
   {
      string::size_type const LineEnd = std::min(Section.find('\n', Pos), Section.length());
      if (Section[Pos] == ' ' || Section[Pos] == '\t')
      {
	 // continuation of the previous field
	 if (Tags.empty() == true)
	    return false;
	 Tags.back().EndValue = LineEnd;
	 Pos = LineEnd + 1;
	 continue;
      }

      string::size_type const Colon = Section.find(':', Pos);
      if (Colon == string::npos || Colon >= LineEnd || Colon == Pos)
	 return false;

      TagData Tag;
      Tag.StartTag = Pos;
      Tag.EndTag = Colon;
      while (Tag.EndTag > Tag.StartTag && isspace_ascii(Section[Tag.EndTag - 1]))
	 --Tag.EndTag;
      Tag.StartValue = Colon + 1;
      Tag.EndValue = LineEnd;
      Tags.push_back(Tag);
      Pos = LineEnd + 1;
   }
   return true;
}
									/*}}}*/
// TagSection::FindTag - Locate the last occurrence of a field		/*{{{*/
pkgTagSection::TagData const * pkgTagSection::FindTag(string_view Tag) const
{
   for (auto T = Tags.rbegin(); T != Tags.rend(); ++T)
   {
      if (T->EndTag - T->StartTag != Tag.length())
	 continue;
      const char * const Name = Section.data() + T->StartTag;
      if (stringcasecmp(Name, Name + Tag.length(), Tag.data(), Tag.data() + Tag.length()) == 0)
	 return &*T;
   }
   return nullptr;
}
									/*}}}*/
// TagSection::Find - Locate a tag and return its value		/*{{{*/
string_view pkgTagSection::Find(string_view Tag) const
{
   TagData const * const T = FindTag(Tag);
   if (T == nullptr)
      return string_view();

   string::size_type Start = T->StartValue;
   string::size_type End = T->EndValue;
   for (; Start < End && isspace_ascii(Section[Start]); ++Start);
   for (; End > Start && isspace_ascii(Section[End - 1]); --End);
   return string_view(Section.data() + Start, End - Start);
}
bool pkgTagSection::Find(string_view Tag, string &Value) const
{
   if (FindTag(Tag) == nullptr)
      return false;
   Value = string{Find(Tag)};
   return true;
}
bool pkgTagSection::Exists(string_view Tag) const
{
   return FindTag(Tag) != nullptr;
}
									/*}}}*/
// TagSection::FindI - Find an integer value				/*{{{*/
signed int pkgTagSection::FindI(string_view Tag, signed long Default) const
{
   string const Value{Find(Tag)};
   if (Value.empty() == true)
      return Default;

   errno = 0;
   char *End;
   signed long const Result = strtol(Value.c_str(), &End, 10);
   if (errno != 0 || *End != '\0' || Result != static_cast<signed int>(Result))
      return Default;
   return Result;
}
									/*}}}*/
// TagSection::FindULL - Find an unsigned long long value		/*{{{*/
unsigned long long pkgTagSection::FindULL(string_view Tag, unsigned long long const &Default) const
{
   string const Value{Find(Tag)};
   if (Value.empty() == true || Value[0] == '-')
      return Default;

   errno = 0;
   char *End;
   unsigned long long const Result = strtoull(Value.c_str(), &End, 10);
   if (errno != 0 || *End != '\0')
      return Default;
   return Result;
}
									/*}}}*/
// TagSection::Get - Access a field by position				/*{{{*/
void pkgTagSection::Get(string_view &Tag, string_view &Value, unsigned int I) const
{
   TagData const &T = Tags.at(I);
   Tag = string_view(Section.data() + T.StartTag, T.EndTag - T.StartTag);
   Value = string_view(Section.data() + T.StartValue, T.EndValue - T.StartValue);
}
									/*}}}*/

// TagFile::pkgTagFile - Constructor					/*{{{*/
pkgTagFile::pkgTagFile(FileFd * const F, pkgTagFile::Flags const pFlags) :
   Fd(F), Mode(pFlags), Stanzas(0)
{
}
pkgTagFile::~pkgTagFile() {}
									/*}}}*/
// TagFile::Step - Advance to the next section				/*{{{*/
// ---------------------------------------------------------------------
/* Leading empty lines are skipped, the stanza ends at the first empty
   (or whitespace only) line or at the end of the file. */
bool pkgTagFile::Step(pkgTagSection &Tag)
{
   if (Fd == nullptr || Fd->IsOpen() == false || Fd->Failed() == true)
      return false;

   string Stanza;
   string Line;
   while (Fd->ReadLine(Line) == true)
   {
      if ((Mode & SUPPORT_COMMENTS) == SUPPORT_COMMENTS && Line.empty() == false && Line[0] == '#')
	 continue;

      string::size_type const Content = Line.find_first_not_of(" \t\r");
      if (Content == string::npos)
      {
	 if (Stanza.empty() == true)
	    continue;
	 break;
      }

      if (Line.back() == '\r')
	 Line.pop_back();
      Stanza.append(Line).append("\n");
   }

   if (Fd->Failed() == true)
      return false;
   if (Stanza.empty() == true)
      return false;

   ++Stanzas;
   if (Tag.Scan(Stanza.c_str(), Stanza.length()) == false)
      return _error->Error(_("Unable to parse package file %s (%d)"),
	    Fd->Name().c_str(), static_cast<int>(Stanzas));
   return true;
}
									/*}}}*/
