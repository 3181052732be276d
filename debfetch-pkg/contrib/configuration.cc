// -*- mode: cpp; mode: fold -*-
// Description								/*{{{*/
/* ######################################################################

   Configuration Class

   Storage is a plain tree of Items linked by Child/Next pointers, the
   file parser understands the named.conf like syntax of the
   configuration files including the #include and #clear directives.

   ##################################################################### */
									/*}}}*/
// Include files							/*{{{*/
#include <config.h>

#include <debfetch-pkg/configuration.h>
#include <debfetch-pkg/error.h>
#include <debfetch-pkg/fileutl.h>
#include <debfetch-pkg/strutl.h>

#include <ctype.h>
#include <stdio.h>
#include <stdlib.h>
#include <string.h>

#include <algorithm>
#include <stack>
#include <string>
#include <vector>

#include <debfetchi18n.h>

using namespace std;
									/*}}}*/

Configuration *_config = new Configuration;

// FreeTree - Delete an item and everything below it			/*{{{*/
static void FreeTree(Configuration::Item *Top)
{
   while (Top != 0)
   {
      FreeTree(Top->Child);
      Configuration::Item * const Next = Top->Next;
      delete Top;
      Top = Next;
   }
}
									/*}}}*/
// Configuration::Configuration - Constructor				/*{{{*/
Configuration::Configuration() : ToFree(true)
{
   Root = new Item;
}
Configuration::Configuration(const Item *Root) : Root((Item *)Root), ToFree(false)
{
}
									/*}}}*/
// Configuration::~Configuration - Destructor				/*{{{*/
Configuration::~Configuration()
{
   if (ToFree == false)
      return;
   FreeTree(Root->Child);
   delete Root;
}
									/*}}}*/
// Configuration::Lookup - Lookup a single item				/*{{{*/
// ---------------------------------------------------------------------
/* Tags compare case insensitive. An empty tag never matches, with
   Create set it appends a new anonymous list element. */
Configuration::Item *Configuration::Lookup(Item *Head,const char *S,
					   unsigned long const &Len,bool const &Create)
{
   Item **Last = &Head->Child;
   for (Item *I = Head->Child; I != 0; Last = &I->Next, I = I->Next)
      if (Len != 0 && Len == I->Tag.length() && stringcasecmp(I->Tag,S,S + Len) == 0)
	 return I;

   if (Create == false)
      return 0;

   Item *I = new Item;
   I->Tag.assign(S,Len);
   I->Parent = Head;
   *Last = I;
   return I;
}
									/*}}}*/
// Configuration::Lookup - Lookup a fully scoped item			/*{{{*/
Configuration::Item *Configuration::Lookup(const char *Name,bool const &Create)
{
   if (Name == 0)
      return Root->Child;

   Item *Itm = Root;
   const char *Start = Name;
   for (const char *TagEnd = strstr(Start, "::"); TagEnd != 0; TagEnd = strstr(Start, "::"))
   {
      Itm = Lookup(Itm,Start,TagEnd - Start,Create);
      if (Itm == 0)
	 return 0;
      Start = TagEnd + 2;
   }

   // a trailing :: creates a new list element
   if (*Start == '\0' && Create == false)
      return 0;
   return Lookup(Itm,Start,strlen(Start),Create);
}
									/*}}}*/
// Configuration::Find - Find a value					/*{{{*/
string Configuration::Find(const char *Name,const char *Default) const
{
   const Item *Itm = Lookup(Name);
   if (Itm == 0 || Itm->Value.empty() == true)
      return Default == 0 ? "" : Default;
   return Itm->Value;
}
									/*}}}*/
// Configuration::FindFile - Find a Filename				/*{{{*/
// ---------------------------------------------------------------------
/* Relative values are prefixed with the values of their parents, so
   Dir "/etc/"; Dir::Etc "debfetch/"; Dir::Etc::main "debfetch.conf";
   resolves to /etc/debfetch/debfetch.conf */
string Configuration::FindFile(const char *Name,const char *Default) const
{
   const Item *Itm = Lookup(Name);
   if (Itm == 0 || Itm->Value.empty() == true)
      return Default == 0 ? "" : Default;

   string val = Itm->Value;
   for (; Itm->Parent != 0; Itm = Itm->Parent)
   {
      if (val.empty() == false && val[0] == '/')
	 break;
      if (val.length() >= 2 && (val[0] == '~' || val[0] == '.') && val[1] == '/')
	 break;
      if (Itm->Parent->Value.empty() == true)
	 continue;
      if (Itm->Parent->Value.back() != '/')
	 val.insert(0, "/");
      val.insert(0, Itm->Parent->Value);
   }
   return val;
}
									/*}}}*/
// Configuration::FindDir - Find a directory name			/*{{{*/
// ---------------------------------------------------------------------
/* This is like findfile execept the result is terminated in a / */
string Configuration::FindDir(const char *Name,const char *Default) const
{
   string Res = FindFile(Name,Default);
   if (Res.empty() == false && Res.back() != '/')
   {
      if (Debfetch::String::Endswith(Res, "/dev/null"))
	 return Res;
      Res.push_back('/');
   }
   return Res;
}
									/*}}}*/
// Configuration::FindVector - Find a vector of values			/*{{{*/
vector<string> Configuration::FindVector(const char *Name, std::string const &Default) const
{
   const Item *Top = Lookup(Name);
   if (Top == NULL)
      return VectorizeString(Default, ',');
   if (Top->Value.empty() == false)
      return VectorizeString(Top->Value, ',');

   vector<string> Vec;
   for (const Item *I = Top->Child; I != NULL; I = I->Next)
      Vec.push_back(I->Value);
   if (Vec.empty() == true)
      return VectorizeString(Default, ',');
   return Vec;
}
									/*}}}*/
// Configuration::FindI - Find an integer value				/*{{{*/
int Configuration::FindI(const char *Name,int const &Default) const
{
   const Item *Itm = Lookup(Name);
   if (Itm == 0 || Itm->Value.empty() == true)
      return Default;

   char *End;
   int const Res = strtol(Itm->Value.c_str(),&End,0);
   if (End == Itm->Value.c_str())
      return Default;
   return Res;
}
									/*}}}*/
// Configuration::FindB - Find a boolean type				/*{{{*/
bool Configuration::FindB(const char *Name,bool const &Default) const
{
   const Item *Itm = Lookup(Name);
   if (Itm == 0 || Itm->Value.empty() == true)
      return Default;
   return StringToBool(Itm->Value,Default);
}
									/*}}}*/
// Configuration::CndSet - Conditional Set a value			/*{{{*/
// ---------------------------------------------------------------------
/* This will not overwrite */
void Configuration::CndSet(const char *Name,const string &Value)
{
   Item *Itm = Lookup(Name,true);
   if (Itm != 0 && Itm->Value.empty() == true)
      Itm->Value = Value;
}
void Configuration::CndSet(const char *Name,int const Value)
{
   CndSet(Name, std::to_string(Value));
}
									/*}}}*/
// Configuration::Set - Set a value					/*{{{*/
void Configuration::Set(const char *Name,const string &Value)
{
   Item *Itm = Lookup(Name,true);
   if (Itm != 0)
      Itm->Value = Value;
}
void Configuration::Set(const char *Name,int const &Value)
{
   Set(Name, std::to_string(Value));
}
									/*}}}*/
// Configuration::Clear - Clear an single value from a list		/*{{{*/
void Configuration::Clear(string const &Name, string const &Value)
{
   Item *Top = Lookup(Name.c_str(),false);
   if (Top == 0)
      return;

   Item **Link = &Top->Child;
   while (*Link != 0)
   {
      Item * const I = *Link;
      if (I->Value != Value)
      {
	 Link = &I->Next;
	 continue;
      }
      *Link = I->Next;
      FreeTree(I->Child);
      delete I;
   }
}
									/*}}}*/
// Configuration::Clear - Clear an entire tree				/*{{{*/
void Configuration::Clear(string const &Name)
{
   Item *Top = Lookup(Name.c_str(),false);
   if (Top == 0)
      return;
   Top->Value.clear();
   FreeTree(Top->Child);
   Top->Child = 0;
}
									/*}}}*/
// Configuration::Exists - Returns true if the Name exists		/*{{{*/
bool Configuration::Exists(const char *Name) const
{
   return Lookup(Name) != 0;
}
									/*}}}*/
// Configuration::Dump - Dump the config				/*{{{*/
// ---------------------------------------------------------------------
/* Writes the tree in a form ReadConfigFile can read back */
void Configuration::Dump(ostream& str)
{
   const Item *Top = Tree(0);
   while (Top != 0)
   {
      str << QuoteString(Top->FullTag(), "=\"\n") << " \""
	  << QuoteString(Top->Value, "=\"\n") << "\";" << endl;

      if (Top->Child != 0)
      {
	 Top = Top->Child;
	 continue;
      }
      while (Top != 0 && Top->Next == 0)
	 Top = Top->Parent;
      if (Top != 0)
	 Top = Top->Next;
   }
}
									/*}}}*/
// Configuration::Item::FullTag - Return the fully scoped tag		/*{{{*/
// ---------------------------------------------------------------------
/* Stop sets an optional max recursion depth if this item is being viewed as
   part of a sub tree. */
string Configuration::Item::FullTag(const Item *Stop) const
{
   if (Parent == 0 || Parent->Parent == 0 || Parent == Stop)
      return Tag;
   return Parent->FullTag(Stop) + "::" + Tag;
}
									/*}}}*/

// StripComments - Remove comments from one line of a config file	/*{{{*/
// ---------------------------------------------------------------------
/* Handles //, # and the multi line C comment. Comment markers inside of
   quotes are kept, as are the #clear and #include directives. */
static string StripComments(string const &Line, bool &InComment)
{
   string Out;
   bool InQuote = false;
   for (size_t I = 0; I < Line.length(); ++I)
   {
      if (InComment == true)
      {
	 if (Line.compare(I, 2, "*/") == 0)
	 {
	    InComment = false;
	    ++I;
	 }
	 continue;
      }
      char const C = Line[I];
      if (C == '"')
	 InQuote = !InQuote;
      else if (InQuote == false)
      {
	 if (Line.compare(I, 2, "//") == 0)
	    break;
	 if (Line.compare(I, 2, "/*") == 0)
	 {
	    InComment = true;
	    ++I;
	    continue;
	 }
	 if (C == '#' && Line.compare(I + 1, 5, "clear") != 0 &&
	     Line.compare(I + 1, 7, "include") != 0)
	    break;
      }
      Out.push_back(C);
   }
   return Out;
}
									/*}}}*/
// ApplyDirective - Handle #clear and #include				/*{{{*/
static bool ApplyDirective(Configuration &Conf, string const &FName, int const CurLine,
			   string const &Tag, string const &Word, unsigned const Depth)
{
   if (Tag == "clear")
   {
      Conf.Clear(Word);
      return true;
   }
   if (Tag != "include")
      return _error->Error(_("Syntax error %s:%u: Unsupported directive '%s'"),FName.c_str(),CurLine,Tag.c_str());

   if (Depth > 10)
      return _error->Error(_("Syntax error %s:%u: Too many nested includes"),FName.c_str(),CurLine);
   bool const Res = (Word.empty() == false && Word.back() == '/') ?
      ReadConfigDir(Conf, Word, Depth + 1) : ReadConfigFile(Conf, Word, Depth + 1);
   if (Res == false)
      return _error->Error(_("Syntax error %s:%u: Included from here"),FName.c_str(),CurLine);
   return true;
}
									/*}}}*/
// ReadConfigFile - Read a configuration file				/*{{{*/
// ---------------------------------------------------------------------
/* The format is close to bind's named.conf: a statement is a tag and a
   value terminated by ';', a tag followed by '{' opens a scope which
   prefixes all tags until the matching '};'. Statements may span lines. */
bool ReadConfigFile(Configuration &Conf,const string &FName,unsigned const &Depth)
{
   FileFd F;
   if (F.Open(FName, FileFd::ReadOnly) == false)
      return _error->Error(_("Could not open configuration file %s"), FName.c_str());

   std::stack<string> Stack;
   string ParentTag;
   string Statement;
   int CurLine = 0;
   bool InComment = false;

   string Input;
   while (F.ReadLine(Input) == true)
   {
      ++CurLine;
      string const Fragment = StripComments(SubstVar(Input, "\t", " "), InComment);

      bool InQuote = false;
      for (char const C : Fragment)
      {
	 if (C == '"')
	    InQuote = !InQuote;
	 if (InQuote == true || (C != '{' && C != ';' && C != '}'))
	 {
	    Statement.push_back(C);
	    continue;
	 }

	 Statement = Debfetch::String::Strip(Statement);
	 if (C == '{' && Statement.empty() == true)
	    return _error->Error(_("Syntax error %s:%u: Block starts with no name."),FName.c_str(),CurLine);

	 if (Statement.empty() == false)
	 {
	    string Tag;
	    const char *Pos = Statement.c_str();
	    if (ParseQuoteWord(Pos,Tag) == false)
	       return _error->Error(_("Syntax error %s:%u: Malformed tag"),FName.c_str(),CurLine);

	    string Word;
	    bool NoWord = false;
	    if (ParseCWord(Pos,Word) == false && ParseQuoteWord(Pos,Word) == false)
	    {
	       if (C != '{')
		  std::swap(Word, Tag);
	       else
		  NoWord = true;
	    }
	    if (*Pos != '\0')
	       return _error->Error(_("Syntax error %s:%u: Extra junk after value"),FName.c_str(),CurLine);

	    if (Tag.empty() == false && Tag[0] == '#')
	    {
	       if (ParentTag.empty() == false || C == '{')
		  return _error->Error(_("Syntax error %s:%u: Directives can only be done at the top level"),FName.c_str(),CurLine);
	       if (ApplyDirective(Conf, FName, CurLine, Tag.substr(1), Word, Depth) == false)
		  return false;
	    }
	    else if (C == '{')
	    {
	       Stack.push(ParentTag);
	       ParentTag = ParentTag.empty() ? Tag : ParentTag + "::" + Tag;
	       if (NoWord == false)
		  Conf.Set(ParentTag, Word);
	    }
	    else if (ParentTag.empty() == true)
	       Conf.Set(Tag, Word);
	    else
	       Conf.Set(ParentTag + "::" + Tag, Word);
	 }
	 Statement.clear();

	 if (C == '}')
	 {
	    if (Stack.empty() == true)
	       return _error->Error(_("Syntax error %s:%u: Unbalanced closing brace"),FName.c_str(),CurLine);
	    ParentTag = Stack.top();
	    Stack.pop();
	 }
      }
      if (Statement.empty() == false)
	 Statement.push_back(' ');
   }
   if (F.Failed() == true)
      return false;

   if (Debfetch::String::Strip(Statement).empty() == false || Stack.empty() == false)
      return _error->Error(_("Syntax error %s:%u: Extra junk at end of file"),FName.c_str(),CurLine);
   return true;
}
									/*}}}*/
// ReadConfigDir - Read a directory of config files			/*{{{*/
// ---------------------------------------------------------------------
/* Only files ending in .conf are read, in alphabetic order */
bool ReadConfigDir(Configuration &Conf,const string &Dir,unsigned const &Depth)
{
   vector<string> const Files = GetListOfFilesInDir(Dir, "conf");
   bool Res = true;
   for (auto const &File : Files)
      Res &= ReadConfigFile(Conf, File, Depth);
   return Res;
}
									/*}}}*/
