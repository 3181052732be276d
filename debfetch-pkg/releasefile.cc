// -*- mode: cpp; mode: fold -*-
// Description								/*{{{*/
/* ######################################################################

   Release File - The checksum manifest of a distribution

   ##################################################################### */
									/*}}}*/
// Include Files							/*{{{*/
#include <config.h>

#include <debfetch-pkg/configuration.h>
#include <debfetch-pkg/error.h>
#include <debfetch-pkg/fileutl.h>
#include <debfetch-pkg/releasefile.h>
#include <debfetch-pkg/selectfirst.h>
#include <debfetch-pkg/strutl.h>
#include <debfetch-pkg/tagfile.h>

#include <cerrno>
#include <cstdlib>
#include <iostream>
#include <optional>
#include <string>
#include <vector>

#include <debfetchi18n.h>
									/*}}}*/

using std::string;

char const * const pkgReleaseFile::ChecksumSections[] = { "SHA512", "SHA256", nullptr };

pkgReleaseFile::pkgReleaseFile() {}
pkgReleaseFile::~pkgReleaseFile() {}

HashStringList pkgReleaseFile::IndexEntry::Hashes() const
{
   HashStringList List;
   List.push_back(Hash);
   List.FileSize(Size);
   return List;
}

// ReleaseFile::Load - Parse the first stanza of a Release file		/*{{{*/
bool pkgReleaseFile::Load(string const &File)
{
   FileFd Fd;
   if (Fd.Open(File, FileFd::ReadOnly) == false)
      return false;
   return Load(Fd, File);
}
bool pkgReleaseFile::Load(FileFd &Fd, string const &Name)
{
   Filename = Name;
   Suite.clear();
   Codename.clear();
   ChecksumType.clear();
   Entries.clear();
   ByMetaKey.clear();

   pkgTagFile TagFile(&Fd, pkgTagFile::STRICT);
   pkgTagSection Section;
   if (TagFile.Step(Section) == false)
   {
      if (_error->PendingError() == false)
	 _error->Error(_("Unable to parse package file %s (%d)"), Filename.c_str(), 1);
      return false;
   }

   Suite = Section.FindS("Suite");
   Codename = Section.FindS("Codename");

   std::vector<string> Candidates;
   for (char const * const *Type = ChecksumSections; *Type != nullptr; ++Type)
      Candidates.emplace_back(*Type);
   auto const Selected = Debfetch::select_first_available(Candidates,
	 [&](string const &Type) -> std::optional<string> {
	    // an empty section counts as absent
	    if (Section.Find(Type).empty() == true)
	       return std::nullopt;
	    return Type;
	 });
   if (Selected.has_value() == false)
      return _error->Error(_("Neither SHA512 nor SHA256 section found in release file %s"), Filename.c_str());

   ChecksumType = *Selected;
   if (_config->FindB("Debug::Debfetch", false) == true)
      std::clog << "Using " << ChecksumType << " section of " << Filename << std::endl;
   return ParseSection(Section, ChecksumType);
}
									/*}}}*/
// ReleaseFile::ParseSection - Read the rows <hash> <size> <path>	/*{{{*/
bool pkgReleaseFile::ParseSection(pkgTagSection const &Section, string const &Type)
{
   string const Content = Section.FindS(Type);
   for (auto const &Row : VectorizeString(Content, '\n'))
   {
      const char *C = Row.c_str();
      string Hash, Size, MetaKey;
      if (ParseQuoteWord(C, Hash) == false)
	 continue;
      if (ParseQuoteWord(C, Size) == false || ParseQuoteWord(C, MetaKey) == false)
	 return _error->Error(_("Invalid '%s' entry in Release file %s"), Type.c_str(), Filename.c_str());

      errno = 0;
      char *End;
      unsigned long long const Bytes = strtoull(Size.c_str(), &End, 10);
      if (errno != 0 || *End != '\0' || Size[0] == '-')
	 return _error->Error(_("Invalid '%s' entry in Release file %s"), Type.c_str(), Filename.c_str());

      IndexEntry Entry;
      Entry.MetaKey = MetaKey;
      Entry.Size = Bytes;
      Entry.Hash = HashString(Type, Hash);

      // the first row for a path wins
      if (ByMetaKey.find(MetaKey) != ByMetaKey.end())
	 continue;
      ByMetaKey[MetaKey] = Entries.size();
      Entries.push_back(std::move(Entry));
   }
   return true;
}
									/*}}}*/
// ReleaseFile::Lookup - Find the row of an index			/*{{{*/
pkgReleaseFile::IndexEntry const *pkgReleaseFile::Lookup(string const &MetaKey) const
{
   auto const I = ByMetaKey.find(MetaKey);
   if (I == ByMetaKey.end())
      return nullptr;
   return &Entries[I->second];
}
									/*}}}*/
// ReleaseFile::CheckDist - Compare Codename and Suite with Dist	/*{{{*/
bool pkgReleaseFile::CheckDist(string const &Dist) const
{
   if (Dist == Codename || Dist == Suite)
      return true;

   string const Got = Codename.empty() == false ? Codename : Suite;
   _error->Warning(_("Conflicting distribution: %s (expected %s but got %s)"),
	 Filename.c_str(), Dist.c_str(), Got.c_str());
   return false;
}
									/*}}}*/
