// -*- mode: cpp; mode: fold -*-
// Description								/*{{{*/
/* ######################################################################

   Hashes - Checksums for everything fetched from a repository

   Only the algorithms a Release file may be trusted with are computed:
   SHA512 and SHA256. The byte count is carried along as the pseudo
   hash Checksum-FileSize so that a size check is part of every
   comparison.

   ##################################################################### */
									/*}}}*/
#ifndef DEBFETCH_HASHES_H
#define DEBFETCH_HASHES_H

#include <debfetch-pkg/macros.h>

#include <cstring>
#include <string>
#include <vector>

class FileFd;

// helper class that contains hash function name
// and hash
class DEBFETCH_PUBLIC HashString
{
 protected:
   std::string Type;
   std::string Hash;
   static const char * _SupportedHashes[4];

   std::string GetHashForFile(std::string filename) const;

 public:
   HashString(std::string Type, std::string Hash);
   explicit HashString(std::string StringedHashString);  // init from str as "type:hash"
   HashString();

   std::string HashType() const { return Type; };
   std::string HashValue() const { return Hash; };

   // verify the given filename against the currently loaded hash
   bool VerifyFile(std::string filename) const;

   // generate a hash string from the given filename
   bool FromFile(std::string filename);

   std::string toStr() const;                    // convert to str as "type:hash"
   bool empty() const;
   bool usable() const;
   bool operator==(HashString const &other) const;
   bool operator!=(HashString const &other) const;

   // return the list of hashes we support, strongest first
   static DEBFETCH_PURE const char** SupportedHashes();
};

class DEBFETCH_PUBLIC HashStringList
{
   public:
   /** find best hash if no specific one is requested
    *
    * @param type of the checksum to return, can be \b NULL
    * @return If type is \b NULL (or the empty string) it will
    *  return the 'best' hash; otherwise the hash which was
    *  specifically requested. If no hash is found \b NULL will be returned.
    */
   HashString const * find(char const * const type) const;
   HashString const * find(std::string const &type) const { return find(type.c_str()); }

   /** finds the filesize hash and returns it as number
    *
    * @return beware: if the size isn't known we return \b 0 here,
    * just like we would do for an empty file.
    */
   unsigned long long FileSize() const;
   bool FileSize(unsigned long long const Size);

   static DEBFETCH_PURE bool supported(char const * const type);
   /** add the given #HashString to the list
    *
    * @return \b false if the hash is unsupported, empty or conflicts
    *  with a hash of the same type already in the list
    */
   bool push_back(const HashString &hashString);
   size_t size() const { return list.size(); }

   bool VerifyFile(std::string filename) const;
   bool empty() const { return list.empty(); }

   /** has the list at least one hash good enough to trust a file? */
   bool usable() const;

   typedef std::vector<HashString>::const_iterator const_iterator;
   const_iterator begin() const { return list.begin(); }
   const_iterator end() const { return list.end(); }
   void clear() { list.clear(); }

   /** compare two HashStringList for similarity
    *
    * If both lists carry a size the sizes have to agree. The strongest
    * hash type present in both lists decides the rest; lists without
    * a common type are never equal.
    */
   bool operator==(HashStringList const &other) const;
   bool operator!=(HashStringList const &other) const;

   HashStringList() {}

   explicit HashStringList(std::string const &hash) {
      if (hash.empty() == false)
	 list.push_back(HashString(hash));
   }

   private:
   std::vector<HashString> list;
};

class PrivateHashes;
class DEBFETCH_PUBLIC Hashes
{
   PrivateHashes * const d;

   public:
   static const int UntilEOF = 0;

   bool Add(const unsigned char * const Data, unsigned long long const Size) DEBFETCH_NONNULL(2);
   inline bool Add(const char * const Data) DEBFETCH_NONNULL(2)
   {return Add(reinterpret_cast<unsigned char const *>(Data),strlen(Data));};
   inline bool Add(const char *const Data, unsigned long long const Size) DEBFETCH_NONNULL(2)
   {
      return Add(reinterpret_cast<unsigned char const *>(Data), Size);
   };

   enum SupportedHashes { SHA256SUM = (1 << 0), SHA512SUM = (1 << 1) };
   bool AddFD(int const Fd,unsigned long long Size = 0);
   bool AddFD(FileFd &Fd,unsigned long long Size = 0);

   HashStringList GetHashStringList();
   HashString GetHashString(SupportedHashes hash);

   Hashes();
   explicit Hashes(unsigned int const Hashes);
   explicit Hashes(HashStringList const &Hashes);
   Hashes(Hashes const &) = delete;
   Hashes &operator=(Hashes const &) = delete;
   virtual ~Hashes();
};

#endif
