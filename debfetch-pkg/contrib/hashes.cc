// -*- mode: cpp; mode: fold -*-
// Description								/*{{{*/
/* ######################################################################

   Hashes - Checksums for everything fetched from a repository

   The digests are computed with the OpenSSL EVP interface; all enabled
   algorithms are fed from the same buffer so a file is read once.

   ##################################################################### */
									/*}}}*/
// Include Files							/*{{{*/
#include <config.h>

#include <debfetch-pkg/configuration.h>
#include <debfetch-pkg/fileutl.h>
#include <debfetch-pkg/hashes.h>
#include <debfetch-pkg/macros.h>
#include <debfetch-pkg/strutl.h>

#include <algorithm>
#include <array>
#include <cstdlib>
#include <iostream>
#include <memory>
#include <string>
#include <vector>
#include <strings.h>
#include <unistd.h>

#include <openssl/evp.h>
									/*}}}*/

const char * HashString::_SupportedHashes[] =
{
   "SHA512", "SHA256", "Checksum-FileSize", NULL
};

HashString::HashString()
{
}

HashString::HashString(std::string Type, std::string Hash) : Type(Type), Hash(Hash)
{
}

HashString::HashString(std::string StringedHash)			/*{{{*/
{
   std::string::size_type const pos = StringedHash.find(':');
   if (pos == std::string::npos)
   {
      if (_config->FindB("Debug::Hashes",false) == true)
	 std::clog << "HashString(string): invalid StringedHash " << StringedHash << std::endl;
      return;
   }
   Type = StringedHash.substr(0,pos);
   Hash = StringedHash.substr(pos+1);

   if (_config->FindB("Debug::Hashes",false) == true)
      std::clog << "HashString(string): " << Type << " : " << Hash << std::endl;
}
									/*}}}*/
bool HashString::VerifyFile(std::string filename) const			/*{{{*/
{
   std::string const fileHash = GetHashForFile(filename);

   if (_config->FindB("Debug::Hashes",false) == true)
      std::clog << "HashString::VerifyFile: got: " << fileHash << " expected: " << toStr() << std::endl;

   return fileHash.empty() == false && fileHash == Hash;
}
									/*}}}*/
bool HashString::FromFile(std::string filename)				/*{{{*/
{
   // pick the strongest hash
   if (Type.empty() == true)
      Type = _SupportedHashes[0];

   Hash = GetHashForFile(filename);
   return Hash.empty() == false;
}
									/*}}}*/
std::string HashString::GetHashForFile(std::string filename) const	/*{{{*/
{
   FileFd Fd(filename, FileFd::ReadOnly);
   if (Fd.IsOpen() == false)
      return "";

   std::string fileHash;
   if (strcasecmp(Type.c_str(), "SHA256") == 0)
   {
      Hashes SHA256(Hashes::SHA256SUM);
      if (SHA256.AddFD(Fd) == true)
	 fileHash = SHA256.GetHashString(Hashes::SHA256SUM).Hash;
   }
   else if (strcasecmp(Type.c_str(), "SHA512") == 0)
   {
      Hashes SHA512(Hashes::SHA512SUM);
      if (SHA512.AddFD(Fd) == true)
	 fileHash = SHA512.GetHashString(Hashes::SHA512SUM).Hash;
   }
   else if (strcasecmp(Type.c_str(), "Checksum-FileSize") == 0)
      strprintf(fileHash, "%llu", Fd.FileSize());
   Fd.Close();

   return fileHash;
}
									/*}}}*/
const char** HashString::SupportedHashes()				/*{{{*/
{
   return _SupportedHashes;
}
									/*}}}*/
DEBFETCH_PURE bool HashString::empty() const				/*{{{*/
{
   return (Type.empty() || Hash.empty());
}
									/*}}}*/
static bool IsConfigured(const char *name, const char *what)
{
   std::string option;
   strprintf(option, "Debfetch::Hashes::%s::%s", name, what);
   return _config->FindB(option, false);
}
DEBFETCH_PURE bool HashString::usable() const				/*{{{*/
{
   return (
      (Type != "Checksum-FileSize") &&
      !IsConfigured(Type.c_str(), "Untrusted")
   );
}
									/*}}}*/
std::string HashString::toStr() const					/*{{{*/
{
   return Type + ":" + Hash;
}
									/*}}}*/
DEBFETCH_PURE bool HashString::operator==(HashString const &other) const	/*{{{*/
{
   return (strcasecmp(Type.c_str(), other.Type.c_str()) == 0 &&
	   strcasecmp(Hash.c_str(), other.Hash.c_str()) == 0);
}
DEBFETCH_PURE bool HashString::operator!=(HashString const &other) const
{
   return !(*this == other);
}
									/*}}}*/

bool HashStringList::usable() const					/*{{{*/
{
   return std::any_of(list.begin(), list.end(), [](HashString const &hs) { return hs.usable(); });
}
									/*}}}*/
HashString const * HashStringList::find(char const * const type) const /*{{{*/
{
   if (type == NULL || type[0] == '\0')
   {
      for (char const * const * t = HashString::SupportedHashes(); *t != NULL; ++t)
	 for (auto const &hs : list)
	    if (strcasecmp(hs.HashType().c_str(), *t) == 0)
	       return &hs;
      return NULL;
   }
   for (auto const &hs : list)
      if (strcasecmp(hs.HashType().c_str(), type) == 0)
	 return &hs;
   return NULL;
}
									/*}}}*/
unsigned long long HashStringList::FileSize() const			/*{{{*/
{
   HashString const * const hsf = find("Checksum-FileSize");
   if (hsf == NULL)
      return 0;
   std::string const hv = hsf->HashValue();
   return strtoull(hv.c_str(), NULL, 10);
}
									/*}}}*/
bool HashStringList::FileSize(unsigned long long const Size)		/*{{{*/
{
   return push_back(HashString("Checksum-FileSize", std::to_string(Size)));
}
									/*}}}*/
bool HashStringList::supported(char const * const type)			/*{{{*/
{
   for (char const * const * t = HashString::SupportedHashes(); *t != NULL; ++t)
      if (strcasecmp(*t, type) == 0)
	 return true;
   return false;
}
									/*}}}*/
bool HashStringList::push_back(const HashString &hashString)		/*{{{*/
{
   if (hashString.HashType().empty() == true ||
	 hashString.HashValue().empty() == true ||
	 supported(hashString.HashType().c_str()) == false)
      return false;

   // ensure that each type is added only once
   HashString const * const hs = find(hashString.HashType().c_str());
   if (hs != NULL)
      return *hs == hashString;

   list.push_back(hashString);
   return true;
}
									/*}}}*/
bool HashStringList::VerifyFile(std::string filename) const		/*{{{*/
{
   if (usable() == false)
      return false;

   FileFd file(filename, FileFd::ReadOnly);
   if (file.IsOpen() == false)
      return false;
   Hashes hashes(*this);
   if (hashes.AddFD(file) == false)
      return false;
   return hashes.GetHashStringList() == *this;
}
									/*}}}*/
bool HashStringList::operator==(HashStringList const &other) const	/*{{{*/
{
   HashString const * const size = find("Checksum-FileSize");
   HashString const * const osize = other.find("Checksum-FileSize");
   if (size != NULL && osize != NULL && *size != *osize)
      return false;

   for (char const * const * t = HashString::SupportedHashes(); *t != NULL; ++t)
   {
      if (strcmp(*t, "Checksum-FileSize") == 0)
	 continue;
      HashString const * const hs = find(*t);
      HashString const * const ohs = other.find(*t);
      if (hs == NULL || ohs == NULL)
	 continue;
      return *hs == *ohs;
   }
   return false;
}
bool HashStringList::operator!=(HashStringList const &other) const
{
   return !(*this == other);
}
									/*}}}*/
static DEBFETCH_PURE std::string HexDigest(unsigned char const * const Sum, size_t const Size)
{
   static char const Conv[] = "0123456789abcdef";
   std::string Result;
   Result.reserve(Size * 2);
   for (size_t I = 0; I != Size; ++I)
   {
      Result.push_back(Conv[Sum[I] >> 4]);
      Result.push_back(Conv[Sum[I] & 0xF]);
   }
   return Result;
}

// PrivateHashes							/*{{{*/
class PrivateHashes
{
   public:
   unsigned long long FileSize{0};

   struct HashAlgo
   {
      size_t index;
      const char *name;
      const EVP_MD *(*evpLink)(void);
      Hashes::SupportedHashes ourAlgo;
   };

   static constexpr std::array<HashAlgo, 2> Algorithms{{
      HashAlgo{0, "SHA256", EVP_sha256, Hashes::SHA256SUM},
      HashAlgo{1, "SHA512", EVP_sha512, Hashes::SHA512SUM},
   }};

   private:
   std::array<EVP_MD_CTX *, Algorithms.size()> contexts{};

   public:
   bool Write(unsigned char const *Data, size_t Size)
   {
      for (auto &context : contexts)
	 if (context != nullptr && EVP_DigestUpdate(context, Data, Size) != 1)
	    return false;
      return true;
   }

   std::string HexDigest(HashAlgo const &algo)
   {
      unsigned char Sum[EVP_MAX_MD_SIZE];
      unsigned int Size = 0;

      // digest a copy, the caller might want to continue adding data
      EVP_MD_CTX * const tmpContext = EVP_MD_CTX_new();
      if (tmpContext == nullptr)
	 return "";
      EVP_MD_CTX_copy_ex(tmpContext, contexts[algo.index]);
      EVP_DigestFinal_ex(tmpContext, Sum, &Size);
      EVP_MD_CTX_free(tmpContext);

      return ::HexDigest(Sum, Size);
   }

   bool Enable(HashAlgo const &algo)
   {
      contexts[algo.index] = EVP_MD_CTX_new();
      if (contexts[algo.index] == nullptr)
	 return false;
      if (EVP_DigestInit_ex(contexts[algo.index], algo.evpLink(), NULL) == 1)
	 return true;
      EVP_MD_CTX_free(contexts[algo.index]);
      contexts[algo.index] = nullptr;
      return false;
   }
   bool IsEnabled(HashAlgo const &algo) const
   {
      return contexts[algo.index] != nullptr;
   }

   explicit PrivateHashes(unsigned int const CalcHashes)
   {
      for (auto const &Algo : Algorithms)
	 if ((CalcHashes & Algo.ourAlgo) == Algo.ourAlgo)
	    Enable(Algo);
   }
   explicit PrivateHashes(HashStringList const &Hashes)
   {
      for (auto const &Algo : Algorithms)
	 if (Hashes.usable() == false || Hashes.find(Algo.name) != NULL)
	    Enable(Algo);
   }
   ~PrivateHashes()
   {
      for (auto ctx : contexts)
	 if (ctx != nullptr)
	    EVP_MD_CTX_free(ctx);
   }
};
									/*}}}*/
// Hashes::Add* - Add the contents of data or FD			/*{{{*/
bool Hashes::Add(const unsigned char * const Data, unsigned long long const Size)
{
   if (Size != 0)
   {
      if (d->Write(Data, Size) == false)
	 return false;
      d->FileSize += Size;
   }
   return true;
}
bool Hashes::AddFD(int const Fd,unsigned long long Size)
{
   std::unique_ptr<unsigned char[]> Buf(new unsigned char[DEBFETCH_BUFFER_SIZE]);
   bool const ToEOF = (Size == UntilEOF);
   while (Size != 0 || ToEOF)
   {
      unsigned long long n = DEBFETCH_BUFFER_SIZE;
      if (ToEOF == false)
	 n = std::min(Size, n);
      ssize_t const Res = read(Fd, Buf.get(), n);
      if (Res < 0 || (ToEOF == false && Res != (ssize_t) n)) // error, or short read
	 return false;
      if (ToEOF == true && Res == 0) // EOF
	 break;
      Size -= Res;
      if (Add(Buf.get(), Res) == false)
	 return false;
   }
   return true;
}
bool Hashes::AddFD(FileFd &Fd,unsigned long long Size)
{
   std::unique_ptr<unsigned char[]> Buf(new unsigned char[DEBFETCH_BUFFER_SIZE]);
   bool const ToEOF = (Size == UntilEOF);
   while (Size != 0 || ToEOF)
   {
      unsigned long long n = DEBFETCH_BUFFER_SIZE;
      if (ToEOF == false)
	 n = std::min(Size, n);
      unsigned long long a = 0;
      if (Fd.Read(Buf.get(), n, &a) == false) // error
	 return false;
      if (ToEOF == false)
      {
	 if (a != n) // short read
	    return false;
      }
      else if (a == 0) // EOF
	 break;
      Size -= a;
      if (Add(Buf.get(), a) == false)
	 return false;
   }
   return true;
}
									/*}}}*/
HashStringList Hashes::GetHashStringList()				/*{{{*/
{
   HashStringList hashes;
   for (auto const &Algo : PrivateHashes::Algorithms)
      if (d->IsEnabled(Algo))
	 hashes.push_back(HashString(Algo.name, d->HexDigest(Algo)));
   hashes.FileSize(d->FileSize);

   return hashes;
}
									/*}}}*/
HashString Hashes::GetHashString(SupportedHashes hash)			/*{{{*/
{
   for (auto const &Algo : PrivateHashes::Algorithms)
      if (hash == Algo.ourAlgo && d->IsEnabled(Algo))
	 return HashString(Algo.name, d->HexDigest(Algo));
   return HashString();
}
									/*}}}*/
Hashes::Hashes() : d(new PrivateHashes(~0u)) { }
Hashes::Hashes(unsigned int const Hashes) : d(new PrivateHashes(Hashes)) {}
Hashes::Hashes(HashStringList const &Hashes) : d(new PrivateHashes(Hashes)) {}
Hashes::~Hashes() { delete d; }
