// -*- mode: cpp; mode: fold -*-
// Description								/*{{{*/
/* ######################################################################

   Fetcher - Retrieve one repository file into the scratch directory

   ##################################################################### */
									/*}}}*/
// Include Files							/*{{{*/
#include <config.h>

#include <debfetch-pkg/configuration.h>
#include <debfetch-pkg/error.h>
#include <debfetch-pkg/fetcher.h>
#include <debfetch-pkg/fileutl.h>
#include <debfetch-pkg/hashes.h>
#include <debfetch-pkg/strutl.h>

#include <cerrno>
#include <iostream>
#include <memory>
#include <string>

#include <sys/stat.h>

#include <curl/curl.h>

#include <debfetchi18n.h>
									/*}}}*/

using std::string;

// pkgFetcher - Base class						/*{{{*/
pkgFetcher::pkgFetcher() : Debug(_config->FindB("Debug::Debfetch", false))
{
}
pkgFetcher::~pkgFetcher() {}

bool pkgFetcher::Store(FileFd &Dest, Hashes &Hash, void const * const Data, unsigned long long const Size)
{
   if (Dest.Write(Data, Size) == false)
      return false;
   return Hash.Add(static_cast<unsigned char const *>(Data), Size);
}
									/*}}}*/
// pkgFetcher::ForURI - Pick the fetcher for an access method		/*{{{*/
std::unique_ptr<pkgFetcher> pkgFetcher::ForURI(string const &Uri)
{
   ::URI const U(Uri);
   if (U.Access == "http" || U.Access == "https")
      return std::unique_ptr<pkgFetcher>(new CurlFetcher());
   if (U.Access == "file")
      return std::unique_ptr<pkgFetcher>(new FileFetcher());

   _error->Error(_("The method driver %s could not be found."), U.Access.c_str());
   return nullptr;
}
									/*}}}*/
// VerifyFetched - Compare hashes and size of a fetched file		/*{{{*/
static string DescribeHashes(HashStringList const &List, char const * const Type)
{
   string Res;
   HashString const * const Hash = List.find(Type);
   if (Hash != nullptr)
      Res.append(Hash->toStr());
   else
      Res.append(Type).append(":");
   Res.append(" Size:").append(std::to_string(List.FileSize()));
   return Res;
}
bool VerifyFetched(string const &Name, HashStringList const &Expected,
		   HashStringList const &Received)
{
   HashString const * const Want = Expected.find(nullptr);
   if (Want == nullptr || Want->HashType() == "Checksum-FileSize")
      return _error->Error(_("No checksum found for %s"), Name.c_str());

   bool Match = true;
   if (Expected.find("Checksum-FileSize") != nullptr)
      Match = Expected.FileSize() == Received.FileSize();
   HashString const * const Got = Received.find(Want->HashType());
   if (Match == true)
      Match = Got != nullptr && *Got == *Want;

   if (_config->FindB("Debug::Hashes", false) == true)
      std::clog << Name << ": " << (Match ? "match" : "mismatch")
		<< " expected " << DescribeHashes(Expected, Want->HashType().c_str())
		<< " received " << DescribeHashes(Received, Want->HashType().c_str()) << std::endl;
   if (Match == true)
      return true;

   string Msg;
   strprintf(Msg, _("Checksum mismatch on repository item %s"), Name.c_str());
   Msg.append("\n  ").append(_("Hashes of expected file:")).append(" ")
      .append(DescribeHashes(Expected, Want->HashType().c_str()));
   Msg.append("\n  ").append(_("Hashes of received file:")).append(" ")
      .append(DescribeHashes(Received, Want->HashType().c_str()));
   return _error->Error("%s", Msg.c_str());
}
									/*}}}*/

// CurlFetcher - libcurl based http and https				/*{{{*/
namespace {
// minimum speed in bytes/sec that triggers download timeout handling
constexpr long DL_MIN_SPEED = 10;

struct CurlGlobal
{
   CURLcode const Init;
   CurlGlobal() : Init(curl_global_init(CURL_GLOBAL_DEFAULT)) {}
   ~CurlGlobal() { if (Init == CURLE_OK) curl_global_cleanup(); }
};

struct CURLUserPointer
{
   FileFd *File;
   Hashes *Hash;
};

struct CurlDeleter
{
   void operator()(CURL *curl) const { curl_easy_cleanup(curl); }
};
}

CurlFetcher::CurlFetcher()
{
   static CurlGlobal const Global;
   if (Global.Init != CURLE_OK)
      _error->Warning("curl: %s", curl_easy_strerror(Global.Init));
}
CurlFetcher::~CurlFetcher() {}

size_t CurlFetcher::write_data(void *buffer, size_t size, size_t nmemb, void *userp)
{
   CURLUserPointer *me = static_cast<CURLUserPointer *>(userp);
   size_t const buffer_size = size * nmemb;
   if (Store(*me->File, *me->Hash, buffer, buffer_size) == false)
      return 0;
   return buffer_size;
}
									/*}}}*/
// CurlFetcher::Fetch - Single GET of the given URI			/*{{{*/
pkgFetcher::Status CurlFetcher::Fetch(string const &Uri, string const &DestFile,
				      HashStringList &Result)
{
   ::URI const U(Uri);
   std::string const Scope = "Acquire::" + U.Access + "::";
   auto const ConfigFind = [&](char const * const Key, string const &Default) {
      return _config->Find(Scope + Key, _config->Find(string("Acquire::http::") + Key, Default));
   };
   auto const ConfigFindB = [&](char const * const Key, bool const Default) {
      return _config->FindB(Scope + Key, _config->FindB(string("Acquire::http::") + Key, Default));
   };

   std::unique_ptr<CURL, CurlDeleter> curl(curl_easy_init());
   if (curl == nullptr)
   {
      _error->Error(_("Could not get new curl handle for %s"), Uri.c_str());
      return TransportFailed;
   }

   FileFd File;
   if (File.Open(DestFile, FileFd::WriteEmpty) == false)
      return TransportFailed;
   File.EraseOnFailure();

   Hashes Hash(Hashes::SHA256SUM | Hashes::SHA512SUM);
   CURLUserPointer userp = { &File, &Hash };
   char curl_errorstr[CURL_ERROR_SIZE] = "";

   curl_easy_setopt(curl.get(), CURLOPT_URL, Uri.c_str());
   curl_easy_setopt(curl.get(), CURLOPT_WRITEFUNCTION, write_data);
   curl_easy_setopt(curl.get(), CURLOPT_WRITEDATA, &userp);
   curl_easy_setopt(curl.get(), CURLOPT_NOPROGRESS, 1L);
   curl_easy_setopt(curl.get(), CURLOPT_FOLLOWLOCATION, 1L);
   curl_easy_setopt(curl.get(), CURLOPT_MAXREDIRS, 10L);
   curl_easy_setopt(curl.get(), CURLOPT_ERRORBUFFER, curl_errorstr);

   if (U.Access == "https")
   {
      curl_easy_setopt(curl.get(), CURLOPT_PROTOCOLS, CURLPROTO_HTTPS);
      curl_easy_setopt(curl.get(), CURLOPT_REDIR_PROTOCOLS, CURLPROTO_HTTPS);
      curl_easy_setopt(curl.get(), CURLOPT_SSL_VERIFYPEER, ConfigFindB("Verify-Peer", true) ? 1L : 0L);
      curl_easy_setopt(curl.get(), CURLOPT_SSL_VERIFYHOST, ConfigFindB("Verify-Host", true) ? 2L : 0L);
      string const cainfo = ConfigFind("CaInfo", "");
      if (cainfo.empty() == false)
	 curl_easy_setopt(curl.get(), CURLOPT_CAINFO, cainfo.c_str());
   }
   else
   {
      curl_easy_setopt(curl.get(), CURLOPT_PROTOCOLS, CURLPROTO_HTTP | CURLPROTO_HTTPS);
      curl_easy_setopt(curl.get(), CURLOPT_REDIR_PROTOCOLS, CURLPROTO_HTTP | CURLPROTO_HTTPS);
   }

   curl_easy_setopt(curl.get(), CURLOPT_USERAGENT,
	 ConfigFind("User-Agent", "Debfetch/" PACKAGE_VERSION).c_str());

   long const timeout = _config->FindI(Scope + "Timeout", _config->FindI("Acquire::http::Timeout", 120));
   curl_easy_setopt(curl.get(), CURLOPT_CONNECTTIMEOUT, timeout);
   curl_easy_setopt(curl.get(), CURLOPT_LOW_SPEED_LIMIT, DL_MIN_SPEED);
   curl_easy_setopt(curl.get(), CURLOPT_LOW_SPEED_TIME, timeout);

   bool const DebugHttp = _config->FindB("Debug::Acquire::http", false);
   if (DebugHttp == true)
      curl_easy_setopt(curl.get(), CURLOPT_VERBOSE, 1L);
   if (Debug == true || DebugHttp == true)
      std::clog << "GET " << URI::NoUserPassword(Uri) << std::endl;

   CURLcode const success = curl_easy_perform(curl.get());
   long status = 0;
   curl_easy_getinfo(curl.get(), CURLINFO_RESPONSE_CODE, &status);

   if (success != CURLE_OK)
   {
      // only take curls technical errors if we haven't our own
      if (_error->PendingError() == false)
	 _error->Error("%s: %s", URI::NoUserPassword(Uri).c_str(),
	       curl_errorstr[0] != '\0' ? curl_errorstr : curl_easy_strerror(success));
      File.OpFail();
      File.Close();
      return TransportFailed;
   }

   if (status != 200)
   {
      if (Debug == true || DebugHttp == true)
	 std::clog << "Answer for " << URI::NoUserPassword(Uri) << ": " << status << std::endl;
      File.OpFail();
      File.Close();
      return NotFound;
   }

   if (File.Close() == false)
      return TransportFailed;
   Result = Hash.GetHashStringList();
   return Ok;
}
									/*}}}*/

// FileFetcher - Copy from the local filesystem				/*{{{*/
FileFetcher::~FileFetcher() {}

pkgFetcher::Status FileFetcher::Fetch(string const &Uri, string const &DestFile,
				      HashStringList &Result)
{
   ::URI const Get(Uri);
   if (Get.Host.empty() == false)
   {
      _error->Error(_("Invalid URI, local URIS must not start with //"));
      return TransportFailed;
   }
   string const File = DeQuoteString(Get.Path);
   if (Debug == true)
      std::clog << "Copy " << File << std::endl;

   if (RemoveFile("FileFetcher::Fetch", DestFile) == false)
      return TransportFailed;
   struct stat Buf;
   if (stat(File.c_str(), &Buf) != 0)
   {
      if (errno == ENOENT || errno == ENOTDIR)
	 return NotFound;
      _error->Errno("stat", _("Unable to access file %s"), File.c_str());
      return TransportFailed;
   }
   if (S_ISDIR(Buf.st_mode))
      return NotFound;

   FileFd From;
   if (From.Open(File, FileFd::ReadOnly) == false)
      return TransportFailed;
   FileFd To;
   if (To.Open(DestFile, FileFd::WriteEmpty) == false)
      return TransportFailed;
   To.EraseOnFailure();

   Hashes Hash(Hashes::SHA256SUM | Hashes::SHA512SUM);
   std::unique_ptr<char[]> Buffer(new char[DEBFETCH_BUFFER_SIZE]);
   while (true)
   {
      unsigned long long Actual = 0;
      if (From.Read(Buffer.get(), DEBFETCH_BUFFER_SIZE, &Actual) == false)
      {
	 To.OpFail();
	 return TransportFailed;
      }
      if (Actual == 0)
	 break;
      if (Store(To, Hash, Buffer.get(), Actual) == false)
      {
	 To.OpFail();
	 return TransportFailed;
      }
   }

   if (To.Close() == false)
      return TransportFailed;
   Result = Hash.GetHashStringList();
   return Ok;
}
									/*}}}*/
