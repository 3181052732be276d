// -*- mode: cpp; mode: fold -*-
// Description								/*{{{*/
/* ######################################################################

   Fetcher - Retrieve one repository file into the scratch directory

   A fetcher copies the resource behind a URI into a local file and
   hashes it on the way. There are no retries: one failed attempt is
   the answer for this URI and the caller decides if that is fatal.

   ##################################################################### */
									/*}}}*/
#ifndef DEBFETCH_FETCHER_H
#define DEBFETCH_FETCHER_H

#include <debfetch-pkg/hashes.h>
#include <debfetch-pkg/macros.h>

#include <memory>
#include <string>

class FileFd;

class DEBFETCH_PUBLIC pkgFetcher
{
   protected:
   bool const Debug;

   /** \brief write a chunk to the destination and add it to the hashes */
   static bool Store(FileFd &Dest, Hashes &Hash, void const * const Data, unsigned long long const Size);

   public:
   enum Status
   {
      /** the resource was stored completely */
      Ok,
      /** the server answered, but not with the resource */
      NotFound,
      /** no answer at all (resolving, connecting, reading, writing) */
      TransportFailed
   };

   /** \brief fetch Uri into DestFile
    *
    *  DestFile is truncated first and removed again unless the result
    *  is Ok. Only TransportFailed leaves an error on the stack.
    *
    *  @param[out] Result contains SHA256, SHA512 and the size of the
    *  stored file
    */
   virtual Status Fetch(std::string const &Uri, std::string const &DestFile,
			HashStringList &Result) = 0;

   /** \brief name of the access methods the fetcher handles */
   virtual char const *Name() const = 0;

   /** \brief create the fetcher for the access method of Uri
    *
    *  \return NULL with an error on the stack for unsupported methods
    */
   static std::unique_ptr<pkgFetcher> ForURI(std::string const &Uri);

   pkgFetcher();
   pkgFetcher(pkgFetcher const &) = delete;
   pkgFetcher &operator=(pkgFetcher const &) = delete;
   virtual ~pkgFetcher();
};

/** \brief compare a fetched file with the expected checksum and size
 *
 *  Expected holds exactly one hash type and optionally the size. A
 *  missing hash of that type in Received counts as mismatch.
 *
 *  \return \b false with the expected and received values on the
 *  error stack if they differ
 */
DEBFETCH_PUBLIC bool VerifyFetched(std::string const &Name, HashStringList const &Expected,
				   HashStringList const &Received);

/** \brief http and https via libcurl */
class DEBFETCH_PUBLIC CurlFetcher : public pkgFetcher
{
   static size_t write_data(void *buffer, size_t size, size_t nmemb, void *userp);

   public:
   virtual Status Fetch(std::string const &Uri, std::string const &DestFile,
			HashStringList &Result) override;
   virtual char const *Name() const override { return "http"; }

   CurlFetcher();
   virtual ~CurlFetcher();
};

/** \brief file: URIs naming a local mirror */
class DEBFETCH_PUBLIC FileFetcher : public pkgFetcher
{
   public:
   virtual Status Fetch(std::string const &Uri, std::string const &DestFile,
			HashStringList &Result) override;
   virtual char const *Name() const override { return "file"; }

   virtual ~FileFetcher();
};

#endif
