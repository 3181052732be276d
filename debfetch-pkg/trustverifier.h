// -*- mode: cpp; mode: fold -*-
// Description								/*{{{*/
/* ######################################################################

   Trust Verifier - Authenticate the Release metadata

   The repository key is turned into a keyring of its own inside the
   scratch directory of one download, gpgv is run against exactly this
   keyring and nothing else. Without a key the metadata is only
   unwrapped, never trusted.

   ##################################################################### */
									/*}}}*/
#ifndef DEBFETCH_TRUSTVERIFIER_H
#define DEBFETCH_TRUSTVERIFIER_H

#include <debfetch-pkg/macros.h>

#include <string>

class DEBFETCH_PUBLIC pkgTrustVerifier
{
   std::string const ScratchDir;
   std::string Keyring;
   bool const Debug;

   DEBFETCH_HIDDEN bool RunGPGV(std::string const &File, std::string const &Signature,
	 std::string const &Name) const;

   public:
   /** \brief import the repository key into the scratch keyring
    *
    *  KeySource is a local path or a http, https or file URI.
    */
   bool LoadKey(std::string const &KeySource);
   bool HasKey() const { return Keyring.empty() == false; }
   std::string const &GetKeyring() const { return Keyring; }

   /** \brief verify a clear-signed file like InRelease
    *
    *  The file is split into message and signature first, so the
    *  message verified by gpgv is exactly what is parsed later.
    *
    *  @param Signed is the downloaded file
    *  @param Name is the URI used in messages
    *  @param[out] Content is the path of the verified message
    */
   bool VerifyInline(std::string const &Signed, std::string const &Name, std::string &Content) const;

   /** \brief verify File against a detached signature like Release.gpg */
   bool VerifyDetached(std::string const &File, std::string const &Signature,
	 std::string const &Name) const;

   /** \brief the message of a possibly clear-signed file, unverified
    *  @param[out] Content is the path of the message */
   bool ExtractUnverified(std::string const &File, std::string const &Name, std::string &Content) const;

   explicit pkgTrustVerifier(std::string const &ScratchDir);
   virtual ~pkgTrustVerifier();
};

#endif
