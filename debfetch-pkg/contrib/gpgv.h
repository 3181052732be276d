// -*- mode: cpp; mode: fold -*-
// Description								/*{{{*/
/* ######################################################################

   Helpers to deal with gpgv better and more easily

   gpgv is run against a keyring built from exactly one repository key.
   Its --status-fd output is collected into a GPGVSigners record which
   decides whether the signature is acceptable: gpgv has to exit
   cleanly and one key has to be reported as GOODSIG and VALIDSIG.

   ##################################################################### */
									/*}}}*/
#ifndef DEBFETCH_GPGV_H
#define DEBFETCH_GPGV_H

#include <debfetch-pkg/macros.h>

#include <string>
#include <vector>

class FileFd;

/** \brief signer information collected from the gpgv status lines */
struct DEBFETCH_PUBLIC GPGVSigners
{
   std::vector<std::string> Good;
   std::vector<std::string> Bad;
   // expired or revoked keys and signatures made with untrusted digests
   std::vector<std::string> Worthless;
   // signatures made with digests configured as weak
   std::vector<std::string> SoonWorthless;
   std::vector<std::string> NoPubKey;
   std::vector<std::string> Valid;
   // fingerprints that are VALIDSIG and GOODSIG at the same time
   std::vector<std::string> SignedBy;
   bool NoData = false;

   /** \brief feed one line of gpgv --status-fd output
    *
    *  Lines not starting with the [GNUPG:] prefix are ignored.
    */
   void ParseStatusLine(std::string const &Line);
   /** \brief resolve the collected lines into SignedBy, call once */
   void Finish();
   /** \brief is there at least one good and valid signer? */
   bool Trusted() const { return SignedBy.empty() == false; }
   /** \brief human readable reason for a rejection */
   std::string Explain() const;

   private:
   std::vector<std::string> ErrSigners;
   std::vector<std::string> UntrustedValid;
};

/** \brief compare a VALIDSIG fingerprint with a GOODSIG key
 *
 *  GOODSIG may carry a long keyid or the full fingerprint,
 *  VALIDSIG always the fingerprint.
 */
DEBFETCH_PUBLIC bool IsTheSameKey(std::string const &validsig, std::string const &goodsig);

/** \brief run gpgv on a detached signature
 *
 *  gpgv runs with an isolated --homedir, the given keyring as only
 *  keyring and --status-fd 3. The weak digests named in
 *  Debfetch::Gpgv::WeakDigests are allowed for the signature
 *  envelope only; the digest of a VALIDSIG is judged separately.
 *
 *  @param File is the signed message
 *  @param FileSig is the detached signature
 *  @param Keyring is the binary keyring file
 *  @param HomeDir is an empty directory gpgv may use
 *  @param[out] Signers collects the status lines
 *  @param[out] ExitStatus is the exit status of gpgv
 *  @return \b false if gpgv could not be run at all
 */
DEBFETCH_PUBLIC bool ExecGPGV(std::string const &File, std::string const &FileSig,
      std::string const &Keyring, std::string const &HomeDir,
      GPGVSigners &Signers, int &ExitStatus);

/** \brief copy an OpenPGP public key into a binary keyring
 *
 *  ASCII armored keys are dearmored, binary keys are recognized by
 *  the leading public key packet tag and copied as they are.
 *
 *  @return \b false with an error on the stack if the key is neither
 */
DEBFETCH_PUBLIC bool ImportKeyIntoKeyring(std::string const &KeyFile, FileFd &Keyring);

/** \brief Split an inline signature into message and signature
 *
 *  Takes a clear-signed message and puts the first signed message
 *  in the content file and all signatures following it into the
 *  second. Unsigned messages, additional messages as well as
 *  whitespaces are discarded. The resulting files are suitable to
 *  be checked with gpgv.
 *
 *  If a FileFd pointers is NULL it will not be used and the content
 *  which would have been written to it is silently discarded.
 *
 *  Note that trying to split an unsigned file will fail, but
 *  not generate an error message.
 *
 *  @param InFile is the clear-signed file
 *  @param ContentFile is the FileFd the message will be written to
 *  @param ContentHeader is a list of all required Armored Headers for the message
 *  @param SignatureFile is the FileFd all signatures will be written to
 *  @return true if the splitting was successful, false otherwise
 */
DEBFETCH_PUBLIC bool SplitClearSignedFile(std::string const &InFile, FileFd * const ContentFile,
      std::vector<std::string> * const ContentHeader, FileFd * const SignatureFile);

/** \brief open a file which might be clear-signed
 *
 * This method tries to extract the (signed) message of a file.
 * If the file isn't signed it will just open the given filename.
 * Otherwise the message is extracted to a temporary file which
 * will be opened instead.
 *
 * @param ClearSignedFileName is the name of the file to open
 * @param[out] MessageFile is the FileFd in which the file will be opened
 * @return \b true if opening was successful, otherwise \b false
 */
DEBFETCH_PUBLIC bool OpenMaybeClearSignedFile(std::string const &ClearSignedFileName, FileFd &MessageFile);

/** \brief check that a detached signature file contains only signatures
 *
 *  Anything outside of the armored signature blocks is rejected, so
 *  a captive portal page or a Release file stored under the wrong
 *  name is reported instead of being handed to gpgv.
 */
DEBFETCH_PUBLIC bool VerifyDetachedSignatureFile(std::string const &DetachedSignatureFileName);

#endif
