// -*- mode: cpp; mode: fold -*-
// Description								/*{{{*/
/* ######################################################################

   Trust Verifier - Authenticate the Release metadata

   ##################################################################### */
									/*}}}*/
// Include Files							/*{{{*/
#include <config.h>

#include <debfetch-pkg/configuration.h>
#include <debfetch-pkg/error.h>
#include <debfetch-pkg/fetcher.h>
#include <debfetch-pkg/fileutl.h>
#include <debfetch-pkg/gpgv.h>
#include <debfetch-pkg/hashes.h>
#include <debfetch-pkg/strutl.h>
#include <debfetch-pkg/trustverifier.h>

#include <iostream>
#include <memory>
#include <string>

#include <debfetchi18n.h>
									/*}}}*/

using std::string;

pkgTrustVerifier::pkgTrustVerifier(string const &ScratchDir) : ScratchDir(ScratchDir),
   Debug(_config->FindB("Debug::Debfetch", false))
{
}
pkgTrustVerifier::~pkgTrustVerifier() {}

// TrustVerifier::LoadKey - Build the keyring of this download		/*{{{*/
bool pkgTrustVerifier::LoadKey(string const &KeySource)
{
   string KeyFile = KeySource;
   ::URI const U(KeySource);
   if (U.Access == "http" || U.Access == "https" || U.Access == "file")
   {
      std::unique_ptr<pkgFetcher> Fetcher = pkgFetcher::ForURI(KeySource);
      if (Fetcher == nullptr)
	 return false;
      KeyFile = flCombine(ScratchDir, "repository.key");
      HashStringList Ignored;
      switch (Fetcher->Fetch(KeySource, KeyFile, Ignored))
      {
	 case pkgFetcher::Ok:
	    break;
	 case pkgFetcher::NotFound:
	    return _error->Error(_("Unable to fetch archive element '%s'"), URI::NoUserPassword(KeySource).c_str());
	 case pkgFetcher::TransportFailed:
	    return false;
      }
   }
   else if (RealFileExists(KeyFile) == false)
      return _error->Error(_("Unable to read %s"), KeyFile.c_str());

   string const Target = flCombine(ScratchDir, "trusted.gpg");
   FileFd Ring;
   if (Ring.Open(Target, FileFd::WriteTemp, 0600) == false)
      return false;
   Ring.EraseOnFailure();
   if (ImportKeyIntoKeyring(KeyFile, Ring) == false)
   {
      Ring.OpFail();
      return false;
   }
   if (Ring.Close() == false)
      return false;

   if (Debug == true)
      std::clog << "Imported " << KeySource << " into " << Target << std::endl;
   Keyring = Target;
   return true;
}
									/*}}}*/
// TrustVerifier::RunGPGV - Let gpgv decide				/*{{{*/
// ---------------------------------------------------------------------
/* gpgv has to succeed and at least one key has to be reported as both
   GOODSIG and VALIDSIG, anything else is a failed verification. */
bool pkgTrustVerifier::RunGPGV(string const &File, string const &Signature,
			       string const &Name) const
{
   if (HasKey() == false)
      return _error->Error(_("The signature of %s could not be verified"), Name.c_str());

   GPGVSigners Signers;
   int ExitStatus = 0;
   if (ExecGPGV(File, Signature, Keyring, ScratchDir, Signers, ExitStatus) == false)
      return false;

   if (ExitStatus == 0 && Signers.Trusted() == true)
   {
      if (Debug == true)
	 std::clog << Name << " is signed by " << Debfetch::String::Join(Signers.SignedBy, ", ") << std::endl;
      return true;
   }

   string Detail = Signers.Explain();
   if (ExitStatus != 0 && Signers.Trusted() == true)
      strprintf(Detail, _("gpgv exited with status %d"), ExitStatus);
   return _error->Error(_("The signature of %s could not be verified: %s"), Name.c_str(), Detail.c_str());
}
									/*}}}*/
// TrustVerifier::VerifyInline - Split and verify a clear-signed file	/*{{{*/
bool pkgTrustVerifier::VerifyInline(string const &Signed, string const &Name, string &Content) const
{
   string const Message = flCombine(ScratchDir, flNotDir(Signed) + ".message");
   string const Signature = flCombine(ScratchDir, flNotDir(Signed) + ".sig");
   {
      FileFd MessageFd, SignatureFd;
      if (MessageFd.Open(Message, FileFd::WriteEmpty, 0600) == false ||
	    SignatureFd.Open(Signature, FileFd::WriteEmpty, 0600) == false)
	 return false;

      _error->PushToStack();
      bool const Split = SplitClearSignedFile(Signed, &MessageFd, nullptr, &SignatureFd);
      _error->MergeWithStack();
      if (Split == false)
      {
	 if (_error->PendingError() == false)
	    _error->Error(_("The signature of %s could not be verified: %s"), Name.c_str(),
		  "NOSPLIT");
	 return false;
      }
      if (MessageFd.Close() == false || SignatureFd.Close() == false)
	 return false;
   }

   if (RunGPGV(Message, Signature, Name) == false)
      return false;
   Content = Message;
   return true;
}
									/*}}}*/
// TrustVerifier::VerifyDetached - Verify against Release.gpg		/*{{{*/
bool pkgTrustVerifier::VerifyDetached(string const &File, string const &Signature,
				      string const &Name) const
{
   if (VerifyDetachedSignatureFile(Signature) == false)
   {
      _error->Error(_("The signature of %s could not be verified"), Name.c_str());
      return false;
   }
   return RunGPGV(File, Signature, Name);
}
									/*}}}*/
// TrustVerifier::ExtractUnverified - Unwrap without checking		/*{{{*/
bool pkgTrustVerifier::ExtractUnverified(string const &File, string const &Name, string &Content) const
{
   if (StartsWithGPGClearTextSignature(File) == false)
   {
      Content = File;
      return true;
   }

   string const Message = flCombine(ScratchDir, flNotDir(File) + ".message");
   FileFd MessageFd;
   if (MessageFd.Open(Message, FileFd::WriteEmpty, 0600) == false)
      return false;
   if (SplitClearSignedFile(File, &MessageFd, nullptr, nullptr) == false)
   {
      MessageFd.OpFail();
      if (_error->PendingError() == false)
	 _error->Error(_("Clearsigned file %s isn't valid, got '%s' (does the network require authentication?)"), Name.c_str(), "NOSPLIT");
      return false;
   }
   if (MessageFd.Close() == false)
      return false;
   Content = Message;
   return true;
}
									/*}}}*/
