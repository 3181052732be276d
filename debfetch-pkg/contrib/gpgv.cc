// -*- mode: cpp; mode: fold -*-
// Include Files							/*{{{*/
#include <config.h>

#include <debfetch-pkg/configuration.h>
#include <debfetch-pkg/error.h>
#include <debfetch-pkg/fileutl.h>
#include <debfetch-pkg/gpgv.h>
#include <debfetch-pkg/strutl.h>

#include <cctype>
#include <cerrno>
#include <cstddef>
#include <cstdio>
#include <cstdlib>
#include <cstring>
#include <fcntl.h>
#include <sys/wait.h>
#include <unistd.h>

#include <algorithm>
#include <iostream>
#include <iterator>
#include <sstream>
#include <string>
#include <vector>

#include <debfetchi18n.h>
									/*}}}*/

static char const GNUPGPREFIX[] = "[GNUPG:] ";

class LineBuffer							/*{{{*/
{
   std::string line;

   public:
   bool empty() const noexcept { return line.empty(); }
   std::string const &view() const noexcept { return line; }
   bool starts_with(char const * const start) const { return line.compare(0, strlen(start), start) == 0; }

   bool writeTo(FileFd *const to, size_t offset = 0) const
   {
      if (to == nullptr)
	 return true;
      return to->Write(line.data() + offset, line.length() - offset);
   }
   bool writeLineTo(FileFd *const to) const
   {
      if (to == nullptr)
	 return true;
      return to->Write(line.data(), line.length()) && to->Write("\n", 1);
   }
   bool writeNewLineIf(FileFd *const to, bool const condition) const
   {
      if (condition == false || to == nullptr)
	 return true;
      return to->Write("\n", 1);
   }

   bool readFrom(FileFd &stream, std::string const &InFile, bool acceptEoF = false)
   {
      if (stream.ReadLine(line) == false)
      {
	 if (stream.Failed() == true)
	    return false;
	 if (acceptEoF)
	    return false;
	 return _error->Error("Splitting of clearsigned file %s failed as it doesn't contain all expected parts", InFile.c_str());
      }
      // trailing whitespace is not part of the signed text (rfc4880 §7.1)
      std::string::size_type const end = line.find_last_not_of(" \t\r");
      if (end == std::string::npos)
	 line.clear();
      else
	 line.erase(end + 1);
      return true;
   }
};
static bool operator==(LineBuffer const &buf, char const * const exp)
{
   return buf.view() == exp;
}
static bool operator!=(LineBuffer const &buf, char const * const exp)
{
   return buf.view() != exp;
}
									/*}}}*/
// Digest - OpenPGP hash algorithm ids as reported by VALIDSIG		/*{{{*/
struct Digest {
   enum class State {
      Untrusted,
      Weak,
      Trusted,
   } state;
   char const *name;

   State getState() const {
      std::string optionUntrusted;
      std::string optionWeak;
      strprintf(optionUntrusted, "Debfetch::Hashes::%s::Untrusted", name);
      strprintf(optionWeak, "Debfetch::Hashes::%s::Weak", name);
      if (_config->FindB(optionUntrusted, false) == true)
	 return State::Untrusted;
      if (_config->FindB(optionWeak, false) == true)
	 return State::Weak;
      return state;
   }
};
static Digest const Digests[] = {
   {Digest::State::Untrusted, "Invalid digest"},
   {Digest::State::Untrusted, "MD5"},
   {Digest::State::Untrusted, "SHA1"},
   {Digest::State::Untrusted, "RIPEMD160"},
   {Digest::State::Trusted, "Reserved digest"},
   {Digest::State::Trusted, "Reserved digest"},
   {Digest::State::Trusted, "Reserved digest"},
   {Digest::State::Trusted, "Reserved digest"},
   {Digest::State::Trusted, "SHA256"},
   {Digest::State::Trusted, "SHA384"},
   {Digest::State::Trusted, "SHA512"},
   {Digest::State::Trusted, "SHA224"},
};
static Digest const &FindDigest(std::string const &Id)
{
   int const id = atoi(Id.c_str());
   if (id >= 0 && static_cast<size_t>(id) < sizeof(Digests) / sizeof(Digests[0]))
      return Digests[id];
   return Digests[0];
}
									/*}}}*/
bool IsTheSameKey(std::string const &validsig, std::string const &goodsig) /*{{{*/
{
   // VALIDSIG reports a fingerprint (40 = 24 + 16), GOODSIG can be longid (16) or
   // fingerprint according to documentation in DETAILS.gz
   if (validsig.length() < 40)
      return validsig == goodsig;
   if (goodsig.length() == 40)
      return validsig.compare(0, 40, goodsig) == 0;
   if (goodsig.length() == 16)
      return validsig.compare(24, 16, goodsig) == 0;
   return false;
}
									/*}}}*/
// GPGVSigners::ParseStatusLine - sort one status line in		/*{{{*/
static std::string KeyIdOf(std::string const &msg)
{
   // "KEYWORD <hexdigits> rest..."
   std::string::size_type const start = msg.find(' ');
   if (start == std::string::npos)
      return "";
   std::string::size_type end = start + 1;
   while (end < msg.length() && isxdigit(msg[end]) != 0)
      ++end;
   return msg.substr(start + 1, end - start - 1);
}
void GPGVSigners::ParseStatusLine(std::string const &Line)
{
   bool const Debug = _config->FindB("Debug::Acquire::gpgv", false);
   if (Line.compare(0, strlen(GNUPGPREFIX), GNUPGPREFIX) != 0)
      return;
   std::string msg = Line.substr(strlen(GNUPGPREFIX));
   std::string::size_type const nuke = msg.find_last_not_of("\n\t\r ");
   msg.erase(nuke == std::string::npos ? 0 : nuke + 1);
   if (Debug == true)
      std::clog << "Got " << msg << " !" << std::endl;

   auto const is = [&msg](char const * const keyword) {
      size_t const len = strlen(keyword);
      return msg.compare(0, len, keyword) == 0 && (msg.length() == len || msg[len] == ' ');
   };

   if (is("BADSIG"))
      Bad.push_back(msg);
   else if (is("ERRSIG"))
      ErrSigners.push_back(KeyIdOf(msg));
   else if (is("NO_PUBKEY"))
   {
      std::string const key = KeyIdOf(msg);
      NoPubKey.push_back(key);
      ErrSigners.erase(std::remove(ErrSigners.begin(), ErrSigners.end(), key), ErrSigners.end());
   }
   else if (is("NODATA"))
      NoData = true;
   else if (is("EXPKEYSIG") || is("EXPSIG") || is("REVKEYSIG"))
      Worthless.push_back(msg);
   else if (is("GOODSIG"))
      Good.push_back(KeyIdOf(msg));
   else if (is("VALIDSIG"))
   {
      std::istringstream iss(msg);
      std::vector<std::string> const tokens{std::istream_iterator<std::string>{iss},
	 std::istream_iterator<std::string>{}};
      if (tokens.size() < 9)
      {
	 Worthless.push_back(msg);
	 return;
      }
      std::string const &sig = tokens[1];
      Digest const &digest = FindDigest(tokens[8]);
      switch (digest.getState())
      {
	 case Digest::State::Weak:
	    SoonWorthless.push_back(sig);
	    if (Debug == true)
	       std::clog << "Got weak VALIDSIG, key ID: " << sig << std::endl;
	    break;
	 case Digest::State::Untrusted:
	    // treated like an expired key: the VALIDSIG is not enough
	    Worthless.push_back(sig + " (" + digest.name + ")");
	    UntrustedValid.push_back(sig);
	    if (Debug == true)
	       std::clog << "Got untrusted VALIDSIG, key ID: " << sig << std::endl;
	    return;
	 case Digest::State::Trusted:
	    if (Debug == true)
	       std::clog << "Got trusted VALIDSIG, key ID: " << sig << std::endl;
	    break;
      }
      Valid.push_back(sig);
   }
}
									/*}}}*/
void GPGVSigners::Finish()						/*{{{*/
{
   std::move(ErrSigners.begin(), ErrSigners.end(), std::back_inserter(Worthless));
   ErrSigners.clear();

   Good.erase(std::remove_if(Good.begin(), Good.end(), [&](std::string const &good) {
	    return std::any_of(UntrustedValid.begin(), UntrustedValid.end(), [&](std::string const &sig) {
		  return IsTheSameKey(sig, good); });
	    }), Good.end());

   // for gpg an expired key is valid, too, but we want only the valid & good ones
   SignedBy.clear();
   for (auto const &v : Valid)
      if (std::any_of(Good.begin(), Good.end(), [&v](std::string const &g) { return IsTheSameKey(v, g); }))
	 SignedBy.push_back(v);
   std::sort(SignedBy.begin(), SignedBy.end());
}
									/*}}}*/
std::string GPGVSigners::Explain() const				/*{{{*/
{
   if (NoData == true)
   {
      std::string errmsg;
      strprintf(errmsg, _("Signed file isn't valid, got '%s' (does the network require authentication?)"), "NODATA");
      return errmsg;
   }
   std::string errmsg;
   if (Bad.empty() == false || Worthless.empty() == false)
   {
      errmsg += _("The following signatures were invalid:\n");
      for (auto const &I : Bad)
	 errmsg.append(I).append("\n");
      for (auto const &I : Worthless)
	 errmsg.append(I).append("\n");
   }
   if (NoPubKey.empty() == false)
   {
      errmsg += _("The following signatures couldn't be verified because the public key is not available:\n");
      for (auto const &I : NoPubKey)
	 errmsg.append("NO_PUBKEY ").append(I).append("\n");
   }
   if (errmsg.empty() == true)
      errmsg = _("No good and valid signature was found.");
   else if (errmsg.back() == '\n')
      errmsg.pop_back();
   return errmsg;
}
									/*}}}*/
// ExecGPGV - run gpgv and collect its status output			/*{{{*/
// ---------------------------------------------------------------------
/* The status is read from a pipe placed on fd 3 of the child, its
   stdout and stderr are discarded and the locale is reset so the
   status keywords are never translated. */
bool ExecGPGV(std::string const &File, std::string const &FileSig,
      std::string const &Keyring, std::string const &HomeDir,
      GPGVSigners &Signers, int &ExitStatus)
{
#define EINTERNAL 111
   bool const Debug = _config->FindB("Debug::Acquire::gpgv", false);
   ExitStatus = EINTERNAL;
   std::string const gpgv = _config->Find("Dir::Bin::gpgv", "/usr/bin/gpgv");

   std::vector<std::string> Args;
   Args.reserve(16);
   Args.push_back(gpgv);
   Args.push_back("--homedir");
   Args.push_back(HomeDir);
   Args.push_back("--keyring");
   Args.push_back(Keyring);
   for (auto const &weak : _config->FindVector("Debfetch::Gpgv::WeakDigests", "SHA1,RIPEMD160"))
   {
      if (weak.empty())
	 continue;
      Args.push_back("--weak-digest");
      Args.push_back(weak);
   }
   Args.push_back("--status-fd");
   Args.push_back("3");

   Configuration::Item const *Opts = _config->Tree("Acquire::gpgv::Options");
   if (Opts != nullptr)
   {
      for (Opts = Opts->Child; Opts != nullptr; Opts = Opts->Next)
      {
	 if (Opts->Value.empty())
	    continue;
	 Args.push_back(Opts->Value);
      }
   }
   Args.push_back(FileSig);
   Args.push_back(File);

   if (Debug)
   {
      std::clog << "Preparing to exec: ";
      for (auto const &a : Args)
	 std::clog << " " << a;
      std::clog << std::endl;
   }

   // Translate the argument list to a C array before the fork
   std::vector<const char *> cArgs;
   cArgs.reserve(Args.size() + 1);
   for (auto const &arg : Args)
      cArgs.push_back(arg.c_str());
   cArgs.push_back(nullptr);

   int fd[2];
   if (pipe(fd) != 0)
      return _error->Errno("pipe", "Couldn't create pipe for %s", gpgv.c_str());

   pid_t const pid = ExecFork({fd[1]});
   if (pid < 0)
   {
      close(fd[0]);
      close(fd[1]);
      return _error->Error("Fork failed for %s to check %s", gpgv.c_str(), File.c_str());
   }
   if (pid == 0)
   {
      int const nullfd = open("/dev/null", O_WRONLY);
      if (nullfd != -1)
      {
	 dup2(nullfd, STDOUT_FILENO);
	 dup2(nullfd, STDERR_FILENO);
      }
      if (fd[0] != 3)
	 close(fd[0]);
      dup2(fd[1], 3);

      putenv((char *)"LANG=");
      putenv((char *)"LC_ALL=");
      putenv((char *)"LC_MESSAGES=");

      execv(cArgs[0], (char **) &cArgs[0]);
      _exit(EINTERNAL);
   }
   close(fd[1]);

   FileFd status;
   if (status.OpenDescriptor(fd[0], FileFd::ReadOnly, true) == false)
   {
      ExecWait(pid, gpgv.c_str(), true);
      return false;
   }
   for (std::string line; status.ReadLine(line);)
   {
      if (Debug == true)
	 std::clog << "Read: " << line << std::endl;
      Signers.ParseStatusLine(line);
   }
   status.Close();
   Signers.Finish();

   int Status;
   while (waitpid(pid, &Status, 0) != pid)
   {
      if (errno == EINTR)
	 continue;
      return _error->Error(_("Waited for %s but it wasn't there"), gpgv.c_str());
   }
   if (WIFEXITED(Status) == 0)
      return _error->Error(_("Sub-process %s exited unexpectedly"), gpgv.c_str());
   ExitStatus = WEXITSTATUS(Status);

   if (Debug == true)
   {
      ioprintf(std::clog, "gpgv exited with status %i\n", ExitStatus);
      std::clog << "Summary:\n  Good: " << Debfetch::String::Join(Signers.Good, ", ")
		<< "\n  Valid: " << Debfetch::String::Join(Signers.Valid, ", ")
		<< "\n  Bad: " << Debfetch::String::Join(Signers.Bad, ", ")
		<< "\n  Worthless: " << Debfetch::String::Join(Signers.Worthless, ", ")
		<< "\n  SoonWorthless: " << Debfetch::String::Join(Signers.SoonWorthless, ", ")
		<< "\n  NoPubKey: " << Debfetch::String::Join(Signers.NoPubKey, ", ")
		<< "\n  Signed-By: " << Debfetch::String::Join(Signers.SignedBy, ", ")
		<< "\n  NODATA: " << (Signers.NoData ? "yes" : "no") << std::endl;
   }

   if (ExitStatus == EINTERNAL)
      return _error->Error(_("Could not execute '%s' to verify signature (is gnupg installed?)"), gpgv.c_str());
   return true;
#undef EINTERNAL
}
									/*}}}*/
// ImportKeyIntoKeyring - dearmor or copy a public key			/*{{{*/
bool ImportKeyIntoKeyring(std::string const &KeyFile, FileFd &Keyring)
{
   FileFd keyFd(KeyFile, FileFd::ReadOnly);
   if (keyFd.IsOpen() == false)
      return false;

   unsigned char c;
   if (keyFd.Read(&c, sizeof(c)) == false)
      return _error->Error(_("Key %s is neither an armored nor a binary OpenPGP key"), KeyFile.c_str());

   // Identify the leading byte of an OpenPGP public key packet
   // 0x98 -- old-format OpenPGP public key packet, up to 255 octets
   // 0x99 -- old-format OpenPGP public key packet, 256-65535 octets
   // 0xc6 -- new-format OpenPGP public key packet, any length
   if (c == 0x98 || c == 0x99 || c == 0xc6)
   {
      if (Keyring.Write(&c, sizeof(c)) == false || CopyFile(keyFd, Keyring) == false)
	 return _error->Error("Unable to copy key %s into keyring %s", KeyFile.c_str(), Keyring.Name().c_str());
      return true;
   }

   if (keyFd.Seek(0) == false)
      return false;
   std::string b64msg;
   int state = 0;
   for (std::string line; keyFd.ReadLine(line);)
   {
      line = Debfetch::String::Strip(line);
      if (state == 0 && Debfetch::String::Startswith(line, "-----BEGIN PGP PUBLIC KEY BLOCK-----"))
	 state = 1;
      else if (state == 1 && line.empty())
	 state = 2;
      else if (state == 2 && Debfetch::String::Startswith(line, "-----END"))
	 state = 3;
      else if (state == 2 && line.empty() == false && line[0] != '=')
	 b64msg += line;
   }
   if (state != 3)
      return _error->Error(_("Key %s is neither an armored nor a binary OpenPGP key"), KeyFile.c_str());

   std::string const decoded = Base64Decode(b64msg);
   if (decoded.empty())
      return _error->Error(_("Key %s is neither an armored nor a binary OpenPGP key"), KeyFile.c_str());
   return Keyring.Write(decoded.data(), decoded.size());
}
									/*}}}*/
// VerifyDetachedSignatureFile - only signature blocks allowed		/*{{{*/
bool VerifyDetachedSignatureFile(std::string const &FileGPG)
{
   FileFd detached;
   if (detached.Open(FileGPG, FileFd::ReadOnly) == false)
      return _error->Error("Detached signature file '%s' could not be opened", FileGPG.c_str());

   LineBuffer buf;
   bool open_signature = false;
   bool found_badcontent = false;
   size_t found_signatures = 0;
   while (buf.readFrom(detached, FileGPG, true))
   {
      if (open_signature)
      {
	 if (buf == "-----END PGP SIGNATURE-----")
	    open_signature = false;
	 else if (buf.starts_with("-"))
	    // Radix-64 has no dash, this smells like a header we do not know
	    return _error->Error("Detached signature file '%s' contains unexpected line starting with a dash", FileGPG.c_str());
      }
      else
      {
	 if (buf == "-----BEGIN PGP SIGNATURE-----")
	 {
	    open_signature = true;
	    ++found_signatures;
	    if (found_badcontent)
	       break;
	 }
	 else
	 {
	    found_badcontent = true;
	    if (found_signatures != 0)
	       break;
	 }
      }
   }
   if (detached.Failed())
      return false;
   if (found_signatures == 0)
   {
      if (found_badcontent && detached.Seek(0))
      {
	 unsigned char ptag = 0;
	 // rfc4880 §4.2: the first bit is always set, an old format tag has the second unset
	 if (detached.Read(&ptag, 1) && (ptag & 0x80) != 0 && (ptag & 0x40) == 0)
	    return _error->Error("Detached signature file '%s' is in unsupported binary format", FileGPG.c_str());
      }
      return _error->Error(_("Signed file isn't valid, got '%s' (does the network require authentication?)"), "NODATA");
   }
   else if (found_badcontent)
      return _error->Error("Detached signature file '%s' contains lines not belonging to a signature", FileGPG.c_str());
   if (open_signature)
      return _error->Error("Detached signature file '%s' contains unclosed signatures", FileGPG.c_str());
   return true;
}
									/*}}}*/
// SplitClearSignedFile - split message into data/signature		/*{{{*/
bool SplitClearSignedFile(std::string const &InFile, FileFd * const ContentFile,
      std::vector<std::string> * const ContentHeader, FileFd * const SignatureFile)
{
   FileFd in;
   if (in.Open(InFile, FileFd::ReadOnly) == false)
      return false;

   struct ScopedErrors
   {
      ScopedErrors() { _error->PushToStack(); }
      ~ScopedErrors() { _error->MergeWithStack(); }
   } scoped;
   LineBuffer buf;

   // start of the message
   if (buf.readFrom(in, InFile) == false)
      return false; // empty or read error
   if (buf != "-----BEGIN PGP SIGNED MESSAGE-----")
   {
      // an unsigned file is not worth an error, but a late signed block is
      while (buf.readFrom(in, InFile, true))
	 if (buf == "-----BEGIN PGP SIGNED MESSAGE-----")
	    return _error->Error("Clearsigned file '%s' does not start with a signed message block.", InFile.c_str());

      return false;
   }

   // save "Hash" Armor Headers
   while (true)
   {
      if (buf.readFrom(in, InFile) == false)
	 return false;
      if (buf.empty())
	 break; // empty line ends the Armor Headers
      if (buf.starts_with("-"))
	 return _error->Error("Clearsigned file '%s' contains unexpected line starting with a dash (%s)", InFile.c_str(), "armor");
      if (ContentHeader != nullptr && buf.starts_with("Hash: "))
	 ContentHeader->push_back(buf.view());
   }

   // the message itself
   bool first_line = true;
   while (true)
   {
      if (buf.readFrom(in, InFile) == false)
	 return false;

      if (buf.starts_with("-"))
      {
	 if (buf == "-----BEGIN PGP SIGNATURE-----")
	 {
	    if (buf.writeLineTo(SignatureFile) == false)
	       return false;
	    break;
	 }
	 else if (buf.starts_with("- "))
	 {
	    // dash-escaped line
	    if (buf.writeNewLineIf(ContentFile, not first_line) == false || buf.writeTo(ContentFile, 2) == false)
	       return false;
	 }
	 else
	    // a dash line that is not an escape could hide a header from us but not from gpgv
	    return _error->Error("Clearsigned file '%s' contains unexpected line starting with a dash (%s)", InFile.c_str(), "msg");
      }
      else if (buf.writeNewLineIf(ContentFile, not first_line) == false || buf.writeTo(ContentFile) == false)
	 return false;
      first_line = false;
   }

   // collect all signatures
   bool open_signature = true;
   while (true)
   {
      if (buf.readFrom(in, InFile, true) == false)
	 break;

      if (open_signature)
      {
	 if (buf == "-----END PGP SIGNATURE-----")
	    open_signature = false;
	 else if (buf.starts_with("-"))
	    return _error->Error("Clearsigned file '%s' contains unexpected line starting with a dash (%s)", InFile.c_str(), "sig");
      }
      else
      {
	 if (buf == "-----BEGIN PGP SIGNATURE-----")
	    open_signature = true;
	 else
	    return _error->Error("Clearsigned file '%s' contains unsigned lines.", InFile.c_str());
      }

      if (buf.writeLineTo(SignatureFile) == false)
	 return false;
   }
   if (open_signature)
      return _error->Error("Signature in file %s wasn't closed", InFile.c_str());

   // Catch-all for "unhandled" read/write errors
   if (_error->PendingError())
      return false;
   return true;
}
									/*}}}*/
bool OpenMaybeClearSignedFile(std::string const &ClearSignedFileName, FileFd &MessageFile) /*{{{*/
{
   if (GetTempFile("clearsigned.message", true, &MessageFile) == nullptr)
      return false;
   if (MessageFile.Failed())
      return _error->Error("Couldn't open temporary file to work with %s", ClearSignedFileName.c_str());

   _error->PushToStack();
   bool const splitDone = SplitClearSignedFile(ClearSignedFileName, &MessageFile, NULL, NULL);
   bool const errorDone = _error->PendingError();
   _error->MergeWithStack();
   if (splitDone == false)
   {
      MessageFile.Close();

      if (errorDone)
	 return false;

      // we deal with an unsigned file
      MessageFile.Open(ClearSignedFileName, FileFd::ReadOnly);
   }
   else // clear-signed
   {
      if (MessageFile.Seek(0) == false)
	 return _error->Errno("lseek", "Unable to seek back in message for file %s", ClearSignedFileName.c_str());
   }

   return MessageFile.Failed() == false;
}
									/*}}}*/
