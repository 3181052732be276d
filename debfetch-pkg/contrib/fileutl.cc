// -*- mode: cpp; mode: fold -*-
// Description								/*{{{*/
/* ######################################################################

   File Utilities

   FileFd reads and writes plain, gzip, bzip2 and xz files through a
   small backend class per format. Backends always work on their own
   duplicate of the descriptor, so closing a compressed stream never
   takes the FileFd descriptor with it and a backwards Seek can simply
   rewind the descriptor and start a new stream.

   ##################################################################### */
									/*}}}*/
// Include Files							/*{{{*/
#include <config.h>

#include <debfetch-pkg/configuration.h>
#include <debfetch-pkg/error.h>
#include <debfetch-pkg/fileutl.h>
#include <debfetch-pkg/macros.h>
#include <debfetch-pkg/strutl.h>

#include <algorithm>
#include <cstdarg>
#include <cstdint>
#include <cstdio>
#include <cstdlib>
#include <cstring>
#include <memory>
#include <set>
#include <string>
#include <vector>

#include <dirent.h>
#include <errno.h>
#include <fcntl.h>
#include <signal.h>
#include <sys/stat.h>
#include <sys/types.h>
#include <sys/wait.h>
#include <unistd.h>

#include <bzlib.h>
#include <lzma.h>
#include <zlib.h>

#include <debfetchi18n.h>
									/*}}}*/

using namespace std;

// CopyFile - Buffered copy of a file					/*{{{*/
// ---------------------------------------------------------------------
/* The caller is expected to set things so that failure causes erasure */
bool CopyFile(FileFd &From,FileFd &To)
{
   if (From.IsOpen() == false || To.IsOpen() == false ||
	 From.Failed() == true || To.Failed() == true)
      return false;

   std::unique_ptr<unsigned char[]> Buf(new unsigned char[DEBFETCH_BUFFER_SIZE]);
   unsigned long long ToRead = 0;
   do {
      if (From.Read(Buf.get(), DEBFETCH_BUFFER_SIZE, &ToRead) == false ||
	  To.Write(Buf.get(), ToRead) == false)
	 return false;
   } while (ToRead != 0);

   return true;
}
									/*}}}*/
bool RemoveFile(char const * const Function, std::string const &FileName)/*{{{*/
{
   if (FileName == "/dev/null")
      return true;
   errno = 0;
   if (unlink(FileName.c_str()) != 0)
   {
      if (errno == ENOENT)
	 return true;

      return _error->WarningE(Function,_("Problem unlinking the file %s"), FileName.c_str());
   }
   return true;
}
									/*}}}*/
// FileExists - Check if a file exists					/*{{{*/
// ---------------------------------------------------------------------
/* Beware: Directories are also files! */
bool FileExists(string File)
{
   struct stat Buf;
   if (stat(File.c_str(),&Buf) != 0)
      return false;
   return true;
}
									/*}}}*/
// RealFileExists - Check if a file exists and if it is really a file	/*{{{*/
bool RealFileExists(string File)
{
   struct stat Buf;
   if (stat(File.c_str(),&Buf) != 0)
      return false;
   return ((Buf.st_mode & S_IFREG) != 0);
}
									/*}}}*/
// DirectoryExists - Check if a directory exists and is really one	/*{{{*/
bool DirectoryExists(string const &Path)
{
   struct stat Buf;
   if (stat(Path.c_str(),&Buf) != 0)
      return false;
   return ((Buf.st_mode & S_IFDIR) != 0);
}
									/*}}}*/
// CreateDirectory - poor man's mkdir -p guarded by a parent directory	/*{{{*/
// ---------------------------------------------------------------------
/* Only the part of Path below Parent is created, so a typo in a
   configured directory can not create directories all over the place. */
bool CreateDirectory(string const &Parent, string const &Path)
{
   if (Parent.empty() == true || Path.empty() == true)
      return false;

   if (DirectoryExists(Path) == true)
      return true;

   if (DirectoryExists(Parent) == false)
      return false;

   // we are not going to create directories "into the blue"
   if (Path.compare(0, Parent.length(), Parent) != 0)
      return false;

   vector<string> const dirs = VectorizeString(Path.substr(Parent.size()), '/');
   string progress = Parent;
   for (auto const &d : dirs)
   {
      if (d.empty() == true)
	 continue;

      progress.append("/").append(d);
      if (DirectoryExists(progress) == true)
	 continue;

      if (mkdir(progress.c_str(), 0755) != 0)
	 return _error->Errno("mkdir", _("Unable to create directory %s"), progress.c_str());
   }
   return true;
}
									/*}}}*/
// GetListOfFilesInDir - returns a sorted vector of files in a dir	/*{{{*/
std::vector<string> GetListOfFilesInDir(string const &Dir, string const &Ext)
{
   std::vector<string> List;

   if (DirectoryExists(Dir) == false)
   {
      _error->Error(_("List of files can't be created as '%s' is not a directory"), Dir.c_str());
      return List;
   }

   bool const Debug = _config->FindB("Debug::GetListOfFilesInDir", false);
   DIR *D = opendir(Dir.c_str());
   if (D == nullptr)
   {
      _error->Errno("opendir",_("Unable to read %s"),Dir.c_str());
      return List;
   }

   for (struct dirent *Ent = readdir(D); Ent != nullptr; Ent = readdir(D))
   {
      if (Ent->d_name[0] == '.')
	 continue;

      string const File = flCombine(Dir, Ent->d_name);
      if (RealFileExists(File) == false)
	 continue;

      if (Ext.empty() == false && flExtension(Ent->d_name) != Ext)
      {
	 if (Debug == true)
	    std::clog << "Bad file: " << Ent->d_name << " → no extension" << std::endl;
	 continue;
      }

      if (Debug == true)
	 std::clog << "Accept file: " << Ent->d_name << " in " << Dir << std::endl;
      List.push_back(File);
   }
   closedir(D);

   std::sort(List.begin(), List.end());
   return List;
}
									/*}}}*/
// flNotDir - Strip the directory from the filename			/*{{{*/
string flNotDir(string File)
{
   string::size_type Res = File.rfind('/');
   if (Res == string::npos)
      return File;
   return File.substr(Res + 1);
}
									/*}}}*/
// flNotFile - Strip the file from the directory name			/*{{{*/
// ---------------------------------------------------------------------
/* Result ends in a / */
string flNotFile(string File)
{
   string::size_type Res = File.rfind('/');
   if (Res == string::npos)
      return "./";
   return File.substr(0, Res + 1);
}
									/*}}}*/
// flExtension - Return the extension for the file			/*{{{*/
string flExtension(string File)
{
   string::size_type Res = File.rfind('.');
   if (Res == string::npos)
      return File;
   return File.substr(Res + 1);
}
									/*}}}*/
// flCombine - Combine a file and a directory				/*{{{*/
// ---------------------------------------------------------------------
/* If the file is an absolute path then it is just returned, otherwise
   the directory is pre-pended to it. */
string flCombine(string Dir,string File)
{
   if (File.empty() == true)
      return string();

   if (File[0] == '/' || Dir.empty() == true)
      return File;
   if (File.length() >= 2 && File[0] == '.' && File[1] == '/')
      return File;
   if (Dir[Dir.length()-1] == '/')
      return Dir + File;
   return Dir + '/' + File;
}
									/*}}}*/
// flAbsPath - Return the absolute path of the filename			/*{{{*/
string flAbsPath(string File)
{
   char *p = realpath(File.c_str(), NULL);
   if (p == NULL)
   {
      _error->Errno("realpath", "flAbsPath on %s failed", File.c_str());
      return "";
   }
   std::string AbsPath(p);
   free(p);
   return AbsPath;
}
									/*}}}*/
// SetCloseExec - Set the close on exec flag				/*{{{*/
void SetCloseExec(int Fd,bool Close)
{
   if (fcntl(Fd,F_SETFD,(Close == false)?0:FD_CLOEXEC) != 0)
      _error->Errno("fcntl", "Could not set close on exec for descriptor %d", Fd);
}
									/*}}}*/
// ExecFork - Fork that sanitizes the context before execing		/*{{{*/
// ---------------------------------------------------------------------
/* The child gets default signal handlers and every descriptor except
   stdio and the ones in KeepFDs is marked close-on-exec. A failed fork
   returns -1 with an error on the stack. */
pid_t ExecFork()
{
   return ExecFork(std::set<int>());
}
pid_t ExecFork(std::set<int> KeepFDs)
{
   pid_t const Process = fork();
   if (Process < 0)
   {
      _error->Errno("fork", _("Failed to fork"));
      return Process;
   }

   if (Process == 0)
   {
      signal(SIGPIPE,SIG_DFL);
      signal(SIGQUIT,SIG_DFL);
      signal(SIGINT,SIG_DFL);
      signal(SIGWINCH,SIG_DFL);
      signal(SIGCONT,SIG_DFL);
      signal(SIGTSTP,SIG_DFL);

      DIR *dir = opendir("/proc/self/fd");
      if (dir != NULL)
      {
	 for (struct dirent *ent = readdir(dir); ent != nullptr; ent = readdir(dir))
	 {
	    int const fd = atoi(ent->d_name);
	    if (fd >= 3 && KeepFDs.find(fd) == KeepFDs.end())
	       fcntl(fd,F_SETFD,FD_CLOEXEC);
	 }
	 closedir(dir);
      }
      else
      {
	 long const ScOpenMax = sysconf(_SC_OPEN_MAX);
	 for (int K = 3; K < ScOpenMax; ++K)
	    if (KeepFDs.find(K) == KeepFDs.end())
	       fcntl(K,F_SETFD,FD_CLOEXEC);
      }
   }

   return Process;
}
									/*}}}*/
// ExecWait - Fancy waitpid						/*{{{*/
// ---------------------------------------------------------------------
/* Waits for the given sub process. If Reap is set then no errors are
   generated. Otherwise a failed subprocess will generate a proper descriptive
   message */
bool ExecWait(pid_t Pid,const char *Name,bool Reap)
{
   if (Pid <= 1)
      return true;

   int Status;
   while (waitpid(Pid,&Status,0) != Pid)
   {
      if (errno == EINTR)
	 continue;

      if (Reap == true)
	 return false;

      return _error->Error(_("Waited for %s but it wasn't there"),Name);
   }

   if (WIFEXITED(Status) != 0 && WEXITSTATUS(Status) == 0)
      return true;

   if (Reap == true)
      return false;
   if (WIFSIGNALED(Status) != 0)
   {
      if (WTERMSIG(Status) == SIGSEGV)
	 return _error->Error(_("Sub-process %s received a segmentation fault."),Name);
      return _error->Error(_("Sub-process %s received signal %u."),Name, WTERMSIG(Status));
   }
   if (WIFEXITED(Status) != 0)
      return _error->Error(_("Sub-process %s returned an error code (%u)"),Name,WEXITSTATUS(Status));

   return _error->Error(_("Sub-process %s exited unexpectedly"),Name);
}
									/*}}}*/
// StartsWithGPGClearTextSignature - Check if a file is clearsigned	/*{{{*/
bool StartsWithGPGClearTextSignature(string const &FileName)
{
   static char const SIGMSG[] = "-----BEGIN PGP SIGNED MESSAGE-----";
   FileFd Fd;
   if (Fd.Open(FileName, FileFd::ReadOnly) == false)
   {
      _error->Discard();
      return false;
   }
   std::string Line;
   if (Fd.ReadLine(Line) == false)
      return false;
   if (Line.empty() == false && Line.back() == '\r')
      Line.pop_back();
   return Line == SIGMSG;
}
									/*}}}*/

class DEBFETCH_HIDDEN FileFdPrivate {					/*{{{*/
protected:
   FileFd * const filefd;
   // readahead for ReadLine, served before the backend is asked again
   std::string pending;
   unsigned long long seekpos;
public:
   explicit FileFdPrivate(FileFd * const pfilefd) : filefd(pfilefd), seekpos(0) {}

   virtual bool InternalOpen(int const iFd, unsigned int const Mode) = 0;
   ssize_t InternalRead(void * const To, unsigned long long const Size)
   {
      if (pending.empty() == false)
      {
	 unsigned long long const n = std::min<unsigned long long>(Size, pending.size());
	 memcpy(To, pending.data(), n);
	 pending.erase(0, n);
	 return n;
      }
      ssize_t const Res = InternalUnbufferedRead(To, Size);
      if (Res > 0)
	 seekpos += Res;
      return Res;
   }
   virtual ssize_t InternalUnbufferedRead(void * const To, unsigned long long const Size) = 0;
   virtual bool InternalReadError() { return filefd->FileFdErrno("read",_("Read error")); }
   bool InternalReadLine(std::string &To)
   {
      To.clear();
      char chunk[4096];
      while (true)
      {
	 std::string::size_type const nl = pending.find('\n');
	 if (nl != std::string::npos)
	 {
	    To.append(pending, 0, nl);
	    pending.erase(0, nl + 1);
	    return true;
	 }
	 To.append(pending);
	 pending.clear();

	 unsigned long long actual = 0;
	 if (filefd->Read(chunk, sizeof(chunk), &actual) == false)
	    return false;
	 if (actual == 0)
	 {
	    if (To.empty() == true)
	       return false;
	    // the last line had no newline, report it but keep Eof() set
	    return true;
	 }
	 filefd->Flags &= ~FileFd::HitEof;
	 pending.assign(chunk, actual);
      }
   }
   virtual ssize_t InternalWrite(void const * const From, unsigned long long const Size) = 0;
   virtual bool InternalWriteError() { return filefd->FileFdErrno("write",_("Write error")); }
   virtual bool InternalSeek(unsigned long long const To)
   {
      unsigned long long const current = InternalTell();
      if (current == To)
	 return true;
      else if (current < To)
	 return filefd->Skip(To - current);

      // streams can only go forward, start over for the rest
      if ((filefd->openmode & FileFd::WriteOnly) == FileFd::WriteOnly)
	 return filefd->FileFdError("Reopen is only implemented for read-only files!");
      if (lseek(filefd->iFd, 0, SEEK_SET) != 0)
	 return filefd->FileFdErrno("lseek", "Unable to rewind %s", filefd->FileName.c_str());
      InternalClose(filefd->FileName);
      pending.clear();
      seekpos = 0;
      if (filefd->OpenInternDescriptor(filefd->openmode, filefd->compression) == false)
	 return filefd->FileFdError("Seek on file %s because it couldn't be reopened", filefd->FileName.c_str());
      if (To != 0)
	 return filefd->Skip(To);
      return true;
   }
   virtual bool InternalSkip(unsigned long long Over)
   {
      char ignore[1024];
      while (Over != 0)
      {
	 unsigned long long const toread = std::min<unsigned long long>(sizeof(ignore), Over);
	 if (filefd->Read(ignore, toread) == false)
	    return filefd->FileFdError("Unable to seek ahead %llu",Over);
	 Over -= toread;
      }
      return true;
   }
   virtual unsigned long long InternalTell()
   {
      return seekpos - pending.size();
   }
   virtual unsigned long long InternalSize()
   {
      unsigned long long const oldSeek = filefd->Tell();
      char ignore[4096];
      unsigned long long read = 0;
      do {
	 if (filefd->Read(ignore, sizeof(ignore), &read) == false)
	 {
	    filefd->Seek(oldSeek);
	    return 0;
	 }
      } while (read != 0);
      unsigned long long const size = filefd->Tell();
      filefd->Seek(oldSeek);
      return size;
   }
   virtual bool InternalClose(std::string const &FileName) = 0;

   virtual ~FileFdPrivate() {}
};
									/*}}}*/
class DEBFETCH_HIDDEN GzipFileFdPrivate: public FileFdPrivate {		/*{{{*/
   gzFile gz;
public:
   virtual bool InternalOpen(int const iFd, unsigned int const Mode) override
   {
      if ((Mode & FileFd::WriteOnly) == FileFd::WriteOnly)
	 gz = gzdopen(iFd, "w");
      else
	 gz = gzdopen(iFd, "r");
      filefd->Flags |= FileFd::Compressed;
      return gz != nullptr;
   }
   virtual ssize_t InternalUnbufferedRead(void * const To, unsigned long long const Size) override
   {
      return gzread(gz, To, Size);
   }
   virtual bool InternalReadError() override
   {
      int err;
      char const * const errmsg = gzerror(gz, &err);
      if (err != Z_ERRNO)
	 return filefd->FileFdError("gzread: %s (%d: %s)", _("Read error"), err, errmsg);
      return FileFdPrivate::InternalReadError();
   }
   virtual ssize_t InternalWrite(void const * const From, unsigned long long const Size) override
   {
      return gzwrite(gz, From, Size);
   }
   virtual bool InternalWriteError() override
   {
      int err;
      char const * const errmsg = gzerror(gz, &err);
      if (err != Z_ERRNO)
	 return filefd->FileFdError("gzwrite: %s (%d: %s)", _("Write error"), err, errmsg);
      return FileFdPrivate::InternalWriteError();
   }
   virtual bool InternalClose(std::string const &FileName) override
   {
      if (gz == nullptr)
	 return true;
      int const e = gzclose(gz);
      gz = nullptr;
      // closing an empty stream reports a buffer error, that is fine
      if (e != 0 && e != Z_BUF_ERROR)
	 return _error->Errno("close",_("Problem closing the gzip file %s"), FileName.c_str());
      return true;
   }

   explicit GzipFileFdPrivate(FileFd * const filefd) : FileFdPrivate(filefd), gz(nullptr) {}
   virtual ~GzipFileFdPrivate() { InternalClose(""); }
};
									/*}}}*/
class DEBFETCH_HIDDEN Bz2FileFdPrivate: public FileFdPrivate {		/*{{{*/
   BZFILE* bz2;
public:
   virtual bool InternalOpen(int const iFd, unsigned int const Mode) override
   {
      if ((Mode & FileFd::WriteOnly) == FileFd::WriteOnly)
	 bz2 = BZ2_bzdopen(iFd, "w");
      else
	 bz2 = BZ2_bzdopen(iFd, "r");
      filefd->Flags |= FileFd::Compressed;
      return bz2 != nullptr;
   }
   virtual ssize_t InternalUnbufferedRead(void * const To, unsigned long long const Size) override
   {
      return BZ2_bzread(bz2, To, Size);
   }
   virtual bool InternalReadError() override
   {
      int err;
      char const * const errmsg = BZ2_bzerror(bz2, &err);
      if (err != BZ_IO_ERROR)
	 return filefd->FileFdError("BZ2_bzread: %s %s (%d: %s)", filefd->FileName.c_str(), _("Read error"), err, errmsg);
      return FileFdPrivate::InternalReadError();
   }
   virtual ssize_t InternalWrite(void const * const From, unsigned long long const Size) override
   {
      return BZ2_bzwrite(bz2, const_cast<void *>(From), Size);
   }
   virtual bool InternalWriteError() override
   {
      int err;
      char const * const errmsg = BZ2_bzerror(bz2, &err);
      if (err != BZ_IO_ERROR)
	 return filefd->FileFdError("BZ2_bzwrite: %s %s (%d: %s)", filefd->FileName.c_str(), _("Write error"), err, errmsg);
      return FileFdPrivate::InternalWriteError();
   }
   virtual bool InternalClose(std::string const &) override
   {
      if (bz2 == nullptr)
	 return true;
      BZ2_bzclose(bz2);
      bz2 = nullptr;
      return true;
   }

   explicit Bz2FileFdPrivate(FileFd * const filefd) : FileFdPrivate(filefd), bz2(nullptr) {}
   virtual ~Bz2FileFdPrivate() { InternalClose(""); }
};
									/*}}}*/
class DEBFETCH_HIDDEN LzmaFileFdPrivate: public FileFdPrivate {		/*{{{*/
   int fd;
   bool compressing;
   bool eof;
   lzma_stream stream;
   lzma_ret err;
   uint8_t buffer[4096];

   bool WriteOut(size_t const n)
   {
      size_t done = 0;
      while (done < n)
      {
	 ssize_t const Res = write(fd, buffer + done, n - done);
	 if (Res < 0 && errno == EINTR)
	    continue;
	 if (Res <= 0)
	    return false;
	 done += Res;
      }
      return true;
   }
public:
   virtual bool InternalOpen(int const iFd, unsigned int const Mode) override
   {
      eof = false;
      lzma_stream tmp_stream = LZMA_STREAM_INIT;
      stream = tmp_stream;
      filefd->Flags |= FileFd::Compressed;

      if ((Mode & FileFd::WriteOnly) == FileFd::WriteOnly)
      {
	 compressing = true;
	 err = lzma_easy_encoder(&stream, 6, LZMA_CHECK_CRC64);
      }
      else
      {
	 compressing = false;
	 err = lzma_auto_decoder(&stream, UINT64_MAX, 0);
      }
      if (err != LZMA_OK)
	 return false;
      fd = iFd;
      return true;
   }
   virtual ssize_t InternalUnbufferedRead(void * const To, unsigned long long const Size) override
   {
      if (eof == true)
	 return 0;

      stream.next_out = static_cast<uint8_t *>(To);
      stream.avail_out = Size;
      while (stream.avail_out == Size)
      {
	 lzma_action action = LZMA_RUN;
	 if (stream.avail_in == 0)
	 {
	    ssize_t const Res = read(fd, buffer, sizeof(buffer));
	    if (Res < 0)
	       return -1;
	    stream.next_in = buffer;
	    stream.avail_in = Res;
	    if (Res == 0)
	       action = LZMA_FINISH;
	 }
	 err = lzma_code(&stream, action);
	 if (err == LZMA_STREAM_END)
	 {
	    eof = true;
	    break;
	 }
	 else if (err != LZMA_OK)
	 {
	    errno = 0;
	    return -1;
	 }
      }
      return Size - stream.avail_out;
   }
   virtual bool InternalReadError() override
   {
      return filefd->FileFdError("lzma_read: %s (%d)", _("Read error"), err);
   }
   virtual ssize_t InternalWrite(void const * const From, unsigned long long const Size) override
   {
      stream.next_in = static_cast<uint8_t const *>(From);
      stream.avail_in = Size;
      while (stream.avail_in != 0)
      {
	 stream.next_out = buffer;
	 stream.avail_out = sizeof(buffer);
	 err = lzma_code(&stream, LZMA_RUN);
	 if (err != LZMA_OK)
	    return -1;
	 if (WriteOut(sizeof(buffer) - stream.avail_out) == false)
	    return -1;
      }
      return Size;
   }
   virtual bool InternalWriteError() override
   {
      return filefd->FileFdError("lzma_write: %s (%d)", _("Write error"), err);
   }
   virtual bool InternalClose(std::string const &FileName) override
   {
      if (fd == -1)
	 return true;
      bool Res = true;
      if (compressing == true && filefd->Failed() == false)
      {
	 do {
	    stream.next_out = buffer;
	    stream.avail_out = sizeof(buffer);
	    err = lzma_code(&stream, LZMA_FINISH);
	    if (err != LZMA_OK && err != LZMA_STREAM_END)
	    {
	       Res = _error->Error("Compress finalisation of %s failed (%d)", FileName.c_str(), err);
	       break;
	    }
	    if (WriteOut(sizeof(buffer) - stream.avail_out) == false)
	    {
	       Res = _error->Errno("write", _("Write error"));
	       break;
	    }
	 } while (err != LZMA_STREAM_END);
      }
      lzma_end(&stream);
      close(fd);
      fd = -1;
      return Res;
   }

   explicit LzmaFileFdPrivate(FileFd * const filefd) : FileFdPrivate(filefd), fd(-1),
      compressing(false), eof(false), err(LZMA_OK) {}
   virtual ~LzmaFileFdPrivate() { InternalClose(""); }
};
									/*}}}*/
class DEBFETCH_HIDDEN DirectFileFdPrivate: public FileFdPrivate		/*{{{*/
{
public:
   virtual bool InternalOpen(int const, unsigned int const) override { return true; }
   virtual ssize_t InternalUnbufferedRead(void * const To, unsigned long long const Size) override
   {
      return read(filefd->iFd, To, Size);
   }
   virtual ssize_t InternalWrite(void const * const From, unsigned long long const Size) override
   {
      return write(filefd->iFd, From, Size);
   }
   virtual bool InternalSeek(unsigned long long const To) override
   {
      off_t const res = lseek(filefd->iFd, To, SEEK_SET);
      if (res != (off_t)To)
	 return filefd->FileFdError("Unable to seek to %llu", To);
      seekpos = To;
      pending.clear();
      return true;
   }
   virtual bool InternalSkip(unsigned long long Over) override
   {
      if (Over < pending.size())
      {
	 pending.erase(0, Over);
	 return true;
      }
      Over -= pending.size();
      pending.clear();
      if (Over == 0)
	 return true;
      off_t const res = lseek(filefd->iFd, Over, SEEK_CUR);
      if (res < 0)
	 return filefd->FileFdError("Unable to seek ahead %llu",Over);
      seekpos = res;
      return true;
   }
   virtual unsigned long long InternalTell() override
   {
      return lseek(filefd->iFd,0,SEEK_CUR) - pending.size();
   }
   virtual unsigned long long InternalSize() override
   {
      return filefd->FileSize();
   }
   virtual bool InternalClose(std::string const &) override { return true; }

   explicit DirectFileFdPrivate(FileFd * const filefd) : FileFdPrivate(filefd) {}
   virtual ~DirectFileFdPrivate() {}
};
									/*}}}*/
// FileFd Constructors							/*{{{*/
FileFd::FileFd(std::string FileName,unsigned int const Mode,unsigned long AccessMode) :
   iFd(-1), Flags(0), d(nullptr), openmode(0), compression(None)
{
   Open(FileName,Mode, None, AccessMode);
}
FileFd::FileFd(std::string FileName,unsigned int const Mode, CompressMode Compress, unsigned long AccessMode) :
   iFd(-1), Flags(0), d(nullptr), openmode(0), compression(None)
{
   Open(FileName,Mode, Compress, AccessMode);
}
FileFd::FileFd() : iFd(-1), Flags(AutoClose), d(nullptr), openmode(0), compression(None) {}
									/*}}}*/
// FileFd::Open - Open a file						/*{{{*/
// ---------------------------------------------------------------------
/* The most commonly used open mode combinations are given with Mode */
bool FileFd::Open(string FileName,unsigned int const Mode,CompressMode Compress, unsigned long const AccessMode)
{
   Close();
   Flags = AutoClose;

   if (Compress == Extension)
   {
      std::string const ext = flExtension(FileName);
      if (FileName.find('.') == std::string::npos)
	 Compress = None;
      else if (ext == "gz")
	 Compress = Gzip;
      else if (ext == "bz2")
	 Compress = Bzip2;
      else if (ext == "xz" || ext == "lzma")
	 Compress = Xz;
      // no matching extension - assume uncompressed
      else
	 Compress = None;
   }

   if ((Mode & WriteOnly) != WriteOnly && (Mode & (Create | Empty | Exclusive)) != 0)
      return FileFdError("ReadOnly mode for %s doesn't accept additional flags!", FileName.c_str());
   if ((Mode & ReadWrite) == 0)
      return FileFdError("No openmode provided in FileFd::Open for %s", FileName.c_str());
   if ((Mode & ReadWrite) == ReadWrite && Compress != None)
      return FileFdError("ReadWrite mode is not supported for compressed file %s", FileName.c_str());

   unsigned int OpenMode = Mode;
   if (FileName == "/dev/null")
      OpenMode = OpenMode & ~(Exclusive | Create | Empty);

   if ((OpenMode & (Exclusive | Create)) == (Exclusive | Create))
      RemoveFile("FileFd::Open", FileName);

   int fileflags = 0;
   if ((OpenMode & ReadWrite) == ReadWrite)
      fileflags |= O_RDWR;
   else if ((OpenMode & WriteOnly) == WriteOnly)
      fileflags |= O_WRONLY;
   else
      fileflags |= O_RDONLY;
   if ((OpenMode & Create) == Create)
      fileflags |= O_CREAT;
   if ((OpenMode & Empty) == Empty)
      fileflags |= O_TRUNC;
   if ((OpenMode & Exclusive) == Exclusive)
      fileflags |= O_EXCL;

   iFd = open(FileName.c_str(), fileflags, AccessMode);
   this->FileName = FileName;
   if (iFd == -1)
      return FileFdErrno("open",_("Could not open file %s"), FileName.c_str());
   SetCloseExec(iFd,true);

   if (OpenInternDescriptor(OpenMode, Compress) == false)
   {
      close(iFd);
      iFd = -1;
      return FileFdError(_("Could not open file %s"), FileName.c_str());
   }
   return true;
}
									/*}}}*/
// FileFd::OpenDescriptor - Open a filedescriptor			/*{{{*/
bool FileFd::OpenDescriptor(int Fd, unsigned int const Mode, CompressMode Compress, bool AutoClose)
{
   Close();
   Flags = (AutoClose) ? FileFd::AutoClose : 0;
   iFd = Fd;
   this->FileName = "";
   if (Compress == Extension)
   {
      if (AutoClose == true && Fd != -1)
	 close(Fd);
      iFd = -1;
      return FileFdError("Opening Fd %d in Extension compression mode is not supported", Fd);
   }
   if (OpenInternDescriptor(Mode, Compress) == false)
   {
      if (iFd != -1 && AutoClose == true)
	 close(iFd);
      iFd = -1;
      return FileFdError(_("Could not open file descriptor %d"), Fd);
   }
   return true;
}
									/*}}}*/
// FileFd::OpenInternDescriptor - Attach the backend for the format	/*{{{*/
bool FileFd::OpenInternDescriptor(unsigned int const Mode, CompressMode const Compress)
{
   if (iFd == -1)
      return false;

   if (d != nullptr)
      d->InternalClose(FileName);

   openmode = Mode;
   compression = Compress;
   if (d == nullptr)
   {
      switch (Compress)
      {
	 case Gzip: d = new GzipFileFdPrivate(this); break;
	 case Bzip2: d = new Bz2FileFdPrivate(this); break;
	 case Xz: d = new LzmaFileFdPrivate(this); break;
	 case None:
	 case Extension:
	    d = new DirectFileFdPrivate(this);
	    break;
      }
   }

   int backendFd = iFd;
   if (Compress != None && Compress != Extension)
   {
      // the libraries close what they are given
      backendFd = dup(iFd);
      if (backendFd == -1)
	 return FileFdErrno("OpenInternDescriptor", _("Could not open file descriptor %d"), iFd);
   }
   if (d->InternalOpen(backendFd, Mode) == false)
   {
      if (backendFd != iFd)
	 close(backendFd);
      return false;
   }
   return true;
}
									/*}}}*/
// FileFd::~File - Closes the file					/*{{{*/
// ---------------------------------------------------------------------
/* If the proper modes are selected then we close the Fd and possibly
   unlink the file on error. */
FileFd::~FileFd()
{
   Close();
   delete d;
   d = nullptr;
}
									/*}}}*/
// FileFd::Read - Read a bit of the file				/*{{{*/
// ---------------------------------------------------------------------
/* We are careful to handle interruption by a signal while reading
   gracefully. Without Actual a short read is an error. */
bool FileFd::Read(void *To,unsigned long long Size,unsigned long long *Actual)
{
   if (d == nullptr || Failed())
      return false;
   ssize_t Res = 1;
   errno = 0;
   if (Actual != 0)
      *Actual = 0;
   if (Size != 0)
      *((char *)To) = '\0';
   while (Res > 0 && Size > 0)
   {
      Res = d->InternalRead(To, Size);

      if (Res < 0)
      {
	 if (errno == EINTR)
	 {
	    Res = 1;
	    errno = 0;
	    continue;
	 }
	 return d->InternalReadError();
      }

      To = (char *)To + Res;
      Size -= Res;
      if (Actual != 0)
	 *Actual += Res;
   }

   if (Size == 0)
      return true;

   // Eof handling
   if (Actual != 0)
   {
      Flags |= HitEof;
      return true;
   }

   return FileFdError(_("read, still have %llu to read but none left"), Size);
}
bool FileFd::Read(int const Fd, void *To, unsigned long long Size, unsigned long long * const Actual)
{
   ssize_t Res = 1;
   errno = 0;
   if (Actual != nullptr)
      *Actual = 0;
   if (Size != 0)
      *static_cast<char *>(To) = '\0';
   while (Res > 0 && Size > 0)
   {
      Res = read(Fd, To, Size);
      if (Res < 0)
      {
	 if (errno == EINTR)
	 {
	    Res = 1;
	    errno = 0;
	    continue;
	 }
	 return _error->Errno("read", _("Read error"));
      }
      To = static_cast<char *>(To) + Res;
      Size -= Res;
      if (Actual != nullptr)
	 *Actual += Res;
   }
   if (Size == 0)
      return true;
   if (Actual != nullptr)
      return true;
   return _error->Error(_("read, still have %llu to read but none left"), Size);
}
									/*}}}*/
// FileFd::ReadLine - Read a complete line from the file		/*{{{*/
bool FileFd::ReadLine(std::string &To)
{
   To.clear();
   if (d == nullptr || Failed())
      return false;
   return d->InternalReadLine(To);
}
									/*}}}*/
// FileFd::Write - Write to the file					/*{{{*/
bool FileFd::Write(const void *From,unsigned long long Size)
{
   if (d == nullptr || Failed())
      return false;
   ssize_t Res = 1;
   errno = 0;
   while (Res > 0 && Size > 0)
   {
      Res = d->InternalWrite(From, Size);

      if (Res < 0)
      {
	 if (errno == EINTR)
	 {
	    Res = 1;
	    errno = 0;
	    continue;
	 }
	 return d->InternalWriteError();
      }

      From = (char const *)From + Res;
      Size -= Res;
   }

   if (Size == 0)
      return true;

   return FileFdError(_("write, still have %llu to write but couldn't"), Size);
}
bool FileFd::Write(int Fd, const void *From, unsigned long long Size)
{
   ssize_t Res = 1;
   errno = 0;
   while (Res > 0 && Size > 0)
   {
      Res = write(Fd,From,Size);
      if (Res < 0 && errno == EINTR)
      {
	 Res = 1;
	 errno = 0;
	 continue;
      }
      if (Res < 0)
	 return _error->Errno("write",_("Write error"));

      From = (char const *)From + Res;
      Size -= Res;
   }

   if (Size == 0)
      return true;

   return _error->Error(_("write, still have %llu to write but couldn't"), Size);
}
									/*}}}*/
// FileFd::Seek - Seek in the file					/*{{{*/
bool FileFd::Seek(unsigned long long To)
{
   if (d == nullptr || Failed())
      return false;
   Flags &= ~HitEof;
   return d->InternalSeek(To);
}
									/*}}}*/
// FileFd::Skip - Skip over data in the file				/*{{{*/
bool FileFd::Skip(unsigned long long Over)
{
   if (d == nullptr || Failed())
      return false;
   return d->InternalSkip(Over);
}
									/*}}}*/
// FileFd::Tell - Current seek position					/*{{{*/
unsigned long long FileFd::Tell()
{
   if (d == nullptr || Failed())
      return 0;
   return d->InternalTell();
}
									/*}}}*/
// FileFd::FileSize - Return the size of the file			/*{{{*/
unsigned long long FileFd::FileSize()
{
   struct stat Buf;
   if (fstat(iFd,&Buf) != 0)
   {
      FileFdErrno("fstat","Unable to determine the file size");
      return 0;
   }
   return Buf.st_size;
}
									/*}}}*/
// FileFd::Size - Return the size of the content in the file		/*{{{*/
unsigned long long FileFd::Size()
{
   if (d == nullptr)
      return 0;
   return d->InternalSize();
}
									/*}}}*/
// FileFd::Close - Close the file if the close flag is set		/*{{{*/
bool FileFd::Close()
{
   if (iFd == -1)
      return true;

   bool Res = true;
   if (d != nullptr)
   {
      Res &= d->InternalClose(FileName);
      delete d;
      d = nullptr;
   }

   if ((Flags & AutoClose) == AutoClose)
   {
      if (close(iFd) != 0 && errno != EINTR)
	 Res &= _error->Errno("close",_("Problem closing the file %s"), FileName.c_str());
   }
   iFd = -1;

   if ((Flags & Fail) == Fail && (Flags & DelOnFail) == DelOnFail &&
       FileName.empty() == false)
      Res &= RemoveFile("FileFd::Close", FileName);

   if (Res == false)
      Flags |= Fail;
   return Res;
}
									/*}}}*/
// FileFd::Sync - Sync the file						/*{{{*/
bool FileFd::Sync()
{
   if (fsync(iFd) != 0)
      return FileFdErrno("sync",_("Problem syncing the file"));
   return true;
}
									/*}}}*/
// FormatVA - render a printf style message into a string		/*{{{*/
static std::string FormatVA(const char *Description, va_list args)
{
   va_list copy;
   va_copy(copy, args);
   int const len = vsnprintf(nullptr, 0, Description, copy);
   va_end(copy);
   if (len <= 0)
      return Description;
   std::vector<char> buf(len + 1);
   vsnprintf(buf.data(), buf.size(), Description, args);
   return std::string(buf.data(), len);
}
									/*}}}*/
// FileFd::FileFdErrno - set Fail and call _error->Errno		/*{{{*/
bool FileFd::FileFdErrno(const char *Function, const char *Description,...)
{
   int const errsv = errno;
   Flags |= Fail;
   va_list args;
   va_start(args,Description);
   std::string const Msg = FormatVA(Description, args);
   va_end(args);
   errno = errsv;
   return _error->Errno(Function, "%s", Msg.c_str());
}
									/*}}}*/
// FileFd::FileFdError - set Fail and call _error->Error		/*{{{*/
bool FileFd::FileFdError(const char *Description,...) {
   Flags |= Fail;
   va_list args;
   va_start(args,Description);
   std::string const Msg = FormatVA(Description, args);
   va_end(args);
   return _error->Error("%s", Msg.c_str());
}
									/*}}}*/

static std::string DEBFETCH_NONNULL(1) GetTempDirEnv(char const * const env)	/*{{{*/
{
   const char *tmpdir = getenv(env);
   struct stat st;
   if (!tmpdir || strlen(tmpdir) == 0 || // tmpdir is set
	 stat(tmpdir, &st) != 0 || (st.st_mode & S_IFDIR) == 0) // exists and is directory
      tmpdir = "/tmp";
   else if (geteuid() != 0 && // root can do everything anyway
	 faccessat(AT_FDCWD, tmpdir, R_OK | W_OK | X_OK, AT_EACCESS) != 0) // current user has rwx access to directory
      tmpdir = "/tmp";

   return string(tmpdir);
}
									/*}}}*/
// GetTempDir - Dir::Temp overrides TMPDIR				/*{{{*/
std::string GetTempDir()
{
   std::string const Configured = _config->FindDir("Dir::Temp", "");
   if (Configured.empty() == false && DirectoryExists(Configured) == true)
   {
      std::string Dir = Configured;
      while (Dir.size() > 1 && Dir.back() == '/')
	 Dir.pop_back();
      return Dir;
   }
   return GetTempDirEnv("TMPDIR");
}
									/*}}}*/
FileFd* GetTempFile(std::string const &Prefix, bool ImmediateUnlink, FileFd * const TmpFd)	/*{{{*/
{
   std::string const tempdir = GetTempDir();
   std::string tmpl = tempdir + "/" + (Prefix.empty() ? std::string("debfetch") : Prefix) + ".XXXXXX";
   std::vector<char> name(tmpl.begin(), tmpl.end());
   name.push_back('\0');

   int const fd = mkstemp(name.data());
   if (fd < 0)
   {
      _error->Errno("GetTempFile", _("Unable to mkstemp %s"), name.data());
      return nullptr;
   }
   std::unique_ptr<FileFd> Owned;
   FileFd *Fd = TmpFd;
   if (Fd == nullptr)
   {
      Owned.reset(new FileFd());
      Fd = Owned.get();
   }
   if (ImmediateUnlink == true)
      unlink(name.data());
   if (Fd->OpenDescriptor(fd, FileFd::ReadWrite, FileFd::None, true) == false)
   {
      _error->Errno("GetTempFile", _("Unable to write to %s"), name.data());
      return nullptr;
   }
   if (ImmediateUnlink == false)
      Fd->Name() = name.data();
   Owned.release();
   return Fd;
}
									/*}}}*/
// CreateTemporaryDirectory - mkdtemp below the temp dir		/*{{{*/
std::string CreateTemporaryDirectory(std::string const &Prefix)
{
   std::string tmpl = GetTempDir() + "/" + Prefix + ".XXXXXX";
   std::vector<char> name(tmpl.begin(), tmpl.end());
   name.push_back('\0');
   if (mkdtemp(name.data()) == nullptr)
   {
      _error->Errno("mkdtemp", _("Unable to create a temporary directory from template %s"), tmpl.c_str());
      return "";
   }
   return name.data();
}
									/*}}}*/
// RemoveTemporaryDirectory - delete the files inside, then the dir	/*{{{*/
bool RemoveTemporaryDirectory(char const * const Function, std::string const &Dir)
{
   if (Dir.empty() == true || DirectoryExists(Dir) == false)
      return true;

   bool Res = true;
   DIR *D = opendir(Dir.c_str());
   if (D == nullptr)
      return _error->WarningE(Function, _("Unable to read %s"), Dir.c_str());
   for (struct dirent *Ent = readdir(D); Ent != nullptr; Ent = readdir(D))
   {
      if (strcmp(Ent->d_name, ".") == 0 || strcmp(Ent->d_name, "..") == 0)
	 continue;
      Res &= RemoveFile(Function, flCombine(Dir, Ent->d_name));
   }
   closedir(D);

   if (rmdir(Dir.c_str()) != 0)
      return _error->WarningE(Function, _("Unable to remove the directory %s"), Dir.c_str());
   return Res;
}
									/*}}}*/
bool Rename(std::string From, std::string To)				/*{{{*/
{
   if (rename(From.c_str(),To.c_str()) != 0)
   {
      _error->Error(_("rename failed, %s (%s -> %s)."),strerror(errno),
                    From.c_str(),To.c_str());
      return false;
   }
   return true;
}
									/*}}}*/
