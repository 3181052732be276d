// -*- mode: cpp; mode: fold -*-
// SPDX-License-Identifier: GPL-2.0+
// Description								/*{{{*/
/* ######################################################################

   File Utilities

   FileFd - RAII file descriptor with transparent (de)compression
   CopyFile - Buffered copy of a single file
   FileExists - Returns true if the file exists
   ExecFork/ExecWait - Run a helper like gpgv and collect its status

   Everything downloaded ends up in a scratch directory first, so this
   file also carries the helpers to create and dispose of temporary
   files and directories.

   ##################################################################### */
									/*}}}*/
#ifndef DEBFETCH_FILEUTL_H
#define DEBFETCH_FILEUTL_H

#include <debfetch-pkg/macros.h>

#include <set>
#include <string>
#include <vector>
#include <sys/types.h>

class FileFdPrivate;
class DEBFETCH_PUBLIC FileFd
{
   friend class FileFdPrivate;
   friend class GzipFileFdPrivate;
   friend class Bz2FileFdPrivate;
   friend class LzmaFileFdPrivate;
   friend class DirectFileFdPrivate;
   protected:
   int iFd;

   enum LocalFlags {AutoClose = (1<<0),Fail = (1<<1),DelOnFail = (1<<2),
                    HitEof = (1<<3), Compressed = (1<<4) };
   unsigned long Flags;
   std::string FileName;

   public:
   enum OpenMode {
	ReadOnly = (1 << 0),
	WriteOnly = (1 << 1),
	ReadWrite = ReadOnly | WriteOnly,

	Create = (1 << 2),
	Exclusive = (1 << 3),
	Empty = (1 << 4),

	WriteEmpty = WriteOnly | Create | Empty,
	WriteAny = WriteOnly | Create,
	WriteTemp = WriteOnly | Create | Exclusive
   };
   enum CompressMode
   {
      None = 'N',
      Extension = 'E',
      Gzip = 'G',
      Bzip2 = 'B',
      Xz = 'X'
   };

   inline bool Read(void *To,unsigned long long Size,bool AllowEof)
   {
      unsigned long long Jnk;
      if (AllowEof)
	 return Read(To,Size,&Jnk);
      return Read(To,Size);
   }
   bool Read(void *To,unsigned long long Size,unsigned long long *Actual = 0);
   bool static Read(int const Fd, void *To, unsigned long long Size, unsigned long long * const Actual = 0);
   /** read a complete line from the file
    *
    *  The string does \b not include the newline. A final line without
    *  newline is returned as well.
    *
    *  @param To string which will hold the line
    *  @return \b false at the end of the file or on error, check
    *  Failed() to tell them apart
    */
   bool ReadLine(std::string &To);
   bool Write(const void *From,unsigned long long Size);
   bool static Write(int Fd, const void *From, unsigned long long Size);
   bool Seek(unsigned long long To);
   bool Skip(unsigned long long Over);
   unsigned long long Tell();
   // the size of the file content (compressed files will be uncompressed first)
   unsigned long long Size();
   // the size of the file itself
   unsigned long long FileSize();

   bool Open(std::string FileName,unsigned int const Mode,CompressMode Compress,unsigned long const AccessMode = 0666);
   inline bool Open(std::string const &FileName,unsigned int const Mode, unsigned long const AccessMode = 0666) {
      return Open(FileName, Mode, None, AccessMode);
   };
   bool OpenDescriptor(int Fd, unsigned int const Mode, CompressMode Compress, bool AutoClose=false);
   inline bool OpenDescriptor(int Fd, unsigned int const Mode, bool AutoClose=false) {
      return OpenDescriptor(Fd, Mode, None, AutoClose);
   };
   bool Close();
   bool Sync();

   // Simple manipulators
   inline int Fd() {return iFd;};
   inline bool IsOpen() {return iFd >= 0;};
   inline bool Failed() {return (Flags & Fail) == Fail;};
   inline void EraseOnFailure() {Flags |= DelOnFail;};
   inline void OpFail() {Flags |= Fail;};
   inline bool Eof() {return (Flags & HitEof) == HitEof;};
   inline bool IsCompressed() {return (Flags & Compressed) == Compressed;};
   inline std::string &Name() {return FileName;};

   FileFd(std::string FileName,unsigned int const Mode,unsigned long AccessMode = 0666);
   FileFd(std::string FileName,unsigned int const Mode, CompressMode Compress, unsigned long AccessMode = 0666);
   FileFd();
   virtual ~FileFd();

   private:
   FileFdPrivate * d;
   unsigned int openmode;
   CompressMode compression;
   FileFd(const FileFd &) = delete;
   FileFd & operator=(const FileFd &) = delete;
   DEBFETCH_HIDDEN bool OpenInternDescriptor(unsigned int const Mode, CompressMode const Compress);

   // private helpers to set Fail flag and call _error->Error
   DEBFETCH_HIDDEN bool FileFdErrno(const char* Function, const char* Description,...) DEBFETCH_PRINTF(3) DEBFETCH_COLD;
   DEBFETCH_HIDDEN bool FileFdError(const char* Description,...) DEBFETCH_PRINTF(2) DEBFETCH_COLD;
};

DEBFETCH_PUBLIC bool CopyFile(FileFd &From,FileFd &To);
DEBFETCH_PUBLIC bool RemoveFile(char const * const Function, std::string const &FileName);
DEBFETCH_PUBLIC bool FileExists(std::string File);
DEBFETCH_PUBLIC bool RealFileExists(std::string File);
DEBFETCH_PUBLIC bool DirectoryExists(std::string const &Path);
DEBFETCH_PUBLIC bool CreateDirectory(std::string const &Parent, std::string const &Path);
DEBFETCH_PUBLIC bool Rename(std::string From, std::string To);

DEBFETCH_PUBLIC std::string GetTempDir();
DEBFETCH_PUBLIC FileFd* GetTempFile(std::string const &Prefix = "",
                    bool ImmediateUnlink = true,
		    FileFd * const TmpFd = NULL);

/** \brief create a fresh private directory below GetTempDir()
 *
 *  \return the path of the new directory or an empty string
 *  in which case an error is on the stack.
 */
DEBFETCH_PUBLIC std::string CreateTemporaryDirectory(std::string const &Prefix);
/** \brief remove a directory created by CreateTemporaryDirectory
 *
 *  Only the plain files directly inside it are expected; they are
 *  removed before the directory itself.
 */
DEBFETCH_PUBLIC bool RemoveTemporaryDirectory(char const * const Function, std::string const &Dir);

/** \brief list the files in a directory with the given extension
 *
 *  Entries starting with a dot are ignored. The list is sorted and
 *  contains full paths.
 */
DEBFETCH_PUBLIC std::vector<std::string> GetListOfFilesInDir(std::string const &Dir, std::string const &Ext);

// Process control
DEBFETCH_PUBLIC pid_t ExecFork();
DEBFETCH_PUBLIC pid_t ExecFork(std::set<int> keep_fds);
DEBFETCH_PUBLIC bool ExecWait(pid_t Pid,const char *Name,bool Reap = false);
DEBFETCH_PUBLIC void SetCloseExec(int Fd,bool Close);

// check if the given file starts with a PGP cleartext signature
DEBFETCH_PUBLIC bool StartsWithGPGClearTextSignature(std::string const &FileName);

// File string manipulators
DEBFETCH_PUBLIC std::string flNotDir(std::string File);
DEBFETCH_PUBLIC std::string flNotFile(std::string File);
DEBFETCH_PUBLIC std::string flExtension(std::string File);
DEBFETCH_PUBLIC std::string flCombine(std::string Dir,std::string File);
/** \brief Takes a file path and returns the absolute path
 */
DEBFETCH_PUBLIC std::string flAbsPath(std::string File);

#endif
