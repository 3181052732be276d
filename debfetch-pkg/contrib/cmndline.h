// -*- mode: cpp; mode: fold -*-
// Description								/*{{{*/
/* ######################################################################

   Command Line Class - Option parser feeding the configuration tree

   Every option is described by an Args entry which names the
   configuration item it sets. Words which are not options are kept in
   FileList, the first of them selects the sub command via DispatchArg.

 CommandLine::Args Args[] =
 {{'q',"quiet","quiet",CommandLine::IntLevel},
  {'a',"architecture","Debfetch::Architectures::",CommandLine::HasArg},
  {0,0,0,0}};

   The flags mean,
     HasArg - the option takes a value. A ConfName ending in :: appends
              the value as a new list element, so the option can be
              given more than once.
     IntLevel - -qq (+2), -q5 (=5) and -q=5 (=5) are all accepted
     Boolean  - -d (true), --no-d (false), -d=yes (true), -d=off (false)
     InvBoolean - like Boolean, but a bare -d sets false
     ConfigFile - the value is a configuration file read right away
     ArbItem - the value is name=value set directly in the configuration

   ##################################################################### */
									/*}}}*/
#ifndef DEBFETCH_CMNDLINE_H
#define DEBFETCH_CMNDLINE_H

#include <debfetch-pkg/macros.h>

class Configuration;

class DEBFETCH_PUBLIC CommandLine
{
   public:
   struct Args;
   struct Dispatch;

   protected:

   Args *ArgList;
   Configuration *Conf;
   bool HandleOpt(int &I,int argc,const char *argv[],
		  const char *&Opt,Args *A,bool PreceedeMatch = false);

   public:

   enum AFlags
   {
      HasArg = (1 << 0),
      IntLevel = (1 << 1),
      Boolean = (1 << 2),
      InvBoolean = (1 << 3),
      ConfigFile = (1 << 4) | HasArg,
      ArbItem = (1 << 5) | HasArg
   };

   const char **FileList;

   bool Parse(int argc,const char **argv);
   unsigned int FileSize() const DEBFETCH_PURE;
   bool DispatchArg(Dispatch const * const List,bool NoMatch = true);

   CommandLine(Args *AList,Configuration *Conf);
   CommandLine(CommandLine const &) = delete;
   CommandLine &operator=(CommandLine const &) = delete;
   ~CommandLine();
};

struct CommandLine::Args
{
   char ShortOpt;
   const char *LongOpt;
   const char *ConfName;
   unsigned long Flags;

   inline bool end() {return ShortOpt == 0 && LongOpt == 0;};
   inline bool IsBoolean() {return Flags == 0 || (Flags & (Boolean|InvBoolean)) != 0;};
};

struct CommandLine::Dispatch
{
   const char *Match;
   bool (*Handler)(CommandLine &);
};

#endif
