// -*- mode: cpp; mode: fold -*-
// Description								/*{{{*/
/* ######################################################################

   Command Line Class - Option parser feeding the configuration tree

   ##################################################################### */
									/*}}}*/
// Include files							/*{{{*/
#include <config.h>

#include <debfetch-pkg/cmndline.h>
#include <debfetch-pkg/configuration.h>
#include <debfetch-pkg/error.h>
#include <debfetch-pkg/strutl.h>

#include <cstdlib>
#include <cstring>
#include <string>

#include <debfetchi18n.h>
									/*}}}*/
using namespace std;

// CommandLine::CommandLine - Constructor				/*{{{*/
CommandLine::CommandLine(Args *AList,Configuration *Conf) : ArgList(AList),
                                 Conf(Conf), FileList(0)
{
}
									/*}}}*/
// CommandLine::~CommandLine - Destructor				/*{{{*/
CommandLine::~CommandLine()
{
   delete [] FileList;
}
									/*}}}*/
// FindLong - Look up a long option name up to OptEnd			/*{{{*/
static CommandLine::Args *FindLong(CommandLine::Args *List,const char *Opt,const char *OptEnd)
{
   for (; List->end() == false; ++List)
      if (List->LongOpt != 0 && stringcasecmp(Opt,OptEnd,List->LongOpt,List->LongOpt + strlen(List->LongOpt)) == 0)
	 break;
   return List;
}
static CommandLine::Args *FindShort(CommandLine::Args *List,char const Opt)
{
   for (; List->end() == false && List->ShortOpt != Opt; ++List);
   return List;
}
									/*}}}*/
// CommandLine::Parse - Main action member				/*{{{*/
// ---------------------------------------------------------------------
/* Options are removed from argv, everything else ends up in FileList.
   A lone -- stops the option processing. */
bool CommandLine::Parse(int argc,const char **argv)
{
   delete [] FileList;
   FileList = new const char *[argc + 1];
   const char **Files = FileList;
   *Files = 0;
   int I;
   for (I = 1; I < argc; I++)
   {
      const char *Opt = argv[I];

      // A lone dash is a word as well
      if (*Opt != '-' || Opt[1] == 0)
      {
	 *Files++ = Opt;
	 continue;
      }

      Opt++;

      if (*Opt == '-' && Opt[1] == 0)
      {
	 I++;
	 break;
      }

      // Short options can be clustered: -qq
      if (*Opt != '-')
      {
	 while (*Opt != 0)
	 {
	    Args *A = FindShort(ArgList,*Opt);
	    if (A->end() == true)
	       return _error->Error(_("Command line option '%c' [from %s] is not understood in combination with the other options."),*Opt,argv[I]);

	    if (HandleOpt(I,argc,argv,Opt,A) == false)
	       return false;
	    if (*Opt != 0)
	       Opt++;
	 }
	 continue;
      }

      Opt++;

      const char *OptEnd = strchrnul(Opt, '=');
      Args *A = FindLong(ArgList,Opt,OptEnd);

      // --no-foo and --yes-foo prefix a boolean with its sense
      bool PreceedMatch = false;
      if (A->end() == true)
      {
	 const char *Dash = static_cast<const char *>(memchr(Opt, '-', OptEnd - Opt));
	 if (Dash == NULL)
	    return _error->Error(_("Command line option %s is not understood in combination with the other options"),argv[I]);
	 Opt = Dash + 1;

	 A = FindLong(ArgList,Opt,OptEnd);
	 if (A->end() == true && OptEnd - Opt == 1)
	    A = FindShort(ArgList,*Opt);
	 if (A->end() == true)
	    return _error->Error(_("Command line option %s is not understood in combination with the other options"),argv[I]);

	 if (A->IsBoolean() == false)
	    return _error->Error(_("Command line option %s is not boolean"),argv[I]);
	 PreceedMatch = true;
      }

      // HandleOpt expects Opt on the last letter of the option name
      OptEnd--;
      if (HandleOpt(I,argc,argv,OptEnd,A,PreceedMatch) == false)
	 return false;
   }

   for (; I < argc; I++)
      *Files++ = argv[I];
   *Files = 0;

   return true;
}
									/*}}}*/
// CommandLine::HandleOpt - Handle a single option including all flags	/*{{{*/
// ---------------------------------------------------------------------
/* Opt points to the last character of the option name. The argument is
   either glued to it (-q5, --quiet=5) or the following word of argv. */
bool CommandLine::HandleOpt(int &I,int argc,const char *argv[],
			    const char *&Opt,Args *A,bool PreceedMatch)
{
   const char *Argument = 0;
   bool CertainArg = false;
   int IncI = 0;

   if (Opt[1] == 0)
   {
      if (I + 1 < argc && argv[I+1][0] != '-')
	 Argument = argv[I+1];
      IncI = 1;
   }
   else if (Opt[1] == '=')
   {
      CertainArg = true;
      Argument = Opt + 2;
   }
   else
      Argument = Opt + 1;

   if ((A->Flags & HasArg) == HasArg)
   {
      if (Argument == 0)
	 return _error->Error(_("Option %s requires an argument."),argv[I]);
      Opt += strlen(Opt);
      I += IncI;

      if ((A->Flags & ConfigFile) == ConfigFile)
	 return ReadConfigFile(*Conf,Argument);

      if ((A->Flags & ArbItem) == ArbItem)
      {
	 const char * const J = strchr(Argument, '=');
	 if (J == nullptr)
	    return _error->Error(_("Option %s: Configuration item specification must have an =<val>."),argv[I]);
	 Conf->Set(string(Argument,J-Argument), J+1);
	 return true;
      }

      Conf->Set(A->ConfName,Argument);
      return true;
   }

   if ((A->Flags & IntLevel) == IntLevel)
   {
      if (Argument != 0)
      {
	 char *EndPtr;
	 long const Value = strtol(Argument,&EndPtr,10);

	 if (EndPtr == Argument && CertainArg == true)
	    return _error->Error(_("Option %s requires an integer argument, not '%s'"),argv[I],Argument);

	 if (EndPtr != Argument && *EndPtr == 0)
	 {
	    Conf->Set(A->ConfName,static_cast<int>(Value));
	    Opt += strlen(Opt);
	    I += IncI;
	    return true;
	 }
      }

      Conf->Set(A->ConfName,Conf->FindI(A->ConfName)+1);
      return true;
   }

   // Boolean: -1 is unspecified, 0 is no, 1 is yes
   int Sense = -1;
   if (Argument != 0)
   {
      Sense = StringToBool(Argument);
      if (Sense >= 0)
      {
	 Opt += strlen(Opt);
	 I += IncI;
      }
      else if (CertainArg == true)
	 return _error->Error(_("Sense %s is not understood, try true or false."),Argument);
   }
   else if (PreceedMatch == true)
   {
      // the sense is the word between the dashes: --no-foo
      const char *J = argv[I];
      for (; *J == '-'; ++J);
      const char *JEnd = strchr(J, '-');
      if (JEnd != NULL)
      {
	 Sense = StringToBool(string(J, JEnd - J));
	 if (Sense < 0)
	    return _error->Error(_("Sense %s is not understood, try true or false."),string(J, JEnd - J).c_str());
      }
   }

   if (Sense == -1)
      Sense = ((A->Flags & InvBoolean) == InvBoolean) ? 0 : 1;

   Conf->Set(A->ConfName,Sense);
   return true;
}
									/*}}}*/
// CommandLine::FileSize - Count the number of filenames		/*{{{*/
unsigned int CommandLine::FileSize() const
{
   unsigned int Count = 0;
   for (const char **I = FileList; I != 0 && *I != 0; I++)
      Count++;
   return Count;
}
									/*}}}*/
// CommandLine::DispatchArg - Do something with the first arg		/*{{{*/
bool CommandLine::DispatchArg(Dispatch const * const Map,bool NoMatch)
{
   if (FileSize() == 0)
   {
      if (NoMatch == true)
	 _error->Error(_("No operation given"));
      return false;
   }

   for (int I = 0; Map[I].Match != 0; I++)
   {
      if (strcmp(FileList[0],Map[I].Match) != 0)
	 continue;

      bool const Res = Map[I].Handler(*this);
      if (Res == false && _error->PendingError() == false)
	 _error->Error("Handler silently failed");
      return Res;
   }

   if (NoMatch == true)
      _error->Error(_("Invalid operation %s"),FileList[0]);
   return false;
}
									/*}}}*/
