// -*- mode: cpp; mode: fold -*-
// Description								/*{{{*/
/* ######################################################################

   Global Error Class - Message stack shared by all pipeline stages

   Messages are formatted eagerly with vsnprintf into a std::string,
   the list keeps them in the order they were reported. A PendingFlag
   caches whether the current level contains an error.

   ##################################################################### */
									/*}}}*/
// Include Files							/*{{{*/
#include <config.h>

#include <debfetch-pkg/configuration.h>
#include <debfetch-pkg/error.h>

#include <algorithm>
#include <cerrno>
#include <cstdio>
#include <cstring>
#include <iostream>
#include <list>
#include <string>
#include <stdarg.h>
									/*}}}*/

// Global Error Object							/*{{{*/
GlobalError *_GetErrorObj()
{
   static thread_local GlobalError Obj;
   return &Obj;
}
									/*}}}*/
// GlobalError::GlobalError - Constructor				/*{{{*/
GlobalError::GlobalError() : PendingFlag(false) {}
									/*}}}*/
// GlobalError::FatalE, Errno, WarningE, NoticeE and DebugE - Add to the list/*{{{*/
#define GEMessage(NAME, TYPE) \
bool GlobalError::NAME (const char *Function, const char *Description,...) { \
	int const errsv = errno; \
	va_list args; \
	va_start(args, Description); \
	VInsertErrno(TYPE, Function, Description, args, errsv); \
	va_end(args); \
	return false; \
}
GEMessage(FatalE, FATAL)
GEMessage(Errno, ERROR)
GEMessage(WarningE, WARNING)
GEMessage(NoticeE, NOTICE)
GEMessage(DebugE, DEBUG)
#undef GEMessage
									/*}}}*/
// GlobalError::InsertErrno - Add a message of a given type with errno	/*{{{*/
bool GlobalError::InsertErrno(MsgType const &type, const char *Function,
				const char *Description,...)
{
   int const errsv = errno;
   va_list args;
   va_start(args, Description);
   VInsertErrno(type, Function, Description, args, errsv);
   va_end(args);
   return false;
}
									/*}}}*/
// GlobalError::VInsertErrno - decorate the format with the errno text	/*{{{*/
// ---------------------------------------------------------------------
/* The errno part is appended to the format string itself, so percent
   signs in the strerror text have to be escaped before formatting. */
bool GlobalError::VInsertErrno(MsgType type, const char *Function,
			       const char *Description, va_list args,
			       int const errsv)
{
   std::string Format(Description);
   Format.append(" - ").append(Function).append(" (");
   Format.append(std::to_string(errsv)).append(": ");
   for (char const *c = strerror(errsv); *c != '\0'; ++c)
   {
      if (*c == '%')
	 Format.push_back('%');
      Format.push_back(*c);
   }
   Format.append(")");
   return VInsert(type, Format, args);
}
									/*}}}*/
// GlobalError::Fatal, Error, Warning, Notice and Debug - Add to the list/*{{{*/
#define GEMessage(NAME, TYPE) \
bool GlobalError::NAME (const char *Description,...) { \
	va_list args; \
	va_start(args, Description); \
	VInsert(TYPE, Description, args); \
	va_end(args); \
	return false; \
}
GEMessage(Fatal, FATAL)
GEMessage(Error, ERROR)
GEMessage(Warning, WARNING)
GEMessage(Notice, NOTICE)
GEMessage(Debug, DEBUG)
#undef GEMessage
									/*}}}*/
// GlobalError::Insert - Add a message of a given type			/*{{{*/
bool GlobalError::Insert(MsgType const &type, const char *Description,...)
{
   va_list args;
   va_start(args, Description);
   VInsert(type, Description, args);
   va_end(args);
   return false;
}
									/*}}}*/
// GlobalError::VInsert - Format and append a new item			/*{{{*/
bool GlobalError::VInsert(MsgType type, std::string const &Description, va_list args)
{
   va_list measure;
   va_copy(measure, args);
   int const n = vsnprintf(nullptr, 0, Description.c_str(), measure);
   va_end(measure);

   std::string Text;
   if (n > 0)
   {
      Text.resize(n + 1);
      vsnprintf(&Text[0], Text.size(), Description.c_str(), args);
      Text.resize(n);
   }
   else if (n < 0)
      Text = Description;

   Messages.emplace_back(std::move(Text), type);
   if (type == ERROR || type == FATAL)
      PendingFlag = true;
   if (type == FATAL || type == DEBUG)
      std::clog << Messages.back() << std::endl;
   return false;
}
									/*}}}*/
// GlobalError::PopMessage - Pulls a single message out			/*{{{*/
bool GlobalError::PopMessage(std::string &Text)
{
   if (Messages.empty() == true)
      return false;

   Item const msg = Messages.front();
   Messages.pop_front();

   bool const Ret = (msg.Type == ERROR || msg.Type == FATAL);
   Text = msg.Text;
   if (PendingFlag == false || Ret == false)
      return Ret;

   PendingFlag = std::any_of(Messages.begin(), Messages.end(), [](Item const &m) {
      return m.Type == ERROR || m.Type == FATAL;
   });
   return Ret;
}
									/*}}}*/
// GlobalError::DumpErrors - Dump all of the errors/warns to out	/*{{{*/
void GlobalError::DumpErrors(std::ostream &out, MsgType const &threshold,
			     bool const &mergeStack)
{
   if (mergeStack == true)
      for (auto s = Stacks.rbegin(); s != Stacks.rend(); ++s)
	 Messages.insert(Messages.begin(), s->Messages.begin(), s->Messages.end());

   for (auto const &m : Messages)
      if (m.Type >= threshold)
	 out << m << std::endl;

   Discard();
}
									/*}}}*/
// GlobalError::Discard - Discard					/*{{{*/
void GlobalError::Discard()
{
   Messages.clear();
   PendingFlag = false;
}
									/*}}}*/
// GlobalError::empty - does our error list include anything?		/*{{{*/
bool GlobalError::empty(MsgType const &threshold) const
{
   if (PendingFlag == true)
      return false;
   return std::none_of(Messages.begin(), Messages.end(), [&threshold](Item const &m) {
      return m.Type >= threshold;
   });
}
									/*}}}*/
// GlobalError::PushToStack						/*{{{*/
void GlobalError::PushToStack()
{
   Stacks.emplace_back(Messages, PendingFlag);
   Discard();
}
									/*}}}*/
// GlobalError::RevertToStack						/*{{{*/
void GlobalError::RevertToStack()
{
   Discard();
   if (Stacks.empty() == true)
      return;
   MsgStack pack = Stacks.back();
   Messages = pack.Messages;
   PendingFlag = pack.PendingFlag;
   Stacks.pop_back();
}
									/*}}}*/
// GlobalError::MergeWithStack						/*{{{*/
void GlobalError::MergeWithStack()
{
   if (Stacks.empty() == true)
      return;
   MsgStack pack = Stacks.back();
   Messages.splice(Messages.begin(), pack.Messages);
   PendingFlag = PendingFlag || pack.PendingFlag;
   Stacks.pop_back();
}
									/*}}}*/
// GlobalError::Item::operator<<					/*{{{*/
// ---------------------------------------------------------------------
/* Multi line messages are indented so that gpgv output quoted into an
   error stays readable below its E: prefix. */
DEBFETCH_HIDDEN std::ostream &operator<<(std::ostream &out, GlobalError::Item const &i)
{
   static constexpr auto COLOR_RESET = "\033[0m";
   static constexpr auto COLOR_NOTICE = "\033[33m";
   static constexpr auto COLOR_WARN = "\033[1;33m";
   static constexpr auto COLOR_ERROR = "\033[1;31m";

   bool const use_color = _config->FindB("Debfetch::Color", false);
   char const *color = nullptr;
   char prefix = 'D';
   switch (i.Type)
   {
   case GlobalError::FATAL:
   case GlobalError::ERROR:
      prefix = 'E';
      color = COLOR_ERROR;
      break;
   case GlobalError::WARNING:
      prefix = 'W';
      color = COLOR_WARN;
      break;
   case GlobalError::NOTICE:
      prefix = 'N';
      color = COLOR_NOTICE;
      break;
   case GlobalError::DEBUG:
      break;
   }

   if (use_color && color != nullptr)
      out << color << prefix << ": " << COLOR_RESET;
   else
      out << prefix << ": ";

   bool first = true;
   std::string::size_type start = 0;
   while (start != std::string::npos && start < i.Text.size())
   {
      auto const end = i.Text.find_first_of("\n\r", start);
      if (first == false)
	 out << std::endl << "   ";
      out << i.Text.substr(start, end == std::string::npos ? std::string::npos : end - start);
      first = false;
      if (end == std::string::npos)
	 break;
      start = i.Text.find_first_not_of("\n\r", end);
   }
   return out;
}
									/*}}}*/
