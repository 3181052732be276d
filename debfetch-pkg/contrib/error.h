// -*- mode: cpp; mode: fold -*-
// SPDX-License-Identifier: GPL-2.0+
// Description								/*{{{*/
/* ######################################################################

   Global Error Class - Message stack shared by all pipeline stages

   A function that fails pushes a message onto the stack and returns
   false, so the usual pattern is

     if (open(..) == -1)
        return _error->Errno("open", "Unable to open %s", File.c_str());

   Nothing in the library prints or exits on its own. The caller (the
   command line front end or a test) decides whether the collected
   messages are dumped and whether that ends the program. Warnings do
   not force a false return; the unauthenticated download notice is
   reported that way.

   Messages are stored in FIFO order. PushToStack/RevertToStack allow
   a caller to run a sub operation whose failures it wants to inspect
   or drop without disturbing what was collected before.

   ##################################################################### */
									/*}}}*/
#ifndef DEBFETCH_ERROR_H
#define DEBFETCH_ERROR_H

#include <debfetch-pkg/macros.h>

#include <cstdarg>
#include <cstddef>
#include <iostream>
#include <list>
#include <string>
#include <utility>

class DEBFETCH_PUBLIC GlobalError						/*{{{*/
{
public:									/*{{{*/
	/** \brief a message can have one of following severity */
	enum MsgType {
		/** \brief printed instantly in addition to being queued */
		FATAL = 40,
		/** \brief the requested operation can not succeed */
		ERROR = 30,
		/** \brief the operation succeeded but something is off */
		WARNING = 20,
		/** \brief informational, e.g. a suite name mismatch */
		NOTICE = 10,
		/** \brief enabled with the Debug:: switches, printed instantly */
		DEBUG = 0
	};

	/** \brief add a message with strerror(errno) appended
	 *
	 *  \param Function name of the failing system call or function
	 *  \param Description format string for the message
	 *
	 *  \return \b false
	 */
	bool Errno(const char *Function,const char *Description,...) DEBFETCH_PRINTF(3) DEBFETCH_COLD;
	bool FatalE(const char *Function,const char *Description,...) DEBFETCH_PRINTF(3) DEBFETCH_COLD;
	bool WarningE(const char *Function,const char *Description,...) DEBFETCH_PRINTF(3) DEBFETCH_COLD;
	bool NoticeE(const char *Function,const char *Description,...) DEBFETCH_PRINTF(3) DEBFETCH_COLD;
	bool DebugE(const char *Function,const char *Description,...) DEBFETCH_PRINTF(3) DEBFETCH_COLD;

	/** \brief add a message of the given severity with errno appended */
	bool InsertErrno(MsgType const &type, const char* Function,
			 const char* Description,...) DEBFETCH_PRINTF(4) DEBFETCH_COLD;

	bool Fatal(const char *Description,...) DEBFETCH_PRINTF(2) DEBFETCH_COLD;
	bool Error(const char *Description,...) DEBFETCH_PRINTF(2) DEBFETCH_COLD;
	bool Warning(const char *Description,...) DEBFETCH_PRINTF(2) DEBFETCH_COLD;
	bool Notice(const char *Description,...) DEBFETCH_PRINTF(2) DEBFETCH_COLD;
	bool Debug(const char *Description,...) DEBFETCH_PRINTF(2) DEBFETCH_COLD;

	/** \brief add a message of the given severity
	 *
	 *  \return \b false, so it can be used in return statements
	 */
	bool Insert(MsgType const &type, const char* Description,...) DEBFETCH_PRINTF(3) DEBFETCH_COLD;

	/** \brief is an error or fatal message in the current level? */
	inline bool PendingError() const DEBFETCH_PURE {return PendingFlag;};

	/** \brief does the current level lack messages at or above threshold?
	 *
	 *  \param threshold minimum level considered
	 */
	bool empty(MsgType const &threshold = WARNING) const DEBFETCH_PURE;

	/** \brief returns and removes the oldest message
	 *
	 *  \param[out] Text message of the removed item
	 *
	 *  \return \b true if the message was an error, \b false otherwise
	 */
	bool PopMessage(std::string &Text);

	/** \brief clears the current level */
	void Discard();

	/** \brief writes messages at or above threshold to out and discards all
	 *
	 *  \param mergeStack if true the pushed levels are dumped first
	 */
	void DumpErrors(std::ostream &out, MsgType const &threshold = WARNING,
			bool const &mergeStack = true);
	void inline DumpErrors(MsgType const &threshold) {
		DumpErrors(std::cerr, threshold);
	}
	void inline DumpErrors() {
		DumpErrors(WARNING);
	}

	/** \brief move the current messages into a new stack level
	 *
	 *  Afterwards the query functions behave as if nothing was
	 *  reported so far. Only the newest level is ever operated on.
	 */
	void PushToStack();
	/** \brief drop the current messages and restore the pushed level */
	void RevertToStack();
	/** \brief prepend the pushed level to the current messages */
	void MergeWithStack();
	size_t StackCount() const DEBFETCH_PURE {
		return Stacks.size();
	}

	GlobalError();
									/*}}}*/
private:								/*{{{*/
	struct Item {
		std::string Text;
		MsgType Type;
		Item(std::string Text, MsgType const &Type) :
			Text(std::move(Text)), Type(Type) {};
		DEBFETCH_HIDDEN friend std::ostream &operator<<(std::ostream &out, Item const &i);
	};
	DEBFETCH_HIDDEN friend std::ostream &operator<<(std::ostream &out, Item const &i);

	bool VInsert(MsgType type, std::string const &Description, va_list args) DEBFETCH_COLD;
	bool VInsertErrno(MsgType type, const char *Function, const char *Description,
			  va_list args, int const errsv) DEBFETCH_COLD;

	std::list<Item> Messages;
	bool PendingFlag;

	struct MsgStack {
		std::list<Item> Messages;
		bool const PendingFlag;
		MsgStack(std::list<Item> const &Messages, bool const &Pending) :
			 Messages(Messages), PendingFlag(Pending) {};
	};
	std::list<MsgStack> Stacks;
									/*}}}*/
};
									/*}}}*/
// one stack per thread, so parallel downloads keep their messages apart
DEBFETCH_PUBLIC GlobalError *_GetErrorObj();
static struct {
	inline GlobalError* operator ->() { return _GetErrorObj(); }
} _error __attribute__((unused));

#endif
