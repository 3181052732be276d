// -*- mode: cpp; mode: fold -*-
// SPDX-License-Identifier: GPL-2.0+
// Description								/*{{{*/
/* ######################################################################

   Macros Header - Attribute, visibility and scope helpers shared by
   the library and the front end

   ##################################################################### */
									/*}}}*/
#ifndef DEBFETCH_MACROS_H
#define DEBFETCH_MACROS_H

#ifdef __GNUC__
#define DEBFETCH_GCC_VERSION (__GNUC__ << 8 | __GNUC_MINOR__)
#else
#define DEBFETCH_GCC_VERSION 0
#endif

#ifdef DEBFETCH_COMPILING_DEBFETCH
/* likely() and unlikely() mark boolean expressions as (not) likely true */
#if DEBFETCH_GCC_VERSION >= 0x0300
	#define likely(x)	__builtin_expect (!!(x), 1)
	#define unlikely(x)	__builtin_expect (!!(x), 0)
#else
	#define likely(x)	(x)
	#define unlikely(x)	(x)
#endif
#endif

#if DEBFETCH_GCC_VERSION >= 0x0300
	#define DEBFETCH_PURE	__attribute__((pure))
	#define DEBFETCH_PRINTF(n)	__attribute__((format(printf, n, n + 1)))
	#define DEBFETCH_NORETURN	__attribute__((noreturn))
	#define DEBFETCH_MUSTCHECK	__attribute__((warn_unused_result))
#else
	#define DEBFETCH_PURE
	#define DEBFETCH_PRINTF(n)
	#define DEBFETCH_NORETURN
	#define DEBFETCH_MUSTCHECK
#endif

#if DEBFETCH_GCC_VERSION > 0x0302
	#define DEBFETCH_NONNULL(...)	__attribute__((nonnull(__VA_ARGS__)))
#else
	#define DEBFETCH_NONNULL(...)
#endif

#if DEBFETCH_GCC_VERSION >= 0x0400
	#define DEBFETCH_PUBLIC __attribute__ ((visibility ("default")))
	#define DEBFETCH_HIDDEN __attribute__ ((visibility ("hidden")))
#else
	#define DEBFETCH_PUBLIC
	#define DEBFETCH_HIDDEN
#endif

// cold functions are unlikely() to be called
#if DEBFETCH_GCC_VERSION >= 0x0403
	#define DEBFETCH_COLD	__attribute__ ((__cold__))
#else
	#define DEBFETCH_COLD
#endif

#define DEBFETCH_PKG_MAJOR 1
#define DEBFETCH_PKG_MINOR 0
#define DEBFETCH_PKG_RELEASE 0

/* Should be a multiple of the common page size (4096) */
static constexpr unsigned long long DEBFETCH_BUFFER_SIZE = 64 * 1024;

template <class F>
struct DebfetchScopeWrapper {
   F func;
   ~DebfetchScopeWrapper() { func(); }
};
template <class F>
DebfetchScopeWrapper(F) -> DebfetchScopeWrapper<F>;
#define DEBFETCH_PASTE2(a, b) a##b
#define DEBFETCH_PASTE(a, b) DEBFETCH_PASTE2(a, b)
#define DEFER(lambda) DebfetchScopeWrapper DEBFETCH_PASTE(defer, __LINE__){lambda};

#endif
