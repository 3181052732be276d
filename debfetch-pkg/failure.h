// -*- mode: cpp; mode: fold -*-
// Description								/*{{{*/
/* ######################################################################

   Failure - Why a download was given up

   Every stage reports its failure as one of these kinds next to the
   human readable messages on the error stack.

   ##################################################################### */
									/*}}}*/
#ifndef DEBFETCH_FAILURE_H
#define DEBFETCH_FAILURE_H

namespace Debfetch {

enum class Failure
{
   None,
   InvalidRepositorySpec,
   RepositoryUnreachable,
   SignatureVerificationFailed,
   NoChecksumSection,
   ChecksumMismatch,
   PackageNotFound,
   InvalidDestination,
};

inline char const *FailureName(Failure const F)
{
   switch (F)
   {
      case Failure::None: return "None";
      case Failure::InvalidRepositorySpec: return "InvalidRepositorySpec";
      case Failure::RepositoryUnreachable: return "RepositoryUnreachable";
      case Failure::SignatureVerificationFailed: return "SignatureVerificationFailed";
      case Failure::NoChecksumSection: return "NoChecksumSection";
      case Failure::ChecksumMismatch: return "ChecksumMismatch";
      case Failure::PackageNotFound: return "PackageNotFound";
      case Failure::InvalidDestination: return "InvalidDestination";
   }
   return "Unknown";
}

}

#endif
