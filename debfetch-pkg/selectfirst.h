// -*- mode: cpp; mode: fold -*-
// Description								/*{{{*/
/* ######################################################################

   Ordered candidate selection

   The checksum section of a Release file, the checksum field of a
   package and the compressed variant of an index are all picked the
   same way: walk a preference ordered list and take the first entry
   the probe accepts.

   ##################################################################### */
									/*}}}*/
#ifndef DEBFETCH_SELECTFIRST_H
#define DEBFETCH_SELECTFIRST_H

#include <iterator>
#include <optional>
#include <utility>

namespace Debfetch {

/** \brief first candidate for which the probe yields a value
 *
 *  The probe is called with each candidate in order and returns a
 *  std::optional. The first engaged result is returned, the remaining
 *  candidates are not probed.
 */
template <typename Container, typename Probe>
auto select_first_available(Container const &Candidates, Probe &&probe)
   -> decltype(probe(*std::begin(Candidates)))
{
   for (auto const &C : Candidates)
   {
      auto Res = probe(C);
      if (Res.has_value())
	 return Res;
   }
   return {};
}

}

#endif
