// -*- mode: cpp; mode: fold -*-
// Description								/*{{{*/
/* ######################################################################

   Init - Initialize the package library

   pkgInitConfig has to be called before any pipeline stage runs, it
   sets the defaults of every configuration item they read and then
   merges the configuration files on top.

   ##################################################################### */
									/*}}}*/
#ifndef DEBFETCH_INIT_H
#define DEBFETCH_INIT_H

#include <debfetch-pkg/macros.h>

class Configuration;

DEBFETCH_PUBLIC extern const char *pkgVersion;

DEBFETCH_PUBLIC bool pkgInitConfig(Configuration &Cnf);

#endif
