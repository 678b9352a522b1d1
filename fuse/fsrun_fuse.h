/*
   fsrun: a library for serving in-RAM filesystem namespaces over FUSE
   Copyright (C) 2026  The fsrun developers

   This program is dual-licensed: you can redistribute it and/or modify
   it under the terms of the GNU Lesser General Public License version 3 or later as
   published by the Free Software Foundation. For the terms of this
   license, see LICENSE.LGPLv3+ or <http://www.gnu.org/licenses/>.

   You are free to use this program under the terms of the GNU Lesser General
   Public License, but WITHOUT ANY WARRANTY; without even the implied
   warranty of MERCHANTABILITY or FITNESS FOR A PARTICULAR PURPOSE.
   See the GNU Lesser General Public License for more details.

   Alternatively, you are free to use this program under the terms of the
   Internet Software Consortium License, but WITHOUT ANY WARRANTY; without
   even the implied warranty of MERCHANTABILITY or FITNESS FOR A PARTICULAR PURPOSE.
   For the terms of this license, see LICENSE.ISC or
   <http://www.isc.org/downloads/software-support-policy/isc-license/>.
*/

#ifndef _FSRUN_FUSE_H_
#define _FSRUN_FUSE_H_


#define _DEFAULT_SOURCE

#include <fsrun/fsrun.h>

#define FUSE_USE_VERSION 28

#include <fuse_lowlevel.h>

// libfuse transport state
struct fsrun_fuse_state {

   struct fuse_args args;               // kernel configuration (FUSE command-line options)

   char* mountpoint;

   struct fuse_chan* ch;
   struct fuse_session* se;
   bool signal_handlers;

   // request buffer
   char* buf;
   size_t bufsize;

   // filled in by the low-level callbacks while fsrun_fuse_recv() processes a buffer
   struct fsrun_request* pending;
   bool have_pending;
};

FSRUN_C_LINKAGE_BEGIN

// set up and tear down
int fsrun_fuse_init( struct fsrun_fuse_state* state, int argc, char** argv );
int fsrun_fuse_free( struct fsrun_fuse_state* state );

// get the transport table for a state.
// mounting does not daemonize, so a runner using it may run on any thread
int fsrun_fuse_transport( struct fsrun_fuse_state* state, struct fsrun_transport_ops* transport );

// low-level callbacks
struct fuse_lowlevel_ops fsrun_fuse_get_opers();

// main interface
int fsrun_fuse_main( int argc, char** argv, struct fsrun_operations const* ops, void* fs );

FSRUN_C_LINKAGE_END

#endif
