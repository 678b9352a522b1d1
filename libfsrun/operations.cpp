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

#include <fsrun/operations.h>

// set up an operations table that implements nothing
int fsrun_operations_init( struct fsrun_operations* ops ) {

   memset( ops, 0, sizeof(struct fsrun_operations) );
   return 0;
}

// set up a lookup result: no generation, and one-second timeouts
int fsrun_lookup_init( struct fsrun_lookup* lookup ) {

   memset( lookup, 0, sizeof(struct fsrun_lookup) );

   lookup->has_attr_timeout = true;
   lookup->attr_timeout.tv_sec = 1;

   lookup->has_entry_timeout = true;
   lookup->entry_timeout.tv_sec = 1;

   return 0;
}

// set up an open result: handle 0, seekable, no caching hints
int fsrun_open_file_init( struct fsrun_open_file* open_file ) {

   memset( open_file, 0, sizeof(struct fsrun_open_file) );

   open_file->seekable = true;

   return 0;
}
