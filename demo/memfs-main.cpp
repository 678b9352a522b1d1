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

/*
 * A FUSE filesystem held entirely in RAM, served by an fsrun runner.
 * It starts out with a few directories and one file, and supports
 * reads, writes, truncation, and extended attributes.
 *
 * Usage:
 *    ./fsrun-memfs [fuse opts] mountpoint_dir
 *
 * -d also turns on fsrun's debug messages.
 */

#include "memfs.h"
#include "fsrun_fuse.h"

void usage( char const* progname ) {
   fprintf(stderr, "Usage: %s [fuse opts] mountpoint_dir\n", progname );
}

int main( int argc, char** argv ) {

   int rc = 0;
   struct memfs fs;
   struct fsrun_operations ops;

   if( argc < 2 ) {
      usage( argv[0] );
      exit(1);
   }

   for( int i = 1; i < argc; i++ ) {
      if( strcmp( argv[i], "-d" ) == 0 ) {
         fsrun_set_debug_level( 1 );
      }
   }

   // set up
   rc = memfs_init( &fs );
   if( rc != 0 ) {
      fprintf(stderr, "memfs_init rc = %d\n", rc );
      exit(1);
   }

   rc = memfs_populate( &fs );
   if( rc != 0 ) {
      fprintf(stderr, "memfs_populate rc = %d\n", rc );

      memfs_free( &fs );
      exit(1);
   }

   memfs_operations( &ops );

   // run
   rc = fsrun_fuse_main( argc, argv, &ops, &fs );

   // shutdown
   memfs_free( &fs );

   return (rc == 0 ? 0 : 1);
}
