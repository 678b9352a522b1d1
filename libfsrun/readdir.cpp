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

#include <fsrun/readdir.h>

// set up a directory entry
// return 0 on success
// return -ENAMETOOLONG if the name does not fit
int fsrun_dir_entry_init( struct fsrun_dir_entry* dent, char const* name, fsrun_ino_t file_id, uint8_t type, uint64_t offset ) {

   size_t name_len = strlen( name );

   if( name_len > FSRUN_FILESYSTEM_NAMEMAX ) {
      return -ENAMETOOLONG;
   }

   memset( dent, 0, sizeof(struct fsrun_dir_entry) );

   dent->type = type;
   dent->file_id = file_id;
   dent->offset = offset;
   memcpy( dent->name, name, name_len );

   return 0;
}


// append an entry to a listing, if it comes after the cursor
// return 0 on success (including if the entry was skipped)
// return -ENAMETOOLONG if the name does not fit
// return -ENOMEM if OOM
int fsrun_readdir_append( fsrun_dir_entry_list* dents, uint64_t cursor, char const* name, fsrun_ino_t file_id, uint8_t type, uint64_t offset ) {

   int rc = 0;
   struct fsrun_dir_entry dent;

   if( offset <= cursor ) {
      // already listed
      return 0;
   }

   rc = fsrun_dir_entry_init( &dent, name, file_id, type, offset );
   if( rc != 0 ) {
      fsrun_error("fsrun_dir_entry_init('%s') rc = %d\n", name, rc );
      return rc;
   }

   try {
      dents->push_back( dent );
   }
   catch( bad_alloc& ba ) {
      return -ENOMEM;
   }

   return 0;
}


// append "." (the directory itself) and ".." (its parent) to a listing, if they come after the cursor.
// the root is its own parent.
// return 0 on success
// return -ENOMEM if OOM
int fsrun_readdir_append_dots( fsrun_dir_entry_list* dents, uint64_t cursor, fsrun_ino_t dir, fsrun_ino_t parent ) {

   int rc = 0;

   rc = fsrun_readdir_append( dents, cursor, ".", dir, FSRUN_ENTRY_TYPE_DIR, FSRUN_READDIR_DOT );
   if( rc != 0 ) {
      return rc;
   }

   rc = fsrun_readdir_append( dents, cursor, "..", parent, FSRUN_ENTRY_TYPE_DIR, FSRUN_READDIR_DOTDOT );
   if( rc != 0 ) {
      return rc;
   }

   return 0;
}
