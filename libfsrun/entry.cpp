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

#include <fsrun/entry.h>
#include "util.h"

// make a new, empty directory with the given permission bits
// return NULL if OOM
struct fsrun_directory* fsrun_directory_new( mode_t mode ) {

   struct fsrun_directory* dir = safe_new( fsrun_directory );
   if( dir == NULL ) {
      return NULL;
   }

   fsrun_attrs_init( &dir->attrs, S_IFDIR | (mode & 07777) );
   dir->attrs.nlink = 2;

   return dir;
}

void fsrun_directory_free( struct fsrun_directory* dir ) {
   safe_delete( dir );
}


// find a child by name
// return 0 on success, and set *ino
// return -ENOENT if there is no such child
// return -ENOMEM if OOM
int fsrun_directory_get( struct fsrun_directory const* dir, char const* name, fsrun_ino_t* ino ) {

   fsrun_dir_children::const_iterator itr;

   try {
      itr = dir->children.find( string(name) );
   }
   catch( bad_alloc& ba ) {
      return -ENOMEM;
   }

   if( itr == dir->children.end() ) {
      return -ENOENT;
   }

   *ino = itr->second;
   return 0;
}

size_t fsrun_directory_count( struct fsrun_directory const* dir ) {
   return dir->children.size();
}


// start iterating over a directory's children, in name order
void fsrun_dir_iterator_begin( struct fsrun_dir_iterator* itr, struct fsrun_directory const* dir ) {

   itr->children = &dir->children;
   itr->pos = dir->children.begin();
}

// get the next child.
// return true and set *name and *ino if there is one.
// *name is valid until the directory is modified.
// return false once every child has been seen.
bool fsrun_dir_iterator_next( struct fsrun_dir_iterator* itr, char const** name, fsrun_ino_t* ino ) {

   if( itr->pos == itr->children->end() ) {
      return false;
   }

   *name = itr->pos->first.c_str();
   *ino = itr->pos->second;

   itr->pos++;
   return true;
}
