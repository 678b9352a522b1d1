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

#include <fsrun/path.h>

// chop up a path into its constituent names.
// empty names (from leading, trailing, or repeated /) and "." are skipped,
// so "", "/" and "/./" all have no names.
// ".." is kept, since only the namespace can say what it refers to.
// return 0 on success
// return -EINVAL if path is NULL
// return -ENOMEM on OOM
int fsrun_path_split( char const* path, vector<string>* names ) {

   if( path == NULL ) {
      return -EINVAL;
   }

   try {

      names->clear();

      char const* cur = path;

      while( *cur != '\0' ) {

         // skip delimiters
         while( *cur == '/' ) {
            cur++;
         }

         if( *cur == '\0' ) {
            break;
         }

         char const* next = strchr( cur, '/' );
         if( next == NULL ) {
            next = cur + strlen(cur);
         }

         size_t name_len = next - cur;

         if( !(name_len == 1 && cur[0] == '.') ) {
            names->push_back( string( cur, name_len ) );
         }

         cur = next;
      }
   }
   catch( bad_alloc& ba ) {
      return -ENOMEM;
   }

   return 0;
}


// can name be the name of a directory entry?
// return 0 if so
// return -EINVAL if it is NULL, empty, "." or "..", or has a '/'
// return -ENAMETOOLONG if it is longer than FSRUN_FILESYSTEM_NAMEMAX
int fsrun_name_check( char const* name ) {

   if( name == NULL || name[0] == '\0' ) {
      return -EINVAL;
   }

   if( strcmp( name, "." ) == 0 || strcmp( name, ".." ) == 0 ) {
      return -EINVAL;
   }

   if( strchr( name, '/' ) != NULL ) {
      return -EINVAL;
   }

   if( strlen( name ) > FSRUN_FILESYSTEM_NAMEMAX ) {
      return -ENAMETOOLONG;
   }

   return 0;
}
