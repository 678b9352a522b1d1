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

#include <fsrun/xattr.h>

// decode setxattr wire flags into FSRUN_XATTR_CREATE or FSRUN_XATTR_REPLACE
// return 0 on success, and set *flags
// return -EINVAL unless exactly one of XATTR_CREATE and XATTR_REPLACE is set
int fsrun_xattr_flags_decode( int wire_flags, int* flags ) {

   bool create = (wire_flags & XATTR_CREATE) != 0;
   bool replace = (wire_flags & XATTR_REPLACE) != 0;

   if( create && replace ) {
      return -EINVAL;
   }

   // TODO: setxattr(2) treats neither flag as "create or replace"; decide whether to accept it
   if( !create && !replace ) {
      return -EINVAL;
   }

   *flags = (create ? FSRUN_XATTR_CREATE : FSRUN_XATTR_REPLACE);
   return 0;
}


// set an xattr.
// flags is FSRUN_XATTR_CREATE or FSRUN_XATTR_REPLACE.
// return 0 on success
// return -EINVAL if flags is neither
// return -EEXIST if creating, and the attribute exists
// return -ENOATTR if replacing, and the attribute does not exist
// return -ENOMEM if OOM
int fsrun_xattr_set_insert( fsrun_xattr_set* xattrs, char const* name, char const* value, size_t value_len, int flags ) {

   if( flags != FSRUN_XATTR_CREATE && flags != FSRUN_XATTR_REPLACE ) {
      return -EINVAL;
   }

   try {

      string name_s( name );
      fsrun_xattr_set::iterator itr = xattrs->find( name_s );

      // semantics check
      if( itr != xattrs->end() && flags == FSRUN_XATTR_CREATE ) {
         return -EEXIST;
      }

      if( itr == xattrs->end() && flags == FSRUN_XATTR_REPLACE ) {
         return -ENOATTR;
      }

      (*xattrs)[ name_s ] = string( value, value_len );
   }
   catch( bad_alloc& ba ) {
      return -ENOMEM;
   }

   return 0;
}


// get an xattr value.
// return the length of the attribute on success
// on error:
// * -ENOATTR if the attribute doesn't exist
// * -ERANGE if the buffer isn't big enough
// * -ENOMEM if there isn't enough memory
// if size == 0 or value == NULL, then just return the length of the attribute requested
ssize_t fsrun_xattr_set_get( fsrun_xattr_set const* xattrs, char const* name, char* value, size_t size ) {

   fsrun_xattr_set::const_iterator itr;

   try {
      itr = xattrs->find( string(name) );
   }
   catch( bad_alloc& ba ) {
      return -ENOMEM;
   }

   if( itr == xattrs->end() ) {
      // not found
      return -ENOATTR;
   }

   string const& value_s = itr->second;

   // size query?
   if( value == NULL || size == 0 ) {
      return value_s.size();
   }

   // enough space?
   if( value_s.size() > size ) {
      return -ERANGE;
   }

   memcpy( value, value_s.data(), value_s.size() );

   return value_s.size();
}


// what's the total length of all attributes names (null-terminated)?
static size_t fsrun_xattr_set_list_len( fsrun_xattr_set const* xattrs ) {

   size_t size = 0;

   for( fsrun_xattr_set::const_iterator itr = xattrs->begin(); itr != xattrs->end(); itr++ ) {

      size += itr->first.size() + 1;
   }

   return size;
}

// copy the xattr names into a buffer.
// NOTE: no input validation occurs here.  The caller must ensure that list has enough space to hold all names, separated by \0's
static void fsrun_xattr_set_copy_names( fsrun_xattr_set const* xattrs, char* list ) {

   size_t offset = 0;

   for( fsrun_xattr_set::const_iterator itr = xattrs->begin(); itr != xattrs->end(); itr++ ) {

      memcpy( list + offset, itr->first.data(), itr->first.size() );

      offset += itr->first.size();

      *(list + offset) = '\0';

      offset++;
   }
}


// get the list of all xattr names
// return the length of the name list on success
// return -ERANGE if the buffer is too short
// if list == NULL or size == 0, then just return the length of the name list
ssize_t fsrun_xattr_set_list( fsrun_xattr_set const* xattrs, char* list, size_t size ) {

   size_t total_size = fsrun_xattr_set_list_len( xattrs );

   // just a length query?
   if( list == NULL || size == 0 ) {
      return total_size;
   }

   // range check
   if( total_size > size ) {
      return -ERANGE;
   }

   fsrun_xattr_set_copy_names( xattrs, list );

   return total_size;
}

size_t fsrun_xattr_set_count( fsrun_xattr_set const* xattrs ) {
   return xattrs->size();
}
