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

#ifndef _FSRUN_OPERATIONS_H_
#define _FSRUN_OPERATIONS_H_

#include <fsrun/common.h>
#include <fsrun/attrs.h>
#include <fsrun/readdir.h>
#include <fsrun/error.h>

// result of a lookup.
// a cleared has_* flag means "use the transport's default".
struct fsrun_lookup {

   struct fsrun_attrs attrs;
   fsrun_ino_t ino;

   bool has_generation;
   uint64_t generation;

   bool has_attr_timeout;
   struct timespec attr_timeout;

   bool has_entry_timeout;
   struct timespec entry_timeout;
};

// result of an open or opendir
struct fsrun_open_file {

   uint64_t fh;                 // backend-chosen handle
   bool direct_io;
   bool keep_cache;
   bool seekable;
   bool cache_dir;              // opendir only
};

// Backend capability table.
// Every slot takes the backend's state as its first argument.
// A NULL slot means the backend does not implement the operation, and the
// request is answered with ENOSYS without calling anything.
// Slots return 0 (or a byte count) on success, and a negative errno on failure.
struct fsrun_operations {

   // resolve name in the directory parent
   int (*lookup)( void* fs, fsrun_ino_t parent, char const* name, struct fsrun_lookup* out );

   int (*getattr)( void* fs, fsrun_ino_t ino, struct fsrun_attrs* attrs );

   // merge the update and return the resulting attributes in *attrs
   int (*setattr)( void* fs, fsrun_ino_t ino, struct fsrun_set_attrs const* set, struct fsrun_attrs* attrs );

   int (*open)( void* fs, fsrun_ino_t ino, int flags, struct fsrun_open_file* out );
   int (*opendir)( void* fs, fsrun_ino_t ino, int flags, struct fsrun_open_file* out );

   // flags is FSRUN_XATTR_CREATE or FSRUN_XATTR_REPLACE
   int (*setxattr)( void* fs, fsrun_ino_t ino, char const* name, char const* value, size_t value_len, int flags );

   // return the full length of the value (or name list).
   // size == 0 is a length query and copies nothing.
   // return -ERANGE if the full length is more than a nonzero size.
   ssize_t (*getxattr)( void* fs, fsrun_ino_t ino, char const* name, char* value, size_t size );
   ssize_t (*listxattr)( void* fs, fsrun_ino_t ino, char* list, size_t size );

   // append the entries after the cursor offset to *dents
   int (*readdir)( void* fs, fsrun_ino_t dir, uint64_t offset, fsrun_dir_entry_list* dents );

   // return the number of bytes read or written
   ssize_t (*read)( void* fs, fsrun_ino_t ino, char* buf, size_t size, off_t offset );
   ssize_t (*write)( void* fs, fsrun_ino_t ino, char const* buf, size_t size, off_t offset );
};

FSRUN_C_LINKAGE_BEGIN

int fsrun_operations_init( struct fsrun_operations* ops );

int fsrun_lookup_init( struct fsrun_lookup* lookup );
int fsrun_open_file_init( struct fsrun_open_file* open_file );

FSRUN_C_LINKAGE_END

#endif
