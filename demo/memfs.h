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

#ifndef _FSRUN_MEMFS_H_
#define _FSRUN_MEMFS_H_

#include <fsrun/fsrun.h>

// contents of the file the demo tree starts with
#define MEMFS_HELLO_MSG         "hello_world!"

// a file held in RAM
struct memfs_file {

   struct fsrun_attrs attrs;
   vector<char> data;
};

typedef fsrun_inode_table<memfs_file> memfs_table;
typedef fsrun_inode_entry<memfs_file> memfs_entry;

// per-inode extended attributes
typedef map< fsrun_ino_t, fsrun_xattr_set > memfs_xattr_table;

// a filesystem held in RAM
struct memfs {

   memfs_table table;
   memfs_xattr_table* xattrs;

   uint64_t next_fh;
};

FSRUN_C_LINKAGE_BEGIN

int memfs_init( struct memfs* fs );
int memfs_free( struct memfs* fs );

// build the namespace
int memfs_mkdir( struct memfs* fs, fsrun_ino_t parent, char const* name, mode_t mode, fsrun_ino_t* ino );
int memfs_mkfile( struct memfs* fs, fsrun_ino_t parent, char const* name, mode_t mode, char const* data, size_t len, fsrun_ino_t* ino );
int memfs_populate( struct memfs* fs );

// get the backend's operations
int memfs_operations( struct fsrun_operations* ops );

FSRUN_C_LINKAGE_END

#endif
