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

#ifndef _FSRUN_READDIR_H_
#define _FSRUN_READDIR_H_

#include <fsrun/common.h>
#include <fsrun/debug.h>
#include <fsrun/attrs.h>

// readdir cursors of the synthesized entries.
// real children start at FSRUN_READDIR_FIRST_CHILD.
#define FSRUN_READDIR_DOT               1
#define FSRUN_READDIR_DOTDOT            2
#define FSRUN_READDIR_FIRST_CHILD       3

// fsrun dir entry
struct fsrun_dir_entry {
   uint8_t type;                // type of file (FSRUN_ENTRY_TYPE_*)
   fsrun_ino_t file_id;         // inode
   uint64_t offset;             // cursor to resume the listing after this entry
   char name[FSRUN_FILESYSTEM_NAMEMAX+1];          // name of file
};

typedef vector< struct fsrun_dir_entry > fsrun_dir_entry_list;

int fsrun_dir_entry_init( struct fsrun_dir_entry* dent, char const* name, fsrun_ino_t file_id, uint8_t type, uint64_t offset );

// listing helpers
int fsrun_readdir_append( fsrun_dir_entry_list* dents, uint64_t cursor, char const* name, fsrun_ino_t file_id, uint8_t type, uint64_t offset );
int fsrun_readdir_append_dots( fsrun_dir_entry_list* dents, uint64_t cursor, fsrun_ino_t dir, fsrun_ino_t parent );

#endif
