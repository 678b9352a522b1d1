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

#ifndef _FSRUN_XATTR_H_
#define _FSRUN_XATTR_H_

#include <fsrun/common.h>
#include <fsrun/debug.h>

// decoded setxattr disposition
#define FSRUN_XATTR_CREATE      1       // the attribute must not exist yet
#define FSRUN_XATTR_REPLACE     2       // the attribute must already exist

// name --> value
typedef map< string, string > fsrun_xattr_set;

FSRUN_C_LINKAGE_BEGIN

// wire flags
int fsrun_xattr_flags_decode( int wire_flags, int* flags );

FSRUN_C_LINKAGE_END

// xattr sets
int fsrun_xattr_set_insert( fsrun_xattr_set* xattrs, char const* name, char const* value, size_t value_len, int flags );
ssize_t fsrun_xattr_set_get( fsrun_xattr_set const* xattrs, char const* name, char* value, size_t size );
ssize_t fsrun_xattr_set_list( fsrun_xattr_set const* xattrs, char* list, size_t size );
size_t fsrun_xattr_set_count( fsrun_xattr_set const* xattrs );

#endif
