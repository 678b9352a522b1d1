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

#ifndef _FSRUN_ATTRS_H_
#define _FSRUN_ATTRS_H_

#include <fsrun/common.h>

// inode types
#define FSRUN_ENTRY_TYPE_UNKNOWN      0
#define FSRUN_ENTRY_TYPE_FILE         1
#define FSRUN_ENTRY_TYPE_DIR          2
#define FSRUN_ENTRY_TYPE_FIFO         3
#define FSRUN_ENTRY_TYPE_SOCK         4
#define FSRUN_ENTRY_TYPE_CHR          5
#define FSRUN_ENTRY_TYPE_BLK          6
#define FSRUN_ENTRY_TYPE_LNK          7

// default attribute values
#define FSRUN_ATTRS_DEFAULT_SIZE      4096
#define FSRUN_ATTRS_DEFAULT_TTL_SEC   1

// full inode metadata, as reported to the kernel
struct fsrun_attrs {

   uint64_t size;
   mode_t mode;                 // type and permission bits
   uint32_t nlink;

   uid_t uid;
   gid_t gid;

   dev_t rdev;
   uint32_t blksize;
   uint64_t blocks;

   struct timespec atime;
   struct timespec mtime;
   struct timespec ctime;

   // how long the kernel may cache these attributes (a duration, not a deadline)
   struct timespec ttl;
};

// Fields a setattr request may change, one row per field:
//    FIELD( bit, FLAG, member, type )
// The sparse update struct, its valid-bits and the merge in fsrun_attrs_apply() are
// all generated from this list, so a field cannot be added to one and not the others.
// Every member named here must also exist in struct fsrun_attrs with the same type.
#define FSRUN_SET_ATTRS_FIELDS( FIELD ) \
   FIELD( 0,  MODE,     mode,     mode_t ) \
   FIELD( 1,  SIZE,     size,     uint64_t ) \
   FIELD( 2,  NLINK,    nlink,    uint32_t ) \
   FIELD( 3,  UID,      uid,      uid_t ) \
   FIELD( 4,  GID,      gid,      gid_t ) \
   FIELD( 5,  RDEV,     rdev,     dev_t ) \
   FIELD( 6,  BLKSIZE,  blksize,  uint32_t ) \
   FIELD( 7,  BLOCKS,   blocks,   uint64_t ) \
   FIELD( 8,  ATIME,    atime,    struct timespec ) \
   FIELD( 9,  MTIME,    mtime,    struct timespec ) \
   FIELD( 10, CTIME,    ctime,    struct timespec )

#define FSRUN_SET_ATTR_FLAG_DEF( bit, FLAG, member, type ) FSRUN_SET_ATTR_ ## FLAG = (1 << (bit)),
#define FSRUN_SET_ATTR_MEMBER_DEF( bit, FLAG, member, type ) type member;
#define FSRUN_SET_ATTR_OR( bit, FLAG, member, type ) | FSRUN_SET_ATTR_ ## FLAG
#define FSRUN_SET_ATTR_ONE( bit, FLAG, member, type ) + 1

enum {
   FSRUN_SET_ATTRS_FIELDS( FSRUN_SET_ATTR_FLAG_DEF )
};

#define FSRUN_SET_ATTR_ALL              (0 FSRUN_SET_ATTRS_FIELDS( FSRUN_SET_ATTR_OR ))
#define FSRUN_SET_ATTR_NUM_FIELDS       (0 FSRUN_SET_ATTRS_FIELDS( FSRUN_SET_ATTR_ONE ))

// sparse attribute update.
// a field is applied only if its FSRUN_SET_ATTR_* bit is set in valid.
struct fsrun_set_attrs {

   int valid;

   FSRUN_SET_ATTRS_FIELDS( FSRUN_SET_ATTR_MEMBER_DEF )
};

FSRUN_C_LINKAGE_BEGIN

// construction
int fsrun_attrs_init( struct fsrun_attrs* attrs, mode_t mode );
int fsrun_set_attrs_init( struct fsrun_set_attrs* set );

// merge
struct fsrun_attrs* fsrun_attrs_apply( struct fsrun_attrs* attrs, struct fsrun_set_attrs const* set );
char const* fsrun_set_attrs_flag_name( int flag );

// time
int fsrun_timespec_now( struct timespec* ts );
double fsrun_timespec_to_double( struct timespec const* ts );

// wire translation
int fsrun_attrs_to_stat( struct fsrun_attrs const* attrs, fsrun_ino_t ino, struct stat* sb );

// types
uint8_t fsrun_entry_type_from_mode( mode_t mode );
unsigned char fsrun_entry_type_to_dtype( uint8_t type );

FSRUN_C_LINKAGE_END

#endif
