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

#include <fsrun/attrs.h>
#include <fsrun/debug.h>

// set up attributes for an inode with the given mode.
// everything besides the mode gets its default.
int fsrun_attrs_init( struct fsrun_attrs* attrs, mode_t mode ) {

   memset( attrs, 0, sizeof(struct fsrun_attrs) );

   attrs->mode = mode;
   attrs->size = FSRUN_ATTRS_DEFAULT_SIZE;
   attrs->ttl.tv_sec = FSRUN_ATTRS_DEFAULT_TTL_SEC;

   return 0;
}

// set up an empty update
int fsrun_set_attrs_init( struct fsrun_set_attrs* set ) {

   memset( set, 0, sizeof(struct fsrun_set_attrs) );
   return 0;
}


#define FSRUN_SET_ATTR_APPLY( bit, FLAG, member, type ) \
   if( set->valid & FSRUN_SET_ATTR_ ## FLAG ) { \
      attrs->member = set->member; \
   }

// merge a sparse update into attrs: fields whose bit is set in set->valid are overwritten,
// and everything else is left alone.
// return attrs
struct fsrun_attrs* fsrun_attrs_apply( struct fsrun_attrs* attrs, struct fsrun_set_attrs const* set ) {

   FSRUN_SET_ATTRS_FIELDS( FSRUN_SET_ATTR_APPLY )

   return attrs;
}


#define FSRUN_SET_ATTR_NAME( bit, FLAG, member, type ) \
   case FSRUN_SET_ATTR_ ## FLAG: \
      return #member;

// name of the field behind a single FSRUN_SET_ATTR_* bit, or NULL if there is none
char const* fsrun_set_attrs_flag_name( int flag ) {

   switch( flag ) {

      FSRUN_SET_ATTRS_FIELDS( FSRUN_SET_ATTR_NAME )

      default:
         return NULL;
   }
}


// get the current wallclock time
// return 0 on success
// return -errno on failure
int fsrun_timespec_now( struct timespec* ts ) {

   int rc = clock_gettime( CLOCK_REALTIME, ts );
   if( rc != 0 ) {

      rc = -errno;
      fsrun_error("clock_gettime rc = %d\n", rc );
      return rc;
   }

   return 0;
}

// convert a duration to seconds
double fsrun_timespec_to_double( struct timespec const* ts ) {
   return (double)ts->tv_sec + (double)ts->tv_nsec / 1e9;
}


// fill in a stat buffer for an inode
int fsrun_attrs_to_stat( struct fsrun_attrs const* attrs, fsrun_ino_t ino, struct stat* sb ) {

   memset( sb, 0, sizeof(struct stat) );

   sb->st_ino = (ino_t)ino;
   sb->st_mode = attrs->mode;
   sb->st_nlink = attrs->nlink;
   sb->st_uid = attrs->uid;
   sb->st_gid = attrs->gid;
   sb->st_rdev = attrs->rdev;
   sb->st_size = (off_t)attrs->size;
   sb->st_blksize = attrs->blksize;
   sb->st_blocks = (blkcnt_t)attrs->blocks;

   sb->st_atim = attrs->atime;
   sb->st_mtim = attrs->mtime;
   sb->st_ctim = attrs->ctime;

   return 0;
}


// get the entry type from a mode's type bits.
// return FSRUN_ENTRY_TYPE_UNKNOWN if the mode has none
uint8_t fsrun_entry_type_from_mode( mode_t mode ) {

   if( S_ISREG( mode ) ) {
      return FSRUN_ENTRY_TYPE_FILE;
   }
   else if( S_ISDIR( mode ) ) {
      return FSRUN_ENTRY_TYPE_DIR;
   }
   else if( S_ISFIFO( mode ) ) {
      return FSRUN_ENTRY_TYPE_FIFO;
   }
   else if( S_ISSOCK( mode ) ) {
      return FSRUN_ENTRY_TYPE_SOCK;
   }
   else if( S_ISCHR( mode ) ) {
      return FSRUN_ENTRY_TYPE_CHR;
   }
   else if( S_ISBLK( mode ) ) {
      return FSRUN_ENTRY_TYPE_BLK;
   }
   else if( S_ISLNK( mode ) ) {
      return FSRUN_ENTRY_TYPE_LNK;
   }

   return FSRUN_ENTRY_TYPE_UNKNOWN;
}

// get the dirent d_type for an entry type
unsigned char fsrun_entry_type_to_dtype( uint8_t type ) {

   switch( type ) {

      case FSRUN_ENTRY_TYPE_FILE:
         return DT_REG;

      case FSRUN_ENTRY_TYPE_DIR:
         return DT_DIR;

      case FSRUN_ENTRY_TYPE_FIFO:
         return DT_FIFO;

      case FSRUN_ENTRY_TYPE_SOCK:
         return DT_SOCK;

      case FSRUN_ENTRY_TYPE_CHR:
         return DT_CHR;

      case FSRUN_ENTRY_TYPE_BLK:
         return DT_BLK;

      case FSRUN_ENTRY_TYPE_LNK:
         return DT_LNK;

      default:
         return DT_UNKNOWN;
   }
}
