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

#include "memfs.h"

// set up an empty filesystem (just the root directory)
// return 0 on success
// return -ENOMEM if OOM
int memfs_init( struct memfs* fs ) {

   int rc = 0;

   rc = fsrun_inode_table_init( &fs->table );
   if( rc != 0 ) {
      return rc;
   }

   fs->xattrs = new (nothrow) memfs_xattr_table();
   if( fs->xattrs == NULL ) {

      fsrun_inode_table_free( &fs->table );
      return -ENOMEM;
   }

   fs->next_fh = 1;

   return 0;
}

// free a filesystem
int memfs_free( struct memfs* fs ) {

   fsrun_inode_table_free( &fs->table );

   if( fs->xattrs != NULL ) {
      delete fs->xattrs;
      fs->xattrs = NULL;
   }

   return 0;
}


// stamp new attributes with the caller's identity and the current time
static void memfs_attrs_fill( struct fsrun_attrs* attrs ) {

   struct timespec now;

   memset( &now, 0, sizeof(now) );
   fsrun_timespec_now( &now );

   attrs->uid = getuid();
   attrs->gid = getgid();
   attrs->blksize = FSRUN_ATTRS_DEFAULT_SIZE;

   attrs->atime = now;
   attrs->mtime = now;
   attrs->ctime = now;
}

// make a directory
// return 0 on success, and set *ino (if not NULL)
// return the same errors as fsrun_inode_table_push_dir()
int memfs_mkdir( struct memfs* fs, fsrun_ino_t parent, char const* name, mode_t mode, fsrun_ino_t* ino ) {

   int rc = 0;
   struct fsrun_directory* dir = fsrun_directory_new( mode );

   if( dir == NULL ) {
      return -ENOMEM;
   }

   memfs_attrs_fill( &dir->attrs );

   rc = fsrun_inode_table_push_dir( &fs->table, parent, name, dir, ino );
   if( rc != 0 ) {

      fsrun_error("fsrun_inode_table_push_dir(%" PRIu64 ", '%s') rc = %d\n", parent, name, rc );
      fsrun_directory_free( dir );
      return rc;
   }

   return 0;
}

// make a file with the given contents
// return 0 on success, and set *ino (if not NULL)
// return the same errors as fsrun_inode_table_push_file()
int memfs_mkfile( struct memfs* fs, fsrun_ino_t parent, char const* name, mode_t mode, char const* data, size_t len, fsrun_ino_t* ino ) {

   int rc = 0;
   struct memfs_file* file = new (nothrow) memfs_file();

   if( file == NULL ) {
      return -ENOMEM;
   }

   try {
      file->data.assign( data, data + len );
   }
   catch( bad_alloc& ba ) {

      delete file;
      return -ENOMEM;
   }

   fsrun_attrs_init( &file->attrs, S_IFREG | (mode & 07777) );
   memfs_attrs_fill( &file->attrs );

   file->attrs.size = len;
   file->attrs.nlink = 1;

   rc = fsrun_inode_table_push_file( &fs->table, parent, name, file, ino );
   if( rc != 0 ) {

      fsrun_error("fsrun_inode_table_push_file(%" PRIu64 ", '%s') rc = %d\n", parent, name, rc );
      delete file;
      return rc;
   }

   return 0;
}

// build the demo tree:
//   /test/test2/test3/
//   /root2/
//   /file ("hello_world!")
int memfs_populate( struct memfs* fs ) {

   int rc = 0;
   fsrun_ino_t test = 0;
   fsrun_ino_t test2 = 0;

   rc = memfs_mkdir( fs, FSRUN_ROOT_INODE, "test", 0755, &test );
   if( rc != 0 ) {
      return rc;
   }

   rc = memfs_mkdir( fs, test, "test2", 0755, &test2 );
   if( rc != 0 ) {
      return rc;
   }

   rc = memfs_mkdir( fs, test2, "test3", 0755, NULL );
   if( rc != 0 ) {
      return rc;
   }

   rc = memfs_mkdir( fs, FSRUN_ROOT_INODE, "root2", 0755, NULL );
   if( rc != 0 ) {
      return rc;
   }

   rc = memfs_mkfile( fs, FSRUN_ROOT_INODE, "file", 0755, MEMFS_HELLO_MSG, strlen(MEMFS_HELLO_MSG), NULL );
   if( rc != 0 ) {
      return rc;
   }

   return 0;
}


static int memfs_lookup( void* cls, fsrun_ino_t parent, char const* name, struct fsrun_lookup* out ) {

   int rc = 0;
   fsrun_ino_t ino = 0;
   struct memfs* fs = (struct memfs*)cls;

   memfs_entry const* parent_ent = fsrun_inode_table_get( &fs->table, parent );
   if( parent_ent == NULL ) {
      return FSRUN_ERR_NO_ENTRY;
   }

   struct fsrun_directory const* dir = fsrun_inode_entry_as_dir( parent_ent );
   if( dir == NULL ) {
      return FSRUN_ERR_NOT_DIRECTORY;
   }

   rc = fsrun_directory_get( dir, name, &ino );
   if( rc != 0 ) {
      return rc;
   }

   memfs_entry const* ent = fsrun_inode_table_get( &fs->table, ino );
   if( ent == NULL ) {
      return FSRUN_ERR_NO_ENTRY;
   }

   out->ino = ino;
   return fsrun_inode_entry_getattrs( ent, &out->attrs );
}

static int memfs_getattr( void* cls, fsrun_ino_t ino, struct fsrun_attrs* attrs ) {

   struct memfs* fs = (struct memfs*)cls;

   memfs_entry const* ent = fsrun_inode_table_get( &fs->table, ino );
   if( ent == NULL ) {
      return FSRUN_ERR_NO_ENTRY;
   }

   return fsrun_inode_entry_getattrs( ent, attrs );
}

// a new size also truncates or extends a file's data
static int memfs_setattr( void* cls, fsrun_ino_t ino, struct fsrun_set_attrs const* set, struct fsrun_attrs* attrs ) {

   struct memfs* fs = (struct memfs*)cls;

   memfs_entry* ent = fsrun_inode_table_get_mut( &fs->table, ino );
   if( ent == NULL ) {
      return FSRUN_ERR_NO_ENTRY;
   }

   struct memfs_file* file = fsrun_inode_entry_as_file( ent );

   if( file != NULL && (set->valid & FSRUN_SET_ATTR_SIZE) ) {

      try {
         file->data.resize( set->size, 0 );
      }
      catch( bad_alloc& ba ) {
         return -ENOMEM;
      }
      catch( length_error& le ) {
         return -EFBIG;
      }
   }

   return fsrun_inode_entry_apply_attrs( ent, set, attrs );
}

static int memfs_open( void* cls, fsrun_ino_t ino, int flags, struct fsrun_open_file* out ) {

   struct memfs* fs = (struct memfs*)cls;

   memfs_entry const* ent = fsrun_inode_table_get( &fs->table, ino );
   if( ent == NULL ) {
      return FSRUN_ERR_NO_ENTRY;
   }

   if( fsrun_inode_entry_as_file( ent ) == NULL ) {
      return FSRUN_ERR_NOT_FILE;
   }

   out->fh = fs->next_fh;
   fs->next_fh++;

   return 0;
}

static int memfs_opendir( void* cls, fsrun_ino_t ino, int flags, struct fsrun_open_file* out ) {

   struct memfs* fs = (struct memfs*)cls;

   memfs_entry const* ent = fsrun_inode_table_get( &fs->table, ino );
   if( ent == NULL ) {
      return FSRUN_ERR_NO_ENTRY;
   }

   if( fsrun_inode_entry_as_dir( ent ) == NULL ) {
      return FSRUN_ERR_NOT_DIRECTORY;
   }

   out->fh = fs->next_fh;
   out->cache_dir = true;

   fs->next_fh++;

   return 0;
}

static int memfs_setxattr( void* cls, fsrun_ino_t ino, char const* name, char const* value, size_t value_len, int flags ) {

   int rc = 0;
   struct memfs* fs = (struct memfs*)cls;

   if( fsrun_inode_table_get( &fs->table, ino ) == NULL ) {
      return FSRUN_ERR_NO_ENTRY;
   }

   memfs_xattr_table::iterator itr = fs->xattrs->find( ino );
   if( itr != fs->xattrs->end() ) {
      return fsrun_xattr_set_insert( &itr->second, name, value, value_len, flags );
   }

   // no xattrs yet, so there is nothing to replace
   if( flags != FSRUN_XATTR_CREATE ) {
      return FSRUN_ERR_NO_ATTR;
   }

   try {
      itr = fs->xattrs->insert( make_pair( ino, fsrun_xattr_set() ) ).first;
   }
   catch( bad_alloc& ba ) {
      return -ENOMEM;
   }

   rc = fsrun_xattr_set_insert( &itr->second, name, value, value_len, flags );
   if( rc != 0 ) {
      fs->xattrs->erase( itr );
   }

   return rc;
}

static ssize_t memfs_getxattr( void* cls, fsrun_ino_t ino, char const* name, char* value, size_t size ) {

   struct memfs* fs = (struct memfs*)cls;

   if( fsrun_inode_table_get( &fs->table, ino ) == NULL ) {
      return FSRUN_ERR_NO_ENTRY;
   }

   memfs_xattr_table::const_iterator itr = fs->xattrs->find( ino );
   if( itr == fs->xattrs->end() ) {
      return FSRUN_ERR_NO_ATTR;
   }

   return fsrun_xattr_set_get( &itr->second, name, value, size );
}

static ssize_t memfs_listxattr( void* cls, fsrun_ino_t ino, char* list, size_t size ) {

   struct memfs* fs = (struct memfs*)cls;

   if( fsrun_inode_table_get( &fs->table, ino ) == NULL ) {
      return FSRUN_ERR_NO_ENTRY;
   }

   memfs_xattr_table::const_iterator itr = fs->xattrs->find( ino );
   if( itr == fs->xattrs->end() ) {
      // no names
      return 0;
   }

   return fsrun_xattr_set_list( &itr->second, list, size );
}

static int memfs_readdir( void* cls, fsrun_ino_t dir, uint64_t offset, fsrun_dir_entry_list* dents ) {

   struct memfs* fs = (struct memfs*)cls;

   return fsrun_inode_table_readdir( &fs->table, dir, offset, dents );
}

// reading past the end of the data is not an error; it just comes up short
static ssize_t memfs_read( void* cls, fsrun_ino_t ino, char* buf, size_t size, off_t offset ) {

   struct memfs* fs = (struct memfs*)cls;

   memfs_entry const* ent = fsrun_inode_table_get( &fs->table, ino );
   if( ent == NULL ) {
      return FSRUN_ERR_NO_ENTRY;
   }

   struct memfs_file const* file = fsrun_inode_entry_as_file( ent );
   if( file == NULL ) {
      return FSRUN_ERR_NOT_FILE;
   }

   if( offset < 0 ) {
      return -EINVAL;
   }

   if( (uint64_t)offset >= file->data.size() ) {
      return 0;
   }

   size_t num_read = MIN( size, file->data.size() - (size_t)offset );

   memcpy( buf, &file->data[0] + offset, num_read );

   return num_read;
}

// grow the file as needed, and copy the data in
static ssize_t memfs_write( void* cls, fsrun_ino_t ino, char const* buf, size_t size, off_t offset ) {

   struct memfs* fs = (struct memfs*)cls;

   memfs_entry* ent = fsrun_inode_table_get_mut( &fs->table, ino );
   if( ent == NULL ) {
      return FSRUN_ERR_NO_ENTRY;
   }

   struct memfs_file* file = fsrun_inode_entry_as_file( ent );
   if( file == NULL ) {
      return FSRUN_ERR_NOT_FILE;
   }

   if( offset < 0 ) {
      return -EINVAL;
   }

   if( size == 0 ) {
      return 0;
   }

   size_t end = (size_t)offset + size;

   if( end > file->data.size() ) {

      try {
         file->data.resize( end, 0 );
      }
      catch( bad_alloc& ba ) {
         return -ENOMEM;
      }
      catch( length_error& le ) {
         return -EFBIG;
      }
   }

   memcpy( &file->data[0] + offset, buf, size );

   file->attrs.size = file->data.size();
   fsrun_timespec_now( &file->attrs.mtime );

   return size;
}


// get the memfs operations
int memfs_operations( struct fsrun_operations* ops ) {

   fsrun_operations_init( ops );

   ops->lookup = memfs_lookup;
   ops->getattr = memfs_getattr;
   ops->setattr = memfs_setattr;
   ops->open = memfs_open;
   ops->opendir = memfs_opendir;
   ops->setxattr = memfs_setxattr;
   ops->getxattr = memfs_getxattr;
   ops->listxattr = memfs_listxattr;
   ops->readdir = memfs_readdir;
   ops->read = memfs_read;
   ops->write = memfs_write;

   return 0;
}
