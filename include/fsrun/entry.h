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

#ifndef _FSRUN_ENTRY_H_
#define _FSRUN_ENTRY_H_

#include <fsrun/common.h>
#include <fsrun/debug.h>
#include <fsrun/attrs.h>
#include <fsrun/path.h>
#include <fsrun/readdir.h>

// inode kinds
#define FSRUN_INODE_DIR         1
#define FSRUN_INODE_FILE        2

// directory children, by name.
// std::map keeps enumeration order stable while the directory is unmodified.
typedef map< string, fsrun_ino_t > fsrun_dir_children;

// fsrun directory
struct fsrun_directory {

   fsrun_dir_children children;
   struct fsrun_attrs attrs;
};

// children iterator
struct fsrun_dir_iterator {

   fsrun_dir_children const* children;
   fsrun_dir_children::const_iterator pos;
};

// directories
struct fsrun_directory* fsrun_directory_new( mode_t mode );
void fsrun_directory_free( struct fsrun_directory* dir );
int fsrun_directory_get( struct fsrun_directory const* dir, char const* name, fsrun_ino_t* ino );
size_t fsrun_directory_count( struct fsrun_directory const* dir );

// iteration
void fsrun_dir_iterator_begin( struct fsrun_dir_iterator* itr, struct fsrun_directory const* dir );
bool fsrun_dir_iterator_next( struct fsrun_dir_iterator* itr, char const** name, fsrun_ino_t* ino );


// One inode: either a directory or an application-defined file F.
// Exactly one of dir and file is non-NULL, as selected by kind.
// F must have a public "struct fsrun_attrs attrs" member.
template <typename F>
struct fsrun_inode_entry {

   bool has_parent;             // false only for the root
   fsrun_ino_t parent;

   int kind;                    // FSRUN_INODE_*

   struct fsrun_directory* dir;
   F* file;
};

template <typename F>
int fsrun_inode_entry_init_dir( fsrun_inode_entry<F>* ent, struct fsrun_directory* dir ) {

   ent->has_parent = false;
   ent->parent = 0;
   ent->kind = FSRUN_INODE_DIR;
   ent->dir = dir;
   ent->file = NULL;

   return 0;
}

template <typename F>
int fsrun_inode_entry_init_file( fsrun_inode_entry<F>* ent, F* file ) {

   ent->has_parent = false;
   ent->parent = 0;
   ent->kind = FSRUN_INODE_FILE;
   ent->dir = NULL;
   ent->file = file;

   return 0;
}

template <typename F>
struct fsrun_directory const* fsrun_inode_entry_as_dir( fsrun_inode_entry<F> const* ent ) {
   return ent->kind == FSRUN_INODE_DIR ? ent->dir : NULL;
}

template <typename F>
struct fsrun_directory* fsrun_inode_entry_as_dir( fsrun_inode_entry<F>* ent ) {
   return ent->kind == FSRUN_INODE_DIR ? ent->dir : NULL;
}

template <typename F>
F const* fsrun_inode_entry_as_file( fsrun_inode_entry<F> const* ent ) {
   return ent->kind == FSRUN_INODE_FILE ? ent->file : NULL;
}

template <typename F>
F* fsrun_inode_entry_as_file( fsrun_inode_entry<F>* ent ) {
   return ent->kind == FSRUN_INODE_FILE ? ent->file : NULL;
}

// get the readdir type of an entry.
// files report the type in their mode, and count as regular files if it has none.
template <typename F>
uint8_t fsrun_inode_entry_type( fsrun_inode_entry<F> const* ent ) {

   uint8_t type = FSRUN_ENTRY_TYPE_UNKNOWN;

   switch( ent->kind ) {

      case FSRUN_INODE_DIR:
         type = FSRUN_ENTRY_TYPE_DIR;
         break;

      case FSRUN_INODE_FILE:
         type = fsrun_entry_type_from_mode( ent->file->attrs.mode );
         if( type == FSRUN_ENTRY_TYPE_UNKNOWN ) {
            type = FSRUN_ENTRY_TYPE_FILE;
         }
         break;

      default:
         fsrun_error("BUG: unknown inode kind %d\n", ent->kind );
         break;
   }

   return type;
}

// copy out an entry's attributes
// return 0 on success
// return -EINVAL if the entry is corrupt
template <typename F>
int fsrun_inode_entry_getattrs( fsrun_inode_entry<F> const* ent, struct fsrun_attrs* attrs ) {

   switch( ent->kind ) {

      case FSRUN_INODE_DIR:
         *attrs = ent->dir->attrs;
         return 0;

      case FSRUN_INODE_FILE:
         *attrs = ent->file->attrs;
         return 0;

      default:
         fsrun_error("BUG: unknown inode kind %d\n", ent->kind );
         return -EINVAL;
   }
}

// merge a sparse update into an entry's attributes, and copy out the result if attrs is not NULL
// return 0 on success
// return -EINVAL if the entry is corrupt
template <typename F>
int fsrun_inode_entry_apply_attrs( fsrun_inode_entry<F>* ent, struct fsrun_set_attrs const* set, struct fsrun_attrs* attrs ) {

   struct fsrun_attrs* cur = NULL;

   switch( ent->kind ) {

      case FSRUN_INODE_DIR:
         cur = &ent->dir->attrs;
         break;

      case FSRUN_INODE_FILE:
         cur = &ent->file->attrs;
         break;

      default:
         fsrun_error("BUG: unknown inode kind %d\n", ent->kind );
         return -EINVAL;
   }

   fsrun_attrs_apply( cur, set );

   if( attrs != NULL ) {
      *attrs = *cur;
   }

   return 0;
}


// Inode table: owns every entry and every payload, keyed by inode.
// Parents are referred to by inode, never by pointer.
// Entries are only ever added; inode numbers are never reused.
template <typename F>
struct fsrun_inode_table {

   map< fsrun_ino_t, fsrun_inode_entry<F> > entries;

   // next inode to hand out
   fsrun_ino_t next_ino;
};

template <typename F>
fsrun_inode_entry<F> const* fsrun_inode_table_get( struct fsrun_inode_table<F> const* table, fsrun_ino_t ino ) {

   typename map< fsrun_ino_t, fsrun_inode_entry<F> >::const_iterator itr = table->entries.find( ino );
   if( itr == table->entries.end() ) {
      return NULL;
   }

   return &itr->second;
}

template <typename F>
fsrun_inode_entry<F>* fsrun_inode_table_get_mut( struct fsrun_inode_table<F>* table, fsrun_ino_t ino ) {

   typename map< fsrun_ino_t, fsrun_inode_entry<F> >::iterator itr = table->entries.find( ino );
   if( itr == table->entries.end() ) {
      return NULL;
   }

   return &itr->second;
}

// set up an inode table with only the root directory
// return 0 on success
// return -ENOMEM if OOM
template <typename F>
int fsrun_inode_table_init( struct fsrun_inode_table<F>* table ) {

   fsrun_inode_entry<F> root;
   struct fsrun_directory* root_dir = fsrun_directory_new( 0755 );

   if( root_dir == NULL ) {
      return -ENOMEM;
   }

   fsrun_inode_entry_init_dir( &root, root_dir );

   try {
      table->entries.clear();
      table->entries[ FSRUN_ROOT_INODE ] = root;
   }
   catch( bad_alloc& ba ) {

      fsrun_directory_free( root_dir );
      return -ENOMEM;
   }

   table->next_ino = FSRUN_ROOT_INODE + 1;

   return 0;
}

// free every entry and payload in the table
template <typename F>
int fsrun_inode_table_free( struct fsrun_inode_table<F>* table ) {

   typename map< fsrun_ino_t, fsrun_inode_entry<F> >::iterator itr;

   for( itr = table->entries.begin(); itr != table->entries.end(); itr++ ) {

      fsrun_inode_entry<F>* ent = &itr->second;

      switch( ent->kind ) {

         case FSRUN_INODE_DIR:
            fsrun_directory_free( ent->dir );
            ent->dir = NULL;
            break;

         case FSRUN_INODE_FILE:
            delete ent->file;
            ent->file = NULL;
            break;

         default:
            fsrun_error("BUG: inode %" PRIu64 " has unknown kind %d\n", itr->first, ent->kind );
            break;
      }
   }

   table->entries.clear();
   table->next_ino = 0;

   return 0;
}

// number of live inodes, including the root
template <typename F>
size_t fsrun_inode_table_count( struct fsrun_inode_table<F> const* table ) {
   return table->entries.size();
}

// insert an entry as the child called name of the directory parent.
// the entry is built with fsrun_inode_entry_init_dir() or fsrun_inode_entry_init_file();
// on success, the table owns its payload and *ret_ino (if not NULL) is the new inode.
// return 0 on success
// return negative on error, in which case the table is unchanged and the caller keeps the payload:
// * -ENOENT if parent does not exist
// * -ENOTDIR if parent is not a directory
// * -EINVAL if the name is not a valid directory entry name, or the entry has no payload
// * -ENAMETOOLONG if the name is too long
// * -EEXIST if parent already has a child called name
// * -ENOSPC if the inode space is exhausted
// * -ENOMEM if OOM
template <typename F>
int fsrun_inode_table_push_entry( struct fsrun_inode_table<F>* table, fsrun_ino_t parent, char const* name, fsrun_inode_entry<F> const* entry, fsrun_ino_t* ret_ino ) {

   int rc = 0;
   fsrun_ino_t ino = 0;
   fsrun_inode_entry<F> child = *entry;

   rc = fsrun_name_check( name );
   if( rc != 0 ) {
      return rc;
   }

   if( (child.kind == FSRUN_INODE_DIR && child.dir == NULL) || (child.kind == FSRUN_INODE_FILE && child.file == NULL) || (child.kind != FSRUN_INODE_DIR && child.kind != FSRUN_INODE_FILE) ) {
      return -EINVAL;
   }

   fsrun_inode_entry<F>* parent_ent = fsrun_inode_table_get_mut( table, parent );
   if( parent_ent == NULL ) {
      return -ENOENT;
   }

   struct fsrun_directory* parent_dir = fsrun_inode_entry_as_dir( parent_ent );
   if( parent_dir == NULL ) {
      return -ENOTDIR;
   }

   if( parent_dir->children.find( string(name) ) != parent_dir->children.end() ) {
      return -EEXIST;
   }

   // never wrap around
   if( table->next_ino == UINT64_MAX ) {
      fsrun_error("Out of inode numbers (next = %" PRIu64 ")\n", table->next_ino );
      return -ENOSPC;
   }

   ino = table->next_ino;

   child.has_parent = true;
   child.parent = parent;

   try {
      table->entries[ ino ] = child;
   }
   catch( bad_alloc& ba ) {
      return -ENOMEM;
   }

   try {
      parent_dir->children[ string(name) ] = ino;
   }
   catch( bad_alloc& ba ) {

      table->entries.erase( ino );
      return -ENOMEM;
   }

   table->next_ino++;

   if( ret_ino != NULL ) {
      *ret_ino = ino;
   }

   return 0;
}

// insert a directory.  See fsrun_inode_table_push_entry()
template <typename F>
int fsrun_inode_table_push_dir( struct fsrun_inode_table<F>* table, fsrun_ino_t parent, char const* name, struct fsrun_directory* dir, fsrun_ino_t* ret_ino ) {

   fsrun_inode_entry<F> ent;
   fsrun_inode_entry_init_dir( &ent, dir );

   return fsrun_inode_table_push_entry( table, parent, name, &ent, ret_ino );
}

// insert a file.  See fsrun_inode_table_push_entry()
template <typename F>
int fsrun_inode_table_push_file( struct fsrun_inode_table<F>* table, fsrun_ino_t parent, char const* name, F* file, fsrun_ino_t* ret_ino ) {

   fsrun_inode_entry<F> ent;
   fsrun_inode_entry_init_file( &ent, file );

   return fsrun_inode_table_push_entry( table, parent, name, &ent, ret_ino );
}

// resolve a path to an entry, starting at the root.
// "a/b" and "/a/b" are the same path.
// on success, return the entry and set *ret_ino (if not NULL) to its inode.
// on error, return NULL and set *err to:
// * -ENOENT if a component does not exist
// * -ENOTDIR if a component before the last one is not a directory
// * -ENOMEM if OOM
template <typename F>
fsrun_inode_entry<F> const* fsrun_inode_table_lookup( struct fsrun_inode_table<F> const* table, char const* path, fsrun_ino_t* ret_ino, int* err ) {

   int rc = 0;
   vector<string> names;
   fsrun_ino_t ino = FSRUN_ROOT_INODE;

   rc = fsrun_path_split( path, &names );
   if( rc != 0 ) {
      *err = rc;
      return NULL;
   }

   fsrun_inode_entry<F> const* ent = fsrun_inode_table_get( table, ino );
   if( ent == NULL ) {
      fsrun_error("BUG: no root inode in table %p\n", table );
      *err = -ENOENT;
      return NULL;
   }

   for( unsigned int i = 0; i < names.size(); i++ ) {

      struct fsrun_directory const* dir = fsrun_inode_entry_as_dir( ent );
      if( dir == NULL ) {
         *err = -ENOTDIR;
         return NULL;
      }

      rc = fsrun_directory_get( dir, names[i].c_str(), &ino );
      if( rc != 0 ) {
         *err = rc;
         return NULL;
      }

      ent = fsrun_inode_table_get( table, ino );
      if( ent == NULL ) {
         fsrun_error("BUG: dangling child %" PRIu64 " '%s'\n", ino, names[i].c_str() );
         *err = -ENOENT;
         return NULL;
      }
   }

   if( ret_ino != NULL ) {
      *ret_ino = ino;
   }

   *err = 0;
   return ent;
}

// resolve a path to a mutable entry.  See fsrun_inode_table_lookup()
template <typename F>
fsrun_inode_entry<F>* fsrun_inode_table_lookup_mut( struct fsrun_inode_table<F>* table, char const* path, fsrun_ino_t* ret_ino, int* err ) {

   fsrun_ino_t ino = 0;

   fsrun_inode_entry<F> const* ent = fsrun_inode_table_lookup( (struct fsrun_inode_table<F> const*)table, path, &ino, err );
   if( ent == NULL ) {
      return NULL;
   }

   if( ret_ino != NULL ) {
      *ret_ino = ino;
   }

   return fsrun_inode_table_get_mut( table, ino );
}

// start iterating over the children of a directory inode.
// return 0 on success
// return -ENOENT if dir does not exist
// return -ENOTDIR if dir is not a directory
template <typename F>
int fsrun_inode_table_children( struct fsrun_inode_table<F> const* table, fsrun_ino_t dir, struct fsrun_dir_iterator* itr ) {

   fsrun_inode_entry<F> const* ent = fsrun_inode_table_get( table, dir );
   if( ent == NULL ) {
      return -ENOENT;
   }

   struct fsrun_directory const* d = fsrun_inode_entry_as_dir( ent );
   if( d == NULL ) {
      return -ENOTDIR;
   }

   fsrun_dir_iterator_begin( itr, d );
   return 0;
}

// list a directory, starting after the given cursor.
// "." and ".." come first (the root is its own ".."), then the children in name order.
// return 0 on success, and append the entries to *dents
// return -ENOENT if dir does not exist
// return -ENOTDIR if dir is not a directory
// return -ENOMEM if OOM
template <typename F>
int fsrun_inode_table_readdir( struct fsrun_inode_table<F> const* table, fsrun_ino_t dir, uint64_t cursor, fsrun_dir_entry_list* dents ) {

   int rc = 0;
   struct fsrun_dir_iterator itr;
   char const* name = NULL;
   fsrun_ino_t child_ino = 0;
   uint64_t offset = FSRUN_READDIR_FIRST_CHILD;

   fsrun_inode_entry<F> const* ent = fsrun_inode_table_get( table, dir );
   if( ent == NULL ) {
      return -ENOENT;
   }

   rc = fsrun_inode_table_children( table, dir, &itr );
   if( rc != 0 ) {
      return rc;
   }

   rc = fsrun_readdir_append_dots( dents, cursor, dir, ent->has_parent ? ent->parent : dir );
   if( rc != 0 ) {
      return rc;
   }

   while( fsrun_dir_iterator_next( &itr, &name, &child_ino ) ) {

      uint8_t type = FSRUN_ENTRY_TYPE_UNKNOWN;
      fsrun_inode_entry<F> const* child = fsrun_inode_table_get( table, child_ino );

      if( child != NULL ) {
         type = fsrun_inode_entry_type( child );
      }

      rc = fsrun_readdir_append( dents, cursor, name, child_ino, type, offset );
      if( rc != 0 ) {
         return rc;
      }

      offset++;
   }

   return 0;
}

#endif
