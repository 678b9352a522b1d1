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

#include "common.h"

// look up a path with both lookup and lookup_mut, and check that they agree
// return the inode on success, 0 on failure (*err is set)
static fsrun_ino_t lookup_both( memfs_table* table, char const* path, int* err ) {

   fsrun_ino_t ino = 0;
   fsrun_ino_t ino_mut = 0;
   int err_mut = 0;

   memfs_entry const* ent = fsrun_inode_table_lookup( (memfs_table const*)table, path, &ino, err );
   memfs_entry* ent_mut = fsrun_inode_table_lookup_mut( table, path, &ino_mut, &err_mut );

   if( *err != err_mut ) {
      fsrun_error("lookup('%s'): err %d != lookup_mut err %d\n", path, *err, err_mut );
      exit(1);
   }

   if( ent != (memfs_entry const*)ent_mut ) {
      fsrun_error("lookup('%s'): entry %p != lookup_mut entry %p\n", path, ent, ent_mut );
      exit(1);
   }

   if( ent == NULL ) {
      return 0;
   }

   if( ino != ino_mut ) {
      fsrun_error("lookup('%s'): inode %" PRIu64 " != lookup_mut inode %" PRIu64 "\n", path, ino, ino_mut );
      exit(1);
   }

   return ino;
}

static void expect_lookup( memfs_table* table, char const* path, fsrun_ino_t expected ) {

   int err = 0;
   fsrun_ino_t ino = lookup_both( table, path, &err );

   if( err != 0 || ino != expected ) {
      fsrun_error("lookup('%s') = %" PRIu64 " (err %d), expected %" PRIu64 "\n", path, ino, err, expected );
      exit(1);
   }
}

static void expect_lookup_err( memfs_table* table, char const* path, int expected_err ) {

   int err = 0;
   fsrun_ino_t ino = lookup_both( table, path, &err );

   if( ino != 0 || err != expected_err ) {
      fsrun_error("lookup('%s') = %" PRIu64 " (err %d), expected err %d\n", path, ino, err, expected_err );
      exit(1);
   }
}

static void expect_push_err( struct memfs* fs, fsrun_ino_t parent, char const* name, int expected_err ) {

   size_t count = fsrun_inode_table_count( &fs->table );
   fsrun_ino_t next_ino = fs->table.next_ino;
   fsrun_ino_t ino = 0;

   struct memfs_file* file = new memfs_file();
   fsrun_attrs_init( &file->attrs, S_IFREG | 0644 );

   int rc = fsrun_inode_table_push_file( &fs->table, parent, name, file, &ino );
   if( rc != expected_err ) {
      fsrun_error("push_file(%" PRIu64 ", '%s') rc = %d, expected %d\n", parent, name, rc, expected_err );
      exit(1);
   }

   // table is unchanged, and the payload is still ours
   if( fsrun_inode_table_count( &fs->table ) != count || fs->table.next_ino != next_ino ) {
      fsrun_error("push_file(%" PRIu64 ", '%s') failed, but changed the table\n", parent, name );
      exit(1);
   }

   delete file;
}

// path splitting and child-name rules
static void test_paths() {

   int rc = 0;
   vector<string> names;

   rc = fsrun_path_split( "//a/./b//c/", &names );
   if( rc != 0 || names.size() != 3 || names[0] != "a" || names[1] != "b" || names[2] != "c" ) {
      fsrun_error("fsrun_path_split rc = %d, %zu names\n", rc, names.size() );
      exit(1);
   }

   rc = fsrun_path_split( "/./", &names );
   if( rc != 0 || names.size() != 0 ) {
      fsrun_error("fsrun_path_split('/./') rc = %d, %zu names\n", rc, names.size() );
      exit(1);
   }

   rc = fsrun_path_split( "a/../b", &names );
   if( rc != 0 || names.size() != 3 || names[1] != ".." ) {
      fsrun_error("fsrun_path_split('a/../b') rc = %d, %zu names\n", rc, names.size() );
      exit(1);
   }

   if( fsrun_path_split( NULL, &names ) != -EINVAL ) {
      fsrun_error("%s", "fsrun_path_split(NULL) succeeded\n");
      exit(1);
   }

   if( fsrun_name_check( "ok" ) != 0 || fsrun_name_check( "" ) != -EINVAL || fsrun_name_check( "." ) != -EINVAL ||
       fsrun_name_check( ".." ) != -EINVAL || fsrun_name_check( "a/b" ) != -EINVAL || fsrun_name_check( "..." ) != 0 ) {
      fsrun_error("%s", "bad fsrun_name_check\n");
      exit(1);
   }
}

// a directory's own view of its children
static void test_directory() {

   int rc = 0;
   struct memfs fs;
   fsrun_ino_t b_ino = 0;
   fsrun_ino_t ino = 0;

   rc = memfs_init( &fs );
   if( rc != 0 ) {
      fsrun_error("memfs_init rc = %d\n", rc );
      exit(1);
   }

   if( memfs_mkdir( &fs, FSRUN_ROOT_INODE, "a", 0755, NULL ) != 0 ||
       memfs_mkdir( &fs, FSRUN_ROOT_INODE, "b", 0700, &b_ino ) != 0 ||
       memfs_mkfile( &fs, FSRUN_ROOT_INODE, "c", 0644, "x", 1, NULL ) != 0 ) {
      exit(1);
   }

   struct fsrun_directory const* root = fsrun_inode_entry_as_dir( fsrun_inode_table_get( &fs.table, FSRUN_ROOT_INODE ) );

   if( fsrun_directory_count( root ) != 3 ) {
      fsrun_error("root has %zu children\n", fsrun_directory_count( root ) );
      exit(1);
   }

   rc = fsrun_directory_get( root, "b", &ino );
   if( rc != 0 || ino != b_ino ) {
      fsrun_error("fsrun_directory_get('b') rc = %d, ino = %" PRIu64 "\n", rc, ino );
      exit(1);
   }

   rc = fsrun_directory_get( root, "zz", &ino );
   if( rc != -ENOENT ) {
      fsrun_error("fsrun_directory_get('zz') rc = %d\n", rc );
      exit(1);
   }

   struct fsrun_directory const* b = fsrun_inode_entry_as_dir( fsrun_inode_table_get( &fs.table, b_ino ) );
   if( b->attrs.mode != (S_IFDIR | 0700) || b->attrs.nlink != 2 || fsrun_directory_count( b ) != 0 ) {
      fsrun_error("%s", "bad new directory\n");
      exit(1);
   }

   memfs_free( &fs );
}

// inode numbers never wrap around
static void test_exhaustion() {

   int rc = 0;
   struct memfs fs;
   fsrun_ino_t ino = 0;

   rc = memfs_init( &fs );
   if( rc != 0 ) {
      fsrun_error("memfs_init rc = %d\n", rc );
      exit(1);
   }

   fs.table.next_ino = UINT64_MAX - 1;

   rc = memfs_mkdir( &fs, FSRUN_ROOT_INODE, "last", 0755, &ino );
   if( rc != 0 || ino != UINT64_MAX - 1 ) {
      fsrun_error("memfs_mkdir('last') rc = %d, ino = %" PRIu64 "\n", rc, ino );
      exit(1);
   }

   size_t count = fsrun_inode_table_count( &fs.table );
   fsrun_ino_t next_ino = fs.table.next_ino;

   // quiet the expected error message
   int error_level = fsrun_get_error_level();
   fsrun_set_error_level( 0 );

   rc = memfs_mkfile( &fs, FSRUN_ROOT_INODE, "one-too-many", 0644, "x", 1, &ino );

   fsrun_set_error_level( error_level );

   if( rc != -ENOSPC ) {
      fsrun_error("memfs_mkfile('one-too-many') rc = %d\n", rc );
      exit(1);
   }

   if( fsrun_inode_table_count( &fs.table ) != count || fs.table.next_ino != next_ino ) {
      fsrun_error("table changed: %zu entries (expected %zu), next inode %" PRIu64 " (expected %" PRIu64 ")\n",
                  fsrun_inode_table_count( &fs.table ), count, fs.table.next_ino, next_ino );
      exit(1);
   }

   int err = 0;
   if( fsrun_inode_table_lookup( &fs.table, "/one-too-many", &ino, &err ) != NULL || err != -ENOENT ) {
      fsrun_error("'/one-too-many' resolved, err = %d\n", err );
      exit(1);
   }

   memfs_free( &fs );
}


int main( int argc, char** argv ) {

   int rc = 0;
   struct memfs fs;
   fsrun_ino_t dir_ino = 0;
   fsrun_ino_t sub_ino = 0;
   fsrun_ino_t file_ino = 0;
   fsrun_ino_t last_ino = 0;
   char long_name[FSRUN_FILESYSTEM_NAMEMAX + 2];

   test_paths();
   test_directory();
   test_exhaustion();

   rc = memfs_init( &fs );
   if( rc != 0 ) {
      fsrun_error("memfs_init rc = %d\n", rc );
      exit(1);
   }

   // root exists, is a directory, and has no parent
   memfs_entry const* root = fsrun_inode_table_get( &fs.table, FSRUN_ROOT_INODE );
   if( root == NULL || root->has_parent || root->kind != FSRUN_INODE_DIR || fsrun_inode_entry_as_dir( root ) == NULL ) {
      fsrun_error("%s", "bad root\n");
      exit(1);
   }

   if( fsrun_inode_table_count( &fs.table ) != 1 ) {
      fsrun_error("fresh table has %zu entries\n", fsrun_inode_table_count( &fs.table ) );
      exit(1);
   }

   if( fsrun_inode_table_get( &fs.table, 2 ) != NULL ) {
      fsrun_error("%s", "inode 2 exists in a fresh table\n");
      exit(1);
   }

   // insert
   rc = memfs_mkdir( &fs, FSRUN_ROOT_INODE, "dir", 0750, &dir_ino );
   if( rc != 0 ) {
      fsrun_error("memfs_mkdir('dir') rc = %d\n", rc );
      exit(1);
   }

   rc = memfs_mkdir( &fs, dir_ino, "sub", 0755, &sub_ino );
   if( rc != 0 ) {
      fsrun_error("memfs_mkdir('sub') rc = %d\n", rc );
      exit(1);
   }

   rc = memfs_mkfile( &fs, dir_ino, "file", 0644, "abc", 3, &file_ino );
   if( rc != 0 ) {
      fsrun_error("memfs_mkfile('file') rc = %d\n", rc );
      exit(1);
   }

   if( !(FSRUN_ROOT_INODE < dir_ino && dir_ino < sub_ino && sub_ino < file_ino) ) {
      fsrun_error("inodes not increasing: %" PRIu64 " %" PRIu64 " %" PRIu64 "\n", dir_ino, sub_ino, file_ino );
      exit(1);
   }

   // get and get_mut agree, and the entries are wired up
   memfs_entry const* file_ent = fsrun_inode_table_get( &fs.table, file_ino );
   memfs_entry* file_ent_mut = fsrun_inode_table_get_mut( &fs.table, file_ino );

   if( file_ent == NULL || file_ent != (memfs_entry const*)file_ent_mut ) {
      fsrun_error("get(%" PRIu64 ") = %p, get_mut = %p\n", file_ino, file_ent, file_ent_mut );
      exit(1);
   }

   if( !file_ent->has_parent || file_ent->parent != dir_ino || fsrun_inode_entry_as_file( file_ent ) == NULL || fsrun_inode_entry_as_dir( file_ent ) != NULL ) {
      fsrun_error("%s", "bad file entry\n");
      exit(1);
   }

   if( fsrun_inode_entry_as_file( file_ent )->data.size() != 3 || fsrun_inode_entry_type( file_ent ) != FSRUN_ENTRY_TYPE_FILE ) {
      fsrun_error("%s", "bad file payload\n");
      exit(1);
   }

   struct fsrun_attrs attrs;
   fsrun_inode_entry_getattrs( fsrun_inode_table_get( &fs.table, dir_ino ), &attrs );
   if( attrs.mode != (S_IFDIR | 0750) || attrs.size != FSRUN_ATTRS_DEFAULT_SIZE ) {
      fsrun_error("dir mode %o size %" PRIu64 "\n", attrs.mode, attrs.size );
      exit(1);
   }

   // lookups
   expect_lookup( &fs.table, "", FSRUN_ROOT_INODE );
   expect_lookup( &fs.table, "/", FSRUN_ROOT_INODE );
   expect_lookup( &fs.table, "dir", dir_ino );
   expect_lookup( &fs.table, "/dir", dir_ino );
   expect_lookup( &fs.table, "dir/sub", sub_ino );
   expect_lookup( &fs.table, "/dir/sub", sub_ino );
   expect_lookup( &fs.table, "/dir/sub/", sub_ino );
   expect_lookup( &fs.table, "//dir//sub", sub_ino );
   expect_lookup( &fs.table, "/./dir/./file", file_ino );
   expect_lookup( &fs.table, "dir/file", file_ino );

   expect_lookup_err( &fs.table, "/nope", -ENOENT );
   expect_lookup_err( &fs.table, "/dir/nope", -ENOENT );
   expect_lookup_err( &fs.table, "/dir/sub/nope/deeper", -ENOENT );
   expect_lookup_err( &fs.table, "/dir/file/x", -ENOTDIR );
   expect_lookup_err( &fs.table, "/dir/..", -ENOENT );
   expect_lookup_err( &fs.table, "/DIR", -ENOENT );

   // bad inserts leave the table alone
   memset( long_name, 'x', sizeof(long_name) );
   long_name[ FSRUN_FILESYSTEM_NAMEMAX + 1 ] = '\0';

   expect_push_err( &fs, 999, "orphan", -ENOENT );
   expect_push_err( &fs, file_ino, "child", -ENOTDIR );
   expect_push_err( &fs, dir_ino, "file", -EEXIST );
   expect_push_err( &fs, dir_ino, "sub", -EEXIST );
   expect_push_err( &fs, dir_ino, "", -EINVAL );
   expect_push_err( &fs, dir_ino, ".", -EINVAL );
   expect_push_err( &fs, dir_ino, "..", -EINVAL );
   expect_push_err( &fs, dir_ino, "a/b", -EINVAL );
   expect_push_err( &fs, dir_ino, long_name, -ENAMETOOLONG );

   // names are bytes: case matters
   rc = memfs_mkfile( &fs, dir_ino, "FILE", 0644, "", 0, NULL );
   if( rc != 0 ) {
      fsrun_error("memfs_mkfile('FILE') rc = %d\n", rc );
      exit(1);
   }

   // children come out in name order
   struct fsrun_dir_iterator itr;
   char const* name = NULL;
   fsrun_ino_t child_ino = 0;
   vector<string> names;

   rc = fsrun_inode_table_children( &fs.table, dir_ino, &itr );
   if( rc != 0 ) {
      fsrun_error("fsrun_inode_table_children rc = %d\n", rc );
      exit(1);
   }

   while( fsrun_dir_iterator_next( &itr, &name, &child_ino ) ) {
      names.push_back( string(name) );
   }

   if( names.size() != 3 || names[0] != "FILE" || names[1] != "file" || names[2] != "sub" ) {
      fsrun_error("children of %" PRIu64 " out of order\n", dir_ino );
      exit(1);
   }

   rc = fsrun_inode_table_children( &fs.table, file_ino, &itr );
   if( rc != -ENOTDIR ) {
      fsrun_error("fsrun_inode_table_children(file) rc = %d\n", rc );
      exit(1);
   }

   rc = fsrun_inode_table_children( &fs.table, 999, &itr );
   if( rc != -ENOENT ) {
      fsrun_error("fsrun_inode_table_children(999) rc = %d\n", rc );
      exit(1);
   }

   // lots of inserts: every new inode is bigger than all before it
   last_ino = fs.table.next_ino - 1;

   rc = fsrun_test_mkdir_LR_recursive( &fs, sub_ino, "tree", 6 );
   if( rc != 0 ) {
      fsrun_error("fsrun_test_mkdir_LR_recursive rc = %d\n", rc );
      exit(1);
   }

   expect_lookup( &fs.table, "/dir/sub/tree", last_ino + 1 );
   expect_lookup( &fs.table, "/dir/sub/tree/L", last_ino + 2 );
   expect_lookup( &fs.table, "/dir/sub/tree/L/L/L/L/L", last_ino + 6 );

   if( fsrun_inode_table_count( &fs.table ) != 5 + 63 ) {
      fsrun_error("table has %zu entries\n", fsrun_inode_table_count( &fs.table ) );
      exit(1);
   }

   // apply attributes through an entry
   struct fsrun_set_attrs set;
   fsrun_set_attrs_init( &set );
   set.valid = FSRUN_SET_ATTR_UID;
   set.uid = 4321;

   rc = fsrun_inode_entry_apply_attrs( fsrun_inode_table_get_mut( &fs.table, sub_ino ), &set, &attrs );
   if( rc != 0 || attrs.uid != 4321 ) {
      fsrun_error("fsrun_inode_entry_apply_attrs rc = %d, uid = %d\n", rc, (int)attrs.uid );
      exit(1);
   }

   fsrun_inode_entry_getattrs( fsrun_inode_table_get( &fs.table, sub_ino ), &attrs );
   if( attrs.uid != 4321 ) {
      fsrun_error("uid of %" PRIu64 " is %d\n", sub_ino, (int)attrs.uid );
      exit(1);
   }

   rc = fsrun_test_print_tree( stdout, &fs.table );
   if( rc != 0 ) {
      fsrun_error("fsrun_test_print_tree rc = %d\n", rc );
      exit(1);
   }

   memfs_free( &fs );

   return 0;
}
