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

// type to type string
void fsrun_test_type_to_string( int type, char type_buf[10] ) {

   switch( type ) {
      case FSRUN_ENTRY_TYPE_FILE:
         strcpy(type_buf, "FILE");
         break;

      case FSRUN_ENTRY_TYPE_DIR:
         strcpy(type_buf, "DIR ");
         break;

      case FSRUN_ENTRY_TYPE_FIFO:
         strcpy(type_buf, "FIFO");
         break;

      case FSRUN_ENTRY_TYPE_SOCK:
         strcpy(type_buf, "SOCK");
         break;

      case FSRUN_ENTRY_TYPE_CHR:
         strcpy(type_buf, "CHAR");
         break;

      case FSRUN_ENTRY_TYPE_BLK:
         strcpy(type_buf, "BLCK");
         break;

      case FSRUN_ENTRY_TYPE_LNK:
         strcpy(type_buf, "LINK");
         break;

      default:
         strcpy(type_buf, "UNKN");
         break;
   }
}

// print out a tree to the given file stream, breadth-first
int fsrun_test_print_tree( FILE* out, memfs_table const* table ) {

   char type_str[10];
   int rc = 0;

   vector< fsrun_ino_t > frontier;
   vector< string > frontier_paths;

   frontier.push_back( FSRUN_ROOT_INODE );
   frontier_paths.push_back( string("/") );

   while( frontier.size() > 0 ) {

      fsrun_ino_t ino = frontier[0];
      string next_path = frontier_paths[0];

      frontier.erase( frontier.begin() );
      frontier_paths.erase( frontier_paths.begin() );

      memfs_entry const* node = fsrun_inode_table_get( table, ino );
      if( node == NULL ) {
         fsrun_error("ERR: no inode %" PRIu64 " at '%s'\n", ino, next_path.c_str() );

         rc = -ENOENT;
         break;
      }

      struct fsrun_attrs attrs;
      fsrun_inode_entry_getattrs( node, &attrs );

      fsrun_test_type_to_string( fsrun_inode_entry_type( node ), type_str );

      fprintf( out, "%s: inode=%" PRIu64 " size=%" PRIu64 " mode=%o \"%s\"\n", type_str, ino, attrs.size, attrs.mode, next_path.c_str() );

      if( node->kind == FSRUN_INODE_DIR ) {

         struct fsrun_dir_iterator itr;
         char const* name = NULL;
         fsrun_ino_t child_ino = 0;

         rc = fsrun_inode_table_children( table, ino, &itr );
         if( rc != 0 ) {
            fsrun_error("fsrun_inode_table_children(%" PRIu64 ") rc = %d\n", ino, rc );
            break;
         }

         // explore children
         while( fsrun_dir_iterator_next( &itr, &name, &child_ino ) ) {

            frontier.push_back( child_ino );

            if( next_path == "/" ) {
               frontier_paths.push_back( next_path + name );
            }
            else {
               frontier_paths.push_back( next_path + "/" + name );
            }
         }
      }
   }

   return rc;
}


// begin a functional test: make a memfs with the demo tree
int fsrun_test_begin( struct memfs* fs ) {

   int rc = 0;

   rc = memfs_init( fs );
   if( rc != 0 ) {
      fsrun_error("memfs_init rc = %d\n", rc );
      return rc;
   }

   rc = memfs_populate( fs );
   if( rc != 0 ) {
      fsrun_error("memfs_populate rc = %d\n", rc );

      memfs_free( fs );
      return rc;
   }

   return rc;
}


// end a functional test
int fsrun_test_end( struct memfs* fs ) {

   int rc = 0;

   rc = memfs_free( fs );
   if( rc != 0 ) {
      fsrun_error("memfs_free rc = %d\n", rc );
   }

   return rc;
}

// make a binary tree of directories called L and R under parent/name
int fsrun_test_mkdir_LR_recursive( struct memfs* fs, fsrun_ino_t parent, char const* name, int depth ) {

   int rc = 0;
   fsrun_ino_t ino = 0;

   if( depth <= 0 ) {
      return 0;
   }

   fsrun_debug("mkdir(%" PRIu64 ", '%s')\n", parent, name );

   rc = memfs_mkdir( fs, parent, name, 0755, &ino );
   if( rc != 0 ) {
      fsrun_error("memfs_mkdir(%" PRIu64 ", '%s') rc = %d\n", parent, name, rc );
      return rc;
   }

   rc = fsrun_test_mkdir_LR_recursive( fs, ino, "L", depth - 1 );
   if( rc != 0 ) {
      fsrun_error("fsrun_test_mkdir_LR_recursive(%" PRIu64 ", 'L') rc = %d\n", ino, rc );
      return rc;
   }

   rc = fsrun_test_mkdir_LR_recursive( fs, ino, "R", depth - 1 );
   if( rc != 0 ) {
      fsrun_error("fsrun_test_mkdir_LR_recursive(%" PRIu64 ", 'R') rc = %d\n", ino, rc );
      return rc;
   }

   return 0;
}


// set up a scripted transport with no requests
int fsrun_test_transport_init( struct fsrun_test_transport* t ) {

   t->requests.clear();
   t->next = 0;
   t->replies.clear();

   t->recv_rc = 0;

   t->fail_reply_at = -1;
   t->fail_reply_rc = 0;

   t->mount_rc = 0;

   t->num_mounts = 0;
   t->num_unmounts = 0;
   t->mountpoint.clear();

   return 0;
}

// queue a request
int fsrun_test_push_request( struct fsrun_test_transport* t, struct fsrun_request const* req ) {

   t->requests.push_back( *req );
   return (int)t->requests.size() - 1;
}

static int fsrun_test_request_id( struct fsrun_request* req ) {
   return (int)(intptr_t)req->transport_data;
}

// start recording a reply.
// return NULL if this reply is supposed to fail
static struct fsrun_test_reply* fsrun_test_reply_new( struct fsrun_test_transport* t, struct fsrun_request* req, int type ) {

   struct fsrun_test_reply reply;
   int request_id = fsrun_test_request_id( req );

   if( request_id == t->fail_reply_at ) {
      return NULL;
   }

   reply.request_id = request_id;
   reply.type = type;
   reply.err = 0;
   reply.ino = 0;
   reply.size = 0;

   fsrun_lookup_init( &reply.lookup );
   fsrun_attrs_init( &reply.attrs, 0 );
   fsrun_open_file_init( &reply.open_file );

   t->replies.push_back( reply );

   return &t->replies.back();
}

static int fsrun_test_mount( void* cls, char const* mountpoint ) {

   struct fsrun_test_transport* t = (struct fsrun_test_transport*)cls;

   t->num_mounts++;

   if( mountpoint != NULL ) {
      t->mountpoint = string( mountpoint );
   }

   return t->mount_rc;
}

static int fsrun_test_unmount( void* cls ) {

   struct fsrun_test_transport* t = (struct fsrun_test_transport*)cls;

   t->num_unmounts++;

   return 0;
}

static int fsrun_test_recv( void* cls, struct fsrun_request* req ) {

   struct fsrun_test_transport* t = (struct fsrun_test_transport*)cls;

   if( t->next >= t->requests.size() ) {
      return t->recv_rc;
   }

   *req = t->requests[ t->next ];
   req->transport_data = (void*)(intptr_t)t->next;

   t->next++;

   return 1;
}

static int fsrun_test_reply_err( void* cls, struct fsrun_request* req, int err ) {

   struct fsrun_test_transport* t = (struct fsrun_test_transport*)cls;
   struct fsrun_test_reply* reply = fsrun_test_reply_new( t, req, FSRUN_TEST_REPLY_ERR );

   if( reply == NULL ) {
      return t->fail_reply_rc;
   }

   reply->err = err;
   return 0;
}

static int fsrun_test_reply_ok( void* cls, struct fsrun_request* req ) {

   struct fsrun_test_transport* t = (struct fsrun_test_transport*)cls;
   struct fsrun_test_reply* reply = fsrun_test_reply_new( t, req, FSRUN_TEST_REPLY_OK );

   if( reply == NULL ) {
      return t->fail_reply_rc;
   }

   return 0;
}

static int fsrun_test_reply_entry( void* cls, struct fsrun_request* req, struct fsrun_lookup const* lookup ) {

   struct fsrun_test_transport* t = (struct fsrun_test_transport*)cls;
   struct fsrun_test_reply* reply = fsrun_test_reply_new( t, req, FSRUN_TEST_REPLY_ENTRY );

   if( reply == NULL ) {
      return t->fail_reply_rc;
   }

   reply->lookup = *lookup;
   return 0;
}

static int fsrun_test_reply_attr( void* cls, struct fsrun_request* req, fsrun_ino_t ino, struct fsrun_attrs const* attrs ) {

   struct fsrun_test_transport* t = (struct fsrun_test_transport*)cls;
   struct fsrun_test_reply* reply = fsrun_test_reply_new( t, req, FSRUN_TEST_REPLY_ATTR );

   if( reply == NULL ) {
      return t->fail_reply_rc;
   }

   reply->ino = ino;
   reply->attrs = *attrs;
   return 0;
}

static int fsrun_test_reply_open( void* cls, struct fsrun_request* req, struct fsrun_open_file const* open_file ) {

   struct fsrun_test_transport* t = (struct fsrun_test_transport*)cls;
   struct fsrun_test_reply* reply = fsrun_test_reply_new( t, req, FSRUN_TEST_REPLY_OPEN );

   if( reply == NULL ) {
      return t->fail_reply_rc;
   }

   reply->open_file = *open_file;
   return 0;
}

static int fsrun_test_reply_buf( void* cls, struct fsrun_request* req, char const* buf, size_t len ) {

   struct fsrun_test_transport* t = (struct fsrun_test_transport*)cls;
   struct fsrun_test_reply* reply = fsrun_test_reply_new( t, req, FSRUN_TEST_REPLY_BUF );

   if( reply == NULL ) {
      return t->fail_reply_rc;
   }

   if( len > 0 ) {
      reply->data = string( buf, len );
   }

   return 0;
}

static int fsrun_test_reply_write( void* cls, struct fsrun_request* req, size_t count ) {

   struct fsrun_test_transport* t = (struct fsrun_test_transport*)cls;
   struct fsrun_test_reply* reply = fsrun_test_reply_new( t, req, FSRUN_TEST_REPLY_WRITE );

   if( reply == NULL ) {
      return t->fail_reply_rc;
   }

   reply->size = count;
   return 0;
}

static int fsrun_test_reply_xattr_size( void* cls, struct fsrun_request* req, size_t size ) {

   struct fsrun_test_transport* t = (struct fsrun_test_transport*)cls;
   struct fsrun_test_reply* reply = fsrun_test_reply_new( t, req, FSRUN_TEST_REPLY_XATTR_SIZE );

   if( reply == NULL ) {
      return t->fail_reply_rc;
   }

   reply->size = size;
   return 0;
}

// each entry is packed as a whole struct fsrun_dir_entry
static size_t fsrun_test_add_direntry( void* cls, struct fsrun_request* req, char* buf, size_t bufsize, struct fsrun_dir_entry const* dent ) {

   size_t len = sizeof(struct fsrun_dir_entry);

   if( len <= bufsize ) {
      memcpy( buf, dent, len );
   }

   return len;
}

// get the scripted transport's methods
int fsrun_test_transport_ops( struct fsrun_transport_ops* ops ) {

   memset( ops, 0, sizeof(struct fsrun_transport_ops) );

   ops->mount = fsrun_test_mount;
   ops->unmount = fsrun_test_unmount;
   ops->recv = fsrun_test_recv;
   ops->reply_err = fsrun_test_reply_err;
   ops->reply_ok = fsrun_test_reply_ok;
   ops->reply_entry = fsrun_test_reply_entry;
   ops->reply_attr = fsrun_test_reply_attr;
   ops->reply_open = fsrun_test_reply_open;
   ops->reply_buf = fsrun_test_reply_buf;
   ops->reply_write = fsrun_test_reply_write;
   ops->reply_xattr_size = fsrun_test_reply_xattr_size;
   ops->add_direntry = fsrun_test_add_direntry;

   return 0;
}

// serve every queued request with a fresh runner
// return the runner's result
int fsrun_test_run( struct fsrun_operations const* ops, void* fs, struct fsrun_test_transport* t ) {

   int rc = 0;
   int run_rc = 0;
   struct fsrun_runner runner;
   struct fsrun_transport_ops transport;

   fsrun_test_transport_ops( &transport );

   rc = fsrun_runner_init( &runner, "/tmp/fsrun-test", ops, fs );
   if( rc != 0 ) {
      fsrun_error("fsrun_runner_init rc = %d\n", rc );
      return rc;
   }

   rc = fsrun_runner_set_transport( &runner, &transport, t );
   if( rc != 0 ) {
      fsrun_error("fsrun_runner_set_transport rc = %d\n", rc );

      fsrun_runner_free( &runner, NULL );
      return rc;
   }

   run_rc = fsrun_runner_run( &runner );

   rc = fsrun_runner_free( &runner, NULL );
   if( rc != 0 ) {
      fsrun_error("fsrun_runner_free rc = %d\n", rc );
      return rc;
   }

   return run_rc;
}

// get the reply to a request, or NULL if there is none
struct fsrun_test_reply const* fsrun_test_reply_for( struct fsrun_test_transport* t, int request_id ) {

   for( unsigned int i = 0; i < t->replies.size(); i++ ) {

      if( t->replies[i].request_id == request_id ) {
         return &t->replies[i];
      }
   }

   return NULL;
}

// check that a request was answered with the given errno
// return 0 if so, -EINVAL if not
int fsrun_test_expect_err( struct fsrun_test_transport* t, int request_id, int err ) {

   struct fsrun_test_reply const* reply = fsrun_test_reply_for( t, request_id );

   if( reply == NULL ) {
      fsrun_error("request %d: no reply\n", request_id );
      return -EINVAL;
   }

   if( reply->type != FSRUN_TEST_REPLY_ERR || reply->err != err ) {
      fsrun_error("request %d (%s): reply type %d err %d, expected error %d\n", request_id, fsrun_op_name( t->requests[request_id].op ), reply->type, reply->err, err );
      return -EINVAL;
   }

   return 0;
}

// check that every received request got exactly one reply, in order
// return 0 if so, -EINVAL if not
int fsrun_test_check_replies( struct fsrun_test_transport* t ) {

   if( t->replies.size() != t->next ) {
      fsrun_error("%zu requests received, but %zu replies sent\n", t->next, t->replies.size() );
      return -EINVAL;
   }

   for( unsigned int i = 0; i < t->replies.size(); i++ ) {

      if( t->replies[i].request_id != (int)i ) {
         fsrun_error("reply %u answers request %d\n", i, t->replies[i].request_id );
         return -EINVAL;
      }
   }

   return 0;
}
