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

#include <fsrun/runner.h>
#include <fsrun/error.h>
#include "util.h"

static char const* FSRUN_OP_NAMES[] = {
   "unsupported",
   "lookup",
   "getattr",
   "setattr",
   "open",
   "opendir",
   "setxattr",
   "getxattr",
   "listxattr",
   "readdir",
   "readdirplus",
   "read",
   "write"
};

// name of a decoded operation
char const* fsrun_op_name( int op ) {

   if( op < 0 || op > FSRUN_OP_WRITE ) {
      return "unknown";
   }

   return FSRUN_OP_NAMES[op];
}

// set up an empty request
int fsrun_request_init( struct fsrun_request* req, int op ) {

   memset( req, 0, sizeof(struct fsrun_request) );

   req->op = op;
   fsrun_set_attrs_init( &req->set_attrs );

   return 0;
}

static char const* fsrun_request_name( struct fsrun_request* req ) {

   if( req->op_name != NULL ) {
      return req->op_name;
   }

   return fsrun_op_name( req->op );
}


// set up a runner for a backend.
// mountpoint may be NULL if the transport does not need one.
// ops is copied; a NULL ops means the backend implements nothing.
// return 0 on success
// return -ENOMEM if OOM
int fsrun_runner_init( struct fsrun_runner* runner, char const* mountpoint, struct fsrun_operations const* ops, void* fs_data ) {

   int rc = 0;

   memset( runner, 0, sizeof(struct fsrun_runner) );

   if( mountpoint != NULL ) {

      runner->mountpoint = strdup( mountpoint );
      if( runner->mountpoint == NULL ) {
         return -ENOMEM;
      }
   }

   if( ops != NULL ) {
      runner->ops = *ops;
   }
   else {
      fsrun_operations_init( &runner->ops );
   }

   runner->fs_data = fs_data;

   rc = pthread_mutex_init( &runner->lock, NULL );
   if( rc != 0 ) {

      safe_free( runner->mountpoint );
      return -rc;
   }

   return 0;
}


// attach a transport.
// recv, every reply_* method, and add_direntry are required.
// return 0 on success
// return -EINVAL if the transport is missing a required method
// return -EBUSY if the runner is serving requests
int fsrun_runner_set_transport( struct fsrun_runner* runner, struct fsrun_transport_ops const* transport, void* transport_cls ) {

   if( transport->recv == NULL || transport->reply_err == NULL || transport->reply_ok == NULL ||
       transport->reply_entry == NULL || transport->reply_attr == NULL || transport->reply_open == NULL ||
       transport->reply_buf == NULL || transport->reply_write == NULL || transport->reply_xattr_size == NULL ||
       transport->add_direntry == NULL ) {

      fsrun_error("%s", "Transport is missing required methods\n");
      return -EINVAL;
   }

   pthread_mutex_lock( &runner->lock );

   if( runner->running || runner->thread_started ) {

      pthread_mutex_unlock( &runner->lock );
      return -EBUSY;
   }

   runner->transport = *transport;
   runner->transport_cls = transport_cls;
   runner->has_transport = true;

   pthread_mutex_unlock( &runner->lock );

   return 0;
}


// free a runner, and give back the backend state if fs_data is not NULL.
// the transport is not freed.
// return 0 on success
// return -EBUSY if the runner is still serving requests, or has not been joined
int fsrun_runner_free( struct fsrun_runner* runner, void** fs_data ) {

   pthread_mutex_lock( &runner->lock );

   if( runner->running || runner->thread_started ) {

      pthread_mutex_unlock( &runner->lock );
      return -EBUSY;
   }

   pthread_mutex_unlock( &runner->lock );

   if( fs_data != NULL ) {
      *fs_data = runner->fs_data;
   }

   safe_free( runner->mountpoint );
   pthread_mutex_destroy( &runner->lock );

   memset( runner, 0, sizeof(struct fsrun_runner) );

   return 0;
}


// send an error reply for a failed operation.
// rc is the operation's (negative) return code
// return 0 if the reply was sent
// return negative if the transport failed
static int fsrun_runner_reply_err( struct fsrun_runner* runner, struct fsrun_request* req, int rc ) {

   int err = fsrun_reply_errno( rc );

   rc = runner->transport.reply_err( runner->transport_cls, req, err );
   if( rc != 0 ) {
      fsrun_error("reply_err(%s, %d) rc = %d\n", fsrun_request_name( req ), err, rc );
   }

   return rc;
}

// log a failed operation and reply with its error
static int fsrun_runner_fail( struct fsrun_runner* runner, struct fsrun_request* req, int rc ) {

   fsrun_warn("%s(%" PRIu64 ") rc = %d\n", fsrun_request_name( req ), req->ino, rc );

   return fsrun_runner_reply_err( runner, req, rc );
}

// log the result of sending a reply
static int fsrun_runner_replied( struct fsrun_request* req, int rc ) {

   if( rc != 0 ) {
      fsrun_error("reply to %s(%" PRIu64 ") rc = %d\n", fsrun_request_name( req ), req->ino, rc );
   }

   return rc;
}


static int fsrun_runner_lookup( struct fsrun_runner* runner, struct fsrun_request* req ) {

   int rc = 0;
   struct fsrun_lookup out;

   fsrun_lookup_init( &out );

   rc = runner->ops.lookup( runner->fs_data, req->ino, req->name, &out );
   if( rc != 0 ) {

      fsrun_warn("lookup(%" PRIu64 ", '%s') rc = %d\n", req->ino, req->name, rc );
      return fsrun_runner_reply_err( runner, req, rc );
   }

   rc = runner->transport.reply_entry( runner->transport_cls, req, &out );
   return fsrun_runner_replied( req, rc );
}


static int fsrun_runner_getattr( struct fsrun_runner* runner, struct fsrun_request* req ) {

   int rc = 0;
   struct fsrun_attrs attrs;

   memset( &attrs, 0, sizeof(struct fsrun_attrs) );

   rc = runner->ops.getattr( runner->fs_data, req->ino, &attrs );
   if( rc != 0 ) {
      return fsrun_runner_fail( runner, req, rc );
   }

   rc = runner->transport.reply_attr( runner->transport_cls, req, req->ino, &attrs );
   return fsrun_runner_replied( req, rc );
}


static int fsrun_runner_setattr( struct fsrun_runner* runner, struct fsrun_request* req ) {

   int rc = 0;
   struct fsrun_attrs attrs;

   memset( &attrs, 0, sizeof(struct fsrun_attrs) );

   rc = runner->ops.setattr( runner->fs_data, req->ino, &req->set_attrs, &attrs );
   if( rc != 0 ) {
      return fsrun_runner_fail( runner, req, rc );
   }

   rc = runner->transport.reply_attr( runner->transport_cls, req, req->ino, &attrs );
   return fsrun_runner_replied( req, rc );
}


// open or opendir
static int fsrun_runner_open( struct fsrun_runner* runner, struct fsrun_request* req ) {

   int rc = 0;
   struct fsrun_open_file out;

   fsrun_open_file_init( &out );

   if( req->op == FSRUN_OP_OPENDIR ) {
      rc = runner->ops.opendir( runner->fs_data, req->ino, req->flags, &out );
   }
   else {
      rc = runner->ops.open( runner->fs_data, req->ino, req->flags, &out );

      // only meaningful for directories
      out.cache_dir = false;
   }

   if( rc != 0 ) {
      return fsrun_runner_fail( runner, req, rc );
   }

   rc = runner->transport.reply_open( runner->transport_cls, req, &out );
   return fsrun_runner_replied( req, rc );
}


static int fsrun_runner_setxattr( struct fsrun_runner* runner, struct fsrun_request* req ) {

   int rc = 0;
   int flags = 0;

   rc = fsrun_xattr_flags_decode( req->flags, &flags );
   if( rc != 0 ) {

      fsrun_warn("setxattr(%" PRIu64 ", '%s'): invalid flags %X\n", req->ino, req->name, req->flags );
      return fsrun_runner_reply_err( runner, req, rc );
   }

   rc = runner->ops.setxattr( runner->fs_data, req->ino, req->name, req->buf, req->size, flags );
   if( rc != 0 ) {

      fsrun_warn("setxattr(%" PRIu64 ", '%s') rc = %d\n", req->ino, req->name, rc );
      return fsrun_runner_reply_err( runner, req, rc );
   }

   rc = runner->transport.reply_ok( runner->transport_cls, req );
   return fsrun_runner_replied( req, rc );
}


// getxattr or listxattr.
// a zero-size request only wants the length.
static int fsrun_runner_xattr( struct fsrun_runner* runner, struct fsrun_request* req ) {

   int rc = 0;
   ssize_t len = 0;
   char* value = NULL;

   if( req->size > 0 ) {

      value = CALLOC_LIST( char, req->size );
      if( value == NULL ) {
         return fsrun_runner_fail( runner, req, -ENOMEM );
      }
   }

   if( req->op == FSRUN_OP_GETXATTR ) {
      len = runner->ops.getxattr( runner->fs_data, req->ino, req->name, value, req->size );
   }
   else {
      len = runner->ops.listxattr( runner->fs_data, req->ino, value, req->size );
   }

   if( len < 0 ) {

      safe_free( value );
      return fsrun_runner_fail( runner, req, (int)len );
   }

   if( req->size == 0 ) {

      // size query
      rc = runner->transport.reply_xattr_size( runner->transport_cls, req, (size_t)len );
   }
   else if( (size_t)len > req->size ) {

      fsrun_warn("%s(%" PRIu64 "): %zd bytes do not fit in %zu\n", fsrun_request_name( req ), req->ino, len, req->size );
      safe_free( value );
      return fsrun_runner_reply_err( runner, req, -ERANGE );
   }
   else {

      rc = runner->transport.reply_buf( runner->transport_cls, req, value, (size_t)len );
   }

   safe_free( value );
   return fsrun_runner_replied( req, rc );
}


// list a directory, and pack as many entries as fit into the requested size
static int fsrun_runner_readdir( struct fsrun_runner* runner, struct fsrun_request* req ) {

   int rc = 0;
   char* buf = NULL;
   size_t used = 0;
   fsrun_dir_entry_list* dents = NULL;

   dents = safe_new( fsrun_dir_entry_list );
   if( dents == NULL ) {
      return fsrun_runner_fail( runner, req, -ENOMEM );
   }

   rc = runner->ops.readdir( runner->fs_data, req->ino, (uint64_t)req->offset, dents );
   if( rc != 0 ) {

      safe_delete( dents );
      return fsrun_runner_fail( runner, req, rc );
   }

   if( req->size > 0 ) {

      buf = CALLOC_LIST( char, req->size );
      if( buf == NULL ) {

         safe_delete( dents );
         return fsrun_runner_fail( runner, req, -ENOMEM );
      }

      for( unsigned int i = 0; i < dents->size(); i++ ) {

         size_t len = runner->transport.add_direntry( runner->transport_cls, req, buf + used, req->size - used, &dents->at(i) );
         if( len > req->size - used ) {
            // full
            break;
         }

         used += len;
      }
   }

   rc = runner->transport.reply_buf( runner->transport_cls, req, buf, used );

   safe_free( buf );
   safe_delete( dents );

   return fsrun_runner_replied( req, rc );
}


static int fsrun_runner_read( struct fsrun_runner* runner, struct fsrun_request* req ) {

   int rc = 0;
   ssize_t num_read = 0;
   char* buf = NULL;

   if( req->size > 0 ) {

      buf = CALLOC_LIST( char, req->size );
      if( buf == NULL ) {
         return fsrun_runner_fail( runner, req, -ENOMEM );
      }
   }

   num_read = runner->ops.read( runner->fs_data, req->ino, buf, req->size, req->offset );
   if( num_read < 0 ) {

      safe_free( buf );
      return fsrun_runner_fail( runner, req, (int)num_read );
   }

   if( (size_t)num_read > req->size ) {

      fsrun_error("BUG: read(%" PRIu64 ") returned %zd bytes, but only %zu were requested\n", req->ino, num_read, req->size );
      safe_free( buf );
      return fsrun_runner_reply_err( runner, req, -EIO );
   }

   rc = runner->transport.reply_buf( runner->transport_cls, req, buf, (size_t)num_read );

   safe_free( buf );
   return fsrun_runner_replied( req, rc );
}


static int fsrun_runner_write( struct fsrun_runner* runner, struct fsrun_request* req ) {

   int rc = 0;
   ssize_t num_written = 0;

   num_written = runner->ops.write( runner->fs_data, req->ino, req->buf, req->size, req->offset );
   if( num_written < 0 ) {
      return fsrun_runner_fail( runner, req, (int)num_written );
   }

   if( (size_t)num_written > req->size ) {

      fsrun_error("BUG: write(%" PRIu64 ") wrote %zd bytes, but was only given %zu\n", req->ino, num_written, req->size );
      return fsrun_runner_reply_err( runner, req, -EIO );
   }

   rc = runner->transport.reply_write( runner->transport_cls, req, (size_t)num_written );
   return fsrun_runner_replied( req, rc );
}


// answer one request: call the backend, and send back its result or its error.
// operations the backend does not implement, unsupported operations, and readdirplus
// are answered with ENOSYS without calling the backend.
// return 0 if the request was answered (successfully or not)
// return negative if the reply could not be sent
int fsrun_runner_dispatch( struct fsrun_runner* runner, struct fsrun_request* req ) {

   fsrun_debug("%s(%" PRIu64 ")\n", fsrun_request_name( req ), req->ino );

   switch( req->op ) {

      case FSRUN_OP_LOOKUP:
         if( runner->ops.lookup != NULL ) {
            return fsrun_runner_lookup( runner, req );
         }
         break;

      case FSRUN_OP_GETATTR:
         if( runner->ops.getattr != NULL ) {
            return fsrun_runner_getattr( runner, req );
         }
         break;

      case FSRUN_OP_SETATTR:
         if( runner->ops.setattr != NULL ) {
            return fsrun_runner_setattr( runner, req );
         }
         break;

      case FSRUN_OP_OPEN:
         if( runner->ops.open != NULL ) {
            return fsrun_runner_open( runner, req );
         }
         break;

      case FSRUN_OP_OPENDIR:
         if( runner->ops.opendir != NULL ) {
            return fsrun_runner_open( runner, req );
         }
         break;

      case FSRUN_OP_SETXATTR:
         if( runner->ops.setxattr != NULL ) {
            return fsrun_runner_setxattr( runner, req );
         }
         break;

      case FSRUN_OP_GETXATTR:
         if( runner->ops.getxattr != NULL ) {
            return fsrun_runner_xattr( runner, req );
         }
         break;

      case FSRUN_OP_LISTXATTR:
         if( runner->ops.listxattr != NULL ) {
            return fsrun_runner_xattr( runner, req );
         }
         break;

      case FSRUN_OP_READDIR:
         if( runner->ops.readdir != NULL ) {
            return fsrun_runner_readdir( runner, req );
         }
         break;

      case FSRUN_OP_READ:
         if( runner->ops.read != NULL ) {
            return fsrun_runner_read( runner, req );
         }
         break;

      case FSRUN_OP_WRITE:
         if( runner->ops.write != NULL ) {
            return fsrun_runner_write( runner, req );
         }
         break;

      default:
         // unsupported, or readdirplus
         break;
   }

   fsrun_debug("%s: not implemented\n", fsrun_request_name( req ) );

   return fsrun_runner_reply_err( runner, req, FSRUN_ERR_NOT_IMPLEMENTED );
}


// receive and answer requests until the transport closes or fails
static int fsrun_runner_loop( struct fsrun_runner* runner ) {

   int rc = 0;
   struct fsrun_request req;

   while( true ) {

      fsrun_request_init( &req, FSRUN_OP_UNSUPPORTED );

      rc = runner->transport.recv( runner->transport_cls, &req );
      if( rc == 0 ) {

         fsrun_debug("%s", "End of requests\n");
         return 0;
      }

      if( rc < 0 ) {

         fsrun_error("recv rc = %d\n", rc );
         return rc;
      }

      rc = fsrun_runner_dispatch( runner, &req );
      if( rc != 0 ) {

         fsrun_error("fsrun_runner_dispatch(%s) rc = %d\n", fsrun_request_name( &req ), rc );
         return rc;
      }
   }

   return 0;
}


// mount, serve requests until the transport closes or fails, and unmount.
// blocks the calling thread.
// return 0 if the transport closed normally
// return -EINVAL if there is no transport
// return -EBUSY if the runner is already serving requests
// return the transport's (negative) error otherwise
int fsrun_runner_run( struct fsrun_runner* runner ) {

   int rc = 0;
   int unmount_rc = 0;

   pthread_mutex_lock( &runner->lock );

   if( runner->running ) {

      pthread_mutex_unlock( &runner->lock );
      return -EBUSY;
   }

   if( !runner->has_transport ) {

      fsrun_error("%s", "No transport\n");
      runner->result = -EINVAL;

      pthread_mutex_unlock( &runner->lock );
      return -EINVAL;
   }

   runner->running = true;

   pthread_mutex_unlock( &runner->lock );

   if( runner->transport.mount != NULL ) {

      rc = runner->transport.mount( runner->transport_cls, runner->mountpoint );
      if( rc != 0 ) {
         fsrun_error("mount('%s') rc = %d\n", runner->mountpoint, rc );
      }
   }

   if( rc == 0 ) {

      rc = fsrun_runner_loop( runner );

      if( runner->transport.unmount != NULL ) {

         unmount_rc = runner->transport.unmount( runner->transport_cls );
         if( unmount_rc != 0 ) {

            fsrun_error("unmount('%s') rc = %d\n", runner->mountpoint, unmount_rc );

            if( rc == 0 ) {
               rc = unmount_rc;
            }
         }
      }
   }

   pthread_mutex_lock( &runner->lock );

   runner->running = false;
   runner->result = rc;

   pthread_mutex_unlock( &runner->lock );

   return rc;
}


static void* fsrun_runner_main( void* arg ) {

   struct fsrun_runner* runner = (struct fsrun_runner*)arg;

   int rc = fsrun_runner_run( runner );

   fsrun_debug("runner %p exited, rc = %d\n", runner, rc );

   return NULL;
}

// serve requests on a new thread.  See fsrun_runner_run()
// return 0 on success
// return -EBUSY if the runner has a thread already
// return -EINVAL if there is no transport
// return -errno if the thread could not be started
int fsrun_runner_start( struct fsrun_runner* runner ) {

   int rc = 0;

   pthread_mutex_lock( &runner->lock );

   if( runner->thread_started || runner->running ) {

      pthread_mutex_unlock( &runner->lock );
      return -EBUSY;
   }

   if( !runner->has_transport ) {

      pthread_mutex_unlock( &runner->lock );
      return -EINVAL;
   }

   rc = pthread_create( &runner->thread, NULL, fsrun_runner_main, runner );
   if( rc != 0 ) {

      pthread_mutex_unlock( &runner->lock );

      fsrun_error("pthread_create rc = %d\n", rc );
      return -rc;
   }

   runner->thread_started = true;

   pthread_mutex_unlock( &runner->lock );

   return 0;
}

// wait for a runner's thread to finish, and get the result of its run
// return 0 on success, and set *result (if not NULL)
// return -EINVAL if the runner was not started
// return -errno if the thread could not be joined
int fsrun_runner_join( struct fsrun_runner* runner, int* result ) {

   int rc = 0;

   pthread_mutex_lock( &runner->lock );

   if( !runner->thread_started ) {

      pthread_mutex_unlock( &runner->lock );
      return -EINVAL;
   }

   pthread_mutex_unlock( &runner->lock );

   rc = pthread_join( runner->thread, NULL );
   if( rc != 0 ) {

      fsrun_error("pthread_join rc = %d\n", rc );
      return -rc;
   }

   pthread_mutex_lock( &runner->lock );

   runner->thread_started = false;

   if( result != NULL ) {
      *result = runner->result;
   }

   pthread_mutex_unlock( &runner->lock );

   return 0;
}
