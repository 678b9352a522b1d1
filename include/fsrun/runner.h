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

#ifndef _FSRUN_RUNNER_H_
#define _FSRUN_RUNNER_H_

#include <fsrun/common.h>
#include <fsrun/debug.h>
#include <fsrun/attrs.h>
#include <fsrun/readdir.h>
#include <fsrun/operations.h>
#include <fsrun/xattr.h>

// decoded operations
#define FSRUN_OP_UNSUPPORTED    0
#define FSRUN_OP_LOOKUP         1
#define FSRUN_OP_GETATTR        2
#define FSRUN_OP_SETATTR        3
#define FSRUN_OP_OPEN           4
#define FSRUN_OP_OPENDIR        5
#define FSRUN_OP_SETXATTR       6
#define FSRUN_OP_GETXATTR       7
#define FSRUN_OP_LISTXATTR      8
#define FSRUN_OP_READDIR        9
#define FSRUN_OP_READDIRPLUS    10
#define FSRUN_OP_READ           11
#define FSRUN_OP_WRITE          12

// one decoded request, as handed over by the transport.
// pointers refer to transport-owned memory, valid until the request is answered.
struct fsrun_request {

   int op;                              // FSRUN_OP_*
   char const* op_name;                 // what the transport calls it (may be NULL)

   void* transport_data;                // the transport's handle for the reply

   fsrun_ino_t ino;                     // target inode (the parent, for lookup)
   char const* name;                    // lookup and xattr name

   int flags;                           // open flags, or wire setxattr flags
   char const* buf;                     // setxattr value, or write data
   size_t size;                         // requested reply size, or length of buf
   off_t offset;                        // read/write offset, or readdir cursor

   struct fsrun_set_attrs set_attrs;    // setattr update
};

// Kernel transport primitives.
// cls is the transport's own state.  Every reply_* answers req, and returns 0
// on success or a negative errno if the reply could not be delivered.
struct fsrun_transport_ops {

   // optional
   int (*mount)( void* cls, char const* mountpoint );
   int (*unmount)( void* cls );

   // wait for the next request.
   // return 1 if *req was filled in, 0 at end of stream, or a negative errno.
   int (*recv)( void* cls, struct fsrun_request* req );

   // err is a positive errno
   int (*reply_err)( void* cls, struct fsrun_request* req, int err );
   int (*reply_ok)( void* cls, struct fsrun_request* req );

   int (*reply_entry)( void* cls, struct fsrun_request* req, struct fsrun_lookup const* lookup );
   int (*reply_attr)( void* cls, struct fsrun_request* req, fsrun_ino_t ino, struct fsrun_attrs const* attrs );
   int (*reply_open)( void* cls, struct fsrun_request* req, struct fsrun_open_file const* open_file );
   int (*reply_buf)( void* cls, struct fsrun_request* req, char const* buf, size_t len );
   int (*reply_write)( void* cls, struct fsrun_request* req, size_t count );
   int (*reply_xattr_size)( void* cls, struct fsrun_request* req, size_t size );

   // pack one directory entry into buf.
   // return the space the entry needs; nothing is packed if that is more than bufsize.
   size_t (*add_direntry)( void* cls, struct fsrun_request* req, char* buf, size_t bufsize, struct fsrun_dir_entry const* dent );
};

// a runner: one backend, served over one transport by a single loop
struct fsrun_runner {

   char* mountpoint;

   struct fsrun_operations ops;
   void* fs_data;

   bool has_transport;
   struct fsrun_transport_ops transport;
   void* transport_cls;

   pthread_mutex_t lock;                // guards running
   bool running;

   pthread_t thread;
   bool thread_started;

   int result;                          // terminal result of the last run
};

FSRUN_C_LINKAGE_BEGIN

// requests
int fsrun_request_init( struct fsrun_request* req, int op );
char const* fsrun_op_name( int op );

// lifecycle
int fsrun_runner_init( struct fsrun_runner* runner, char const* mountpoint, struct fsrun_operations const* ops, void* fs_data );
int fsrun_runner_set_transport( struct fsrun_runner* runner, struct fsrun_transport_ops const* transport, void* transport_cls );
int fsrun_runner_free( struct fsrun_runner* runner, void** fs_data );

// serving
int fsrun_runner_run( struct fsrun_runner* runner );
int fsrun_runner_dispatch( struct fsrun_runner* runner, struct fsrun_request* req );

// background serving
int fsrun_runner_start( struct fsrun_runner* runner );
int fsrun_runner_join( struct fsrun_runner* runner, int* result );

FSRUN_C_LINKAGE_END

#endif
