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

#ifndef _TEST_COMMON_H_
#define _TEST_COMMON_H_

#include <fsrun/fsrun.h>
#include "memfs.h"

// kinds of recorded replies
#define FSRUN_TEST_REPLY_ERR            1
#define FSRUN_TEST_REPLY_OK             2
#define FSRUN_TEST_REPLY_ENTRY          3
#define FSRUN_TEST_REPLY_ATTR           4
#define FSRUN_TEST_REPLY_OPEN           5
#define FSRUN_TEST_REPLY_BUF            6
#define FSRUN_TEST_REPLY_WRITE          7
#define FSRUN_TEST_REPLY_XATTR_SIZE     8

// one reply, as sent by the runner to the scripted transport
struct fsrun_test_reply {

   int request_id;              // index of the request it answers
   int type;                    // FSRUN_TEST_REPLY_*

   int err;                     // ERR: positive errno
   struct fsrun_lookup lookup;  // ENTRY
   fsrun_ino_t ino;             // ATTR
   struct fsrun_attrs attrs;    // ATTR
   struct fsrun_open_file open_file;    // OPEN
   string data;                 // BUF
   size_t size;                 // WRITE and XATTR_SIZE
};

// A transport that hands out a fixed list of requests and records the replies.
// Packed directory entries are whole struct fsrun_dir_entry records.
struct fsrun_test_transport {

   vector< struct fsrun_request > requests;
   size_t next;

   vector< struct fsrun_test_reply > replies;

   // what recv returns once the requests run out (0 is end-of-stream)
   int recv_rc;

   // fail the reply to this request (-1 for none) with fail_reply_rc
   int fail_reply_at;
   int fail_reply_rc;

   // what mount returns
   int mount_rc;

   int num_mounts;
   int num_unmounts;
   string mountpoint;
};

void fsrun_test_type_to_string( int type, char type_buf[10] );

int fsrun_test_print_tree( FILE* out, memfs_table const* table );

int fsrun_test_begin( struct memfs* fs );
int fsrun_test_end( struct memfs* fs );

int fsrun_test_mkdir_LR_recursive( struct memfs* fs, fsrun_ino_t parent, char const* name, int depth );

// scripted transport
int fsrun_test_transport_init( struct fsrun_test_transport* t );
int fsrun_test_transport_ops( struct fsrun_transport_ops* ops );
int fsrun_test_push_request( struct fsrun_test_transport* t, struct fsrun_request const* req );
int fsrun_test_run( struct fsrun_operations const* ops, void* fs, struct fsrun_test_transport* t );

struct fsrun_test_reply const* fsrun_test_reply_for( struct fsrun_test_transport* t, int request_id );
int fsrun_test_expect_err( struct fsrun_test_transport* t, int request_id, int err );
int fsrun_test_check_replies( struct fsrun_test_transport* t );

#endif
