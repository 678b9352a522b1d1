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

#include "fsrun_fuse.h"

// claim the request buffer being processed for a new request.
// return NULL if the callback was not reached from fsrun_fuse_recv(); the request is then answered here
static struct fsrun_request* fsrun_fuse_begin( fuse_req_t freq, int op, char const* op_name ) {

   struct fsrun_fuse_state* state = (struct fsrun_fuse_state*)fuse_req_userdata( freq );

   if( state->pending == NULL || state->have_pending ) {

      fsrun_error("BUG: unexpected %s request\n", op_name );
      fuse_reply_err( freq, EIO );
      return NULL;
   }

   struct fsrun_request* req = state->pending;

   fsrun_request_init( req, op );

   req->op_name = op_name;
   req->transport_data = freq;

   state->have_pending = true;

   return req;
}

static void fsrun_fuse_lookup( fuse_req_t freq, fuse_ino_t parent, char const* name ) {

   struct fsrun_request* req = fsrun_fuse_begin( freq, FSRUN_OP_LOOKUP, "lookup" );
   if( req == NULL ) {
      return;
   }

   req->ino = parent;
   req->name = name;
}

static void fsrun_fuse_getattr( fuse_req_t freq, fuse_ino_t ino, struct fuse_file_info* fi ) {

   struct fsrun_request* req = fsrun_fuse_begin( freq, FSRUN_OP_GETATTR, "getattr" );
   if( req == NULL ) {
      return;
   }

   req->ino = ino;
}

static void fsrun_fuse_setattr( fuse_req_t freq, fuse_ino_t ino, struct stat* attr, int to_set, struct fuse_file_info* fi ) {

   struct fsrun_request* req = fsrun_fuse_begin( freq, FSRUN_OP_SETATTR, "setattr" );
   if( req == NULL ) {
      return;
   }

   struct fsrun_set_attrs* set = &req->set_attrs;

   req->ino = ino;

   if( to_set & FUSE_SET_ATTR_MODE ) {
      set->valid |= FSRUN_SET_ATTR_MODE;
      set->mode = attr->st_mode;
   }

   if( to_set & FUSE_SET_ATTR_UID ) {
      set->valid |= FSRUN_SET_ATTR_UID;
      set->uid = attr->st_uid;
   }

   if( to_set & FUSE_SET_ATTR_GID ) {
      set->valid |= FSRUN_SET_ATTR_GID;
      set->gid = attr->st_gid;
   }

   if( to_set & FUSE_SET_ATTR_SIZE ) {
      set->valid |= FSRUN_SET_ATTR_SIZE;
      set->size = attr->st_size;
   }

   if( to_set & FUSE_SET_ATTR_ATIME_NOW ) {
      set->valid |= FSRUN_SET_ATTR_ATIME;
      fsrun_timespec_now( &set->atime );
   }
   else if( to_set & FUSE_SET_ATTR_ATIME ) {
      set->valid |= FSRUN_SET_ATTR_ATIME;
      set->atime = attr->st_atim;
   }

   if( to_set & FUSE_SET_ATTR_MTIME_NOW ) {
      set->valid |= FSRUN_SET_ATTR_MTIME;
      fsrun_timespec_now( &set->mtime );
   }
   else if( to_set & FUSE_SET_ATTR_MTIME ) {
      set->valid |= FSRUN_SET_ATTR_MTIME;
      set->mtime = attr->st_mtim;
   }
}

static void fsrun_fuse_open( fuse_req_t freq, fuse_ino_t ino, struct fuse_file_info* fi ) {

   struct fsrun_request* req = fsrun_fuse_begin( freq, FSRUN_OP_OPEN, "open" );
   if( req == NULL ) {
      return;
   }

   req->ino = ino;
   req->flags = fi->flags;
}

static void fsrun_fuse_opendir( fuse_req_t freq, fuse_ino_t ino, struct fuse_file_info* fi ) {

   struct fsrun_request* req = fsrun_fuse_begin( freq, FSRUN_OP_OPENDIR, "opendir" );
   if( req == NULL ) {
      return;
   }

   req->ino = ino;
   req->flags = fi->flags;
}

static void fsrun_fuse_setxattr( fuse_req_t freq, fuse_ino_t ino, char const* name, char const* value, size_t size, int flags ) {

   struct fsrun_request* req = fsrun_fuse_begin( freq, FSRUN_OP_SETXATTR, "setxattr" );
   if( req == NULL ) {
      return;
   }

   req->ino = ino;
   req->name = name;
   req->buf = value;
   req->size = size;
   req->flags = flags;
}

static void fsrun_fuse_getxattr( fuse_req_t freq, fuse_ino_t ino, char const* name, size_t size ) {

   struct fsrun_request* req = fsrun_fuse_begin( freq, FSRUN_OP_GETXATTR, "getxattr" );
   if( req == NULL ) {
      return;
   }

   req->ino = ino;
   req->name = name;
   req->size = size;
}

static void fsrun_fuse_listxattr( fuse_req_t freq, fuse_ino_t ino, size_t size ) {

   struct fsrun_request* req = fsrun_fuse_begin( freq, FSRUN_OP_LISTXATTR, "listxattr" );
   if( req == NULL ) {
      return;
   }

   req->ino = ino;
   req->size = size;
}

static void fsrun_fuse_readdir( fuse_req_t freq, fuse_ino_t ino, size_t size, off_t off, struct fuse_file_info* fi ) {

   struct fsrun_request* req = fsrun_fuse_begin( freq, FSRUN_OP_READDIR, "readdir" );
   if( req == NULL ) {
      return;
   }

   req->ino = ino;
   req->size = size;
   req->offset = off;
}

static void fsrun_fuse_read( fuse_req_t freq, fuse_ino_t ino, size_t size, off_t off, struct fuse_file_info* fi ) {

   struct fsrun_request* req = fsrun_fuse_begin( freq, FSRUN_OP_READ, "read" );
   if( req == NULL ) {
      return;
   }

   req->ino = ino;
   req->size = size;
   req->offset = off;
}

static void fsrun_fuse_write( fuse_req_t freq, fuse_ino_t ino, char const* buf, size_t size, off_t off, struct fuse_file_info* fi ) {

   struct fsrun_request* req = fsrun_fuse_begin( freq, FSRUN_OP_WRITE, "write" );
   if( req == NULL ) {
      return;
   }

   req->ino = ino;
   req->buf = buf;
   req->size = size;
   req->offset = off;
}


// operations the kernel can send, but backends cannot implement.
// the runner answers them.
static void fsrun_fuse_unsupported( fuse_req_t freq, fuse_ino_t ino, char const* op_name ) {

   struct fsrun_request* req = fsrun_fuse_begin( freq, FSRUN_OP_UNSUPPORTED, op_name );
   if( req == NULL ) {
      return;
   }

   req->ino = ino;
}

static void fsrun_fuse_readlink( fuse_req_t freq, fuse_ino_t ino ) {
   fsrun_fuse_unsupported( freq, ino, "readlink" );
}

static void fsrun_fuse_mknod( fuse_req_t freq, fuse_ino_t parent, char const* name, mode_t mode, dev_t rdev ) {
   fsrun_fuse_unsupported( freq, parent, "mknod" );
}

static void fsrun_fuse_mkdir( fuse_req_t freq, fuse_ino_t parent, char const* name, mode_t mode ) {
   fsrun_fuse_unsupported( freq, parent, "mkdir" );
}

static void fsrun_fuse_unlink( fuse_req_t freq, fuse_ino_t parent, char const* name ) {
   fsrun_fuse_unsupported( freq, parent, "unlink" );
}

static void fsrun_fuse_rmdir( fuse_req_t freq, fuse_ino_t parent, char const* name ) {
   fsrun_fuse_unsupported( freq, parent, "rmdir" );
}

static void fsrun_fuse_symlink( fuse_req_t freq, char const* link, fuse_ino_t parent, char const* name ) {
   fsrun_fuse_unsupported( freq, parent, "symlink" );
}

static void fsrun_fuse_rename( fuse_req_t freq, fuse_ino_t parent, char const* name, fuse_ino_t newparent, char const* newname ) {
   fsrun_fuse_unsupported( freq, parent, "rename" );
}

static void fsrun_fuse_link( fuse_req_t freq, fuse_ino_t ino, fuse_ino_t newparent, char const* newname ) {
   fsrun_fuse_unsupported( freq, ino, "link" );
}

static void fsrun_fuse_create( fuse_req_t freq, fuse_ino_t parent, char const* name, mode_t mode, struct fuse_file_info* fi ) {
   fsrun_fuse_unsupported( freq, parent, "create" );
}

static void fsrun_fuse_removexattr( fuse_req_t freq, fuse_ino_t ino, char const* name ) {
   fsrun_fuse_unsupported( freq, ino, "removexattr" );
}

static void fsrun_fuse_fsync( fuse_req_t freq, fuse_ino_t ino, int datasync, struct fuse_file_info* fi ) {
   fsrun_fuse_unsupported( freq, ino, "fsync" );
}

static void fsrun_fuse_fsyncdir( fuse_req_t freq, fuse_ino_t ino, int datasync, struct fuse_file_info* fi ) {
   fsrun_fuse_unsupported( freq, ino, "fsyncdir" );
}


// return the set of low-level operations.
// init, forget, release and the rest are left to libfuse.
struct fuse_lowlevel_ops fsrun_fuse_get_opers() {

   struct fuse_lowlevel_ops fo;
   memset(&fo, 0, sizeof(fo));

   fo.lookup = fsrun_fuse_lookup;
   fo.getattr = fsrun_fuse_getattr;
   fo.setattr = fsrun_fuse_setattr;
   fo.readlink = fsrun_fuse_readlink;
   fo.mknod = fsrun_fuse_mknod;
   fo.mkdir = fsrun_fuse_mkdir;
   fo.unlink = fsrun_fuse_unlink;
   fo.rmdir = fsrun_fuse_rmdir;
   fo.symlink = fsrun_fuse_symlink;
   fo.rename = fsrun_fuse_rename;
   fo.link = fsrun_fuse_link;
   fo.open = fsrun_fuse_open;
   fo.read = fsrun_fuse_read;
   fo.write = fsrun_fuse_write;
   fo.fsync = fsrun_fuse_fsync;
   fo.opendir = fsrun_fuse_opendir;
   fo.readdir = fsrun_fuse_readdir;
   fo.fsyncdir = fsrun_fuse_fsyncdir;
   fo.setxattr = fsrun_fuse_setxattr;
   fo.getxattr = fsrun_fuse_getxattr;
   fo.listxattr = fsrun_fuse_listxattr;
   fo.removexattr = fsrun_fuse_removexattr;
   fo.create = fsrun_fuse_create;

   return fo;
}


// a reply to an interrupted request fails with -ENOENT; the kernel no longer wants it
static int fsrun_fuse_reply_rc( int rc ) {

   if( rc == -ENOENT ) {
      return 0;
   }

   return rc;
}

static int fsrun_fuse_reply_err( void* cls, struct fsrun_request* req, int err ) {

   int rc = fuse_reply_err( (fuse_req_t)req->transport_data, err );
   return fsrun_fuse_reply_rc( rc );
}

static int fsrun_fuse_reply_ok( void* cls, struct fsrun_request* req ) {

   int rc = fuse_reply_err( (fuse_req_t)req->transport_data, 0 );
   return fsrun_fuse_reply_rc( rc );
}

static int fsrun_fuse_reply_entry( void* cls, struct fsrun_request* req, struct fsrun_lookup const* lookup ) {

   struct fuse_entry_param e;
   memset( &e, 0, sizeof(e) );

   e.ino = lookup->ino;
   e.generation = (lookup->has_generation ? lookup->generation : 0);

   // transport defaults
   e.attr_timeout = 1.0;
   e.entry_timeout = 1.0;

   if( lookup->has_attr_timeout ) {
      e.attr_timeout = fsrun_timespec_to_double( &lookup->attr_timeout );
   }

   if( lookup->has_entry_timeout ) {
      e.entry_timeout = fsrun_timespec_to_double( &lookup->entry_timeout );
   }

   fsrun_attrs_to_stat( &lookup->attrs, lookup->ino, &e.attr );

   int rc = fuse_reply_entry( (fuse_req_t)req->transport_data, &e );
   return fsrun_fuse_reply_rc( rc );
}

static int fsrun_fuse_reply_attr( void* cls, struct fsrun_request* req, fsrun_ino_t ino, struct fsrun_attrs const* attrs ) {

   struct stat sb;

   fsrun_attrs_to_stat( attrs, ino, &sb );

   int rc = fuse_reply_attr( (fuse_req_t)req->transport_data, &sb, fsrun_timespec_to_double( &attrs->ttl ) );
   return fsrun_fuse_reply_rc( rc );
}

// libfuse 2 has no cache_dir flag, so it is dropped
static int fsrun_fuse_reply_open( void* cls, struct fsrun_request* req, struct fsrun_open_file const* open_file ) {

   struct fuse_file_info fi;
   memset( &fi, 0, sizeof(fi) );

   fi.fh = open_file->fh;
   fi.direct_io = (open_file->direct_io ? 1 : 0);
   fi.keep_cache = (open_file->keep_cache ? 1 : 0);
   fi.nonseekable = (open_file->seekable ? 0 : 1);

   int rc = fuse_reply_open( (fuse_req_t)req->transport_data, &fi );
   return fsrun_fuse_reply_rc( rc );
}

static int fsrun_fuse_reply_buf( void* cls, struct fsrun_request* req, char const* buf, size_t len ) {

   int rc = fuse_reply_buf( (fuse_req_t)req->transport_data, buf, len );
   return fsrun_fuse_reply_rc( rc );
}

static int fsrun_fuse_reply_write( void* cls, struct fsrun_request* req, size_t count ) {

   int rc = fuse_reply_write( (fuse_req_t)req->transport_data, count );
   return fsrun_fuse_reply_rc( rc );
}

static int fsrun_fuse_reply_xattr_size( void* cls, struct fsrun_request* req, size_t size ) {

   int rc = fuse_reply_xattr( (fuse_req_t)req->transport_data, size );
   return fsrun_fuse_reply_rc( rc );
}

static size_t fsrun_fuse_add_direntry( void* cls, struct fsrun_request* req, char* buf, size_t bufsize, struct fsrun_dir_entry const* dent ) {

   struct stat sb;
   memset( &sb, 0, sizeof(sb) );

   // fuse_add_direntry only looks at the inode and the type bits
   sb.st_ino = dent->file_id;
   sb.st_mode = fsrun_entry_type_to_dtype( dent->type ) << 12;

   return fuse_add_direntry( (fuse_req_t)req->transport_data, buf, bufsize, dent->name, &sb, dent->offset );
}


// tear down whatever fsrun_fuse_mount() set up
static void fsrun_fuse_unmount_session( struct fsrun_fuse_state* state ) {

   if( state->se != NULL ) {

      if( state->signal_handlers ) {
         fuse_remove_signal_handlers( state->se );
         state->signal_handlers = false;
      }

      if( state->ch != NULL ) {
         fuse_session_remove_chan( state->ch );
      }

      fuse_session_destroy( state->se );
      state->se = NULL;
   }

   if( state->ch != NULL ) {

      fuse_unmount( state->mountpoint, state->ch );
      state->ch = NULL;
   }

   if( state->buf != NULL ) {

      free( state->buf );
      state->buf = NULL;
      state->bufsize = 0;
   }

   if( state->mountpoint != NULL ) {

      free( state->mountpoint );
      state->mountpoint = NULL;
   }
}


// mount, and set up a low-level session to read requests from
// return 0 on success
// return -ENOMEM if OOM
// return -errno (or -EPERM) if mounting fails
static int fsrun_fuse_mount( void* cls, char const* mountpoint ) {

   int rc = 0;
   struct fsrun_fuse_state* state = (struct fsrun_fuse_state*)cls;
   struct fuse_lowlevel_ops fo = fsrun_fuse_get_opers();

   if( mountpoint == NULL ) {
      fsrun_error("%s", "No mountpoint given\n");
      return -EINVAL;
   }

   state->mountpoint = strdup( mountpoint );
   if( state->mountpoint == NULL ) {
      return -ENOMEM;
   }

   // mount
   state->ch = fuse_mount( state->mountpoint, &state->args );
   if( state->ch == NULL ) {

      rc = -errno;
      fsrun_error("fuse_mount('%s') failed, errno = %d\n", state->mountpoint, rc );

      if( rc == 0 ) {
         rc = -EPERM;
      }

      free( state->mountpoint );
      state->mountpoint = NULL;

      return rc;
   }

   state->se = fuse_lowlevel_new( &state->args, &fo, sizeof(fo), state );
   if( state->se == NULL ) {

      fsrun_error("%s", "fuse_lowlevel_new failed\n");

      fsrun_fuse_unmount_session( state );
      return -EINVAL;
   }

   rc = fuse_set_signal_handlers( state->se );
   if( rc != 0 ) {

      fsrun_error("fuse_set_signal_handlers rc = %d\n", rc );
      fsrun_fuse_unmount_session( state );
      return -EIO;
   }

   state->signal_handlers = true;

   fuse_session_add_chan( state->se, state->ch );

   state->bufsize = fuse_chan_bufsize( state->ch );
   state->buf = (char*)calloc( state->bufsize, 1 );
   if( state->buf == NULL ) {

      fsrun_fuse_unmount_session( state );
      return -ENOMEM;
   }

   fsrun_debug("Mounted on '%s'\n", state->mountpoint );

   return 0;
}

// unmount.  See fsrun_fuse_mount()
static int fsrun_fuse_unmount( void* cls ) {

   struct fsrun_fuse_state* state = (struct fsrun_fuse_state*)cls;

   fsrun_debug("Unmounting '%s'\n", state->mountpoint );

   fsrun_fuse_unmount_session( state );

   return 0;
}


// read and decode the next request the runner must answer.
// requests libfuse answers on its own (init, forget, release, ...) are consumed here.
// return 1 if *req was filled in
// return 0 if the filesystem was unmounted, or the session was told to exit
// return -errno if the channel failed
static int fsrun_fuse_recv( void* cls, struct fsrun_request* req ) {

   int rc = 0;
   struct fsrun_fuse_state* state = (struct fsrun_fuse_state*)cls;

   while( true ) {

      if( fuse_session_exited( state->se ) ) {
         return 0;
      }

      struct fuse_chan* ch = state->ch;

      rc = fuse_chan_recv( &ch, state->buf, state->bufsize );
      if( rc == -EINTR || rc == -EAGAIN ) {
         continue;
      }

      if( rc < 0 ) {
         fsrun_error("fuse_chan_recv rc = %d\n", rc );
         return rc;
      }

      if( rc == 0 ) {
         // unmounted
         return 0;
      }

      state->pending = req;
      state->have_pending = false;

      fuse_session_process( state->se, state->buf, rc, ch );

      state->pending = NULL;

      if( state->have_pending ) {
         state->have_pending = false;
         return 1;
      }
   }

   return 0;
}


// set up FUSE transport state with the given FUSE arguments (argv[0] is the program name)
// return 0 on success
// return -ENOMEM if OOM
int fsrun_fuse_init( struct fsrun_fuse_state* state, int argc, char** argv ) {

   int rc = 0;
   struct fuse_args args = FUSE_ARGS_INIT( 0, NULL );

   memset( state, 0, sizeof(struct fsrun_fuse_state) );

   for( int i = 0; i < argc; i++ ) {

      rc = fuse_opt_add_arg( &args, argv[i] );
      if( rc != 0 ) {

         fuse_opt_free_args( &args );
         return -ENOMEM;
      }
   }

   state->args = args;

   return 0;
}

// free FUSE transport state, unmounting if need be
int fsrun_fuse_free( struct fsrun_fuse_state* state ) {

   fsrun_fuse_unmount_session( state );

   fuse_opt_free_args( &state->args );

   memset( state, 0, sizeof(struct fsrun_fuse_state) );

   return 0;
}

// fill in the transport table for a FUSE state
int fsrun_fuse_transport( struct fsrun_fuse_state* state, struct fsrun_transport_ops* transport ) {

   memset( transport, 0, sizeof(struct fsrun_transport_ops) );

   transport->mount = fsrun_fuse_mount;
   transport->unmount = fsrun_fuse_unmount;
   transport->recv = fsrun_fuse_recv;
   transport->reply_err = fsrun_fuse_reply_err;
   transport->reply_ok = fsrun_fuse_reply_ok;
   transport->reply_entry = fsrun_fuse_reply_entry;
   transport->reply_attr = fsrun_fuse_reply_attr;
   transport->reply_open = fsrun_fuse_reply_open;
   transport->reply_buf = fsrun_fuse_reply_buf;
   transport->reply_write = fsrun_fuse_reply_write;
   transport->reply_xattr_size = fsrun_fuse_reply_xattr_size;
   transport->add_direntry = fsrun_fuse_add_direntry;

   return 0;
}


// serve a backend over FUSE, taking the mountpoint and FUSE options from the command line.
// blocks until the filesystem is unmounted.
// return 0 on clean unmount
// return negative on error
int fsrun_fuse_main( int argc, char** argv, struct fsrun_operations const* ops, void* fs ) {

   int rc = 0;
   int multithreaded = 0;
   int foreground = 0;
   char* mountpoint = NULL;

   struct fsrun_fuse_state state;
   struct fsrun_transport_ops transport;
   struct fsrun_runner runner;

   rc = fsrun_fuse_init( &state, argc, argv );
   if( rc != 0 ) {
      fsrun_error("fsrun_fuse_init rc = %d\n", rc );
      return rc;
   }

   // parse command-line...
   rc = fuse_parse_cmdline( &state.args, &mountpoint, &multithreaded, &foreground );
   if( rc < 0 ) {

      fsrun_error("fuse_parse_cmdline rc = %d\n", rc );
      fsrun_fuse_free( &state );
      return -EINVAL;
   }

   if( mountpoint == NULL ) {

      fsrun_error("%s", "No mountpoint given\n");
      fsrun_fuse_free( &state );
      return -EINVAL;
   }

   if( multithreaded ) {
      fsrun_debug("%s", "Requests are served one at a time; pass -s to silence this\n");
   }

   // detach before any thread or mount exists
   rc = fuse_daemonize( foreground );
   if( rc != 0 ) {

      fsrun_error("fuse_daemonize rc = %d\n", rc );
      free( mountpoint );
      fsrun_fuse_free( &state );
      return -EPERM;
   }

   fsrun_fuse_transport( &state, &transport );

   rc = fsrun_runner_init( &runner, mountpoint, ops, fs );
   free( mountpoint );

   if( rc != 0 ) {

      fsrun_error("fsrun_runner_init rc = %d\n", rc );
      fsrun_fuse_free( &state );
      return rc;
   }

   rc = fsrun_runner_set_transport( &runner, &transport, &state );
   if( rc == 0 ) {

      rc = fsrun_runner_run( &runner );
      if( rc != 0 ) {
         fsrun_error("fsrun_runner_run rc = %d\n", rc );
      }
   }
   else {
      fsrun_error("fsrun_runner_set_transport rc = %d\n", rc );
   }

   fsrun_runner_free( &runner, NULL );
   fsrun_fuse_free( &state );

   return rc;
}
