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

#include <fsrun/debug.h>

int FSRUN_GLOBAL_DEBUG_MESSAGES = 0;
int FSRUN_GLOBAL_WARN_MESSAGES = 1;
int FSRUN_GLOBAL_ERROR_MESSAGES = 1;

void fsrun_set_debug_level( int d ) {
   FSRUN_GLOBAL_DEBUG_MESSAGES = d;
}

void fsrun_set_warn_level( int w ) {
   FSRUN_GLOBAL_WARN_MESSAGES = w;
}

void fsrun_set_error_level( int e ) {
   FSRUN_GLOBAL_ERROR_MESSAGES = e;
}

int fsrun_get_debug_level() {
   return FSRUN_GLOBAL_DEBUG_MESSAGES;
}

int fsrun_get_warn_level() {
   return FSRUN_GLOBAL_WARN_MESSAGES;
}

int fsrun_get_error_level() {
   return FSRUN_GLOBAL_ERROR_MESSAGES;
}

// portable cast pthread_t to uint64_t
unsigned long long int fsrun_pthread_self(void) {

   pthread_t tid = pthread_self();
   unsigned long long int ret = 0;

   memcpy( &ret, &tid, MIN( sizeof(tid), sizeof(ret) ) );
   return ret;
}
