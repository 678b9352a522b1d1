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

#ifndef _FSRUN_DEBUG_H_
#define _FSRUN_DEBUG_H_

#include <fsrun/common.h>

#define FSRUN_WHERESTR "%05d:%016llX: [fsrun %16s:%04u] %s %s: "
#define FSRUN_WHEREARG (int)getpid(), fsrun_pthread_self(), __FILE__, __LINE__, __func__

#define fsrun_debug( format, ... ) \
   do { \
      if( FSRUN_GLOBAL_DEBUG_MESSAGES ) { \
         fprintf(stderr, FSRUN_WHERESTR format, FSRUN_WHEREARG, "DEBUG", __VA_ARGS__ ); \
      } \
   } while(0)


#define fsrun_warn( format, ... ) \
   do { \
      if( FSRUN_GLOBAL_WARN_MESSAGES ) { \
         fprintf(stderr, FSRUN_WHERESTR format, FSRUN_WHEREARG, "WARN", __VA_ARGS__ ); \
      } \
   } while(0)


#define fsrun_error( format, ... ) \
   do { \
      if( FSRUN_GLOBAL_ERROR_MESSAGES ) { \
         fprintf(stderr, FSRUN_WHERESTR format, FSRUN_WHEREARG, "ERROR", __VA_ARGS__); \
      } \
   } while(0)


FSRUN_C_LINKAGE_BEGIN

extern int FSRUN_GLOBAL_DEBUG_MESSAGES;
extern int FSRUN_GLOBAL_WARN_MESSAGES;
extern int FSRUN_GLOBAL_ERROR_MESSAGES;

void fsrun_set_debug_level( int d );
void fsrun_set_warn_level( int w );
void fsrun_set_error_level( int e );
int fsrun_get_debug_level();
int fsrun_get_warn_level();
int fsrun_get_error_level();

// portable cast pthread_t to uint64_t
unsigned long long int fsrun_pthread_self(void);

FSRUN_C_LINKAGE_END

#endif
