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

#ifndef _FSRUN_COMMON_H_
#define _FSRUN_COMMON_H_

#ifndef __STDC_LIMIT_MACROS
#define __STDC_LIMIT_MACROS
#endif

#ifndef __STDC_FORMAT_MACROS
#define __STDC_FORMAT_MACROS
#endif

#include <stdio.h>
#include <stdlib.h>
#include <errno.h>
#include <unistd.h>
#include <string.h>
#include <strings.h>
#include <dirent.h>
#include <stdint.h>
#include <inttypes.h>
#include <stdarg.h>
#include <fcntl.h>
#include <limits.h>
#include <time.h>

#include <sys/types.h>
#include <sys/time.h>
#include <sys/stat.h>
#include <sys/xattr.h>

#include <pthread.h>

#include <map>
#include <string>
#include <vector>
#include <new>
#include <stdexcept>

#ifndef ENOATTR
#define ENOATTR ENODATA
#endif

#define FSRUN_C_LINKAGE_BEGIN extern "C" {
#define FSRUN_C_LINKAGE_END }

#define MIN( x, y ) ((x) > (y) ? (y) : (x))
#define MAX( x, y ) ((x) > (y) ? (x) : (y))

using namespace std;

// inode number
typedef uint64_t fsrun_ino_t;

// the root directory is always inode 1
#define FSRUN_ROOT_INODE ((fsrun_ino_t)1)

#define FSRUN_FILESYSTEM_NAMEMAX 255

#endif
