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

#ifndef _FSRUN_ERROR_H_
#define _FSRUN_ERROR_H_

#include <fsrun/common.h>

// errors a backend reports for a single operation.
// none of them are fatal to the runner; each one becomes an error reply.
#define FSRUN_ERR_NO_ENTRY              (-ENOENT)
#define FSRUN_ERR_NOT_FILE              (-EINVAL)
#define FSRUN_ERR_NOT_DIRECTORY         (-ENOTDIR)
#define FSRUN_ERR_INVALID_FLAGS         (-EINVAL)
#define FSRUN_ERR_NOT_IMPLEMENTED       (-ENOSYS)

// xattr protocol errors
#define FSRUN_ERR_RANGE                 (-ERANGE)
#define FSRUN_ERR_NO_ATTR               (-ENOATTR)

FSRUN_C_LINKAGE_BEGIN

// errno to put on the wire for a negative return code
int fsrun_reply_errno( int rc );

FSRUN_C_LINKAGE_END

#endif
