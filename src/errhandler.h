/*  errhandler.h
 *
 *  This file is part of rchanger.
 *
 *  rchanger copyright (C) 2008-2015 Josh Fisher
 *
 *  rchanger is free software.
 *  You may redistribute it and/or modify it under the terms of the
 *  GNU General Public License version 2, as published by the Free
 *  Software Foundation.
 *
 *  rchanger is distributed in the hope that it will be useful,
 *  but WITHOUT ANY WARRANTY; without even the implied warranty of
 *  MERCHANTABILITY or FITNESS FOR A PARTICULAR PURPOSE.
 *  See the GNU General Public License for more details.
 *
 *  You should have received a copy of the GNU General Public License
 *  along with rchanger.  See the file "COPYING".  If not,
 *  write to:  The Free Software Foundation, Inc.,
 *             59 Temple Place - Suite 330,
 *             Boston,  MA  02111-1307, USA.
*/
#ifndef _ERRHANDLER_H_
#define _ERRHANDLER_H_ 1

#include "tstring.h"

/* Kinds of changer errors. Operations return one of these (zero on
 * success) and record the message in their ErrorHandler. */
#define CHGERR_NONE             0
#define CHGERR_TRANSFER         1
#define CHGERR_INVALID_STATE    2
#define CHGERR_UNKNOWN_COMMAND  3
#define CHGERR_CONFIG           4
#define CHGERR_BAD_SLOT         5

class ErrorHandler
{
public:
   ErrorHandler() : err(CHGERR_NONE), sys_errno(0) {}
   ~ErrorHandler() {}
   inline void clear() { err = CHGERR_NONE; sys_errno = 0; msg.clear(); }
   void SetError(int errkind, const char *fmt, ...);
   void SetErrorWithErrno(int errkind, int errnum, const char *fmt, ...);
   void SetError(const ErrorHandler &b);
   inline const char* GetErrorMsg() const { return msg.c_str(); }
   inline int GetError() const { return err; }
   inline int GetErrno() const { return sys_errno; }
   static const char* KindName(int errkind);
protected:
   int err;
   int sys_errno;
   tString msg;
};

#endif /* _ERRHANDLER_H_ */
