/* errhandler.cpp
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
 *
 *  Provides a class for recording the last error of an object
 */

#include "config.h"
#include <stdio.h>
#ifdef HAVE_STRING_H
#include <string.h>
#endif
#ifdef HAVE_STDARG_H
#include <stdarg.h>
#endif

#include "errhandler.h"

///////////////////////////////////////////////////
//  Class ErrorHandler
///////////////////////////////////////////////////

/*-------------------------------------------------
 *  Method to set error kind and error message
 *------------------------------------------------*/
void ErrorHandler::SetError(int errkind, const char *fmt, ...)
{
   va_list vl;
   char buf[4096];
   err = errkind;
   sys_errno = 0;
   va_start(vl, fmt);
   vsnprintf(buf, sizeof(buf), fmt, vl);
   va_end(vl);
   msg = buf;
}

/*-------------------------------------------------
 *  Method to set error kind and error message and append the text
 *  returned from strerror(errnum).
 *------------------------------------------------*/
void ErrorHandler::SetErrorWithErrno(int errkind, int errnum, const char *fmt, ...)
{
   va_list vl;
   char buf[4096];
   err = errkind;
   sys_errno = errnum;
   va_start(vl, fmt);
   vsnprintf(buf, sizeof(buf), fmt, vl);
   va_end(vl);
   msg = buf;
   msg += ": ";
   msg += strerror(errnum);
}

/*-------------------------------------------------
 *  Method to take on the error of another object
 *------------------------------------------------*/
void ErrorHandler::SetError(const ErrorHandler &b)
{
   if (&b == this) return;
   err = b.err;
   sys_errno = b.sys_errno;
   msg = b.msg;
}

/*-------------------------------------------------
 *  Returns a printable name for an error kind
 *------------------------------------------------*/
const char* ErrorHandler::KindName(int errkind)
{
   switch (errkind) {
   case CHGERR_NONE:
      return "no error";
   case CHGERR_TRANSFER:
      return "transfer error";
   case CHGERR_INVALID_STATE:
      return "invalid state";
   case CHGERR_UNKNOWN_COMMAND:
      return "unknown command";
   case CHGERR_CONFIG:
      return "configuration error";
   case CHGERR_BAD_SLOT:
      return "invalid slot";
   }
   return "unknown error";
}
