/*  loghandler.h
 *
 *  Copyright (C) 2013-2015 Josh Fisher
 *
 *  This program is free software. You may redistribute it and/or modify
 *  it under the terms of the GNU General Public License, as published by
 *  the Free Software Foundation; either version 2, or (at your option)
 *  any later version.
 *
 *  This program is distributed in the hope that it will be useful,
 *  but WITHOUT ANY WARRANTY; without even the implied warranty of
 *  MERCHANTABILITY or FITNESS FOR A PARTICULAR PURPOSE. See the GNU
 *  General Public License for more details.
 *
 *  You should have received a copy of the GNU General Public License
 *  along with this program.  See the file "COPYING".  If not,
 *  see <http://www.gnu.org/licenses/>.
*/

#ifndef _LOGHANDLER_H_
#define _LOGHANDLER_H_ 1

#include <stdio.h>
#include <stdarg.h>
#include <syslog.h>

/* Log file name that routes messages to syslog instead of a file */
#define LOGFILE_SYSLOG "syslog"

class LogHandler
{
public:
   LogHandler();
   virtual ~LogHandler();
   void OpenLog(FILE *fs, int max_level = LOG_WARNING);
   int OpenLog(const char *fname, int max_level = LOG_WARNING);
   void OpenSyslog(const char *ident = NULL, int facility = LOG_DAEMON,
      int max_level = LOG_WARNING);
   void CloseLog();
   void Error(const char *fmt, ... );
   void Warning(const char *fmt, ... );
   void Notice(const char *fmt, ... );
   void Info(const char *fmt, ... );
   void Debug(const char *fmt, ... );
protected:
   void WriteLog(int priority, const char *fmt, va_list vl);
protected:
   bool use_syslog;
   bool owns_stream;
   int max_debug_level;
   FILE *errfs;
};

#ifndef LOGHANDLER_SOURCE
extern LogHandler logger;
#endif

#endif /* _LOGHANDLER_H_ */
