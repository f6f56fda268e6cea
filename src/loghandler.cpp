/* loghandler.cpp
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

#include "config.h"
#include <stdio.h>
#ifdef HAVE_TIME_H
#include <time.h>
#endif
#ifdef HAVE_STDLIB_H
#include <stdlib.h>
#endif
#ifdef HAVE_STRING_H
#include <string.h>
#endif
#ifdef HAVE_ERRNO_H
#include <errno.h>
#endif
#include <stdarg.h>
#define LOGHANDLER_SOURCE 1
#include "loghandler.h"

LogHandler logger;

LogHandler::LogHandler() : use_syslog(false), owns_stream(false),
      max_debug_level(LOG_WARNING), errfs(stderr)
{
}

LogHandler::~LogHandler()
{
   CloseLog();
}

/*-------------------------------------------------
 *  Method to close the current log destination. Logging
 *  reverts to stderr.
 *------------------------------------------------*/
void LogHandler::CloseLog()
{
   if (use_syslog) closelog();
   if (owns_stream && errfs) fclose(errfs);
   use_syslog = false;
   owns_stream = false;
   errfs = stderr;
}

/*-------------------------------------------------
 *  Method to log to an already open stream owned by the caller
 *------------------------------------------------*/
void LogHandler::OpenLog(FILE *fs, int max_level)
{
   CloseLog();
   if (max_level < LOG_EMERG || max_level > LOG_DEBUG) max_level = LOG_DEBUG;
   errfs = fs ? fs : stderr;
   max_debug_level = max_level;
}

/*-------------------------------------------------
 *  Method to log to the file 'fname', opened for append. If
 *  'fname' is "syslog", then messages go to syslog instead.
 *  On success returns zero, else returns errno and leaves the
 *  current log destination unchanged.
 *------------------------------------------------*/
int LogHandler::OpenLog(const char *fname, int max_level)
{
   FILE *fs;
   if (!fname || !fname[0]) return EINVAL;
   if (strcmp(fname, LOGFILE_SYSLOG) == 0) {
      OpenSyslog("rchanger", LOG_DAEMON, max_level);
      return 0;
   }
   fs = fopen(fname, "a");
   if (!fs) return errno;
   OpenLog(fs, max_level);
   owns_stream = true;
   return 0;
}

void LogHandler::OpenSyslog(const char *ident, int facility, int max_level)
{
   CloseLog();
   if (facility < LOG_KERN || facility > LOG_LOCAL7) facility = LOG_DAEMON;
   if (max_level < LOG_EMERG || max_level > LOG_DEBUG) max_level = LOG_DEBUG;
   openlog(ident, LOG_PID, facility);
   use_syslog = true;
   max_debug_level = max_level;
}

void LogHandler::Error(const char *fmt, ...)
{
   va_list vl;
   va_start(vl, fmt);
   WriteLog(LOG_ERR, fmt, vl);
   va_end(vl);
}

void LogHandler::Warning(const char *fmt, ...)
{
   va_list vl;
   va_start(vl, fmt);
   WriteLog(LOG_WARNING, fmt, vl);
   va_end(vl);
}

void LogHandler::Notice(const char *fmt, ...)
{
   va_list vl;
   va_start(vl, fmt);
   WriteLog(LOG_NOTICE, fmt, vl);
   va_end(vl);
}

void LogHandler::Info(const char *fmt, ...)
{
   va_list vl;
   va_start(vl, fmt);
   WriteLog(LOG_INFO, fmt, vl);
   va_end(vl);
}

void LogHandler::Debug(const char *fmt, ...)
{
   va_list vl;
   va_start(vl, fmt);
   WriteLog(LOG_DEBUG, fmt, vl);
   va_end(vl);
}

// Method to write to log
void LogHandler::WriteLog(int priority, const char *fmt, va_list vl)
{
   size_t n;
   struct tm bt;
   time_t t;
   char buf[1024];

   if (priority > max_debug_level || priority < LOG_EMERG || !fmt) return;
   if (use_syslog) {
      vsyslog(priority, fmt, vl);
      return;
   }
   t = time(NULL);
   localtime_r(&t, &bt);
   strftime(buf, 100, "%b %d %T: ", &bt);
   n = strlen(buf);
   vsnprintf(buf + n, sizeof(buf) - n, fmt, vl);
   n = strlen(buf);
   fputs(buf, errfs);
   if (!n || buf[n - 1] != '\n') fputc('\n', errfs);
   fflush(errfs);
}
