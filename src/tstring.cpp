/*  tstring.cpp
 *
 *  This file is part of rchanger.
 *
 *  rchanger copyright (C) 2006-2015 Josh Fisher
 *
 *  rchanger is free software.
 *  You may redistribute it and/or modify it under the terms of the
 *  GNU General Public License, as published by the Free Software
 *  Foundation; either version 2, or (at your option) any later version.
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
#include "config.h"
#include <stdio.h>
#ifdef HAVE_STDLIB_H
#include <stdlib.h>
#endif
#ifdef HAVE_STDARG_H
#include <stdarg.h>
#endif
#ifdef HAVE_CTYPE_H
#include <ctype.h>
#endif
#ifdef HAVE_ERRNO_H
#include <errno.h>
#endif
#include "compat_defs.h"
#include "tstring.h"


/*
 *  Function to make string lower case
 */
tString& tToLower(tString &b)
{
   tStringIterator p;
   for (p = b.begin(); p != b.end(); p++) {
      *p = tolower(*p);
   }
   return b;
}

tString tToLower(const char *sin)
{
   tString b(sin);
   tToLower(b);
   return b;
}

/*
 *  Functions to strip leading and/or trailing whitespace
 */
tString& tStripLeft(tString &b)
{
   size_t n = 0;
   while (n < b.size() && isspace(b[n])) n++;
   if (n) b.erase(0, n);
   return b;
}

tString& tStripRight(tString &b)
{
   size_t n = b.size();
   while (n > 0 && isspace(b[n - 1])) n--;
   b.erase(n);
   return b;
}

tString& tStrip(tString &b)
{
   return tStripLeft(tStripRight(b));
}

tString tStrip(const char *sin)
{
   tString b(sin);
   tStrip(b);
   return b;
}

/*
 *  Function to remove all whitespace
 */
tString& tRemoveWS(tString &b)
{
   tString tmp;
   tStringIterator p;
   for (p = b.begin(); p != b.end(); p++) {
      if (!isspace(*p)) tmp += *p;
   }
   b = tmp;
   return b;
}

/*
 *  Function to format a string using sprintf
 */
const char* tFormat(tString &str, const char *fmt, ...)
{
   char buf[8192];
   va_list vl;
   va_start(vl, fmt);
   vsnprintf(buf, sizeof(buf), fmt, vl);
   va_end(vl);
   buf[8191] = 0;
   str = buf;
   return str.c_str();
}

/*
 *  Function to split a string into whitespace delimited words. The words
 *  found are appended to 'words'. Returns the number of words appended.
 */
size_t tSplitWS(tStringArray &words, const char *str)
{
   size_t n = 0;
   tString word;
   const char *p = str;

   if (!p) return 0;
   while (*p) {
      while (*p && isspace(*p)) ++p;
      if (!*p) break;
      word.clear();
      while (*p && !isspace(*p)) {
         word += *p;
         ++p;
      }
      words.push_back(word);
      ++n;
   }
   return n;
}

/*
 *  Function to parse a base 10 integer. The whole string, less surrounding
 *  whitespace, must be the number. Returns true on success.
 */
bool tParseInt(const tString &str_in, long &val)
{
   char *endp = NULL;
   long v;
   tString str(str_in);

   tStrip(str);
   if (str.empty()) return false;
   if (!isdigit(str[0]) && str[0] != '-' && str[0] != '+') return false;
   errno = 0;
   v = strtol(str.c_str(), &endp, 10);
   if (errno || !endp || *endp) return false;
   val = v;
   return true;
}

/*
 *  Function to return the last component of a path, ignoring
 *  trailing delimiters
 */
tString tBaseName(const tString &path_in)
{
   size_t n;
   tString path(path_in);
   while (path.size() > 1 && path[path.size() - 1] == DIR_DELIM_C) path.erase(path.size() - 1);
   n = path.rfind(DIR_DELIM_C);
   if (n == tString::npos || path.size() == 1) return path;
   return path.substr(n + 1);
}

/*
 *  Function to return the directory portion of a path. Returns "." if
 *  the path has no directory component.
 */
tString tDirName(const tString &path_in)
{
   size_t n;
   tString path(path_in);
   while (path.size() > 1 && path[path.size() - 1] == DIR_DELIM_C) path.erase(path.size() - 1);
   n = path.rfind(DIR_DELIM_C);
   if (n == tString::npos) return ".";
   if (n == 0) return DIR_DELIM;
   return path.substr(0, n);
}
