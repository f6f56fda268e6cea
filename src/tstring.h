/*  tstring.h
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
#ifndef _TSTRING_H_
#define _TSTRING_H_

#include <stdio.h>
#include <string>
#include <vector>

typedef std::basic_string<char> tString;
typedef tString::iterator tStringIterator;
typedef tString::const_iterator tStringConstIterator;
typedef std::vector<tString> tStringArray;

tString& tToLower(tString &b);
tString tToLower(const char *sin);
tString& tStripLeft(tString &b);
tString& tStripRight(tString &b);
tString& tStrip(tString &b);
tString tStrip(const char *sin);
tString& tRemoveWS(tString &b);
const char* tFormat(tString &str, const char *fmt, ...);
size_t tSplitWS(tStringArray &words, const char *str);
inline size_t tSplitWS(tStringArray &words, const tString &str) { return tSplitWS(words, str.c_str()); }
bool tParseInt(const tString &str, long &val);
tString tBaseName(const tString &path);
tString tDirName(const tString &path);

#endif
