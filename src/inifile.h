/*  inifile.h
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

#ifndef _INIFILE_H_
#define _INIFILE_H_ 1

#include <stdio.h>
#include <list>
#include "tstring.h"

#define INIKEYWORDTYPE_SZ           2
#define INIKEYWORDTYPE_LONG         6

class IniValue
{
public:
   IniValue() : type(INIKEYWORDTYPE_SZ), is_set(false) {}
   IniValue(const IniValue &b) : type(b.type), is_set(b.is_set), value(b.value) {}
   virtual ~IniValue() {}
   IniValue& operator=(const IniValue &b);
   IniValue& operator=(const tString &b);
   IniValue& operator=(const char *b);
   IniValue& operator=(long b);
   IniValue& operator=(int b) { return operator=((long)b); }
   long GetLONG() const;
   inline const char* GetSZ() const { return value.c_str(); }
   inline const tString& GetString() const { return value; }
   inline int GetType() const { return type; }
   inline void SetType(int newtype) { type = newtype; }
   inline void clear() { value.clear(); is_set = false; }
   inline bool IsSet() const { return is_set; }
   inline bool empty() const { return value.empty(); }
   friend class IniFile;
protected:
   int type;
   bool is_set;
   tString value;
};


class IniValuePair
{
public:
   IniValuePair() {}
   virtual ~IniValuePair() {}
public:
   tString key;
   tString name;
   IniValue value;
};

typedef std::list<IniValuePair> IniValuePairList;

/*
 *  A set of global keywords (the grammar) and their values. Keywords are
 *  case-insensitive and ignore embedded whitespace, so "Log Level" and
 *  "loglevel" are the same keyword. Files are read and written as lines of
 *  the form "keyword = value", with '#' and ';' starting comment lines.
 */
class IniFile
{
public:
   IniFile() {}
   IniFile(const IniFile &b) : kwmap(b.kwmap) {}
   virtual ~IniFile() {}
   IniFile& operator=(const IniFile &b);
   IniValue& operator[](const char *key);
   inline IniValue& operator[](const tString &key) { return operator[](key.c_str()); }
   bool AddKeyword(const char *kw, int kwtype = INIKEYWORDTYPE_SZ);
   inline bool KeywordExists(const char *kw) { return FindKey(kw) != kwmap.end(); }
   void ClearKeywordValues();
   bool Update(const IniFile &b);
   int Read(FILE* stream_in);
   int Read(const char *fname);
   inline int Read(const tString &fname) { return Read(fname.c_str()); }
   int Write(FILE *stream_out, const char *comment = NULL);
   inline void clear() { kwmap.clear(); }
   inline bool empty() const { return kwmap.empty(); }
   inline const tString& GetErrorMessage() const { return err_msg; }
protected:
   IniValuePairList::iterator FindKey(const char *key);
   int ReadToken(FILE* fs, tString &str);
   int SetValue(IniValuePairList::iterator p, const tString &val, int linenum);
protected:
   IniValuePairList kwmap;
   IniValue bogus;
   tString err_msg;
};

#endif /* _INIFILE_H_ */
