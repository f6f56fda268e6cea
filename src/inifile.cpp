/*  inifile.cpp
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
#include <stdlib.h>
#include <stdio.h>
#ifdef HAVE_STRING_H
#include <string.h>
#endif
#ifdef HAVE_CTYPE_H
#include <ctype.h>
#endif

#include "inifile.h"

////////////////////////////////////////////////////////////////////////////////
//   Class IniValue
////////////////////////////////////////////////////////////////////////////////

IniValue& IniValue::operator=(const IniValue &b)
{
   if (&b != this) {
      type = b.type;
      is_set = b.is_set;
      value = b.value;
   }
   return *this;
}

IniValue& IniValue::operator=(const tString &b)
{
   value = b;
   is_set = true;
   return *this;
}

IniValue& IniValue::operator=(const char *b)
{
   if (!b) {
      clear();
      return *this;
   }
   value = b;
   is_set = true;
   return *this;
}

IniValue& IniValue::operator=(long b)
{
   char buf[64];
   snprintf(buf, sizeof(buf), "%ld", b);
   value = buf;
   is_set = true;
   return *this;
}

long IniValue::GetLONG() const
{
   long l = 0;
   if (!tParseInt(value, l)) return 0;
   return l;
}

/*
 *  Returns true if the value is a well-formed integer
 */
////////////////////////////////////////////////////////////////////////////////
//   Class IniFile
////////////////////////////////////////////////////////////////////////////////

IniFile& IniFile::operator=(const IniFile &b)
{
   if (&b != this) {
      kwmap = b.kwmap;
   }
   return *this;
}

IniValuePairList::iterator IniFile::FindKey(const char *key_in)
{
   IniValuePairList::iterator p;
   tString key(key_in ? key_in : "");
   tToLower(tRemoveWS(key));
   for (p = kwmap.begin(); p != kwmap.end(); p++) {
      if (p->key == key) break;
   }
   return p;
}

IniValue& IniFile::operator[](const char *key)
{
   IniValuePairList::iterator p = FindKey(key);
   if (p != kwmap.end()) return p->value;
   bogus.clear();
   return bogus;
}

/*
 * Method to add a keyword to the grammar
 */
bool IniFile::AddKeyword(const char *key, int kwtype)
{
   IniValuePair np;
   if (!key || FindKey(key) != kwmap.end()) {
      err_msg = "keyword already exists";
      return false;
   }
   np.name = tStrip(key);
   np.key = key;
   tToLower(tRemoveWS(np.key));
   if (np.key.empty() || np.key.find_first_of("[]=#;\"'\\") != tString::npos) {
      err_msg = "invalid keyword";
      return false;
   }
   if (kwtype != INIKEYWORDTYPE_SZ && kwtype != INIKEYWORDTYPE_LONG) {
      err_msg = "invalid key type";
      return false;
   }
   np.value.type = kwtype;
   kwmap.push_back(np);
   return true;
}

/*
 * Method to clear value of all keywords
 */
void IniFile::ClearKeywordValues()
{
   IniValuePairList::iterator p;
   for (p = kwmap.begin(); p != kwmap.end(); p++) {
      p->value.clear();
   }
}

/*
 * Method to update keyword values with values from keywords
 * in b that have been set.
 */
bool IniFile::Update(const IniFile &b)
{
   IniValuePairList::iterator p;
   IniValuePairList::const_iterator pb;
   for (pb = b.kwmap.begin(); pb != b.kwmap.end(); pb++) {
      p = FindKey(pb->key.c_str());
      if (p == kwmap.end()) {
         err_msg = "key '" + pb->key + "' is not defined";
         return false;
      }
      if (pb->value.IsSet()) p->value = pb->value;
   }
   return true;
}

/*
 * Method to read the next token from a file
 * returns:
 *     0   EOF
 *    -1   I/O error
 *    -2   quoted string missing closing quote
 *    ' '  string of blank chars
 *    '\n' newline
 *    '='  =
 *    '\\' line continuation
 *    'S'  quoted string
 *    'A'  atom text
 */
int IniFile::ReadToken(FILE* fs, tString &str)
{
   int c, delim = 0, esc = 0;

   str.clear();
   c = fgetc(fs);
   /* Strip comments */
   if (c == ';' || c == '#') {
      c = fgetc(fs);
      while (c != EOF && c != '\n') {
         c = fgetc(fs);
      }
   }
   if (c == EOF) {
      if (ferror(fs)) return -1;
      return 0;
   }
   if (c == '\r') {
      c = fgetc(fs);
      if (c != '\n') return -1; /* CR not followed by LF is an error */
   }
   if (c == '=' || c == '\n' || c == '\\' || c == '[' || c == ']') {
      str = (char)c;
      return c;
   }
   /* look for space token */
   if (c == ' ' || c == '\t') {
      while (c == ' ' || c == '\t') {
         str += (char)c;
         c = fgetc(fs);
      }
      if (c != EOF) ungetc(c, fs);
      return ' ';
   }
   /* look for quoted string token */
   if (c == '"' || c == '\'') {
      delim = c;
      c = fgetc(fs);
      while (c != EOF && c != '\n') {
         if (esc) {
            switch (c) {
            case 'n':
               str += '\n';
               break;
            case 't':
               str += '\t';
               break;
            default:
               str += (char)c;
               break;
            }
            esc = 0;
         } else if (c == delim) {
            return 'S';
         } else if (c == '\\') {
            esc = 1;
         } else {
            str += (char)c;
         }
         c = fgetc(fs);
      }
      return -2;
   }
   /* look for atom */
   while (c != EOF && c != '"' && c != '\'' && c != ' ' && c != '\t' && c != '='
         && c != '\r' && c != '\n' && c != '\\' && c != '[' && c != ']') {
      str += (char)c;
      c = fgetc(fs);
   }
   if (c != EOF) ungetc(c, fs);
   return 'A';
}

/*
 * Method to assign a value read from a file, checking that numeric
 * keywords are given numbers. Returns zero on success, else linenum.
 */
int IniFile::SetValue(IniValuePairList::iterator p, const tString &val_in, int linenum)
{
   char buf[4096];
   tString val(val_in);
   tStripRight(val);
   if (p->value.type == INIKEYWORDTYPE_LONG && !val.empty()) {
      long l;
      if (!tParseInt(val, l)) {
         snprintf(buf, sizeof(buf), "keyword '%s' requires a number on line %d",
               p->key.c_str(), linenum);
         err_msg = buf;
         return linenum;
      }
   }
   if (val.empty()) p->value.clear();
   else p->value = val;
   return 0;
}

/*
 * Method to parse keyword/value pairs from a file
 */
int IniFile::Read(const char *fname)
{
   if (!fname || !strlen(fname)) {
      err_msg = "filename is empty or null";
      return -1;
   }
   FILE* fin = fopen(fname, "r");
   if (!fin) {
      err_msg = fname;
      err_msg += " not found";
      return -1;
   }
   int result = Read(fin);
   fclose(fin);
   return result;
}

/*
 * Method to parse keyword/value pairs from an open file.
 * Returns zero on success, -1 on i/o error, or else the line number
 * where a syntax error was found.
 */
int IniFile::Read(FILE *fin)
{
   int tok, rc, state = 0, linenum = 1;
   tString word, kw, val;
   IniValuePairList::iterator p = kwmap.end();
   char buf[4096];

   err_msg.clear();
   if (!fin || ferror(fin)) {
      err_msg = "bad file stream";
      return -1;
   }

   tok = ReadToken(fin, word);
   while (tok > 0) {
      switch (state)
      {
      case 0:
         /* Looking for start of keyword */
         switch (tok)
         {
         case '\n':
            ++linenum;
            break;
         case ' ':
            break;
         case 'A':
            kw = word;
            state = 1;
            break;
         default:
            snprintf(buf, sizeof(buf), "syntax error on line %d", linenum);
            err_msg = buf;
            return linenum;
         }
         break;
      case 1:
         /* Reading keyword */
         switch (tok)
         {
         case ' ':
            break;
         case 'A':
            kw += word;
            break;
         case '=':
            p = FindKey(kw.c_str());
            if (p == kwmap.end()) {
               snprintf(buf, sizeof(buf), "unknown keyword '%s' on line %d", kw.c_str(), linenum);
               err_msg = buf;
               return linenum;
            }
            val.clear();
            state = 2;
            break;
         default:
            snprintf(buf, sizeof(buf), "invalid keyword on line %d", linenum);
            err_msg = buf;
            return linenum;
         }
         break;
      case 2:
         /* Looking for start of value */
         switch (tok)
         {
         case ' ':
            break;
         case '\\':
            state = 4;
            break;
         case '\n':
            /* No value given means keyword's value should be cleared */
            p->value.clear();
            ++linenum;
            state = 0;
            break;
         default:
            val = word;
            state = 3;
            break;
         }
         break;
      case 3:
         /* Reading value */
         switch (tok)
         {
         case '\\':
            state = 4;
            break;
         case '\n':
            if ((rc = SetValue(p, val, linenum)) != 0) return rc;
            ++linenum;
            state = 0;
            break;
         default:
            val += word;
            break;
         }
         break;
      case 4:
         /* Looking for end of line following a continuation */
         switch (tok)
         {
         case ' ':
            break;
         case '\n':
            ++linenum;
            state = 3;
            break;
         default:
            snprintf(buf, sizeof(buf), "invalid continuation of line %d", linenum);
            err_msg = buf;
            return linenum;
         }
         break;
      }
      tok = ReadToken(fin, word);
   }

   if (tok < 0) {
      if (tok == -2) {
         snprintf(buf, sizeof(buf), "missing closing quote on line %d", linenum);
         err_msg = buf;
         return linenum;
      }
      err_msg = "file i/o error";
      return -1;
   }
   switch (state)
   {
   case 1:
      snprintf(buf, sizeof(buf), "invalid keyword on line %d", linenum);
      err_msg = buf;
      return linenum;
   case 2:
      p->value.clear();
      break;
   case 3:
      return SetValue(p, val, linenum);
   case 4:
      snprintf(buf, sizeof(buf), "invalid continuation on line %d", linenum);
      err_msg = buf;
      return linenum;
   }
   return 0;
}

/*
 * Method to write the keywords that have been set to an open file as
 * "keyword = value" lines, preceded by an optional comment line. String
 * values are quoted when needed to read back unchanged.
 * Returns zero on success, else -1.
 */
int IniFile::Write(FILE *fout, const char *comment)
{
   IniValuePairList::iterator p;
   tString val;
   size_t n;

   err_msg.clear();
   if (!fout) {
      err_msg = "bad file stream";
      return -1;
   }
   if (comment && comment[0]) {
      if (fprintf(fout, "# %s\n", comment) < 0) {
         err_msg = "file i/o error";
         return -1;
      }
   }
   for (p = kwmap.begin(); p != kwmap.end(); p++) {
      if (!p->value.IsSet()) continue;
      val = p->value.value;
      if (p->value.type == INIKEYWORDTYPE_SZ
            && (val.empty() || val.find_first_of("\"'\\=#;[] \t\n") != tString::npos)) {
         /* Quote and escape the string */
         val = "\"";
         for (n = 0; n < p->value.value.size(); n++) {
            switch (p->value.value[n]) {
            case '"':
            case '\\':
               val += '\\';
               val += p->value.value[n];
               break;
            case '\n':
               val += "\\n";
               break;
            case '\t':
               val += "\\t";
               break;
            default:
               val += p->value.value[n];
               break;
            }
         }
         val += '"';
      }
      if (fprintf(fout, "%s = %s\n", p->name.c_str(), val.c_str()) < 0) {
         err_msg = "file i/o error";
         return -1;
      }
   }
   if (fflush(fout)) {
      err_msg = "file i/o error";
      return -1;
   }
   return 0;
}
