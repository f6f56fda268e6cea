/*  test_util.h
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
 *  Scratch directory and file helpers shared by the unit tests
 */
#ifndef _TEST_UTIL_H_
#define _TEST_UTIL_H_ 1

#include <stdio.h>
#include <stdlib.h>
#include <unistd.h>
#include <sys/stat.h>
#include "tstring.h"

/* Removes the directory tree rooted at 'path' */
inline void remove_tree(const tString &path)
{
   tString cmd = "rm -rf '" + path + "'";
   if (system(cmd.c_str()) != 0) {
      fprintf(stderr, "could not remove %s\n", path.c_str());
   }
}

/*
 *  Creates a scratch directory that is removed, with its contents,
 *  when the object is destroyed
 */
class TempDir
{
public:
   TempDir()
   {
      char tmpl[] = "/tmp/rchanger-test-XXXXXX";
      if (mkdtemp(tmpl)) path = tmpl;
   }
   ~TempDir() { if (!path.empty()) remove_tree(path); }
   tString Path(const char *name) const { return path + "/" + name; }
   const tString& Root() const { return path; }
public:
   tString path;
};

inline bool write_file(const tString &fname, const tString &contents)
{
   FILE *fs = fopen(fname.c_str(), "w");
   if (!fs) return false;
   fputs(contents.c_str(), fs);
   return fclose(fs) == 0;
}

inline tString read_file(const tString &fname)
{
   tString contents;
   char buf[1024];
   size_t n;
   FILE *fs = fopen(fname.c_str(), "r");
   if (!fs) return contents;
   while ((n = fread(buf, 1, sizeof(buf), fs)) > 0) contents.append(buf, n);
   fclose(fs);
   return contents;
}

/* Appends 'name' to directory 'dir' */
inline tString path_join(const tString &dir, const tString &name)
{
   if (dir.empty()) return name;
   if (dir[dir.size() - 1] == '/') return dir + name;
   return dir + "/" + name;
}

inline bool path_exists(const tString &fname)
{
   struct stat st;
   return stat(fname.c_str(), &st) == 0;
}

inline long file_size(const tString &fname)
{
   struct stat st;
   if (stat(fname.c_str(), &st)) return -1;
   return (long)st.st_size;
}

/* Reads back everything written to a tmpfile() stream */
inline tString read_stream(FILE *fs)
{
   tString contents;
   char buf[1024];
   size_t n;
   fflush(fs);
   rewind(fs);
   while ((n = fread(buf, 1, sizeof(buf), fs)) > 0) contents.append(buf, n);
   return contents;
}

#endif /* _TEST_UTIL_H_ */
