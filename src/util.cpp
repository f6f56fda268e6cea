/* util.cpp
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
 * This file simply provides some file utility functions
 */

#include "config.h"
#include <stdio.h>
#ifdef HAVE_STDLIB_H
#include <stdlib.h>
#endif
#ifdef HAVE_ERRNO_H
#include <errno.h>
#endif
#ifdef HAVE_UNISTD_H
#include <unistd.h>
#endif
#ifdef HAVE_SYS_TYPES_H
#include <sys/types.h>
#endif
#ifdef HAVE_SYS_STAT_H
#include <sys/stat.h>
#endif
#ifdef HAVE_FCNTL_H
#include <fcntl.h>
#endif

#include "compat_defs.h"
#include "tstring.h"
#include "util.h"


/*-------------------------------------------------
 *  Function returns true if 'fname' exists
 *------------------------------------------------*/
bool file_exists(const char *fname)
{
   struct stat st;
   return stat(fname, &st) == 0;
}


/*-------------------------------------------------
 *  Function to truncate existing file 'fname' to zero length.
 *  On success returns zero, else returns errno
 *------------------------------------------------*/
int truncate_file(const char *fname)
{
   if (truncate(fname, 0)) return errno;
   return 0;
}


/*-------------------------------------------------
 *  Function to rename 'tmp_fname' over 'fname' after flushing it to
 *  disk, so that 'fname' is replaced in full or not at all.
 *  On success returns zero, else removes 'tmp_fname' and returns errno
 *------------------------------------------------*/
int replace_file(const char *tmp_fname, const char *fname)
{
   int fd, rc;
   fd = open(tmp_fname, O_RDONLY);
   if (fd >= 0) {
      fsync(fd);
      close(fd);
   }
   if (rename(tmp_fname, fname)) {
      rc = errno;
      unlink(tmp_fname);
      return rc;
   }
   return 0;
}


/*-------------------------------------------------
 *  Function to replace 'fname', if it exists, with a new empty file.
 *  The empty file is created beside 'fname' and renamed over it, so
 *  'fname' is never missing if creation fails.
 *  On success returns zero, else returns errno
 *------------------------------------------------*/
int create_empty_file(const char *fname)
{
   int fd, rc;
   tString tmp;

   tFormat(tmp, "%s.%d.new", fname, (int)getpid());
   fd = open(tmp.c_str(), O_WRONLY | O_CREAT | O_TRUNC, 0640);
   if (fd < 0) return errno;
   if (close(fd)) {
      rc = errno;
      unlink(tmp.c_str());
      return rc;
   }
   return replace_file(tmp.c_str(), fname);
}


/*-------------------------------------------------
 *  Function to create the directory containing 'fname' if it does
 *  not exist. Only the last directory component is created.
 *  On success returns zero, else returns errno
 *------------------------------------------------*/
int make_parent_dir(const char *fname)
{
   int rc = 0;
   mode_t old_mask;
   tString dir = tDirName(fname);

   if (access(dir.c_str(), W_OK) == 0) return 0;
   if (errno != ENOENT) return errno;
   old_mask = umask(STATE_FILE_MASK);
   if (mkdir(dir.c_str(), STATE_DIR_MODE)) rc = errno;
   umask(old_mask);
   return rc;
}
