/* lockfile.cpp
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
 *  Provides a class to serialize access to the changer, and to the
 *  changer's state file, using flock() on a lock file.
 */

#include "config.h"
#include <stdio.h>
#ifdef HAVE_STRING_H
#include <string.h>
#endif
#ifdef HAVE_ERRNO_H
#include <errno.h>
#endif
#ifdef HAVE_UNISTD_H
#include <unistd.h>
#endif
#ifdef HAVE_FCNTL_H
#include <fcntl.h>
#endif
#ifdef HAVE_SYS_STAT_H
#include <sys/stat.h>
#endif
#ifdef HAVE_SYS_FILE_H
#include <sys/file.h>
#endif

#include "compat_defs.h"
#include "loghandler.h"
#include "lockfile.h"


/*-------------------------------------------------
 * destructor
 *-------------------------------------------------*/
LockFile::~LockFile()
{
   Unlock();
}


/*-------------------------------------------------
 *  Method to open lock file 'fname', creating it if needed, and
 *  obtain an exclusive lock on it, waiting as long as it takes for
 *  another process to release it. If 'write_pid' is true, then the
 *  lock file is overwritten with the PID of this process once locked.
 *  On success returns zero, otherwise sets lasterr and returns the
 *  error kind.
 *------------------------------------------------*/
int LockFile::Lock(const char *fname, bool write_pid)
{
   int rc;
   mode_t old_mask;
   char buf[64];

   if (fd >= 0) return 0;
   verr.clear();
   if (!fname || !fname[0]) {
      verr.SetError(CHGERR_CONFIG, "lock file path is empty");
      return CHGERR_CONFIG;
   }
   path = fname;
   old_mask = umask(STATE_FILE_MASK);
   fd = open(fname, O_RDWR | O_CREAT | O_CLOEXEC, 0660);
   rc = errno;
   umask(old_mask);
   if (fd < 0) {
      verr.SetErrorWithErrno(CHGERR_CONFIG, rc, "cannot open lock file %s", fname);
      return CHGERR_CONFIG;
   }
   while (flock(fd, LOCK_EX)) {
      rc = errno;
      if (rc == EINTR) continue;
      close(fd);
      fd = -1;
      verr.SetErrorWithErrno(CHGERR_CONFIG, rc, "cannot lock %s", fname);
      return CHGERR_CONFIG;
   }
   if (write_pid) {
      /* Record PID of lock holder */
      snprintf(buf, sizeof(buf), "%d\n", (int)getpid());
      if (ftruncate(fd, 0) || pwrite(fd, buf, strlen(buf), 0) < 0) {
         logger.Warning("WARNING! could not write pid to lock file %s (errno=%d)", fname, errno);
      }
   }
   logger.Debug("locked %s for pid %d", fname, (int)getpid());
   return 0;
}


/*-------------------------------------------------
 *  Method to release the lock
 *------------------------------------------------*/
void LockFile::Unlock()
{
   if (fd < 0) return;
   flock(fd, LOCK_UN);
   close(fd);
   fd = -1;
   logger.Debug("unlocked %s for pid %d", path.c_str(), (int)getpid());
}
