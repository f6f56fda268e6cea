/*  test_lockfile.cpp
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
 */

#include <gtest/gtest.h>
#include <unistd.h>
#include <fcntl.h>
#include <sys/file.h>
#include <sys/time.h>
#include <sys/wait.h>
#include "lockfile.h"
#include "test_util.h"

/* True if some other open file description holds a lock on 'fname' */
static bool held_elsewhere(const tString &fname)
{
   bool held;
   int fd = open(fname.c_str(), O_RDWR);
   if (fd < 0) return false;
   held = flock(fd, LOCK_EX | LOCK_NB) != 0;
   close(fd);
   return held;
}

static double now_seconds()
{
   struct timeval tv;
   gettimeofday(&tv, NULL);
   return tv.tv_sec + tv.tv_usec / 1e6;
}

TEST(LockFileTest, LockAndUnlock)
{
   TempDir tmp;
   tString fname = tmp.Path("rchanger.lock");
   LockFile lck;

   ASSERT_EQ(0, lck.Lock(fname, true));
   EXPECT_TRUE(lck.IsLocked());
   EXPECT_TRUE(held_elsewhere(fname));
   lck.Unlock();
   EXPECT_FALSE(lck.IsLocked());
   EXPECT_FALSE(held_elsewhere(fname));
}

TEST(LockFileTest, WaitsForHolderToRelease)
{
   TempDir tmp;
   tString fname = tmp.Path("rchanger.lock");
   int pfd[2], status = -1;
   char c;
   double start, waited;
   pid_t pid;

   ASSERT_EQ(0, pipe(pfd));
   pid = fork();
   ASSERT_GE(pid, 0);
   if (pid == 0) {
      /* holder: lock, signal the parent, hold for a second, then exit */
      LockFile holder;
      close(pfd[0]);
      if (holder.Lock(fname)) _exit(1);
      if (write(pfd[1], "x", 1) != 1) _exit(1);
      sleep(1);
      _exit(0);
   }
   close(pfd[1]);
   ASSERT_EQ(1, read(pfd[0], &c, 1));
   close(pfd[0]);
   EXPECT_TRUE(held_elsewhere(fname));

   LockFile lck;
   start = now_seconds();
   ASSERT_EQ(0, lck.Lock(fname, true));
   waited = now_seconds() - start;
   EXPECT_GE(waited, 0.5);
   ASSERT_EQ(pid, waitpid(pid, &status, 0));
   EXPECT_TRUE(WIFEXITED(status));
   EXPECT_EQ(0, WEXITSTATUS(status));
}

TEST(LockFileTest, HolderPidIsRecorded)
{
   TempDir tmp;
   tString fname = tmp.Path("rchanger.lock");
   tString expect;
   LockFile lck;

   ASSERT_EQ(0, lck.Lock(fname, true));
   tFormat(expect, "%d\n", (int)getpid());
   EXPECT_EQ(expect, read_file(fname));
   EXPECT_STREQ(fname.c_str(), lck.GetPath());
}

TEST(LockFileTest, ReleasedWhenDestroyed)
{
   TempDir tmp;
   tString fname = tmp.Path("scoped.lock");
   {
      LockFile lck;
      ASSERT_EQ(0, lck.Lock(fname));
      EXPECT_TRUE(held_elsewhere(fname));
   }
   EXPECT_FALSE(held_elsewhere(fname));
   EXPECT_TRUE(path_exists(fname));
}

TEST(LockFileTest, MissingDirectoryIsConfigError)
{
   TempDir tmp;
   LockFile lck;
   EXPECT_EQ(CHGERR_CONFIG, lck.Lock(tmp.Path("nodir/rchanger.lock")));
   EXPECT_EQ(CHGERR_CONFIG, lck.GetError());
   EXPECT_FALSE(lck.IsLocked());
}
