/* mypopen.cpp
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
#include <stdlib.h>
#ifdef HAVE_UNISTD_H
#include <unistd.h>
#endif
#ifdef HAVE_ERRNO_H
#include <errno.h>
#endif
#ifdef HAVE_SYS_STAT_H
#include <sys/stat.h>
#endif
#ifdef HAVE_SYS_WAIT_H
#include <sys/wait.h>
#endif
#ifdef HAVE_FCNTL_H
#include <fcntl.h>
#endif
#include <vector>

#include "loghandler.h"
#include "mypopen.h"


/*
 *  Function to close all pipes that may be open
 */
static void CloseAllPipes(int *pipe_in, int *pipe_out, int *pipe_err)
{
   if (pipe_in[0] >= 0) close(pipe_in[0]);
   if (pipe_in[1] >= 0) close(pipe_in[1]);
   if (pipe_out[0] >= 0) close(pipe_out[0]);
   if (pipe_out[1] >= 0) close(pipe_out[1]);
   if (pipe_err[0] >= 0) close(pipe_err[0]);
   if (pipe_err[1] >= 0) close(pipe_err[1]);
}

/*
 *  Function to create a pipe for one of the child's standard files
 *  when the caller requests it by passing descriptor -1.
 *  Returns zero on success, else errno.
 */
static int OpenChildPipe(int *fno, int *p, const char *which)
{
   if (!fno || *fno >= 0) return 0;
   if (pipe(p)) return errno;
   logger.Debug("popen: child %s uses pipe (%d -> %d)", which, p[0], p[1]);
   return 0;
}

/*
 *  Function to make descriptor 'target' in the child refer to either
 *  the child's end of a pipe or the file given by the caller
 */
static void AssignChildFile(int *fno, int pipe_end, int target)
{
   if (!fno) return;
   if (*fno < 0) {
      dup2(pipe_end, target);
      close(pipe_end);
   } else if (*fno != target) {
      dup2(*fno, target);
      close(*fno);
   }
}


/*
 *  Function to fork a child process, specifying the argument vector of the
 *  command to be run in the child and the child's standard i/o files. args[0]
 *  is the program, which is searched for in PATH if it contains no '/'. If
 *  fno_stdXXX is NULL, then the child will inherit the parent's stdXXX. If
 *  *fno_stdXXX is -1, then a pipe will be created with the child's stdXXX being
 *  one end of the pipe and the other end of the pipe being passed back to the
 *  caller in *fno_stdXXX. If *fno_stdXXX is zero or greater, then it specifies
 *  a file descriptor that will be used as the corresponding stdXXX in the child.
 *  On success, returns the pid of the child. On error, returns -1 and sets errno.
 */
int mypopen_raw(const tStringArray &args, int *fno_stdin, int *fno_stdout, int *fno_stderr)
{
   int rc, pipe_in[2], pipe_out[2], pipe_err[2];
   int n, pid = -1;
   std::vector<char*> argv;

   if (args.empty() || args[0].empty()) {
      errno = EINVAL;
      return -1;
   }
   for (n = 0; n < 2; n++) {
      pipe_in[n] = -1;
      pipe_out[n] = -1;
      pipe_err[n] = -1;
   }
   for (n = 0; n < (int)args.size(); n++) {
      argv.push_back(const_cast<char*>(args[n].c_str()));
   }
   argv.push_back(NULL);

   rc = OpenChildPipe(fno_stdin, pipe_in, "stdin");
   if (!rc) rc = OpenChildPipe(fno_stdout, pipe_out, "stdout");
   if (!rc) rc = OpenChildPipe(fno_stderr, pipe_err, "stderr");
   if (rc) {
      CloseAllPipes(pipe_in, pipe_out, pipe_err);
      errno = rc;
      return -1;
   }

   /* fork a child process to run the command in */
   logger.Debug("popen: forking to run '%s'", argv[0]);
   fflush(stdout);
   fflush(stderr);
   pid = fork();
   switch (pid)
   {
   case -1: /* error creating process */
      rc = errno;
      CloseAllPipes(pipe_in, pipe_out, pipe_err);
      errno = rc;
      return -1;

   case 0: /* child is running */
      /* close pipe ends always used by parent */
      if (pipe_in[1] >= 0) close(pipe_in[1]);
      if (pipe_out[0] >= 0) close(pipe_out[0]);
      if (pipe_err[0] >= 0) close(pipe_err[0]);
      AssignChildFile(fno_stdin, pipe_in[0], STDIN_FILENO);
      AssignChildFile(fno_stdout, pipe_out[1], STDOUT_FILENO);
      AssignChildFile(fno_stderr, pipe_err[1], STDERR_FILENO);
      /* now run the command */
      execvp(argv[0], &argv[0]);
      /* only gets here if execvp fails */
      _exit(MYPOPEN_EXEC_FAILED);
   }

   /* parent is running this, so close pipe ends used by child */
   if (pipe_in[0] >= 0) close(pipe_in[0]);
   if (pipe_out[1] >= 0) close(pipe_out[1]);
   if (pipe_err[1] >= 0) close(pipe_err[1]);

   /* Pass pipe ends being used back to caller */
   if (fno_stdin && *fno_stdin < 0) *fno_stdin = pipe_in[1];
   if (fno_stdout && *fno_stdout < 0) *fno_stdout = pipe_out[0];
   if (fno_stderr && *fno_stderr < 0) *fno_stderr = pipe_err[0];
   logger.Debug("popen: parent returning pid=%d of child", pid);
   return pid;
}


/*
 *  Function to open the file a child is to use for one of its standard
 *  files. An empty name means "/dev/null". Output files are appended to.
 *  Returns the open descriptor, or -1 with errno set.
 */
static int OpenChildFile(const char *fname, bool for_write)
{
   if (!for_write) {
      return open(fname[0] ? fname : "/dev/null", O_RDONLY);
   }
   if (!fname[0]) return open("/dev/null", O_WRONLY);
   return open(fname, O_WRONLY | O_CREAT | O_APPEND, S_IRUSR | S_IWUSR | S_IRGRP);
}

static void CloseChildFiles(int fno_in, int fno_out, int fno_err)
{
   if (fno_in >= 0) close(fno_in);
   if (fno_out >= 0) close(fno_out);
   if (fno_err >= 0) close(fno_err);
}


/*
 *  Function to run a command in a child process, specifying the files the
 *  child will use for stdXXX, and wait for it to exit. If cmd_XXX is non-null,
 *  then it specifies the name of a file that the child is to use as its stdXXX.
 *  If the filename is empty then "/dev/null" is used. If cmd_XXX is NULL, then
 *  the child will use the caller's stdXXX.
 *  On success, returns the exit status of the command (MYPOPEN_EXEC_FAILED if
 *  the command could not be executed). On error, or if the child was killed by
 *  a signal, returns -1 and sets errno appropriately.
 */
int mypopenrw(const tStringArray &args, const char *cmd_in, const char *cmd_out, const char *cmd_err)
{
   int pid, rc, st;
   int fno_in = -1, fno_out = -1, fno_err = -1;
   int *fno_in_p = NULL, *fno_out_p = NULL, *fno_err_p = NULL;

   /* Open files the child will use as stdin, stdout, and stderr */
   if (cmd_in) {
      fno_in = OpenChildFile(cmd_in, false);
      if (fno_in < 0) return -1;
      fno_in_p = &fno_in;
   }
   if (cmd_out) {
      fno_out = OpenChildFile(cmd_out, true);
      if (fno_out < 0) {
         rc = errno;
         CloseChildFiles(fno_in, fno_out, fno_err);
         errno = rc;
         return -1;
      }
      fno_out_p = &fno_out;
   }
   if (cmd_err) {
      fno_err = OpenChildFile(cmd_err, true);
      if (fno_err < 0) {
         rc = errno;
         CloseChildFiles(fno_in, fno_out, fno_err);
         errno = rc;
         return -1;
      }
      fno_err_p = &fno_err;
   }
   pid = mypopen_raw(args, fno_in_p, fno_out_p, fno_err_p);
   rc = errno;
   CloseChildFiles(fno_in, fno_out, fno_err);
   if (pid < 0) {
      errno = rc;
      return -1;
   }

   /* Wait for child process to exit */
   rc = waitpid(pid, &st, 0);
   while (rc < 0) {
      if (errno != EINTR) return -1;
      rc = waitpid(pid, &st, 0);
   }
   if (!WIFEXITED(st)) {
      /* Command was killed for some reason */
      logger.Debug("popen: child pid=%d terminated abnormally", pid);
      errno = EINTR;
      return -1;
   }
   return WEXITSTATUS(st);
}
