/* transfer.cpp
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
 *  Moves volume files to and from the remote archive store by running
 *  rclone in a child process.
 */

#include "config.h"
#include <stdio.h>
#ifdef HAVE_ERRNO_H
#include <errno.h>
#endif

#include "loghandler.h"
#include "mypopen.h"
#include "transfer.h"


/*-------------------------------------------------
 *  Method to build the argument vector for an rclone command.
 *  The fixed options come first, then the user's extra options,
 *  then the operation and its paths.
 *------------------------------------------------*/
void RcloneTransfer::BuildArgs(tStringArray &args, const char *op, const tString &src,
      const tString &dest) const
{
   size_t n;
   args.clear();
   args.push_back(conf.binary);
   if (!conf.config_file.empty()) {
      args.push_back("--config");
      args.push_back(conf.config_file);
   }
   if (!conf.logfile.empty()) {
      args.push_back("--log-file");
      args.push_back(conf.logfile);
   }
   args.push_back("--quiet");
   args.push_back("--checksum");
   for (n = 0; n < conf.extra_opts.size(); n++) {
      args.push_back(conf.extra_opts[n]);
   }
   args.push_back(op);
   args.push_back(src);
   if (!dest.empty()) args.push_back(dest);
}


/*-------------------------------------------------
 *  Protected method to run an rclone operation with its output
 *  discarded. Returns the exit status of rclone, or -1 if it could
 *  not be run or executed, in which case lasterr is set.
 *------------------------------------------------*/
int RcloneTransfer::Run(const char *op, const tString &src, const tString &dest)
{
   int rc;
   tStringArray args;

   BuildArgs(args, op, src, dest);
   logger.Debug("running %s %s %s %s", conf.binary.c_str(), op, src.c_str(), dest.c_str());
   rc = mypopenrw(args, "", "", "");
   if (rc < 0) {
      verr.SetErrorWithErrno(CHGERR_TRANSFER, errno, "failed to run %s %s", conf.binary.c_str(), op);
      return -1;
   }
   if (rc == MYPOPEN_EXEC_FAILED) {
      verr.SetError(CHGERR_TRANSFER, "could not execute %s for %s (exit status %d)",
            conf.binary.c_str(), op, rc);
      logger.Warning("%s", verr.GetErrorMsg());
      return -1;
   }
   return rc;
}


/*-------------------------------------------------
 *  Method to copy file 'src' into directory 'dest_dir'
 *------------------------------------------------*/
int RcloneTransfer::Copy(const tString &src, const tString &dest_dir)
{
   int rc;
   verr.clear();
   rc = Run("copy", src, dest_dir);
   if (rc < 0) return CHGERR_TRANSFER;
   if (rc) {
      verr.SetError(CHGERR_TRANSFER, "rclone copy %s to %s failed with exit status %d",
            src.c_str(), dest_dir.c_str(), rc);
      return CHGERR_TRANSFER;
   }
   logger.Info("copied %s to %s", src.c_str(), dest_dir.c_str());
   return 0;
}


/*-------------------------------------------------
 *  Method to move file 'src' into directory 'dest_dir'
 *------------------------------------------------*/
int RcloneTransfer::Move(const tString &src, const tString &dest_dir)
{
   int rc;
   verr.clear();
   rc = Run("move", src, dest_dir);
   if (rc < 0) return CHGERR_TRANSFER;
   if (rc) {
      verr.SetError(CHGERR_TRANSFER, "rclone move %s to %s failed with exit status %d",
            src.c_str(), dest_dir.c_str(), rc);
      return CHGERR_TRANSFER;
   }
   logger.Info("moved %s to %s", src.c_str(), dest_dir.c_str());
   return 0;
}


/*-------------------------------------------------
 *  Method to determine if 'path' exists in the remote store.
 *  Returns XFER_PRESENT if it does, XFER_NOT_FOUND if rclone reports
 *  that it does not, else XFER_PROBE_FAILED with lasterr set.
 *------------------------------------------------*/
int RcloneTransfer::Probe(const tString &path)
{
   int rc;
   verr.clear();
   rc = Run("ls", path, tString());
   if (rc < 0) return XFER_PROBE_FAILED;
   switch (rc) {
   case 0:
      return XFER_PRESENT;
   case RCLONE_EXIT_DIR_NOT_FOUND:
   case RCLONE_EXIT_FILE_NOT_FOUND:
      return XFER_NOT_FOUND;
   }
   verr.SetError(CHGERR_TRANSFER, "rclone ls %s failed with exit status %d", path.c_str(), rc);
   return XFER_PROBE_FAILED;
}
