/* transfer.h
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
#ifndef _TRANSFER_H_
#define _TRANSFER_H_ 1

#include "tstring.h"
#include "errhandler.h"

/* Results of probing the remote store for a path */
#define XFER_PROBE_FAILED  -1
#define XFER_NOT_FOUND      0
#define XFER_PRESENT        1

/* rclone exit codes meaning the path does not exist */
#define RCLONE_EXIT_DIR_NOT_FOUND   3
#define RCLONE_EXIT_FILE_NOT_FOUND  4

class TransferConfig
{
public:
   TransferConfig() {}
   virtual ~TransferConfig() {}
public:
   tString binary;
   tString config_file;
   tString logfile;
   tStringArray extra_opts;
};

/*
 *  Synchronous copy, move, and existence probe against the remote
 *  archive store. Copy() and Move() take a source file and a destination
 *  directory. They return zero on success, else CHGERR_TRANSFER with the
 *  error message available from GetErrorMsg().
 */
class Transfer
{
public:
   Transfer() {}
   virtual ~Transfer() {}
   virtual int Copy(const tString &src, const tString &dest_dir) = 0;
   virtual int Move(const tString &src, const tString &dest_dir) = 0;
   virtual int Probe(const tString &path) = 0;
   inline bool Exists(const tString &path) { return Probe(path) == XFER_PRESENT; }
   inline int GetError() const { return verr.GetError(); }
   inline const char* GetErrorMsg() const { return verr.GetErrorMsg(); }
   inline const ErrorHandler& GetErrorHandler() const { return verr; }
protected:
   ErrorHandler verr;
};

/*
 *  Transfer implementation that runs the rclone command line tool
 */
class RcloneTransfer : public Transfer
{
public:
   explicit RcloneTransfer(const TransferConfig &config) : conf(config) {}
   virtual ~RcloneTransfer() {}
   virtual int Copy(const tString &src, const tString &dest_dir);
   virtual int Move(const tString &src, const tString &dest_dir);
   virtual int Probe(const tString &path);
   void BuildArgs(tStringArray &args, const char *op, const tString &src,
         const tString &dest = tString()) const;
protected:
   int Run(const char *op, const tString &src, const tString &dest);
protected:
   TransferConfig conf;
};

#endif /* _TRANSFER_H_ */
