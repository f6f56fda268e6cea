/* lockfile.h
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
#ifndef _LOCKFILE_H_
#define _LOCKFILE_H_ 1

#include "tstring.h"
#include "errhandler.h"

/*
 *  An exclusive advisory lock on a lock file. Lock() blocks until the lock
 *  is obtained. The lock is released by Unlock(), by the destructor, or by
 *  the OS when the process exits. The lock file itself is left in place.
 */
class LockFile
{
public:
   LockFile() : fd(-1) {}
   virtual ~LockFile();
   int Lock(const char *fname, bool write_pid = false);
   inline int Lock(const tString &fname, bool write_pid = false) { return Lock(fname.c_str(), write_pid); }
   void Unlock();
   inline bool IsLocked() const { return fd >= 0; }
   inline const char* GetPath() const { return path.c_str(); }
   inline int GetError() const { return verr.GetError(); }
   inline const char* GetErrorMsg() const { return verr.GetErrorMsg(); }
protected:
   int fd;
   tString path;
   ErrorHandler verr;
private:
   LockFile(const LockFile&);
   LockFile& operator=(const LockFile&);
};

#endif /* _LOCKFILE_H_ */
