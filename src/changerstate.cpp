/* changerstate.cpp
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
 *  Persists the slot currently loaded in the drive across invocations.
*/

#include "config.h"
#include <stdio.h>
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

#include "compat_defs.h"
#include "loghandler.h"
#include "inifile.h"
#include "lockfile.h"
#include "util.h"
#include "changerstate.h"


/*-------------------------------------------------
 *  Method to get the path of the lock file guarding the state file
 *-------------------------------------------------*/
tString StateFile::GetLockPath() const
{
   return path + ".lock";
}


/*-------------------------------------------------
 *  Protected method to parse state from stream 'fs'.
 *  Returns zero on success, else sets lasterr and returns
 *  CHGERR_CONFIG.
 *-------------------------------------------------*/
int StateFile::ParseState(FILE *fs, ChangerState &state)
{
   int rc;
   long slot;
   IniFile ini;

   ini.AddKeyword(STATE_KW_LOADED_SLOT, INIKEYWORDTYPE_LONG);
   rc = ini.Read(fs);
   if (rc) {
      if (rc < 0)
         verr.SetError(CHGERR_CONFIG, "error reading state file %s: %s", path.c_str(),
               ini.GetErrorMessage().c_str());
      else
         verr.SetError(CHGERR_CONFIG, "state file %s is corrupt at line %d: %s", path.c_str(),
               rc, ini.GetErrorMessage().c_str());
      return CHGERR_CONFIG;
   }
   if (!ini[STATE_KW_LOADED_SLOT].IsSet()) {
      verr.SetError(CHGERR_CONFIG, "state file %s has no '%s' keyword", path.c_str(),
            STATE_KW_LOADED_SLOT);
      return CHGERR_CONFIG;
   }
   slot = ini[STATE_KW_LOADED_SLOT].GetLONG();
   if (slot < 0 || slot > 0x7fffffffL) {
      verr.SetError(CHGERR_CONFIG, "state file %s has invalid slot %ld", path.c_str(), slot);
      return CHGERR_CONFIG;
   }
   state.loaded_slot = (int)slot;
   return 0;
}


/*-------------------------------------------------
 *  Method to load changer state from the state file. A missing,
 *  unreadable, or corrupt state file leaves the drive empty and is
 *  logged as a warning.
 *  Returns zero on success, else if the state file could not be
 *  locked sets lasterr and returns CHGERR_CONFIG.
 *-------------------------------------------------*/
int StateFile::Load(ChangerState &state)
{
   FILE *FS;
   LockFile lck;

   state.clear();
   verr.clear();
   if (lck.Lock(GetLockPath())) {
      verr.SetError(CHGERR_CONFIG, "%s", lck.GetErrorMsg());
      return CHGERR_CONFIG;
   }
   if (!file_exists(path.c_str())) {
      logger.Warning("state file %s not found, assuming drive is empty", path.c_str());
      return 0;
   }
   FS = fopen(path.c_str(), "r");
   if (!FS) {
      logger.Warning("cannot open state file %s (errno=%d), assuming drive is empty",
            path.c_str(), errno);
      return 0;
   }
   if (ParseState(FS, state)) {
      state.clear();
      logger.Warning("%s, assuming drive is empty", verr.GetErrorMsg());
      verr.clear();
   }
   fclose(FS);
   logger.Debug("restored state: loaded slot %d", state.loaded_slot);
   return 0;
}


/*-------------------------------------------------
 *  Method to save changer state. The state is written to a temporary
 *  file in the same directory and then renamed over the state file.
 *  Returns zero on success, else sets lasterr and returns
 *  CHGERR_CONFIG.
 *-------------------------------------------------*/
int StateFile::Save(const ChangerState &state)
{
   mode_t old_mask;
   int rc;
   FILE *FS;
   tString tmp;
   IniFile ini;
   LockFile lck;

   verr.clear();
   if (lck.Lock(GetLockPath())) {
      verr.SetError(CHGERR_CONFIG, "%s", lck.GetErrorMsg());
      return CHGERR_CONFIG;
   }
   ini.AddKeyword(STATE_KW_LOADED_SLOT, INIKEYWORDTYPE_LONG);
   ini[STATE_KW_LOADED_SLOT] = (long)(state.empty() ? 0 : state.loaded_slot);

   tFormat(tmp, "%s.%d.tmp", path.c_str(), (int)getpid());
   old_mask = umask(STATE_FILE_MASK);
   FS = fopen(tmp.c_str(), "w");
   rc = errno;
   umask(old_mask);
   if (!FS) {
      verr.SetErrorWithErrno(CHGERR_CONFIG, rc, "cannot create %s", tmp.c_str());
      return CHGERR_CONFIG;
   }
   if (ini.Write(FS, "rchanger state, 0 means the drive is empty")) {
      rc = errno;
      fclose(FS);
      unlink(tmp.c_str());
      verr.SetErrorWithErrno(CHGERR_CONFIG, rc, "error writing %s", tmp.c_str());
      return CHGERR_CONFIG;
   }
   if (fclose(FS)) {
      rc = errno;
      unlink(tmp.c_str());
      verr.SetErrorWithErrno(CHGERR_CONFIG, rc, "error writing %s", tmp.c_str());
      return CHGERR_CONFIG;
   }
   if ((rc = replace_file(tmp.c_str(), path.c_str())) != 0) {
      verr.SetErrorWithErrno(CHGERR_CONFIG, rc, "cannot replace state file %s", path.c_str());
      return CHGERR_CONFIG;
   }
   logger.Debug("saved state: loaded slot %d", state.loaded_slot);
   return 0;
}
