/* changerstate.h
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
#ifndef _CHANGERSTATE_H_
#define _CHANGERSTATE_H_ 1

#include "tstring.h"
#include "errhandler.h"

/* Keyword holding the loaded slot in the state file */
#define STATE_KW_LOADED_SLOT "loaded slot"

class ChangerState
{
public:
   ChangerState() : loaded_slot(0) {}
   explicit ChangerState(int slot) : loaded_slot(slot < 0 ? 0 : slot) {}
   virtual ~ChangerState() {}
   inline void clear() { loaded_slot = 0; }
   inline bool empty() const { return loaded_slot <= 0; }
   inline bool operator==(const ChangerState &b) const { return loaded_slot == b.loaded_slot; }
   inline bool operator!=(const ChangerState &b) const { return loaded_slot != b.loaded_slot; }
public:
   int loaded_slot;  /* zero when the drive is empty */
};

/*
 *  Reads and writes the changer state file. The file is only accessed
 *  while holding an exclusive lock on a companion "<file>.lock" file.
 */
class StateFile
{
public:
   StateFile() {}
   explicit StateFile(const tString &fname) : path(fname) {}
   virtual ~StateFile() {}
   inline void SetPath(const tString &fname) { path = fname; }
   inline const tString& GetPath() const { return path; }
   tString GetLockPath() const;
   int Load(ChangerState &state);
   int Save(const ChangerState &state);
   inline int GetError() const { return verr.GetError(); }
   inline const char* GetErrorMsg() const { return verr.GetErrorMsg(); }
protected:
   int ParseState(FILE *fs, ChangerState &state);
protected:
   tString path;
   ErrorHandler verr;
};

#endif /* _CHANGERSTATE_H_ */
