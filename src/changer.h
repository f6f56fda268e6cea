/* changer.h
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
#ifndef _CHANGER_H_
#define _CHANGER_H_ 1

#include <vector>
#include "tstring.h"
#include "errhandler.h"
#include "changerstate.h"
#include "transfer.h"

/* Actions making up a planned drive transition */
#define CHANGER_STEP_UNLOAD  1
#define CHANGER_STEP_LOAD    2

class ChangerStep
{
public:
   ChangerStep() : action(0), slot(0) {}
   ChangerStep(int act, int s) : action(act), slot(s) {}
public:
   int action;
   int slot;
};

typedef std::vector<ChangerStep> ChangerStepArray;

class RemoteChanger;

/*
 *  Walks the changer's slots in ascending order, producing each slot
 *  number and its volume label on demand. Restart() begins the walk
 *  again from the first slot.
 */
class SlotIterator
{
public:
   explicit SlotIterator(const RemoteChanger &c) : changer(c), next_slot(1) {}
   bool Next(int &slot, tString &label);
   inline void Restart() { next_slot = 1; }
protected:
   const RemoteChanger &changer;
   int next_slot;
};

/*
 *  Emulates a single drive autoloader whose slots are directories under
 *  a remote root and whose drive is a local archive file.
 */
class RemoteChanger
{
public:
   RemoteChanger(Transfer &xfer_in, const tString &root, const tString &archive_dev,
         int slots, const tString &prefix);
   virtual ~RemoteChanger() {}
   int LoadDrive(int slot);
   int UnloadDrive(int slot);
   int PlanLoad(int slot, ChangerStepArray &steps) const;
   tString GetVolumeLabel(int slot) const;
   tString GetRemoteSlotPath(int slot) const;
   tString GetRemoteVolumePath(int slot) const;
   inline SlotIterator Slots() const { return SlotIterator(*this); }
   inline int GetLoadedSlot() const { return state.empty() ? 0 : state.loaded_slot; }
   inline bool DriveEmpty() const { return state.empty(); }
   inline int NumSlots() const { return num_slots; }
   inline const ChangerState& GetState() const { return state; }
   inline void SetState(const ChangerState &st) { state = st; }
   inline int GetError() const { return verr.GetError(); }
   inline const char* GetErrorMsg() const { return verr.GetErrorMsg(); }
protected:
   int CheckSlot(int slot, const char *action);
   int CheckArchiveDevice(const char *action);
   int TransferIn(int slot);
   int TransferOut(int slot);
   int CreateBlankVolume(int slot);
protected:
   Transfer &xfer;
   tString changer_root;
   tString archive_device;
   int num_slots;
   tString label_prefix;
   ChangerState state;
   ErrorHandler verr;
};

#endif /* _CHANGER_H_ */
