/* changer.cpp
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
 *  Implements load and unload of the virtual drive by transferring
 *  volume files between the remote archive store and the local
 *  archive device.
 */

#include "config.h"
#include <stdio.h>
#ifdef HAVE_ERRNO_H
#include <errno.h>
#endif

#include "compat_defs.h"
#include "loghandler.h"
#include "util.h"
#include "changer.h"


/*-------------------------------------------------
 *  Function to append 'name' to remote path 'root'. No delimiter is
 *  inserted after a bare remote name ("remote:") or a trailing '/'.
 *------------------------------------------------*/
static tString remote_join(const tString &root, const tString &name)
{
   tString result(root);
   if (result.empty()) return name;
   switch (result[result.size() - 1]) {
   case ':':
   case '/':
      break;
   default:
      result += '/';
      break;
   }
   result += name;
   return result;
}


///////////////////////////////////////////////////
//  Class SlotIterator
///////////////////////////////////////////////////

/*-------------------------------------------------
 *  Method to get the next slot and its label. Returns false once
 *  every slot has been produced.
 *------------------------------------------------*/
bool SlotIterator::Next(int &slot, tString &label)
{
   if (next_slot > changer.NumSlots()) return false;
   slot = next_slot++;
   label = changer.GetVolumeLabel(slot);
   return true;
}


///////////////////////////////////////////////////
//  Class RemoteChanger
///////////////////////////////////////////////////

RemoteChanger::RemoteChanger(Transfer &xfer_in, const tString &root, const tString &archive_dev,
      int slots, const tString &prefix)
   : xfer(xfer_in), changer_root(root), archive_device(archive_dev), num_slots(slots),
     label_prefix(prefix)
{
}


/*-------------------------------------------------
 *  Method to get the barcode label of the volume in 'slot'
 *------------------------------------------------*/
tString RemoteChanger::GetVolumeLabel(int slot) const
{
   tString label;
   tFormat(label, "%s-%05d", label_prefix.c_str(), slot);
   return label;
}


/*-------------------------------------------------
 *  Method to get the remote directory holding the volume of 'slot'
 *------------------------------------------------*/
tString RemoteChanger::GetRemoteSlotPath(int slot) const
{
   tString s;
   tFormat(s, "%d", slot);
   return remote_join(changer_root, s);
}


/*-------------------------------------------------
 *  Method to get the remote path of the volume file of 'slot'. The
 *  file has the same name as the local archive device.
 *------------------------------------------------*/
tString RemoteChanger::GetRemoteVolumePath(int slot) const
{
   return remote_join(GetRemoteSlotPath(slot), tBaseName(archive_device));
}


/*-------------------------------------------------
 *  Protected method to verify 'slot' is a valid slot number
 *------------------------------------------------*/
int RemoteChanger::CheckSlot(int slot, const char *action)
{
   if (slot < 1 || slot > num_slots) {
      verr.SetError(CHGERR_BAD_SLOT, "cannot %s invalid slot %d (changer has %d slots)",
            action, slot, num_slots);
      return CHGERR_BAD_SLOT;
   }
   return 0;
}


/*-------------------------------------------------
 *  Protected method to verify an archive device was given
 *------------------------------------------------*/
int RemoteChanger::CheckArchiveDevice(const char *action)
{
   if (archive_device.empty()) {
      verr.SetError(CHGERR_CONFIG, "cannot %s without an archive device", action);
      return CHGERR_CONFIG;
   }
   return 0;
}


/*-------------------------------------------------
 *  Method to build the steps needed to load 'slot' into the drive.
 *  When another slot is loaded, it must be unloaded first. When 'slot'
 *  is already loaded, no steps are needed.
 *  Returns the number of steps.
 *------------------------------------------------*/
int RemoteChanger::PlanLoad(int slot, ChangerStepArray &steps) const
{
   steps.clear();
   if (GetLoadedSlot() == slot) return 0;
   if (!state.empty()) steps.push_back(ChangerStep(CHANGER_STEP_UNLOAD, state.loaded_slot));
   steps.push_back(ChangerStep(CHANGER_STEP_LOAD, slot));
   return (int)steps.size();
}


/*-------------------------------------------------
 *  Protected method to replace the archive device with an empty
 *  file for a slot that has no volume in the remote store yet.
 *------------------------------------------------*/
int RemoteChanger::CreateBlankVolume(int slot)
{
   int rc = create_empty_file(archive_device.c_str());
   if (rc) {
      verr.SetErrorWithErrno(CHGERR_CONFIG, rc, "cannot create blank volume %s for slot %d",
            archive_device.c_str(), slot);
      return CHGERR_CONFIG;
   }
   logger.Notice("slot %d has no volume in %s, created blank volume %s", slot,
         changer_root.c_str(), archive_device.c_str());
   return 0;
}


/*-------------------------------------------------
 *  Protected method to fetch the volume of 'slot' into the drive.
 *  On success sets the drive loaded from 'slot' and returns zero,
 *  else sets lasterr and returns the error kind.
 *------------------------------------------------*/
int RemoteChanger::TransferIn(int slot)
{
   int rc;
   tString src = GetRemoteVolumePath(slot);

   switch (xfer.Probe(src)) {
   case XFER_PRESENT:
      if (xfer.Copy(src, tDirName(archive_device))) {
         verr.SetError(xfer.GetErrorHandler());
         return CHGERR_TRANSFER;
      }
      break;
   case XFER_NOT_FOUND:
      if ((rc = CreateBlankVolume(slot)) != 0) return rc;
      break;
   default:
      logger.Warning("WARNING! could not probe %s: %s", src.c_str(), xfer.GetErrorMsg());
      if ((rc = CreateBlankVolume(slot)) != 0) return rc;
      break;
   }
   state.loaded_slot = slot;
   logger.Notice("loaded drive 0 from slot %d (%s)", slot, GetVolumeLabel(slot).c_str());
   return 0;
}


/*-------------------------------------------------
 *  Protected method to store the volume in the drive back into 'slot'
 *  and truncate the archive device. On success sets the drive empty
 *  and returns zero, else sets lasterr and returns the error kind with
 *  the drive still loaded.
 *------------------------------------------------*/
int RemoteChanger::TransferOut(int slot)
{
   int rc;

   if (xfer.Copy(archive_device, GetRemoteSlotPath(slot))) {
      verr.SetError(xfer.GetErrorHandler());
      return CHGERR_TRANSFER;
   }
   if ((rc = truncate_file(archive_device.c_str())) != 0) {
      verr.SetErrorWithErrno(CHGERR_CONFIG, rc, "stored slot %d but cannot truncate %s",
            slot, archive_device.c_str());
      return CHGERR_CONFIG;
   }
   state.clear();
   logger.Notice("unloaded drive 0 to slot %d (%s)", slot, GetVolumeLabel(slot).c_str());
   return 0;
}


/*-------------------------------------------------
 *  Method to load the drive from 'slot'. If another slot is loaded,
 *  it is unloaded first, and if that fails the load is abandoned.
 *  Returns zero on success, else sets lasterr and returns the error
 *  kind.
 *------------------------------------------------*/
int RemoteChanger::LoadDrive(int slot)
{
   int rc;
   size_t n;
   ChangerStepArray steps;

   verr.clear();
   if ((rc = CheckSlot(slot, "load")) != 0) return rc;
   if ((rc = CheckArchiveDevice("load")) != 0) return rc;
   if (PlanLoad(slot, steps) == 0) {
      logger.Info("drive 0 already loaded from slot %d", slot);
      return 0;
   }
   for (n = 0; n < steps.size(); n++) {
      switch (steps[n].action) {
      case CHANGER_STEP_UNLOAD:
         logger.Warning("WARNING! drive 0 loaded from slot %d, unloading it before loading slot %d",
               steps[n].slot, slot);
         rc = TransferOut(steps[n].slot);
         break;
      case CHANGER_STEP_LOAD:
         rc = TransferIn(steps[n].slot);
         break;
      }
      if (rc) return rc;
   }
   return 0;
}


/*-------------------------------------------------
 *  Method to unload the drive to 'slot', which must be the slot the
 *  drive is loaded from.
 *  Returns zero on success, else sets lasterr and returns the error
 *  kind.
 *------------------------------------------------*/
int RemoteChanger::UnloadDrive(int slot)
{
   int rc;

   verr.clear();
   if ((rc = CheckSlot(slot, "unload")) != 0) return rc;
   if (state.empty()) {
      verr.SetError(CHGERR_INVALID_STATE, "cannot unload slot %d, drive 0 is empty", slot);
      return CHGERR_INVALID_STATE;
   }
   if (state.loaded_slot != slot) {
      verr.SetError(CHGERR_INVALID_STATE, "cannot unload slot %d, drive 0 is loaded from slot %d",
            slot, state.loaded_slot);
      return CHGERR_INVALID_STATE;
   }
   if ((rc = CheckArchiveDevice("unload")) != 0) return rc;
   return TransferOut(slot);
}
