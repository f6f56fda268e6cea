/*  commands.cpp
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
 *  Autochanger API commands
 */

#include "config.h"
#include <stdio.h>
#ifdef HAVE_UNISTD_H
#include <unistd.h>
#endif
#ifdef HAVE_CTYPE_H
#include <ctype.h>
#endif

#include "loghandler.h"
#include "commands.h"


/*-------------------------------------------------
 *   LIST Command
 * Prints a line on stdout for each slot of the form
 *       s:barcode
 * where 's' is the one-based slot number and 'barcode' is the label
 * of the volume in the slot. Every slot holds a volume, even if it
 * is currently loaded in the drive.
 *------------------------------------------------*/
static int do_list_cmd(RemoteChanger &changer, const CommandParams &params, FILE *out)
{
   int slot;
   tString label;
   SlotIterator it = changer.Slots();

   while (it.Next(slot, label)) {
      fprintf(out, "%d:%s\n", slot, label.c_str());
   }
   logger.Info("  SUCCESS sent list to stdout");
   return 0;
}


/*-------------------------------------------------
 *   SLOTS Command
 * Prints the number of slots the changer has
 *------------------------------------------------*/
static int do_slots_cmd(RemoteChanger &changer, const CommandParams &params, FILE *out)
{
   fprintf(out, "%d\n", changer.NumSlots());
   logger.Info("  SUCCESS reporting %d slots", changer.NumSlots());
   return 0;
}


/*-------------------------------------------------
 *   LOAD Command
 *------------------------------------------------*/
static int do_load_cmd(RemoteChanger &changer, const CommandParams &params, FILE *out)
{
   if (changer.LoadDrive(params.slot)) {
      logger.Error("  ERROR loading slot %d into drive %d", params.slot, params.drive);
      return changer.GetError();
   }
   logger.Info("  SUCCESS loading slot %d into drive %d", params.slot, params.drive);
   return 0;
}


/*-------------------------------------------------
 *   UNLOAD Command
 *------------------------------------------------*/
static int do_unload_cmd(RemoteChanger &changer, const CommandParams &params, FILE *out)
{
   if (changer.UnloadDrive(params.slot)) {
      logger.Error("  ERROR unloading slot %d from drive %d", params.slot, params.drive);
      return changer.GetError();
   }
   logger.Info("  SUCCESS unloading slot %d from drive %d", params.slot, params.drive);
   return 0;
}


/*-------------------------------------------------
 *   LOADED Command
 * Prints the slot number of the volume currently loaded into the
 * drive, or zero if the drive is unloaded.
 *------------------------------------------------*/
static int do_loaded_cmd(RemoteChanger &changer, const CommandParams &params, FILE *out)
{
   int slot = changer.GetLoadedSlot();
   fprintf(out, "%d\n", slot);
   logger.Info("  SUCCESS reporting drive %d loaded from slot %d", params.drive, slot);
   return 0;
}


/*-------------------------------------------------
 *   LISTALL Command
 * Prints state of the drive (loaded or empty), followed by state
 * of the slots (full or empty).
 *------------------------------------------------*/
static int do_listall_cmd(RemoteChanger &changer, const CommandParams &params, FILE *out)
{
   int slot, loaded = changer.GetLoadedSlot();
   tString label;
   SlotIterator it = changer.Slots();

   /* Print drive state info */
   if (changer.DriveEmpty()) {
      fprintf(out, "D:0:E\n");
   } else {
      fprintf(out, "D:0:F:%d:%s\n", loaded, changer.GetVolumeLabel(loaded).c_str());
   }
   /* Print slot state info */
   while (it.Next(slot, label)) {
      if (slot == loaded)
         fprintf(out, "S:%d:E\n", slot);
      else
         fprintf(out, "S:%d:F:%s\n", slot, label.c_str());
   }
   logger.Info("  SUCCESS sent listall to stdout");
   return 0;
}


/*-------------------------------------------------
 *  Commands
 * ------------------------------------------------*/
static const CHANGERCMD changer_command[] = {
   { "list", do_list_cmd, false },
   { "slots", do_slots_cmd, false },
   { "load", do_load_cmd, true },
   { "unload", do_unload_cmd, true },
   { "loaded", do_loaded_cmd, false },
   { "listall", do_listall_cmd, false },
   { NULL, NULL, false }
};


/*-------------------------------------------------
 *  Function to find the command named 'name', ignoring case.
 *  Returns NULL and sets verr if there is no such command.
 *------------------------------------------------*/
const CHANGERCMD* LookupCommand(const char *name, ErrorHandler &verr)
{
   int n;
   tString tmp;

   if (name) tmp = name;
   tToLower(tStrip(tmp));
   for (n = 0; changer_command[n].name; n++) {
      if (tmp == changer_command[n].name) return &changer_command[n];
   }
   verr.SetError(CHGERR_UNKNOWN_COMMAND, "'%s' is not a recognized command", name ? name : "");
   return NULL;
}


/*-------------------------------------------------
 *  Function to perform command 'cmd' on 'changer', writing its
 *  output to 'out'.
 *  Returns zero on success, else sets verr and returns the error kind.
 *------------------------------------------------*/
int RunCommand(const CHANGERCMD *cmd, RemoteChanger &changer, const CommandParams &params,
      FILE *out, ErrorHandler &verr)
{
   int rc;
   size_t n;
   tString uname;

   if (!cmd) {
      verr.SetError(CHGERR_UNKNOWN_COMMAND, "no command given");
      return CHGERR_UNKNOWN_COMMAND;
   }
   uname = cmd->name;
   for (n = 0; n < uname.size(); n++) uname[n] = toupper(uname[n]);
   logger.Debug("==== performing %s command pid=%d", uname.c_str(), (int)getpid());
   rc = cmd->handler(changer, params, out);
   if (rc) {
      if (changer.GetError()) verr.SetError(changer.GetError(), "%s", changer.GetErrorMsg());
      else verr.SetError(rc, "%s command failed", cmd->name);
      return verr.GetError();
   }
   fflush(out);
   return 0;
}
