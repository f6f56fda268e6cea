/*  commands.h
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

#ifndef _COMMANDS_H_
#define _COMMANDS_H_ 1

#include <stdio.h>
#include "tstring.h"
#include "errhandler.h"
#include "changer.h"

/*-------------------------------------------------
 *  Command line parameters of a changer command
 * ------------------------------------------------*/
class CommandParams
{
public:
   CommandParams() : slot(0), drive(0) {}
   virtual ~CommandParams() {}
public:
   tString changer_device;
   tString command;
   int slot;
   tString archive_device;
   int drive;
};

typedef int (*CommandHandler)(RemoteChanger &changer, const CommandParams &params, FILE *out);

typedef struct _changer_cmd_s
{
   const char *name;
   CommandHandler handler;
   bool needs_volume;   /* requires slot and archive device parameters */
} CHANGERCMD;

const CHANGERCMD* LookupCommand(const char *name, ErrorHandler &verr);
int RunCommand(const CHANGERCMD *cmd, RemoteChanger &changer, const CommandParams &params,
      FILE *out, ErrorHandler &verr);

#endif /* _COMMANDS_H_ */
