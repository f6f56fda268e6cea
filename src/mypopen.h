/*  mypopen.h
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

#ifndef _MYPOPEN_H_
#define _MYPOPEN_H_ 1

#include "tstring.h"

/* Exit status reported by a child that could not exec the command */
#define MYPOPEN_EXEC_FAILED 127

int mypopen_raw(const tStringArray &args, int *fno_stdin, int *fno_stdout, int *fno_stderr);
int mypopenrw(const tStringArray &args, const char *cmd_in = NULL, const char *cmd_out = NULL,
      const char *cmd_err = NULL);

#endif /* _MYPOPEN_H_ */
