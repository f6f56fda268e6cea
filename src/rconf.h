/*  rconf.h
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

#ifndef _RCONF_H_
#define _RCONF_H_ 1

#include "inifile.h"
#include "errhandler.h"
#include "transfer.h"

#define DEFAULT_LOG_LEVEL 3
#define DEFAULT_RCLONE "/usr/bin/rclone"
#define DEFAULT_RCLONE_CONFIG "/etc/bareos/rclone.conf"
#define DEFAULT_SLOTS 8192
#define DEFAULT_LABEL_PREFIX "VTAPE"

/* Config file keywords */
#define RK_LOCKFILE "lockfile"
#define RK_LOGFILE "logfile"
#define RK_LOG_LEVEL "log level"
#define RK_RCLONE "rclone"
#define RK_RCLONE_OPTIONS "rclone options"
#define RK_RCLONE_CONFIG "rclone config"
#define RK_RCLONE_LOG "rclone logfile"
#define RK_STATE_FILE "state file"
#define RK_SLOTS "slots"
#define RK_LABEL_PREFIX "label prefix"

/* Configuration values */

class ChangerConfig
{
public:
   IniFile keyword;
   tString config_file;
   tString lockfile;
   tString logfile;
   int log_level;
   tString rclone;
   tString rclone_options;
   tString rclone_config;
   tString rclone_log;
   tString state_file;
   int slots;
   tString label_prefix;
public:
   ChangerConfig();
   virtual ~ChangerConfig() {}
   bool Read(const char *cfile);
   inline bool Read(const tString &cfile) { return Read(cfile.c_str()); }
   bool Override(const char *kw, const char *value);
   bool Validate();
   void GetTransferConfig(TransferConfig &xconf) const;
   inline int GetError() const { return verr.GetError(); }
   inline const char* GetErrorMsg() const { return verr.GetErrorMsg(); }
protected:
   bool GetStringValue(IniFile &ini, const char *kw, tString &val, bool allow_empty = false);
   bool GetIntValue(IniFile &ini, const char *kw, int &val, long minval, long maxval);
   bool Apply(IniFile &ini);
protected:
   ErrorHandler verr;
};

#endif /* _RCONF_H_ */
