/*  rconf.cpp
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
 *  Provides class for reading configuration file and providing access
 *  to config variables.
 */

#include "config.h"
#include <stdio.h>
#ifdef HAVE_STDLIB_H
#include <stdlib.h>
#endif
#ifdef HAVE_UNISTD_H
#include <unistd.h>
#endif
#ifdef HAVE_STRING_H
#include <string.h>
#endif
#ifdef HAVE_ERRNO_H
#include <errno.h>
#endif
#include <limits.h>

#include "compat_defs.h"
#include "loghandler.h"
#include "util.h"
#include "rconf.h"


/*================================================
 *  Class ChangerConfig
 *================================================*/

/*--------------------------------------------------
 * Default constructor
 *------------------------------------------------*/
ChangerConfig::ChangerConfig() : log_level(DEFAULT_LOG_LEVEL), slots(DEFAULT_SLOTS)
{
   tFormat(lockfile, "%s/spool/rchanger/rchanger.lock", LOCALSTATEDIR);
   tFormat(logfile, "%s/log/rchanger/rchanger.log", LOCALSTATEDIR);
   tFormat(rclone_log, "%s/log/rchanger/rclone.log", LOCALSTATEDIR);
   tFormat(state_file, "%s/spool/rchanger/rchanger.state", LOCALSTATEDIR);
   rclone = DEFAULT_RCLONE;
   rclone_config = DEFAULT_RCLONE_CONFIG;
   label_prefix = DEFAULT_LABEL_PREFIX;
   /* Define config file keywords */
   keyword.AddKeyword(RK_LOCKFILE, INIKEYWORDTYPE_SZ);
   keyword.AddKeyword(RK_LOGFILE, INIKEYWORDTYPE_SZ);
   keyword.AddKeyword(RK_LOG_LEVEL, INIKEYWORDTYPE_LONG);
   keyword.AddKeyword(RK_RCLONE, INIKEYWORDTYPE_SZ);
   keyword.AddKeyword(RK_RCLONE_OPTIONS, INIKEYWORDTYPE_SZ);
   keyword.AddKeyword(RK_RCLONE_CONFIG, INIKEYWORDTYPE_SZ);
   keyword.AddKeyword(RK_RCLONE_LOG, INIKEYWORDTYPE_SZ);
   keyword.AddKeyword(RK_STATE_FILE, INIKEYWORDTYPE_SZ);
   keyword.AddKeyword(RK_SLOTS, INIKEYWORDTYPE_LONG);
   keyword.AddKeyword(RK_LABEL_PREFIX, INIKEYWORDTYPE_SZ);
}

/*-------------------------------------------------
 *  Protected method to copy the stripped value of string keyword 'kw'
 *  in 'ini' to 'val' if the keyword is set.
 *  Returns false if the value is empty and 'allow_empty' is false.
 *------------------------------------------------*/
bool ChangerConfig::GetStringValue(IniFile &ini, const char *kw, tString &val, bool allow_empty)
{
   tString tmp;
   if (!ini[kw].IsSet()) return true;
   tmp = ini[kw].GetString();
   tStrip(tmp);
   if (tmp.empty() && !allow_empty) {
      verr.SetError(CHGERR_CONFIG, "keyword '%s' must specify a non-empty string", kw);
      logger.Error("%s", verr.GetErrorMsg());
      return false;
   }
   val = tmp;
   return true;
}

/*-------------------------------------------------
 *  Protected method to copy the value of numeric keyword 'kw' in
 *  'ini' to 'val' if the keyword is set.
 *  Returns false if the value is outside of 'minval' to 'maxval'.
 *------------------------------------------------*/
bool ChangerConfig::GetIntValue(IniFile &ini, const char *kw, int &val, long minval, long maxval)
{
   long l;
   if (!ini[kw].IsSet()) return true;
   l = ini[kw].GetLONG();
   if (l < minval || l > maxval) {
      verr.SetError(CHGERR_CONFIG, "keyword '%s' must be between %ld and %ld inclusive (got %ld)",
            kw, minval, maxval, l);
      logger.Error("%s", verr.GetErrorMsg());
      return false;
   }
   val = (int)l;
   return true;
}

/*-------------------------------------------------
 *  Protected method to set config values from the keywords set
 *  in 'ini'. On success, returns true. Otherwise sets lasterr
 *  and returns false.
 *------------------------------------------------*/
bool ChangerConfig::Apply(IniFile &ini)
{
   if (!GetStringValue(ini, RK_LOCKFILE, lockfile)) return false;
   if (!GetStringValue(ini, RK_LOGFILE, logfile)) return false;
   if (!GetStringValue(ini, RK_RCLONE, rclone)) return false;
   if (!GetStringValue(ini, RK_RCLONE_OPTIONS, rclone_options, true)) return false;
   if (!GetStringValue(ini, RK_RCLONE_CONFIG, rclone_config, true)) return false;
   if (!GetStringValue(ini, RK_RCLONE_LOG, rclone_log, true)) return false;
   if (!GetStringValue(ini, RK_STATE_FILE, state_file)) return false;
   if (!GetStringValue(ini, RK_LABEL_PREFIX, label_prefix)) return false;

   if (!GetIntValue(ini, RK_LOG_LEVEL, log_level, 0, 7)) return false;
   if (!GetIntValue(ini, RK_SLOTS, slots, 1, INT_MAX)) return false;
   keyword.Update(ini);
   return true;
}

/*-------------------------------------------------
 *  Method to read config file and set config values from keyword
 *  value pairs. On success, returns true. Otherwise sets lasterr
 *  and returns false.
 *------------------------------------------------*/
bool ChangerConfig::Read(const char *cfile)
{
   int rc;
   IniFile tmp_ini = keyword;

   verr.clear();
   tmp_ini.ClearKeywordValues();
   if (!cfile || !cfile[0]) {
      verr.SetError(CHGERR_CONFIG, "config file not specified");
      logger.Error("%s", verr.GetErrorMsg());
      return false;
   }
   /* Does config file exist */
   if (access(cfile, R_OK)) {
      verr.SetErrorWithErrno(CHGERR_CONFIG, errno, "could not access config file %s", cfile);
      logger.Error("%s", verr.GetErrorMsg());
      return false;
   }
   /* Read config file values */
   rc = tmp_ini.Read(cfile);
   if (rc) {
      if (rc > 0) verr.SetError(CHGERR_CONFIG, "parse error in %s at line %d: %s", cfile, rc,
            tmp_ini.GetErrorMessage().c_str());
      else verr.SetError(CHGERR_CONFIG, "could not read config file %s", cfile);
      logger.Error("%s", verr.GetErrorMsg());
      return false;
   }
   config_file = cfile;
   return Apply(tmp_ini);
}

/*-------------------------------------------------
 *  Method to override the value of keyword 'kw' with 'value', as
 *  given on the command line. On success, returns true. Otherwise
 *  sets lasterr and returns false.
 *------------------------------------------------*/
bool ChangerConfig::Override(const char *kw, const char *value)
{
   long l;
   IniFile tmp_ini = keyword;

   verr.clear();
   tmp_ini.ClearKeywordValues();
   if (!tmp_ini.KeywordExists(kw)) {
      verr.SetError(CHGERR_CONFIG, "unknown configuration keyword '%s'", kw);
      logger.Error("%s", verr.GetErrorMsg());
      return false;
   }
   if (tmp_ini[kw].GetType() == INIKEYWORDTYPE_LONG && !tParseInt(value ? value : "", l)) {
      verr.SetError(CHGERR_CONFIG, "'%s' requires a number, not '%s'", kw, value ? value : "");
      logger.Error("%s", verr.GetErrorMsg());
      return false;
   }
   tmp_ini[kw] = value ? value : "";
   return Apply(tmp_ini);
}

/*-------------------------------------------------
 *  Method to validate config values after the command line
 *  overrides have been applied. Creates the directories of the
 *  lock file and state file if needed.
 *  On success, returns true. Otherwise sets lasterr and returns false.
 *------------------------------------------------*/
bool ChangerConfig::Validate()
{
   int rc;

   verr.clear();
   if (slots < 1) {
      verr.SetError(CHGERR_CONFIG, "number of slots must be at least 1 (got %d)", slots);
      logger.Error("%s", verr.GetErrorMsg());
      return false;
   }
   if (label_prefix.empty() || label_prefix.find(DIR_DELIM_C) != tString::npos) {
      verr.SetError(CHGERR_CONFIG, "label prefix '%s' must be non-empty and contain no '%s'",
            label_prefix.c_str(), DIR_DELIM);
      logger.Error("%s", verr.GetErrorMsg());
      return false;
   }
   if (log_level < 0 || log_level > 7) {
      verr.SetError(CHGERR_CONFIG, "log level must be between 0 and 7 inclusive (got %d)", log_level);
      logger.Error("%s", verr.GetErrorMsg());
      return false;
   }
   /* Validate rclone binary is executable */
   if (access(rclone.c_str(), X_OK)) {
      verr.SetErrorWithErrno(CHGERR_CONFIG, errno, "rclone binary '%s' is not executable",
            rclone.c_str());
      logger.Error("%s", verr.GetErrorMsg());
      return false;
   }
   /* Validate lock file and state file directories are usable */
   if (lockfile.empty() || (rc = make_parent_dir(lockfile.c_str())) != 0) {
      verr.SetErrorWithErrno(CHGERR_CONFIG, lockfile.empty() ? EINVAL : rc,
            "could not create directory for lock file '%s'", lockfile.c_str());
      logger.Error("%s", verr.GetErrorMsg());
      return false;
   }
   if (state_file.empty() || (rc = make_parent_dir(state_file.c_str())) != 0) {
      verr.SetErrorWithErrno(CHGERR_CONFIG, state_file.empty() ? EINVAL : rc,
            "could not create directory for state file '%s'", state_file.c_str());
      logger.Error("%s", verr.GetErrorMsg());
      return false;
   }
   return true;
}

/*-------------------------------------------------
 *  Method to build the transfer tool settings from the
 *  configuration
 *------------------------------------------------*/
void ChangerConfig::GetTransferConfig(TransferConfig &xconf) const
{
   xconf.binary = rclone;
   xconf.config_file = rclone_config;
   xconf.logfile = rclone_log;
   xconf.extra_opts.clear();
   tSplitWS(xconf.extra_opts, rclone_options);
}
