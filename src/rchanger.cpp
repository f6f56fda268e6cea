/*  rchanger.cpp
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

#include "config.h"
#include <stdio.h>
#ifdef HAVE_STDLIB_H
#include <stdlib.h>
#endif
#ifdef HAVE_GETOPT_H
#include <getopt.h>
#endif
#ifdef HAVE_UNISTD_H
#include <unistd.h>
#endif
#ifdef HAVE_LOCALE_H
#include <locale.h>
#endif

#include "compat_defs.h"
#include "loghandler.h"
#include "lockfile.h"
#include "util.h"
#include "rconf.h"
#include "transfer.h"
#include "changerstate.h"
#include "changer.h"
#include "commands.h"

/*-------------------------------------------------
 *  Command line parameters
 * ------------------------------------------------*/
typedef struct _cmdparams_s
{
   bool print_version;
   bool print_help;
   tString config_file;
   tStringArray override_kw;
   tStringArray override_val;
   const CHANGERCMD *cmd;
   CommandParams params;
} CMDPARAMS;
CMDPARAMS cmdl;

/*-------------------------------------------------
 *  Function to print version info to stdout
 *------------------------------------------------*/
static void print_version(void)
{
   fprintf(stdout, "%s version %s\n", PACKAGE_NAME, PACKAGE_VERSION);
   fprintf(stdout, "\n%s.\n", COPYRIGHT_NOTICE);
}

/*-------------------------------------------------
 *  Function to print command help to stdout
 *------------------------------------------------*/
static void print_help(void)
{
   fprintf(stdout, "rchanger version %s\n\n", PACKAGE_VERSION);
   fprintf(stdout, "USAGE:\n\n"
      "  rchanger [options] changer_device command [slot [archive_device [drive]]]\n"
      "    Perform Bareos Autochanger API command for the virtual changer\n"
      "    whose slots are directories under the rclone remote path\n"
      "    'changer_device', using 'slot', 'archive_device', and 'drive'.\n"
      "    Commands are: loaded, load, unload, list, listall, slots\n"
      "  rchanger --version\n"
      "    print version info\n"
      "  rchanger --help\n"
      "    print help\n"
      "\nOptions:\n"
      "    -c, --config=FILE         read settings from configuration file FILE\n"
      "    --lockfile=FILE           lock file serializing changer commands\n"
      "    --logfile=FILE            log file, or 'syslog' to log to syslog\n"
      "    --log-level=N             log level from 0 (emergency) to 7 (debug)\n"
      "    --rclone=FILE             path of the rclone binary\n"
      "    --rclone-options=STRING   extra space-delimited rclone options\n"
      "    --rclone-config=FILE      rclone configuration file\n"
      "    --rclone-log=FILE         file rclone writes its log to\n"
      "    --statefile=FILE          file holding the loaded slot\n"
      "    --slots=N                 number of slots in the changer\n"
      "    --prefix=STRING           volume label prefix\n"
      "\nReport bugs to %s.\n", PACKAGE_BUGREPORT);
}

/*-------------------------------------------------
 *  Function to parse command line parameters
 *------------------------------------------------*/
#define LONGONLYOPT_VERSION         0
#define LONGONLYOPT_HELP            1
#define LONGONLYOPT_LOCKFILE        2
#define LONGONLYOPT_LOGFILE         3
#define LONGONLYOPT_LOG_LEVEL       4
#define LONGONLYOPT_RCLONE          5
#define LONGONLYOPT_RCLONE_OPTIONS  6
#define LONGONLYOPT_RCLONE_CONFIG   7
#define LONGONLYOPT_RCLONE_LOG      8
#define LONGONLYOPT_STATEFILE       9
#define LONGONLYOPT_SLOTS           10
#define LONGONLYOPT_PREFIX          11

static void add_override(const char *kw, const char *val)
{
   cmdl.override_kw.push_back(kw);
   cmdl.override_val.push_back(val ? val : "");
}

static int parse_cmdline(int argc, char *argv[], ErrorHandler &verr)
{
   int c, ndx = 0;
   long l;
   struct option options[] = { { "version", 0, 0, LONGONLYOPT_VERSION },
         { "help", 0, 0, LONGONLYOPT_HELP },
         { "config", 1, 0, 'c' },
         { "lockfile", 1, 0, LONGONLYOPT_LOCKFILE },
         { "logfile", 1, 0, LONGONLYOPT_LOGFILE },
         { "log-level", 1, 0, LONGONLYOPT_LOG_LEVEL },
         { "rclone", 1, 0, LONGONLYOPT_RCLONE },
         { "rclone-options", 1, 0, LONGONLYOPT_RCLONE_OPTIONS },
         { "rclone-config", 1, 0, LONGONLYOPT_RCLONE_CONFIG },
         { "rclone-log", 1, 0, LONGONLYOPT_RCLONE_LOG },
         { "statefile", 1, 0, LONGONLYOPT_STATEFILE },
         { "slots", 1, 0, LONGONLYOPT_SLOTS },
         { "prefix", 1, 0, LONGONLYOPT_PREFIX },
         { 0, 0, 0, 0 } };

   cmdl.print_version = false;
   cmdl.print_help = false;
   cmdl.config_file.clear();
   cmdl.override_kw.clear();
   cmdl.override_val.clear();
   cmdl.cmd = NULL;
   /* process the command line */
   for (;;) {
      c = getopt_long(argc ,argv, "c:", options, NULL);
      if (c == -1) break;
      switch (c) {
      case LONGONLYOPT_VERSION:
         cmdl.print_version = true;
         cmdl.print_help = false;
         return 0;
      case LONGONLYOPT_HELP:
         cmdl.print_version = false;
         cmdl.print_help = true;
         return 0;
      case 'c':
         cmdl.config_file = optarg;
         break;
      case LONGONLYOPT_LOCKFILE:
         add_override(RK_LOCKFILE, optarg);
         break;
      case LONGONLYOPT_LOGFILE:
         add_override(RK_LOGFILE, optarg);
         break;
      case LONGONLYOPT_LOG_LEVEL:
         add_override(RK_LOG_LEVEL, optarg);
         break;
      case LONGONLYOPT_RCLONE:
         add_override(RK_RCLONE, optarg);
         break;
      case LONGONLYOPT_RCLONE_OPTIONS:
         add_override(RK_RCLONE_OPTIONS, optarg);
         break;
      case LONGONLYOPT_RCLONE_CONFIG:
         add_override(RK_RCLONE_CONFIG, optarg);
         break;
      case LONGONLYOPT_RCLONE_LOG:
         add_override(RK_RCLONE_LOG, optarg);
         break;
      case LONGONLYOPT_STATEFILE:
         add_override(RK_STATE_FILE, optarg);
         break;
      case LONGONLYOPT_SLOTS:
         add_override(RK_SLOTS, optarg);
         break;
      case LONGONLYOPT_PREFIX:
         add_override(RK_LABEL_PREFIX, optarg);
         break;
      default:
         verr.SetError(CHGERR_CONFIG, "unknown option");
         return CHGERR_CONFIG;
      }
   }

   /* process positional params */
   ndx = optind;
   /* First parameter is the changer device */
   if (ndx >= argc) {
      verr.SetError(CHGERR_CONFIG, "missing parameter 1 (changer_device)");
      return CHGERR_CONFIG;
   }
   cmdl.params.changer_device = argv[ndx];
   /* Second parameter is the command */
   ++ndx;
   if (ndx >= argc) {
      verr.SetError(CHGERR_CONFIG, "missing parameter 2 (command)");
      return CHGERR_CONFIG;
   }
   cmdl.params.command = argv[ndx];
   cmdl.cmd = LookupCommand(argv[ndx], verr);
   if (!cmdl.cmd) return CHGERR_UNKNOWN_COMMAND;
   /* Commands other than LOAD and UNLOAD ignore the remaining params */
   if (!cmdl.cmd->needs_volume) return 0;
   /* Param 3 is the slot number */
   ++ndx;
   if (ndx >= argc) {
      verr.SetError(CHGERR_CONFIG, "missing parameter 3 (slot number)");
      return CHGERR_CONFIG;
   }
   if (!tParseInt(argv[ndx], l) || l < 1 || l > 0x7fffffffL) {
      verr.SetError(CHGERR_BAD_SLOT, "invalid slot number '%s' in parameter 3", argv[ndx]);
      return CHGERR_BAD_SLOT;
   }
   cmdl.params.slot = (int)l;
   /* Param 4 is the archive device path */
   ++ndx;
   if (ndx >= argc) {
      verr.SetError(CHGERR_CONFIG, "missing parameter 4 (archive device)");
      return CHGERR_CONFIG;
   }
   cmdl.params.archive_device = argv[ndx];
   /* Param 5 is the optional drive index, which must be zero */
   ++ndx;
   if (ndx < argc) {
      if (!tParseInt(argv[ndx], l) || l != 0) {
         verr.SetError(CHGERR_BAD_SLOT, "invalid drive index '%s' in parameter 5", argv[ndx]);
         return CHGERR_BAD_SLOT;
      }
   }
   cmdl.params.drive = 0;

   /*  note that any extraneous parameters are simply ignored */
   return 0;
}


/*-------------------------------------------------
 *  Function to report a failure on stderr and in the log
 *------------------------------------------------*/
static int report_error(int errkind, const char *msg)
{
   fprintf(stderr, "%s\n", msg);
   logger.Error("ERROR! [%s] %s", ErrorHandler::KindName(errkind), msg);
   return 1;
}


/* -------------  Main  -------------------------*/

int main(int argc, char *argv[])
{
   int rc;
   size_t n;
   ErrorHandler verr;
   ChangerConfig conf;
   TransferConfig xconf;
   ChangerState state;
   LockFile run_lock;

#ifdef HAVE_LOCALE_H
   setlocale(LC_ALL, "");
#endif

   /* Log initially to stderr */
   logger.OpenLog(stderr, LOG_ERR);
   /* parse the command line */
   if (parse_cmdline(argc, argv, verr)) {
      fprintf(stderr, "%s\n", verr.GetErrorMsg());
      if (verr.GetError() != CHGERR_UNKNOWN_COMMAND) print_help();
      return 1;
   }
   /* Check for --version flag */
   if (cmdl.print_version) {
      print_version();
      return 0;
   }
   /* Check for --help flag */
   if (cmdl.print_help) {
      print_help();
      return 0;
   }
   /* Read config file, then apply command line overrides. Errors are
    * logged to stderr. */
   if (!cmdl.config_file.empty() && !conf.Read(cmdl.config_file)) {
      return 1;
   }
   for (n = 0; n < cmdl.override_kw.size(); n++) {
      if (!conf.Override(cmdl.override_kw[n].c_str(), cmdl.override_val[n].c_str())) {
         return 1;
      }
   }
   /* Validate and commit configuration parameters */
   if (!conf.Validate()) {
      return 1;
   }
   /* Start logging to log file specified in configuration */
   if (conf.logfile != LOGFILE_SYSLOG && (rc = make_parent_dir(conf.logfile.c_str())) != 0) {
      fprintf(stderr, "Error %d creating directory for log file %s\n", rc, conf.logfile.c_str());
      return 1;
   }
   if ((rc = logger.OpenLog(conf.logfile.c_str(), conf.log_level)) != 0) {
      fprintf(stderr, "Error %d opening log file %s\n", rc, conf.logfile.c_str());
      return 1;
   }

   /* Serialize changer commands. Blocks until any other instance exits. */
   if (run_lock.Lock(conf.lockfile, true)) {
      return report_error(run_lock.GetError(), run_lock.GetErrorMsg());
   }

   /* Restore state of the drive */
   StateFile sfile(conf.state_file);
   if (sfile.Load(state)) {
      return report_error(sfile.GetError(), sfile.GetErrorMsg());
   }

   conf.GetTransferConfig(xconf);
   RcloneTransfer xfer(xconf);
   RemoteChanger changer(xfer, cmdl.params.changer_device, cmdl.params.archive_device,
         conf.slots, conf.label_prefix);
   changer.SetState(state);

   /* Perform command */
   if (RunCommand(cmdl.cmd, changer, cmdl.params, stdout, verr)) {
      return report_error(verr.GetError(), verr.GetErrorMsg());
   }

   /* Save state of the drive */
   if (sfile.Save(changer.GetState())) {
      return report_error(sfile.GetError(), sfile.GetErrorMsg());
   }
   run_lock.Unlock();
   return 0;
}
