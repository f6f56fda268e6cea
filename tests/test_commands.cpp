/*  test_commands.cpp
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

#include <gtest/gtest.h>
#include <stdio.h>
#include <sys/stat.h>
#include "commands.h"
#include "fake_transfer.h"
#include "test_util.h"

class CommandsTest : public ::testing::Test
{
protected:
   virtual void SetUp()
   {
      ASSERT_FALSE(tmp.Root().empty());
      remote = tmp.Path("remote");
      ASSERT_EQ(0, mkdir(remote.c_str(), 0770));
      params.changer_device = remote;
      params.archive_device = tmp.Path("vtape");
      out = tmpfile();
      ASSERT_TRUE(out != NULL);
   }
   virtual void TearDown()
   {
      if (out) fclose(out);
   }
   /* Runs 'name' and returns what it printed */
   tString Run(RemoteChanger &changer, const char *name, int expect_rc = 0)
   {
      ErrorHandler verr;
      const CHANGERCMD *cmd = LookupCommand(name, verr);
      EXPECT_TRUE(cmd != NULL) << name;
      if (!cmd) return tString();
      rewind(out);
      if (ftruncate(fileno(out), 0)) return tString();
      EXPECT_EQ(expect_rc, RunCommand(cmd, changer, params, out, verr)) << verr.GetErrorMsg();
      if (expect_rc) EXPECT_EQ(expect_rc, verr.GetError());
      return read_stream(out);
   }
   TempDir tmp;
   tString remote;
   CommandParams params;
   FakeTransfer xfer;
   FILE *out;
};

TEST_F(CommandsTest, UnknownCommandIsRejected)
{
   ErrorHandler verr;
   EXPECT_TRUE(LookupCommand("eject", verr) == NULL);
   EXPECT_EQ(CHGERR_UNKNOWN_COMMAND, verr.GetError());
   EXPECT_NE(tString::npos, tString(verr.GetErrorMsg()).find("eject"));
   EXPECT_TRUE(LookupCommand(NULL, verr) == NULL);
}

TEST_F(CommandsTest, LookupIgnoresCase)
{
   ErrorHandler verr;
   const CHANGERCMD *cmd = LookupCommand("LoAd", verr);
   ASSERT_TRUE(cmd != NULL);
   EXPECT_STREQ("load", cmd->name);
   EXPECT_TRUE(cmd->needs_volume);
   cmd = LookupCommand("listall", verr);
   ASSERT_TRUE(cmd != NULL);
   EXPECT_FALSE(cmd->needs_volume);
   EXPECT_EQ(CHGERR_NONE, verr.GetError());
}

TEST_F(CommandsTest, ListPrintsEverySlot)
{
   RemoteChanger changer(xfer, remote, params.archive_device, 3, "VTAPE");
   EXPECT_EQ("1:VTAPE-00001\n2:VTAPE-00002\n3:VTAPE-00003\n", Run(changer, "list"));
}

TEST_F(CommandsTest, SlotsReportsDefaultCount)
{
   RemoteChanger changer(xfer, remote, params.archive_device, 8192, "VTAPE");
   EXPECT_EQ("8192\n", Run(changer, "slots"));
}

TEST_F(CommandsTest, LoadedLoadUnload)
{
   RemoteChanger changer(xfer, remote, params.archive_device, 8, "VTAPE");
   EXPECT_EQ("0\n", Run(changer, "loaded"));
   params.slot = 2;
   EXPECT_EQ("", Run(changer, "load"));
   EXPECT_EQ("2\n", Run(changer, "loaded"));
   params.slot = 3;
   EXPECT_EQ("", Run(changer, "unload", CHGERR_INVALID_STATE));
   EXPECT_EQ("2\n", Run(changer, "loaded"));
   params.slot = 2;
   EXPECT_EQ("", Run(changer, "unload"));
   EXPECT_EQ("0\n", Run(changer, "loaded"));
}

TEST_F(CommandsTest, LoadOfInvalidSlot)
{
   RemoteChanger changer(xfer, remote, params.archive_device, 8, "VTAPE");
   params.slot = 9;
   Run(changer, "load", CHGERR_BAD_SLOT);
   EXPECT_TRUE(changer.DriveEmpty());
}

TEST_F(CommandsTest, ListAllShowsDriveAndSlots)
{
   RemoteChanger changer(xfer, remote, params.archive_device, 3, "VTAPE");
   EXPECT_EQ("D:0:E\nS:1:F:VTAPE-00001\nS:2:F:VTAPE-00002\nS:3:F:VTAPE-00003\n",
         Run(changer, "listall"));
   changer.SetState(ChangerState(2));
   EXPECT_EQ("D:0:F:2:VTAPE-00002\nS:1:F:VTAPE-00001\nS:2:E\nS:3:F:VTAPE-00003\n",
         Run(changer, "listall"));
}

TEST_F(CommandsTest, RunWithoutCommand)
{
   ErrorHandler verr;
   RemoteChanger changer(xfer, remote, params.archive_device, 3, "VTAPE");
   EXPECT_EQ(CHGERR_UNKNOWN_COMMAND, RunCommand(NULL, changer, params, out, verr));
}
