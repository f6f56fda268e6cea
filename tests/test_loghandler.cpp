/*  test_loghandler.cpp
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
#include "loghandler.h"
#include "test_util.h"

class LogHandlerTest : public ::testing::Test
{
protected:
   virtual void TearDown()
   {
      logger.OpenLog(stderr, LOG_WARNING);
   }
};

TEST_F(LogHandlerTest, FiltersByLevel)
{
   FILE *fs = tmpfile();
   tString text;
   ASSERT_TRUE(fs != NULL);
   logger.OpenLog(fs, LOG_INFO);
   logger.Info("  SUCCESS reporting %d slots", 8192);
   logger.Debug("==== performing SLOTS command");
   logger.Error("ERROR! lost");
   text = read_stream(fs);
   logger.OpenLog(stderr, LOG_WARNING);
   fclose(fs);
   EXPECT_NE(tString::npos, text.find(": " "  SUCCESS reporting 8192 slots\n"));
   EXPECT_NE(tString::npos, text.find(": ERROR! lost\n"));
   EXPECT_EQ(tString::npos, text.find("performing"));
}

TEST_F(LogHandlerTest, AppendsToNamedFile)
{
   TempDir tmp;
   tString fname = tmp.Path("rchanger.log");
   ASSERT_TRUE(write_file(fname, "earlier line\n"));
   ASSERT_EQ(0, logger.OpenLog(fname.c_str(), LOG_DEBUG));
   logger.Debug("locked %s", "/tmp/x.lock");
   logger.CloseLog();
   tString text = read_file(fname);
   EXPECT_EQ(0u, text.find("earlier line\n"));
   EXPECT_NE(tString::npos, text.find("locked /tmp/x.lock\n"));
}

TEST_F(LogHandlerTest, UnopenableFileKeepsDestination)
{
   TempDir tmp;
   EXPECT_NE(0, logger.OpenLog(tmp.Path("nodir/rchanger.log").c_str(), LOG_DEBUG));
   EXPECT_NE(0, logger.OpenLog("", LOG_DEBUG));
}
