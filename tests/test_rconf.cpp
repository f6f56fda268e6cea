/*  test_rconf.cpp
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
#include "config.h"
#include "rconf.h"
#include "test_util.h"

class ChangerConfigTest : public ::testing::Test
{
protected:
   virtual void SetUp()
   {
      ASSERT_FALSE(tmp.Root().empty());
      conf.rclone = "/bin/sh";
      conf.lockfile = tmp.Path("rchanger.lock");
      conf.state_file = tmp.Path("rchanger.state");
   }
   TempDir tmp;
   ChangerConfig conf;
};

TEST(ChangerConfigDefaults, BuiltInValues)
{
   ChangerConfig conf;
   tString expect;
   EXPECT_EQ(DEFAULT_SLOTS, conf.slots);
   EXPECT_EQ(8192, conf.slots);
   EXPECT_EQ(3, conf.log_level);
   EXPECT_EQ("VTAPE", conf.label_prefix);
   EXPECT_EQ("/usr/bin/rclone", conf.rclone);
   EXPECT_EQ("/etc/bareos/rclone.conf", conf.rclone_config);
   EXPECT_TRUE(conf.rclone_options.empty());
   tFormat(expect, "%s/spool/rchanger/rchanger.state", LOCALSTATEDIR);
   EXPECT_EQ(expect, conf.state_file);
   tFormat(expect, "%s/spool/rchanger/rchanger.lock", LOCALSTATEDIR);
   EXPECT_EQ(expect, conf.lockfile);
}

TEST_F(ChangerConfigTest, FileOverridesDefaultsAndCommandLineOverridesFile)
{
   tString cfile = tmp.Path("rchanger.conf");
   ASSERT_TRUE(write_file(cfile,
         "# rchanger test configuration\n"
         "Slots = 20\n"
         "label prefix = TAPE\n"
         "rclone options = \"--fast-list --transfers 4\"\n"
         "log level = 6\n"));
   ASSERT_TRUE(conf.Read(cfile)) << conf.GetErrorMsg();
   EXPECT_EQ(cfile, conf.config_file);
   EXPECT_EQ(20, conf.slots);
   EXPECT_EQ("TAPE", conf.label_prefix);
   EXPECT_EQ(6, conf.log_level);

   ASSERT_TRUE(conf.Override(RK_SLOTS, "30"));
   ASSERT_TRUE(conf.Override(RK_LABEL_PREFIX, "CLI"));
   EXPECT_EQ(30, conf.slots);
   EXPECT_EQ("CLI", conf.label_prefix);
   EXPECT_EQ(6, conf.log_level);
   EXPECT_TRUE(conf.Validate()) << conf.GetErrorMsg();

   TransferConfig xconf;
   conf.GetTransferConfig(xconf);
   EXPECT_EQ("/bin/sh", xconf.binary);
   ASSERT_EQ(3u, xconf.extra_opts.size());
   EXPECT_EQ("--fast-list", xconf.extra_opts[0]);
   EXPECT_EQ("4", xconf.extra_opts[2]);
}

TEST_F(ChangerConfigTest, ReadErrors)
{
   EXPECT_FALSE(conf.Read(tmp.Path("missing.conf")));
   EXPECT_EQ(CHGERR_CONFIG, conf.GetError());
   ASSERT_TRUE(write_file(tmp.Path("bad.conf"), "slots = 4\nmagazine = /mnt\n"));
   EXPECT_FALSE(conf.Read(tmp.Path("bad.conf")));
   EXPECT_NE(tString::npos, tString(conf.GetErrorMsg()).find("line 2"));
   ASSERT_TRUE(write_file(tmp.Path("nan.conf"), "slots = lots\n"));
   EXPECT_FALSE(conf.Read(tmp.Path("nan.conf")));
   EXPECT_EQ(DEFAULT_SLOTS, conf.slots);
}

TEST_F(ChangerConfigTest, OverrideRequiresNumbers)
{
   EXPECT_FALSE(conf.Override(RK_SLOTS, "many"));
   EXPECT_FALSE(conf.Override(RK_LOG_LEVEL, ""));
   EXPECT_FALSE(conf.Override("no such keyword", "1"));
   EXPECT_EQ(DEFAULT_SLOTS, conf.slots);
}

TEST_F(ChangerConfigTest, NumbersOutOfRangeAreRejected)
{
   EXPECT_FALSE(conf.Override(RK_SLOTS, "4294967297"));
   EXPECT_EQ(CHGERR_CONFIG, conf.GetError());
   EXPECT_EQ(DEFAULT_SLOTS, conf.slots);
   EXPECT_FALSE(conf.Override(RK_SLOTS, "0"));
   EXPECT_FALSE(conf.Override(RK_SLOTS, "-1"));
   EXPECT_EQ(DEFAULT_SLOTS, conf.slots);
   EXPECT_FALSE(conf.Override(RK_LOG_LEVEL, "8"));
   EXPECT_FALSE(conf.Override(RK_LOG_LEVEL, "4294967299"));
   EXPECT_EQ(DEFAULT_LOG_LEVEL, conf.log_level);
   EXPECT_TRUE(conf.Override(RK_SLOTS, "2147483647"));
   EXPECT_EQ(2147483647, conf.slots);

   ASSERT_TRUE(write_file(tmp.Path("big.conf"), "slots = 4294967297\n"));
   ChangerConfig other;
   EXPECT_FALSE(other.Read(tmp.Path("big.conf")));
   EXPECT_EQ(DEFAULT_SLOTS, other.slots);
}

TEST_F(ChangerConfigTest, ValidateChecksValues)
{
   EXPECT_TRUE(conf.Validate()) << conf.GetErrorMsg();

   conf.slots = 0;
   EXPECT_FALSE(conf.Validate());
   EXPECT_EQ(CHGERR_CONFIG, conf.GetError());
   conf.slots = 1;

   conf.label_prefix = "a/b";
   EXPECT_FALSE(conf.Validate());
   conf.label_prefix = "";
   EXPECT_FALSE(conf.Validate());
   conf.label_prefix = "VTAPE";

   conf.log_level = 8;
   EXPECT_FALSE(conf.Validate());
   conf.log_level = 7;

   conf.rclone = tmp.Path("no-rclone");
   EXPECT_FALSE(conf.Validate());
   conf.rclone = "/bin/sh";
   EXPECT_TRUE(conf.Validate()) << conf.GetErrorMsg();
}

TEST_F(ChangerConfigTest, ValidateCreatesStateDirectories)
{
   conf.lockfile = tmp.Path("spool/rchanger.lock");
   conf.state_file = tmp.Path("state/rchanger.state");
   EXPECT_TRUE(conf.Validate()) << conf.GetErrorMsg();
   EXPECT_TRUE(path_exists(tmp.Path("spool")));
   EXPECT_TRUE(path_exists(tmp.Path("state")));
   conf.state_file = tmp.Path("a/b/rchanger.state");
   EXPECT_FALSE(conf.Validate());
}
