/*  test_inifile.cpp
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
#include "inifile.h"

static FILE* make_stream(const char *text)
{
   FILE *fs = tmpfile();
   if (!fs) return NULL;
   fputs(text, fs);
   rewind(fs);
   return fs;
}

class IniFileTest : public ::testing::Test
{
protected:
   virtual void SetUp()
   {
      ini.AddKeyword("log level", INIKEYWORDTYPE_LONG);
      ini.AddKeyword("rclone options", INIKEYWORDTYPE_SZ);
      ini.AddKeyword("label prefix", INIKEYWORDTYPE_SZ);
   }
   IniFile ini;
};

TEST_F(IniFileTest, KeywordsIgnoreCaseAndWhitespace)
{
   FILE *fs = make_stream("# comment\n; another\nLog Level = 5\nLABELPREFIX=TAPE\n");
   ASSERT_TRUE(fs != NULL);
   EXPECT_EQ(0, ini.Read(fs));
   fclose(fs);
   EXPECT_TRUE(ini["log level"].IsSet());
   EXPECT_EQ(5, ini["LogLevel"].GetLONG());
   EXPECT_STREQ("TAPE", ini["label prefix"].GetSZ());
   EXPECT_FALSE(ini["rclone options"].IsSet());
}

TEST_F(IniFileTest, QuotedValueAndContinuation)
{
   FILE *fs = make_stream("rclone options = \"--fast-list --transfers 4\"\n"
         "label prefix = VT\\\nAPE\n");
   ASSERT_TRUE(fs != NULL);
   EXPECT_EQ(0, ini.Read(fs));
   fclose(fs);
   EXPECT_EQ("--fast-list --transfers 4", ini["rclone options"].GetString());
   EXPECT_EQ("VTAPE", ini["label prefix"].GetString());
}

TEST_F(IniFileTest, ReportsLineOfSyntaxError)
{
   FILE *fs = make_stream("log level = 3\n\nbogus keyword = 1\n");
   ASSERT_TRUE(fs != NULL);
   EXPECT_EQ(3, ini.Read(fs));
   fclose(fs);
   EXPECT_NE(tString::npos, ini.GetErrorMessage().find("bogus"));
}

TEST_F(IniFileTest, RejectsNonNumericLong)
{
   FILE *fs = make_stream("log level = high\n");
   ASSERT_TRUE(fs != NULL);
   EXPECT_EQ(1, ini.Read(fs));
   fclose(fs);
}

TEST_F(IniFileTest, RejectsUnterminatedQuote)
{
   FILE *fs = make_stream("label prefix = \"VTAPE\n");
   ASSERT_TRUE(fs != NULL);
   EXPECT_EQ(1, ini.Read(fs));
   fclose(fs);
}

TEST_F(IniFileTest, WriteThenReadBack)
{
   IniFile copy(ini);
   FILE *fs = tmpfile();
   ASSERT_TRUE(fs != NULL);
   ini["log level"] = 6;
   ini["rclone options"] = "--fast-list \"x\"";
   EXPECT_EQ(0, ini.Write(fs, "generated"));
   rewind(fs);
   EXPECT_EQ(0, copy.Read(fs));
   fclose(fs);
   EXPECT_EQ(6, copy["log level"].GetLONG());
   EXPECT_EQ("--fast-list \"x\"", copy["rclone options"].GetString());
   EXPECT_FALSE(copy["label prefix"].IsSet());
}

TEST_F(IniFileTest, UpdateCopiesOnlySetValues)
{
   IniFile other(ini);
   ini["label prefix"] = "KEEP";
   ini["log level"] = 2;
   other.ClearKeywordValues();
   other["log level"] = 7;
   EXPECT_TRUE(ini.Update(other));
   EXPECT_EQ(7, ini["log level"].GetLONG());
   EXPECT_STREQ("KEEP", ini["label prefix"].GetSZ());
}

TEST_F(IniFileTest, MissingKeywordReturnsUnsetValue)
{
   EXPECT_FALSE(ini["no such keyword"].IsSet());
   EXPECT_FALSE(ini.KeywordExists("no such keyword"));
   EXPECT_FALSE(ini.AddKeyword("log level", INIKEYWORDTYPE_LONG));
}
