/*  test_errhandler.cpp
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
#include <errno.h>
#include <string.h>
#include "errhandler.h"

TEST(ErrorHandlerTest, FormatsMessage)
{
   ErrorHandler verr;
   EXPECT_EQ(CHGERR_NONE, verr.GetError());
   EXPECT_STREQ("", verr.GetErrorMsg());
   verr.SetError(CHGERR_BAD_SLOT, "cannot load invalid slot %d", 9);
   EXPECT_EQ(CHGERR_BAD_SLOT, verr.GetError());
   EXPECT_STREQ("cannot load invalid slot 9", verr.GetErrorMsg());
   EXPECT_EQ(0, verr.GetErrno());
   verr.clear();
   EXPECT_EQ(CHGERR_NONE, verr.GetError());
}

TEST(ErrorHandlerTest, AppendsSystemError)
{
   ErrorHandler verr, copy;
   tString expect = "cannot open /x: ";
   expect += strerror(ENOENT);
   verr.SetErrorWithErrno(CHGERR_CONFIG, ENOENT, "cannot open %s", "/x");
   EXPECT_EQ(expect, verr.GetErrorMsg());
   EXPECT_EQ(ENOENT, verr.GetErrno());
   copy.SetError(verr);
   EXPECT_EQ(CHGERR_CONFIG, copy.GetError());
   EXPECT_EQ(ENOENT, copy.GetErrno());
   EXPECT_EQ(expect, copy.GetErrorMsg());
}

TEST(ErrorHandlerTest, KindNames)
{
   EXPECT_STREQ("transfer error", ErrorHandler::KindName(CHGERR_TRANSFER));
   EXPECT_STREQ("invalid state", ErrorHandler::KindName(CHGERR_INVALID_STATE));
   EXPECT_STREQ("unknown command", ErrorHandler::KindName(CHGERR_UNKNOWN_COMMAND));
   EXPECT_STREQ("configuration error", ErrorHandler::KindName(CHGERR_CONFIG));
}
