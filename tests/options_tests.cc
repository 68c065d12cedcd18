/*
 *  This file is part of TagWriter.
 *
 *  Copyright (c) 2026 The TagWriter developers
 *
 *  TagWriter is free software: you can redistribute it and/or modify
 *  it under the terms of the GNU General Public License as published by
 *  the Free Software Foundation, either version 3 of the License, or
 *  (at your option) any later version.
 *
 *  TagWriter is distributed in the hope that it will be useful,
 *  but WITHOUT ANY WARRANTY; without even the implied warranty of
 *  MERCHANTABILITY or FITNESS FOR A PARTICULAR PURPOSE.  See the
 *  GNU General Public License for more details.
 *
 *  You should have received a copy of the GNU General Public License
 *  along with TagWriter.  If not, see <https://www.gnu.org/licenses/>.
 */
#include <gtest/gtest.h>
#include <glibmm/miscutils.h>

#include "../twcli/options.h"
#include "../twengine/settings.h"
#include "testutils.h"

TEST(OptionsTest, Defaults)
{
    Options options;

    EXPECT_FALSE(options.verbose);
    EXPECT_FALSE(options.backupBeforeSave);
    EXPECT_TRUE(options.exiftoolPath.empty());
    EXPECT_EQ(options.callTimeout, twengine::DEFAULT_CALL_TIMEOUT);
}

TEST(OptionsTest, SaveAndRead)
{
    TempDir dir;
    const std::string fname = Glib::build_filename(dir.path(), "options");

    Options saved;
    saved.verbose = true;
    saved.backupBeforeSave = true;
    saved.exiftoolPath = "/opt/exiftool/exiftool";
    saved.callTimeout = 12;
    saved.saveToFile(fname);

    Options read;
    read.readFromFile(fname);

    EXPECT_TRUE(read.verbose);
    EXPECT_TRUE(read.backupBeforeSave);
    EXPECT_EQ(read.exiftoolPath, "/opt/exiftool/exiftool");
    EXPECT_EQ(read.callTimeout, 12);
}

TEST(OptionsTest, MissingKeysKeepTheirValue)
{
    TempDir dir;
    const std::string fname = dir.file("options", "[Engine]\nCallTimeout=5\n");

    Options options;
    options.exiftoolPath = "exiftool";
    options.readFromFile(fname);

    EXPECT_EQ(options.callTimeout, 5);
    EXPECT_EQ(options.exiftoolPath, "exiftool");
    EXPECT_FALSE(options.verbose);
}

TEST(OptionsTest, InvalidFiles)
{
    TempDir dir;
    Options options;

    EXPECT_THROW(options.readFromFile(Glib::build_filename(dir.path(), "missing")), Options::Error);
    EXPECT_THROW(options.readFromFile(dir.file("garbled", "this is not a key file\n")), Options::Error);
    EXPECT_THROW(options.readFromFile(dir.file("notanumber", "[Engine]\nCallTimeout=soon\n")), Options::Error);
    EXPECT_THROW(options.readFromFile(dir.file("zero", "[Engine]\nCallTimeout=0\n")), Options::Error);
    EXPECT_THROW(options.readFromFile(dir.file("huge", "[Engine]\nCallTimeout=3000000\n")), Options::Error);
    EXPECT_EQ(options.callTimeout, twengine::DEFAULT_CALL_TIMEOUT);

    EXPECT_THROW(options.saveToFile(Glib::build_filename(dir.path(), "no", "such", "options")), Options::Error);
}
