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
#include <glibmm/fileutils.h>
#include <glibmm/regex.h>
#include <nlohmann/json.hpp>

#include "../twengine/metadatamanager.h"
#include "testutils.h"

using namespace twengine;

class MetadataManagerTest : public ::testing::Test
{
protected:
    MetadataManagerTest() :
        engine(fakeEngineSettings(1)),
        manager(engine)
    {
    }

    ~MetadataManagerTest()
    {
        engine.stop();
    }

    std::string writtenArgs(const std::string& image) const
    {
        const std::string argsFile = image + ".args";
        return Glib::file_test(argsFile, Glib::FILE_TEST_EXISTS) ? Glib::file_get_contents(argsFile) : std::string();
    }

    TempDir dir;
    EngineSupervisor engine;
    MetadataManager manager;
};

TEST_F(MetadataManagerTest, LoadResolvesFields)
{
    const std::string image = dir.file("photo.jpg");

    ASSERT_TRUE(manager.loadFromFile(image));
    EXPECT_EQ(manager.getField("Headline"), "Storm damage");
    EXPECT_EQ(manager.getField("ObjectName"), "Roof");
    EXPECT_EQ(manager.getField("DateModified"), "2024:01:01 00:00:00");
    EXPECT_EQ(manager.getField("By-line", "unset"), "");
    EXPECT_EQ(manager.getField("Credit", "unset"), "unset");
    EXPECT_EQ(manager.getCurrentFile(), image);
    EXPECT_EQ(manager.getLastStatus(), EngineSupervisor::OK);
}

TEST_F(MetadataManagerTest, TiffIgnoresMinorErrors)
{
    ASSERT_TRUE(manager.loadFromFile(dir.file("scan.TIF")));
    EXPECT_EQ(manager.getField("Credit"), "Minor errors ignored");

    ASSERT_TRUE(manager.loadFromFile(dir.file("photo.jpg")));
    EXPECT_EQ(manager.getField("Credit"), "");
}

TEST_F(MetadataManagerTest, LoadMissingFileFails)
{
    manager.setField("Headline", "kept");

    EXPECT_FALSE(manager.loadFromFile(Glib::build_filename(dir.path(), "missing.jpg")));
    EXPECT_EQ(manager.getField("Headline"), "kept");
}

TEST_F(MetadataManagerTest, NoMetadataIsAnEmptyRecord)
{
    manager.setField("Headline", "old");

    EXPECT_TRUE(manager.loadFromFile(dir.file("empty.jpg")));
    EXPECT_TRUE(manager.getRecord().empty());

    EXPECT_TRUE(manager.loadFromFile(dir.file("garbage.jpg")));
    EXPECT_TRUE(manager.getRecord().empty());
}

TEST_F(MetadataManagerTest, LoadTimeoutClearsRecord)
{
    manager.setField("Headline", "old");

    EXPECT_FALSE(manager.loadFromFile(dir.file("hang.jpg")));
    EXPECT_EQ(manager.getLastStatus(), EngineSupervisor::TIMEOUT);
    EXPECT_TRUE(manager.getRecord().empty());

    // the engine is replaced for the next call
    EXPECT_TRUE(manager.loadFromFile(dir.file("photo.jpg")));
    EXPECT_EQ(manager.getField("Headline"), "Storm damage");
}

TEST_F(MetadataManagerTest, SaveWritesPrimaryTags)
{
    const std::string image = dir.file("photo.jpg");

    manager.setField("Headline", "A & B");
    manager.setField("By-line", " Me \r\n");
    manager.setField("XMP:Label", "x");
    manager.setField("Credit", "");

    ASSERT_TRUE(manager.saveToFile(image));

    EXPECT_EQ(writtenArgs(image),
              "-E\n"
              "-IPTC:Headline=A &amp; B\n"
              "-IPTC:By-line=Me\n"
              "-XMP:Label=x\n"
              "-overwrite_original\n" +
              image + "\n");
}

TEST_F(MetadataManagerTest, SaveKeepsMultiLineValuesOnOneLine)
{
    const std::string image = dir.file("photo.jpg");

    manager.setField("Caption-Abstract", "first line\r\nsecond \"line\"");

    ASSERT_TRUE(manager.saveToFile(image));
    EXPECT_NE(writtenArgs(image).find("-IPTC:Caption-Abstract=first line&#xa;second &quot;line&quot;\n"), std::string::npos);
}

TEST_F(MetadataManagerTest, SaveWithNothingToWrite)
{
    const std::string image = dir.file("photo.jpg");

    manager.setField("Headline", "   ");

    EXPECT_TRUE(manager.saveToFile(image));
    EXPECT_TRUE(writtenArgs(image).empty());
}

TEST_F(MetadataManagerTest, SaveRejected)
{
    manager.setField("Headline", "Storm damage");

    EXPECT_FALSE(manager.saveToFile(dir.file("reject.jpg")));
    EXPECT_EQ(manager.getLastStatus(), EngineSupervisor::OK);
    EXPECT_FALSE(manager.getLastError().empty());
}

TEST_F(MetadataManagerTest, SaveMissingFileFails)
{
    manager.setField("Headline", "Storm damage");
    EXPECT_FALSE(manager.saveToFile(Glib::build_filename(dir.path(), "missing.jpg")));
}

TEST_F(MetadataManagerTest, FileNamesWithLineBreaksAreRejected)
{
    const std::string target = dir.file("x.jpg");
    const std::string image = dir.file("x.jpg\n-IPTC:Credit=injected");

    manager.setField("Headline", "Storm damage");

    EXPECT_FALSE(manager.saveToFile(image));
    EXPECT_FALSE(manager.getLastError().empty());
    EXPECT_TRUE(writtenArgs(target).empty());
    EXPECT_TRUE(writtenArgs(image).empty());

    EXPECT_FALSE(manager.loadFromFile(image));
    EXPECT_EQ(manager.getField("Headline"), "Storm damage");
    EXPECT_TRUE(manager.readAllTags(dir.file("y.jpg\r")).empty());
}

TEST_F(MetadataManagerTest, ExportWritesFieldsAndFileName)
{
    ASSERT_TRUE(manager.loadFromFile(dir.file("photo.jpg")));

    const std::string json = Glib::build_filename(dir.path(), "photo.json");
    ASSERT_TRUE(manager.exportToJson(json));

    const nlohmann::json data = nlohmann::json::parse(Glib::file_get_contents(json));

    EXPECT_EQ(data["filename"], "photo.jpg");
    EXPECT_TRUE(Glib::Regex::match_simple("^\\d{4}-\\d{2}-\\d{2} \\d{2}:\\d{2}:\\d{2}$", data["export_date"].get<std::string>()));
    EXPECT_EQ(data["metadata"]["Headline"], "Storm damage");
    EXPECT_EQ(data["metadata"]["DateModified"], "2024:01:01 00:00:00");
}

TEST_F(MetadataManagerTest, ExportWithoutFile)
{
    manager.setField("Headline", "Draft");

    const std::string json = Glib::build_filename(dir.path(), "draft.json");
    ASSERT_TRUE(manager.exportToJson(json));

    const nlohmann::json data = nlohmann::json::parse(Glib::file_get_contents(json));
    EXPECT_EQ(data["filename"], "unknown");

    EXPECT_FALSE(manager.exportToJson(Glib::build_filename(dir.path(), "no", "such", "dir.json")));
    EXPECT_FALSE(manager.getLastError().empty());
}

TEST_F(MetadataManagerTest, ExportThenImportRestoresFields)
{
    ASSERT_TRUE(manager.loadFromFile(dir.file("photo.jpg")));
    manager.setField("Contact", "desk@example.com");

    const MetadataRecord before = manager.getRecord();
    const std::string json = Glib::build_filename(dir.path(), "photo.json");
    ASSERT_TRUE(manager.exportToJson(json));

    manager.clear();
    ASSERT_TRUE(manager.importFromJson(json));

    EXPECT_EQ(manager.getRecord(), before);
}

TEST_F(MetadataManagerTest, ImportBareObjectTakesKnownFieldsOnly)
{
    const std::string json = dir.file("bare.json",
        "{\"Headline\": \"Imported\", \"Credit\": 42, \"Mood\": \"ignored\", \"Source\": null}");

    manager.setField("Contact", "kept");

    ASSERT_TRUE(manager.importFromJson(json));
    EXPECT_EQ(manager.getField("Headline"), "Imported");
    EXPECT_EQ(manager.getField("Credit"), "42");
    EXPECT_EQ(manager.getField("Source", "unset"), "");
    EXPECT_EQ(manager.getField("Mood", "unset"), "unset");
    EXPECT_EQ(manager.getField("Contact"), "kept");
}

TEST_F(MetadataManagerTest, ImportInvalidJsonFails)
{
    EXPECT_FALSE(manager.importFromJson(dir.file("broken.json", "{\"Headline\": ")));
    EXPECT_FALSE(manager.importFromJson(dir.file("list.json", "[1, 2]")));
    EXPECT_FALSE(manager.importFromJson(Glib::build_filename(dir.path(), "missing.json")));
    EXPECT_TRUE(manager.getRecord().empty());
}

TEST_F(MetadataManagerTest, ReadAllTags)
{
    const RawMetadata tags = manager.readAllTags(dir.file("photo.jpg"));

    EXPECT_EQ(tags.at("File:ImageWidth"), "640");
    EXPECT_EQ(tags.at("IPTC:Keywords"), "storm, roof");
    EXPECT_EQ(tags.at("XMP:Creator"), "Someone else");
}

TEST_F(MetadataManagerTest, FieldNames)
{
    const std::vector<Glib::ustring> names = manager.getFieldNames();

    ASSERT_EQ(names.size(), 12u);
    EXPECT_EQ(names.front(), "Headline");
    EXPECT_EQ(names.back(), "Contact");
}

TEST(MetadataManagerUnavailableTest, OperationsFailWithoutEngine)
{
    TempDir dir;
    twengine::Settings s = fakeEngineSettings();
    s.exiftoolPath = "/nonexistent/tagwriter/exiftool";
    EngineSupervisor engine(s);
    MetadataManager manager(engine);

    EXPECT_FALSE(manager.loadFromFile(dir.file("photo.jpg")));
    EXPECT_EQ(manager.getLastStatus(), EngineSupervisor::UNAVAILABLE);

    manager.setField("Headline", "x");
    EXPECT_FALSE(manager.saveToFile(dir.file("photo.jpg")));
    EXPECT_EQ(manager.getLastStatus(), EngineSupervisor::UNAVAILABLE);
}

TEST(MetadataManagerEscapeTest, EscapesHtmlCharacters)
{
    EXPECT_EQ(MetadataManager::escapeValue("plain"), "plain");
    EXPECT_EQ(MetadataManager::escapeValue("<a href='x'>\"&\"</a>"),
              "&lt;a href=&#39;x&#39;&gt;&quot;&amp;&quot;&lt;/a&gt;");
    EXPECT_EQ(MetadataManager::escapeValue("one\ntwo"), "one&#xa;two");
}
