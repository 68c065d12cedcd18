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
#include <algorithm>

#include <gtest/gtest.h>
#include <glibmm/threads.h>

#include "../twengine/fieldresolver.h"

using namespace twengine;

TEST(FieldResolverTest, ReadsPrimaryTag)
{
    RawMetadata raw;
    raw["IPTC:Headline"] = "Storm damage";

    const MetadataRecord record = FieldResolver::normalizeRead(raw);

    EXPECT_EQ(record.getFields().size(), 1u);
    EXPECT_EQ(record.get("Headline"), "Storm damage");
}

TEST(FieldResolverTest, DateModifiedPrefersExif)
{
    RawMetadata raw;
    raw["EXIF:ModifyDate"] = "2024:01:01 00:00:00";
    raw["XMP:ModifyDate"] = "2023:06:01 00:00:00";

    EXPECT_EQ(FieldResolver::normalizeRead(raw).get("DateModified"), "2024:01:01 00:00:00");
}

TEST(FieldResolverTest, DateModifiedSkipsEmptyCandidates)
{
    RawMetadata raw;
    raw["EXIF:ModifyDate"] = "";
    raw["EXIF:FileModifyDate"] = "";
    raw["ICC_Profile:ProfileDateTime"] = "2020:02:02 10:00:00";

    EXPECT_EQ(FieldResolver::normalizeRead(raw).get("DateModified"), "2020:02:02 10:00:00");

    raw["ICC_Profile:ProfileDateTime"] = "";
    EXPECT_FALSE(FieldResolver::normalizeRead(raw).has(Field::DATE_MODIFIED));
}

TEST(FieldResolverTest, PresentButEmptyCandidateWins)
{
    RawMetadata raw;
    raw["IPTC:By-line"] = "";
    raw["XMP:Creator"] = "Someone else";

    const MetadataRecord record = FieldResolver::normalizeRead(raw);

    EXPECT_TRUE(record.has(Field::BYLINE));
    EXPECT_EQ(record.get("By-line", "unset"), "");
}

TEST(FieldResolverTest, EveryCandidateAloneResolvesToItsField)
{
    for (const auto field : FieldResolver::getFields()) {
        for (const auto& tag : FieldResolver::getCandidates(field)) {
            RawMetadata raw;
            raw[tag] = "value of " + tag;

            const MetadataRecord record = FieldResolver::normalizeRead(raw);

            EXPECT_EQ(record.get(FieldResolver::getName(field)), "value of " + tag) << "tag " << tag;
            EXPECT_TRUE(record.getCustom().empty());

            // a tag shared by several fields ("XMP:Title") feeds all of them
            for (const auto& entry : record.getFields()) {
                const std::vector<Glib::ustring> candidates = FieldResolver::getCandidates(entry.first);
                EXPECT_NE(std::find(candidates.begin(), candidates.end(), tag), candidates.end());
                EXPECT_EQ(entry.second, "value of " + tag);
            }
        }
    }
}

TEST(FieldResolverTest, HighestPriorityCandidateWins)
{
    RawMetadata raw;

    for (const auto field : FieldResolver::getFields()) {
        for (const auto& tag : FieldResolver::getCandidates(field)) {
            raw[tag] = tag;
        }
    }

    const MetadataRecord first = FieldResolver::normalizeRead(raw);

    for (const auto field : FieldResolver::getFields()) {
        EXPECT_EQ(first.get(FieldResolver::getName(field)), FieldResolver::getCandidates(field).front());
    }

    for (int i = 0; i < 10; ++i) {
        EXPECT_EQ(FieldResolver::normalizeRead(raw), first);
    }
}

TEST(FieldResolverTest, UnknownTagsAreIgnored)
{
    RawMetadata raw;
    raw["SourceFile"] = "/tmp/a.jpg";
    raw["File:ImageWidth"] = "640";

    EXPECT_TRUE(FieldResolver::normalizeRead(raw).empty());
}

TEST(FieldResolverTest, WriteUsesPrimaryTags)
{
    RawMetadata raw;
    raw["XMP:Title"] = "Roof";
    raw["XMP:Creator"] = "Jane";
    raw["XMP:ModifyDate"] = "2023:06:01 00:00:00";

    const WriteArguments args = FieldResolver::normalizeWrite(FieldResolver::normalizeRead(raw));

    // Headline and ObjectName both read XMP:Title
    ASSERT_EQ(args.size(), 4u);
    EXPECT_EQ(args[0].tag, "IPTC:Headline");
    EXPECT_EQ(args[0].value, "Roof");
    EXPECT_EQ(args[1].tag, "IPTC:ObjectName");
    EXPECT_EQ(args[1].value, "Roof");
    EXPECT_EQ(args[2].tag, "IPTC:By-line");
    EXPECT_EQ(args[2].value, "Jane");
    EXPECT_EQ(args[3].tag, "EXIF:ModifyDate");
    EXPECT_EQ(args[3].value, "2023:06:01 00:00:00");
}

TEST(FieldResolverTest, WriteCoversExactlyTheResolvedFields)
{
    RawMetadata raw;
    raw["IPTC:Headline"] = "Storm damage";
    raw["EXIF:ImageDescription"] = "Roof torn off";
    raw["XMP:Rights"] = "(c) 2024";
    raw["IPTC:Keywords"] = "storm";

    const MetadataRecord record = FieldResolver::normalizeRead(raw);
    const WriteArguments args = FieldResolver::normalizeWrite(record);

    ASSERT_EQ(args.size(), record.getFields().size());

    size_t i = 0;

    for (const auto& entry : record.getFields()) {
        EXPECT_EQ(args[i].tag, FieldResolver::getCandidates(entry.first).front());
        EXPECT_EQ(args[i].value, entry.second);
        ++i;
    }
}

TEST(FieldResolverTest, WriteSanitizesAndSkipsEmptyValues)
{
    MetadataRecord record;
    record.set("Headline", "  Storm\r\ndamage  ");
    record.set("Credit", "   ");
    record.set("Source", "");

    const WriteArguments args = FieldResolver::normalizeWrite(record);

    ASSERT_EQ(args.size(), 1u);
    EXPECT_EQ(args[0].tag, "IPTC:Headline");
    EXPECT_EQ(args[0].value, "Storm\ndamage");
}

TEST(FieldResolverTest, CustomNamesAreWrittenAsTags)
{
    MetadataRecord record;
    record.set("XMP:Label", "red");
    record.set("Contact", "desk@example.com");
    record.set("IPTC:City", "Oslo");

    const WriteArguments args = FieldResolver::normalizeWrite(record);

    ASSERT_EQ(args.size(), 3u);
    EXPECT_EQ(args[0].tag, "IPTC:Contact");
    EXPECT_EQ(args[1].tag, "IPTC:City");
    EXPECT_EQ(args[1].value, "Oslo");
    EXPECT_EQ(args[2].tag, "XMP:Label");
}

TEST(FieldResolverTest, FieldNames)
{
    ASSERT_EQ(FieldResolver::getFields().size(), 12u);
    EXPECT_EQ(FieldResolver::getName(Field::HEADLINE), "Headline");
    EXPECT_EQ(FieldResolver::getName(Field::CAPTION_ABSTRACT), "Caption-Abstract");
    EXPECT_EQ(FieldResolver::getName(Field::CONTACT), "Contact");

    for (const auto field : FieldResolver::getFields()) {
        Field found = Field::HEADLINE;
        EXPECT_TRUE(FieldResolver::fromName(FieldResolver::getName(field), found));
        EXPECT_EQ(found, field);
    }

    Field unused;
    EXPECT_FALSE(FieldResolver::fromName("headline", unused));
    EXPECT_FALSE(FieldResolver::fromName("IPTC:Headline", unused));
}

TEST(FieldResolverTest, FieldListIsSharedAcrossThreads)
{
    std::vector<const std::vector<Field>*> seen(8, nullptr);
    std::vector<Glib::Threads::Thread*> threads;

    for (auto& slot : seen) {
        threads.push_back(Glib::Threads::Thread::create([&slot]() {
            slot = &FieldResolver::getFields();
        }));
    }

    for (auto thread : threads) {
        thread->join();
    }

    for (const auto list : seen) {
        ASSERT_EQ(list, &FieldResolver::getFields());
        EXPECT_EQ(list->size(), 12u);
    }
}

TEST(FieldResolverTest, RecordKeepsCustomNamesApart)
{
    MetadataRecord record;
    record.set("Headline", "a");
    record.set("Mood", "b");

    EXPECT_EQ(record.getFields().size(), 1u);
    EXPECT_EQ(record.getCustom().size(), 1u);
    EXPECT_EQ(record.get("Mood"), "b");
    EXPECT_EQ(record.get("Missing", "default"), "default");

    record.clear();
    EXPECT_TRUE(record.empty());
}
