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
#include "fieldresolver.h"

#include <iostream>

#include "settings.h"
#include "valuesanitizer.h"

namespace twengine
{

namespace
{

struct FieldMapping {
    Field field;
    const char* name;
    const char* candidates[4]; // highest priority first, nullptr padded
};

const FieldMapping fieldMappings[] = {
    {Field::HEADLINE,         "Headline",        {"IPTC:Headline", "XMP-photoshop:Headline", "XMP:Headline", "XMP:Title"}},
    {Field::CAPTION_ABSTRACT, "Caption-Abstract", {"IPTC:Caption-Abstract", "XMP:Description", "EXIF:ImageDescription", nullptr}},
    {Field::CREDIT,           "Credit",          {"IPTC:Credit", "XMP:Credit", "XMP-photoshop:Credit", nullptr}},
    {Field::OBJECT_NAME,      "ObjectName",      {"IPTC:ObjectName", "IPTC:Object Name", "XMP:Title", nullptr}},
    {Field::WRITER_EDITOR,    "Writer-Editor",   {"IPTC:Writer-Editor", "XMP:CaptionWriter", "XMP-photoshop:CaptionWriter", nullptr}},
    {Field::BYLINE,           "By-line",         {"IPTC:By-line", "XMP:Creator", "EXIF:Artist", nullptr}},
    {Field::BYLINE_TITLE,     "By-lineTitle",    {"IPTC:By-lineTitle", "XMP:AuthorsPosition", "XMP-photoshop:AuthorsPosition", nullptr}},
    {Field::SOURCE,           "Source",          {"IPTC:Source", "XMP:Source", "XMP-photoshop:Source", nullptr}},
    {Field::DATE_CREATED,     "DateCreated",     {"IPTC:DateCreated", "XMP:DateCreated", "XMP-photoshop:DateCreated", nullptr}},
    {Field::DATE_MODIFIED,    "DateModified",    {"EXIF:ModifyDate", "EXIF:FileModifyDate", "XMP:ModifyDate", "ICC_Profile:ProfileDateTime"}},
    {Field::COPYRIGHT_NOTICE, "CopyrightNotice", {"IPTC:CopyrightNotice", "XMP:Rights", "EXIF:Copyright", nullptr}},
    {Field::CONTACT,          "Contact",         {"IPTC:Contact", "XMP:Contact", nullptr, nullptr}}
};

const FieldMapping& mappingOf(Field field)
{
    for (const auto& mapping : fieldMappings) {
        if (mapping.field == field) {
            return mapping;
        }
    }

    // every enumerator has a row
    return fieldMappings[0];
}

std::vector<Field> buildFields()
{
    std::vector<Field> fields;

    for (const auto& mapping : fieldMappings) {
        fields.push_back(mapping.field);
    }

    return fields;
}

}

void MetadataRecord::set(const Glib::ustring& name, const Glib::ustring& value)
{
    Field field;

    if (FieldResolver::fromName(name, field)) {
        fields[field] = value;
    } else {
        custom[name] = value;
    }
}

Glib::ustring MetadataRecord::get(const Glib::ustring& name, const Glib::ustring& def) const
{
    Field field;

    if (FieldResolver::fromName(name, field)) {
        const FieldMap::const_iterator it = fields.find(field);
        return it != fields.end() ? it->second : def;
    }

    const CustomMap::const_iterator it = custom.find(name);
    return it != custom.end() ? it->second : def;
}

const std::vector<Field>& FieldResolver::getFields()
{
    static const std::vector<Field> fields = buildFields();
    return fields;
}

Glib::ustring FieldResolver::getName(Field field)
{
    return mappingOf(field).name;
}

bool FieldResolver::fromName(const Glib::ustring& name, Field& field)
{
    for (const auto& mapping : fieldMappings) {
        if (name == mapping.name) {
            field = mapping.field;
            return true;
        }
    }

    return false;
}

std::vector<Glib::ustring> FieldResolver::getCandidates(Field field)
{
    std::vector<Glib::ustring> result;

    for (const char* tag : mappingOf(field).candidates) {
        if (tag) {
            result.push_back(tag);
        }
    }

    return result;
}

MetadataRecord FieldResolver::normalizeRead(const RawMetadata& raw)
{
    MetadataRecord record;

    for (const auto& mapping : fieldMappings) {
        // dates may be present but blank in one namespace and set in another
        const bool needValue = mapping.field == Field::DATE_MODIFIED;

        for (const char* tag : mapping.candidates) {
            if (!tag) {
                break;
            }

            const RawMetadata::const_iterator it = raw.find(tag);

            if (it == raw.end() || (needValue && it->second.empty())) {
                continue;
            }

            if (settings->verbose) {
                std::cerr << "FieldResolver::normalizeRead / " << mapping.name << " <- " << tag << std::endl;
            }

            record.set(mapping.field, it->second);
            break;
        }
    }

    return record;
}

WriteArguments FieldResolver::normalizeWrite(const MetadataRecord& record)
{
    WriteArguments args;

    // std::map keeps fields in enum order and custom names sorted
    for (const auto& entry : record.getFields()) {
        const Glib::ustring value = ValueSanitizer::sanitize(entry.second);

        if (!value.empty()) {
            args.push_back({mappingOf(entry.first).candidates[0], value});
        }
    }

    for (const auto& entry : record.getCustom()) {
        const Glib::ustring value = ValueSanitizer::sanitize(entry.second);

        if (!value.empty() && !entry.first.empty()) {
            args.push_back({entry.first, value});
        }
    }

    return args;
}

}
