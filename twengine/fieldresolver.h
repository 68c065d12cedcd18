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
#ifndef _FIELDRESOLVER_
#define _FIELDRESOLVER_

#include <map>
#include <vector>

#include <glibmm/ustring.h>

namespace twengine
{

/** The descriptive fields TagWriter knows about, in display order. */
enum class Field {
    HEADLINE,
    CAPTION_ABSTRACT,
    CREDIT,
    OBJECT_NAME,
    WRITER_EDITOR,
    BYLINE,
    BYLINE_TITLE,
    SOURCE,
    DATE_CREATED,
    DATE_MODIFIED,
    COPYRIGHT_NOTICE,
    CONTACT
};

/** Tags of one file as reported by the engine, keyed by their group-qualified name ("IPTC:Headline") */
typedef std::map<Glib::ustring, Glib::ustring> RawMetadata;

/** One "-tag=value" assignment for the engine */
struct WriteArgument {
    Glib::ustring tag;
    Glib::ustring value;

    bool operator ==(const WriteArgument& other) const
    {
        return tag == other.tag && value == other.value;
    }
};

typedef std::vector<WriteArgument> WriteArguments;

/**
 * Field values of one image.
 *
 * Values are addressed by field name. Names of known fields go to the
 * canonical map, any other name is kept aside and written back as a tag of
 * that name.
 */
class MetadataRecord final
{
public:
    typedef std::map<Field, Glib::ustring> FieldMap;
    typedef std::map<Glib::ustring, Glib::ustring> CustomMap;

    void set(Field field, const Glib::ustring& value)
    {
        fields[field] = value;
    }

    void set(const Glib::ustring& name, const Glib::ustring& value);

    /** @return the value of @p name, or @p def if it has none */
    Glib::ustring get(const Glib::ustring& name, const Glib::ustring& def = Glib::ustring()) const;

    bool has(Field field) const
    {
        return fields.find(field) != fields.end();
    }

    const FieldMap& getFields() const
    {
        return fields;
    }

    const CustomMap& getCustom() const
    {
        return custom;
    }

    bool empty() const
    {
        return fields.empty() && custom.empty();
    }

    void clear()
    {
        fields.clear();
        custom.clear();
    }

    bool operator ==(const MetadataRecord& other) const
    {
        return fields == other.fields && custom == other.custom;
    }

    bool operator !=(const MetadataRecord& other) const
    {
        return !(*this == other);
    }

private:
    FieldMap fields;
    CustomMap custom;
};

namespace FieldResolver
{

/** @return all fields, in display order */
const std::vector<Field>& getFields();

/** @return the name of @p field as shown to the user ("Caption-Abstract") */
Glib::ustring getName(Field field);

/** Looks up a field by name.
  * @return false if @p name is not the name of a known field */
bool fromName(const Glib::ustring& name, Field& field);

/** @return the tags @p field is read from, highest priority first. The first one is written to. */
std::vector<Glib::ustring> getCandidates(Field field);

/** Picks the value of every known field out of @p raw.
  *
  * A field takes the value of its first candidate tag present in @p raw, even
  * an empty one. DateModified takes its first candidate that is not empty.
  * Fields without any candidate in @p raw are left out. */
MetadataRecord normalizeRead(const RawMetadata& raw);

/** Builds the tag assignments that store @p record.
  *
  * Known fields are written to their first candidate tag, other names are
  * used as the tag. Values are sanitized and skipped if nothing is left. */
WriteArguments normalizeWrite(const MetadataRecord& record);

}

}

#endif
