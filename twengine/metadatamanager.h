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
#pragma once

#include <vector>

#include <glibmm/ustring.h>

#include "enginesupervisor.h"
#include "fieldresolver.h"

namespace twengine
{

/**
 * @brief Field values of the image being edited, read from and written to
 * files through the metadata engine.
 *
 * Every operation reports failure through its return value; getLastStatus()
 * and getLastError() tell why the last engine call failed.
 */
class MetadataManager final
{
public:
    explicit MetadataManager(EngineSupervisor& engine);

    /** Replaces the current values with those of @p path.
      * @return false if the file does not exist, its name has a line break, or the engine could not read it */
    bool loadFromFile(const Glib::ustring& path);

    Glib::ustring getField(const Glib::ustring& name, const Glib::ustring& def = Glib::ustring()) const;
    void setField(const Glib::ustring& name, const Glib::ustring& value);

    /** Writes the current values into @p path, replacing the file.
      * @return true if the engine reports the file as updated, or if there is nothing to write */
    bool saveToFile(const Glib::ustring& path);

    bool exportToJson(const Glib::ustring& path) const;

    /** Takes the known fields of a file written by exportToJson(), or of a plain name to value object.
      * Other fields keep their values. */
    bool importFromJson(const Glib::ustring& path);

    void clear();

    /** @return the names of the known fields, in display order */
    std::vector<Glib::ustring> getFieldNames() const;

    /** @return every tag the engine finds in @p path; empty on failure */
    RawMetadata readAllTags(const Glib::ustring& path);

    const MetadataRecord& getRecord() const
    {
        return record_;
    }

    /** @return the file last loaded successfully */
    const Glib::ustring& getCurrentFile() const
    {
        return current_file_;
    }

    EngineSupervisor::Status getLastStatus() const
    {
        return last_status_;
    }

    const Glib::ustring& getLastError() const
    {
        return last_error_;
    }

    /** Encodes @p value for an engine run with -E: one line, HTML entities. */
    static Glib::ustring escapeValue(const Glib::ustring& value);

    /** @return the arguments of the engine call that writes @p args into @p path */
    static std::vector<Glib::ustring> buildWriteCommand(const WriteArguments& args, const Glib::ustring& path);

private:
    bool checkFile(const Glib::ustring& path);
    bool run(const std::vector<Glib::ustring>& args, Glib::ustring& output);
    RawMetadata readTags(const Glib::ustring& path);

    EngineSupervisor& engine_;
    MetadataRecord record_;
    Glib::ustring current_file_;
    EngineSupervisor::Status last_status_;
    mutable Glib::ustring last_error_;  // exportToJson() reports through it
};

}
