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

#include <glibmm/ustring.h>

namespace twengine
{

/** Default number of seconds one call into the metadata engine may take. */
constexpr int DEFAULT_CALL_TIMEOUT = 30;
/** Upper bound of the call timeout, in seconds. */
constexpr int MAX_CALL_TIMEOUT = 3600;

/** This structure holds the global parameters used by the TagWriter engine. */
class Settings
{
public:
    Glib::ustring   exiftoolPath;           ///< Configured ExifTool executable; empty means "search for it"
    Glib::ustring   bundleDirectory;        ///< Directory of the running binary, used to find a bundled "tools/exiftool"
    int             callTimeout;            ///< Seconds before a call into the engine is abandoned
    bool            verbose;

    Settings();

    /** Creates a new instance of Settings.
      * @return a pointer to the new Settings instance. */
    static Settings* create();
    /** Destroys an instance of Settings.
      * @param s a pointer to the Settings instance to destroy. */
    static void      destroy(Settings* s);
};

/** Settings used by the engine for diagnostics. Never null; points to built-in defaults until init() is called. */
extern const Settings* settings;

/** Makes @p s the settings instance used for diagnostics. Passing nullptr restores the defaults. */
void init(const Settings* s);

}
