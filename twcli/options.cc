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
#include "options.h"

#include <iostream>

#include <glibmm/fileutils.h>
#include <glibmm/keyfile.h>
#include <glibmm/miscutils.h>

#include "../twengine/settings.h"

Options::Options ()
{
    setDefaults ();
}

void Options::setDefaults ()
{
    verbose = false;
    backupBeforeSave = false;
    exiftoolPath = "";
    callTimeout = twengine::DEFAULT_CALL_TIMEOUT;
}

Glib::ustring Options::getDefaultFile ()
{
    return Glib::build_filename (Glib::get_user_config_dir (), "tagwriter", "options");
}

void Options::readFromFile (const Glib::ustring& fname)
{
    Glib::KeyFile keyFile;

    if (!Glib::file_test (fname, Glib::FILE_TEST_EXISTS)) {
        Glib::ustring msg = Glib::ustring::compose ("Options file %1 does not exist", fname);
        throw Error (msg);
    }

    try {
        if (keyFile.load_from_file (fname)) {

            if (keyFile.has_group ("General")) {
                if (keyFile.has_key ("General", "Verbose"))           verbose          = keyFile.get_boolean ("General", "Verbose");
                if (keyFile.has_key ("General", "BackupBeforeSave"))  backupBeforeSave = keyFile.get_boolean ("General", "BackupBeforeSave");
            }

            if (keyFile.has_group ("Engine")) {
                if (keyFile.has_key ("Engine", "ExifToolPath"))       exiftoolPath     = keyFile.get_string  ("Engine", "ExifToolPath");
                if (keyFile.has_key ("Engine", "CallTimeout"))        callTimeout      = keyFile.get_integer ("Engine", "CallTimeout");
            }

            if (callTimeout <= 0 || callTimeout > twengine::MAX_CALL_TIMEOUT) {
                Glib::ustring msg = Glib::ustring::compose ("%1: CallTimeout must be between 1 and %2 seconds", fname, twengine::MAX_CALL_TIMEOUT);
                callTimeout = twengine::DEFAULT_CALL_TIMEOUT;
                throw Error (msg);
            }
        }
    } catch (const Glib::Error &err) {
        Glib::ustring msg = Glib::ustring::compose ("Options::readFromFile / Error code %1 while reading values from \"%2\":\n%3", err.code(), fname, err.what());

        if (verbose) {
            std::cerr << msg << std::endl;
        }

        throw Error (msg);
    }
}

void Options::saveToFile (const Glib::ustring& fname) const
{
    Glib::KeyFile keyFile;

    keyFile.set_boolean ("General", "Verbose", verbose);
    keyFile.set_boolean ("General", "BackupBeforeSave", backupBeforeSave);

    keyFile.set_string  ("Engine", "ExifToolPath", exiftoolPath);
    keyFile.set_integer ("Engine", "CallTimeout", callTimeout);

    try {
        Glib::file_set_contents (fname, keyFile.to_data ());
    } catch (const Glib::FileError &err) {
        Glib::ustring msg = Glib::ustring::compose ("Options::saveToFile / Error: unable to write \"%1\": %2", fname, err.what());
        throw Error (msg);
    }
}
