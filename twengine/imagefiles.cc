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
#include "imagefiles.h"

#include <algorithm>
#include <iostream>

#include <giomm/file.h>
#include <glibmm/fileutils.h>
#include <glibmm/miscutils.h>

#include "settings.h"

namespace twengine
{

namespace
{

const char* const imageExtensions[] = {".jpg", ".jpeg", ".png", ".gif", ".tif", ".tiff", ".bmp"};

Glib::ustring sortKey (const Glib::ustring& path)
{
    return Glib::ustring(Glib::path_get_basename(path)).lowercase();
}

}

bool ImageFiles::hasImageExtension (const Glib::ustring& fileName)
{
    const Glib::ustring::size_type dot = fileName.rfind('.');

    if (dot == Glib::ustring::npos) {
        return false;
    }

    const Glib::ustring ext = fileName.substr(dot).lowercase();

    for (const char* known : imageExtensions) {
        if (ext == known) {
            return true;
        }
    }

    return false;
}

std::vector<Glib::ustring> ImageFiles::getImageFiles (const Glib::ustring& directory)
{
    std::vector<Glib::ustring> files;

    if (directory.empty() || !Glib::file_test(directory, Glib::FILE_TEST_IS_DIR)) {
        return files;
    }

    try {
        const auto dir = Gio::File::create_for_path(directory);
        const auto enumerator = dir->enumerate_children("standard::name,standard::type", Gio::FILE_QUERY_INFO_NOFOLLOW_SYMLINKS);

        while (const auto file = enumerator->next_file()) {
            if (file->get_file_type() != Gio::FILE_TYPE_REGULAR) {
                continue;
            }

            const std::string name = file->get_name();

            if (hasImageExtension(name)) {
                files.push_back(Glib::build_filename(directory, name));
            }
        }
    } catch (const Glib::Error& e) {
        if (settings->verbose) {
            std::cerr << "ImageFiles::getImageFiles / cannot read " << directory << ": " << e.what() << std::endl;
        }

        files.clear();
        return files;
    }

    std::sort(files.begin(), files.end(),
        [](const Glib::ustring& lhs, const Glib::ustring& rhs)
        {
            return sortKey(lhs) < sortKey(rhs);
        }
    );

    return files;
}

Glib::ustring ImageFiles::backupFile (const Glib::ustring& fileName)
{
    if (!Glib::file_test(fileName, Glib::FILE_TEST_IS_REGULAR)) {
        return Glib::ustring();
    }

    Glib::ustring backupName = fileName + "_backup";

    for (int counter = 1; Glib::file_test(backupName, Glib::FILE_TEST_EXISTS); ++counter) {
        backupName = Glib::ustring::compose("%1_backup%2", fileName, counter);
    }

    try {
        Gio::File::create_for_path(fileName)->copy(Gio::File::create_for_path(backupName), Gio::FILE_COPY_ALL_METADATA);
    } catch (const Glib::Error& e) {
        if (settings->verbose) {
            std::cerr << "ImageFiles::backupFile / " << e.what() << std::endl;
        }

        return Glib::ustring();
    }

    if (settings->verbose) {
        std::cerr << "ImageFiles::backupFile / " << fileName << " -> " << backupName << std::endl;
    }

    return backupName;
}

}
