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

namespace twengine
{

namespace ImageFiles
{

/** @return true if @p fileName has the extension of an image format TagWriter edits */
bool hasImageExtension (const Glib::ustring& fileName);

/** Lists the image files of @p directory, symbolic links excluded, sorted by name ignoring case.
  * @return full paths; empty if the directory cannot be read */
std::vector<Glib::ustring> getImageFiles (const Glib::ustring& directory);

/** Copies @p fileName with its attributes to "<fileName>_backup", or "<fileName>_backupN" if that exists.
  * @return the path of the copy, empty on failure */
Glib::ustring backupFile (const Glib::ustring& fileName);

}

}
