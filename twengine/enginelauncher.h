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

#include <memory>

#include <glibmm/ustring.h>

#include "enginehandle.h"

namespace twengine
{

class Settings;

namespace EngineLauncher
{

/** Starts @p executablePath in stay_open mode, reading argument batches from its standard input.
  * @return the handle of the running process
  * @throw EngineError if the process cannot be created or exits right away */
std::shared_ptr<EngineHandle> start (const Glib::ustring& executablePath);

/**
 * Resolves the ExifTool executable to run.
 *
 * A configured path is used as is (searched in PATH if it is a bare name).
 * Otherwise a copy bundled in "tools/" next to the running binary wins over
 * the one found in PATH. Falls back to the bare name "exiftool".
 */
Glib::ustring findExecutable (const Settings& s);

}

}
