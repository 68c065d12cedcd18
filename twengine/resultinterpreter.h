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
#include <nlohmann/json.hpp>

#include "fieldresolver.h"

namespace twengine
{

namespace ResultInterpreter
{

/** Reads the output of "exiftool -j" for one file.
  * @return the tags of the first file; empty if there is none or the output is not JSON */
RawMetadata parseRead (const Glib::ustring& output);

/** @return true if the output of a write reports at least one file updated or created */
bool parseWriteResult (const Glib::ustring& output);

/** Text form of a JSON value: strings as they are, arrays joined by ", ", null as empty, anything else as JSON */
Glib::ustring jsonValueToText (const nlohmann::json& value);

}

}
