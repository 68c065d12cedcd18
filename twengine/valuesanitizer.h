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

namespace ValueSanitizer
{

/** Longest value, in characters, that is written to a file */
constexpr Glib::ustring::size_type MAX_VALUE_LENGTH = 2000;

/**
 * Cleans a value up before it is written.
 *
 * Drops NUL characters and repairs invalid UTF-8, turns CR LF and lone CR
 * into LF, trims surrounding whitespace and cuts the result to
 * MAX_VALUE_LENGTH characters. sanitize(sanitize(v)) == sanitize(v).
 *
 * @return the cleaned value; empty means there is nothing to write
 */
Glib::ustring sanitize (const Glib::ustring& value);

}

}
