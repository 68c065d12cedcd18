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
#include "valuesanitizer.h"

#include <glib.h>

namespace twengine
{

namespace
{

std::string repairUtf8 (const std::string& text)
{
    if (g_utf8_validate(text.data(), text.size(), nullptr)) {
        return text;
    }

    gchar* const valid = g_utf8_make_valid(text.data(), text.size());
    const std::string ret(valid);
    g_free(valid);
    return ret;
}

Glib::ustring trim (const Glib::ustring& text)
{
    Glib::ustring::const_iterator first = text.begin();
    Glib::ustring::const_iterator last = text.end();

    while (first != last && g_unichar_isspace(*first)) {
        ++first;
    }

    while (last != first) {
        Glib::ustring::const_iterator prev = last;
        --prev;

        if (!g_unichar_isspace(*prev)) {
            break;
        }

        last = prev;
    }

    return Glib::ustring(first, last);
}

}

Glib::ustring ValueSanitizer::sanitize (const Glib::ustring& value)
{
    std::string bytes;
    bytes.reserve(value.bytes());

    for (const char c : value.raw()) {
        if (c != '\0') {
            bytes += c;
        }
    }

    std::string::size_type pos = 0;

    while ((pos = bytes.find('\r', pos)) != std::string::npos) {
        if (pos + 1 < bytes.size() && bytes[pos + 1] == '\n') {
            bytes.erase(pos, 1);
        } else {
            bytes[pos] = '\n';
        }

        ++pos;
    }

    Glib::ustring result = trim(repairUtf8(bytes));

    if (result.size() > MAX_VALUE_LENGTH) {
        result = trim(result.substr(0, MAX_VALUE_LENGTH));
    }

    return result;
}

}
