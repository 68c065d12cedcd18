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
#include "resultinterpreter.h"

#include <iostream>

#include <glib.h>
#include <glibmm/regex.h>

#include "settings.h"

namespace twengine
{

Glib::ustring ResultInterpreter::jsonValueToText (const nlohmann::json& value)
{
    switch (value.type()) {
        case nlohmann::json::value_t::null:
        case nlohmann::json::value_t::discarded:
            return Glib::ustring();

        case nlohmann::json::value_t::string:
            return value.get<std::string>();

        case nlohmann::json::value_t::array: {
            Glib::ustring text;

            for (const auto& element : value) {
                if (!text.empty()) {
                    text += ", ";
                }

                text += jsonValueToText(element);
            }

            return text;
        }

        default:
            return value.dump(-1, ' ', false, nlohmann::json::error_handler_t::replace);
    }
}

RawMetadata ResultInterpreter::parseRead (const Glib::ustring& output)
{
    RawMetadata raw;

    const nlohmann::json data = nlohmann::json::parse(output.raw(), nullptr, false);

    if (data.is_discarded()) {
        if (settings->verbose) {
            std::cerr << "ResultInterpreter::parseRead / engine output is not JSON" << std::endl;
        }

        return raw;
    }

    if (!data.is_array() || data.empty() || !data[0].is_object()) {
        return raw;
    }

    for (const auto& item : data[0].items()) {
        raw[item.key()] = jsonValueToText(item.value());
    }

    return raw;
}

bool ResultInterpreter::parseWriteResult (const Glib::ustring& output)
{
    static const Glib::RefPtr<Glib::Regex> summary =
        Glib::Regex::create("^\\s*(\\d+) image files? (updated|created)\\b",
                            Glib::REGEX_MULTILINE | Glib::REGEX_CASELESS);

    Glib::MatchInfo match;

    if (!summary->match(output, match)) {
        return false;
    }

    while (match.matches()) {
        if (g_ascii_strtoull(match.fetch(1).c_str(), nullptr, 10) > 0) {
            return true;
        }

        if (!match.next()) {
            break;
        }
    }

    return false;
}

}
