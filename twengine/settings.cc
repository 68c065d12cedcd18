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
#include "settings.h"

namespace twengine
{

namespace
{

const Settings defaultSettings;

}

const Settings* settings = &defaultSettings;

Settings::Settings() :
    callTimeout(DEFAULT_CALL_TIMEOUT),
    verbose(false)
{
}

Settings* Settings::create()
{
    return new Settings();
}

void Settings::destroy(Settings* s)
{
    if (s == settings) {
        settings = &defaultSettings;
    }

    delete s;
}

void init(const Settings* s)
{
    settings = s ? s : &defaultSettings;
}

}
