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

#include <exception>

#include <glibmm/ustring.h>

namespace twengine
{

/**
 * Raised when the metadata engine cannot be launched or stops answering.
 *
 * It never leaves the engine: the call executor and the supervisor turn it
 * into a status value and an error text.
 */
class EngineError: public std::exception
{
public:
    explicit EngineError (const Glib::ustring &msg): msg_ (msg) {}
    const char *what() const throw() override
    {
        return msg_.c_str();
    }
    const Glib::ustring &get_msg() const throw()
    {
        return msg_;
    }

private:
    Glib::ustring msg_;
};

}
