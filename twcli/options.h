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
#ifndef _TWCLI_OPTIONS_
#define _TWCLI_OPTIONS_

#include <exception>

#include <glibmm/ustring.h>

class Options
{
public:
    class Error: public std::exception
    {
    public:
        explicit Error (const Glib::ustring &msg): msg_ (msg) {}
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

    // General
    bool verbose;
    bool backupBeforeSave;

    // Engine
    Glib::ustring exiftoolPath;
    int callTimeout;        // seconds

    Options ();

    void setDefaults ();

    /** Reads the values present in @p fname, keeping the current value of the others.
      * @throw Error if the file cannot be read or holds an invalid value */
    void readFromFile (const Glib::ustring& fname);

    /** @throw Error if the file cannot be written */
    void saveToFile (const Glib::ustring& fname) const;

    /** @return "$XDG_CONFIG_HOME/tagwriter/options" */
    static Glib::ustring getDefaultFile ();
};

#endif
