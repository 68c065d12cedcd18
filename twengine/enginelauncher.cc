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
#include "enginelauncher.h"

#include <iostream>

#include <glib.h>
#include <glibmm/fileutils.h>
#include <glibmm/miscutils.h>

#include "childprocess.h"
#include "engineerror.h"
#include "settings.h"

namespace twengine
{

namespace
{

// a child that dies this early never got into stay_open mode
constexpr int STARTUP_CHECK_DELAY = 100; // ms

#ifdef _WIN32
const char* const EXIFTOOL_NAME = "exiftool.exe";
#else
const char* const EXIFTOOL_NAME = "exiftool";
#endif

}

std::shared_ptr<EngineHandle> EngineLauncher::start (const Glib::ustring& executablePath)
{
    std::vector<std::string> argv;
    argv.push_back(executablePath);
    argv.push_back("-stay_open");
    argv.push_back("True");
    argv.push_back("-@");
    argv.push_back("-");
    // applied to every batch: group-qualified keys and raw values
    argv.push_back("-common_args");
    argv.push_back("-G");
    argv.push_back("-n");
    argv.push_back("-charset");
    argv.push_back("filename=utf8");

    ChildProcess child;
    platform::spawnChild(argv, child);

    if (platform::waitChild(child, STARTUP_CHECK_DELAY)) {
        platform::closeStreams(child);
        platform::releaseChild(child);
        throw EngineError("\"" + executablePath + "\" did not execute successfully");
    }

    if (settings->verbose) {
        std::cerr << "EngineLauncher::start / " << executablePath << " is running" << std::endl;
    }

    return std::make_shared<EngineHandle>(executablePath, child);
}

Glib::ustring EngineLauncher::findExecutable (const Settings& s)
{
    if (!s.exiftoolPath.empty()) {
        if (Glib::path_is_absolute(s.exiftoolPath)) {
            return s.exiftoolPath;
        }

        const std::string found = Glib::find_program_in_path(s.exiftoolPath);
        return found.empty() ? s.exiftoolPath : Glib::ustring(found);
    }

    if (!s.bundleDirectory.empty()) {
        const std::string bundled = Glib::build_filename(s.bundleDirectory, "tools", EXIFTOOL_NAME);

        if (Glib::file_test(bundled, Glib::FILE_TEST_IS_EXECUTABLE)) {
            if (settings->verbose) {
                std::cerr << "EngineLauncher::findExecutable / using bundled " << bundled << std::endl;
            }

            return bundled;
        }
    }

    const std::string inPath = Glib::find_program_in_path("exiftool");

    if (!inPath.empty()) {
        return inPath;
    }

    return "exiftool";
}

}
