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
#include <clocale>
#include <cstdlib>
#include <cstring>
#include <iostream>
#include <vector>

#include <giomm.h>
#include <glibmm.h>

#ifdef WIN32
#include <windows.h>
#else
#include <unistd.h>
#endif

#include "options.h"
#include "../twengine/enginelauncher.h"
#include "../twengine/enginesupervisor.h"
#include "../twengine/imagefiles.h"
#include "../twengine/metadatamanager.h"
#include "../twengine/settings.h"

namespace
{

enum ExitCode {
    EXIT_OK = 0,
    EXIT_USAGE = 1,
    EXIT_UNAVAILABLE = 2,
    EXIT_FAILED = 3
};

Glib::ustring exePath;

Glib::ustring fname_to_utf8 (const char* fname)
{
#ifdef WIN32

    try {
        return Glib::locale_to_utf8 (fname);
    } catch (Glib::Error&) {
        return Glib::convert_with_fallback (fname, "UTF-8", "ISO-8859-1", "?");
    }

#else

    return Glib::filename_to_utf8 (fname);

#endif
}

void printUsage (const char* argv0)
{
    const std::string name = Glib::path_get_basename (argv0);

    std::cout << "  Reads and writes the descriptive tags of photos through ExifTool." << std::endl;
    std::cout << std::endl;
    std::cout << "Usage:" << std::endl;
    std::cout << "  " << name << " [options] <command> [arguments]" << std::endl;
    std::cout << std::endl;
    std::cout << "Commands:" << std::endl;
    std::cout << "  version                       Print the availability and version of ExifTool." << std::endl;
    std::cout << "  read <image>                  Print the fields of an image." << std::endl;
    std::cout << "  tags <image>                  Print every tag ExifTool reports for an image." << std::endl;
    std::cout << "  write <image> <Field=Value>...  Set fields of an image and save it." << std::endl;
    std::cout << "  export <image> <file.json>    Save the fields of an image to a JSON file." << std::endl;
    std::cout << "  import <file.json> <image>    Write the fields of a JSON file into an image." << std::endl;
    std::cout << "  list <dir>                    List the image files of a directory." << std::endl;
    std::cout << "  config                        Save the effective options to the options file." << std::endl;
    std::cout << std::endl;
    std::cout << "Options:" << std::endl;
    std::cout << "  -c <file>    Read options from <file> instead of " << Options::getDefaultFile () << std::endl;
    std::cout << "  -e <path>    ExifTool executable to use." << std::endl;
    std::cout << "  -t <secs>    Seconds before a call into ExifTool is abandoned (1 to " << twengine::MAX_CALL_TIMEOUT << ", default: " << twengine::DEFAULT_CALL_TIMEOUT << ")." << std::endl;
    std::cout << "  -b           Back up the image before saving it." << std::endl;
    std::cout << "  -v           Verbose output." << std::endl;
    std::cout << std::endl;
    std::cout << "Fields:" << std::endl;
    std::cout << " ";

    for (const auto field : twengine::FieldResolver::getFields ()) {
        std::cout << " " << twengine::FieldResolver::getName (field);
    }

    std::cout << std::endl;
}

int failure (const twengine::MetadataManager& manager, const Glib::ustring& what)
{
    std::cerr << "Error: " << what;

    if (!manager.getLastError ().empty ()) {
        std::cerr << " (" << manager.getLastError () << ")";
    }

    std::cerr << std::endl;

    return manager.getLastStatus () == twengine::EngineSupervisor::UNAVAILABLE ? EXIT_UNAVAILABLE : EXIT_FAILED;
}

bool backupBeforeSave (const Glib::ustring& image, bool enabled)
{
    if (!enabled) {
        return true;
    }

    const Glib::ustring backup = twengine::ImageFiles::backupFile (image);

    if (backup.empty ()) {
        std::cerr << "Error: could not back up \"" << image << "\"" << std::endl;
        return false;
    }

    std::cout << "Backup: " << backup << std::endl;
    return true;
}

int runCommand (const Glib::ustring& command, const std::vector<Glib::ustring>& args, const Options& options, twengine::EngineSupervisor& engine)
{
    twengine::MetadataManager manager (engine);

    if (command == "read") {
        if (!manager.loadFromFile (args[0])) {
            return failure (manager, "could not read \"" + args[0] + "\"");
        }

        for (const auto& name : manager.getFieldNames ()) {
            const Glib::ustring value = manager.getField (name);

            if (!value.empty ()) {
                std::cout << name << ": " << value << std::endl;
            }
        }

        return EXIT_OK;
    }

    if (command == "tags") {
        const twengine::RawMetadata tags = manager.readAllTags (args[0]);

        if (manager.getLastStatus () != twengine::EngineSupervisor::OK || tags.empty ()) {
            return failure (manager, "could not read \"" + args[0] + "\"");
        }

        for (const auto& tag : tags) {
            std::cout << tag.first << ": " << tag.second << std::endl;
        }

        return EXIT_OK;
    }

    if (command == "write") {
        for (size_t i = 1; i < args.size (); ++i) {
            const Glib::ustring::size_type eq = args[i].find ('=');

            if (eq == Glib::ustring::npos || eq == 0) {
                std::cerr << "Error: \"" << args[i] << "\" is not of the form Field=Value" << std::endl;
                return EXIT_USAGE;
            }

            manager.setField (args[i].substr (0, eq), args[i].substr (eq + 1));
        }

        if (!backupBeforeSave (args[0], options.backupBeforeSave)) {
            return EXIT_FAILED;
        }

        if (!manager.saveToFile (args[0])) {
            return failure (manager, "could not write \"" + args[0] + "\"");
        }

        std::cout << "Saved: " << args[0] << std::endl;
        return EXIT_OK;
    }

    if (command == "export") {
        if (!manager.loadFromFile (args[0])) {
            return failure (manager, "could not read \"" + args[0] + "\"");
        }

        if (!manager.exportToJson (args[1])) {
            return failure (manager, "could not write \"" + args[1] + "\"");
        }

        std::cout << "Exported: " << args[1] << std::endl;
        return EXIT_OK;
    }

    if (command == "import") {
        if (!manager.importFromJson (args[0])) {
            return failure (manager, "could not import \"" + args[0] + "\"");
        }

        if (!backupBeforeSave (args[1], options.backupBeforeSave)) {
            return EXIT_FAILED;
        }

        if (!manager.saveToFile (args[1])) {
            return failure (manager, "could not write \"" + args[1] + "\"");
        }

        std::cout << "Saved: " << args[1] << std::endl;
        return EXIT_OK;
    }

    std::cerr << "Error: unknown command \"" << command << "\"" << std::endl;
    return EXIT_USAGE;
}

}

/* Process line command options
 * Returns
 *  0 if the command succeeded
 *  1 if there is an error in parameters
 *  2 if ExifTool is not available
 *  3 if the command failed */
int processLineParams (int argc, char **argv)
{
    Options options;
    Glib::ustring optionsFile = Options::getDefaultFile ();
    bool explicitOptionsFile = false;
    Glib::ustring exiftoolPath;
    int callTimeout = 0;
    bool backup = false;
    bool verbose = false;
    std::vector<Glib::ustring> positional;

    for (int iArg = 1; iArg < argc; iArg++) {
        Glib::ustring currParam (fname_to_utf8 (argv[iArg]));

        if (currParam.size () > 1 && currParam.at (0) == '-' && positional.empty ()) {
            switch (currParam.at (1)) {
                case 'c':
                case 'e':
                case 't':
                    if (iArg + 1 >= argc) {
                        std::cerr << "Error: option \"" << currParam << "\" needs a value" << std::endl;
                        return EXIT_USAGE;
                    }

                    iArg++;

                    if (currParam.at (1) == 'c') {
                        optionsFile = fname_to_utf8 (argv[iArg]);
                        explicitOptionsFile = true;
                    } else if (currParam.at (1) == 'e') {
                        exiftoolPath = fname_to_utf8 (argv[iArg]);
                    } else {
                        callTimeout = atoi (argv[iArg]);

                        if (callTimeout <= 0 || callTimeout > twengine::MAX_CALL_TIMEOUT) {
                            std::cerr << "Error: \"" << argv[iArg] << "\" is not a valid timeout" << std::endl;
                            return EXIT_USAGE;
                        }
                    }

                    break;

                case 'b':
                    backup = true;
                    break;

                case 'v':
                    verbose = true;
                    break;

                case 'h':
                case '?':
                default:
                    printUsage (argv[0]);
                    return EXIT_USAGE;
            }
        } else {
            positional.push_back (currParam);
        }
    }

    if (positional.empty ()) {
        printUsage (argv[0]);
        return EXIT_USAGE;
    }

    if (explicitOptionsFile || Glib::file_test (optionsFile, Glib::FILE_TEST_EXISTS)) {
        try {
            options.readFromFile (optionsFile);
        } catch (Options::Error &e) {
            std::cerr << "Error: " << e.get_msg () << std::endl;
            return EXIT_USAGE;
        }
    }

    // the command line wins over the options file
    if (!exiftoolPath.empty ()) {
        options.exiftoolPath = exiftoolPath;
    }

    if (callTimeout > 0) {
        options.callTimeout = callTimeout;
    }

    options.backupBeforeSave = options.backupBeforeSave || backup;
    options.verbose = options.verbose || verbose;

    const Glib::ustring command = positional[0];
    const std::vector<Glib::ustring> args (positional.begin () + 1, positional.end ());

    size_t minArgs = 0;
    size_t maxArgs = 0;

    if (command == "read" || command == "tags" || command == "list") {
        minArgs = maxArgs = 1;
    } else if (command == "export" || command == "import") {
        minArgs = maxArgs = 2;
    } else if (command == "write") {
        minArgs = 2;
        maxArgs = size_t (-1);
    } else if (command != "version" && command != "config") {
        std::cerr << "Error: unknown command \"" << command << "\"" << std::endl;
        return EXIT_USAGE;
    }

    if (args.size () < minArgs || args.size () > maxArgs) {
        std::cerr << "Error: wrong number of arguments for \"" << command << "\"" << std::endl;
        return EXIT_USAGE;
    }

    if (command == "config") {
        try {
            g_mkdir_with_parents (Glib::path_get_dirname (optionsFile).c_str (), 0700);
            options.saveToFile (optionsFile);
        } catch (Options::Error &e) {
            std::cerr << "Error: " << e.get_msg () << std::endl;
            return EXIT_FAILED;
        }

        std::cout << "Options saved to " << optionsFile << std::endl;
        return EXIT_OK;
    }

    if (command == "list") {
        if (!Glib::file_test (args[0], Glib::FILE_TEST_IS_DIR)) {
            std::cerr << "Error: \"" << args[0] << "\" is not a directory" << std::endl;
            return EXIT_FAILED;
        }

        for (const auto& file : twengine::ImageFiles::getImageFiles (args[0])) {
            std::cout << file << std::endl;
        }

        return EXIT_OK;
    }

    twengine::Settings* settings = twengine::Settings::create ();
    settings->exiftoolPath = options.exiftoolPath;
    settings->bundleDirectory = exePath;
    settings->callTimeout = options.callTimeout;
    settings->verbose = options.verbose;
    twengine::init (settings);

    int ret = EXIT_OK;

    {
        twengine::EngineSupervisor engine (*settings);

        if (!engine.start ()) {
            std::cerr << "Error: ExifTool is not available: " << engine.getLastError () << std::endl;
            std::cerr << "Install ExifTool, put it in the \"tools\" directory next to this program, or use -e <path>." << std::endl;
            ret = EXIT_UNAVAILABLE;
        } else if (command == "version") {
            std::cout << "ExifTool " << engine.getVersion () << " (" << twengine::EngineLauncher::findExecutable (*settings) << ")" << std::endl;
        } else {
            ret = runCommand (command, args, options, engine);
        }

        engine.stop ();
    }

    twengine::Settings::destroy (settings);

    return ret;
}

int main (int argc, char **argv)
{
    setlocale (LC_ALL, "");
    setlocale (LC_NUMERIC, "C");

    Gio::init ();

    char exname[512] = {0};
    // get the path where the tagwriter executable is stored
#ifdef WIN32
    WCHAR exnameU[512] = {0};
    GetModuleFileNameW (NULL, exnameU, 511);
    WideCharToMultiByte (CP_UTF8, 0, exnameU, -1, exname, 511, 0, 0);
#else

    if (readlink ("/proc/self/exe", exname, 511) < 0) {
        strncpy (exname, argv[0], 511);
    }

#endif
    exePath = Glib::path_get_dirname (exname);

    return processLineParams (argc, argv);
}
