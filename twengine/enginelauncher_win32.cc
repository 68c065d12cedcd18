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
#include "childprocess.h"

#include <initializer_list>
#include <iostream>

#include <windows.h>
#include <fcntl.h>
#include <io.h>

#include <glib.h>
#include <glibmm/spawn.h>

#include "engineerror.h"
#include "settings.h"

namespace twengine
{

namespace
{

std::wstring utf8_to_wide (const std::string& s)
{
    glong len = 0;
    gunichar2* const ws = g_utf8_to_utf16(s.c_str(), -1, nullptr, &len, nullptr);

    if (!ws) {
        return std::wstring();
    }

    std::wstring ret(reinterpret_cast<wchar_t*>(ws), len);
    g_free(ws);
    return ret;
}

// Quoting rules of CommandLineToArgvW
std::wstring quoteArgument (const std::wstring& arg)
{
    if (!arg.empty() && arg.find_first_of(L" \t\n\v\"") == std::wstring::npos) {
        return arg;
    }

    std::wstring quoted = L"\"";

    for (auto it = arg.begin(); ; ++it) {
        unsigned int backslashes = 0;

        while (it != arg.end() && *it == L'\\') {
            ++it;
            ++backslashes;
        }

        if (it == arg.end()) {
            quoted.append(backslashes * 2, L'\\');
            break;
        } else if (*it == L'"') {
            quoted.append(backslashes * 2 + 1, L'\\');
            quoted.push_back(*it);
        } else {
            quoted.append(backslashes, L'\\');
            quoted.push_back(*it);
        }
    }

    quoted.push_back(L'"');
    return quoted;
}

Glib::ustring lastErrorText ()
{
    gchar* const msg = g_win32_error_message(GetLastError());
    Glib::ustring ret(msg ? msg : "unknown error");
    g_free(msg);
    return ret;
}

void closeHandles (HANDLE* handles, int count)
{
    for (int i = 0; i < count; ++i) {
        if (handles[i] != INVALID_HANDLE_VALUE) {
            CloseHandle(handles[i]);
        }
    }
}

}

namespace platform
{

void spawnChild (const std::vector<std::string>& argv, ChildProcess& child)
{
    SECURITY_ATTRIBUTES sa;
    sa.nLength = sizeof(sa);
    sa.lpSecurityDescriptor = nullptr;
    sa.bInheritHandle = TRUE;

    // 0,1: stdin read/write  2,3: stdout read/write  4,5: stderr read/write
    HANDLE pipes[6] = {INVALID_HANDLE_VALUE, INVALID_HANDLE_VALUE, INVALID_HANDLE_VALUE,
                       INVALID_HANDLE_VALUE, INVALID_HANDLE_VALUE, INVALID_HANDLE_VALUE};

    if (!CreatePipe(&pipes[0], &pipes[1], &sa, 0) ||
        !CreatePipe(&pipes[2], &pipes[3], &sa, 0) ||
        !CreatePipe(&pipes[4], &pipes[5], &sa, 0)) {
        const Glib::ustring err = lastErrorText();
        closeHandles(pipes, 6);
        throw EngineError("failed to create pipes: " + err);
    }

    // our ends must not leak into the child
    SetHandleInformation(pipes[1], HANDLE_FLAG_INHERIT, 0);
    SetHandleInformation(pipes[2], HANDLE_FLAG_INHERIT, 0);
    SetHandleInformation(pipes[4], HANDLE_FLAG_INHERIT, 0);

    std::wstring cmdline;

    for (const auto& arg : argv) {
        if (!cmdline.empty()) {
            cmdline += L' ';
        }

        cmdline += quoteArgument(utf8_to_wide(arg));
    }

    STARTUPINFOW si;
    ZeroMemory(&si, sizeof(si));
    si.cb = sizeof(si);
    si.dwFlags = STARTF_USESTDHANDLES | STARTF_USESHOWWINDOW;
    si.wShowWindow = SW_HIDE;
    si.hStdInput = pipes[0];
    si.hStdOutput = pipes[3];
    si.hStdError = pipes[5];

    PROCESS_INFORMATION pi;
    ZeroMemory(&pi, sizeof(pi));

    // CREATE_NO_WINDOW keeps the console of ExifTool from flashing up
    if (!CreateProcessW(nullptr, &cmdline[0], nullptr, nullptr, TRUE,
                        CREATE_NO_WINDOW | CREATE_NEW_PROCESS_GROUP,
                        nullptr, nullptr, &si, &pi)) {
        const Glib::ustring err = lastErrorText();
        closeHandles(pipes, 6);
        throw EngineError("failed to start \"" + Glib::ustring(argv.front()) + "\": " + err);
    }

    CloseHandle(pi.hThread);
    CloseHandle(pipes[0]);
    CloseHandle(pipes[3]);
    CloseHandle(pipes[5]);

    child.pid = pi.hProcess;
    child.stdinFd = _open_osfhandle(reinterpret_cast<intptr_t>(pipes[1]), _O_WRONLY | _O_BINARY);
    child.stdoutFd = _open_osfhandle(reinterpret_cast<intptr_t>(pipes[2]), _O_RDONLY | _O_BINARY);
    child.stderrFd = _open_osfhandle(reinterpret_cast<intptr_t>(pipes[4]), _O_RDONLY | _O_BINARY);
    child.exited = false;
    child.reaped = false;

    if (settings->verbose) {
        std::cerr << "spawnChild / started \"" << argv.front() << "\" with pid " << pi.dwProcessId << std::endl;
    }
}

bool childExited (ChildProcess& child)
{
    if (!child.exited && WaitForSingleObject(child.pid, 0) == WAIT_OBJECT_0) {
        child.exited = true;
    }

    return child.exited;
}

bool waitChild (ChildProcess& child, int milliseconds)
{
    if (!child.exited && WaitForSingleObject(child.pid, milliseconds) == WAIT_OBJECT_0) {
        child.exited = true;
    }

    return child.exited;
}

void killChild (ChildProcess& child)
{
    if (!childExited(child)) {
        TerminateProcess(child.pid, 1);
    }
}

void closeStreams (ChildProcess& child)
{
    for (int* fd : {&child.stdinFd, &child.stdoutFd, &child.stderrFd}) {
        if (*fd >= 0) {
            _close(*fd);
            *fd = -1;
        }
    }
}

void releaseChild (ChildProcess& child)
{
    if (!child.reaped) {
        WaitForSingleObject(child.pid, INFINITE);
        child.reaped = true;
        child.exited = true;
    }

    Glib::spawn_close_pid(child.pid);
}

}

}
