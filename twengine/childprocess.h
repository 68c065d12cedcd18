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

#include <string>
#include <vector>

#include <glibmm/spawn.h>

namespace twengine
{

/**
 * A spawned child process with its three standard streams.
 *
 * The stream members are C runtime file descriptors on every platform, so
 * the code talking to the child never needs to know how it was started.
 */
struct ChildProcess
{
    ChildProcess() :
        pid(0),
        stdinFd(-1),
        stdoutFd(-1),
        stderrFd(-1),
        exited(false),
        reaped(false)
    {}

    Glib::Pid pid;
    int stdinFd;
    int stdoutFd;
    int stderrFd;
    bool exited;
    bool reaped;
};

/*
 * Platform strategies. Exactly one of enginelauncher_posix.cc and
 * enginelauncher_win32.cc is compiled in.
 */
namespace platform
{

/** Starts @p argv[0] with piped standard streams. Hides the console window where there is one.
  * @throw EngineError if the process cannot be created */
void spawnChild (const std::vector<std::string>& argv, ChildProcess& child);

/** @return true if the child has terminated; never blocks */
bool childExited (ChildProcess& child);

/** Waits at most @p milliseconds for the child to terminate.
  * @return true if it has terminated */
bool waitChild (ChildProcess& child, int milliseconds);

/** Terminates the child and everything it started. */
void killChild (ChildProcess& child);

/** Closes our ends of the standard streams of a child that was never handed to an EngineHandle. */
void closeStreams (ChildProcess& child);

/** Reaps the child and releases the OS resources held for it. The child must have terminated. */
void releaseChild (ChildProcess& child);

}

}
