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

#include <csignal>
#include <initializer_list>
#include <iostream>

#include <sys/types.h>
#include <sys/wait.h>
#include <unistd.h>

#include <glib.h>
#include <glibmm/spawn.h>

#include "engineerror.h"
#include "settings.h"

namespace twengine
{

namespace
{

// Runs in the child between fork and exec. Gives the engine its own process
// group so that killChild() also reaches anything the engine starts.
void setProcessGroup()
{
    setpgid(0, 0);
}

}

namespace platform
{

void spawnChild (const std::vector<std::string>& argv, ChildProcess& child)
{
    // Writing to an engine that died must fail with EPIPE instead of killing us.
    std::signal(SIGPIPE, SIG_IGN);

    try {
        Glib::spawn_async_with_pipes("", argv,
                                     Glib::SPAWN_SEARCH_PATH | Glib::SPAWN_DO_NOT_REAP_CHILD,
                                     sigc::ptr_fun(&setProcessGroup),
                                     &child.pid, &child.stdinFd, &child.stdoutFd, &child.stderrFd);
    } catch (const Glib::SpawnError& e) {
        throw EngineError("failed to start \"" + Glib::ustring(argv.front()) + "\": " + e.what());
    }

    child.exited = false;
    child.reaped = false;

    if (settings->verbose) {
        std::cerr << "spawnChild / started \"" << argv.front() << "\" with pid " << child.pid << std::endl;
    }
}

bool childExited (ChildProcess& child)
{
    if (child.exited) {
        return true;
    }

    int status = 0;
    const pid_t res = waitpid(child.pid, &status, WNOHANG);

    if (res == child.pid || res < 0) {
        child.exited = true;
        child.reaped = (res == child.pid);
    }

    return child.exited;
}

bool waitChild (ChildProcess& child, int milliseconds)
{
    const gint64 end = g_get_monotonic_time() + gint64(milliseconds) * G_TIME_SPAN_MILLISECOND;

    while (!childExited(child)) {
        if (g_get_monotonic_time() >= end) {
            return false;
        }

        g_usleep(10 * G_TIME_SPAN_MILLISECOND);
    }

    return true;
}

void killChild (ChildProcess& child)
{
    if (childExited(child)) {
        return;
    }

    if (kill(-child.pid, SIGKILL) != 0) {
        kill(child.pid, SIGKILL);
    }
}

void closeStreams (ChildProcess& child)
{
    for (int* fd : {&child.stdinFd, &child.stdoutFd, &child.stderrFd}) {
        if (*fd >= 0) {
            ::close(*fd);
            *fd = -1;
        }
    }
}

void releaseChild (ChildProcess& child)
{
    if (!child.reaped) {
        int status = 0;
        waitpid(child.pid, &status, 0);
        child.reaped = true;
        child.exited = true;
    }

    Glib::spawn_close_pid(child.pid);
}

}

}
