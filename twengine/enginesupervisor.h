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

#include <memory>
#include <vector>

#include <glibmm/threads.h>
#include <glibmm/ustring.h>

#include "callexecutor.h"
#include "enginehandle.h"
#include "settings.h"

namespace twengine
{

/**
 * @brief Owns the one resident ExifTool process of the application.
 *
 * The process is started lazily by get() and replaced when it died or when
 * a call into it timed out. If it cannot be started the supervisor turns
 * "unavailable" and stays so, without trying again, until start() is called.
 */
class EngineSupervisor
{
public:
    enum Status {
        OK,
        UNAVAILABLE,
        TIMEOUT,
        FAILED
    };

    explicit EngineSupervisor (const Settings& s);
    ~EngineSupervisor ();

    EngineSupervisor (const EngineSupervisor&) = delete;
    EngineSupervisor& operator= (const EngineSupervisor&) = delete;

    /** Starts the engine right away, clearing an earlier "unavailable" verdict.
      * @return true if the engine is running */
    bool start ();

    /** Shuts the engine down. Safe to call any number of times. */
    void stop ();

    /** @return a running engine, or nullptr if the engine is unavailable */
    std::shared_ptr<EngineHandle> get ();

    /** Runs one argument batch on the engine, within the call timeout of the settings.
      * @param output receives the standard output of the engine when the status is OK */
    Status execute (const std::vector<Glib::ustring>& args, Glib::ustring& output);

    bool isAvailable () const;

    /** @return the version reported by the engine when it was last started, empty if it never was */
    Glib::ustring getVersion () const;

    /** @return a description of the last failure */
    Glib::ustring getLastError () const;

    static const char* statusName (Status status);

private:
    std::shared_ptr<EngineHandle> launch ();

    const Settings settings_;
    CallExecutor executor_;

    mutable Glib::Threads::Mutex mutex_;
    std::shared_ptr<EngineHandle> handle_;
    bool poisoned_;
    bool unavailable_;
    Glib::ustring version_;
    Glib::ustring lastError_;
};

}
