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
#include "enginesupervisor.h"

#include <algorithm>
#include <iostream>

#include "engineerror.h"
#include "enginelauncher.h"

namespace twengine
{

namespace
{

// milliseconds granted to the engine for answering "-stay_open False"
constexpr int SHUTDOWN_TIMEOUT = 2000;

int callTimeoutMs (int seconds)
{
    return std::min(std::max(seconds, 1), MAX_CALL_TIMEOUT) * 1000;
}

Glib::ustring runBatch (const std::shared_ptr<EngineHandle>& handle, const std::vector<Glib::ustring>& args)
{
    return handle->execute(args);
}

Glib::ustring closeEngine (const std::shared_ptr<EngineHandle>& handle)
{
    handle->close();
    return Glib::ustring();
}

}

EngineSupervisor::EngineSupervisor (const Settings& s) :
    settings_(s),
    executor_(callTimeoutMs(s.callTimeout)),
    poisoned_(false),
    unavailable_(false)
{
}

EngineSupervisor::~EngineSupervisor ()
{
    stop();
}

const char* EngineSupervisor::statusName (Status status)
{
    switch (status) {
        case OK:
            return "ok";

        case UNAVAILABLE:
            return "engine unavailable";

        case TIMEOUT:
            return "timeout";

        case FAILED:
        default:
            return "failed";
    }
}

bool EngineSupervisor::start ()
{
    {
        Glib::Threads::Mutex::Lock lock(mutex_);
        unavailable_ = false;
    }

    return static_cast<bool>(get());
}

void EngineSupervisor::stop ()
{
    std::shared_ptr<EngineHandle> handle;
    bool poisoned;

    {
        Glib::Threads::Mutex::Lock lock(mutex_);
        handle.swap(handle_);
        poisoned = poisoned_;
        poisoned_ = false;
    }

    if (!handle) {
        return;
    }

    if (poisoned) {
        // a stuck call still owns the worker, asking nicely would only queue up behind it
        handle->terminate();
    } else {
        Glib::ustring result, error;

        if (executor_.execute(sigc::bind(sigc::ptr_fun(&closeEngine), handle), SHUTDOWN_TIMEOUT, result, error) != CallExecutor::OK) {
            if (settings_.verbose) {
                std::cerr << "EngineSupervisor::stop / " << error << std::endl;
            }

            handle->terminate();
        }
    }

    if (settings_.verbose) {
        std::cerr << "EngineSupervisor::stop / engine stopped" << std::endl;
    }
}

std::shared_ptr<EngineHandle> EngineSupervisor::get ()
{
    Glib::Threads::Mutex::Lock lock(mutex_);

    if (unavailable_) {
        return nullptr;
    }

    if (handle_ && (poisoned_ || !handle_->running())) {
        if (settings_.verbose) {
            std::cerr << "EngineSupervisor::get / replacing " << (poisoned_ ? "unresponsive" : "dead") << " engine" << std::endl;
        }

        // also unblocks the worker if it still waits on the old process
        handle_->terminate();
        handle_.reset();
        poisoned_ = false;
    }

    if (!handle_) {
        handle_ = launch();
    }

    return handle_;
}

// Called with mutex_ held.
std::shared_ptr<EngineHandle> EngineSupervisor::launch ()
{
    const Glib::ustring executable = EngineLauncher::findExecutable(settings_);
    std::shared_ptr<EngineHandle> handle;

    try {
        handle = EngineLauncher::start(executable);
    } catch (const EngineError& e) {
        lastError_ = e.get_msg();
        unavailable_ = true;

        if (settings_.verbose) {
            std::cerr << "EngineSupervisor::launch / " << lastError_ << std::endl;
        }

        return nullptr;
    }

    std::vector<Glib::ustring> args;
    args.push_back("-ver");

    Glib::ustring version, error;

    if (executor_.execute(sigc::bind(sigc::ptr_fun(&runBatch), handle, args), version, error) != CallExecutor::OK) {
        handle->terminate();
        lastError_ = "\"" + executable + "\" does not answer: " + error;
        unavailable_ = true;

        if (settings_.verbose) {
            std::cerr << "EngineSupervisor::launch / " << lastError_ << std::endl;
        }

        return nullptr;
    }

    version_ = version;

    while (!version_.empty() && (version_[version_.size() - 1] == '\n' || version_[version_.size() - 1] == '\r')) {
        version_.erase(version_.size() - 1);
    }

    if (settings_.verbose) {
        std::cerr << "EngineSupervisor::launch / " << executable << " version " << version_ << std::endl;
    }

    return handle;
}

EngineSupervisor::Status EngineSupervisor::execute (const std::vector<Glib::ustring>& args, Glib::ustring& output)
{
    const std::shared_ptr<EngineHandle> handle = get();

    if (!handle) {
        return UNAVAILABLE;
    }

    Glib::ustring error;
    const CallExecutor::Status status = executor_.execute(sigc::bind(sigc::ptr_fun(&runBatch), handle, args), output, error);

    if (status == CallExecutor::OK) {
        return OK;
    }

    Glib::Threads::Mutex::Lock lock(mutex_);

    lastError_ = error;

    // the process may still be chewing on the call; never hand it out again
    if (handle_ == handle) {
        poisoned_ = true;
    }

    return status == CallExecutor::TIMEOUT ? TIMEOUT : FAILED;
}

bool EngineSupervisor::isAvailable () const
{
    Glib::Threads::Mutex::Lock lock(mutex_);
    return !unavailable_;
}

Glib::ustring EngineSupervisor::getVersion () const
{
    Glib::Threads::Mutex::Lock lock(mutex_);
    return version_;
}

Glib::ustring EngineSupervisor::getLastError () const
{
    Glib::Threads::Mutex::Lock lock(mutex_);
    return lastError_;
}

}
