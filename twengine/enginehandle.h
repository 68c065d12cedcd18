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

#include <vector>

#include <glibmm/iochannel.h>
#include <glibmm/refptr.h>
#include <glibmm/threads.h>
#include <glibmm/ustring.h>

#include "childprocess.h"

namespace twengine
{

/**
 * @brief Live connection to one resident ExifTool process.
 *
 * The process runs with "-stay_open True -@ -": it reads one argument per
 * line from its standard input and runs the batch when it sees
 * "-execute<N>". Every batch we send is closed with "-echo4 {ready<N>}" so
 * that both output streams end with the same marker line.
 *
 * execute() must not be called concurrently; the call executor guarantees
 * that. terminate() and running() may be called from any thread.
 */
class EngineHandle
{
public:
    EngineHandle (const Glib::ustring& executable, const ChildProcess& child);
    ~EngineHandle ();

    EngineHandle (const EngineHandle&) = delete;
    EngineHandle& operator= (const EngineHandle&) = delete;

    /** Runs one argument batch.
      * @return everything the engine wrote to its standard output for this batch
      * @throw EngineError if the process is gone or the streams broke */
    Glib::ustring execute (const std::vector<Glib::ustring>& args);

    /** Standard error output of the last batch */
    Glib::ustring getLastErrorOutput () const;

    bool running () const;

    /** Asks the engine to leave stay_open mode and waits a little for it to exit. Kills it if it does not. */
    void close ();

    /** Kills the engine right away. Unblocks a call stuck in execute(). Idempotent. */
    void terminate ();

    const Glib::ustring& getExecutable () const
    {
        return executable_;
    }

private:
    Glib::ustring readUntil (const Glib::RefPtr<Glib::IOChannel>& channel, const Glib::ustring& marker, const char* streamName);

    const Glib::ustring executable_;
    Glib::RefPtr<Glib::IOChannel> stdin_;
    Glib::RefPtr<Glib::IOChannel> stdout_;
    Glib::RefPtr<Glib::IOChannel> stderr_;
    unsigned int sequence_;

    mutable Glib::Threads::Mutex mutex_;  // covers child_ and lastErrorOutput_
    mutable ChildProcess child_;
    Glib::ustring lastErrorOutput_;
};

}
