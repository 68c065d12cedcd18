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
#ifndef _CALLEXECUTOR_
#define _CALLEXECUTOR_

#include <memory>

#include <glibmm/ustring.h>
#include <sigc++/sigc++.h>

namespace twengine
{

/**
 * @brief Runs calls into the metadata engine on one dedicated worker thread.
 *
 * Calls are run one at a time in the order they were submitted. The caller
 * blocks until its call is done or its timeout expires, whichever comes
 * first. A call that times out is abandoned, not interrupted: it keeps the
 * worker busy until it returns by itself or until whoever owns the engine
 * kills it.
 */
class CallExecutor
{
public:
    enum Status {
        OK,
        TIMEOUT,
        FAILED
    };

    /** A call returns the text produced by the engine and reports failure by throwing. */
    typedef sigc::slot<Glib::ustring> Call;

    /** @param timeout milliseconds to wait for a call, unless execute() is given another one */
    explicit CallExecutor (int timeout);
    ~CallExecutor ();

    CallExecutor (const CallExecutor&) = delete;
    CallExecutor& operator= (const CallExecutor&) = delete;

    /**
     * @brief Queues @p call and waits for it.
     *
     * @param result receives the value returned by the call when the status is OK
     * @param error receives the message of the exception thrown by the call when the status is FAILED
     *
     * @return OK, FAILED, or TIMEOUT if the call did not finish in time
     */
    Status execute (const Call& call, Glib::ustring& result, Glib::ustring& error);
    Status execute (const Call& call, int timeout, Glib::ustring& result, Glib::ustring& error);

    int getTimeout () const;
    void setTimeout (int timeout);

private:
    class Impl;
    std::unique_ptr<Impl> impl_;
};

}

#endif
