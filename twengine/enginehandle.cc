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
#include "enginehandle.h"

#include <iostream>

#include "engineerror.h"
#include "settings.h"

namespace twengine
{

namespace
{

constexpr int CLOSE_GRACE_PERIOD = 1000; // ms

Glib::RefPtr<Glib::IOChannel> openChannel (int fd)
{
    Glib::RefPtr<Glib::IOChannel> channel = Glib::IOChannel::create_from_fd(fd);
    channel->set_close_on_unref(true);
    // raw bytes; the engine talks UTF-8 and we pass it through untouched
    channel->set_encoding("");
    channel->set_line_term("\n");
    return channel;
}

std::string chomp (const std::string& line)
{
    std::string::size_type end = line.size();

    while (end > 0 && (line[end - 1] == '\n' || line[end - 1] == '\r')) {
        --end;
    }

    return line.substr(0, end);
}

}

EngineHandle::EngineHandle (const Glib::ustring& executable, const ChildProcess& child) :
    executable_(executable),
    stdin_(openChannel(child.stdinFd)),
    stdout_(openChannel(child.stdoutFd)),
    stderr_(openChannel(child.stderrFd)),
    sequence_(0),
    child_(child)
{
}

EngineHandle::~EngineHandle ()
{
    Glib::Threads::Mutex::Lock lock(mutex_);

    if (!platform::childExited(child_)) {
        platform::killChild(child_);
    }

    platform::releaseChild(child_);
}

bool EngineHandle::running () const
{
    Glib::Threads::Mutex::Lock lock(mutex_);
    return !platform::childExited(child_);
}

Glib::ustring EngineHandle::execute (const std::vector<Glib::ustring>& args)
{
    if (!running()) {
        throw EngineError("\"" + executable_ + "\" is not running");
    }

    const unsigned int seq = ++sequence_;
    const Glib::ustring marker = Glib::ustring::compose("{ready%1}", seq);

    Glib::ustring command;

    for (const auto& arg : args) {
        command += arg;
        command += '\n';
    }

    command += "-echo4\n";
    command += marker + "\n";
    command += Glib::ustring::compose("-execute%1\n", seq);

    try {
        stdin_->write(command);
        stdin_->flush();

        Glib::ustring output = readUntil(stdout_, marker, "output");
        Glib::ustring errors = readUntil(stderr_, marker, "error output");

        if (settings->verbose && !errors.empty()) {
            std::cerr << "EngineHandle::execute / " << executable_ << " reported: " << errors;
        }

        Glib::Threads::Mutex::Lock lock(mutex_);
        lastErrorOutput_ = errors;
        return output;
    } catch (const Glib::Error& e) {
        throw EngineError("lost connection to \"" + executable_ + "\": " + e.what());
    }
}

Glib::ustring EngineHandle::readUntil (const Glib::RefPtr<Glib::IOChannel>& channel, const Glib::ustring& marker, const char* streamName)
{
    Glib::ustring result;
    Glib::ustring line;

    while (true) {
        const Glib::IOStatus status = channel->read_line(line);

        if (status == Glib::IO_STATUS_EOF) {
            throw EngineError("\"" + executable_ + "\" closed its " + streamName);
        }

        if (status != Glib::IO_STATUS_NORMAL) {
            continue;
        }

        const std::string stripped = chomp(line.raw());

        if (stripped == marker.raw()) {
            break;
        }

        // the marker follows output that did not end with a newline
        const std::string::size_type pos = stripped.rfind(marker.raw());

        if (pos != std::string::npos && pos + marker.bytes() == stripped.size()) {
            result += stripped.substr(0, pos);
            break;
        }

        result += line;
    }

    return result;
}

Glib::ustring EngineHandle::getLastErrorOutput () const
{
    Glib::Threads::Mutex::Lock lock(mutex_);
    return lastErrorOutput_;
}

void EngineHandle::close ()
{
    if (!running()) {
        return;
    }

    try {
        stdin_->write("-stay_open\nFalse\n");
        stdin_->flush();
    } catch (const Glib::Error& e) {
        if (settings->verbose) {
            std::cerr << "EngineHandle::close / could not ask " << executable_ << " to quit: " << e.what() << std::endl;
        }
    }

    Glib::Threads::Mutex::Lock lock(mutex_);

    if (!platform::waitChild(child_, CLOSE_GRACE_PERIOD)) {
        if (settings->verbose) {
            std::cerr << "EngineHandle::close / " << executable_ << " did not quit, killing it" << std::endl;
        }

        platform::killChild(child_);
    }
}

void EngineHandle::terminate ()
{
    Glib::Threads::Mutex::Lock lock(mutex_);
    platform::killChild(child_);
}

}
