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
#include "callexecutor.h"

#include <exception>
#include <iostream>
#include <list>

#include <glib.h>
#include <glibmm/error.h>
#include <glibmm/threads.h>

#include "engineerror.h"
#include "settings.h"

#define DEBUG(format,args...)
//#define DEBUG(format,args...) printf("CallExecutor::%s: " format "\n", __FUNCTION__, ## args)

namespace twengine
{

class CallExecutor::Impl
{
public:

    struct Outcome {
        Outcome():
            started_(false),
            done_(false),
            status_(FAILED)
        {}

        bool started_;
        bool done_;
        Status status_;
        Glib::ustring result_;
        Glib::ustring error_;
    };

    struct Job {
        Job(const Call& call, const std::shared_ptr<Outcome>& outcome):
            call_(call),
            outcome_(outcome)
        {}

        Job() {}

        Call call_;
        // shared with the caller, who may have given up on it
        std::shared_ptr<Outcome> outcome_;
    };

    typedef std::list<Job> JobList;

    explicit Impl(int timeout):
        timeout_(timeout),
        stopping_(false),
        worker_(nullptr)
    {
        worker_ = Glib::Threads::Thread::create(sigc::mem_fun(*this, &Impl::run));
    }

    ~Impl()
    {
        {
            Glib::Threads::Mutex::Lock lock(mutex_);
            stopping_ = true;
            jobAvailable_.broadcast();
        }

        worker_->join();
    }

    int timeout_;

    // covers everything below, and the Outcome of every job
    Glib::Threads::Mutex mutex_;
    Glib::Threads::Cond jobAvailable_;
    Glib::Threads::Cond jobDone_;

    JobList jobs_;
    bool stopping_;

    Glib::Threads::Thread* worker_;

    void
    run()
    {
        while (true) {
            Job j;

            {
                Glib::Threads::Mutex::Lock lock(mutex_);

                while (jobs_.empty() && !stopping_) {
                    jobAvailable_.wait(mutex_);
                }

                if (stopping_) {
                    // nobody can be waiting any more, but leave the outcomes consistent
                    for (auto& job : jobs_) {
                        job.outcome_->error_ = "call executor stopped";
                        job.outcome_->done_ = true;
                    }

                    jobs_.clear();
                    jobDone_.broadcast();
                    return;
                }

                j = jobs_.front();
                jobs_.pop_front();
                j.outcome_->started_ = true;
                DEBUG("%d job(s) remaining", int(jobs_.size()));
            }

            // unlock and do the call; relock to publish the outcome
            Status status = FAILED;
            Glib::ustring result;
            Glib::ustring error;

            try {
                result = j.call_();
                status = OK;
            } catch (const EngineError& e) {
                error = e.get_msg();
            } catch (const Glib::Error& e) {
                error = e.what();
            } catch (const std::exception& e) {
                error = e.what();
            }

            if (status != OK && settings->verbose) {
                std::cerr << "CallExecutor::run / call failed: " << error << std::endl;
            }

            {
                Glib::Threads::Mutex::Lock lock(mutex_);
                j.outcome_->status_ = status;
                j.outcome_->result_ = result;
                j.outcome_->error_ = error;
                j.outcome_->done_ = true;
                jobDone_.broadcast();
            }
        }
    }
};

CallExecutor::CallExecutor(int timeout):
    impl_(new Impl(timeout))
{
}

CallExecutor::~CallExecutor()
{
}

int CallExecutor::getTimeout() const
{
    Glib::Threads::Mutex::Lock lock(impl_->mutex_);
    return impl_->timeout_;
}

void CallExecutor::setTimeout(int timeout)
{
    Glib::Threads::Mutex::Lock lock(impl_->mutex_);
    impl_->timeout_ = timeout;
}

CallExecutor::Status
CallExecutor::execute(const Call& call, Glib::ustring& result, Glib::ustring& error)
{
    return execute(call, getTimeout(), result, error);
}

CallExecutor::Status
CallExecutor::execute(const Call& call, int timeout, Glib::ustring& result, Glib::ustring& error)
{
    std::shared_ptr<Impl::Outcome> outcome = std::make_shared<Impl::Outcome>();

    Glib::Threads::Mutex::Lock lock(impl_->mutex_);

    impl_->jobs_.push_back(Impl::Job(call, outcome));
    impl_->jobAvailable_.signal();

    const gint64 endTime = g_get_monotonic_time() + gint64(timeout) * G_TIME_SPAN_MILLISECOND;

    while (!outcome->done_) {
        if (!impl_->jobDone_.wait_until(impl_->mutex_, endTime)) {
            break;
        }
    }

    if (!outcome->done_) {
        if (!outcome->started_) {
            // still queued behind a stuck call; it will never be wanted
            for (Impl::JobList::iterator i = impl_->jobs_.begin(); i != impl_->jobs_.end(); ++i) {
                if (i->outcome_ == outcome) {
                    impl_->jobs_.erase(i);
                    break;
                }
            }
        }

        DEBUG("call abandoned after %d ms", timeout);
        error = Glib::ustring::compose("call did not complete within %1 ms", timeout);
        return TIMEOUT;
    }

    result = outcome->result_;
    error = outcome->error_;
    return outcome->status_;
}

}
