#include "sequentialexecuter.hpp"

namespace chunkstore::utils
{
SequentialExecuter::SequentialExecuter(std::shared_ptr<Executer> executer)
    : executer_ {std::move(executer)}
    , draining_ {false}
{}

SequentialExecuter::~SequentialExecuter()
{
    process_all_jobs();
}

void SequentialExecuter::add_job(Job &&job)
{
    {
        std::lock_guard lock {mutex_};
        pending_jobs_.push(std::move(job));
        if (draining_)
        {
            return;
        }
        draining_ = true;
    }

    executer_->add_job([this] { drain(); });
}

void SequentialExecuter::process_all_jobs()
{
    std::unique_lock lock {mutex_};
    cv_idle_.wait(lock, [this] { return !draining_ && pending_jobs_.empty(); });
}

void SequentialExecuter::drain()
{
    for (;;)
    {
        Job job;

        {
            std::lock_guard lock {mutex_};
            if (pending_jobs_.empty())
            {
                draining_ = false;
                cv_idle_.notify_all();
                return;
            }
            job = std::move(pending_jobs_.front());
            pending_jobs_.pop();
        }

        job();
    }
}
}  // namespace chunkstore::utils
