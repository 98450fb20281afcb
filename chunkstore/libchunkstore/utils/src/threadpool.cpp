#include "threadpool.hpp"

#include <algorithm>

namespace chunkstore::utils
{
namespace
{
constexpr size_t fallback_thread_count = 4;
}  // namespace

ThreadPool::ThreadPool(size_t thread_count)
    : jobs_to_process_ {0}
    , running_ {true}
{
    thread_count = std::max<size_t>(thread_count, 1);
    threads_.reserve(thread_count);
    for (size_t i = 0; i != thread_count; ++i)
    {
        threads_.emplace_back(&ThreadPool::thread_routine, this);
    }
}

ThreadPool::~ThreadPool()
{
    {
        std::lock_guard<std::mutex> lock {mutex_};
        running_ = false;
    }

    cv_empty_.notify_all();
    for (auto &th : threads_)
    {
        th.join();
    }
}

void ThreadPool::add_job(Job &&job)
{
    {
        std::lock_guard<std::mutex> lock {mutex_};
        pending_jobs_.push(std::move(job));
        ++jobs_to_process_;
    }
    cv_empty_.notify_one();
}

void ThreadPool::process_all_jobs()
{
    std::unique_lock lock {mutex_};
    cv_jobs_left_.wait(lock, [this] { return jobs_to_process_ == 0; });
}

size_t ThreadPool::thread_count() const
{
    return threads_.size();
}

size_t ThreadPool::default_thread_count()
{
    size_t count = std::thread::hardware_concurrency();
    return count != 0 ? count : fallback_thread_count;
}

void ThreadPool::thread_routine()
{
    for (;;)
    {
        std::unique_lock<std::mutex> lock {mutex_};
        cv_empty_.wait(lock, [this] { return !pending_jobs_.empty() || !running_; });

        // Jobs still queued at shutdown are drained before the thread exits
        if (pending_jobs_.empty())
        {
            break;
        }

        Job job = std::move(pending_jobs_.front());
        pending_jobs_.pop();

        lock.unlock();
        job();
        lock.lock();

        if (--jobs_to_process_ == 0)
        {
            lock.unlock();
            cv_jobs_left_.notify_all();
        }
    }
}
}  // namespace chunkstore::utils
