#ifndef CHUNKSTORE_UTILS_THREADPOOL_HPP_
#define CHUNKSTORE_UTILS_THREADPOOL_HPP_

#include <atomic>
#include <condition_variable>
#include <cstddef>
#include <mutex>
#include <queue>
#include <thread>
#include <vector>

#include "executer.hpp"

namespace chunkstore::utils
{
class ThreadPool : public Executer
{
public:
    explicit ThreadPool(size_t thread_count = default_thread_count());
    ThreadPool(const ThreadPool &) = delete;
    ThreadPool &operator=(const ThreadPool &) = delete;

    ~ThreadPool() override;
    void add_job(Job &&job) override;
    void process_all_jobs() override;

    [[nodiscard]] size_t thread_count() const;

    static size_t default_thread_count();

private:
    void thread_routine();

    std::vector<std::thread> threads_;
    std::queue<Job>          pending_jobs_;
    size_t                   jobs_to_process_;
    std::atomic_bool         running_;
    std::mutex               mutex_;
    std::condition_variable  cv_empty_;
    std::condition_variable  cv_jobs_left_;
};
}  // namespace chunkstore::utils

#endif  // CHUNKSTORE_UTILS_THREADPOOL_HPP_
