#ifndef CHUNKSTORE_UTILS_SEQUENTIALEXECUTER_HPP_
#define CHUNKSTORE_UTILS_SEQUENTIALEXECUTER_HPP_

#include <condition_variable>
#include <memory>
#include <mutex>
#include <queue>

#include "executer.hpp"

namespace chunkstore::utils
{
/*
 * Runs jobs on an underlying executer one at a time, in the order they were added. At most one
 * drain job of a SequentialExecuter is queued on the underlying executer at any moment, so jobs
 * added to the same SequentialExecuter never overlap even on a multithreaded pool.
 */
class SequentialExecuter : public Executer
{
public:
    explicit SequentialExecuter(std::shared_ptr<Executer> executer);
    SequentialExecuter(const SequentialExecuter &) = delete;
    SequentialExecuter &operator=(const SequentialExecuter &) = delete;

    ~SequentialExecuter() override;
    void add_job(Job &&job) override;
    void process_all_jobs() override;

private:
    void drain();

    const std::shared_ptr<Executer> executer_;
    std::queue<Job>                 pending_jobs_;
    bool                            draining_;
    std::mutex                      mutex_;
    std::condition_variable         cv_idle_;
};
}  // namespace chunkstore::utils

#endif  // CHUNKSTORE_UTILS_SEQUENTIALEXECUTER_HPP_
