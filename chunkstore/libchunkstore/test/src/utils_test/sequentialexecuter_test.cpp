#include <gtest/gtest.h>

#include <algorithm>
#include <atomic>
#include <memory>
#include <vector>

#include "mainexecuter.hpp"
#include "sequentialexecuter.hpp"
#include "threadpool.hpp"

#include "testutils.hpp"

using namespace ::chunkstore::utils;
using namespace ::testing;

namespace
{
class SequentialExecuterTest : public Test
{
protected:
    void SetUp() override
    {
        thread_pool_ = std::make_shared<ThreadPool>(8);
    }

    std::shared_ptr<ThreadPool> thread_pool_;
};
}  // namespace

TEST_F(SequentialExecuterTest, JobsRunOneAtATimeInOrder)
{
    SequentialExecuter sequencer {thread_pool_};

    const int        total_jobs = 1000;
    std::atomic_int  running {0};
    std::atomic_bool overlapped {false};
    std::vector<int> execution_order;

    for (int i = 0; i != total_jobs; ++i)
    {
        sequencer.add_job([&, job_index = i] {
            if (++running != 1)
            {
                overlapped = true;
            }
            execution_order.push_back(job_index);
            --running;
        });
    }

    sequencer.process_all_jobs();

    EXPECT_FALSE(overlapped);
    EXPECT_EQ(execution_order.size(), total_jobs);
    EXPECT_TRUE(std::is_sorted(execution_order.cbegin(), execution_order.cend()));
}

TEST_F(SequentialExecuterTest, IndependentSequencersRunConcurrently)
{
    SequentialExecuter sequencer1 {thread_pool_};
    SequentialExecuter sequencer2 {thread_pool_};

    std::atomic_bool job1_started {false};
    std::atomic_bool job2_started {false};
    bool             job1_saw_job2 = false;
    bool             job2_saw_job1 = false;

    // Each job waits for the other one to start, which only happens if they overlap
    sequencer1.add_job([&] {
        job1_started  = true;
        job1_saw_job2 = testutils::wait_for([&] { return job2_started.load(); }, 1000);
    });
    sequencer2.add_job([&] {
        job2_started  = true;
        job2_saw_job1 = testutils::wait_for([&] { return job1_started.load(); }, 1000);
    });

    sequencer1.process_all_jobs();
    sequencer2.process_all_jobs();

    EXPECT_TRUE(job1_saw_job2);
    EXPECT_TRUE(job2_saw_job1);
}

TEST_F(SequentialExecuterTest, JobsAddedFromWithinAJob)
{
    SequentialExecuter sequencer {thread_pool_};

    std::vector<int> execution_order;
    sequencer.add_job([&] {
        execution_order.push_back(0);
        sequencer.add_job([&] { execution_order.push_back(2); });
        execution_order.push_back(1);
    });

    sequencer.process_all_jobs();
    EXPECT_EQ(execution_order, (std::vector<int> {0, 1, 2}));
}

TEST_F(SequentialExecuterTest, OverMainExecuter)
{
    SequentialExecuter sequencer {std::make_shared<MainExecuter>()};

    std::vector<int> execution_order;
    sequencer.add_job([&] { execution_order.push_back(0); });
    EXPECT_EQ(execution_order, (std::vector<int> {0}));

    sequencer.add_job([&] {
        sequencer.add_job([&] { execution_order.push_back(2); });
        execution_order.push_back(1);
    });
    EXPECT_EQ(execution_order, (std::vector<int> {0, 1, 2}));
}

TEST_F(SequentialExecuterTest, DestructorWaitsForPendingJobs)
{
    std::atomic_int done_jobs {0};

    {
        SequentialExecuter sequencer {thread_pool_};
        for (int i = 0; i != 100; ++i)
        {
            sequencer.add_job([&] { ++done_jobs; });
        }
    }

    EXPECT_EQ(done_jobs, 100);
}
