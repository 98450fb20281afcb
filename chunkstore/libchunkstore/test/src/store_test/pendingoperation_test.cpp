#include <gtest/gtest.h>

#include <atomic>
#include <thread>
#include <vector>

#include "pendingoperation.hpp"

using namespace ::testing;
using namespace ::chunkstore::store;

TEST(PendingOperationTest, CompletesAfterLastPart)
{
    int       calls  = 0;
    ErrorCode result = ErrorCode::IO_ERROR;

    PendingOperation op {3, [&](ErrorCode error) {
                             ++calls;
                             result = error;
                         }};

    op.complete_part(ErrorCode::OK);
    op.complete_part(ErrorCode::OK);
    EXPECT_EQ(calls, 0);

    op.complete_part(ErrorCode::OK);
    EXPECT_EQ(calls, 1);
    EXPECT_EQ(result, ErrorCode::OK);
}

TEST(PendingOperationTest, FirstErrorWins)
{
    ErrorCode result = ErrorCode::OK;

    PendingOperation op {4, [&](ErrorCode error) { result = error; }};
    op.complete_part(ErrorCode::OK);
    op.complete_part(ErrorCode::NOT_FOUND);
    op.complete_part(ErrorCode::IO_ERROR);
    op.complete_part(ErrorCode::OK);

    EXPECT_EQ(result, ErrorCode::NOT_FOUND);
}

TEST(PendingOperationTest, ConcurrentParts)
{
    const int       part_count = 64;
    std::atomic_int calls {0};

    PendingOperation op {part_count, [&](ErrorCode) { ++calls; }};

    std::vector<std::thread> threads;
    for (int i = 0; i != part_count; ++i)
    {
        threads.emplace_back([&] { op.complete_part(ErrorCode::OK); });
    }
    for (auto &th : threads)
    {
        th.join();
    }

    EXPECT_EQ(calls, 1);
}

TEST(PendingOperationTest, TooManyParts)
{
    PendingOperation op {1, [](ErrorCode) {}};
    op.complete_part(ErrorCode::OK);
    EXPECT_DEATH(op.complete_part(ErrorCode::OK), "");
}
