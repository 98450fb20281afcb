#include <gtest/gtest.h>

#include <atomic>
#include <chrono>
#include <future>
#include <string>
#include <thread>
#include <vector>

#include "handlecache.hpp"

using namespace ::testing;
using namespace ::chunkstore::store;
using namespace ::chunkstore::storage;

TEST(HandleCacheTest, ResolvesOnce)
{
    HandleCache<std::string> cache;

    int  resolutions = 0;
    auto resolver    = [&] {
        ++resolutions;
        return StorageBackend::Handle {7};
    };

    EXPECT_EQ(cache.get_or_resolve("a", resolver), 7);
    EXPECT_EQ(cache.get_or_resolve("a", resolver), 7);
    EXPECT_EQ(resolutions, 1);
    EXPECT_EQ(cache.size(), 1);
    EXPECT_EQ(cache.find("a"), 7);
}

TEST(HandleCacheTest, FailedResolutionIsNotRemembered)
{
    HandleCache<int> cache;

    int  resolutions = 0;
    auto failing     = [&] {
        ++resolutions;
        return StorageBackend::invalid_handle;
    };

    EXPECT_EQ(cache.get_or_resolve(1, failing), StorageBackend::invalid_handle);
    EXPECT_EQ(cache.size(), 0);
    EXPECT_FALSE(cache.find(1).has_value());

    EXPECT_EQ(cache.get_or_resolve(1, failing), StorageBackend::invalid_handle);
    EXPECT_EQ(resolutions, 2);

    EXPECT_EQ(cache.get_or_resolve(1, [] { return StorageBackend::Handle {3}; }), 3);
    EXPECT_EQ(cache.find(1), 3);
}

TEST(HandleCacheTest, EraseAndClear)
{
    HandleCache<int> cache;

    cache.get_or_resolve(1, [] { return StorageBackend::Handle {10}; });
    cache.get_or_resolve(2, [] { return StorageBackend::Handle {20}; });
    EXPECT_EQ(cache.size(), 2);

    cache.erase(1);
    EXPECT_FALSE(cache.find(1).has_value());
    EXPECT_EQ(cache.find(2), 20);

    EXPECT_EQ(cache.get_or_resolve(1, [] { return StorageBackend::Handle {11}; }), 11);

    cache.clear();
    EXPECT_EQ(cache.size(), 0);
    EXPECT_FALSE(cache.find(2).has_value());
}

TEST(HandleCacheTest, ConcurrentLookupsConverge)
{
    HandleCache<int> cache;

    std::atomic_int    resolutions {0};
    std::promise<void> promise_release;
    auto               future_release = promise_release.get_future().share();

    auto resolver = [&, future_release] {
        ++resolutions;
        future_release.wait();
        return StorageBackend::Handle {42};
    };

    std::vector<std::future<StorageBackend::Handle>> lookups;
    for (int i = 0; i != 16; ++i)
    {
        lookups.push_back(
            std::async(std::launch::async, [&] { return cache.get_or_resolve(5, resolver); }));
    }

    std::this_thread::sleep_for(std::chrono::milliseconds {20});
    promise_release.set_value();

    for (auto &f : lookups)
    {
        EXPECT_EQ(f.get(), 42);
    }
    EXPECT_EQ(resolutions, 1);
}

TEST(HandleCacheTest, ResolverMayUseOtherKeys)
{
    HandleCache<std::string> cache;

    auto handle = cache.get_or_resolve("child", [&] {
        auto parent = cache.get_or_resolve("parent", [] { return StorageBackend::Handle {1}; });
        return StorageBackend::Handle {parent + 1};
    });

    EXPECT_EQ(handle, 2);
    EXPECT_EQ(cache.find("parent"), 1);
    EXPECT_EQ(cache.size(), 2);
}

TEST(HandleCacheTest, ClearDuringFailedResolutionKeepsNewerEntry)
{
    HandleCache<int> cache;

    auto handle = cache.get_or_resolve(1, [&] {
        // Replace the entry being resolved with a newer, successful one
        cache.clear();
        cache.get_or_resolve(1, [] { return StorageBackend::Handle {9}; });
        return StorageBackend::invalid_handle;
    });

    EXPECT_EQ(handle, StorageBackend::invalid_handle);
    EXPECT_EQ(cache.find(1), 9);
}
