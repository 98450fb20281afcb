#ifndef CHUNKSTORE_STORE_HANDLECACHE_HPP_
#define CHUNKSTORE_STORE_HANDLECACHE_HPP_

#include <cstdint>
#include <functional>
#include <future>
#include <map>
#include <mutex>
#include <optional>

#include "storagebackend.hpp"

namespace chunkstore::store
{
/*
 * Memoizes backend handles by key. The first lookup of a key runs the resolver, concurrent
 * lookups of the same key wait for that resolution instead of starting their own. Failed
 * resolutions are not remembered.
 */
template<typename Key>
class HandleCache
{
public:
    using Handle   = storage::StorageBackend::Handle;
    using Resolver = std::function<Handle()>;

    HandleCache()
        : next_generation_ {0}
    {}

    HandleCache(const HandleCache &) = delete;
    HandleCache &operator=(const HandleCache &) = delete;

    Handle get_or_resolve(const Key &key, const Resolver &resolver)
    {
        std::promise<Handle> promise;
        uint64_t             generation;

        {
            std::unique_lock lock {mutex_};

            auto it = entries_.find(key);
            if (it != entries_.end())
            {
                auto future = it->second.future;
                lock.unlock();
                return future.get();
            }

            generation = next_generation_++;
            entries_.emplace(key, Entry {promise.get_future().share(), generation});
        }

        // The resolver may look up other keys of this cache, so it runs unlocked
        Handle handle = resolver();
        promise.set_value(handle);

        if (handle == storage::StorageBackend::invalid_handle)
        {
            std::lock_guard lock {mutex_};

            // The entry may have been replaced by a newer one after a clear()
            auto it = entries_.find(key);
            if (it != entries_.end() && it->second.generation == generation)
            {
                entries_.erase(it);
            }
        }

        return handle;
    }

    // Returns the handle only if key was resolved successfully
    std::optional<Handle> find(const Key &key) const
    {
        std::shared_future<Handle> future;

        {
            std::lock_guard lock {mutex_};

            auto it = entries_.find(key);
            if (it == entries_.end())
            {
                return std::nullopt;
            }
            future = it->second.future;
        }

        Handle handle = future.get();
        if (handle == storage::StorageBackend::invalid_handle)
        {
            return std::nullopt;
        }
        return handle;
    }

    void erase(const Key &key)
    {
        std::lock_guard lock {mutex_};
        entries_.erase(key);
    }

    void clear()
    {
        std::lock_guard lock {mutex_};
        entries_.clear();
    }

    [[nodiscard]] size_t size() const
    {
        std::lock_guard lock {mutex_};
        return entries_.size();
    }

private:
    struct Entry
    {
        std::shared_future<Handle> future;
        uint64_t                   generation;
    };

    std::map<Key, Entry> entries_;
    uint64_t             next_generation_;
    mutable std::mutex   mutex_;
};
}  // namespace chunkstore::store

#endif  // CHUNKSTORE_STORE_HANDLECACHE_HPP_
