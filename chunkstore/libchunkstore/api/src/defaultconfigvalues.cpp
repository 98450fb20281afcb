#include "defaultconfigvalues.hpp"

#include <string>

#include <glog/logging.h>

namespace chunkstore
{
DefaultConfigValues::DefaultConfigValues()
    : default_values_ {/* STORAGE_ROOT_DIR */ std::string {"storage"},
          /* CACHE_DIR_NAME */ std::string {"chunks"},
          /* WORKER_THREAD_COUNT */ 0LL /* = one per hardware thread */,
          /* PURGE_STALE_CACHES_ON_START */ false}
{}

std::any DefaultConfigValues::get(const config::ConfigKey &key) const
{
    if (key < config::ConfigKey::FIRST_KEY || key >= config::ConfigKey::KEY_COUNT)
    {
        LOG(ERROR) << "Invalid key " << key;
        return {};
    }
    return default_values_[key];
}
}  // namespace chunkstore
