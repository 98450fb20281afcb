#ifndef CHUNKSTORE_STORE_STOREOPTIONS_HPP_
#define CHUNKSTORE_STORE_STOREOPTIONS_HPP_

#include <cstdint>
#include <optional>
#include <string>
#include <vector>

#include "logicalfileinfo.hpp"

namespace chunkstore::store
{
struct StoreOptions
{
    // Directory name of the store under the backend root; generated when empty
    std::string name;

    // Unset or 0 means the store has no upper bound
    std::optional<uint64_t> total_length;

    // When empty, chunks are kept as individual files in the store directory
    std::vector<mapping::LogicalFileInfo> files;

    // Directory under the backend root that holds the per-store chunk caches
    std::string cache_dir_name = "chunks";
};
}  // namespace chunkstore::store

#endif  // CHUNKSTORE_STORE_STOREOPTIONS_HPP_
