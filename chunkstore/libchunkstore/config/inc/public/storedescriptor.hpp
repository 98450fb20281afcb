#ifndef CHUNKSTORE_CONFIG_STOREDESCRIPTOR_HPP_
#define CHUNKSTORE_CONFIG_STOREDESCRIPTOR_HPP_

#include <cstdint>
#include <optional>
#include <string>
#include <vector>

#include "logicalfileinfo.hpp"

namespace chunkstore::config
{
// Everything needed to open a store, as written by the user
struct StoreDescriptor
{
    uint64_t                              chunk_length = 0;
    std::string                           name;
    std::optional<uint64_t>               total_length;
    std::vector<mapping::LogicalFileInfo> files;
};
}  // namespace chunkstore::config

#endif  // CHUNKSTORE_CONFIG_STOREDESCRIPTOR_HPP_
