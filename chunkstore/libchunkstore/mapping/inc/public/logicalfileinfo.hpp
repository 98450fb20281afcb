#ifndef CHUNKSTORE_MAPPING_LOGICALFILEINFO_HPP_
#define CHUNKSTORE_MAPPING_LOGICALFILEINFO_HPP_

#include <cstdint>
#include <optional>
#include <string>

namespace chunkstore::mapping
{
struct LogicalFileInfo
{
    // Slash separated, relative to the store directory
    std::string path;

    std::optional<uint64_t> length;

    // Byte position of the file within the store's address space. When unset, the file starts
    // where the previous one in the list ends.
    std::optional<uint64_t> offset;
};
}  // namespace chunkstore::mapping

#endif  // CHUNKSTORE_MAPPING_LOGICALFILEINFO_HPP_
