#ifndef CHUNKSTORE_MAPPING_RANGEMAPPER_HPP_
#define CHUNKSTORE_MAPPING_RANGEMAPPER_HPP_

#include <cstddef>
#include <cstdint>
#include <string>
#include <vector>

#include "chunkmap.hpp"
#include "logicalfileinfo.hpp"

namespace chunkstore::mapping
{
class RangeMapper
{
public:
    explicit RangeMapper(size_t chunk_length);

    /*
     * Assigns an offset to every file that has none and builds the table of chunk/file overlaps.
     * Fails without touching chunk_map when a file has no path or no positive length.
     */
    [[nodiscard]] bool map(
        std::vector<LogicalFileInfo> &files, ChunkMap &chunk_map, std::string &error_string) const;

    // Sum of the file lengths; files without a length count as 0
    [[nodiscard]] static uint64_t total_length(const std::vector<LogicalFileInfo> &files);

private:
    void map_file(size_t file_index, uint64_t file_start, uint64_t file_end,
        ChunkMap &chunk_map) const;

    const size_t chunk_length_;
};
}  // namespace chunkstore::mapping

#endif  // CHUNKSTORE_MAPPING_RANGEMAPPER_HPP_
