#include "rangemapper.hpp"

#include <algorithm>
#include <limits>
#include <sstream>

namespace chunkstore::mapping
{
RangeMapper::RangeMapper(size_t chunk_length)
    : chunk_length_ {chunk_length}
{}

bool RangeMapper::map(
    std::vector<LogicalFileInfo> &files, ChunkMap &chunk_map, std::string &error_string) const
{
    if (chunk_length_ == 0)
    {
        error_string = "Chunk length must be positive";
        return false;
    }

    // Validate everything first so a bad list leaves no partial result behind
    for (size_t i = 0; i != files.size(); ++i)
    {
        const auto &file = files[i];
        if (file.path.empty())
        {
            std::ostringstream ss;
            ss << "File #" << i << " is missing its path";
            error_string = ss.str();
            return false;
        }
        if (!file.length.has_value())
        {
            error_string = "File " + file.path + " is missing its length";
            return false;
        }
        if (*file.length == 0)
        {
            error_string = "File " + file.path + " has zero length";
            return false;
        }
    }

    std::vector<uint64_t> offsets(files.size());
    for (size_t i = 0; i != files.size(); ++i)
    {
        const auto &file = files[i];
        if (file.offset.has_value())
        {
            offsets[i] = *file.offset;
        }
        else if (i != 0)
        {
            offsets[i] = offsets[i - 1] + *files[i - 1].length;
        }

        if (offsets[i] > std::numeric_limits<uint64_t>::max() - *file.length)
        {
            error_string = "File " + file.path + " extends beyond the addressable range";
            return false;
        }
    }

    ChunkMap result;
    for (size_t i = 0; i != files.size(); ++i)
    {
        files[i].offset = offsets[i];
        map_file(i, offsets[i], offsets[i] + *files[i].length, result);
    }

    chunk_map = std::move(result);
    return true;
}

uint64_t RangeMapper::total_length(const std::vector<LogicalFileInfo> &files)
{
    uint64_t total = 0;
    for (const auto &file : files)
    {
        total += file.length.value_or(0);
    }
    return total;
}

void RangeMapper::map_file(
    size_t file_index, uint64_t file_start, uint64_t file_end, ChunkMap &chunk_map) const
{
    const uint64_t first_chunk = file_start / chunk_length_;
    const uint64_t last_chunk  = (file_end - 1) / chunk_length_;

    for (uint64_t c = first_chunk; c <= last_chunk; ++c)
    {
        const uint64_t chunk_start = c * chunk_length_;

        ChunkRangeEntry entry;
        entry.file_index  = file_index;
        entry.from        = file_start > chunk_start ? size_t(file_start - chunk_start) : 0;
        entry.to          = size_t(std::min<uint64_t>(chunk_length_, file_end - chunk_start));
        entry.file_offset = chunk_start > file_start ? chunk_start - file_start : 0;

        chunk_map.add(c, entry);
    }
}
}  // namespace chunkstore::mapping
