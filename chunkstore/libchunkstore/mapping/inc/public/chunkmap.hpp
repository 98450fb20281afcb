#ifndef CHUNKSTORE_MAPPING_CHUNKMAP_HPP_
#define CHUNKSTORE_MAPPING_CHUNKMAP_HPP_

#include <cstddef>
#include <cstdint>
#include <map>
#include <vector>

namespace chunkstore::mapping
{
/*
 * Part of a chunk that overlaps one logical file. Bytes [from, to) of the chunk live in file
 * file_index, starting at byte file_offset of that file.
 */
struct ChunkRangeEntry
{
    size_t   file_index;
    size_t   from;
    size_t   to;
    uint64_t file_offset;

    [[nodiscard]] size_t size() const
    {
        return to - from;
    }
};

inline bool operator==(const ChunkRangeEntry &lhs, const ChunkRangeEntry &rhs)
{
    return lhs.file_index == rhs.file_index && lhs.from == rhs.from && lhs.to == rhs.to &&
           lhs.file_offset == rhs.file_offset;
}

class ChunkMap
{
public:
    using Entries = std::vector<ChunkRangeEntry>;

    void add(uint64_t chunk_index, const ChunkRangeEntry &entry)
    {
        entries_[chunk_index].push_back(entry);
    }

    // Returns nullptr when no file overlaps the chunk
    [[nodiscard]] const Entries *find(uint64_t chunk_index) const
    {
        auto it = entries_.find(chunk_index);
        return it == entries_.end() ? nullptr : &it->second;
    }

    [[nodiscard]] size_t chunk_count() const
    {
        return entries_.size();
    }

    [[nodiscard]] bool empty() const
    {
        return entries_.empty();
    }

    void clear()
    {
        entries_.clear();
    }

private:
    std::map<uint64_t, Entries> entries_;
};
}  // namespace chunkstore::mapping

#endif  // CHUNKSTORE_MAPPING_CHUNKMAP_HPP_
