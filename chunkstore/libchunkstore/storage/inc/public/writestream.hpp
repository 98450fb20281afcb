#ifndef CHUNKSTORE_STORAGE_WRITESTREAM_HPP_
#define CHUNKSTORE_STORAGE_WRITESTREAM_HPP_

#include <cstddef>
#include <cstdint>

namespace chunkstore::storage
{
/*
 * Positioned writer over one backend file. Not synchronized; callers serialize access to a
 * stream themselves.
 */
class WriteStream
{
public:
    virtual ~WriteStream() = default;

    virtual bool write_at(uint64_t position, const uint8_t *in, size_t amount) = 0;
    virtual bool close()                                                       = 0;
};
}  // namespace chunkstore::storage

#endif  // CHUNKSTORE_STORAGE_WRITESTREAM_HPP_
