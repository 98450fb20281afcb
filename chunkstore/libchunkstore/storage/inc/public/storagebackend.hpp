#ifndef CHUNKSTORE_STORAGE_STORAGEBACKEND_HPP_
#define CHUNKSTORE_STORAGE_STORAGEBACKEND_HPP_

#include <cstdint>
#include <memory>
#include <string>
#include <vector>

#include "writestream.hpp"

namespace chunkstore::storage
{
/*
 * Hierarchical storage: directories containing files and other directories, addressed through
 * handles. Opening the same entry twice yields the same handle. Removing an entry invalidates
 * the handles of everything below it.
 */
class StorageBackend
{
public:
    using Handle                           = int;
    static constexpr Handle invalid_handle = -1;

    virtual ~StorageBackend() = default;

    [[nodiscard]] virtual Handle root_directory() const = 0;

    // Both return invalid_handle if the entry is missing and create is false
    [[nodiscard]] virtual Handle open_directory(
        Handle parent, const std::string &name, bool create) = 0;
    [[nodiscard]] virtual Handle open_file(Handle parent, const std::string &name, bool create) = 0;

    /*
     * With keep_existing_data == false the stream builds new content for the file from scratch.
     * The new content replaces the old one as a whole when the stream is closed successfully;
     * until then readers keep seeing the old content.
     */
    [[nodiscard]] virtual std::unique_ptr<WriteStream> open_write_stream(
        Handle file, bool keep_existing_data) = 0;

    virtual bool file_size(Handle file, uint64_t &size) = 0;

    // Reads [from, to) clamped to the current file size; reading past the end yields no bytes
    virtual bool read_range(Handle file, uint64_t from, uint64_t to, std::vector<uint8_t> &out) = 0;

    virtual bool list_entries(Handle directory, std::vector<std::string> &names)      = 0;
    virtual bool remove_entry(Handle parent, const std::string &name, bool recursive) = 0;
};
}  // namespace chunkstore::storage

#endif  // CHUNKSTORE_STORAGE_STORAGEBACKEND_HPP_
