#ifndef CHUNKSTORE_STORAGE_FILESYSTEMWRITESTREAM_HPP_
#define CHUNKSTORE_STORAGE_FILESYSTEMWRITESTREAM_HPP_

#include <filesystem>
#include <fstream>
#include <string>

#include "writestream.hpp"

namespace chunkstore::storage
{
/*
 * Without keep_existing_data the stream writes to a swap file beside the target and renames it
 * over the target on a successful close(), so readers of the target never see it truncated or
 * half written. A failed write or a stream dropped without close() discards the swap file.
 */
class FilesystemWriteStream : public WriteStream
{
public:
    FilesystemWriteStream(std::filesystem::path file_path, bool keep_existing_data);
    FilesystemWriteStream(const FilesystemWriteStream &) = delete;
    FilesystemWriteStream &operator=(const FilesystemWriteStream &) = delete;

    ~FilesystemWriteStream() override;

    [[nodiscard]] bool is_open() const;
    bool               write_at(uint64_t position, const uint8_t *in, size_t amount) override;
    bool               close() override;

private:
    [[nodiscard]] bool replaces_file() const;
    bool               commit();
    void               discard_swap_file();

    std::filesystem::path file_path_;
    std::filesystem::path swap_path_;
    std::fstream          fs_;
    bool                  write_failed_;
};
}  // namespace chunkstore::storage

#endif  // CHUNKSTORE_STORAGE_FILESYSTEMWRITESTREAM_HPP_
