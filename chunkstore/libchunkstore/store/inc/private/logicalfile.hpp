#ifndef CHUNKSTORE_STORE_LOGICALFILE_HPP_
#define CHUNKSTORE_STORE_LOGICALFILE_HPP_

#include <cstddef>
#include <cstdint>
#include <functional>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

#include "sequentialexecuter.hpp"
#include "storagebackend.hpp"
#include "writestream.hpp"

namespace chunkstore::store
{
/*
 * One of the files a store maps its chunks onto. Writes go through a single lazily opened write
 * stream, one at a time and in the order they were issued. Reads go through a snapshot of the file
 * taken on the first read and renewed by refresh_snapshot(); they never see past the size the file
 * had when the snapshot was taken.
 */
class LogicalFile
{
public:
    using Handle          = storage::StorageBackend::Handle;
    using HandleResolver  = std::function<Handle()>;
    using DoneHandler     = std::function<void(bool)>;
    using SharedChunkData = std::shared_ptr<const std::vector<uint8_t>>;

    LogicalFile(std::string path, std::shared_ptr<storage::StorageBackend> backend,
        std::shared_ptr<utils::Executer> executer, HandleResolver resolve_handle);
    LogicalFile(const LogicalFile &) = delete;
    LogicalFile &operator=(const LogicalFile &) = delete;

    ~LogicalFile();

    [[nodiscard]] const std::string &path() const;

    // Writes data[from, to) at file_offset
    void write(uint64_t file_offset, SharedChunkData data, size_t from, size_t to,
        DoneHandler done_handler);

    // Runs after every write issued before it
    void close_stream(DoneHandler done_handler);

    bool read(uint64_t from, uint64_t to, std::vector<uint8_t> &out);
    bool refresh_snapshot();
    void drop_snapshot();

private:
    struct Snapshot
    {
        Handle   file;
        uint64_t size;
    };

    bool take_snapshot();
    bool open_stream();

    const std::string                              path_;
    const std::shared_ptr<storage::StorageBackend> backend_;
    const HandleResolver                           resolve_handle_;
    std::unique_ptr<storage::WriteStream>          stream_;
    std::optional<Snapshot>                        snapshot_;
    std::mutex                                     snapshot_mutex_;
    utils::SequentialExecuter                      sequencer_;
};
}  // namespace chunkstore::store

#endif  // CHUNKSTORE_STORE_LOGICALFILE_HPP_
