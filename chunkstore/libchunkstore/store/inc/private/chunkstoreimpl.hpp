#ifndef CHUNKSTORE_STORE_CHUNKSTOREIMPL_HPP_
#define CHUNKSTORE_STORE_CHUNKSTOREIMPL_HPP_

#include <condition_variable>
#include <cstddef>
#include <cstdint>
#include <functional>
#include <memory>
#include <mutex>
#include <shared_mutex>
#include <string>
#include <vector>

#include "chunkmap.hpp"
#include "chunkstore.hpp"
#include "handlecache.hpp"
#include "logicalfile.hpp"
#include "logicalfileinfo.hpp"
#include "storagebackend.hpp"

namespace chunkstore::utils
{
// Forward declarations
class Executer;
}  // namespace chunkstore::utils

namespace chunkstore::store
{
class ChunkStoreImpl : public ChunkStore
{
public:
    /*
     * Expects validated arguments: a positive chunk length, valid entry names and files with
     * sanitized paths, lengths and offsets, already mapped onto chunk_map. A total_length of 0
     * means the store is unbounded.
     */
    ChunkStoreImpl(size_t chunk_length, std::string name, std::string cache_dir_name,
        uint64_t total_length, std::vector<mapping::LogicalFileInfo> files,
        mapping::ChunkMap chunk_map, std::shared_ptr<storage::StorageBackend> backend,
        std::shared_ptr<utils::Executer> executer);
    ChunkStoreImpl(const ChunkStoreImpl &) = delete;
    ChunkStoreImpl &operator=(const ChunkStoreImpl &) = delete;

    ~ChunkStoreImpl() override;

    std::future<ErrorCode> put(uint64_t index, Data data, ErrorCallback callback) override;
    std::future<GetResult> get(uint64_t index, GetOptions options, GetCallback callback) override;
    std::future<ErrorCode> cleanup(ErrorCallback callback) override;
    std::future<ErrorCode> close(ErrorCallback callback) override;
    std::future<ErrorCode> destroy(ErrorCallback callback) override;

    [[nodiscard]] size_t             chunk_length() const override;
    [[nodiscard]] const std::string &name() const override;

private:
    using Handle            = storage::StorageBackend::Handle;
    using CompletionHandler = std::function<void(ErrorCode)>;

    enum class State
    {
        OPEN,
        CLOSING,
        CLOSED,
        DESTROYED
    };

    constexpr static const char *to_string(State state)
    {
        switch (state)
        {
            case State::OPEN: return "OPEN";
            case State::CLOSING: return "CLOSING";
            case State::CLOSED: return "CLOSED";
            case State::DESTROYED: return "DESTROYED";
            default: return "INVALID_STATE";
        }
    }

    [[nodiscard]] State state() const;
    void                set_state(State new_state);

    // Put, get and cleanup are data operations, close waits for them to finish
    bool begin_operation(bool data_operation);
    void end_operation(bool data_operation);
    bool start_close(CompletionHandler on_closed);
    void finish_close(const CompletionHandler &on_closed);
    void release_state();

    [[nodiscard]] uint64_t  chunk_count() const;
    [[nodiscard]] size_t    chunk_size(uint64_t index) const;
    [[nodiscard]] ErrorCode check_put(uint64_t index, size_t data_size) const;
    [[nodiscard]] ErrorCode check_get(
        uint64_t index, const GetOptions &options, size_t &offset, size_t &length) const;

    void      do_put(uint64_t index, const std::shared_ptr<const Data> &data,
             CompletionHandler completion_handler);
    ErrorCode write_chunk_file(uint64_t index, const Data &data);
    GetResult do_get(uint64_t index, size_t offset, size_t length);
    GetResult read_chunk_file(uint64_t index, Handle file, size_t offset, size_t length);
    GetResult reconstruct_chunk(uint64_t index, size_t offset, size_t length);

    void      run_cleanup(CompletionHandler completion_handler);
    ErrorCode wipe_cache();
    ErrorCode remove_store_directories();

    // Returns false only if the directory exists and could not be removed
    bool remove_directory(Handle parent, const std::string &name);

    Handle resolve_directory(const std::string &key);
    Handle resolve_chunk_file(uint64_t index);
    Handle resolve_logical_file(size_t file_index);

    const size_t                                    chunk_length_;
    const std::string                               name_;
    const std::string                               cache_dir_name_;
    const uint64_t                                  total_length_;
    const std::vector<mapping::LogicalFileInfo>     files_;
    mapping::ChunkMap                               chunk_map_;
    const std::shared_ptr<storage::StorageBackend>  backend_;
    const std::shared_ptr<utils::Executer>          executer_;
    HandleCache<std::string>                        directories_;
    HandleCache<size_t>                             file_handles_;
    HandleCache<uint64_t>                           chunk_files_;
    std::vector<std::unique_ptr<LogicalFile>>       logical_files_;
    State                                           state_;
    size_t                                          data_operations_;
    size_t                                          pending_operations_;
    std::function<void()>                           on_data_operations_drained_;
    mutable std::mutex                              mutex_;
    std::condition_variable                         cv_idle_;
    std::shared_mutex                               cache_mutex_;
};
}  // namespace chunkstore::store

#endif  // CHUNKSTORE_STORE_CHUNKSTOREIMPL_HPP_
