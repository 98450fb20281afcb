#ifndef CHUNKSTORE_STORE_CHUNKSTORE_HPP_
#define CHUNKSTORE_STORE_CHUNKSTORE_HPP_

#include <cstddef>
#include <cstdint>
#include <functional>
#include <future>
#include <memory>
#include <optional>
#include <string>
#include <vector>

#include "errorcode.hpp"
#include "storeoptions.hpp"

namespace chunkstore
{
namespace storage
{
// Forward declarations
class StorageBackend;
}  // namespace storage

namespace utils
{
// Forward declarations
class Executer;
}  // namespace utils
}  // namespace chunkstore

namespace chunkstore::store
{
// Byte window within a chunk; offset defaults to 0 and length to the rest of the chunk
struct GetOptions
{
    std::optional<size_t> offset;
    std::optional<size_t> length;
};

struct GetResult
{
    ErrorCode            error = ErrorCode::OK;
    std::vector<uint8_t> data;
};

/*
 * Fixed-size chunk interface over a storage backend. Chunks are either kept as individual files or
 * mapped onto an ordered list of logical files, in which case a disposable per-chunk cache is kept
 * next to them.
 *
 * Every operation runs asynchronously on the executer given at creation. The result is delivered
 * through the returned future and, if given, the callback, which is invoked first.
 */
class ChunkStore
{
public:
    using Data          = std::vector<uint8_t>;
    using ErrorCallback = std::function<void(ErrorCode)>;
    using GetCallback   = std::function<void(const GetResult &)>;

    virtual ~ChunkStore() = default;

    /*
     * Validates the options and builds the chunk map. Returns nullptr on an invalid configuration
     * and describes the problem in error_string.
     */
    [[nodiscard]] static std::unique_ptr<ChunkStore> create(size_t chunk_length,
        StoreOptions options, std::shared_ptr<storage::StorageBackend> backend,
        std::shared_ptr<utils::Executer> executer, std::string &error_string);

    // Removes every cache left behind by stores that were not closed
    static bool purge_cache_directory(
        storage::StorageBackend &backend, const std::string &cache_dir_name);

    virtual std::future<ErrorCode> put(uint64_t index, Data data, ErrorCallback callback = {}) = 0;
    virtual std::future<GetResult> get(
        uint64_t index, GetOptions options = {}, GetCallback callback = {}) = 0;

    virtual std::future<ErrorCode> cleanup(ErrorCallback callback = {}) = 0;
    virtual std::future<ErrorCode> close(ErrorCallback callback = {})   = 0;
    virtual std::future<ErrorCode> destroy(ErrorCallback callback = {}) = 0;

    [[nodiscard]] virtual size_t             chunk_length() const = 0;
    [[nodiscard]] virtual const std::string &name() const         = 0;
};
}  // namespace chunkstore::store

#endif  // CHUNKSTORE_STORE_CHUNKSTORE_HPP_
