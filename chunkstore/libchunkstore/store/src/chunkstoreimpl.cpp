#include "chunkstoreimpl.hpp"

#include <algorithm>

#include <glog/logging.h>

#include "executer.hpp"
#include "pendingoperation.hpp"

namespace chunkstore::store
{
namespace
{
// Cannot clash with a directory path of a logical file, ':' never survives sanitization
constexpr char const *cache_directory_key = ":cache";
constexpr char const *store_directory_key = "";

void split_parent(const std::string &path, std::string &parent, std::string &child)
{
    auto pos = path.rfind('/');
    if (pos == std::string::npos)
    {
        parent = store_directory_key;
        child  = path;
    }
    else
    {
        parent = path.substr(0, pos);
        child  = path.substr(pos + 1);
    }
}
}  // namespace

ChunkStoreImpl::ChunkStoreImpl(size_t chunk_length, std::string name, std::string cache_dir_name,
    uint64_t total_length, std::vector<mapping::LogicalFileInfo> files,
    mapping::ChunkMap chunk_map, std::shared_ptr<storage::StorageBackend> backend,
    std::shared_ptr<utils::Executer> executer)
    : chunk_length_ {chunk_length}
    , name_ {std::move(name)}
    , cache_dir_name_ {std::move(cache_dir_name)}
    , total_length_ {total_length}
    , files_ {std::move(files)}
    , chunk_map_ {std::move(chunk_map)}
    , backend_ {std::move(backend)}
    , executer_ {std::move(executer)}
    , state_ {State::OPEN}
    , data_operations_ {0}
    , pending_operations_ {0}
{
    logical_files_.reserve(files_.size());
    for (size_t i = 0; i != files_.size(); ++i)
    {
        logical_files_.push_back(std::make_unique<LogicalFile>(
            files_[i].path, backend_, executer_, [this, i] { return resolve_logical_file(i); }));
    }

    LOG(INFO) << "Store " << name_ << " opened; chunk length = " << chunk_length_
              << "; total length = " << total_length_ << "; files = " << files_.size();
}

ChunkStoreImpl::~ChunkStoreImpl()
{
    if (state() == State::OPEN)
    {
        close({}).wait();
    }

    std::unique_lock lock {mutex_};
    cv_idle_.wait(lock, [this] { return pending_operations_ == 0; });
}

std::future<ErrorCode> ChunkStoreImpl::put(uint64_t index, Data data, ErrorCallback callback)
{
    auto promise = std::make_shared<std::promise<ErrorCode>>();
    auto future  = promise->get_future();
    auto finish  = [promise, callback = std::move(callback)](ErrorCode error) {
        if (callback)
        {
            callback(error);
        }
        promise->set_value(error);
    };

    if (!begin_operation(true))
    {
        LOG(WARNING) << "Store " << name_ << ": cannot put chunk " << index
                     << ", the store is closed";
        finish(ErrorCode::STORE_CLOSED);
        return future;
    }

    ErrorCode error = check_put(index, data.size());
    if (error != ErrorCode::OK)
    {
        finish(error);
        end_operation(true);
        return future;
    }

    executer_->add_job([this, index, data = std::make_shared<const Data>(std::move(data)),
                           finish = std::move(finish)] {
        do_put(index, data, [this, finish](ErrorCode error) {
            finish(error);
            end_operation(true);
        });
    });

    return future;
}

std::future<GetResult> ChunkStoreImpl::get(uint64_t index, GetOptions options, GetCallback callback)
{
    auto promise = std::make_shared<std::promise<GetResult>>();
    auto future  = promise->get_future();
    auto finish  = [promise, callback = std::move(callback)](GetResult result) {
        if (callback)
        {
            callback(result);
        }
        promise->set_value(std::move(result));
    };

    if (!begin_operation(true))
    {
        LOG(WARNING) << "Store " << name_ << ": cannot get chunk " << index
                     << ", the store is closed";
        finish({ErrorCode::STORE_CLOSED, {}});
        return future;
    }

    size_t    offset;
    size_t    length;
    ErrorCode error = check_get(index, options, offset, length);
    if (error != ErrorCode::OK || length == 0)
    {
        finish({error, {}});
        end_operation(true);
        return future;
    }

    executer_->add_job([this, index, offset, length, finish = std::move(finish)] {
        finish(do_get(index, offset, length));
        end_operation(true);
    });

    return future;
}

std::future<ErrorCode> ChunkStoreImpl::cleanup(ErrorCallback callback)
{
    auto promise = std::make_shared<std::promise<ErrorCode>>();
    auto future  = promise->get_future();
    auto finish  = [promise, callback = std::move(callback)](ErrorCode error) {
        if (callback)
        {
            callback(error);
        }
        promise->set_value(error);
    };

    if (!begin_operation(true))
    {
        LOG(WARNING) << "Store " << name_ << ": cannot clean up, the store is closed";
        finish(ErrorCode::STORE_CLOSED);
        return future;
    }

    if (logical_files_.empty())
    {
        // Without files the chunks are the data, there is no cache to discard
        finish(ErrorCode::OK);
        end_operation(true);
        return future;
    }

    executer_->add_job([this, finish = std::move(finish)] {
        run_cleanup([this, finish](ErrorCode error) {
            finish(error);
            end_operation(true);
        });
    });

    return future;
}

std::future<ErrorCode> ChunkStoreImpl::close(ErrorCallback callback)
{
    auto promise = std::make_shared<std::promise<ErrorCode>>();
    auto future  = promise->get_future();
    auto finish  = [promise, callback = std::move(callback)](ErrorCode error) {
        if (callback)
        {
            callback(error);
        }
        promise->set_value(error);
    };

    bool started = start_close([this, finish](ErrorCode error) {
        finish(error);
        end_operation(false);
    });
    if (!started)
    {
        LOG(WARNING) << "Store " << name_ << " is already closed";
        finish(ErrorCode::ALREADY_CLOSED);
    }

    return future;
}

std::future<ErrorCode> ChunkStoreImpl::destroy(ErrorCallback callback)
{
    auto promise = std::make_shared<std::promise<ErrorCode>>();
    auto future  = promise->get_future();
    auto finish  = [promise, callback = std::move(callback)](ErrorCode error) {
        if (callback)
        {
            callback(error);
        }
        promise->set_value(error);
    };

    bool started = start_close([this, finish](ErrorCode close_error) {
        ErrorCode remove_error = remove_store_directories();
        set_state(State::DESTROYED);
        LOG(INFO) << "Store " << name_ << " destroyed";

        finish(close_error != ErrorCode::OK ? close_error : remove_error);
        end_operation(false);
    });
    if (!started)
    {
        LOG(WARNING) << "Store " << name_ << " is already closed, it cannot be destroyed";
        finish(ErrorCode::ALREADY_CLOSED);
    }

    return future;
}

size_t ChunkStoreImpl::chunk_length() const
{
    return chunk_length_;
}

const std::string &ChunkStoreImpl::name() const
{
    return name_;
}

ChunkStoreImpl::State ChunkStoreImpl::state() const
{
    std::lock_guard lock {mutex_};
    return state_;
}

void ChunkStoreImpl::set_state(State new_state)
{
    std::lock_guard lock {mutex_};
    if (state_ != new_state)
    {
        LOG(INFO) << "Store " << name_ << " state changed: " << to_string(state_) << " -> "
                  << to_string(new_state);
        state_ = new_state;
    }
}

bool ChunkStoreImpl::begin_operation(bool data_operation)
{
    std::lock_guard lock {mutex_};

    if (state_ != State::OPEN)
    {
        return false;
    }

    if (data_operation)
    {
        ++data_operations_;
    }
    ++pending_operations_;
    return true;
}

void ChunkStoreImpl::end_operation(bool data_operation)
{
    std::function<void()> on_drained;

    {
        std::lock_guard lock {mutex_};

        if (data_operation && --data_operations_ == 0 && on_data_operations_drained_)
        {
            on_drained = std::move(on_data_operations_drained_);
            on_data_operations_drained_ = nullptr;
        }

        --pending_operations_;
        cv_idle_.notify_all();
    }

    // A pending close keeps pending_operations_ above zero, so *this is still alive here
    if (on_drained)
    {
        executer_->add_job(std::move(on_drained));
    }
}

bool ChunkStoreImpl::start_close(CompletionHandler on_closed)
{
    bool run_now;

    {
        std::lock_guard lock {mutex_};

        if (state_ != State::OPEN)
        {
            return false;
        }

        LOG(INFO) << "Store " << name_ << " state changed: " << to_string(state_) << " -> "
                  << to_string(State::CLOSING);
        state_ = State::CLOSING;
        ++pending_operations_;

        run_now = data_operations_ == 0;
        if (!run_now)
        {
            on_data_operations_drained_ = [this, on_closed] { finish_close(on_closed); };
        }
    }

    if (run_now)
    {
        executer_->add_job([this, on_closed = std::move(on_closed)] { finish_close(on_closed); });
    }

    return true;
}

void ChunkStoreImpl::finish_close(const CompletionHandler &on_closed)
{
    auto release = [this, on_closed](ErrorCode error) {
        release_state();
        set_state(State::CLOSED);
        on_closed(error);
    };

    if (logical_files_.empty())
    {
        release(ErrorCode::OK);
    }
    else
    {
        run_cleanup(std::move(release));
    }
}

void ChunkStoreImpl::release_state()
{
    directories_.clear();
    file_handles_.clear();
    chunk_files_.clear();
    chunk_map_.clear();

    // The files themselves stay alive until destruction, their sequencers may still be draining
    for (auto &file : logical_files_)
    {
        file->drop_snapshot();
    }
}

uint64_t ChunkStoreImpl::chunk_count() const
{
    return total_length_ / chunk_length_ + (total_length_ % chunk_length_ != 0 ? 1 : 0);
}

size_t ChunkStoreImpl::chunk_size(uint64_t index) const
{
    if (total_length_ != 0 && index == chunk_count() - 1)
    {
        auto remainder = size_t(total_length_ % chunk_length_);
        return remainder != 0 ? remainder : chunk_length_;
    }
    return chunk_length_;
}

ErrorCode ChunkStoreImpl::check_put(uint64_t index, size_t data_size) const
{
    const size_t expected_size = chunk_size(index);
    if (data_size != expected_size)
    {
        LOG(ERROR) << "Store " << name_ << ": chunk " << index << " must be " << expected_size
                   << " bytes long, got " << data_size;
        return ErrorCode::CHUNK_LENGTH_MISMATCH;
    }

    if (!logical_files_.empty() && chunk_map_.find(index) == nullptr)
    {
        LOG(ERROR) << "Store " << name_ << ": no file overlaps chunk " << index;
        return ErrorCode::NO_MATCHING_FILES;
    }

    return ErrorCode::OK;
}

ErrorCode ChunkStoreImpl::check_get(
    uint64_t index, const GetOptions &options, size_t &offset, size_t &length) const
{
    const size_t size = chunk_size(index);

    offset = options.offset.value_or(0);
    if (offset > size)
    {
        LOG(ERROR) << "Store " << name_ << ": offset " << offset << " is past the end of chunk "
                   << index << " (" << size << " bytes)";
        return ErrorCode::RANGE_OUT_OF_BOUNDS;
    }

    length = options.length.value_or(size - offset);
    if (length > size - offset)
    {
        LOG(ERROR) << "Store " << name_ << ": range [" << offset << ", +" << length
                   << ") is past the end of chunk " << index << " (" << size << " bytes)";
        return ErrorCode::RANGE_OUT_OF_BOUNDS;
    }

    return ErrorCode::OK;
}

void ChunkStoreImpl::do_put(uint64_t index, const std::shared_ptr<const Data> &data,
    CompletionHandler completion_handler)
{
    const mapping::ChunkMap::Entries *targets =
        logical_files_.empty() ? nullptr : chunk_map_.find(index);

    auto pending = std::make_shared<PendingOperation>(
        1 + (targets ? targets->size() : 0), std::move(completion_handler));

    if (targets)
    {
        for (const auto &target : *targets)
        {
            logical_files_[target.file_index]->write(target.file_offset, data, target.from,
                target.to, [pending](bool success) {
                    pending->complete_part(success ? ErrorCode::OK : ErrorCode::IO_ERROR);
                });
        }
    }

    pending->complete_part(write_chunk_file(index, *data));
}

ErrorCode ChunkStoreImpl::write_chunk_file(uint64_t index, const Data &data)
{
    std::shared_lock lock {cache_mutex_};

    Handle file = resolve_chunk_file(index);
    if (file == storage::StorageBackend::invalid_handle)
    {
        LOG(ERROR) << "Store " << name_ << ": cannot create the file of chunk " << index;
        return ErrorCode::IO_ERROR;
    }

    auto stream = backend_->open_write_stream(file, false);
    if (!stream)
    {
        LOG(ERROR) << "Store " << name_ << ": cannot open the file of chunk " << index;
        chunk_files_.erase(index);
        return ErrorCode::IO_ERROR;
    }

    bool written = stream->write_at(0, data.data(), data.size());
    bool closed  = stream->close();
    if (!written || !closed)
    {
        LOG(ERROR) << "Store " << name_ << ": cannot write chunk " << index;
        chunk_files_.erase(index);
        return ErrorCode::IO_ERROR;
    }

    return ErrorCode::OK;
}

GetResult ChunkStoreImpl::do_get(uint64_t index, size_t offset, size_t length)
{
    std::shared_lock lock {cache_mutex_};

    if (logical_files_.empty())
    {
        if (auto file = chunk_files_.find(index))
        {
            return read_chunk_file(index, *file, offset, length);
        }

        // Chunks written by an earlier session are opened without memoizing a miss
        Handle file      = storage::StorageBackend::invalid_handle;
        Handle directory = resolve_directory(store_directory_key);
        if (directory != storage::StorageBackend::invalid_handle)
        {
            file = backend_->open_file(directory, std::to_string(index), false);
        }
        if (file == storage::StorageBackend::invalid_handle)
        {
            LOG(WARNING) << "Store " << name_ << ": chunk " << index << " not found";
            return {ErrorCode::NOT_FOUND, {}};
        }
        return read_chunk_file(index, file, offset, length);
    }

    if (auto file = chunk_files_.find(index))
    {
        return read_chunk_file(index, *file, offset, length);
    }

    return reconstruct_chunk(index, offset, length);
}

GetResult ChunkStoreImpl::read_chunk_file(uint64_t index, Handle file, size_t offset, size_t length)
{
    GetResult result;
    if (!backend_->read_range(file, offset, uint64_t(offset) + length, result.data))
    {
        LOG(ERROR) << "Store " << name_ << ": cannot read chunk " << index;
        return {ErrorCode::IO_ERROR, {}};
    }

    // A chunk file shorter than the range was left by a store with another layout
    if (result.data.size() != length)
    {
        LOG(WARNING) << "Store " << name_ << ": chunk " << index << " not found";
        return {ErrorCode::NOT_FOUND, {}};
    }

    return result;
}

GetResult ChunkStoreImpl::reconstruct_chunk(uint64_t index, size_t offset, size_t length)
{
    const auto *entries = chunk_map_.find(index);
    if (entries == nullptr)
    {
        LOG(ERROR) << "Store " << name_ << ": no file overlaps chunk " << index;
        return {ErrorCode::NO_MATCHING_FILES, {}};
    }

    const size_t window_end = offset + length;

    GetResult            result;
    bool                 matched = false;
    std::vector<uint8_t> part;

    for (const auto &entry : *entries)
    {
        const size_t from = std::max(entry.from, offset);
        const size_t to   = std::min(entry.to, window_end);
        if (from >= to)
        {
            continue;
        }
        matched = true;

        const uint64_t file_from = entry.file_offset + (from - entry.from);
        auto          &file      = *logical_files_[entry.file_index];
        if (!file.read(file_from, file_from + (to - from), part))
        {
            LOG(ERROR) << "Store " << name_ << ": cannot read chunk " << index << " from "
                       << file.path();
            return {ErrorCode::IO_ERROR, {}};
        }

        if (part.size() != to - from)
        {
            LOG(WARNING) << "Store " << name_ << ": chunk " << index << " not found in "
                         << file.path();
            return {ErrorCode::NOT_FOUND, {}};
        }

        result.data.insert(result.data.end(), part.cbegin(), part.cend());
    }

    if (!matched)
    {
        LOG(ERROR) << "Store " << name_ << ": no file overlaps bytes [" << offset << ", "
                   << window_end << ") of chunk " << index;
        return {ErrorCode::NO_MATCHING_FILES, {}};
    }

    if (result.data.empty())
    {
        result.error = ErrorCode::NOT_FOUND;
    }

    return result;
}

void ChunkStoreImpl::run_cleanup(CompletionHandler completion_handler)
{
    auto pending = std::make_shared<PendingOperation>(logical_files_.size(),
        [this, completion_handler = std::move(completion_handler)](ErrorCode close_error) {
            ErrorCode wipe_error = wipe_cache();
            completion_handler(close_error != ErrorCode::OK ? close_error : wipe_error);
        });

    // Every stream is closed, even after one of them failed to
    for (auto &file : logical_files_)
    {
        file->close_stream([pending](bool success) {
            pending->complete_part(success ? ErrorCode::OK : ErrorCode::IO_ERROR);
        });
    }
}

ErrorCode ChunkStoreImpl::wipe_cache()
{
    std::unique_lock lock {cache_mutex_};

    ErrorCode result = ErrorCode::OK;

    Handle cache_root =
        backend_->open_directory(backend_->root_directory(), cache_dir_name_, false);
    if (!remove_directory(cache_root, name_))
    {
        LOG(ERROR) << "Store " << name_ << ": cannot remove the chunk cache";
        result = ErrorCode::IO_ERROR;
    }

    chunk_files_.clear();
    directories_.erase(cache_directory_key);

    if (resolve_directory(cache_directory_key) == storage::StorageBackend::invalid_handle)
    {
        LOG(ERROR) << "Store " << name_ << ": cannot recreate the chunk cache directory";
        if (result == ErrorCode::OK)
        {
            result = ErrorCode::IO_ERROR;
        }
    }

    for (auto &file : logical_files_)
    {
        if (!file->refresh_snapshot() && result == ErrorCode::OK)
        {
            result = ErrorCode::IO_ERROR;
        }
    }

    if (result == ErrorCode::OK)
    {
        LOG(INFO) << "Store " << name_ << ": chunk cache discarded";
    }

    return result;
}

ErrorCode ChunkStoreImpl::remove_store_directories()
{
    ErrorCode result = ErrorCode::OK;
    Handle    root   = backend_->root_directory();

    if (!remove_directory(root, name_))
    {
        LOG(ERROR) << "Store " << name_ << ": cannot remove the store directory";
        result = ErrorCode::IO_ERROR;
    }

    Handle cache_root = backend_->open_directory(root, cache_dir_name_, false);
    if (!remove_directory(cache_root, name_))
    {
        LOG(ERROR) << "Store " << name_ << ": cannot remove the chunk cache";
        result = ErrorCode::IO_ERROR;
    }

    return result;
}

bool ChunkStoreImpl::remove_directory(Handle parent, const std::string &name)
{
    if (parent == storage::StorageBackend::invalid_handle ||
        backend_->open_directory(parent, name, false) == storage::StorageBackend::invalid_handle)
    {
        return true;
    }
    return backend_->remove_entry(parent, name, true);
}

ChunkStoreImpl::Handle ChunkStoreImpl::resolve_directory(const std::string &key)
{
    return directories_.get_or_resolve(key, [this, &key]() -> Handle {
        Handle root = backend_->root_directory();

        if (key == store_directory_key)
        {
            return backend_->open_directory(root, name_, true);
        }

        if (key == cache_directory_key)
        {
            Handle cache_root = backend_->open_directory(root, cache_dir_name_, true);
            if (cache_root == storage::StorageBackend::invalid_handle)
            {
                return storage::StorageBackend::invalid_handle;
            }
            return backend_->open_directory(cache_root, name_, true);
        }

        std::string parent_key;
        std::string child_name;
        split_parent(key, parent_key, child_name);

        Handle parent = resolve_directory(parent_key);
        if (parent == storage::StorageBackend::invalid_handle)
        {
            return storage::StorageBackend::invalid_handle;
        }
        return backend_->open_directory(parent, child_name, true);
    });
}

ChunkStoreImpl::Handle ChunkStoreImpl::resolve_chunk_file(uint64_t index)
{
    return chunk_files_.get_or_resolve(index, [this, index]() -> Handle {
        Handle directory = resolve_directory(
            logical_files_.empty() ? store_directory_key : cache_directory_key);
        if (directory == storage::StorageBackend::invalid_handle)
        {
            return storage::StorageBackend::invalid_handle;
        }
        return backend_->open_file(directory, std::to_string(index), true);
    });
}

ChunkStoreImpl::Handle ChunkStoreImpl::resolve_logical_file(size_t file_index)
{
    return file_handles_.get_or_resolve(file_index, [this, file_index]() -> Handle {
        std::string directory_key;
        std::string file_name;
        split_parent(files_[file_index].path, directory_key, file_name);

        Handle directory = resolve_directory(directory_key);
        if (directory == storage::StorageBackend::invalid_handle)
        {
            return storage::StorageBackend::invalid_handle;
        }
        return backend_->open_file(directory, file_name, true);
    });
}
}  // namespace chunkstore::store
