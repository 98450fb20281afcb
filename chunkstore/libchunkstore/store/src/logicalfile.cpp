#include "logicalfile.hpp"

#include <algorithm>

#include <glog/logging.h>

namespace chunkstore::store
{
LogicalFile::LogicalFile(std::string path, std::shared_ptr<storage::StorageBackend> backend,
    std::shared_ptr<utils::Executer> executer, HandleResolver resolve_handle)
    : path_ {std::move(path)}
    , backend_ {std::move(backend)}
    , resolve_handle_ {std::move(resolve_handle)}
    , sequencer_ {std::move(executer)}
{}

LogicalFile::~LogicalFile()
{
    sequencer_.process_all_jobs();
    if (stream_ && !stream_->close())
    {
        LOG(WARNING) << "Write stream of " << path_ << " did not close cleanly";
    }
}

const std::string &LogicalFile::path() const
{
    return path_;
}

void LogicalFile::write(
    uint64_t file_offset, SharedChunkData data, size_t from, size_t to, DoneHandler done_handler)
{
    sequencer_.add_job([this, file_offset, data = std::move(data), from, to,
                           done_handler = std::move(done_handler)] {
        if (!stream_ && !open_stream())
        {
            done_handler(false);
            return;
        }

        bool success = stream_->write_at(file_offset, data->data() + from, to - from);
        if (!success)
        {
            LOG(ERROR) << "Cannot write " << (to - from) << " bytes at offset " << file_offset
                       << " of " << path_;
        }
        done_handler(success);
    });
}

void LogicalFile::close_stream(DoneHandler done_handler)
{
    sequencer_.add_job([this, done_handler = std::move(done_handler)] {
        if (!stream_)
        {
            done_handler(true);
            return;
        }

        bool success = stream_->close();
        stream_.reset();
        if (!success)
        {
            LOG(ERROR) << "Cannot close the write stream of " << path_;
        }
        done_handler(success);
    });
}

bool LogicalFile::read(uint64_t from, uint64_t to, std::vector<uint8_t> &out)
{
    Snapshot snapshot;

    {
        std::lock_guard lock {snapshot_mutex_};
        if (!snapshot_ && !take_snapshot())
        {
            return false;
        }
        snapshot = *snapshot_;
    }

    to = std::min(to, snapshot.size);
    if (from >= to)
    {
        out.clear();
        return true;
    }

    return backend_->read_range(snapshot.file, from, to, out);
}

bool LogicalFile::refresh_snapshot()
{
    std::lock_guard lock {snapshot_mutex_};
    return take_snapshot();
}

void LogicalFile::drop_snapshot()
{
    std::lock_guard lock {snapshot_mutex_};
    snapshot_.reset();
}

bool LogicalFile::take_snapshot()
{
    Handle file = resolve_handle_();
    if (file == storage::StorageBackend::invalid_handle)
    {
        LOG(ERROR) << "Cannot open " << path_ << " for reading";
        return false;
    }

    uint64_t size;
    if (!backend_->file_size(file, size))
    {
        LOG(ERROR) << "Cannot take a read snapshot of " << path_;
        return false;
    }

    snapshot_ = Snapshot {file, size};
    return true;
}

bool LogicalFile::open_stream()
{
    Handle file = resolve_handle_();
    if (file == storage::StorageBackend::invalid_handle)
    {
        LOG(ERROR) << "Cannot open " << path_;
        return false;
    }

    stream_ = backend_->open_write_stream(file, true);
    if (!stream_)
    {
        LOG(ERROR) << "Cannot open a write stream for " << path_;
        return false;
    }

    return true;
}
}  // namespace chunkstore::store
