#include "filesystemwritestream.hpp"

#include <atomic>
#include <cstdint>

#include <glog/logging.h>

namespace chunkstore::storage
{
namespace
{
std::filesystem::path make_swap_path(const std::filesystem::path &file_path)
{
    // Unique per stream, concurrent replacements of one file must not share a swap file
    static std::atomic<uint64_t> next_swap_id {0};

    auto swap_name = "." + file_path.filename().string() + "." + std::to_string(next_swap_id++) +
                     ".swp";
    return file_path.parent_path() / swap_name;
}
}  // namespace

FilesystemWriteStream::FilesystemWriteStream(
    std::filesystem::path file_path, bool keep_existing_data)
    : file_path_ {std::move(file_path)}
    , write_failed_ {false}
{
    std::ios::openmode mode = std::ios::out | std::ios::binary;
    if (keep_existing_data)
    {
        mode |= std::ios::in;
        fs_.open(file_path_, mode);
    }
    else
    {
        swap_path_ = make_swap_path(file_path_);
        mode |= std::ios::trunc;
        fs_.open(swap_path_, mode);
    }

    if (!fs_)
    {
        LOG(ERROR) << "Cannot open " << (replaces_file() ? swap_path_ : file_path_)
                   << " for writing";
    }
}

FilesystemWriteStream::~FilesystemWriteStream()
{
    if (fs_.is_open())
    {
        fs_.close();
    }
    discard_swap_file();
}

bool FilesystemWriteStream::is_open() const
{
    return fs_.is_open();
}

bool FilesystemWriteStream::write_at(uint64_t position, const uint8_t *in, size_t amount)
{
    if (!fs_.is_open())
    {
        LOG(ERROR) << "Write stream for " << file_path_ << " is closed";
        return false;
    }

    fs_.seekp(std::fstream::off_type(position), std::ios::beg);
    fs_.write(reinterpret_cast<const char *>(in), std::streamsize(amount));

    // Flush so that readers going through other descriptors observe the data
    fs_.flush();

    if (!fs_)
    {
        LOG(ERROR) << "Write failed; file = " << file_path_ << "; position = " << position
                   << "; amount = " << amount;
        fs_.clear();
        write_failed_ = true;
        return false;
    }

    return true;
}

bool FilesystemWriteStream::close()
{
    if (!fs_.is_open())
    {
        return true;
    }

    fs_.close();
    if (fs_.fail())
    {
        LOG(ERROR) << "Failed to close " << file_path_;
        fs_.clear();
        discard_swap_file();
        return false;
    }

    if (!replaces_file())
    {
        return true;
    }

    if (write_failed_)
    {
        LOG(ERROR) << "Discarding the new content of " << file_path_ << ", a write failed";
        discard_swap_file();
        return false;
    }

    return commit();
}

bool FilesystemWriteStream::replaces_file() const
{
    return !swap_path_.empty();
}

bool FilesystemWriteStream::commit()
{
    std::error_code ec;
    std::filesystem::rename(swap_path_, file_path_, ec);
    if (ec)
    {
        LOG(ERROR) << "Cannot replace " << file_path_ << " with " << swap_path_ << ": "
                   << ec.message();
        discard_swap_file();
        return false;
    }

    swap_path_.clear();
    return true;
}

void FilesystemWriteStream::discard_swap_file()
{
    if (!replaces_file())
    {
        return;
    }

    std::error_code ec;
    std::filesystem::remove(swap_path_, ec);
    if (ec)
    {
        LOG(WARNING) << "Cannot remove swap file " << swap_path_ << ": " << ec.message();
    }
    swap_path_.clear();
}
}  // namespace chunkstore::storage
