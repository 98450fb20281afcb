#include "filesystemstoragebackend.hpp"

#include <algorithm>
#include <fstream>

#include <boost/interprocess/file_mapping.hpp>
#include <boost/interprocess/mapped_region.hpp>
#include <glog/logging.h>

#include "filesystemwritestream.hpp"

namespace chunkstore::storage
{
namespace
{
bool is_valid_entry_name(const std::string &name)
{
    return !name.empty() && name != "." && name != ".." &&
           name.find_first_of("/\\") == std::string::npos && name.find('\0') == std::string::npos;
}

bool is_same_or_below(const std::filesystem::path &ancestor, const std::filesystem::path &path)
{
    auto [it_ancestor, it_path] =
        std::mismatch(ancestor.begin(), ancestor.end(), path.begin(), path.end());
    return it_ancestor == ancestor.end();
}
}  // namespace

FilesystemStorageBackend::FilesystemStorageBackend(const std::string &root_path)
    : root_handle_ {invalid_handle}
    , next_handle_ {1}
{
    std::error_code ec;

    root_path_ = std::filesystem::absolute(root_path, ec).lexically_normal();
    if (ec)
    {
        LOG(ERROR) << "Cannot resolve storage root " << root_path << ": " << ec.message();
        return;
    }

    if (!std::filesystem::is_directory(root_path_, ec))
    {
        std::filesystem::create_directories(root_path_, ec);
        if (ec)
        {
            LOG(ERROR) << "Cannot create storage root " << root_path_ << ": " << ec.message();
            return;
        }
    }

    root_handle_ = register_path(root_path_);
}

bool FilesystemStorageBackend::is_valid() const
{
    return root_handle_ != invalid_handle;
}

StorageBackend::Handle FilesystemStorageBackend::root_directory() const
{
    return root_handle_;
}

StorageBackend::Handle FilesystemStorageBackend::open_directory(
    Handle parent, const std::string &name, bool create)
{
    std::filesystem::path path;
    if (!get_child_path(parent, name, path))
    {
        return invalid_handle;
    }

    std::error_code ec;
    if (std::filesystem::is_directory(path, ec))
    {
        return register_path(path);
    }

    if (std::filesystem::exists(path, ec))
    {
        LOG(ERROR) << path << " exists and is not a directory";
        return invalid_handle;
    }

    if (!create)
    {
        return invalid_handle;
    }

    std::filesystem::create_directory(path, ec);
    if (ec && !std::filesystem::is_directory(path))
    {
        LOG(ERROR) << "Cannot create directory " << path << ": " << ec.message();
        return invalid_handle;
    }

    return register_path(path);
}

StorageBackend::Handle FilesystemStorageBackend::open_file(
    Handle parent, const std::string &name, bool create)
{
    std::filesystem::path path;
    if (!get_child_path(parent, name, path))
    {
        return invalid_handle;
    }

    std::error_code ec;
    if (std::filesystem::is_regular_file(path, ec))
    {
        return register_path(path);
    }

    if (std::filesystem::exists(path, ec))
    {
        LOG(ERROR) << path << " exists and is not a regular file";
        return invalid_handle;
    }

    if (!create)
    {
        return invalid_handle;
    }

    {
        // Append mode creates the file without truncating one created concurrently
        std::ofstream fs {path, std::ios::out | std::ios::app | std::ios::binary};
        if (!fs)
        {
            LOG(ERROR) << "Cannot create file " << path;
            return invalid_handle;
        }
    }

    return register_path(path);
}

std::unique_ptr<WriteStream> FilesystemStorageBackend::open_write_stream(
    Handle file, bool keep_existing_data)
{
    std::filesystem::path path;
    if (!get_path(file, path))
    {
        LOG(ERROR) << "Invalid file handle " << file;
        return nullptr;
    }

    auto stream = std::make_unique<FilesystemWriteStream>(path, keep_existing_data);
    if (!stream->is_open())
    {
        return nullptr;
    }

    return stream;
}

bool FilesystemStorageBackend::file_size(Handle file, uint64_t &size)
{
    std::filesystem::path path;
    if (!get_path(file, path))
    {
        LOG(ERROR) << "Invalid file handle " << file;
        return false;
    }

    std::error_code ec;
    auto            sz = std::filesystem::file_size(path, ec);
    if (ec)
    {
        LOG(ERROR) << "Cannot get the size of " << path << ": " << ec.message();
        return false;
    }

    size = uint64_t(sz);
    return true;
}

bool FilesystemStorageBackend::read_range(
    Handle file, uint64_t from, uint64_t to, std::vector<uint8_t> &out)
{
    out.clear();

    uint64_t size;
    if (!file_size(file, size))
    {
        return false;
    }

    to = std::min(to, size);
    if (from >= to)
    {
        return true;
    }

    std::filesystem::path path;
    if (!get_path(file, path))
    {
        return false;
    }

    try
    {
        boost::interprocess::file_mapping  mapping {path.c_str(), boost::interprocess::read_only};
        boost::interprocess::mapped_region region {mapping, boost::interprocess::read_only,
            boost::interprocess::offset_t(from), size_t(to - from)};

        const auto *data = static_cast<const uint8_t *>(region.get_address());
        out.assign(data, data + region.get_size());
    }
    catch (const boost::interprocess::interprocess_exception &e)
    {
        LOG(ERROR) << "Exception occured while reading [" << from << ", " << to << ") from "
                   << path << ": " << e.what();
        return false;
    }

    return true;
}

bool FilesystemStorageBackend::list_entries(Handle directory, std::vector<std::string> &names)
{
    names.clear();

    std::filesystem::path path;
    if (!get_path(directory, path))
    {
        LOG(ERROR) << "Invalid directory handle " << directory;
        return false;
    }

    std::error_code ec;
    for (std::filesystem::directory_iterator it {path, ec}, end; !ec && it != end;
         it.increment(ec))
    {
        names.push_back(it->path().filename().string());
    }

    if (ec)
    {
        LOG(ERROR) << "Cannot list directory " << path << ": " << ec.message();
        return false;
    }

    return true;
}

bool FilesystemStorageBackend::remove_entry(
    Handle parent, const std::string &name, bool recursive)
{
    std::filesystem::path path;
    if (!get_child_path(parent, name, path))
    {
        return false;
    }

    std::error_code ec;
    if (!std::filesystem::exists(path, ec))
    {
        LOG(WARNING) << "Cannot remove " << path << ": no such file or directory";
        return false;
    }

    if (recursive)
    {
        std::filesystem::remove_all(path, ec);
    }
    else
    {
        std::filesystem::remove(path, ec);
    }

    // Handles of whatever got removed are stale even if removal stopped halfway
    forget_paths_under(path);

    if (ec)
    {
        LOG(ERROR) << "Cannot remove " << path << ": " << ec.message();
        return false;
    }

    return true;
}

bool FilesystemStorageBackend::get_path(Handle handle, std::filesystem::path &path) const
{
    std::lock_guard lock {mutex_};

    auto it = paths_.find(handle);
    if (it == paths_.end())
    {
        return false;
    }

    path = it->second;
    return true;
}

bool FilesystemStorageBackend::get_child_path(
    Handle parent, const std::string &name, std::filesystem::path &path) const
{
    if (!is_valid_entry_name(name))
    {
        LOG(ERROR) << "Invalid entry name \"" << name << "\"";
        return false;
    }

    std::filesystem::path parent_path;
    if (!get_path(parent, parent_path))
    {
        LOG(ERROR) << "Invalid directory handle " << parent;
        return false;
    }

    path = parent_path / name;
    return true;
}

StorageBackend::Handle FilesystemStorageBackend::register_path(const std::filesystem::path &path)
{
    std::lock_guard lock {mutex_};

    auto it = handles_by_path_.find(path);
    if (it != handles_by_path_.end())
    {
        return it->second;
    }

    Handle handle = next_handle_++;
    paths_.emplace(handle, path);
    handles_by_path_.emplace(path, handle);
    return handle;
}

void FilesystemStorageBackend::forget_paths_under(const std::filesystem::path &path)
{
    std::lock_guard lock {mutex_};

    for (auto it = handles_by_path_.begin(); it != handles_by_path_.end();)
    {
        if (is_same_or_below(path, it->first))
        {
            paths_.erase(it->second);
            it = handles_by_path_.erase(it);
        }
        else
        {
            ++it;
        }
    }
}
}  // namespace chunkstore::storage
