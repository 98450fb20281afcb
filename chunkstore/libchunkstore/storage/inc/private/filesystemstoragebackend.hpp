#ifndef CHUNKSTORE_STORAGE_FILESYSTEMSTORAGEBACKEND_HPP_
#define CHUNKSTORE_STORAGE_FILESYSTEMSTORAGEBACKEND_HPP_

#include <filesystem>
#include <map>
#include <mutex>
#include <string>

#include "storagebackend.hpp"

namespace chunkstore::storage
{
class FilesystemStorageBackend : public StorageBackend
{
public:
    explicit FilesystemStorageBackend(const std::string &root_path);

    [[nodiscard]] bool   is_valid() const;
    [[nodiscard]] Handle root_directory() const override;
    [[nodiscard]] Handle open_directory(
        Handle parent, const std::string &name, bool create) override;
    [[nodiscard]] Handle open_file(Handle parent, const std::string &name, bool create) override;
    [[nodiscard]] std::unique_ptr<WriteStream> open_write_stream(
        Handle file, bool keep_existing_data) override;
    bool file_size(Handle file, uint64_t &size) override;
    bool read_range(Handle file, uint64_t from, uint64_t to, std::vector<uint8_t> &out) override;
    bool list_entries(Handle directory, std::vector<std::string> &names) override;
    bool remove_entry(Handle parent, const std::string &name, bool recursive) override;

private:
    [[nodiscard]] bool get_path(Handle handle, std::filesystem::path &path) const;
    [[nodiscard]] bool get_child_path(
        Handle parent, const std::string &name, std::filesystem::path &path) const;
    Handle             register_path(const std::filesystem::path &path);
    void               forget_paths_under(const std::filesystem::path &path);

    std::filesystem::path                   root_path_;
    Handle                                  root_handle_;
    Handle                                  next_handle_;
    std::map<Handle, std::filesystem::path> paths_;
    std::map<std::filesystem::path, Handle> handles_by_path_;
    mutable std::mutex                      mutex_;
};
}  // namespace chunkstore::storage

#endif  // CHUNKSTORE_STORAGE_FILESYSTEMSTORAGEBACKEND_HPP_
