#include "chunkstore.hpp"

#include <set>

#include <glog/logging.h>

#include "chunkstoreimpl.hpp"
#include "pathutils.hpp"
#include "rangemapper.hpp"
#include "storagebackend.hpp"
#include "storenamegenerator.hpp"

namespace chunkstore::store
{
namespace
{
bool normalize_files(std::vector<mapping::LogicalFileInfo> &files, std::string &error_string)
{
    std::set<std::string> file_paths;
    std::set<std::string> directory_paths;

    for (auto &file : files)
    {
        std::vector<std::string> components;
        if (!pathutils::split_path(file.path, components, error_string))
        {
            return false;
        }

        file.path = pathutils::join_path(components.cbegin(), components.cend());
        if (!file_paths.insert(file.path).second)
        {
            error_string = "Duplicate file path " + file.path;
            return false;
        }

        for (auto it = components.cbegin() + 1; it != components.cend(); ++it)
        {
            directory_paths.insert(pathutils::join_path(components.cbegin(), it));
        }
    }

    for (const auto &path : file_paths)
    {
        if (directory_paths.count(path) != 0)
        {
            error_string = "File path " + path + " is also the directory of another file";
            return false;
        }
    }

    return true;
}
}  // namespace

std::unique_ptr<ChunkStore> ChunkStore::create(size_t chunk_length, StoreOptions options,
    std::shared_ptr<storage::StorageBackend> backend, std::shared_ptr<utils::Executer> executer,
    std::string &error_string)
{
    if (!backend || !executer)
    {
        error_string = "A store needs a storage backend and an executer";
        LOG(ERROR) << error_string;
        return nullptr;
    }

    if (chunk_length == 0)
    {
        error_string = "Chunk length must be positive";
        LOG(ERROR) << error_string;
        return nullptr;
    }

    if (!pathutils::is_valid_entry_name(options.cache_dir_name))
    {
        error_string = "Invalid cache directory name \"" + options.cache_dir_name + "\"";
        LOG(ERROR) << error_string;
        return nullptr;
    }

    if (options.name.empty())
    {
        static StoreNameGenerator name_generator;
        options.name = name_generator.next_name();
    }
    else if (!pathutils::is_valid_entry_name(options.name) ||
             options.name == options.cache_dir_name)
    {
        error_string = "Invalid store name \"" + options.name + "\"";
        LOG(ERROR) << error_string;
        return nullptr;
    }

    uint64_t          total_length = options.total_length.value_or(0);
    mapping::ChunkMap chunk_map;

    if (!options.files.empty())
    {
        if (!normalize_files(options.files, error_string))
        {
            LOG(ERROR) << "Store " << options.name << ": " << error_string;
            return nullptr;
        }

        mapping::RangeMapper mapper {chunk_length};
        if (!mapper.map(options.files, chunk_map, error_string))
        {
            LOG(ERROR) << "Store " << options.name << ": " << error_string;
            return nullptr;
        }

        uint64_t files_length = mapping::RangeMapper::total_length(options.files);
        if (options.total_length.has_value() && *options.total_length != files_length)
        {
            error_string = "Total length " + std::to_string(*options.total_length) +
                           " differs from the length of the files (" +
                           std::to_string(files_length) + ")";
            LOG(ERROR) << "Store " << options.name << ": " << error_string;
            return nullptr;
        }
        total_length = files_length;
    }

    return std::make_unique<ChunkStoreImpl>(chunk_length, std::move(options.name),
        std::move(options.cache_dir_name), total_length, std::move(options.files),
        std::move(chunk_map), std::move(backend), std::move(executer));
}

bool ChunkStore::purge_cache_directory(
    storage::StorageBackend &backend, const std::string &cache_dir_name)
{
    if (!pathutils::is_valid_entry_name(cache_dir_name))
    {
        LOG(ERROR) << "Invalid cache directory name \"" << cache_dir_name << "\"";
        return false;
    }

    auto root = backend.root_directory();
    if (backend.open_directory(root, cache_dir_name, false) ==
        storage::StorageBackend::invalid_handle)
    {
        return true;
    }

    if (!backend.remove_entry(root, cache_dir_name, true))
    {
        LOG(ERROR) << "Cannot remove the chunk cache directory " << cache_dir_name;
        return false;
    }

    LOG(INFO) << "Stale chunk caches purged";
    return true;
}
}  // namespace chunkstore::store
