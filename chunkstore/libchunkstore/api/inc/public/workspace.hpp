#ifndef CHUNKSTORE_API_WORKSPACE_HPP_
#define CHUNKSTORE_API_WORKSPACE_HPP_

#include <memory>
#include <string>

#include "chunkstore/commondefs.h"

#include "chunkstore.hpp"
#include "storedescriptor.hpp"

namespace chunkstore
{
// Forward declarations
class WorkspaceImpl;

/*
 * Entry point of the library. Owns the configuration read from <app_data_dir>/<config_file_name>,
 * the worker threads and the storage backend that stores are opened on.
 */
class CHUNKSTORE_API Workspace
{
public:
    Workspace(const std::string &app_data_dir_path, const std::string &config_file_name);
    Workspace(Workspace &&other) noexcept;
    Workspace &operator=(Workspace &&rhs) noexcept;
    ~Workspace();

    bool start();
    bool stop();

    std::unique_ptr<store::ChunkStore> open_store(
        const config::StoreDescriptor &descriptor, std::string &error_string);
    std::unique_ptr<store::ChunkStore> open_store(
        const std::string &descriptor_file_path, std::string &error_string);

    // Removes the chunk caches of every store; must not run while stores with files are open
    bool purge_stale_caches();

private:
    std::unique_ptr<WorkspaceImpl> impl_;
};
}  // namespace chunkstore

#endif  // CHUNKSTORE_API_WORKSPACE_HPP_
