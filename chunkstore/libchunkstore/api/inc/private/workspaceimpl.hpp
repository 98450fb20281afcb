#ifndef CHUNKSTORE_API_WORKSPACEIMPL_HPP_
#define CHUNKSTORE_API_WORKSPACEIMPL_HPP_

#include <memory>
#include <mutex>
#include <string>

#include "chunkstore.hpp"
#include "config.hpp"
#include "storedescriptor.hpp"

namespace chunkstore
{
namespace utils
{
// Forward declarations
class ThreadPool;
}  // namespace utils

namespace storage
{
// Forward declarations
class FilesystemStorageBackend;
}  // namespace storage

class WorkspaceImpl
{
public:
    WorkspaceImpl(std::string app_data_dir_path, const std::string &config_file_name);
    ~WorkspaceImpl();

    bool start();
    bool stop();

    std::unique_ptr<store::ChunkStore> open_store(
        const config::StoreDescriptor &descriptor, std::string &error_string);
    std::unique_ptr<store::ChunkStore> open_store(
        const std::string &descriptor_file_path, std::string &error_string);

    bool purge_stale_caches();

private:
    enum class State
    {
        IDLE,
        RUNNING
    };

    constexpr static const char *to_string(State state)
    {
        switch (state)
        {
            case State::IDLE: return "IDLE";
            case State::RUNNING: return "RUNNING";
            default: return "INVALID_STATE";
        }
    }

    State                                              state_;
    const std::string                                  app_data_dir_path_;
    const config::Config                               cfg_;
    std::shared_ptr<utils::ThreadPool>                 thread_pool_;
    std::shared_ptr<storage::FilesystemStorageBackend> backend_;
    mutable std::mutex                                 mutex_;
};
}  // namespace chunkstore

#endif  // CHUNKSTORE_API_WORKSPACEIMPL_HPP_
