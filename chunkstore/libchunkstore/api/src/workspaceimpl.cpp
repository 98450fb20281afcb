#include "workspaceimpl.hpp"

#include <filesystem>
#include <sstream>
#include <utility>

#include <glog/logging.h>

#include "defaultconfigvalues.hpp"
#include "filesystemstoragebackend.hpp"
#include "jsonconfigloader.hpp"
#include "jsonstoredescriptorloader.hpp"
#include "threadpool.hpp"

namespace
{
std::string path_join(const std::string &directory, const std::string &file_name)
{
    return (std::filesystem::path {directory} / file_name).string();
}
}  // namespace

namespace chunkstore
{
WorkspaceImpl::WorkspaceImpl(std::string app_data_dir_path, const std::string &config_file_name)
    : state_ {State::IDLE}
    , app_data_dir_path_ {std::move(app_data_dir_path)}
    , cfg_ {config::JSONConfigLoader {path_join(app_data_dir_path_, config_file_name)},
          std::make_unique<DefaultConfigValues>()}
{}

WorkspaceImpl::~WorkspaceImpl()
{
    bool running;
    {
        std::lock_guard lock {mutex_};
        running = state_ == State::RUNNING;
    }

    if (running)
    {
        stop();
    }
}

bool WorkspaceImpl::start()
{
    std::lock_guard lock {mutex_};

    if (state_ != State::IDLE)
    {
        LOG(WARNING) << "Cannot start workspace from state " << to_string(state_);
        return false;
    }

    // A relative storage root lives in the app data directory, an absolute one replaces it
    auto storage_root =
        path_join(app_data_dir_path_, cfg_.get_string(config::ConfigKey::STORAGE_ROOT_DIR));
    auto backend = std::make_shared<storage::FilesystemStorageBackend>(storage_root);
    if (!backend->is_valid())
    {
        LOG(ERROR) << "Cannot open storage root " << storage_root;
        return false;
    }

    auto thread_count = cfg_.get_integer(config::ConfigKey::WORKER_THREAD_COUNT);
    if (thread_count < 0)
    {
        LOG(WARNING) << "Invalid worker thread count " << thread_count
                     << ", using one thread per hardware thread";
        thread_count = 0;
    }

    thread_pool_ = std::make_shared<utils::ThreadPool>(
        thread_count != 0 ? size_t(thread_count) : utils::ThreadPool::default_thread_count());
    backend_ = std::move(backend);

    if (cfg_.get_bool(config::ConfigKey::PURGE_STALE_CACHES_ON_START) &&
        !store::ChunkStore::purge_cache_directory(
            *backend_, cfg_.get_string(config::ConfigKey::CACHE_DIR_NAME)))
    {
        LOG(WARNING) << "Stale chunk caches could not be purged";
    }

    state_ = State::RUNNING;
    LOG(INFO) << "Workspace started; storage root = " << storage_root
              << "; worker threads = " << thread_pool_->thread_count();
    return true;
}

bool WorkspaceImpl::stop()
{
    std::lock_guard lock {mutex_};

    if (state_ != State::RUNNING)
    {
        LOG(WARNING) << "Cannot stop workspace from state " << to_string(state_);
        return false;
    }

    // Stores still open keep their own references to both
    backend_.reset();
    thread_pool_.reset();

    state_ = State::IDLE;
    LOG(INFO) << "Workspace stopped";
    return true;
}

std::unique_ptr<store::ChunkStore> WorkspaceImpl::open_store(
    const config::StoreDescriptor &descriptor, std::string &error_string)
{
    std::lock_guard lock {mutex_};

    if (state_ != State::RUNNING)
    {
        std::ostringstream ss;
        ss << "Cannot open a store from state " << to_string(state_);
        error_string = ss.str();
        return nullptr;
    }

    store::StoreOptions options;
    options.name           = descriptor.name;
    options.total_length   = descriptor.total_length;
    options.files          = descriptor.files;
    options.cache_dir_name = cfg_.get_string(config::ConfigKey::CACHE_DIR_NAME);

    return store::ChunkStore::create(
        size_t(descriptor.chunk_length), std::move(options), backend_, thread_pool_, error_string);
}

std::unique_ptr<store::ChunkStore> WorkspaceImpl::open_store(
    const std::string &descriptor_file_path, std::string &error_string)
{
    config::StoreDescriptor descriptor;
    if (!config::JSONStoreDescriptorLoader {descriptor_file_path}.load(descriptor, error_string))
    {
        return nullptr;
    }
    return open_store(descriptor, error_string);
}

bool WorkspaceImpl::purge_stale_caches()
{
    std::lock_guard lock {mutex_};

    if (state_ != State::RUNNING)
    {
        LOG(WARNING) << "Cannot purge caches from state " << to_string(state_);
        return false;
    }

    return store::ChunkStore::purge_cache_directory(
        *backend_, cfg_.get_string(config::ConfigKey::CACHE_DIR_NAME));
}
}  // namespace chunkstore
