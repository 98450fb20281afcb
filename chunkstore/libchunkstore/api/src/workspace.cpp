#include "workspace.hpp"

#include "workspaceimpl.hpp"

namespace chunkstore
{
Workspace::Workspace(const std::string &app_data_dir_path, const std::string &config_file_name)
    : impl_ {std::make_unique<WorkspaceImpl>(app_data_dir_path, config_file_name)}
{}

Workspace::Workspace(Workspace &&other) noexcept
    : impl_ {std::move(other.impl_)}
{}

Workspace &Workspace::operator=(Workspace &&rhs) noexcept
{
    impl_ = std::move(rhs.impl_);
    return *this;
}

Workspace::~Workspace() = default;

bool Workspace::start()
{
    return impl_->start();
}

bool Workspace::stop()
{
    return impl_->stop();
}

std::unique_ptr<store::ChunkStore> Workspace::open_store(
    const config::StoreDescriptor &descriptor, std::string &error_string)
{
    return impl_->open_store(descriptor, error_string);
}

std::unique_ptr<store::ChunkStore> Workspace::open_store(
    const std::string &descriptor_file_path, std::string &error_string)
{
    return impl_->open_store(descriptor_file_path, error_string);
}

bool Workspace::purge_stale_caches()
{
    return impl_->purge_stale_caches();
}
}  // namespace chunkstore
