#include "cleanupcommand.hpp"

#include "chunkstore.hpp"

namespace chunkstorecli
{
bool CleanupCommand::execute(
    chunkstore::store::ChunkStore &store, std::string &error_message) const
{
    auto error = store.cleanup().get();
    if (error != chunkstore::store::ErrorCode::OK)
    {
        error_message = std::string {"Cleanup failed: "} + chunkstore::store::to_string(error);
        return false;
    }
    return true;
}

bool CleanupCommand::should_terminate_program_after_execution() const
{
    return false;
}
}  // namespace chunkstorecli
