#include "destroycommand.hpp"

#include <iostream>

#include "chunkstore.hpp"

namespace chunkstorecli
{
bool DestroyCommand::execute(
    chunkstore::store::ChunkStore &store, std::string &error_message) const
{
    std::cout << "\nDestroying store " << store.name() << "...\n";
    auto error = store.destroy().get();
    if (error != chunkstore::store::ErrorCode::OK)
    {
        error_message = std::string {"Destroy failed: "} + chunkstore::store::to_string(error);
        return false;
    }
    return true;
}

bool DestroyCommand::should_terminate_program_after_execution() const
{
    return true;
}
}  // namespace chunkstorecli
