#include "exitcommand.hpp"

#include <iostream>

#include "chunkstore.hpp"

namespace chunkstorecli
{
bool ExitCommand::execute(
    chunkstore::store::ChunkStore &store, std::string &error_message) const
{
    std::cout << "\nClosing store " << store.name() << "...\n";
    auto error = store.close().get();

    if (error != chunkstore::store::ErrorCode::OK &&
        error != chunkstore::store::ErrorCode::ALREADY_CLOSED)
    {
        error_message = std::string {"Close failed: "} + chunkstore::store::to_string(error);
        return false;
    }
    return true;
}

bool ExitCommand::should_terminate_program_after_execution() const
{
    return true;
}
}  // namespace chunkstorecli
