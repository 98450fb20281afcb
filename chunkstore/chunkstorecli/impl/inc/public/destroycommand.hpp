#ifndef CHUNKSTORECLI_DESTROYCOMMAND_HPP_
#define CHUNKSTORECLI_DESTROYCOMMAND_HPP_

#include "executablecommand.hpp"

namespace chunkstorecli
{
// Deletes the store with all of its data and ends the session
class DestroyCommand : public ExecutableCommand
{
public:
    [[nodiscard]] bool execute(
        chunkstore::store::ChunkStore &store, std::string &error_message) const override;
    [[nodiscard]] bool should_terminate_program_after_execution() const override;
};
}  // namespace chunkstorecli

#endif  // CHUNKSTORECLI_DESTROYCOMMAND_HPP_
