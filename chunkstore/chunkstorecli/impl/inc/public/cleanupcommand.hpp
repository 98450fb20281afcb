#ifndef CHUNKSTORECLI_CLEANUPCOMMAND_HPP_
#define CHUNKSTORECLI_CLEANUPCOMMAND_HPP_

#include "executablecommand.hpp"

namespace chunkstorecli
{
class CleanupCommand : public ExecutableCommand
{
public:
    [[nodiscard]] bool execute(
        chunkstore::store::ChunkStore &store, std::string &error_message) const override;
    [[nodiscard]] bool should_terminate_program_after_execution() const override;
};
}  // namespace chunkstorecli

#endif  // CHUNKSTORECLI_CLEANUPCOMMAND_HPP_
