#ifndef CHUNKSTORECLI_EXECUTABLECOMMAND_HPP_
#define CHUNKSTORECLI_EXECUTABLECOMMAND_HPP_

#include <string>

namespace chunkstore::store
{
// Forward declarations
class ChunkStore;
}  // namespace chunkstore::store

namespace chunkstorecli
{
class ExecutableCommand
{
public:
    virtual ~ExecutableCommand() = default;

    [[nodiscard]] virtual bool execute(
        chunkstore::store::ChunkStore &store, std::string &error_message) const = 0;
    [[nodiscard]] virtual bool should_terminate_program_after_execution() const = 0;
};
}  // namespace chunkstorecli

#endif  // CHUNKSTORECLI_EXECUTABLECOMMAND_HPP_
