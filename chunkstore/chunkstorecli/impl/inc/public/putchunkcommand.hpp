#ifndef CHUNKSTORECLI_PUTCHUNKCOMMAND_HPP_
#define CHUNKSTORECLI_PUTCHUNKCOMMAND_HPP_

#include <cstdint>
#include <string>

#include "executablecommand.hpp"

namespace chunkstorecli
{
// Stores the whole content of a local file as one chunk
class PutChunkCommand : public ExecutableCommand
{
public:
    PutChunkCommand(uint64_t chunk_index, std::string source_file);
    [[nodiscard]] bool execute(
        chunkstore::store::ChunkStore &store, std::string &error_message) const override;
    [[nodiscard]] bool should_terminate_program_after_execution() const override;

private:
    uint64_t    chunk_index_;
    std::string source_file_;
};
}  // namespace chunkstorecli

#endif  // CHUNKSTORECLI_PUTCHUNKCOMMAND_HPP_
