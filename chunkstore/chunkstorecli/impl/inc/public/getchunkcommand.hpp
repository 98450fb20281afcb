#ifndef CHUNKSTORECLI_GETCHUNKCOMMAND_HPP_
#define CHUNKSTORECLI_GETCHUNKCOMMAND_HPP_

#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>

#include "executablecommand.hpp"

namespace chunkstorecli
{
// Writes a chunk, or a byte range of it, to a local file
class GetChunkCommand : public ExecutableCommand
{
public:
    GetChunkCommand(uint64_t chunk_index, std::string dest_file, std::optional<size_t> offset,
        std::optional<size_t> length);
    [[nodiscard]] bool execute(
        chunkstore::store::ChunkStore &store, std::string &error_message) const override;
    [[nodiscard]] bool should_terminate_program_after_execution() const override;

private:
    uint64_t              chunk_index_;
    std::string           dest_file_;
    std::optional<size_t> offset_;
    std::optional<size_t> length_;
};
}  // namespace chunkstorecli

#endif  // CHUNKSTORECLI_GETCHUNKCOMMAND_HPP_
