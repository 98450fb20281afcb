#include "getchunkcommand.hpp"

#include <fstream>
#include <iostream>

#include "chunkstore.hpp"

namespace chunkstorecli
{
GetChunkCommand::GetChunkCommand(uint64_t chunk_index, std::string dest_file,
    std::optional<size_t> offset, std::optional<size_t> length)
    : chunk_index_ {chunk_index}
    , dest_file_ {std::move(dest_file)}
    , offset_ {offset}
    , length_ {length}
{}

bool GetChunkCommand::execute(
    chunkstore::store::ChunkStore &store, std::string &error_message) const
{
    auto result = store.get(chunk_index_, {offset_, length_}).get();
    if (result.error != chunkstore::store::ErrorCode::OK)
    {
        error_message =
            std::string {"Cannot get chunk: "} + chunkstore::store::to_string(result.error);
        return false;
    }

    std::ofstream fs {dest_file_, std::ios::binary | std::ios::trunc};
    if (!fs)
    {
        error_message = "Cannot open " + dest_file_ + " for writing";
        return false;
    }

    fs.write(
        reinterpret_cast<const char *>(result.data.data()), std::streamsize(result.data.size()));
    if (!fs)
    {
        error_message = "Cannot write " + dest_file_;
        return false;
    }

    std::cout << result.data.size() << " bytes written to " << dest_file_ << '\n';
    return true;
}

bool GetChunkCommand::should_terminate_program_after_execution() const
{
    return false;
}
}  // namespace chunkstorecli
