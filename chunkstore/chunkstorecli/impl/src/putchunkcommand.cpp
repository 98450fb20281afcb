#include "putchunkcommand.hpp"

#include <fstream>
#include <iterator>
#include <vector>

#include "chunkstore.hpp"

namespace chunkstorecli
{
PutChunkCommand::PutChunkCommand(uint64_t chunk_index, std::string source_file)
    : chunk_index_ {chunk_index}
    , source_file_ {std::move(source_file)}
{}

bool PutChunkCommand::execute(
    chunkstore::store::ChunkStore &store, std::string &error_message) const
{
    std::ifstream fs {source_file_, std::ios::binary};
    if (!fs)
    {
        error_message = "Cannot open " + source_file_ + " for reading";
        return false;
    }

    std::vector<uint8_t> data(
        (std::istreambuf_iterator<char>(fs)), std::istreambuf_iterator<char>());
    if (fs.bad())
    {
        error_message = "Cannot read " + source_file_;
        return false;
    }

    auto error = store.put(chunk_index_, std::move(data)).get();
    if (error != chunkstore::store::ErrorCode::OK)
    {
        error_message = std::string {"Cannot put chunk: "} + chunkstore::store::to_string(error);
        return false;
    }

    return true;
}

bool PutChunkCommand::should_terminate_program_after_execution() const
{
    return false;
}
}  // namespace chunkstorecli
