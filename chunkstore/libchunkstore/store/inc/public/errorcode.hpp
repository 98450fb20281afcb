#ifndef CHUNKSTORE_STORE_ERRORCODE_HPP_
#define CHUNKSTORE_STORE_ERRORCODE_HPP_

namespace chunkstore::store
{
enum class ErrorCode
{
    OK,
    INVALID_CONFIGURATION,
    CHUNK_LENGTH_MISMATCH,
    RANGE_OUT_OF_BOUNDS,
    NO_MATCHING_FILES,
    NOT_FOUND,
    STORE_CLOSED,
    ALREADY_CLOSED,
    IO_ERROR
};

constexpr const char *to_string(ErrorCode error)
{
    switch (error)
    {
        case ErrorCode::OK: return "OK";
        case ErrorCode::INVALID_CONFIGURATION: return "INVALID_CONFIGURATION";
        case ErrorCode::CHUNK_LENGTH_MISMATCH: return "CHUNK_LENGTH_MISMATCH";
        case ErrorCode::RANGE_OUT_OF_BOUNDS: return "RANGE_OUT_OF_BOUNDS";
        case ErrorCode::NO_MATCHING_FILES: return "NO_MATCHING_FILES";
        case ErrorCode::NOT_FOUND: return "NOT_FOUND";
        case ErrorCode::STORE_CLOSED: return "STORE_CLOSED";
        case ErrorCode::ALREADY_CLOSED: return "ALREADY_CLOSED";
        case ErrorCode::IO_ERROR: return "IO_ERROR";
        default: return "INVALID_ERROR_CODE";
    }
}
}  // namespace chunkstore::store

#endif  // CHUNKSTORE_STORE_ERRORCODE_HPP_
