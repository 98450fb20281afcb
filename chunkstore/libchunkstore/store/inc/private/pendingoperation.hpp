#ifndef CHUNKSTORE_STORE_PENDINGOPERATION_HPP_
#define CHUNKSTORE_STORE_PENDINGOPERATION_HPP_

#include <cstddef>
#include <functional>
#include <mutex>

#include "errorcode.hpp"

namespace chunkstore::store
{
/*
 * Joins a fixed number of concurrently running parts of one operation. The completion handler is
 * called once, by whichever part finishes last, with the first error reported by any part.
 */
class PendingOperation
{
public:
    using CompletionHandler = std::function<void(ErrorCode)>;

    PendingOperation(size_t part_count, CompletionHandler completion_handler);
    PendingOperation(const PendingOperation &) = delete;
    PendingOperation &operator=(const PendingOperation &) = delete;

    void complete_part(ErrorCode error);

private:
    size_t            parts_left_;
    ErrorCode         result_;
    CompletionHandler completion_handler_;
    std::mutex        mutex_;
};
}  // namespace chunkstore::store

#endif  // CHUNKSTORE_STORE_PENDINGOPERATION_HPP_
