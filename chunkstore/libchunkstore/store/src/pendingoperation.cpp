#include "pendingoperation.hpp"

#include <glog/logging.h>

namespace chunkstore::store
{
PendingOperation::PendingOperation(size_t part_count, CompletionHandler completion_handler)
    : parts_left_ {part_count}
    , result_ {ErrorCode::OK}
    , completion_handler_ {std::move(completion_handler)}
{}

void PendingOperation::complete_part(ErrorCode error)
{
    CompletionHandler handler;

    {
        std::lock_guard lock {mutex_};

        if (parts_left_ == 0)
        {
            LOG(FATAL) << "More parts completed than were started";
        }

        if (result_ == ErrorCode::OK)
        {
            result_ = error;
        }

        if (--parts_left_ != 0)
        {
            return;
        }
        handler = std::move(completion_handler_);
    }

    handler(result_);
}
}  // namespace chunkstore::store
