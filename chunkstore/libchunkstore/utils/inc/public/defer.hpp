#ifndef CHUNKSTORE_UTILS_DEFER_HPP_
#define CHUNKSTORE_UTILS_DEFER_HPP_

#include <functional>

namespace chunkstore::utils
{
// Calls the given function when going out of scope
class Defer
{
    using Call = std::function<void()>;

public:
    explicit Defer(Call call)
        : call_ {std::move(call)}
    {}

    Defer(const Defer &) = delete;
    Defer &operator=(const Defer &) = delete;

    ~Defer()
    {
        if (call_)
        {
            call_();
        }
    }

private:
    Call call_;
};
}  // namespace chunkstore::utils

#ifdef __COUNTER__
#define CHUNKSTORE_DEFER_NEW_ID __COUNTER__
#else
#define CHUNKSTORE_DEFER_NEW_ID __LINE__
#endif

#define CHUNKSTORE_DEFER_CONCAT_TOKENS(t1, t2) t1##t2
#define CHUNKSTORE_DEFER_OBJ_NAME(base, id)    CHUNKSTORE_DEFER_CONCAT_TOKENS(base, id)
#define DEFER(...)                                                                 \
    ::chunkstore::utils::Defer CHUNKSTORE_DEFER_OBJ_NAME(_defer_obj_, CHUNKSTORE_DEFER_NEW_ID)( \
        [&] { __VA_ARGS__; })

#endif  // CHUNKSTORE_UTILS_DEFER_HPP_
