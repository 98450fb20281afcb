#ifndef CHUNKSTORE_UTILS_EXECUTER_HPP_
#define CHUNKSTORE_UTILS_EXECUTER_HPP_

#include <functional>

namespace chunkstore::utils
{
class Executer
{
public:
    using Job = std::function<void()>;

    virtual ~Executer()             = default;
    virtual void add_job(Job &&job) = 0;
    virtual void process_all_jobs() = 0;
};
}  // namespace chunkstore::utils

#endif  // CHUNKSTORE_UTILS_EXECUTER_HPP_
