#ifndef CHUNKSTORE_UTILS_MAINEXECUTER_HPP_
#define CHUNKSTORE_UTILS_MAINEXECUTER_HPP_

#include "executer.hpp"

namespace chunkstore::utils
{
// Runs every job inline, on the thread that adds it
class MainExecuter : public Executer
{
public:
    void add_job(Job &&job) override;
    void process_all_jobs() override;
};
}  // namespace chunkstore::utils

#endif  // CHUNKSTORE_UTILS_MAINEXECUTER_HPP_
