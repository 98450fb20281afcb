#include "mainexecuter.hpp"

namespace chunkstore::utils
{
void MainExecuter::add_job(Job &&job)
{
    Job local_job {std::move(job)};
    local_job();
}

void MainExecuter::process_all_jobs()
{
}
}  // namespace chunkstore::utils
