#include "random.hpp"

namespace chunkstore::utils
{
Random::Random()
    : prng_ {std::random_device {}()}
{}
}  // namespace chunkstore::utils
