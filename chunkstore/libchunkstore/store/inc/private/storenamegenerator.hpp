#ifndef CHUNKSTORE_STORE_STORENAMEGENERATOR_HPP_
#define CHUNKSTORE_STORE_STORENAMEGENERATOR_HPP_

#include <string>

#include "random.hpp"

namespace chunkstore::store
{
// Makes names of the form store.<UTC timestamp>.<random suffix>
class StoreNameGenerator
{
public:
    [[nodiscard]] std::string next_name();

private:
    utils::Random rng_;
};
}  // namespace chunkstore::store

#endif  // CHUNKSTORE_STORE_STORENAMEGENERATOR_HPP_
