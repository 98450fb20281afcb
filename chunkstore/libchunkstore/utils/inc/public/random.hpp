#ifndef CHUNKSTORE_UTILS_RANDOM_HPP_
#define CHUNKSTORE_UTILS_RANDOM_HPP_

#include <algorithm>
#include <cstdint>
#include <limits>
#include <mutex>
#include <random>
#include <type_traits>

namespace chunkstore::utils
{
class Random
{
public:
    Random();

    template<typename Int = int>
    auto next(Int max = std::numeric_limits<Int>::max())
        -> std::enable_if_t<std::is_integral_v<Int>, Int>
    {
        return next<Int>(0, max);
    }

    template<typename Int = int>
    auto next(Int min, Int max) -> std::enable_if_t<std::is_integral_v<Int>, Int>
    {
        // uniform_int_distribution is undefined for char-sized types
        using Wide = std::conditional_t<std::is_signed_v<Int>, long long, unsigned long long>;
        std::uniform_int_distribution<Wide> d {Wide(min), Wide(max)};
        std::lock_guard                     lock {mutex_};
        return Int(d(prng_));
    }

    template<typename OutputIt>
    void fill_bytes(OutputIt begin, OutputIt end)
    {
        std::generate(begin, end, [this] { return next<uint8_t>(); });
    }

private:
    std::mt19937_64 prng_;
    std::mutex      mutex_;
};
}  // namespace chunkstore::utils

#endif  // CHUNKSTORE_UTILS_RANDOM_HPP_
