#ifndef CHUNKSTORE_CONFIG_FALLBACKCONFIGVALUEPROVIDER_HPP_
#define CHUNKSTORE_CONFIG_FALLBACKCONFIGVALUEPROVIDER_HPP_

#include <any>

namespace chunkstore::config
{
// Forward declarations
class ConfigKey;

class FallbackConfigValueProvider
{
public:
    virtual ~FallbackConfigValueProvider() = default;

    [[nodiscard]] virtual std::any get(const ConfigKey &key) const = 0;
};
}  // namespace chunkstore::config

#endif  // CHUNKSTORE_CONFIG_FALLBACKCONFIGVALUEPROVIDER_HPP_
