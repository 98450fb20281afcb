#include "config.hpp"

#include "configloader.hpp"

namespace chunkstore::config
{
Config::Config(const ConfigLoader &              config_loader,
    std::unique_ptr<FallbackConfigValueProvider> fallback_value_provider)
    : fallback_value_provider_ {std::move(fallback_value_provider)}
{
    auto loaded_configuration = config_loader.load();
    for (int k = ConfigKey::FIRST_KEY; k != ConfigKey::KEY_COUNT; ++k)
    {
        auto it = loaded_configuration.find(ConfigKey {ConfigKey::EnumType(k)}.to_string());
        if (it != loaded_configuration.end())
        {
            values_[k] = std::move(it->second);
        }
    }
}
}  // namespace chunkstore::config
