#ifndef CHUNKSTORE_CONFIG_CONFIG_HPP_
#define CHUNKSTORE_CONFIG_CONFIG_HPP_

#include <any>
#include <array>
#include <memory>
#include <string>
#include <typeinfo>

#include <glog/logging.h>

#include "configkeys.hpp"
#include "fallbackconfigvalueprovider.hpp"

namespace chunkstore::config
{
class ConfigLoader;

/*
 * Values come from the loader; a key that is missing or holds a value of the wrong type is looked
 * up in the fallback provider instead. Missing fallbacks are fatal.
 */
class Config
{
public:
    explicit Config(const ConfigLoader &             config_loader,
        std::unique_ptr<FallbackConfigValueProvider> fallback_value_provider = nullptr);

    [[nodiscard]] std::string get_string(ConfigKey key) const
    {
        return get<std::string>(key);
    }

    [[nodiscard]] long long get_integer(ConfigKey key) const
    {
        return get<long long>(key);
    }

    [[nodiscard]] bool get_bool(ConfigKey key) const
    {
        return get<bool>(key);
    }

private:
    template<typename T>
    [[nodiscard]] T get(ConfigKey key) const
    {
        if (key < 0 || key >= ConfigKey::KEY_COUNT)
        {
            LOG(FATAL) << "Invalid key " << key;
        }

        const auto &val = values_[key];
        if (!val.has_value())
        {
            LOG(WARNING) << "No config value with key " << key.to_string()
                         << ", using the default";
            return get_fallback_value<T>(key);
        }

        if (const T *typed_val = std::any_cast<T>(&val))
        {
            return *typed_val;
        }

        LOG(ERROR) << "Config value " << key.to_string() << " has type " << val.type().name()
                   << ", expected " << typeid(T).name() << "; using the default";
        return get_fallback_value<T>(key);
    }

    template<typename T>
    [[nodiscard]] T get_fallback_value(ConfigKey key) const
    {
        if (!fallback_value_provider_)
        {
            LOG(FATAL) << "Fallback config value provider is missing, cannot continue execution...";
        }

        std::any val = fallback_value_provider_->get(key);
        if (!val.has_value())
        {
            LOG(FATAL) << "No fallback config value with key " << key.to_string();
        }

        const T *typed_val = std::any_cast<T>(&val);
        if (!typed_val)
        {
            LOG(FATAL) << "Fallback config value " << key.to_string() << " has type "
                       << val.type().name() << ", expected " << typeid(T).name();
        }

        return *typed_val;
    }

    std::array<std::any, ConfigKey::KEY_COUNT> values_;

    // Shared so that a Config object stays copyable
    const std::shared_ptr<FallbackConfigValueProvider> fallback_value_provider_;
};
}  // namespace chunkstore::config

#endif  // CHUNKSTORE_CONFIG_CONFIG_HPP_
