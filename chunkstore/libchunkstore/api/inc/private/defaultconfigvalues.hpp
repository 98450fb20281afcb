#ifndef CHUNKSTORE_API_DEFAULTCONFIGVALUES_HPP_
#define CHUNKSTORE_API_DEFAULTCONFIGVALUES_HPP_

#include "configkeys.hpp"
#include "fallbackconfigvalueprovider.hpp"

namespace chunkstore
{
class DefaultConfigValues : public config::FallbackConfigValueProvider
{
public:
    DefaultConfigValues();
    [[nodiscard]] std::any get(const config::ConfigKey &key) const override;

private:
    const std::any default_values_[config::ConfigKey::KEY_COUNT];
};
}  // namespace chunkstore

#endif  // CHUNKSTORE_API_DEFAULTCONFIGVALUES_HPP_
