#ifndef CHUNKSTORE_CONFIG_CONFIGLOADER_HPP_
#define CHUNKSTORE_CONFIG_CONFIGLOADER_HPP_

#include <any>
#include <map>
#include <string>

namespace chunkstore::config
{
class ConfigLoader
{
public:
    virtual ~ConfigLoader() = default;

    // Values are std::string, long long, double or bool
    [[nodiscard]] virtual std::map<std::string, std::any> load() const = 0;
};
}  // namespace chunkstore::config

#endif  // CHUNKSTORE_CONFIG_CONFIGLOADER_HPP_
