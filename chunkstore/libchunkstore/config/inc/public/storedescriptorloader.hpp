#ifndef CHUNKSTORE_CONFIG_STOREDESCRIPTORLOADER_HPP_
#define CHUNKSTORE_CONFIG_STOREDESCRIPTORLOADER_HPP_

#include <string>

#include "storedescriptor.hpp"

namespace chunkstore::config
{
class StoreDescriptorLoader
{
public:
    virtual ~StoreDescriptorLoader() = default;

    [[nodiscard]] virtual bool load(
        StoreDescriptor &descriptor, std::string &error_string) const = 0;
};
}  // namespace chunkstore::config

#endif  // CHUNKSTORE_CONFIG_STOREDESCRIPTORLOADER_HPP_
