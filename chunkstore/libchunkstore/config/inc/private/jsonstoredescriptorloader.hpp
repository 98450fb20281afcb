#ifndef CHUNKSTORE_CONFIG_JSONSTOREDESCRIPTORLOADER_HPP_
#define CHUNKSTORE_CONFIG_JSONSTOREDESCRIPTORLOADER_HPP_

#include <string>

#include <nlohmann/json.hpp>

#include "storedescriptorloader.hpp"

namespace chunkstore::config
{
/*
 * Reads a descriptor of the form
 *
 * {
 *     "chunk_length": 16384,
 *     "name": "dataset",
 *     "total_length": 18,
 *     "files": [
 *         {"path": "a/first.bin", "length": 10},
 *         {"path": "second.bin", "length": 8, "offset": 10}
 *     ]
 * }
 *
 * where only chunk_length is required.
 */
class JSONStoreDescriptorLoader : public StoreDescriptorLoader
{
public:
    explicit JSONStoreDescriptorLoader(std::string descriptor_file_path);
    [[nodiscard]] bool load(StoreDescriptor &descriptor, std::string &error_string) const override;

private:
    bool parse_file_entry(const nlohmann::json &entry, mapping::LogicalFileInfo &file,
        std::string &error_string) const;

    const std::string descriptor_file_path_;
};
}  // namespace chunkstore::config

#endif  // CHUNKSTORE_CONFIG_JSONSTOREDESCRIPTORLOADER_HPP_
