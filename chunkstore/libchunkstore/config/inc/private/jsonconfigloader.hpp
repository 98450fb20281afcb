#ifndef CHUNKSTORE_CONFIG_JSONCONFIGLOADER_HPP_
#define CHUNKSTORE_CONFIG_JSONCONFIGLOADER_HPP_

#include <string>

#include <nlohmann/json.hpp>

#include "configloader.hpp"

namespace chunkstore::config
{
// Nested objects are flattened, their keys share one namespace with the top level ones
class JSONConfigLoader : public ConfigLoader
{
public:
    explicit JSONConfigLoader(std::string config_file_path);
    [[nodiscard]] std::map<std::string, std::any> load() const override;

private:
    void walk_json(const nlohmann::json &json_root, std::map<std::string, std::any> &out) const;

    const std::string config_file_path_;
};
}  // namespace chunkstore::config

#endif  // CHUNKSTORE_CONFIG_JSONCONFIGLOADER_HPP_
