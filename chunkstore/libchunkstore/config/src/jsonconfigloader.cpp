#include "jsonconfigloader.hpp"

#include <fstream>

#include <glog/logging.h>

namespace chunkstore::config
{
JSONConfigLoader::JSONConfigLoader(std::string config_file_path)
    : config_file_path_ {std::move(config_file_path)}
{}

std::map<std::string, std::any> JSONConfigLoader::load() const
{
    std::map<std::string, std::any> values;

    std::ifstream fs {config_file_path_};
    if (!fs.good())
    {
        LOG(ERROR) << "Cannot open " << config_file_path_
                   << " for reading, configuration loading failed.";
        return values;
    }

    auto json_root = nlohmann::json::parse(fs, nullptr, false);
    if (json_root.is_discarded() || !json_root.is_object())
    {
        LOG(ERROR) << config_file_path_ << " is not a JSON object, configuration loading failed.";
        return values;
    }

    walk_json(json_root, values);

    return values;
}

void JSONConfigLoader::walk_json(
    const nlohmann::json &json_root, std::map<std::string, std::any> &out) const
{
    using value_t = nlohmann::json::value_t;

    for (const auto &[k, v] : json_root.items())
    {
        switch (v.type())
        {
            case value_t::string: out.emplace(k, v.get<std::string>()); break;
            case value_t::number_integer:
            case value_t::number_unsigned: out.emplace(k, v.get<long long>()); break;
            case value_t::number_float: out.emplace(k, v.get<double>()); break;
            case value_t::boolean: out.emplace(k, v.get<bool>()); break;
            case value_t::object: walk_json(v, out); break;
            default:
                LOG(WARNING) << "Invalid field type for configuration JSON (key = " << k << ")";
                break;
        }
    }
}
}  // namespace chunkstore::config
