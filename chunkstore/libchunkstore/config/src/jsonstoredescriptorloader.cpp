#include "jsonstoredescriptorloader.hpp"

#include <fstream>

#include <glog/logging.h>

#include "defer.hpp"

namespace chunkstore::config
{
namespace
{
constexpr char const *json_chunk_length_entry_name = "chunk_length";
constexpr char const *json_name_entry_name         = "name";
constexpr char const *json_total_length_entry_name = "total_length";
constexpr char const *json_files_entry_name        = "files";
constexpr char const *json_path_entry_name         = "path";
constexpr char const *json_length_entry_name       = "length";
constexpr char const *json_offset_entry_name       = "offset";

bool read_unsigned(const nlohmann::json &object, const char *key, std::optional<uint64_t> &out,
    std::string &error_string)
{
    auto it = object.find(key);
    if (it == object.end() || it->is_null())
    {
        out.reset();
        return true;
    }

    if (!it->is_number_unsigned())
    {
        error_string = std::string {"Field "} + key + " must be a non-negative integer";
        return false;
    }

    out = it->get<uint64_t>();
    return true;
}
}  // namespace

JSONStoreDescriptorLoader::JSONStoreDescriptorLoader(std::string descriptor_file_path)
    : descriptor_file_path_ {std::move(descriptor_file_path)}
{}

bool JSONStoreDescriptorLoader::load(StoreDescriptor &descriptor, std::string &error_string) const
{
    bool success = false;
    DEFER({
        if (!success)
        {
            LOG(ERROR) << "Cannot load store descriptor " << descriptor_file_path_ << ": "
                       << error_string;
        }
    });

    std::ifstream fs {descriptor_file_path_};
    if (!fs.good())
    {
        error_string = "Cannot open " + descriptor_file_path_ + " for reading";
        return false;
    }

    auto json_root = nlohmann::json::parse(fs, nullptr, false);
    if (json_root.is_discarded() || !json_root.is_object())
    {
        error_string = descriptor_file_path_ + " is not a JSON object";
        return false;
    }

    StoreDescriptor result;

    std::optional<uint64_t> chunk_length;
    if (!read_unsigned(json_root, json_chunk_length_entry_name, chunk_length, error_string))
    {
        return false;
    }
    if (!chunk_length || *chunk_length == 0)
    {
        error_string = "Field chunk_length must be a positive integer";
        return false;
    }
    result.chunk_length = *chunk_length;

    auto name_it = json_root.find(json_name_entry_name);
    if (name_it != json_root.end() && !name_it->is_null())
    {
        if (!name_it->is_string())
        {
            error_string = "Field name must be a string";
            return false;
        }
        result.name = name_it->get<std::string>();
    }

    if (!read_unsigned(json_root, json_total_length_entry_name, result.total_length, error_string))
    {
        return false;
    }

    auto files_it = json_root.find(json_files_entry_name);
    if (files_it != json_root.end() && !files_it->is_null())
    {
        if (!files_it->is_array())
        {
            error_string = "Field files must be an array";
            return false;
        }

        for (const auto &entry : *files_it)
        {
            mapping::LogicalFileInfo file;
            if (!parse_file_entry(entry, file, error_string))
            {
                return false;
            }
            result.files.push_back(std::move(file));
        }
    }

    descriptor = std::move(result);
    success    = true;
    return true;
}

bool JSONStoreDescriptorLoader::parse_file_entry(
    const nlohmann::json &entry, mapping::LogicalFileInfo &file, std::string &error_string) const
{
    if (!entry.is_object())
    {
        error_string = "Every entry of files must be an object";
        return false;
    }

    auto path_it = entry.find(json_path_entry_name);
    if (path_it == entry.end() || !path_it->is_string())
    {
        error_string = "File entry is missing its path";
        return false;
    }
    file.path = path_it->get<std::string>();

    return read_unsigned(entry, json_length_entry_name, file.length, error_string) &&
           read_unsigned(entry, json_offset_entry_name, file.offset, error_string);
}
}  // namespace chunkstore::config
