#include "pathutils.hpp"

#include <algorithm>
#include <cstring>
#include <iterator>
#include <sstream>

namespace chunkstore::store::pathutils
{
namespace
{
constexpr char const *reserved_chars = "<>:\"/\\|?*";

bool is_reserved(char c)
{
    return static_cast<unsigned char>(c) < 0x20 || std::strchr(reserved_chars, c) != nullptr;
}
}  // namespace

std::string sanitize_file_name(const std::string &name)
{
    std::string sanitized;
    sanitized.reserve(name.size());
    std::copy_if(name.cbegin(), name.cend(), std::back_inserter(sanitized),
        [](char c) { return !is_reserved(c); });
    return sanitized;
}

bool split_path(
    const std::string &path, std::vector<std::string> &components, std::string &error_string)
{
    std::vector<std::string> result;
    std::istringstream       ss {path};
    std::string              component;

    while (std::getline(ss, component, '/'))
    {
        if (component.empty())
        {
            continue;
        }

        if (component == "." || component == "..")
        {
            error_string = "Path " + path + " contains a relative component";
            return false;
        }

        std::string sanitized = sanitize_file_name(component);
        if (!is_valid_entry_name(sanitized))
        {
            error_string = "Path " + path + " contains an invalid component \"" + component + "\"";
            return false;
        }

        result.push_back(std::move(sanitized));
    }

    if (result.empty())
    {
        error_string = "Path \"" + path + "\" does not name a file";
        return false;
    }

    components = std::move(result);
    return true;
}

std::string join_path(std::vector<std::string>::const_iterator begin,
    std::vector<std::string>::const_iterator                   end)
{
    std::string path;
    for (auto it = begin; it != end; ++it)
    {
        if (!path.empty())
        {
            path += '/';
        }
        path += *it;
    }
    return path;
}

bool is_valid_entry_name(const std::string &name)
{
    return !name.empty() && name != "." && name != ".." &&
           name.find_first_of("/\\") == std::string::npos && name.find('\0') == std::string::npos;
}
}  // namespace chunkstore::store::pathutils
