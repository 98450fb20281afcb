#ifndef CHUNKSTORE_STORE_PATHUTILS_HPP_
#define CHUNKSTORE_STORE_PATHUTILS_HPP_

#include <string>
#include <vector>

namespace chunkstore::store::pathutils
{
// Drops the characters that are not allowed in file names on common filesystems
std::string sanitize_file_name(const std::string &name);

/*
 * Splits a slash separated relative path into sanitized components. Empty components are skipped.
 * Fails on "." and ".." components and on components with nothing left after sanitization.
 */
bool split_path(
    const std::string &path, std::vector<std::string> &components, std::string &error_string);

std::string join_path(std::vector<std::string>::const_iterator begin,
    std::vector<std::string>::const_iterator                   end);

// A single directory level name, usable as is
bool is_valid_entry_name(const std::string &name);
}  // namespace chunkstore::store::pathutils

#endif  // CHUNKSTORE_STORE_PATHUTILS_HPP_
