#ifndef CHUNKSTORE_CONFIG_CONFIGKEYS_HPP_
#define CHUNKSTORE_CONFIG_CONFIGKEYS_HPP_

#include <string>

namespace chunkstore::config
{
class ConfigKey
{
public:
    enum EnumType
    {
        FIRST_KEY = 0,

        STORAGE_ROOT_DIR = FIRST_KEY,
        CACHE_DIR_NAME,
        WORKER_THREAD_COUNT,
        PURGE_STALE_CACHES_ON_START,

        KEY_COUNT
    };

    ConfigKey(EnumType k)
        : key_ {k}
    {}

    [[nodiscard]] std::string to_string() const
    {
        if (key_ >= 0 && key_ < KEY_COUNT)
        {
            return string_vals[key_];
        }
        return "";
    }

    [[nodiscard]] EnumType to_enum_type() const
    {
        return key_;
    }

    operator EnumType() const
    {
        return to_enum_type();
    }

    explicit operator std::string() const
    {
        return to_string();
    }

private:
    EnumType key_;

    static constexpr char const *string_vals[] {"storage_root_dir", "cache_dir_name",
        "worker_thread_count", "purge_stale_caches_on_start"};
};
}  // namespace chunkstore::config

#endif  // CHUNKSTORE_CONFIG_CONFIGKEYS_HPP_
