#include <gmock/gmock.h>
#include <gtest/gtest.h>

#include <memory>

#include "config.hpp"
#include "fallbackconfigvalueprovider.hpp"

#include "configloader_mock.hpp"

using namespace ::testing;
using namespace ::chunkstore::config;

namespace
{
class ConfigTest : public Test
{
protected:
    class GoodFallbackValueProviderMock : public FallbackConfigValueProvider
    {
    public:
        [[nodiscard]] std::any get(const ConfigKey &key) const override
        {
            if (key == ConfigKey::WORKER_THREAD_COUNT)
            {
                return worker_thread_count_;
            }
            else if (key == ConfigKey::CACHE_DIR_NAME)
            {
                return std::string {cache_dir_name_};
            }
            return {};
        }

        static constexpr long long   worker_thread_count_ = 3LL;
        static constexpr char const *cache_dir_name_      = "chunk_cache";
    };

    class BadFallbackValueProviderMock : public FallbackConfigValueProvider
    {
    public:
        [[nodiscard]] std::any get(const ConfigKey &) const override
        {
            return {};
        }
    };

    class WrongTypeFallbackValueProviderMock : public FallbackConfigValueProvider
    {
    public:
        [[nodiscard]] std::any get(const ConfigKey &key) const override
        {
            if (key == ConfigKey::CACHE_DIR_NAME)
            {
                return {5};
            }
            return {};
        }
    };

    void SetUp() override
    {
        ON_CALL(config_loader_, load())
            .WillByDefault(Return(std::map<std::string, std::any> {
                {ConfigKey(ConfigKey::STORAGE_ROOT_DIR).to_string(), storage_root_dir_},
                {ConfigKey(ConfigKey::PURGE_STALE_CACHES_ON_START).to_string(),
                    purge_stale_caches_on_start_},
                {ConfigKey(ConfigKey::CACHE_DIR_NAME).to_string(), cache_dir_name_},
                {"unknown_key", 12LL}}));
    }

    NiceMock<ConfigLoaderMock> config_loader_;

    const std::string storage_root_dir_            = "/home/anon/.chunkstore/storage";
    const bool        purge_stale_caches_on_start_ = true;
    const long long   cache_dir_name_              = 42LL;
};
}  // namespace

TEST_F(ConfigTest, GetString)
{
    Config conf {config_loader_};
    EXPECT_EQ(conf.get_string(ConfigKey::STORAGE_ROOT_DIR), storage_root_dir_);
}

TEST_F(ConfigTest, GetBool)
{
    Config conf {config_loader_};
    EXPECT_EQ(conf.get_bool(ConfigKey::PURGE_STALE_CACHES_ON_START), purge_stale_caches_on_start_);
}

TEST_F(ConfigTest, GetMissingValue)
{
    Config conf {config_loader_, std::make_unique<GoodFallbackValueProviderMock>()};
    EXPECT_EQ(conf.get_integer(ConfigKey::WORKER_THREAD_COUNT),
        GoodFallbackValueProviderMock::worker_thread_count_);
}

TEST_F(ConfigTest, GetMissingValue_NoFallback)
{
    Config conf {config_loader_};
    EXPECT_DEATH(static_cast<void>(conf.get_integer(ConfigKey::WORKER_THREAD_COUNT)), "");
}

TEST_F(ConfigTest, GetMissingValue_MissingInFallback)
{
    Config conf {config_loader_, std::make_unique<BadFallbackValueProviderMock>()};
    EXPECT_DEATH(static_cast<void>(conf.get_integer(ConfigKey::WORKER_THREAD_COUNT)), "");
}

TEST_F(ConfigTest, GetValue_WrongType)
{
    Config conf {config_loader_, std::make_unique<GoodFallbackValueProviderMock>()};
    EXPECT_EQ(
        conf.get_string(ConfigKey::CACHE_DIR_NAME), GoodFallbackValueProviderMock::cache_dir_name_);
}

TEST_F(ConfigTest, GetValue_WrongType_NoFallback)
{
    Config conf {config_loader_};
    EXPECT_DEATH(static_cast<void>(conf.get_string(ConfigKey::CACHE_DIR_NAME)), "");
}

TEST_F(ConfigTest, GetValue_WrongType_WrongTypeInFallback)
{
    Config conf {config_loader_, std::make_unique<WrongTypeFallbackValueProviderMock>()};
    EXPECT_DEATH(static_cast<void>(conf.get_string(ConfigKey::CACHE_DIR_NAME)), "");
}

TEST_F(ConfigTest, CopiesShareTheFallbackProvider)
{
    Config conf {config_loader_, std::make_unique<GoodFallbackValueProviderMock>()};
    Config copy {conf};
    EXPECT_EQ(copy.get_integer(ConfigKey::WORKER_THREAD_COUNT),
        GoodFallbackValueProviderMock::worker_thread_count_);
    EXPECT_EQ(copy.get_string(ConfigKey::STORAGE_ROOT_DIR), storage_root_dir_);
}
