#include <gtest/gtest.h>

#include <string>

#include "jsonconfigloader.hpp"

#include "testutils.hpp"

using namespace ::testing;
using namespace ::chunkstore::config;

namespace
{
class JSONConfigLoaderTest : public Test
{
protected:
    testutils::TemporaryDirectory temp_dir_;
};
}  // namespace

TEST_F(JSONConfigLoaderTest, BasicJSON)
{
    auto path = temp_dir_.write_file("config_basic.json", R"({
        "key0": "strval",
        "key1": 123,
        "key2": -10,
        "key3": 1.55,
        "key4": true
    })");

    JSONConfigLoader ldr {path};
    auto             vals = ldr.load();

    EXPECT_EQ(vals.size(), 5);
    EXPECT_EQ(std::any_cast<std::string>(vals.at("key0")), "strval");
    EXPECT_EQ(std::any_cast<long long>(vals.at("key1")), 123);
    EXPECT_EQ(std::any_cast<long long>(vals.at("key2")), -10);
    EXPECT_EQ(std::any_cast<double>(vals.at("key3")), 1.55);
    EXPECT_EQ(std::any_cast<bool>(vals.at("key4")), true);
}

TEST_F(JSONConfigLoaderTest, MultilevelJSON)
{
    auto path = temp_dir_.write_file("config_multilevel.json", R"({
        "key0": "this is a string",
        "level1": {
            "key1": -1,
            "key2": 1,
            "level2": {
                "key3": -0.1,
                "key4": 0.1
            }
        },
        "key5": true
    })");

    JSONConfigLoader ldr {path};
    auto             vals = ldr.load();

    EXPECT_EQ(vals.size(), 6);
    EXPECT_EQ(std::any_cast<std::string>(vals.at("key0")), "this is a string");
    EXPECT_EQ(std::any_cast<long long>(vals.at("key1")), -1);
    EXPECT_EQ(std::any_cast<long long>(vals.at("key2")), 1);
    EXPECT_EQ(std::any_cast<double>(vals.at("key3")), -0.1);
    EXPECT_EQ(std::any_cast<double>(vals.at("key4")), 0.1);
    EXPECT_EQ(std::any_cast<bool>(vals.at("key5")), true);
}

TEST_F(JSONConfigLoaderTest, UnsupportedValuesAreSkipped)
{
    auto path = temp_dir_.write_file(
        "config_arrays.json", R"({"key0": [1, 2, 3], "key1": null, "key2": "kept"})");

    JSONConfigLoader ldr {path};
    auto             vals = ldr.load();

    EXPECT_EQ(vals.size(), 1);
    EXPECT_EQ(std::any_cast<std::string>(vals.at("key2")), "kept");
}

TEST_F(JSONConfigLoaderTest, MissingFile)
{
    JSONConfigLoader ldr {(temp_dir_.path() / "missing.json").string()};
    EXPECT_TRUE(ldr.load().empty());
}

TEST_F(JSONConfigLoaderTest, MalformedFile)
{
    auto path = temp_dir_.write_file("config_malformed.json", R"({"key0": "strval",)");

    JSONConfigLoader ldr {path};
    EXPECT_TRUE(ldr.load().empty());
}

TEST_F(JSONConfigLoaderTest, NotAnObject)
{
    auto path = temp_dir_.write_file("config_array.json", "[1, 2]");

    JSONConfigLoader ldr {path};
    EXPECT_TRUE(ldr.load().empty());
}
