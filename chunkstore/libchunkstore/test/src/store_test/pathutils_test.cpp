#include <gmock/gmock.h>
#include <gtest/gtest.h>

#include <string>
#include <vector>

#include "pathutils.hpp"

using namespace ::testing;
using namespace ::chunkstore::store;

TEST(PathUtilsTest, SanitizeFileName)
{
    EXPECT_EQ(pathutils::sanitize_file_name("plain_name.bin"), "plain_name.bin");
    EXPECT_EQ(pathutils::sanitize_file_name("a<b>c:d\"e|f?g*h\\i"), "abcdefghi");
    EXPECT_EQ(pathutils::sanitize_file_name(std::string {"x\ty\n\x01z"}), "xyz");
    EXPECT_EQ(pathutils::sanitize_file_name("???"), "");
}

TEST(PathUtilsTest, SplitPath)
{
    std::vector<std::string> components;
    std::string              error_string;

    EXPECT_TRUE(pathutils::split_path("dir/sub/file.bin", components, error_string));
    EXPECT_THAT(components, ElementsAre("dir", "sub", "file.bin"));

    EXPECT_TRUE(pathutils::split_path("//dir///file?.bin/", components, error_string));
    EXPECT_THAT(components, ElementsAre("dir", "file.bin"));

    EXPECT_TRUE(pathutils::split_path("single", components, error_string));
    EXPECT_THAT(components, ElementsAre("single"));
}

TEST(PathUtilsTest, SplitPath_Invalid)
{
    for (const char *path : {"", "/", "///", "a/../b", "./a", "a/?/b", "a/..", "*"})
    {
        std::vector<std::string> components {"untouched"};
        std::string              error_string;

        EXPECT_FALSE(pathutils::split_path(path, components, error_string)) << path;
        EXPECT_FALSE(error_string.empty()) << path;
        EXPECT_THAT(components, ElementsAre("untouched")) << path;
    }
}

TEST(PathUtilsTest, JoinPath)
{
    std::vector<std::string> components {"a", "b", "c"};
    EXPECT_EQ(pathutils::join_path(components.cbegin(), components.cend()), "a/b/c");
    EXPECT_EQ(pathutils::join_path(components.cbegin(), components.cbegin() + 1), "a");
    EXPECT_EQ(pathutils::join_path(components.cbegin(), components.cbegin()), "");
}

TEST(PathUtilsTest, IsValidEntryName)
{
    EXPECT_TRUE(pathutils::is_valid_entry_name("chunks"));
    EXPECT_TRUE(pathutils::is_valid_entry_name("store.20240101.000000.000000.0000abcd"));
    EXPECT_FALSE(pathutils::is_valid_entry_name(""));
    EXPECT_FALSE(pathutils::is_valid_entry_name("."));
    EXPECT_FALSE(pathutils::is_valid_entry_name(".."));
    EXPECT_FALSE(pathutils::is_valid_entry_name("a/b"));
    EXPECT_FALSE(pathutils::is_valid_entry_name("a\\b"));
}
