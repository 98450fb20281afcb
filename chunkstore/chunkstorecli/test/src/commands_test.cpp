#include <gtest/gtest.h>

#include <filesystem>
#include <fstream>
#include <iterator>
#include <memory>
#include <random>
#include <string>

#include "chunkstore.hpp"
#include "cleanupcommand.hpp"
#include "destroycommand.hpp"
#include "exitcommand.hpp"
#include "filesystemstoragebackend.hpp"
#include "getchunkcommand.hpp"
#include "mainexecuter.hpp"
#include "putchunkcommand.hpp"

using namespace ::chunkstorecli;
using namespace ::chunkstore;

namespace fs = std::filesystem;

namespace
{
class CommandsTest : public ::testing::Test
{
protected:
    void SetUp() override
    {
        work_dir_ = fs::temp_directory_path() /
                    ("chunkstorecli_test." + std::to_string(std::random_device {}()));
        fs::create_directories(work_dir_);

        store::StoreOptions options;
        options.name  = "cli";
        options.files = {{"data.bin", 6, std::nullopt}};

        std::string error_string;
        store_ = store::ChunkStore::create(4, std::move(options),
            std::make_shared<storage::FilesystemStorageBackend>((work_dir_ / "root").string()),
            std::make_shared<utils::MainExecuter>(), error_string);
        ASSERT_NE(store_, nullptr) << error_string;
    }

    void TearDown() override
    {
        store_.reset();

        std::error_code ec;
        fs::remove_all(work_dir_, ec);
    }

    std::string local_file(const std::string &name) const
    {
        return (work_dir_ / name).string();
    }

    void write_local_file(const std::string &name, const std::string &content) const
    {
        std::ofstream fs {local_file(name), std::ios::binary};
        fs << content;
    }

    std::string read_local_file(const std::string &name) const
    {
        std::ifstream fs {local_file(name), std::ios::binary};
        return {std::istreambuf_iterator<char> {fs}, std::istreambuf_iterator<char> {}};
    }

    fs::path                           work_dir_;
    std::unique_ptr<store::ChunkStore> store_;
};
}  // namespace

TEST_F(CommandsTest, PutThenGet)
{
    write_local_file("chunk0", "abcd");

    std::string err;
    EXPECT_TRUE(PutChunkCommand(0, local_file("chunk0")).execute(*store_, err)) << err;
    EXPECT_TRUE(GetChunkCommand(0, local_file("out"), std::nullopt, std::nullopt)
                    .execute(*store_, err))
        << err;
    EXPECT_EQ(read_local_file("out"), "abcd");

    EXPECT_TRUE(GetChunkCommand(0, local_file("part"), 1, 2).execute(*store_, err)) << err;
    EXPECT_EQ(read_local_file("part"), "bc");
}

TEST_F(CommandsTest, PutReportsStoreErrors)
{
    write_local_file("too_long", "abcdef");

    std::string err;
    EXPECT_FALSE(PutChunkCommand(0, local_file("too_long")).execute(*store_, err));
    EXPECT_NE(err.find("CHUNK_LENGTH_MISMATCH"), std::string::npos);

    err.clear();
    EXPECT_FALSE(PutChunkCommand(0, local_file("missing")).execute(*store_, err));
    EXPECT_FALSE(err.empty());
}

TEST_F(CommandsTest, GetReportsStoreErrors)
{
    std::string err;
    EXPECT_FALSE(
        GetChunkCommand(1, local_file("out"), std::nullopt, std::nullopt).execute(*store_, err));
    EXPECT_NE(err.find("NOT_FOUND"), std::string::npos);
    EXPECT_FALSE(fs::exists(local_file("out")));

    err.clear();
    EXPECT_FALSE(GetChunkCommand(0, local_file("out"), 3, 5).execute(*store_, err));
    EXPECT_NE(err.find("RANGE_OUT_OF_BOUNDS"), std::string::npos);
}

TEST_F(CommandsTest, CleanupKeepsData)
{
    write_local_file("chunk1", "ef");

    std::string err;
    ASSERT_TRUE(PutChunkCommand(1, local_file("chunk1")).execute(*store_, err)) << err;

    CleanupCommand cleanup;
    EXPECT_TRUE(cleanup.execute(*store_, err)) << err;
    EXPECT_FALSE(cleanup.should_terminate_program_after_execution());

    EXPECT_TRUE(GetChunkCommand(1, local_file("out"), std::nullopt, std::nullopt)
                    .execute(*store_, err))
        << err;
    EXPECT_EQ(read_local_file("out"), "ef");
}

TEST_F(CommandsTest, ExitClosesTheStore)
{
    std::string err;
    ExitCommand exit_command;
    EXPECT_TRUE(exit_command.execute(*store_, err)) << err;

    // Already closed is not a failure
    EXPECT_TRUE(exit_command.execute(*store_, err)) << err;

    write_local_file("chunk0", "abcd");
    EXPECT_FALSE(PutChunkCommand(0, local_file("chunk0")).execute(*store_, err));
    EXPECT_NE(err.find("STORE_CLOSED"), std::string::npos);
}

TEST_F(CommandsTest, DestroyRemovesTheStore)
{
    std::string    err;
    DestroyCommand destroy;
    EXPECT_TRUE(destroy.execute(*store_, err)) << err;
    EXPECT_FALSE(fs::exists(work_dir_ / "root" / "cli"));

    EXPECT_FALSE(destroy.execute(*store_, err));
    EXPECT_FALSE(err.empty());
}
