#include <gtest/gtest.h>

#include <string>
#include <vector>

#include "cleanupcommand.hpp"
#include "commandinterpreter.hpp"
#include "destroycommand.hpp"
#include "exitcommand.hpp"
#include "getchunkcommand.hpp"
#include "putchunkcommand.hpp"

using namespace ::chunkstorecli;

namespace
{
Command make_command(const std::string &cmd, const std::vector<std::string> &args)
{
    return {cmd, args.cbegin(), args.cend()};
}
}  // namespace

TEST(CommandInterpreterTest, InvalidCommandObject)
{
    CommandInterpreter command_interpreter;

    std::string err;
    EXPECT_EQ(command_interpreter.interpret(Command {}, err), nullptr);
    EXPECT_FALSE(err.empty());
}

TEST(CommandInterpreterTest, UnknownCommand)
{
    CommandInterpreter command_interpreter;

    std::string err;
    EXPECT_EQ(command_interpreter.interpret(Command {"plm"}, err), nullptr);
    EXPECT_FALSE(err.empty());
}

TEST(CommandInterpreterTest, PutChunkCommand)
{
    CommandInterpreter command_interpreter;

    std::string err;
    auto        cmd = command_interpreter.interpret(make_command("put", {"12", "chunk.bin"}), err);
    ASSERT_NE(cmd, nullptr);
    EXPECT_NE(dynamic_cast<PutChunkCommand *>(cmd.get()), nullptr);
    EXPECT_FALSE(cmd->should_terminate_program_after_execution());
    EXPECT_TRUE(err.empty());
}

TEST(CommandInterpreterTest, PutChunkCommand_InvalidArgs)
{
    CommandInterpreter command_interpreter;

    std::string err;
    EXPECT_EQ(command_interpreter.interpret(make_command("put", {"12"}), err), nullptr);
    EXPECT_FALSE(err.empty());

    err.clear();
    EXPECT_EQ(
        command_interpreter.interpret(make_command("put", {"-1", "chunk.bin"}), err), nullptr);
    EXPECT_FALSE(err.empty());

    err.clear();
    EXPECT_EQ(
        command_interpreter.interpret(make_command("put", {"12x", "chunk.bin"}), err), nullptr);
    EXPECT_FALSE(err.empty());
}

TEST(CommandInterpreterTest, GetChunkCommand)
{
    CommandInterpreter command_interpreter;

    for (const auto &args : std::vector<std::vector<std::string>> {
             {"0", "out.bin"}, {"0", "out.bin", "2"}, {"0", "out.bin", "2", "3"}})
    {
        std::string err;
        auto        cmd = command_interpreter.interpret(make_command("get", args), err);
        ASSERT_NE(cmd, nullptr);
        EXPECT_NE(dynamic_cast<GetChunkCommand *>(cmd.get()), nullptr);
        EXPECT_TRUE(err.empty());
    }
}

TEST(CommandInterpreterTest, GetChunkCommand_InvalidArgs)
{
    CommandInterpreter command_interpreter;

    for (const auto &args : std::vector<std::vector<std::string>> {{"0"},
             {"0", "out.bin", "2", "3", "4"}, {"zero", "out.bin"}, {"0", "out.bin", "two"},
             {"0", "out.bin", "2", "-3"}})
    {
        std::string err;
        EXPECT_EQ(command_interpreter.interpret(make_command("get", args), err), nullptr);
        EXPECT_FALSE(err.empty());
    }
}

TEST(CommandInterpreterTest, CleanupCommand)
{
    CommandInterpreter command_interpreter;

    std::string err;
    auto        cmd = command_interpreter.interpret(Command {"cleanup"}, err);
    ASSERT_NE(cmd, nullptr);
    EXPECT_NE(dynamic_cast<CleanupCommand *>(cmd.get()), nullptr);
    EXPECT_FALSE(cmd->should_terminate_program_after_execution());

    EXPECT_EQ(command_interpreter.interpret(make_command("cleanup", {"now"}), err), nullptr);
    EXPECT_FALSE(err.empty());
}

TEST(CommandInterpreterTest, DestroyCommand)
{
    CommandInterpreter command_interpreter;

    std::string err;
    auto        cmd = command_interpreter.interpret(Command {"destroy"}, err);
    ASSERT_NE(cmd, nullptr);
    EXPECT_NE(dynamic_cast<DestroyCommand *>(cmd.get()), nullptr);
    EXPECT_TRUE(cmd->should_terminate_program_after_execution());
}

TEST(CommandInterpreterTest, ExitCommand)
{
    CommandInterpreter command_interpreter;

    std::string err;
    auto        cmd = command_interpreter.interpret(Command {"exit"}, err);
    ASSERT_NE(cmd, nullptr);
    EXPECT_NE(dynamic_cast<ExitCommand *>(cmd.get()), nullptr);
    EXPECT_TRUE(cmd->should_terminate_program_after_execution());
    EXPECT_TRUE(err.empty());
}

TEST(CommandInterpreterTest, ExitCommand_InvalidNumberOfArgs)
{
    CommandInterpreter command_interpreter;

    std::string err;
    EXPECT_EQ(command_interpreter.interpret(make_command("exit", {"arg1", "arg2"}), err), nullptr);
    EXPECT_FALSE(err.empty());
}
