#include "commandinterpreter.hpp"

#include <charconv>
#include <cstdint>
#include <optional>

#include "cleanupcommand.hpp"
#include "destroycommand.hpp"
#include "exitcommand.hpp"
#include "getchunkcommand.hpp"
#include "putchunkcommand.hpp"

namespace chunkstorecli
{
namespace
{
constexpr char const *put_chunk_command_name = "put";
constexpr char const *get_chunk_command_name = "get";
constexpr char const *cleanup_command_name   = "cleanup";
constexpr char const *destroy_command_name   = "destroy";
constexpr char const *exit_command_name      = "exit";

template<typename Int>
bool parse_number(const std::string &str, Int &value)
{
    const char *end = str.data() + str.size();
    auto [ptr, ec]  = std::from_chars(str.data(), end, value);
    return ec == std::errc {} && ptr == end;
}
}  // namespace

std::unique_ptr<ExecutableCommand> CommandInterpreter::interpret(
    const Command &command, std::string &err) const
{
    if (!command)
    {
        err = "Invalid command object";
        return nullptr;
    }

    if (command.cmd == put_chunk_command_name)
    {
        uint64_t index;
        if (command.args.size() != 2 || !parse_number(command.args[0], index))
        {
            err = "Usage: put {chunk_index} {source_file}";
            return nullptr;
        }
        return std::make_unique<PutChunkCommand>(index, command.args[1]);
    }
    else if (command.cmd == get_chunk_command_name)
    {
        uint64_t              index;
        std::optional<size_t> offset;
        std::optional<size_t> length;

        bool args_ok = (command.args.size() >= 2 && command.args.size() <= 4) &&
                       parse_number(command.args[0], index);
        if (args_ok && command.args.size() >= 3)
        {
            args_ok = parse_number(command.args[2], offset.emplace());
        }
        if (args_ok && command.args.size() == 4)
        {
            args_ok = parse_number(command.args[3], length.emplace());
        }

        if (!args_ok)
        {
            err = "Usage: get {chunk_index} {dest_file} [offset] [length]";
            return nullptr;
        }
        return std::make_unique<GetChunkCommand>(index, command.args[1], offset, length);
    }
    else if (command.cmd == cleanup_command_name)
    {
        if (!command.args.empty())
        {
            err = "Usage: cleanup";
            return nullptr;
        }
        return std::make_unique<CleanupCommand>();
    }
    else if (command.cmd == destroy_command_name)
    {
        if (!command.args.empty())
        {
            err = "Usage: destroy";
            return nullptr;
        }
        return std::make_unique<DestroyCommand>();
    }
    else if (command.cmd == exit_command_name)
    {
        if (!command.args.empty())
        {
            err = "Usage: exit";
            return nullptr;
        }
        return std::make_unique<ExitCommand>();
    }
    else
    {
        err = "Unknown command";
        return nullptr;
    }
}

std::unique_ptr<ExecutableCommand> CommandInterpreter::make_exit_command() const
{
    return std::make_unique<ExitCommand>();
}
}  // namespace chunkstorecli
