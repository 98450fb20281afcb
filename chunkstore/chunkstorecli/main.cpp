#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <memory>

#include <glog/logging.h>

#include "chunkstore.hpp"
#include "commandinterpreter.hpp"
#include "commandreader.hpp"
#include "workspace.hpp"

namespace
{
constexpr char const *config_file_name = "config.json";

constexpr char const *default_configuration = R"({
    "storage_root_dir": "storage",
    "cache_dir_name": "chunks",
    "worker_thread_count": 0,
    "purge_stale_caches_on_start": false
}
)";

std::string get_app_data_dir()
{
#if defined(linux) || defined(__linux__) || defined(__APPLE__)
    return std::filesystem::path {std::getenv("HOME")} / ".chunkstore";
#elif defined(_WIN32)
    return std::filesystem::path {std::getenv("APPDATA")} / "chunkstore";
#else
#error "Unsupported OS"
#endif
}

bool write_file_if_not_exists(const std::string &path, const std::string &content)
{
    if (!std::filesystem::is_regular_file(path))
    {
        // If there is a file which is not regular and with the same name, delete it
        std::error_code ec;
        std::filesystem::remove_all(path, ec);

        std::ofstream fs {path};
        if (!fs)
        {
            std::cout << "Cannot open " << path << " for writing\n";
            return false;
        }
        fs << content;
    }
    return true;
}

void print_help()
{
    std::cout << "Commands:\n"
              << "  put {chunk_index} {source_file}\n"
              << "  get {chunk_index} {dest_file} [offset] [length]\n"
              << "  cleanup\n"
              << "  destroy\n"
              << "  exit\n\n";
}
}  // namespace

int main(int argc, char **argv)
{
    google::InitGoogleLogging(argv[0]);

    std::cout << "chunkstore command line utility " << CHUNKSTORECLI_VERSION << "\n\n";

    if (argc != 2)
    {
        std::cout << "Usage: " << argv[0] << " {store_descriptor.json}\n";
        return EXIT_FAILURE;
    }

    std::string app_data_dir {get_app_data_dir()};

    if (!std::filesystem::is_directory(app_data_dir))
    {
        std::error_code ec;

        // If there is a regular file with the same name, delete it
        std::filesystem::remove(app_data_dir, ec);

        std::filesystem::create_directories(app_data_dir, ec);
        if (ec)
        {
            std::cout << "Error while creating app data directory " << app_data_dir << ": "
                      << ec.message() << "\n";
            return EXIT_FAILURE;
        }
    }

    if (!write_file_if_not_exists(
            std::filesystem::path {app_data_dir} / config_file_name, default_configuration))
    {
        return EXIT_FAILURE;
    }

    chunkstore::Workspace workspace {app_data_dir, config_file_name};
    if (!workspace.start())
    {
        std::cout << "Failed to start, check the log file for details.\n";
        return EXIT_FAILURE;
    }

    std::string error_message;
    auto        store = workspace.open_store(std::string {argv[1]}, error_message);
    if (!store)
    {
        std::cout << "Cannot open store: " << error_message << '\n';
        return EXIT_FAILURE;
    }

    std::cout << "Store " << store->name() << " opened, chunk length " << store->chunk_length()
              << "\n\n";
    print_help();

    chunkstorecli::CommandReader      cmd_reader {std::cin};
    chunkstorecli::CommandInterpreter cmd_interpreter;

    int exit_status = EXIT_SUCCESS;

    for (;;)
    {
        std::cout << "> ";
        chunkstorecli::Command cmd = cmd_reader.read_next_command();

        std::unique_ptr<chunkstorecli::ExecutableCommand> exec_cmd =
            cmd ? cmd_interpreter.interpret(cmd, error_message) :
                  cmd_interpreter.make_exit_command();
        if (!exec_cmd)
        {
            std::cout << "Invalid command: " << error_message << '\n';
            continue;
        }

        bool exec_success = exec_cmd->execute(*store, error_message);
        if (!exec_success)
        {
            std::cout << error_message << '\n';
        }

        if (exec_cmd->should_terminate_program_after_execution())
        {
            if (!exec_success)
            {
                exit_status = EXIT_FAILURE;
            }
            break;
        }
    }

    store.reset();
    workspace.stop();

    return exit_status;
}
