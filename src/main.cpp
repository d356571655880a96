#include <iostream>
#include <string>
#include <vector>
#include "torrentflow/core/logger.hpp"
#include "torrentflow/core/config.hpp"
#include "torrentflow/core/cli.hpp"
#include "torrentflow/core/utils.hpp"
#include "torrentflow/core/command_registry.hpp"

int main(int argc, char* argv[]) {
    torrentflow::core::CommandLineParser parser("torrentflow");

    if (!parser.parse(argc, argv)) {
        std::cerr << "Error: " << parser.get_error() << "\n\n";
        parser.print_help();
        return 1;
    }

    if (parser.has_option("help")) {
        parser.print_help();
        torrentflow::core::CommandRegistry().print_help();
        return 0;
    }

    if (parser.has_option("version")) {
        parser.print_version();
        return 0;
    }

    auto& config = torrentflow::core::Config::instance();
    config.set_defaults();

    auto config_file = torrentflow::core::utils::FileUtils::expand_home(
        parser.get_option("config", "~/.torrentflow.conf"));
    if (torrentflow::core::utils::FileUtils::exists(config_file)) {
        if (!config.load_from_file(config_file.string())) {
            std::cerr << "Warning: could not read config file " << config_file.string() << "\n";
        }
    }

    if (parser.has_option("socket")) {
        config.set("ipc.socket_path", parser.get_option("socket"));
    }

    auto log_level = parser.has_option("verbose")
        ? torrentflow::core::LogLevel::Debug
        : torrentflow::core::Logger::parse_level(config.get_string("log.level", "info"));
    torrentflow::core::Logger::initialize(config.get_string("log.file", "torrentflow.log"), log_level);

    LOG_DEBUG("TorrentFlow starting up");

    torrentflow::core::CommandRegistry command_registry;

    auto& args = parser.get_positional_args();
    if (args.empty()) {
        parser.print_help();
        command_registry.print_help();
        torrentflow::core::Logger::shutdown();
        return 0;
    }

    std::string command = args[0];

    auto result = command_registry.execute_command(command, args);

    if (!result.success) {
        std::cerr << "Error: " << result.message << "\n";
        if (!command_registry.has_command(command)) {
            std::cout << "\nAvailable commands:\n";
            command_registry.print_help();
        }
    }

    torrentflow::core::Logger::shutdown();
    return result.exit_code;
}
