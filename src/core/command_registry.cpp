#include "torrentflow/core/command_registry.hpp"
#include <iostream>
#include <iomanip>

namespace torrentflow::core {

CommandRegistry::CommandRegistry() {
    register_command("daemon", std::make_unique<DaemonCommandHandler>());
    register_command("add", std::make_unique<AddCommandHandler>());
    register_command("seed", std::make_unique<SeedCommandHandler>());
    register_command("pause", std::make_unique<PauseCommandHandler>());
    register_command("resume", std::make_unique<ResumeCommandHandler>());
    register_command("remove", std::make_unique<RemoveCommandHandler>());
    register_command("list", std::make_unique<ListCommandHandler>());
    register_command("stats", std::make_unique<StatsCommandHandler>());
    register_command("status", std::make_unique<StatusCommandHandler>());
    register_command("watch", std::make_unique<WatchCommandHandler>());
}

void CommandRegistry::register_command(const std::string& name, std::unique_ptr<CommandHandler> handler) {
    handlers_[name] = std::move(handler);
}

CommandResult CommandRegistry::execute_command(const std::string& command, const std::vector<std::string>& args) {
    auto it = handlers_.find(command);
    if (it == handlers_.end()) {
        return CommandResult::error("Unknown command: " + command);
    }

    return it->second->execute(args);
}

bool CommandRegistry::has_command(const std::string& command) const {
    return handlers_.find(command) != handlers_.end();
}

void CommandRegistry::print_help() const {
    std::cout << "\nCommands:\n";

    for (const auto& [name, handler] : handlers_) {
        std::cout << "  " << std::left << std::setw(10) << name
                  << handler->get_description() << "\n";
        std::cout << "  " << std::left << std::setw(10) << " "
                  << "Usage: " << handler->get_usage() << "\n";
    }
}

}
