#pragma once

#include "ipc_protocol.hpp"
#include <optional>
#include <string>
#include <vector>

namespace torrentflow::core {

struct CommandResult {
    bool success;
    std::string message;
    int exit_code;

    static CommandResult ok(const std::string& msg = "") {
        return {true, msg, 0};
    }

    static CommandResult error(const std::string& msg, int code = 1) {
        return {false, msg, code};
    }
};

class CommandHandler {
public:
    virtual ~CommandHandler() = default;

    // args[0] is the command name itself.
    virtual CommandResult execute(const std::vector<std::string>& args) = 0;
    virtual std::string get_description() const = 0;
    virtual std::string get_usage() const = 0;
};

// Base for commands that talk to a running daemon over the IPC socket.
class DaemonClientCommand : public CommandHandler {
protected:
    std::string socket_path() const;

    // Sends the request; on failure returns the CommandResult to hand back.
    std::optional<IPCResponse> call(const IPCRequest& request, CommandResult& failure) const;
};

class DaemonCommandHandler : public CommandHandler {
public:
    CommandResult execute(const std::vector<std::string>& args) override;
    std::string get_description() const override { return "Run the transfer daemon until interrupted"; }
    std::string get_usage() const override { return "torrentflow daemon"; }
};

class AddCommandHandler : public DaemonClientCommand {
public:
    CommandResult execute(const std::vector<std::string>& args) override;
    std::string get_description() const override { return "Add a transfer from a magnet link or .torrent file"; }
    std::string get_usage() const override { return "torrentflow add <magnet-uri | file.torrent>"; }
};

class SeedCommandHandler : public DaemonClientCommand {
public:
    CommandResult execute(const std::vector<std::string>& args) override;
    std::string get_description() const override { return "Seed local files without downloading"; }
    std::string get_usage() const override { return "torrentflow seed <path> [path...]"; }
};

class PauseCommandHandler : public DaemonClientCommand {
public:
    CommandResult execute(const std::vector<std::string>& args) override;
    std::string get_description() const override { return "Stop requesting pieces for a transfer"; }
    std::string get_usage() const override { return "torrentflow pause <id>"; }
};

class ResumeCommandHandler : public DaemonClientCommand {
public:
    CommandResult execute(const std::vector<std::string>& args) override;
    std::string get_description() const override { return "Request all pieces of a transfer again"; }
    std::string get_usage() const override { return "torrentflow resume <id>"; }
};

class RemoveCommandHandler : public DaemonClientCommand {
public:
    CommandResult execute(const std::vector<std::string>& args) override;
    std::string get_description() const override { return "Remove a transfer, optionally deleting its files"; }
    std::string get_usage() const override { return "torrentflow remove <id> [delete-files]"; }
};

class ListCommandHandler : public DaemonClientCommand {
public:
    CommandResult execute(const std::vector<std::string>& args) override;
    std::string get_description() const override { return "List transfers, or show one in detail"; }
    std::string get_usage() const override { return "torrentflow list [id]"; }
};

class StatsCommandHandler : public DaemonClientCommand {
public:
    CommandResult execute(const std::vector<std::string>& args) override;
    std::string get_description() const override { return "Show aggregate transfer statistics"; }
    std::string get_usage() const override { return "torrentflow stats"; }
};

class StatusCommandHandler : public DaemonClientCommand {
public:
    CommandResult execute(const std::vector<std::string>& args) override;
    std::string get_description() const override { return "Check whether the daemon is running"; }
    std::string get_usage() const override { return "torrentflow status"; }
};

class WatchCommandHandler : public DaemonClientCommand {
public:
    CommandResult execute(const std::vector<std::string>& args) override;
    std::string get_description() const override { return "Follow live transfer updates"; }
    std::string get_usage() const override { return "torrentflow watch [ticks]"; }
};

}
