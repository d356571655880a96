#include "torrentflow/core/command_handler.hpp"
#include "torrentflow/core/config.hpp"
#include "torrentflow/core/ipc_client.hpp"
#include "torrentflow/core/ipc_server.hpp"
#include "torrentflow/core/logger.hpp"
#include "torrentflow/core/utils.hpp"
#include "torrentflow/engine/local_engine.hpp"
#include "torrentflow/engine/storage_config.hpp"
#include "torrentflow/session/session_manager.hpp"
#include <boost/asio/signal_set.hpp>
#include <csignal>
#include <filesystem>
#include <iomanip>
#include <iostream>

namespace torrentflow::core {

namespace {

uint64_t get_u64(const IPCResponse& response, const std::string& key) {
    auto it = response.data.find(key);
    if (it == response.data.end() || it->second.empty()) {
        return 0;
    }
    try {
        return std::stoull(it->second);
    } catch (const std::exception&) {
        return 0;
    }
}

std::string get_str(const IPCResponse& response, const std::string& key, const std::string& fallback = "") {
    auto it = response.data.find(key);
    return it != response.data.end() ? it->second : fallback;
}

std::string format_eta_field(const std::string& seconds) {
    if (seconds.empty()) {
        return "Unknown";
    }
    try {
        return utils::StringUtils::format_duration(std::chrono::seconds(std::stoll(seconds)));
    } catch (const std::exception&) {
        return "Unknown";
    }
}

std::string absolute_path(const std::string& path) {
    std::error_code ec;
    auto absolute = std::filesystem::absolute(utils::FileUtils::expand_home(path), ec);
    return ec ? path : absolute.string();
}

void print_transfer(const IPCResponse& response, const std::string& prefix, size_t index) {
    std::cout << "  [" << index << "] " << get_str(response, prefix + "name") << "\n";
    std::cout << "      ID: " << get_str(response, prefix + "id") << "\n";
    std::cout << "      Status: " << std::left << std::setw(12) << get_str(response, prefix + "status")
              << get_str(response, prefix + "progress") << "% of "
              << utils::StringUtils::format_bytes(get_u64(response, prefix + "size")) << "\n";
    std::cout << "      Speed: down " << utils::StringUtils::format_speed(get_u64(response, prefix + "down"))
              << ", up " << utils::StringUtils::format_speed(get_u64(response, prefix + "up"))
              << "   Peers: " << get_u64(response, prefix + "peers")
              << " (" << get_u64(response, prefix + "seeds") << " seeds)"
              << "   ETA: " << format_eta_field(get_str(response, prefix + "eta")) << "\n";
}

void print_stats(const IPCResponse& response) {
    std::cout << "  Transfers: " << get_u64(response, "stats.sessions")
              << " (" << get_u64(response, "stats.active") << " incomplete)\n";
    std::cout << "  Download: " << utils::StringUtils::format_speed(get_u64(response, "stats.download")) << "\n";
    std::cout << "  Upload: " << utils::StringUtils::format_speed(get_u64(response, "stats.upload")) << "\n";
    std::cout << "  Peers: " << get_u64(response, "stats.peers") << "\n";
}

CommandResult report(const IPCResponse& response) {
    if (!response.success) {
        return CommandResult::error(response.message);
    }

    std::cout << "✓ " << response.message;
    auto id = get_str(response, "id");
    if (!id.empty()) {
        std::cout << " (" << id << ")";
    }
    std::cout << "\n";

    // Completed with a warning, e.g. some files could not be deleted.
    auto error = get_str(response, "error");
    if (!error.empty() && error != "success") {
        std::cout << "  Warning: " << error << "\n";
    }
    return CommandResult::ok(response.message);
}

}

std::string DaemonClientCommand::socket_path() const {
    return Config::instance().get_string("ipc.socket_path", "/tmp/torrentflow.sock");
}

std::optional<IPCResponse> DaemonClientCommand::call(const IPCRequest& request, CommandResult& failure) const {
    IPCClient client(socket_path());
    auto response = client.send_request(request);
    if (!response) {
        failure = CommandResult::error("Daemon is not running (socket " + socket_path() +
                                       "). Start it with 'torrentflow daemon'.");
    }
    return response;
}

CommandResult DaemonCommandHandler::execute(const std::vector<std::string>& args) {
    auto& config = Config::instance();

    auto storage = engine::StorageConfig::from_config();
    if (!storage.validate()) {
        return CommandResult::error("Invalid storage configuration (check session.download_dir and seed.piece_size)");
    }
    if (!storage.create_directories()) {
        return CommandResult::error("Cannot create download directory " + storage.download_directory.string());
    }

    try {
        auto engine = std::make_shared<engine::LocalEngine>(storage);
        auto manager = std::make_shared<session::SessionManager>(engine, session::SessionManagerOptions::from_config());

        manager->add_event_handler([](const session::SessionEvent& event) {
            std::cout << "[" << session::to_string(event.type) << "] " << event.session_id;
            if (!event.message.empty()) {
                std::cout << ": " << event.message;
            }
            std::cout << std::endl;
        });
        manager->start();

        IPCServer ipc_server(manager, config.get_string("ipc.socket_path", "/tmp/torrentflow.sock"));
        if (!ipc_server.start()) {
            manager->stop();
            return CommandResult::error("Failed to start IPC server on " + ipc_server.get_socket_path());
        }

        std::cout << "TorrentFlow daemon running\n";
        std::cout << "  Downloads: " << storage.download_directory.string() << "\n";
        std::cout << "  Socket: " << ipc_server.get_socket_path() << "\n";
        std::cout << "Press Ctrl+C to stop.\n";

        boost::asio::io_context signal_context;
        boost::asio::signal_set signals(signal_context, SIGINT, SIGTERM);
        signals.async_wait([](const boost::system::error_code& error, int signal_number) {
            if (!error) {
                LOG_INFO("Received signal {}, shutting down", signal_number);
            }
        });
        signal_context.run();

        ipc_server.stop();
        manager->stop();

        std::cout << "Daemon stopped.\n";
        return CommandResult::ok("Daemon stopped");

    } catch (const std::exception& e) {
        LOG_CRITICAL("Daemon failed: {}", e.what());
        return CommandResult::error("Daemon failed: " + std::string(e.what()));
    }
}

CommandResult AddCommandHandler::execute(const std::vector<std::string>& args) {
    if (args.size() < 2) {
        return CommandResult::error("Usage: " + get_usage());
    }

    IPCRequest request;
    if (utils::StringUtils::starts_with(utils::StringUtils::to_lower(args[1]), "magnet:")) {
        request.command = "add-magnet";
        request.parameters["uri"] = args[1];
    } else {
        request.command = "add-file";
        request.parameters["path"] = absolute_path(args[1]);
    }

    CommandResult failure = CommandResult::ok();
    auto response = call(request, failure);
    return response ? report(*response) : failure;
}

CommandResult SeedCommandHandler::execute(const std::vector<std::string>& args) {
    if (args.size() < 2) {
        return CommandResult::error("Usage: " + get_usage());
    }

    std::vector<std::string> paths;
    for (size_t i = 1; i < args.size(); ++i) {
        if (args[i].find(';') != std::string::npos) {
            return CommandResult::error("Path contains ';': " + args[i]);
        }
        paths.push_back(absolute_path(args[i]));
    }

    IPCRequest request;
    request.command = "seed";
    request.parameters["paths"] = utils::StringUtils::join(paths, ";");

    std::cout << "Hashing " << paths.size() << " file(s)...\n";

    CommandResult failure = CommandResult::ok();
    auto response = call(request, failure);
    return response ? report(*response) : failure;
}

CommandResult PauseCommandHandler::execute(const std::vector<std::string>& args) {
    if (args.size() < 2) {
        return CommandResult::error("Usage: " + get_usage());
    }

    IPCRequest request;
    request.command = "pause";
    request.parameters["id"] = args[1];

    CommandResult failure = CommandResult::ok();
    auto response = call(request, failure);
    return response ? report(*response) : failure;
}

CommandResult ResumeCommandHandler::execute(const std::vector<std::string>& args) {
    if (args.size() < 2) {
        return CommandResult::error("Usage: " + get_usage());
    }

    IPCRequest request;
    request.command = "resume";
    request.parameters["id"] = args[1];

    CommandResult failure = CommandResult::ok();
    auto response = call(request, failure);
    return response ? report(*response) : failure;
}

CommandResult RemoveCommandHandler::execute(const std::vector<std::string>& args) {
    if (args.size() < 2 || args.size() > 3) {
        return CommandResult::error("Usage: " + get_usage());
    }

    bool delete_files = false;
    if (args.size() == 3) {
        if (args[2] != "delete-files") {
            return CommandResult::error("Usage: " + get_usage());
        }
        delete_files = true;
    }

    IPCRequest request;
    request.command = "remove";
    request.parameters["id"] = args[1];
    request.parameters["delete_files"] = delete_files ? "true" : "false";

    CommandResult failure = CommandResult::ok();
    auto response = call(request, failure);
    return response ? report(*response) : failure;
}

CommandResult ListCommandHandler::execute(const std::vector<std::string>& args) {
    IPCRequest request;
    CommandResult failure = CommandResult::ok();

    if (args.size() >= 2) {
        request.command = "get";
        request.parameters["id"] = args[1];

        auto response = call(request, failure);
        if (!response) return failure;
        if (!response->success) return CommandResult::error(response->message);

        print_transfer(*response, "", 1);
        std::cout << "      Source: " << get_str(*response, "source")
                  << "   Added: " << get_str(*response, "added") << "\n";

        auto file_count = get_u64(*response, "files");
        if (file_count > 0) {
            std::cout << "      Files:\n";
        }
        for (uint64_t i = 0; i < file_count; ++i) {
            std::string prefix = "f" + std::to_string(i) + ".";
            std::cout << "        - " << get_str(*response, prefix + "name")
                      << " (" << utils::StringUtils::format_bytes(get_u64(*response, prefix + "size"))
                      << ", " << get_str(*response, prefix + "progress") << "%)\n";
        }
        return CommandResult::ok();
    }

    request.command = "list";
    auto response = call(request, failure);
    if (!response) return failure;
    if (!response->success) return CommandResult::error(response->message);

    auto count = get_u64(*response, "count");
    if (count == 0) {
        std::cout << "No transfers.\n";
        return CommandResult::ok();
    }

    std::cout << "Transfers:\n";
    for (uint64_t i = 0; i < count; ++i) {
        print_transfer(*response, "t" + std::to_string(i) + ".", i + 1);
    }
    return CommandResult::ok();
}

CommandResult StatsCommandHandler::execute(const std::vector<std::string>& args) {
    IPCRequest request;
    request.command = "stats";

    CommandResult failure = CommandResult::ok();
    auto response = call(request, failure);
    if (!response) return failure;
    if (!response->success) return CommandResult::error(response->message);

    std::cout << "Statistics:\n";
    print_stats(*response);
    return CommandResult::ok();
}

CommandResult StatusCommandHandler::execute(const std::vector<std::string>& args) {
    IPCRequest request;
    request.command = "status";

    IPCClient client(socket_path());
    auto response = client.send_request(request);
    if (!response || !response->success) {
        std::cout << "TorrentFlow daemon is not running (socket " << socket_path() << ")\n";
        return CommandResult::ok();
    }

    std::cout << "TorrentFlow daemon is running\n";
    std::cout << "  Broadcasting: " << get_str(*response, "broadcasting")
              << " every " << get_str(*response, "tick_interval_ms") << " ms\n";
    print_stats(*response);
    return CommandResult::ok();
}

CommandResult WatchCommandHandler::execute(const std::vector<std::string>& args) {
    uint64_t limit = 0;
    if (args.size() >= 2) {
        try {
            limit = std::stoull(args[1]);
        } catch (const std::exception&) {
            return CommandResult::error("Usage: " + get_usage());
        }
    }

    uint64_t ticks = 0;
    IPCClient client(socket_path());
    bool connected = client.watch([&](const IPCResponse& frame) {
        auto type = get_str(frame, "type");

        if (type == "event") {
            std::cout << "* " << get_str(frame, "event") << " " << get_str(frame, "id");
            auto detail = get_str(frame, "detail");
            if (!detail.empty()) {
                std::cout << ": " << detail;
            }
            std::cout << "\n";
        } else if (type == "tick") {
            std::cout << "--- " << utils::TimeUtils::format_timestamp(utils::TimeUtils::now())
                      << " (tick " << get_str(frame, "tick") << ")\n";
            auto count = get_u64(frame, "count");
            for (uint64_t i = 0; i < count; ++i) {
                print_transfer(frame, "t" + std::to_string(i) + ".", i + 1);
            }
            print_stats(frame);
            ++ticks;
        }
        std::cout.flush();

        return limit == 0 || ticks < limit;
    });

    if (!connected) {
        return CommandResult::error("Daemon is not running (socket " + socket_path() + ")");
    }
    return CommandResult::ok();
}

}
