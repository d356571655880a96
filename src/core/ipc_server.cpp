#include "torrentflow/core/ipc_server.hpp"
#include "torrentflow/core/bounded_queue.hpp"
#include "torrentflow/core/logger.hpp"
#include "torrentflow/core/utils.hpp"
#include "torrentflow/session/session_manager.hpp"
#include <sys/socket.h>
#include <sys/un.h>
#include <unistd.h>
#include <cerrno>
#include <cstring>
#include <system_error>
#include <fmt/format.h>

namespace torrentflow::core {

namespace {

IPCResponse from_result(const session::SessionResult& result, const std::string& success_message) {
    IPCResponse response;
    response.success = result.completed();
    response.message = result.success() ? success_message : result.message;
    response.data["error"] = session::to_string(result.error);
    if (!result.session_id.empty()) {
        response.data["id"] = result.session_id;
    }
    return response;
}

std::optional<std::string> require(const IPCRequest& request, const std::string& key) {
    auto it = request.parameters.find(key);
    if (it == request.parameters.end() || it->second.empty()) {
        return std::nullopt;
    }
    return it->second;
}

bool parse_flag(const std::string& value) {
    auto lower = utils::StringUtils::to_lower(value);
    return lower == "true" || lower == "1" || lower == "yes";
}

std::optional<std::string> read_line(int fd) {
    std::string line;
    char c;
    while (line.size() < IPC_MAX_LINE) {
        ssize_t n = ::read(fd, &c, 1);
        if (n < 0 && errno == EINTR) {
            continue;
        }
        if (n <= 0) {
            return std::nullopt;
        }
        if (c == '\n') {
            return line;
        }
        line.push_back(c);
    }
    return std::nullopt;
}

}

void append_snapshot(IPCResponse& response, const std::string& prefix,
                     const session::TransferSnapshot& snapshot, bool include_files) {
    auto& data = response.data;
    data[prefix + "id"] = snapshot.id;
    data[prefix + "name"] = snapshot.name;
    data[prefix + "source"] = session::to_string(snapshot.source);
    data[prefix + "metadata"] = snapshot.metadata_known ? "true" : "false";
    data[prefix + "status"] = session::to_string(snapshot.status);
    data[prefix + "size"] = std::to_string(snapshot.total_size);
    data[prefix + "completed"] = std::to_string(snapshot.bytes_completed);
    data[prefix + "progress"] = fmt::format("{:.2f}", snapshot.progress);
    data[prefix + "down"] = std::to_string(snapshot.download_rate);
    data[prefix + "up"] = std::to_string(snapshot.upload_rate);
    data[prefix + "peers"] = std::to_string(snapshot.peers);
    data[prefix + "seeds"] = std::to_string(snapshot.seeds);
    data[prefix + "eta"] = snapshot.eta ? std::to_string(snapshot.eta->count()) : "";
    data[prefix + "added"] = utils::TimeUtils::to_iso_string(snapshot.added_at);

    if (!include_files) {
        return;
    }

    data[prefix + "files"] = std::to_string(snapshot.files.size());
    for (size_t i = 0; i < snapshot.files.size(); ++i) {
        const auto& file = snapshot.files[i];
        std::string file_prefix = prefix + "f" + std::to_string(i) + ".";
        data[file_prefix + "name"] = file.name;
        data[file_prefix + "path"] = file.path;
        data[file_prefix + "size"] = std::to_string(file.size);
        data[file_prefix + "completed"] = std::to_string(file.bytes_completed);
        data[file_prefix + "progress"] = fmt::format("{:.2f}", file.progress);
    }
}

void append_stats(IPCResponse& response, const session::GlobalStats& stats) {
    response.data["stats.download"] = std::to_string(stats.total_download_rate);
    response.data["stats.upload"] = std::to_string(stats.total_upload_rate);
    response.data["stats.peers"] = std::to_string(stats.total_peers);
    response.data["stats.active"] = std::to_string(stats.active_transfers);
    response.data["stats.sessions"] = std::to_string(stats.session_count);
}

IPCResponse make_batch_frame(const session::SnapshotBatch& batch) {
    auto response = IPCResponse::ok("tick " + std::to_string(batch.tick));
    response.data["type"] = "tick";
    response.data["tick"] = std::to_string(batch.tick);
    response.data["count"] = std::to_string(batch.snapshots.size());

    for (size_t i = 0; i < batch.snapshots.size(); ++i) {
        append_snapshot(response, "t" + std::to_string(i) + ".", batch.snapshots[i], false);
    }
    append_stats(response, batch.stats);
    return response;
}

IPCServer::IPCServer(std::shared_ptr<session::SessionManager> manager, const std::string& socket_path)
    : manager_(std::move(manager))
    , socket_path_(socket_path)
    , server_fd_(-1)
    , running_(false) {

    LOG_INFO("IPC server initialized with socket: {}", socket_path_);
}

IPCServer::~IPCServer() {
    stop();
}

bool IPCServer::start() {
    if (running_) {
        LOG_WARN("IPC server already running");
        return false;
    }

    // Remove existing socket file if it exists
    unlink(socket_path_.c_str());

    server_fd_ = socket(AF_UNIX, SOCK_STREAM, 0);
    if (server_fd_ < 0) {
        LOG_ERROR("Failed to create Unix socket: {}", strerror(errno));
        return false;
    }

    struct sockaddr_un addr;
    memset(&addr, 0, sizeof(addr));
    addr.sun_family = AF_UNIX;
    strncpy(addr.sun_path, socket_path_.c_str(), sizeof(addr.sun_path) - 1);

    if (bind(server_fd_, (struct sockaddr*)&addr, sizeof(addr)) < 0) {
        LOG_ERROR("Failed to bind Unix socket: {}", strerror(errno));
        close(server_fd_);
        server_fd_ = -1;
        return false;
    }

    if (listen(server_fd_, 16) < 0) {
        LOG_ERROR("Failed to listen on Unix socket: {}", strerror(errno));
        close(server_fd_);
        server_fd_ = -1;
        return false;
    }

    running_ = true;

    accept_thread_ = std::thread([this]() {
        accept_loop();
    });

    LOG_INFO("IPC server started on {}", socket_path_);
    return true;
}

void IPCServer::stop() {
    if (!running_.exchange(false)) {
        return;
    }

    LOG_INFO("Stopping IPC server");

    if (server_fd_ >= 0) {
        // shutdown() wakes the blocked accept()
        shutdown(server_fd_, SHUT_RDWR);
        close(server_fd_);
        server_fd_ = -1;
    }

    if (accept_thread_.joinable()) {
        accept_thread_.join();
    }

    {
        std::unique_lock<std::mutex> lock(clients_mutex_);
        for (int fd : client_fds_) {
            shutdown(fd, SHUT_RDWR);
        }
        clients_cv_.wait(lock, [this]() { return active_clients_ == 0; });
    }

    unlink(socket_path_.c_str());
}

void IPCServer::accept_loop() {
    LOG_INFO("IPC server accept loop started");

    while (running_) {
        struct sockaddr_un client_addr;
        socklen_t client_len = sizeof(client_addr);

        int client_fd = accept(server_fd_, (struct sockaddr*)&client_addr, &client_len);
        if (client_fd < 0) {
            if (errno == EINTR) {
                continue;
            }
            if (running_) {
                LOG_ERROR("Failed to accept IPC connection: {}", strerror(errno));
            }
            break;
        }

        std::lock_guard<std::mutex> lock(clients_mutex_);
        if (!running_) {
            close(client_fd);
            break;
        }

        try {
            std::thread client_thread([this, client_fd]() {
                handle_client(client_fd);
            });
            client_thread.detach();
        } catch (const std::system_error& e) {
            LOG_ERROR("Cannot serve IPC client: {}", e.what());
            close(client_fd);
            continue;
        }
        client_fds_.insert(client_fd);
        ++active_clients_;
    }

    LOG_INFO("IPC server accept loop stopped");
}

void IPCServer::handle_client(int client_fd) {
    try {
        auto line = read_line(client_fd);
        if (line) {
            auto request = parse_request(*line);
            if (request && request->command == "watch") {
                stream_updates(client_fd);
            } else {
                IPCResponse response = request ? handle_request(*request)
                                               : IPCResponse::error("Malformed request");
                if (!write_all(client_fd, encode_response(response))) {
                    LOG_DEBUG("IPC client went away before the response was written");
                }
            }
        }
    } catch (const std::exception& e) {
        LOG_ERROR("Error handling IPC client: {}", e.what());
    }

    std::lock_guard<std::mutex> lock(clients_mutex_);
    client_fds_.erase(client_fd);
    close(client_fd);
    --active_clients_;
    clients_cv_.notify_all();
}

size_t IPCServer::get_active_clients() const {
    std::lock_guard<std::mutex> lock(clients_mutex_);
    return active_clients_;
}

IPCResponse IPCServer::handle_request(const IPCRequest& request) {
    LOG_DEBUG("IPC request: {}", request.command);

    try {
        if (request.command == "status") {
            return handle_status_command(request);
        } else if (request.command == "list") {
            return handle_list_command(request);
        } else if (request.command == "get") {
            return handle_get_command(request);
        } else if (request.command == "add-magnet") {
            return handle_add_magnet_command(request);
        } else if (request.command == "add-file") {
            return handle_add_file_command(request);
        } else if (request.command == "seed") {
            return handle_seed_command(request);
        } else if (request.command == "pause") {
            return handle_pause_command(request);
        } else if (request.command == "resume") {
            return handle_resume_command(request);
        } else if (request.command == "remove") {
            return handle_remove_command(request);
        } else if (request.command == "stats") {
            return handle_stats_command(request);
        }
    } catch (const std::exception& e) {
        LOG_ERROR("IPC command {} failed: {}", request.command, e.what());
        return IPCResponse::error("Internal error: " + std::string(e.what()));
    }

    return IPCResponse::error("Unknown command: " + request.command);
}

void IPCServer::stream_updates(int client_fd) {
    auto subscription = manager_->subscribe();
    auto events = std::make_shared<BoundedQueue<session::SessionEvent>>(64);
    auto handler_id = manager_->add_event_handler([events](const session::SessionEvent& event) {
        events->push(event);
    });

    LOG_DEBUG("IPC watcher attached");
    bool connected = write_all(client_fd, encode_response(IPCResponse::ok("watching")));

    while (connected && running_) {
        while (auto event = events->try_pop()) {
            auto frame = IPCResponse::ok("event");
            frame.data["type"] = "event";
            frame.data["event"] = session::to_string(event->type);
            frame.data["id"] = event->session_id;
            frame.data["detail"] = event->message;
            if (!write_all(client_fd, encode_response(frame))) {
                connected = false;
                break;
            }
        }

        if (!connected) {
            break;
        }

        auto batch = subscription->pop_for(std::chrono::milliseconds(200));
        if (batch) {
            connected = write_all(client_fd, encode_response(make_batch_frame(*batch)));
        }
    }

    manager_->remove_event_handler(handler_id);
    manager_->unsubscribe(subscription);
    LOG_DEBUG("IPC watcher detached");
}

bool IPCServer::write_all(int fd, const std::string& data) {
    size_t written = 0;
    while (written < data.size()) {
        ssize_t n = send(fd, data.data() + written, data.size() - written, MSG_NOSIGNAL);
        if (n < 0 && errno == EINTR) {
            continue;
        }
        if (n <= 0) {
            return false;
        }
        written += static_cast<size_t>(n);
    }
    return true;
}

IPCResponse IPCServer::handle_status_command(const IPCRequest& request) {
    auto stats = manager_->get_stats();

    auto response = IPCResponse::ok("Status retrieved successfully");
    response.data["daemon_running"] = "true";
    response.data["session_count"] = std::to_string(stats.session_count);
    response.data["broadcasting"] = manager_->get_broadcaster().is_running() ? "true" : "false";
    response.data["tick_interval_ms"] = std::to_string(manager_->get_options().tick_interval.count());
    append_stats(response, stats);
    return response;
}

IPCResponse IPCServer::handle_list_command(const IPCRequest& request) {
    auto snapshots = manager_->get_all();

    auto response = IPCResponse::ok("Transfers retrieved successfully");
    response.data["count"] = std::to_string(snapshots.size());
    for (size_t i = 0; i < snapshots.size(); ++i) {
        append_snapshot(response, "t" + std::to_string(i) + ".", snapshots[i], false);
    }
    return response;
}

IPCResponse IPCServer::handle_get_command(const IPCRequest& request) {
    auto id = require(request, "id");
    if (!id) {
        return IPCResponse::error("Missing parameter: id");
    }

    auto snapshot = manager_->get(*id);
    if (!snapshot) {
        auto response = IPCResponse::error("Session not found: " + *id);
        response.data["error"] = session::to_string(session::SessionError::NOT_FOUND);
        return response;
    }

    auto response = IPCResponse::ok("Transfer retrieved successfully");
    append_snapshot(response, "", *snapshot, true);
    return response;
}

IPCResponse IPCServer::handle_add_magnet_command(const IPCRequest& request) {
    auto uri = require(request, "uri");
    if (!uri) {
        return IPCResponse::error("Missing parameter: uri");
    }
    return from_result(manager_->add_by_magnet(*uri), "Magnet added");
}

IPCResponse IPCServer::handle_add_file_command(const IPCRequest& request) {
    auto path = require(request, "path");
    if (!path) {
        return IPCResponse::error("Missing parameter: path");
    }
    return from_result(manager_->add_by_descriptor_file(*path), "Descriptor added");
}

IPCResponse IPCServer::handle_seed_command(const IPCRequest& request) {
    std::vector<std::string> paths;
    if (auto joined = require(request, "paths")) {
        for (const auto& path : utils::StringUtils::split(*joined, ';')) {
            if (!path.empty()) {
                paths.push_back(path);
            }
        }
    }
    return from_result(manager_->add_local_for_seeding(paths), "Seeding started");
}

IPCResponse IPCServer::handle_pause_command(const IPCRequest& request) {
    auto id = require(request, "id");
    if (!id) {
        return IPCResponse::error("Missing parameter: id");
    }
    return from_result(manager_->pause(*id), "Transfer paused");
}

IPCResponse IPCServer::handle_resume_command(const IPCRequest& request) {
    auto id = require(request, "id");
    if (!id) {
        return IPCResponse::error("Missing parameter: id");
    }
    return from_result(manager_->resume(*id), "Transfer resumed");
}

IPCResponse IPCServer::handle_remove_command(const IPCRequest& request) {
    auto id = require(request, "id");
    if (!id) {
        return IPCResponse::error("Missing parameter: id");
    }

    bool delete_files = false;
    if (auto flag = require(request, "delete_files")) {
        delete_files = parse_flag(*flag);
    }
    return from_result(manager_->remove(*id, delete_files), "Transfer removed");
}

IPCResponse IPCServer::handle_stats_command(const IPCRequest& request) {
    auto response = IPCResponse::ok("Statistics retrieved successfully");
    append_stats(response, manager_->get_stats());
    return response;
}

}
