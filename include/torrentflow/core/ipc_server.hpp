#pragma once

#include "ipc_protocol.hpp"
#include <atomic>
#include <condition_variable>
#include <memory>
#include <mutex>
#include <set>
#include <string>
#include <thread>

namespace torrentflow::session {
    class SessionManager;
    struct TransferSnapshot;
    struct GlobalStats;
    struct SnapshotBatch;
}

namespace torrentflow::core {

class IPCServer {
public:
    IPCServer(std::shared_ptr<session::SessionManager> manager,
              const std::string& socket_path = "/tmp/torrentflow.sock");
    ~IPCServer();

    bool start();
    void stop();
    bool is_running() const { return running_; }
    const std::string& get_socket_path() const { return socket_path_; }
    // Client connections still being served.
    size_t get_active_clients() const;

    // Dispatches one request; used by the socket loop and directly by tests.
    IPCResponse handle_request(const IPCRequest& request);

private:
    void accept_loop();
    void handle_client(int client_fd);
    void stream_updates(int client_fd);
    bool write_all(int fd, const std::string& data);

    IPCResponse handle_status_command(const IPCRequest& request);
    IPCResponse handle_list_command(const IPCRequest& request);
    IPCResponse handle_get_command(const IPCRequest& request);
    IPCResponse handle_add_magnet_command(const IPCRequest& request);
    IPCResponse handle_add_file_command(const IPCRequest& request);
    IPCResponse handle_seed_command(const IPCRequest& request);
    IPCResponse handle_pause_command(const IPCRequest& request);
    IPCResponse handle_resume_command(const IPCRequest& request);
    IPCResponse handle_remove_command(const IPCRequest& request);
    IPCResponse handle_stats_command(const IPCRequest& request);

    std::shared_ptr<session::SessionManager> manager_;
    std::string socket_path_;
    int server_fd_;
    std::atomic<bool> running_;
    std::thread accept_thread_;

    // Client threads are detached; stop() waits for the count to drain.
    mutable std::mutex clients_mutex_;
    std::condition_variable clients_cv_;
    std::set<int> client_fds_;
    size_t active_clients_ = 0;
};

// Flattens snapshots into response data. List entries are prefixed "t<i>.",
// files "t<i>.f<j>.".
void append_snapshot(IPCResponse& response, const std::string& prefix,
                     const session::TransferSnapshot& snapshot, bool include_files);
void append_stats(IPCResponse& response, const session::GlobalStats& stats);
IPCResponse make_batch_frame(const session::SnapshotBatch& batch);

}
