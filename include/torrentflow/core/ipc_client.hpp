#pragma once

#include "ipc_protocol.hpp"
#include <functional>
#include <optional>
#include <string>

namespace torrentflow::core {

class IPCClient {
public:
    IPCClient(const std::string& socket_path = "/tmp/torrentflow.sock");
    ~IPCClient();

    std::optional<IPCResponse> send_request(const IPCRequest& request);
    bool is_daemon_running();

    // Sends `watch` and hands every frame to `on_frame` until it returns
    // false or the daemon closes the connection. False if never connected.
    bool watch(const std::function<bool(const IPCResponse&)>& on_frame);

private:
    int connect_socket();

    std::string socket_path_;
};

}
