#include "torrentflow/core/ipc_client.hpp"
#include "torrentflow/core/logger.hpp"
#include <sys/socket.h>
#include <sys/un.h>
#include <unistd.h>
#include <cerrno>
#include <cstring>

namespace torrentflow::core {

namespace {

// Accumulates socket data and yields one complete response block at a time.
class FrameReader {
public:
    explicit FrameReader(int fd) : fd_(fd) {}

    std::optional<std::string> next_block() {
        while (true) {
            auto end = find_end();
            if (end != std::string::npos) {
                std::string block = buffer_.substr(0, end);
                buffer_.erase(0, end);
                return block;
            }

            char chunk[4096];
            ssize_t n = ::read(fd_, chunk, sizeof(chunk));
            if (n < 0 && errno == EINTR) {
                continue;
            }
            if (n <= 0) {
                return std::nullopt;
            }
            buffer_.append(chunk, static_cast<size_t>(n));
        }
    }

private:
    // Offset just past the first "END\n" line, or npos.
    size_t find_end() const {
        const std::string marker = std::string(IPC_END_MARKER) + "\n";
        size_t pos = 0;
        while (pos < buffer_.size()) {
            size_t eol = buffer_.find('\n', pos);
            if (eol == std::string::npos) {
                return std::string::npos;
            }
            if (buffer_.compare(pos, eol + 1 - pos, marker) == 0) {
                return eol + 1;
            }
            pos = eol + 1;
        }
        return std::string::npos;
    }

    int fd_;
    std::string buffer_;
};

bool send_all(int fd, const std::string& data) {
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

}

IPCClient::IPCClient(const std::string& socket_path)
    : socket_path_(socket_path) {
}

IPCClient::~IPCClient() {
}

int IPCClient::connect_socket() {
    int sock_fd = socket(AF_UNIX, SOCK_STREAM, 0);
    if (sock_fd < 0) {
        LOG_ERROR("Failed to create Unix socket: {}", strerror(errno));
        return -1;
    }

    struct sockaddr_un addr;
    memset(&addr, 0, sizeof(addr));
    addr.sun_family = AF_UNIX;
    strncpy(addr.sun_path, socket_path_.c_str(), sizeof(addr.sun_path) - 1);

    if (connect(sock_fd, (struct sockaddr*)&addr, sizeof(addr)) < 0) {
        LOG_DEBUG("Failed to connect to daemon socket: {}", strerror(errno));
        close(sock_fd);
        return -1;
    }

    return sock_fd;
}

std::optional<IPCResponse> IPCClient::send_request(const IPCRequest& request) {
    int sock_fd = connect_socket();
    if (sock_fd < 0) {
        return std::nullopt;
    }

    if (!send_all(sock_fd, encode_request(request))) {
        LOG_ERROR("Failed to write to daemon socket: {}", strerror(errno));
        close(sock_fd);
        return std::nullopt;
    }

    FrameReader reader(sock_fd);
    auto block = reader.next_block();
    close(sock_fd);

    if (!block) {
        LOG_ERROR("Failed to read from daemon socket");
        return std::nullopt;
    }

    auto response = parse_response(*block);
    if (!response) {
        LOG_ERROR("Malformed response from daemon");
    }
    return response;
}

bool IPCClient::is_daemon_running() {
    IPCRequest request;
    request.command = "status";

    auto response = send_request(request);
    return response.has_value() && response->success;
}

bool IPCClient::watch(const std::function<bool(const IPCResponse&)>& on_frame) {
    int sock_fd = connect_socket();
    if (sock_fd < 0) {
        return false;
    }

    IPCRequest request;
    request.command = "watch";
    if (!send_all(sock_fd, encode_request(request))) {
        close(sock_fd);
        return false;
    }

    FrameReader reader(sock_fd);
    while (auto block = reader.next_block()) {
        auto frame = parse_response(*block);
        if (!frame) {
            LOG_WARN("Skipping malformed frame from daemon");
            continue;
        }
        if (!on_frame(*frame)) {
            break;
        }
    }

    close(sock_fd);
    return true;
}

}
