#pragma once

#include <map>
#include <optional>
#include <string>

namespace torrentflow::core {

// Line protocol spoken over the daemon's Unix socket.
//
//   request:  COMMAND key=value key=value\n
//   response: SUCCESS|ERROR\n
//             <message>\n
//             key=value\n ...
//             END\n
//
// Values are percent-encoded on the wire; keys are plain tokens.

struct IPCRequest {
    std::string command;
    std::map<std::string, std::string> parameters;
};

struct IPCResponse {
    bool success = false;
    std::string message;
    std::map<std::string, std::string> data;

    static IPCResponse ok(const std::string& message = "") {
        IPCResponse response;
        response.success = true;
        response.message = message;
        return response;
    }

    static IPCResponse error(const std::string& message) {
        IPCResponse response;
        response.success = false;
        response.message = message;
        return response;
    }
};

constexpr size_t IPC_MAX_LINE = 64 * 1024;
constexpr const char* IPC_END_MARKER = "END";

std::string encode_request(const IPCRequest& request);
std::optional<IPCRequest> parse_request(const std::string& line);

std::string encode_response(const IPCResponse& response);
// Expects a complete block including the END line.
std::optional<IPCResponse> parse_response(const std::string& block);

}
