#include "torrentflow/core/ipc_protocol.hpp"
#include "torrentflow/core/utils.hpp"
#include <sstream>
#include <algorithm>
#include <cctype>

namespace torrentflow::core {

namespace {

bool is_valid_key(const std::string& key) {
    return !key.empty() && std::all_of(key.begin(), key.end(), [](unsigned char c) {
        return std::isalnum(c) || c == '_' || c == '-' || c == '.';
    });
}

std::string single_line(std::string text) {
    std::replace(text.begin(), text.end(), '\n', ' ');
    text.erase(std::remove(text.begin(), text.end(), '\r'), text.end());
    return text;
}

}

std::string encode_request(const IPCRequest& request) {
    std::ostringstream out;
    out << request.command;

    for (const auto& [key, value] : request.parameters) {
        out << " " << key << "=" << utils::StringUtils::url_encode(value);
    }
    out << "\n";

    return out.str();
}

std::optional<IPCRequest> parse_request(const std::string& line) {
    std::string text = line;
    text.erase(std::remove(text.begin(), text.end(), '\n'), text.end());
    text.erase(std::remove(text.begin(), text.end(), '\r'), text.end());

    std::istringstream iss(text);
    IPCRequest request;
    if (!(iss >> request.command)) {
        return std::nullopt;
    }

    std::string token;
    while (iss >> token) {
        size_t eq_pos = token.find('=');
        if (eq_pos == std::string::npos) {
            return std::nullopt;
        }

        std::string key = token.substr(0, eq_pos);
        auto value = utils::StringUtils::url_decode(token.substr(eq_pos + 1));
        if (!is_valid_key(key) || !value) {
            return std::nullopt;
        }
        request.parameters[key] = *value;
    }

    return request;
}

std::string encode_response(const IPCResponse& response) {
    std::ostringstream out;
    out << (response.success ? "SUCCESS" : "ERROR") << "\n";
    out << single_line(response.message) << "\n";

    for (const auto& [key, value] : response.data) {
        out << key << "=" << utils::StringUtils::url_encode(value) << "\n";
    }
    out << IPC_END_MARKER << "\n";

    return out.str();
}

std::optional<IPCResponse> parse_response(const std::string& block) {
    std::istringstream in(block);
    std::string line;

    IPCResponse response;

    // First line: SUCCESS or ERROR
    if (!std::getline(in, line)) {
        return std::nullopt;
    }
    if (line == "SUCCESS") {
        response.success = true;
    } else if (line == "ERROR") {
        response.success = false;
    } else {
        return std::nullopt;
    }

    // Second line: message
    if (!std::getline(in, line)) {
        return std::nullopt;
    }
    response.message = line;

    // Remaining lines: key=value pairs until END
    while (std::getline(in, line)) {
        if (line == IPC_END_MARKER) {
            return response;
        }

        size_t eq_pos = line.find('=');
        if (eq_pos == std::string::npos) {
            return std::nullopt;
        }

        auto value = utils::StringUtils::url_decode(line.substr(eq_pos + 1));
        if (!value) {
            return std::nullopt;
        }
        response.data[line.substr(0, eq_pos)] = *value;
    }

    return std::nullopt;
}

}
