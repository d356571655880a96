#include "torrentflow/metainfo/magnet_link.hpp"
#include "torrentflow/core/utils.hpp"
#include <cctype>

namespace torrentflow::metainfo {

namespace {

constexpr const char* MAGNET_PREFIX = "magnet:?";
constexpr const char* BTIH_PREFIX = "urn:btih:";

int hex_value(char c) {
    if (c >= '0' && c <= '9') return c - '0';
    if (c >= 'a' && c <= 'f') return c - 'a' + 10;
    if (c >= 'A' && c <= 'F') return c - 'A' + 10;
    return -1;
}

bool decode_hex(const std::string& text, Sha1Digest& out) {
    for (size_t i = 0; i < out.size(); ++i) {
        int high = hex_value(text[2 * i]);
        int low = hex_value(text[2 * i + 1]);
        if (high < 0 || low < 0) {
            return false;
        }
        out[i] = static_cast<uint8_t>((high << 4) | low);
    }
    return true;
}

// RFC 4648 alphabet, 32 characters -> 160 bits.
bool decode_base32(const std::string& text, Sha1Digest& out) {
    uint64_t buffer = 0;
    int bits = 0;
    size_t written = 0;

    for (char c : text) {
        char upper = static_cast<char>(std::toupper(static_cast<unsigned char>(c)));
        int value;
        if (upper >= 'A' && upper <= 'Z') {
            value = upper - 'A';
        } else if (upper >= '2' && upper <= '7') {
            value = upper - '2' + 26;
        } else {
            return false;
        }

        buffer = (buffer << 5) | static_cast<uint64_t>(value);
        bits += 5;
        if (bits >= 8) {
            bits -= 8;
            out[written++] = static_cast<uint8_t>((buffer >> bits) & 0xFF);
        }
    }

    return written == out.size();
}

}

std::optional<MagnetLink> MagnetLink::parse(const std::string& uri) {
    using core::utils::StringUtils;

    if (!StringUtils::starts_with(StringUtils::to_lower(uri.substr(0, 8)), MAGNET_PREFIX)) {
        return std::nullopt;
    }

    MagnetLink link;
    bool have_hash = false;

    for (const auto& param : StringUtils::split(uri.substr(8), '&')) {
        if (param.empty()) continue;

        auto eq = param.find('=');
        if (eq == std::string::npos) {
            return std::nullopt;
        }

        std::string key = param.substr(0, eq);
        auto value = StringUtils::url_decode(param.substr(eq + 1));
        if (!value) {
            return std::nullopt;
        }

        if (key == "xt") {
            if (!StringUtils::starts_with(StringUtils::to_lower(*value), BTIH_PREFIX)) {
                continue;   // other hash schemes are ignored
            }
            if (have_hash) {
                return std::nullopt;
            }

            std::string encoded = value->substr(9);
            bool ok = false;
            if (encoded.size() == 40) {
                ok = decode_hex(encoded, link.info_hash);
            } else if (encoded.size() == 32) {
                ok = decode_base32(encoded, link.info_hash);
            }
            if (!ok) {
                return std::nullopt;
            }
            have_hash = true;
        } else if (key == "dn") {
            if (!value->empty()) {
                link.display_name = *value;
            }
        } else if (key == "tr") {
            if (!value->empty()) {
                link.trackers.push_back(*value);
            }
        }
    }

    if (!have_hash) {
        return std::nullopt;
    }

    link.info_hash_hex = digest_to_hex(link.info_hash);
    return link;
}

std::string MagnetLink::to_uri() const {
    using core::utils::StringUtils;

    std::string uri = std::string(MAGNET_PREFIX) + "xt=" + BTIH_PREFIX + info_hash_hex;
    if (display_name) {
        uri += "&dn=" + StringUtils::url_encode(*display_name);
    }
    for (const auto& tracker : trackers) {
        uri += "&tr=" + StringUtils::url_encode(tracker);
    }
    return uri;
}

}
