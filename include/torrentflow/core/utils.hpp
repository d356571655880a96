#pragma once

#include <string>
#include <vector>
#include <chrono>
#include <optional>
#include <filesystem>
#include <cstdint>

namespace torrentflow::core::utils {

class StringUtils {
public:
    static std::vector<std::string> split(const std::string& str, char delimiter);
    static std::string join(const std::vector<std::string>& parts, const std::string& delimiter);
    static std::string trim(const std::string& str);
    static std::string to_lower(const std::string& str);
    static bool starts_with(const std::string& str, const std::string& prefix);

    static std::string format_bytes(uint64_t bytes);
    static std::string format_speed(uint64_t bytes_per_second);
    static std::string format_duration(std::chrono::milliseconds duration);

    // RFC 3986 percent-encoding; unreserved characters pass through.
    static std::string url_encode(const std::string& str);
    // Returns nullopt on a truncated or non-hex escape. '+' is kept literal.
    static std::optional<std::string> url_decode(const std::string& str);

    static std::string to_hex(const uint8_t* data, size_t size);
};

class FileUtils {
public:
    static bool exists(const std::filesystem::path& path);
    static bool is_file(const std::filesystem::path& path);

    // Reads the whole file in binary mode.
    static std::optional<std::string> read_file(const std::filesystem::path& path);
    static bool write_file(const std::filesystem::path& path, const std::string& content);

    static std::filesystem::path get_home_dir();

    // Replaces a leading "~" with the home directory.
    static std::filesystem::path expand_home(const std::string& path);
};

class TimeUtils {
public:
    static std::chrono::system_clock::time_point now();
    static std::string to_iso_string(const std::chrono::system_clock::time_point& time);
    static std::string format_timestamp(const std::chrono::system_clock::time_point& time);
};

}
