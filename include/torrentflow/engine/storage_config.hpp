#pragma once

#include <filesystem>
#include <string>
#include <cstdint>

namespace torrentflow::engine {

struct StorageConfig {
    std::filesystem::path download_directory;

    uint32_t seed_piece_length = 256 * 1024;
    std::string seed_announce;

    StorageConfig() = default;

    explicit StorageConfig(const std::filesystem::path& download_dir);

    // Reads session.download_dir, seed.piece_size and seed.announce.
    static StorageConfig from_config();

    bool validate() const;

    bool create_directories() const;

    uint64_t get_available_space() const;

    // Where a descriptor's file lands on disk.
    std::filesystem::path get_file_path(const std::string& transfer_name,
                                        const std::string& relative_path,
                                        bool single_file) const;
};

} // namespace torrentflow::engine
