#include "torrentflow/engine/storage_config.hpp"
#include "torrentflow/core/config.hpp"
#include "torrentflow/core/utils.hpp"

namespace torrentflow::engine {

StorageConfig::StorageConfig(const std::filesystem::path& download_dir)
    : download_directory(download_dir) {
}

StorageConfig StorageConfig::from_config() {
    auto& config = core::Config::instance();

    StorageConfig storage;
    storage.download_directory = core::utils::FileUtils::expand_home(
        config.get_string("session.download_dir", "~/TorrentFlow/Downloads"));
    if (storage.download_directory.is_relative()) {
        std::error_code ec;
        auto absolute = std::filesystem::absolute(storage.download_directory, ec);
        if (!ec) {
            storage.download_directory = absolute;
        }
    }

    int piece_size = config.get_int("seed.piece_size", 256 * 1024);
    if (piece_size > 0) {
        storage.seed_piece_length = static_cast<uint32_t>(piece_size);
    }

    storage.seed_announce = config.get_string("seed.announce");
    return storage;
}

bool StorageConfig::validate() const {
    if (download_directory.empty() || !download_directory.is_absolute()) {
        return false;
    }

    // 16KB to 16MB, power of two
    if (seed_piece_length < 16 * 1024 || seed_piece_length > 16 * 1024 * 1024) {
        return false;
    }
    if ((seed_piece_length & (seed_piece_length - 1)) != 0) {
        return false;
    }

    return true;
}

bool StorageConfig::create_directories() const {
    try {
        std::filesystem::create_directories(download_directory);
        return true;
    } catch (const std::filesystem::filesystem_error&) {
        return false;
    }
}

uint64_t StorageConfig::get_available_space() const {
    try {
        auto space_info = std::filesystem::space(download_directory);
        return space_info.available;
    } catch (const std::filesystem::filesystem_error&) {
        return 0;
    }
}

std::filesystem::path StorageConfig::get_file_path(const std::string& transfer_name,
                                                   const std::string& relative_path,
                                                   bool single_file) const {
    if (single_file) {
        return download_directory / transfer_name;
    }
    return download_directory / transfer_name / std::filesystem::path(relative_path);
}

} // namespace torrentflow::engine
