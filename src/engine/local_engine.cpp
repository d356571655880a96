#include "torrentflow/engine/local_engine.hpp"
#include "torrentflow/core/logger.hpp"
#include <algorithm>
#include <atomic>
#include <fstream>

namespace torrentflow::engine {

namespace {

// Reads byte ranges of the concatenated payload out of the individual files.
class PayloadReader {
public:
    PayloadReader(const metainfo::TransferDescriptor& descriptor,
                  const std::vector<std::filesystem::path>& paths)
        : descriptor_(descriptor)
        , paths_(paths)
        , streams_(paths.size()) {
    }

    bool read(uint64_t offset, uint64_t length, std::vector<char>& out) {
        out.resize(length);
        uint64_t done = 0;

        for (size_t i = 0; i < descriptor_.files.size() && done < length; ++i) {
            const auto& file = descriptor_.files[i];
            uint64_t position = offset + done;
            if (position >= file.offset + file.length || file.length == 0) {
                continue;
            }

            uint64_t in_file = position - file.offset;
            uint64_t chunk = std::min(length - done, file.length - in_file);

            auto& stream = open(i);
            if (!stream.is_open()) {
                return false;
            }

            stream.clear();
            stream.seekg(static_cast<std::streamoff>(in_file));
            stream.read(out.data() + done, static_cast<std::streamsize>(chunk));
            if (static_cast<uint64_t>(stream.gcount()) != chunk) {
                return false;
            }
            done += chunk;
        }

        return done == length;
    }

private:
    std::ifstream& open(size_t index) {
        auto& stream = streams_[index];
        if (!stream.is_open() && !failed_.count(index)) {
            stream.open(paths_[index], std::ios::binary);
            if (!stream.is_open()) {
                failed_.insert(index);
            }
        }
        return stream;
    }

    const metainfo::TransferDescriptor& descriptor_;
    const std::vector<std::filesystem::path>& paths_;
    std::vector<std::ifstream> streams_;
    std::set<size_t> failed_;
};

class LocalHandle : public EngineHandle {
public:
    LocalHandle(std::shared_ptr<LocalEngine::ActiveSet> active, std::string info_hash)
        : active_(std::move(active))
        , info_hash_(std::move(info_hash)) {
    }

    ~LocalHandle() override {
        drop();
    }

    void set_metadata(std::string name, uint64_t total, uint64_t completed, std::vector<EngineFile> files) {
        std::lock_guard<std::mutex> lock(mutex_);
        name_ = std::move(name);
        total_length_ = total;
        bytes_completed_ = completed;
        files_ = std::move(files);
        has_metadata_ = true;
    }

    void set_display_name(std::string name) {
        std::lock_guard<std::mutex> lock(mutex_);
        name_ = std::move(name);
    }

    std::string info_hash() const override { return info_hash_; }

    std::string name() const override {
        std::lock_guard<std::mutex> lock(mutex_);
        return name_;
    }

    bool has_metadata() const override {
        std::lock_guard<std::mutex> lock(mutex_);
        return has_metadata_;
    }

    uint64_t bytes_completed() const override {
        std::lock_guard<std::mutex> lock(mutex_);
        return dropped_ ? 0 : bytes_completed_;
    }

    uint64_t total_length() const override {
        std::lock_guard<std::mutex> lock(mutex_);
        return dropped_ ? 0 : total_length_;
    }

    uint64_t bytes_downloaded() const override { return 0; }
    uint64_t bytes_uploaded() const override { return 0; }

    uint32_t active_peer_count() const override { return 0; }
    uint32_t known_peer_count() const override { return 0; }
    uint32_t connected_seed_count() const override { return 0; }

    std::vector<EngineFile> file_list() const override {
        std::lock_guard<std::mutex> lock(mutex_);
        if (dropped_ || !has_metadata_) {
            return {};
        }
        return files_;
    }

    void request_all_pieces() override {
        if (!dropped_.load()) {
            pieces_requested_ = true;
        }
    }

    void cancel_all_piece_requests() override {
        pieces_requested_ = false;
    }

    bool pieces_requested() const override {
        return pieces_requested_.load();
    }

    void drop() override {
        if (dropped_.exchange(true)) {
            return;
        }
        pieces_requested_ = false;

        std::lock_guard<std::mutex> lock(active_->mutex);
        active_->info_hashes.erase(info_hash_);
    }

    void on_metadata_ready(std::function<void()> callback) override {
        {
            std::lock_guard<std::mutex> lock(mutex_);
            if (!has_metadata_) {
                // No metadata exchange without peers; the callback never fires.
                return;
            }
        }
        if (callback) {
            callback();
        }
    }

private:
    std::shared_ptr<LocalEngine::ActiveSet> active_;
    const std::string info_hash_;

    mutable std::mutex mutex_;
    std::string name_;
    bool has_metadata_ = false;
    uint64_t total_length_ = 0;
    uint64_t bytes_completed_ = 0;
    std::vector<EngineFile> files_;

    std::atomic<bool> pieces_requested_{false};
    std::atomic<bool> dropped_{false};
};

std::vector<EngineFile> make_file_list(const metainfo::TransferDescriptor& descriptor,
                                       const std::vector<std::filesystem::path>& paths,
                                       const PieceCheck& check) {
    std::vector<EngineFile> files;
    files.reserve(descriptor.files.size());

    for (size_t i = 0; i < descriptor.files.size(); ++i) {
        EngineFile file;
        file.name = descriptor.single_file ? descriptor.name : descriptor.name + "/" + descriptor.files[i].path;
        file.path = paths[i];
        file.length = descriptor.files[i].length;
        file.bytes_completed = check.file_bytes[i];
        files.push_back(std::move(file));
    }

    return files;
}

}

PieceCheck verify_pieces(const metainfo::TransferDescriptor& descriptor,
                         const std::vector<std::filesystem::path>& file_paths) {
    PieceCheck check;
    check.file_bytes.assign(descriptor.files.size(), 0);

    if (file_paths.size() != descriptor.files.size()) {
        return check;
    }

    PayloadReader reader(descriptor, file_paths);
    std::vector<char> buffer;

    for (size_t index = 0; index < descriptor.piece_count(); ++index) {
        uint64_t start = static_cast<uint64_t>(index) * descriptor.piece_length;
        uint64_t size = descriptor.piece_size(index);

        if (!reader.read(start, size, buffer)) {
            continue;
        }
        if (metainfo::sha1(buffer.data(), buffer.size()) != descriptor.piece_hashes[index]) {
            continue;
        }

        ++check.verified_pieces;
        check.verified_bytes += size;

        uint64_t end = start + size;
        for (size_t i = 0; i < descriptor.files.size(); ++i) {
            const auto& file = descriptor.files[i];
            uint64_t lo = std::max(start, file.offset);
            uint64_t hi = std::min(end, file.offset + file.length);
            if (lo < hi) {
                check.file_bytes[i] += hi - lo;
            }
        }
    }

    return check;
}

LocalEngine::LocalEngine(const StorageConfig& config)
    : config_(config)
    , active_(std::make_shared<ActiveSet>()) {
    LOG_INFO("Local engine storing transfers under {}", config_.download_directory.string());
}

LocalEngine::~LocalEngine() = default;

size_t LocalEngine::transfer_count() const {
    std::lock_guard<std::mutex> lock(active_->mutex);
    return active_->info_hashes.size();
}

void LocalEngine::claim(const std::string& info_hash) {
    std::lock_guard<std::mutex> lock(active_->mutex);
    if (!active_->info_hashes.insert(info_hash).second) {
        throw DuplicateTransferError(info_hash);
    }
}

std::unique_ptr<EngineHandle> LocalEngine::add_magnet(const metainfo::MagnetLink& link) {
    claim(link.info_hash_hex);

    auto handle = std::make_unique<LocalHandle>(active_, link.info_hash_hex);
    if (link.display_name) {
        handle->set_display_name(*link.display_name);
    }

    LOG_DEBUG("Engine accepted magnet {}", link.info_hash_hex);
    return handle;
}

std::unique_ptr<EngineHandle> LocalEngine::add_descriptor(const metainfo::TransferDescriptor& descriptor) {
    if (!config_.create_directories()) {
        throw EngineError("Cannot create download directory " + config_.download_directory.string());
    }

    std::vector<std::filesystem::path> paths;
    paths.reserve(descriptor.files.size());
    for (const auto& file : descriptor.files) {
        paths.push_back(config_.get_file_path(descriptor.name, file.path, descriptor.single_file));
    }

    claim(descriptor.info_hash_hex);
    auto handle = std::make_unique<LocalHandle>(active_, descriptor.info_hash_hex);

    auto check = verify_pieces(descriptor, paths);
    handle->set_metadata(descriptor.name, descriptor.total_size, check.verified_bytes,
                         make_file_list(descriptor, paths, check));

    LOG_DEBUG("Engine accepted descriptor {}: {}/{} pieces on disk",
              descriptor.info_hash_hex, check.verified_pieces, descriptor.piece_count());
    return handle;
}

std::unique_ptr<EngineHandle> LocalEngine::add_seed_only(const metainfo::TransferDescriptor& descriptor,
                                                         const std::vector<std::filesystem::path>& files) {
    if (files.size() != descriptor.files.size()) {
        throw EngineError("Seed file list does not match descriptor");
    }

    claim(descriptor.info_hash_hex);
    auto handle = std::make_unique<LocalHandle>(active_, descriptor.info_hash_hex);

    auto check = verify_pieces(descriptor, files);
    if (check.verified_pieces != descriptor.piece_count()) {
        // handle's destructor releases the claim
        throw EngineError("Seed data does not match its descriptor (" +
                          std::to_string(check.verified_pieces) + "/" +
                          std::to_string(descriptor.piece_count()) + " pieces)");
    }

    handle->set_metadata(descriptor.name, descriptor.total_size, check.verified_bytes,
                         make_file_list(descriptor, files, check));

    LOG_DEBUG("Engine seeding {} from {} local files", descriptor.info_hash_hex, files.size());
    return handle;
}

} // namespace torrentflow::engine
