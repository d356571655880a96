#pragma once

#include "transfer_engine.hpp"
#include "storage_config.hpp"
#include <memory>
#include <mutex>
#include <set>
#include <string>

namespace torrentflow::engine {

struct PieceCheck {
    size_t verified_pieces = 0;
    uint64_t verified_bytes = 0;
    std::vector<uint64_t> file_bytes;   // verified bytes per file
};

// Hashes every piece of `descriptor` against the data found at `file_paths`
// (one path per descriptor file). Missing or short files count as unverified.
PieceCheck verify_pieces(const metainfo::TransferDescriptor& descriptor,
                         const std::vector<std::filesystem::path>& file_paths);

// Storage-only engine: no peer wire, no DHT. It maps transfers onto disk,
// reports what is already there and tracks piece request intent.
class LocalEngine : public TransferEngine {
public:
    explicit LocalEngine(const StorageConfig& config);
    ~LocalEngine() override;

    std::unique_ptr<EngineHandle> add_magnet(const metainfo::MagnetLink& link) override;
    std::unique_ptr<EngineHandle> add_descriptor(const metainfo::TransferDescriptor& descriptor) override;
    std::unique_ptr<EngineHandle> add_seed_only(const metainfo::TransferDescriptor& descriptor,
                                                const std::vector<std::filesystem::path>& files) override;

    size_t transfer_count() const;
    const StorageConfig& get_config() const { return config_; }

    struct ActiveSet {
        std::mutex mutex;
        std::set<std::string> info_hashes;
    };

private:
    StorageConfig config_;
    std::shared_ptr<ActiveSet> active_;

    void claim(const std::string& info_hash);
};

} // namespace torrentflow::engine
