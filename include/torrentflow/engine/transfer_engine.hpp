#pragma once

#include "../metainfo/descriptor.hpp"
#include "../metainfo/magnet_link.hpp"
#include <string>
#include <vector>
#include <memory>
#include <functional>
#include <filesystem>
#include <stdexcept>
#include <cstdint>

namespace torrentflow::engine {

class EngineError : public std::runtime_error {
public:
    explicit EngineError(const std::string& message) : std::runtime_error(message) {}
};

// The engine already holds a transfer with this info-hash.
class DuplicateTransferError : public EngineError {
public:
    explicit DuplicateTransferError(const std::string& info_hash)
        : EngineError("Transfer already present in engine: " + info_hash), info_hash_(info_hash) {}

    const std::string& get_info_hash() const { return info_hash_; }

private:
    std::string info_hash_;
};

struct EngineFile {
    std::string name;                   // path inside the transfer
    std::filesystem::path path;         // location on disk
    uint64_t length = 0;
    uint64_t bytes_completed = 0;
};

// One transfer inside the engine. All methods may be called from any thread.
class EngineHandle {
public:
    virtual ~EngineHandle() = default;

    virtual std::string info_hash() const = 0;
    virtual std::string name() const = 0;          // empty until metadata is known
    virtual bool has_metadata() const = 0;

    virtual uint64_t bytes_completed() const = 0;
    virtual uint64_t total_length() const = 0;     // 0 until metadata is known
    // Cumulative payload counters.
    virtual uint64_t bytes_downloaded() const = 0;
    virtual uint64_t bytes_uploaded() const = 0;

    virtual uint32_t active_peer_count() const = 0;
    virtual uint32_t known_peer_count() const = 0;
    virtual uint32_t connected_seed_count() const = 0;

    virtual std::vector<EngineFile> file_list() const = 0;

    virtual void request_all_pieces() = 0;
    virtual void cancel_all_piece_requests() = 0;
    virtual bool pieces_requested() const = 0;

    // Detaches the transfer from the engine; files are left on disk.
    virtual void drop() = 0;

    // Invoked once, on an engine thread, when metadata becomes available.
    // Invoked immediately if it already is.
    virtual void on_metadata_ready(std::function<void()> callback) = 0;
};

class TransferEngine {
public:
    virtual ~TransferEngine() = default;

    // All three throw EngineError when the engine rejects the transfer.
    virtual std::unique_ptr<EngineHandle> add_magnet(const metainfo::MagnetLink& link) = 0;
    virtual std::unique_ptr<EngineHandle> add_descriptor(const metainfo::TransferDescriptor& descriptor) = 0;
    // Seeds `files` in place; they must match the descriptor's file list in order.
    virtual std::unique_ptr<EngineHandle> add_seed_only(const metainfo::TransferDescriptor& descriptor,
                                                        const std::vector<std::filesystem::path>& files) = 0;
};

} // namespace torrentflow::engine
