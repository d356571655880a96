#pragma once

#include <string>
#include <vector>
#include <optional>
#include <chrono>
#include <cstdint>

namespace torrentflow::session {

enum class TransferStatus {
    COMPLETED,
    SEEDING,
    STALLED,
    PAUSED,
    DOWNLOADING
};

const char* to_string(TransferStatus status);

enum class SessionError {
    SUCCESS = 0,
    INVALID_INPUT,
    NOT_FOUND,
    DUPLICATE_ID,
    ENGINE_FAILURE,
    PARSE_ERROR,
    METADATA_TIMEOUT,
    PARTIAL_DELETION_FAILURE
};

const char* to_string(SessionError error);

struct SessionResult {
    SessionError error;
    std::string message;
    std::string session_id;

    SessionResult(SessionError err = SessionError::SUCCESS, std::string msg = "", std::string id = "")
        : error(err), message(std::move(msg)), session_id(std::move(id)) {}

    bool success() const { return error == SessionError::SUCCESS; }
    // The operation took effect even though something is reported.
    bool completed() const {
        return success() ||
               error == SessionError::METADATA_TIMEOUT ||
               error == SessionError::PARTIAL_DELETION_FAILURE;
    }
    operator bool() const { return success(); }
};

enum class SourceKind {
    MAGNET,
    DESCRIPTOR,
    LOCAL_SEED
};

const char* to_string(SourceKind kind);

struct FileSnapshot {
    std::string name;
    std::string path;
    uint64_t size = 0;
    uint64_t bytes_completed = 0;
    double progress = 0.0;
};

// Immutable projection of one session at one tick.
struct TransferSnapshot {
    std::string id;
    std::string name;
    SourceKind source = SourceKind::MAGNET;
    bool metadata_known = false;
    uint64_t total_size = 0;
    uint64_t bytes_completed = 0;
    double progress = 0.0;
    TransferStatus status = TransferStatus::PAUSED;
    uint64_t download_rate = 0;
    uint64_t upload_rate = 0;
    uint32_t peers = 0;
    uint32_t seeds = 0;
    std::optional<std::chrono::seconds> eta;
    std::vector<FileSnapshot> files;
    std::chrono::system_clock::time_point added_at;
};

struct GlobalStats {
    uint64_t total_download_rate = 0;
    uint64_t total_upload_rate = 0;
    uint32_t total_peers = 0;
    uint32_t active_transfers = 0;     // not yet complete
    uint32_t session_count = 0;
};

struct SnapshotBatch {
    uint64_t tick = 0;
    std::chrono::system_clock::time_point produced_at;
    std::vector<TransferSnapshot> snapshots;
    GlobalStats stats;
};

enum class SessionEventType {
    ADDED,
    METADATA_TIMEOUT,
    SAMPLING_FAILED,
    REMOVED
};

const char* to_string(SessionEventType type);

struct SessionEvent {
    SessionEventType type;
    std::string session_id;
    std::string message;
};

} // namespace torrentflow::session
