#include "torrentflow/session/session_types.hpp"

namespace torrentflow::session {

const char* to_string(TransferStatus status) {
    switch (status) {
        case TransferStatus::COMPLETED: return "completed";
        case TransferStatus::SEEDING: return "seeding";
        case TransferStatus::STALLED: return "stalled";
        case TransferStatus::PAUSED: return "paused";
        case TransferStatus::DOWNLOADING: return "downloading";
    }
    return "unknown";
}

const char* to_string(SessionError error) {
    switch (error) {
        case SessionError::SUCCESS: return "success";
        case SessionError::INVALID_INPUT: return "invalid input";
        case SessionError::NOT_FOUND: return "not found";
        case SessionError::DUPLICATE_ID: return "duplicate id";
        case SessionError::ENGINE_FAILURE: return "engine failure";
        case SessionError::PARSE_ERROR: return "parse error";
        case SessionError::METADATA_TIMEOUT: return "metadata timeout";
        case SessionError::PARTIAL_DELETION_FAILURE: return "partial deletion failure";
    }
    return "unknown";
}

const char* to_string(SourceKind kind) {
    switch (kind) {
        case SourceKind::MAGNET: return "magnet";
        case SourceKind::DESCRIPTOR: return "descriptor";
        case SourceKind::LOCAL_SEED: return "seed";
    }
    return "unknown";
}

const char* to_string(SessionEventType type) {
    switch (type) {
        case SessionEventType::ADDED: return "added";
        case SessionEventType::METADATA_TIMEOUT: return "metadata-timeout";
        case SessionEventType::SAMPLING_FAILED: return "sampling-failed";
        case SessionEventType::REMOVED: return "removed";
    }
    return "unknown";
}

} // namespace torrentflow::session
