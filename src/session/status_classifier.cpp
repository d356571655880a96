#include "torrentflow/session/status_classifier.hpp"

namespace torrentflow::session {

TransferStatus classify(uint64_t bytes_completed,
                        uint64_t total_size,
                        uint32_t active_peers,
                        uint32_t known_peers,
                        bool metadata_known) {
    bool complete = metadata_known && bytes_completed >= total_size;

    if (complete) {
        return active_peers > 0 ? TransferStatus::SEEDING : TransferStatus::COMPLETED;
    }

    if (active_peers > 0) {
        return TransferStatus::DOWNLOADING;
    }

    return known_peers > 0 ? TransferStatus::STALLED : TransferStatus::PAUSED;
}

double compute_progress(uint64_t bytes_completed, uint64_t total_size) {
    if (total_size == 0) {
        return 0.0;
    }
    if (bytes_completed >= total_size) {
        return 100.0;
    }
    return static_cast<double>(bytes_completed) / static_cast<double>(total_size) * 100.0;
}

} // namespace torrentflow::session
