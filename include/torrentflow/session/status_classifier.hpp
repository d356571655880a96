#pragma once

#include "session_types.hpp"
#include <cstdint>

namespace torrentflow::session {

// Derives the status from engine counters alone; nothing is stored.
// Without metadata the total is unknown and the transfer counts as incomplete.
TransferStatus classify(uint64_t bytes_completed,
                        uint64_t total_size,
                        uint32_t active_peers,
                        uint32_t known_peers,
                        bool metadata_known = true);

// 0 when the total is unknown or zero, clamped to 100.
double compute_progress(uint64_t bytes_completed, uint64_t total_size);

} // namespace torrentflow::session
