#pragma once

#include "session_types.hpp"
#include "transfer_session.hpp"
#include <vector>
#include <optional>
#include <chrono>

namespace torrentflow::session {

// Reads the engine counters of one session and derives the snapshot.
// Propagates whatever the engine handle throws.
TransferSnapshot build_snapshot(const TransferSession& session,
                                uint64_t download_rate,
                                uint64_t upload_rate);

// remaining / rate, rounded down to whole seconds; nullopt when the
// transfer is complete, the total is unknown or nothing is arriving.
std::optional<std::chrono::seconds> estimate_eta(uint64_t bytes_completed,
                                                 uint64_t total_size,
                                                 uint64_t download_rate,
                                                 bool metadata_known = true);

GlobalStats aggregate_stats(const std::vector<TransferSnapshot>& snapshots);

// "Unknown" when there is no estimate.
std::string format_eta(const std::optional<std::chrono::seconds>& eta);

} // namespace torrentflow::session
