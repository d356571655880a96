#include "torrentflow/session/snapshot_builder.hpp"
#include "torrentflow/session/status_classifier.hpp"
#include "torrentflow/core/utils.hpp"

namespace torrentflow::session {

TransferSnapshot build_snapshot(const TransferSession& session,
                                uint64_t download_rate,
                                uint64_t upload_rate) {
    const auto& handle = session.get_handle();

    TransferSnapshot snapshot;
    snapshot.id = session.get_id();
    snapshot.source = session.get_source();
    snapshot.added_at = session.get_added_at();

    snapshot.metadata_known = handle.has_metadata();
    snapshot.bytes_completed = handle.bytes_completed();
    snapshot.total_size = snapshot.metadata_known ? handle.total_length() : 0;
    uint32_t active_peers = handle.active_peer_count();
    uint32_t known_peers = handle.known_peer_count();
    snapshot.seeds = handle.connected_seed_count();
    snapshot.peers = active_peers;

    snapshot.name = session.get_display_name();
    snapshot.progress = compute_progress(snapshot.bytes_completed, snapshot.total_size);
    snapshot.status = classify(snapshot.bytes_completed, snapshot.total_size,
                               active_peers, known_peers, snapshot.metadata_known);
    snapshot.download_rate = download_rate;
    snapshot.upload_rate = upload_rate;
    snapshot.eta = estimate_eta(snapshot.bytes_completed, snapshot.total_size,
                                download_rate, snapshot.metadata_known);

    if (snapshot.metadata_known) {
        for (const auto& file : handle.file_list()) {
            FileSnapshot entry;
            entry.name = file.name;
            entry.path = file.path.string();
            entry.size = file.length;
            entry.bytes_completed = file.bytes_completed;
            entry.progress = compute_progress(file.bytes_completed, file.length);
            snapshot.files.push_back(std::move(entry));
        }
    }

    return snapshot;
}

std::optional<std::chrono::seconds> estimate_eta(uint64_t bytes_completed,
                                                 uint64_t total_size,
                                                 uint64_t download_rate,
                                                 bool metadata_known) {
    if (!metadata_known || download_rate == 0 || bytes_completed >= total_size) {
        return std::nullopt;
    }

    uint64_t remaining = total_size - bytes_completed;
    return std::chrono::seconds(static_cast<std::chrono::seconds::rep>(remaining / download_rate));
}

GlobalStats aggregate_stats(const std::vector<TransferSnapshot>& snapshots) {
    GlobalStats stats;
    stats.session_count = static_cast<uint32_t>(snapshots.size());

    for (const auto& snapshot : snapshots) {
        stats.total_download_rate += snapshot.download_rate;
        stats.total_upload_rate += snapshot.upload_rate;
        stats.total_peers += snapshot.peers;

        if (snapshot.status != TransferStatus::COMPLETED && snapshot.status != TransferStatus::SEEDING) {
            ++stats.active_transfers;
        }
    }

    return stats;
}

std::string format_eta(const std::optional<std::chrono::seconds>& eta) {
    if (!eta) {
        return "Unknown";
    }
    return core::utils::StringUtils::format_duration(
        std::chrono::duration_cast<std::chrono::milliseconds>(*eta));
}

} // namespace torrentflow::session
