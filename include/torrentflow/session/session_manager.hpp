#pragma once

#include "session_types.hpp"
#include "session_registry.hpp"
#include "snapshot_broadcaster.hpp"
#include "transfer_session.hpp"
#include "../engine/transfer_engine.hpp"
#include "../metainfo/descriptor.hpp"
#include <boost/asio.hpp>
#include <atomic>
#include <chrono>
#include <functional>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <thread>
#include <vector>

namespace torrentflow::session {

struct SessionManagerOptions {
    std::chrono::milliseconds tick_interval{1000};
    std::chrono::milliseconds metadata_timeout{60000};
    size_t subscriber_queue = 8;
    uint32_t seed_piece_length = metainfo::DEFAULT_PIECE_LENGTH;
    std::string seed_announce = "udp://tracker.openbittorrent.com:80/announce";

    // session.tick_interval_ms, session.metadata_timeout_s,
    // session.subscriber_queue, seed.piece_size, seed.announce
    static SessionManagerOptions from_config();
};

class SessionManager {
public:
    using EventHandler = std::function<void(const SessionEvent&)>;
    using HandlerId = uint64_t;

    SessionManager(std::shared_ptr<engine::TransferEngine> engine,
                   SessionManagerOptions options = {},
                   std::shared_ptr<SessionRegistry> registry = nullptr);
    ~SessionManager();

    SessionManager(const SessionManager&) = delete;
    SessionManager& operator=(const SessionManager&) = delete;

    // Starts the io thread; with `broadcast` the periodic snapshot task too.
    void start(bool broadcast = true);
    void stop();
    bool is_running() const { return running_.load(); }

    // Adding
    SessionResult add_by_magnet(const std::string& uri);
    SessionResult add_by_descriptor_file(const std::string& path);
    SessionResult add_local_for_seeding(const std::vector<std::string>& paths);

    // Control
    SessionResult pause(const std::string& id);
    SessionResult resume(const std::string& id);
    SessionResult remove(const std::string& id, bool delete_files);

    // Queries. Rates come from the most recent tick; trackers are not touched.
    std::vector<TransferSnapshot> get_all() const;
    std::optional<TransferSnapshot> get(const std::string& id) const;
    GlobalStats get_stats() const;

    // Observers
    SnapshotBroadcaster::Subscription subscribe();
    void unsubscribe(const SnapshotBroadcaster::Subscription& subscription);
    HandlerId add_event_handler(EventHandler handler);
    void remove_event_handler(HandlerId id);

    SnapshotBroadcaster& get_broadcaster() { return *broadcaster_; }
    SessionRegistry& get_registry() { return *registry_; }
    const SessionManagerOptions& get_options() const { return options_; }

private:
    SessionResult register_session(std::shared_ptr<TransferSession> session);
    void watch_metadata(const std::shared_ptr<TransferSession>& session);
    void on_metadata_settled(const std::weak_ptr<TransferSession>& weak_session, bool arrived);
    bool is_current(const std::shared_ptr<TransferSession>& session) const;
    void emit(SessionEventType type, const std::string& id, const std::string& message = "");

    std::shared_ptr<engine::TransferEngine> engine_;
    SessionManagerOptions options_;
    std::shared_ptr<SessionRegistry> registry_;

    boost::asio::io_context io_context_;
    std::optional<boost::asio::executor_work_guard<boost::asio::io_context::executor_type>> work_guard_;
    std::thread io_thread_;
    std::atomic<bool> running_{false};

    std::unique_ptr<SnapshotBroadcaster> broadcaster_;

    mutable std::mutex handlers_mutex_;
    std::map<HandlerId, EventHandler> event_handlers_;
    HandlerId next_handler_id_ = 1;
};

} // namespace torrentflow::session
