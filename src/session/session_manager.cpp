#include "torrentflow/session/session_manager.hpp"
#include "torrentflow/session/snapshot_builder.hpp"
#include "torrentflow/metainfo/magnet_link.hpp"
#include "torrentflow/core/config.hpp"
#include "torrentflow/core/logger.hpp"
#include "torrentflow/core/utils.hpp"
#include <algorithm>
#include <stdexcept>

namespace torrentflow::session {

SessionManagerOptions SessionManagerOptions::from_config() {
    auto& config = core::Config::instance();
    SessionManagerOptions options;

    int tick_ms = config.get_int("session.tick_interval_ms", 1000);
    if (tick_ms > 0) {
        options.tick_interval = std::chrono::milliseconds(tick_ms);
    }

    int timeout_s = config.get_int("session.metadata_timeout_s", 60);
    if (timeout_s > 0) {
        options.metadata_timeout = std::chrono::seconds(timeout_s);
    }

    int queue = config.get_int("session.subscriber_queue", 8);
    if (queue > 0) {
        options.subscriber_queue = static_cast<size_t>(queue);
    }

    int piece_size = config.get_int("seed.piece_size", static_cast<int>(metainfo::DEFAULT_PIECE_LENGTH));
    if (piece_size > 0) {
        options.seed_piece_length = static_cast<uint32_t>(piece_size);
    }

    options.seed_announce = config.get_string("seed.announce", options.seed_announce);
    return options;
}

SessionManager::SessionManager(std::shared_ptr<engine::TransferEngine> engine,
                               SessionManagerOptions options,
                               std::shared_ptr<SessionRegistry> registry)
    : engine_(std::move(engine))
    , options_(std::move(options))
    , registry_(registry ? std::move(registry) : std::make_shared<InMemorySessionRegistry>()) {

    if (!engine_) {
        throw std::invalid_argument("SessionManager requires a transfer engine");
    }

    broadcaster_ = std::make_unique<SnapshotBroadcaster>(io_context_, registry_,
                                                         options_.tick_interval,
                                                         options_.subscriber_queue);
    broadcaster_->set_failure_handler([this](const std::string& id, const std::string& error) {
        emit(SessionEventType::SAMPLING_FAILED, id, error);
    });
}

SessionManager::~SessionManager() {
    stop();

    // Sessions own timers bound to io_context_; release them while it exists.
    for (const auto& entry : registry_->get_all()) {
        if (auto wait = entry.session->get_metadata_wait()) {
            wait->cancel();
            entry.session->set_metadata_wait(nullptr);
        }
        auto result = registry_->remove(entry.session->get_id());
        if (!result) {
            LOG_DEBUG("Session {} already gone at shutdown", entry.session->get_id());
        }
    }
}

void SessionManager::start(bool broadcast) {
    if (running_.exchange(true)) {
        LOG_WARN("Session manager already running");
        return;
    }

    io_context_.restart();
    work_guard_.emplace(boost::asio::make_work_guard(io_context_));
    io_thread_ = std::thread([this]() {
        LOG_INFO("Session manager IO thread started");
        while (running_) {
            try {
                io_context_.run();
                break;
            } catch (const std::exception& e) {
                LOG_ERROR("Session manager IO error: {}", e.what());
                if (!running_) break;
                io_context_.restart();
            }
        }
        LOG_INFO("Session manager IO thread stopped");
    });

    if (broadcast) {
        broadcaster_->start();
    }

    LOG_INFO("Session manager started");
}

void SessionManager::stop() {
    if (!running_.exchange(false)) {
        return;
    }

    LOG_INFO("Stopping session manager");
    broadcaster_->stop();

    work_guard_.reset();
    io_context_.stop();
    if (io_thread_.joinable()) {
        io_thread_.join();
    }
}

SessionResult SessionManager::add_by_magnet(const std::string& uri) {
    auto link = metainfo::MagnetLink::parse(core::utils::StringUtils::trim(uri));
    if (!link) {
        return SessionResult(SessionError::INVALID_INPUT, "Invalid magnet link");
    }

    const std::string id = link->info_hash_hex;
    if (registry_->contains(id)) {
        return SessionResult(SessionError::DUPLICATE_ID, "Transfer already added: " + id, id);
    }

    std::unique_ptr<engine::EngineHandle> handle;
    try {
        handle = engine_->add_magnet(*link);
    } catch (const engine::DuplicateTransferError& e) {
        LOG_WARN("Engine already holds magnet {}", id);
        return SessionResult(SessionError::DUPLICATE_ID, e.what(), id);
    } catch (const std::exception& e) {
        LOG_ERROR("Engine rejected magnet {}: {}", id, e.what());
        return SessionResult(SessionError::ENGINE_FAILURE, e.what(), id);
    }

    if (!handle) {
        return SessionResult(SessionError::ENGINE_FAILURE, "Engine returned no transfer", id);
    }

    auto session = std::make_shared<TransferSession>(id, std::move(handle), SourceKind::MAGNET);
    auto lifecycle = session->lock_lifecycle();
    auto result = register_session(session);
    if (!result) {
        return result;
    }

    LOG_INFO("Added magnet {} ({})", id, link->display_name.value_or("no name"));
    watch_metadata(session);
    return result;
}

SessionResult SessionManager::add_by_descriptor_file(const std::string& path) {
    auto file_path = core::utils::FileUtils::expand_home(path);
    if (!core::utils::FileUtils::is_file(file_path)) {
        return SessionResult(SessionError::NOT_FOUND, "Descriptor file not found: " + path);
    }

    metainfo::TransferDescriptor descriptor;
    try {
        descriptor = metainfo::TransferDescriptor::load_from_file(file_path);
    } catch (const metainfo::DescriptorError& e) {
        LOG_WARN("Cannot load descriptor {}: {}", path, e.what());
        return SessionResult(SessionError::PARSE_ERROR, e.what());
    }

    const std::string id = descriptor.info_hash_hex;
    if (registry_->contains(id)) {
        return SessionResult(SessionError::DUPLICATE_ID, "Transfer already added: " + id, id);
    }

    std::unique_ptr<engine::EngineHandle> handle;
    try {
        handle = engine_->add_descriptor(descriptor);
    } catch (const engine::DuplicateTransferError& e) {
        LOG_WARN("Engine already holds descriptor {}", id);
        return SessionResult(SessionError::DUPLICATE_ID, e.what(), id);
    } catch (const std::exception& e) {
        LOG_ERROR("Engine rejected descriptor {}: {}", id, e.what());
        return SessionResult(SessionError::ENGINE_FAILURE, e.what(), id);
    }

    if (!handle) {
        return SessionResult(SessionError::ENGINE_FAILURE, "Engine returned no transfer", id);
    }

    auto session = std::make_shared<TransferSession>(id, std::move(handle), SourceKind::DESCRIPTOR);
    auto lifecycle = session->lock_lifecycle();
    auto result = register_session(session);
    if (!result) {
        return result;
    }

    session->get_handle().request_all_pieces();
    LOG_INFO("Added descriptor {} ({}, {})", id, descriptor.name,
             core::utils::StringUtils::format_bytes(descriptor.total_size));
    emit(SessionEventType::ADDED, id);
    return result;
}

SessionResult SessionManager::add_local_for_seeding(const std::vector<std::string>& paths) {
    if (paths.empty()) {
        return SessionResult(SessionError::INVALID_INPUT, "No files provided");
    }

    std::vector<std::filesystem::path> files;
    files.reserve(paths.size());
    for (const auto& path : paths) {
        auto file_path = core::utils::FileUtils::expand_home(path);
        if (!core::utils::FileUtils::exists(file_path)) {
            return SessionResult(SessionError::NOT_FOUND, "File not found: " + path);
        }
        files.push_back(std::move(file_path));
    }

    metainfo::TransferDescriptor descriptor;
    try {
        metainfo::DescriptorBuilder builder(options_.seed_piece_length);
        builder.set_announce(options_.seed_announce);
        descriptor = builder.build(files);
    } catch (const metainfo::DescriptorError& e) {
        LOG_WARN("Cannot describe local files: {}", e.what());
        return SessionResult(SessionError::INVALID_INPUT, e.what());
    }

    const std::string id = descriptor.info_hash_hex;
    if (registry_->contains(id)) {
        return SessionResult(SessionError::DUPLICATE_ID, "Transfer already added: " + id, id);
    }

    std::unique_ptr<engine::EngineHandle> handle;
    try {
        handle = engine_->add_seed_only(descriptor, files);
    } catch (const engine::DuplicateTransferError& e) {
        LOG_WARN("Engine already holds seed {}", id);
        return SessionResult(SessionError::DUPLICATE_ID, e.what(), id);
    } catch (const std::exception& e) {
        LOG_ERROR("Engine rejected seed {}: {}", id, e.what());
        return SessionResult(SessionError::ENGINE_FAILURE, e.what(), id);
    }

    if (!handle) {
        return SessionResult(SessionError::ENGINE_FAILURE, "Engine returned no transfer", id);
    }

    auto session = std::make_shared<TransferSession>(id, std::move(handle), SourceKind::LOCAL_SEED);
    auto lifecycle = session->lock_lifecycle();
    auto result = register_session(session);
    if (!result) {
        return result;
    }

    LOG_INFO("Seeding {} local files as {} ({})", files.size(), id, descriptor.name);
    emit(SessionEventType::ADDED, id);
    return result;
}

SessionResult SessionManager::register_session(std::shared_ptr<TransferSession> session) {
    SessionResult result;
    try {
        result = registry_->insert(session);
    } catch (const std::exception& e) {
        LOG_ERROR("Cannot read initial counters of {}: {}", session->get_id(), e.what());
        session->get_handle().drop();
        return SessionResult(SessionError::ENGINE_FAILURE, e.what(), session->get_id());
    }

    if (result.error == SessionError::DUPLICATE_ID) {
        // Lost a race with a concurrent add of the same content.
        LOG_WARN("Duplicate session {}, dropping engine transfer", session->get_id());
        session->get_handle().drop();
    }
    return result;
}

void SessionManager::watch_metadata(const std::shared_ptr<TransferSession>& session) {
    auto wait = std::make_shared<MetadataWait>(io_context_, options_.metadata_timeout);
    session->set_metadata_wait(wait);

    std::weak_ptr<TransferSession> weak_session = session;
    wait->start([this, weak_session](bool arrived) {
        on_metadata_settled(weak_session, arrived);
    });

    std::weak_ptr<MetadataWait> weak_wait = wait;
    session->get_handle().on_metadata_ready([weak_wait]() {
        if (auto wait = weak_wait.lock()) {
            wait->notify_ready();
        }
    });
}

void SessionManager::on_metadata_settled(const std::weak_ptr<TransferSession>& weak_session, bool arrived) {
    auto session = weak_session.lock();
    if (!session) {
        return;
    }

    auto lifecycle = session->lock_lifecycle();
    if (session->is_removed() || !is_current(session)) {
        return;
    }

    const auto& id = session->get_id();
    if (!arrived) {
        LOG_WARN("Metadata for {} not received within {} s; transfer kept", id,
                 std::chrono::duration_cast<std::chrono::seconds>(options_.metadata_timeout).count());
        emit(SessionEventType::METADATA_TIMEOUT, id, "Metadata not received in time");
        return;
    }

    if (!session->is_pause_requested()) {
        session->get_handle().request_all_pieces();
    }
    LOG_INFO("Metadata received for {} ({})", id, session->get_display_name());
    emit(SessionEventType::ADDED, id);
}

bool SessionManager::is_current(const std::shared_ptr<TransferSession>& session) const {
    auto entry = registry_->get(session->get_id());
    return entry && entry->session == session;
}

SessionResult SessionManager::pause(const std::string& id) {
    auto entry = registry_->get(id);
    if (!entry) {
        return SessionResult(SessionError::NOT_FOUND, "Session not found: " + id, id);
    }

    entry->session->set_pause_requested(true);
    auto& handle = entry->session->get_handle();
    if (handle.pieces_requested()) {
        handle.cancel_all_piece_requests();
        LOG_INFO("Paused {}", id);
    } else {
        LOG_DEBUG("{} is not requesting pieces, nothing to pause", id);
    }
    return SessionResult(SessionError::SUCCESS, "", id);
}

SessionResult SessionManager::resume(const std::string& id) {
    auto entry = registry_->get(id);
    if (!entry) {
        return SessionResult(SessionError::NOT_FOUND, "Session not found: " + id, id);
    }

    entry->session->set_pause_requested(false);
    auto& handle = entry->session->get_handle();
    if (!handle.has_metadata()) {
        // Pieces are requested once metadata arrives.
        LOG_INFO("Resume of {} takes effect when metadata arrives", id);
    } else if (!handle.pieces_requested()) {
        handle.request_all_pieces();
        LOG_INFO("Resumed {}", id);
    } else {
        LOG_DEBUG("{} is already requesting pieces", id);
    }
    return SessionResult(SessionError::SUCCESS, "", id);
}

SessionResult SessionManager::remove(const std::string& id, bool delete_files) {
    std::shared_ptr<TransferSession> session;
    auto result = registry_->remove(id, &session);
    if (!result) {
        return result;
    }

    {
        // Waits out an ADDED announcement already under way.
        auto lifecycle = session->lock_lifecycle();
        session->mark_removed();
    }

    if (auto wait = session->get_metadata_wait()) {
        wait->cancel();
    }

    auto& handle = session->get_handle();
    std::vector<engine::EngineFile> files;
    if (delete_files && handle.has_metadata()) {
        files = handle.file_list();
    }
    std::string name = session->get_display_name();

    handle.drop();

    size_t failures = 0;
    for (const auto& file : files) {
        std::error_code ec;
        bool removed = std::filesystem::remove(file.path, ec);
        if (ec) {
            ++failures;
            LOG_WARN("Failed to delete {}: {}", file.path.string(), ec.message());
        } else if (!removed) {
            LOG_DEBUG("Nothing to delete at {}", file.path.string());
        }
    }

    if (delete_files && !files.empty()) {
        LOG_INFO("Removed {} and deleted {} of {} files", name, files.size() - failures, files.size());
    } else {
        LOG_INFO("Removed {}", name);
    }
    emit(SessionEventType::REMOVED, id);

    if (failures > 0) {
        return SessionResult(SessionError::PARTIAL_DELETION_FAILURE,
                             std::to_string(failures) + " file(s) could not be deleted", id);
    }
    return SessionResult(SessionError::SUCCESS, "", id);
}

std::vector<TransferSnapshot> SessionManager::get_all() const {
    std::vector<TransferSnapshot> snapshots;
    for (const auto& entry : registry_->get_all()) {
        try {
            snapshots.push_back(build_snapshot(*entry.session, entry.download.current_rate,
                                               entry.upload.current_rate));
        } catch (const std::exception& e) {
            LOG_WARN("Cannot query session {}: {}", entry.session->get_id(), e.what());
        }
    }

    std::sort(snapshots.begin(), snapshots.end(), [](const TransferSnapshot& a, const TransferSnapshot& b) {
        return a.added_at != b.added_at ? a.added_at < b.added_at : a.id < b.id;
    });
    return snapshots;
}

std::optional<TransferSnapshot> SessionManager::get(const std::string& id) const {
    auto entry = registry_->get(id);
    if (!entry) {
        return std::nullopt;
    }

    try {
        return build_snapshot(*entry->session, entry->download.current_rate, entry->upload.current_rate);
    } catch (const std::exception& e) {
        LOG_WARN("Cannot query session {}: {}", id, e.what());
        return std::nullopt;
    }
}

GlobalStats SessionManager::get_stats() const {
    return aggregate_stats(get_all());
}

SnapshotBroadcaster::Subscription SessionManager::subscribe() {
    return broadcaster_->subscribe();
}

void SessionManager::unsubscribe(const SnapshotBroadcaster::Subscription& subscription) {
    broadcaster_->unsubscribe(subscription);
}

SessionManager::HandlerId SessionManager::add_event_handler(EventHandler handler) {
    std::lock_guard<std::mutex> lock(handlers_mutex_);
    HandlerId id = next_handler_id_++;
    event_handlers_[id] = std::move(handler);
    return id;
}

void SessionManager::remove_event_handler(HandlerId id) {
    std::lock_guard<std::mutex> lock(handlers_mutex_);
    event_handlers_.erase(id);
}

void SessionManager::emit(SessionEventType type, const std::string& id, const std::string& message) {
    std::vector<EventHandler> handlers;
    {
        std::lock_guard<std::mutex> lock(handlers_mutex_);
        for (const auto& [handler_id, handler] : event_handlers_) {
            handlers.push_back(handler);
        }
    }

    SessionEvent event{type, id, message};
    for (const auto& handler : handlers) {
        try {
            handler(event);
        } catch (const std::exception& e) {
            LOG_ERROR("Event handler failed on {} for {}: {}", to_string(type), id, e.what());
        }
    }
}

} // namespace torrentflow::session
