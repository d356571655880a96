#pragma once

#include "session_types.hpp"
#include "metadata_wait.hpp"
#include "rate_sampler.hpp"
#include "../engine/transfer_engine.hpp"
#include <string>
#include <memory>
#include <mutex>
#include <atomic>
#include <chrono>

namespace torrentflow::session {

constexpr const char* METADATA_PLACEHOLDER_NAME = "Loading metadata...";

// One active transfer. Owns its engine handle exclusively.
class TransferSession {
public:
    TransferSession(std::string id, std::unique_ptr<engine::EngineHandle> handle, SourceKind source);

    TransferSession(const TransferSession&) = delete;
    TransferSession& operator=(const TransferSession&) = delete;

    const std::string& get_id() const { return id_; }
    SourceKind get_source() const { return source_; }
    std::chrono::system_clock::time_point get_added_at() const { return added_at_; }
    Clock::time_point get_added_steady() const { return added_steady_; }

    engine::EngineHandle& get_handle() const { return *handle_; }

    // Engine name, or a placeholder while metadata is unresolved.
    std::string get_display_name() const;

    // Download intent the user asked for; metadata arrival honours it.
    bool is_pause_requested() const { return pause_requested_.load(); }
    void set_pause_requested(bool paused) { pause_requested_ = paused; }

    void set_metadata_wait(std::shared_ptr<MetadataWait> wait);
    std::shared_ptr<MetadataWait> get_metadata_wait() const;

    // Serialises the ADDED announcement against removal. Once marked
    // removed, nothing further is announced for this session.
    std::unique_lock<std::recursive_mutex> lock_lifecycle() const;
    void mark_removed() { removed_ = true; }
    bool is_removed() const { return removed_.load(); }

private:
    const std::string id_;
    std::unique_ptr<engine::EngineHandle> handle_;
    const SourceKind source_;
    const std::chrono::system_clock::time_point added_at_;
    const Clock::time_point added_steady_;

    std::atomic<bool> pause_requested_{false};
    std::atomic<bool> removed_{false};
    mutable std::recursive_mutex lifecycle_mutex_;

    mutable std::mutex wait_mutex_;
    std::shared_ptr<MetadataWait> metadata_wait_;
};

} // namespace torrentflow::session
