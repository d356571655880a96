#include "torrentflow/session/session_registry.hpp"
#include <mutex>

namespace torrentflow::session {

SessionResult InMemorySessionRegistry::insert(std::shared_ptr<TransferSession> session) {
    if (!session) {
        return SessionResult(SessionError::INVALID_INPUT, "Null session");
    }

    const std::string id = session->get_id();
    auto start = session->get_added_steady();
    // Engine errors propagate to the caller.
    uint64_t downloaded = session->get_handle().bytes_downloaded();
    uint64_t uploaded = session->get_handle().bytes_uploaded();

    std::unique_lock<std::shared_mutex> lock(mutex_);
    if (entries_.count(id)) {
        return SessionResult(SessionError::DUPLICATE_ID, "Session already exists: " + id, id);
    }

    SessionEntry entry;
    entry.session = std::move(session);
    entry.download = RateTracker(start, downloaded);
    entry.upload = RateTracker(start, uploaded);
    entries_.emplace(id, std::move(entry));

    return SessionResult(SessionError::SUCCESS, "", id);
}

SessionResult InMemorySessionRegistry::remove(const std::string& id, std::shared_ptr<TransferSession>* removed) {
    std::unique_lock<std::shared_mutex> lock(mutex_);

    auto it = entries_.find(id);
    if (it == entries_.end()) {
        return SessionResult(SessionError::NOT_FOUND, "Session not found: " + id, id);
    }

    if (removed) {
        *removed = std::move(it->second.session);
    }
    entries_.erase(it);

    return SessionResult(SessionError::SUCCESS, "", id);
}

std::optional<SessionEntry> InMemorySessionRegistry::get(const std::string& id) const {
    std::shared_lock<std::shared_mutex> lock(mutex_);

    auto it = entries_.find(id);
    if (it == entries_.end()) {
        return std::nullopt;
    }
    return it->second;
}

std::vector<SessionEntry> InMemorySessionRegistry::get_all() const {
    std::shared_lock<std::shared_mutex> lock(mutex_);

    std::vector<SessionEntry> result;
    result.reserve(entries_.size());
    for (const auto& [id, entry] : entries_) {
        result.push_back(entry);
    }
    return result;
}

bool InMemorySessionRegistry::contains(const std::string& id) const {
    std::shared_lock<std::shared_mutex> lock(mutex_);
    return entries_.count(id) > 0;
}

size_t InMemorySessionRegistry::size() const {
    std::shared_lock<std::shared_mutex> lock(mutex_);
    return entries_.size();
}

bool InMemorySessionRegistry::record_sample(const std::shared_ptr<TransferSession>& session,
                                            const RateTracker& download,
                                            const RateTracker& upload) {
    if (!session) {
        return false;
    }

    std::unique_lock<std::shared_mutex> lock(mutex_);

    auto it = entries_.find(session->get_id());
    if (it == entries_.end() || it->second.session != session) {
        return false;
    }

    it->second.download = download;
    it->second.upload = upload;
    return true;
}

} // namespace torrentflow::session
