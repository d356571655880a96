#pragma once

#include "transfer_session.hpp"
#include "rate_sampler.hpp"
#include "session_types.hpp"
#include <memory>
#include <optional>
#include <shared_mutex>
#include <string>
#include <unordered_map>
#include <vector>

namespace torrentflow::session {

// A session together with its two rate trackers. Entries are created and
// removed as a unit, so a session is never visible without its trackers.
struct SessionEntry {
    std::shared_ptr<TransferSession> session;
    RateTracker download;
    RateTracker upload;
};

class SessionRegistry {
public:
    virtual ~SessionRegistry() = default;

    // DUPLICATE_ID if the id is already present. Rate trackers start from the
    // handle's current counters; a failing counter read throws.
    virtual SessionResult insert(std::shared_ptr<TransferSession> session) = 0;

    // NOT_FOUND if absent. The removed session is handed back through `removed`.
    virtual SessionResult remove(const std::string& id, std::shared_ptr<TransferSession>* removed = nullptr) = 0;

    virtual std::optional<SessionEntry> get(const std::string& id) const = 0;

    // Copy of the whole registry taken at a single instant.
    virtual std::vector<SessionEntry> get_all() const = 0;

    virtual bool contains(const std::string& id) const = 0;
    virtual size_t size() const = 0;

    // Stores freshly sampled trackers. Ignored (returns false) when `session`
    // is no longer the object registered under its id.
    virtual bool record_sample(const std::shared_ptr<TransferSession>& session,
                               const RateTracker& download,
                               const RateTracker& upload) = 0;
};

// Single map behind a reader/writer lock.
class InMemorySessionRegistry : public SessionRegistry {
public:
    InMemorySessionRegistry() = default;

    SessionResult insert(std::shared_ptr<TransferSession> session) override;
    SessionResult remove(const std::string& id, std::shared_ptr<TransferSession>* removed = nullptr) override;

    std::optional<SessionEntry> get(const std::string& id) const override;
    std::vector<SessionEntry> get_all() const override;

    bool contains(const std::string& id) const override;
    size_t size() const override;

    bool record_sample(const std::shared_ptr<TransferSession>& session,
                       const RateTracker& download,
                       const RateTracker& upload) override;

private:
    std::unordered_map<std::string, SessionEntry> entries_;
    mutable std::shared_mutex mutex_;
};

} // namespace torrentflow::session
