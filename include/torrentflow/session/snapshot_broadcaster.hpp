#pragma once

#include "session_registry.hpp"
#include "session_types.hpp"
#include "../core/bounded_queue.hpp"
#include <boost/asio.hpp>
#include <atomic>
#include <chrono>
#include <functional>
#include <memory>
#include <mutex>
#include <optional>
#include <vector>

namespace torrentflow::session {

class SnapshotBroadcaster {
public:
    using Subscription = std::shared_ptr<core::BoundedQueue<SnapshotBatch>>;
    using FailureHandler = std::function<void(const std::string& session_id, const std::string& error)>;

    SnapshotBroadcaster(boost::asio::io_context& io_context,
                        std::shared_ptr<SessionRegistry> registry,
                        std::chrono::milliseconds interval,
                        size_t queue_capacity);
    ~SnapshotBroadcaster();

    // Schedules periodic ticks on the io_context.
    void start();
    void stop();
    bool is_running() const { return running_.load(); }

    // One sampling pass at `now`. Ticks are serialized.
    SnapshotBatch tick(Clock::time_point now = Clock::now());

    // Each subscriber gets its own queue; a full queue loses its oldest batch.
    Subscription subscribe();
    void unsubscribe(const Subscription& subscription);
    size_t subscriber_count() const;

    std::optional<SnapshotBatch> get_last_batch() const;
    uint64_t get_tick_count() const { return tick_count_.load(); }
    std::chrono::milliseconds get_interval() const { return interval_; }

    void set_failure_handler(FailureHandler handler);

private:
    void schedule_next();
    void publish(const SnapshotBatch& batch);

    boost::asio::io_context& io_context_;
    boost::asio::steady_timer timer_;
    std::shared_ptr<SessionRegistry> registry_;
    std::chrono::milliseconds interval_;
    size_t queue_capacity_;

    std::atomic<bool> running_{false};
    std::atomic<uint64_t> tick_count_{0};
    std::mutex tick_mutex_;

    mutable std::mutex subscribers_mutex_;
    std::vector<Subscription> subscribers_;

    mutable std::mutex state_mutex_;
    std::optional<SnapshotBatch> last_batch_;
    FailureHandler failure_handler_;
};

} // namespace torrentflow::session
