#include "torrentflow/session/snapshot_broadcaster.hpp"
#include "torrentflow/session/snapshot_builder.hpp"
#include "torrentflow/core/logger.hpp"
#include <algorithm>

namespace torrentflow::session {

SnapshotBroadcaster::SnapshotBroadcaster(boost::asio::io_context& io_context,
                                         std::shared_ptr<SessionRegistry> registry,
                                         std::chrono::milliseconds interval,
                                         size_t queue_capacity)
    : io_context_(io_context)
    , timer_(io_context)
    , registry_(std::move(registry))
    , interval_(interval.count() > 0 ? interval : std::chrono::milliseconds(1000))
    , queue_capacity_(queue_capacity) {
}

SnapshotBroadcaster::~SnapshotBroadcaster() {
    running_ = false;

    std::lock_guard<std::mutex> lock(subscribers_mutex_);
    for (auto& subscriber : subscribers_) {
        subscriber->close();
    }
}

void SnapshotBroadcaster::start() {
    if (running_.exchange(true)) {
        LOG_WARN("Snapshot broadcaster already running");
        return;
    }

    LOG_INFO("Snapshot broadcaster started ({} ms interval)", interval_.count());
    boost::asio::post(io_context_, [this]() { schedule_next(); });
}

void SnapshotBroadcaster::stop() {
    if (!running_.exchange(false)) {
        return;
    }

    LOG_INFO("Snapshot broadcaster stopped after {} ticks", tick_count_.load());
    boost::asio::post(io_context_, [this]() { timer_.cancel(); });
}

void SnapshotBroadcaster::schedule_next() {
    if (!running_) {
        return;
    }

    timer_.expires_after(interval_);
    timer_.async_wait([this](const boost::system::error_code& error) {
        if (error == boost::asio::error::operation_aborted || !running_) {
            return;
        }

        try {
            tick(Clock::now());
        } catch (const std::exception& e) {
            LOG_ERROR("Snapshot tick failed: {}", e.what());
        }
        schedule_next();
    });
}

SnapshotBatch SnapshotBroadcaster::tick(Clock::time_point now) {
    std::lock_guard<std::mutex> tick_lock(tick_mutex_);

    SnapshotBatch batch;
    batch.tick = ++tick_count_;
    batch.produced_at = std::chrono::system_clock::now();

    FailureHandler on_failure;
    {
        std::lock_guard<std::mutex> lock(state_mutex_);
        on_failure = failure_handler_;
    }

    auto entries = registry_->get_all();
    batch.snapshots.reserve(entries.size());

    for (auto& entry : entries) {
        const auto& session = entry.session;
        try {
            const auto& handle = session->get_handle();
            RateSampler::sample(entry.download, handle.bytes_downloaded(), now);
            RateSampler::sample(entry.upload, handle.bytes_uploaded(), now);

            auto snapshot = build_snapshot(*session, entry.download.current_rate, entry.upload.current_rate);

            // Skip sessions removed while this tick was running.
            if (!registry_->record_sample(session, entry.download, entry.upload)) {
                LOG_TRACE("Session {} removed during tick {}", session->get_id(), batch.tick);
                continue;
            }
            batch.snapshots.push_back(std::move(snapshot));
        } catch (const std::exception& e) {
            LOG_WARN("Sampling session {} failed: {}", session->get_id(), e.what());
            if (on_failure) {
                on_failure(session->get_id(), e.what());
            }
        }
    }

    std::sort(batch.snapshots.begin(), batch.snapshots.end(),
              [](const TransferSnapshot& a, const TransferSnapshot& b) {
                  return a.added_at != b.added_at ? a.added_at < b.added_at : a.id < b.id;
              });

    batch.stats = aggregate_stats(batch.snapshots);

    LOG_TRACE("Tick {}: {} sessions, down {} B/s, up {} B/s", batch.tick, batch.snapshots.size(),
              batch.stats.total_download_rate, batch.stats.total_upload_rate);

    {
        std::lock_guard<std::mutex> lock(state_mutex_);
        last_batch_ = batch;
    }

    publish(batch);
    return batch;
}

void SnapshotBroadcaster::publish(const SnapshotBatch& batch) {
    std::lock_guard<std::mutex> lock(subscribers_mutex_);

    subscribers_.erase(
        std::remove_if(subscribers_.begin(), subscribers_.end(),
                       [](const Subscription& subscriber) { return subscriber->is_closed(); }),
        subscribers_.end());

    for (auto& subscriber : subscribers_) {
        if (!subscriber->push(batch)) {
            LOG_DEBUG("Slow subscriber lost a batch ({} dropped so far)", subscriber->dropped_count());
        }
    }
}

SnapshotBroadcaster::Subscription SnapshotBroadcaster::subscribe() {
    auto subscription = std::make_shared<core::BoundedQueue<SnapshotBatch>>(queue_capacity_);

    std::lock_guard<std::mutex> lock(subscribers_mutex_);
    subscribers_.push_back(subscription);
    return subscription;
}

void SnapshotBroadcaster::unsubscribe(const Subscription& subscription) {
    if (!subscription) {
        return;
    }
    subscription->close();

    std::lock_guard<std::mutex> lock(subscribers_mutex_);
    subscribers_.erase(std::remove(subscribers_.begin(), subscribers_.end(), subscription),
                       subscribers_.end());
}

size_t SnapshotBroadcaster::subscriber_count() const {
    std::lock_guard<std::mutex> lock(subscribers_mutex_);
    return subscribers_.size();
}

std::optional<SnapshotBatch> SnapshotBroadcaster::get_last_batch() const {
    std::lock_guard<std::mutex> lock(state_mutex_);
    return last_batch_;
}

void SnapshotBroadcaster::set_failure_handler(FailureHandler handler) {
    std::lock_guard<std::mutex> lock(state_mutex_);
    failure_handler_ = std::move(handler);
}

} // namespace torrentflow::session
