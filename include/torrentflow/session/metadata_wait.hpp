#pragma once

#include <utility>
#include <boost/asio.hpp>
#include <atomic>
#include <chrono>
#include <functional>
#include <memory>

namespace torrentflow::session {

// Bounded wait for a transfer's metadata. Settles exactly once: either the
// metadata arrives, the timeout fires, or the wait is cancelled. The handler
// runs on the io_context thread and is not called after cancel().
class MetadataWait : public std::enable_shared_from_this<MetadataWait> {
public:
    using Handler = std::function<void(bool arrived)>;

    MetadataWait(boost::asio::io_context& io_context, std::chrono::milliseconds timeout);

    void start(Handler handler);

    // Safe from any thread.
    void notify_ready();
    void cancel();

    bool is_settled() const { return settled_.load(); }
    bool is_cancelled() const { return cancelled_.load(); }
    std::chrono::milliseconds get_timeout() const { return timeout_; }

private:
    bool settle();
    void finish(bool arrived);

    boost::asio::io_context& io_context_;
    boost::asio::steady_timer timer_;
    std::chrono::milliseconds timeout_;
    Handler handler_;

    std::atomic<bool> settled_{false};
    std::atomic<bool> cancelled_{false};
};

} // namespace torrentflow::session
