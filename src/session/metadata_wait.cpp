#include "torrentflow/session/metadata_wait.hpp"

namespace torrentflow::session {

MetadataWait::MetadataWait(boost::asio::io_context& io_context, std::chrono::milliseconds timeout)
    : io_context_(io_context)
    , timer_(io_context)
    , timeout_(timeout) {
}

void MetadataWait::start(Handler handler) {
    handler_ = std::move(handler);

    // The timer is only touched from the io_context thread.
    auto self = shared_from_this();
    boost::asio::post(io_context_, [self]() {
        if (self->settled_.load()) {
            return;
        }

        self->timer_.expires_after(self->timeout_);
        self->timer_.async_wait([self](const boost::system::error_code& error) {
            if (error == boost::asio::error::operation_aborted) {
                return;
            }
            if (self->settle()) {
                self->finish(false);
            }
        });
    });
}

void MetadataWait::notify_ready() {
    if (!settle()) {
        return;
    }

    auto self = shared_from_this();
    boost::asio::post(io_context_, [self]() {
        self->timer_.cancel();
        self->finish(true);
    });
}

void MetadataWait::cancel() {
    if (!settle()) {
        return;
    }
    cancelled_ = true;

    auto self = shared_from_this();
    boost::asio::post(io_context_, [self]() {
        self->timer_.cancel();
        self->handler_ = nullptr;
    });
}

bool MetadataWait::settle() {
    return !settled_.exchange(true);
}

void MetadataWait::finish(bool arrived) {
    auto handler = std::move(handler_);
    handler_ = nullptr;
    if (handler) {
        handler(arrived);
    }
}

} // namespace torrentflow::session
