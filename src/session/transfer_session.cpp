#include "torrentflow/session/transfer_session.hpp"

namespace torrentflow::session {

TransferSession::TransferSession(std::string id, std::unique_ptr<engine::EngineHandle> handle, SourceKind source)
    : id_(std::move(id))
    , handle_(std::move(handle))
    , source_(source)
    , added_at_(std::chrono::system_clock::now())
    , added_steady_(Clock::now()) {
}

std::string TransferSession::get_display_name() const {
    auto name = handle_->name();
    return name.empty() ? METADATA_PLACEHOLDER_NAME : name;
}

void TransferSession::set_metadata_wait(std::shared_ptr<MetadataWait> wait) {
    std::lock_guard<std::mutex> lock(wait_mutex_);
    metadata_wait_ = std::move(wait);
}

std::shared_ptr<MetadataWait> TransferSession::get_metadata_wait() const {
    std::lock_guard<std::mutex> lock(wait_mutex_);
    return metadata_wait_;
}

std::unique_lock<std::recursive_mutex> TransferSession::lock_lifecycle() const {
    return std::unique_lock<std::recursive_mutex>(lifecycle_mutex_);
}

} // namespace torrentflow::session
