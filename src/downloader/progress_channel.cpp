#include <clawdesk/downloader/progress_channel.h>

namespace clawdesk::downloader {

void ProgressChannel::publish(const ProgressEvent& event) {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (closed_) {
            return;
        }
        latest_ = event;
        ++sequence_;
    }
    cv_.notify_all();
}

void ProgressChannel::close() {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        closed_ = true;
    }
    cv_.notify_all();
}

ProgressChannel::Snapshot ProgressChannel::latest() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return Snapshot{latest_, sequence_, closed_};
}

ProgressChannel::Snapshot ProgressChannel::waitForUpdate(std::uint64_t lastSeen,
                                                         std::chrono::milliseconds timeout) const {
    std::unique_lock<std::mutex> lock(mutex_);
    cv_.wait_for(lock, timeout, [&] { return closed_ || sequence_ > lastSeen; });
    return Snapshot{latest_, sequence_, closed_};
}

void ProgressChannel::cancel() noexcept {
    cancelled_.store(true, std::memory_order_release);
}

bool ProgressChannel::isCancelled() const noexcept {
    return cancelled_.load(std::memory_order_acquire);
}

ProgressCallback ProgressChannel::progressCallback() {
    return [this](const ProgressEvent& ev) { publish(ev); };
}

ShouldCancel ProgressChannel::cancelPredicate() const {
    return [this] { return isCancelled(); };
}

} // namespace clawdesk::downloader
