#pragma once

#include <clawdesk/downloader/downloader.hpp>

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <cstdint>
#include <mutex>

namespace clawdesk::downloader {

/**
 * @brief Mailbox between a download and whoever renders it.
 *
 * The download thread publishes events; readers on any thread see the most
 * recent one (intermediate events may be skipped, never reordered). The
 * channel also carries the cancel request in the opposite direction.
 */
class ProgressChannel {
public:
    struct Snapshot {
        ProgressEvent event;
        std::uint64_t sequence{0}; ///< 0 until the first publish
        bool closed{false};
    };

    ProgressChannel() = default;
    ProgressChannel(const ProgressChannel&) = delete;
    ProgressChannel& operator=(const ProgressChannel&) = delete;

    void publish(const ProgressEvent& event);

    /// Mark the task finished and wake all waiters.
    void close();

    [[nodiscard]] Snapshot latest() const;

    /// Block until sequence > lastSeen, the channel closes, or timeout elapses.
    [[nodiscard]] Snapshot waitForUpdate(std::uint64_t lastSeen,
                                         std::chrono::milliseconds timeout) const;

    void cancel() noexcept;
    [[nodiscard]] bool isCancelled() const noexcept;

    /// Callbacks bound to this channel, for IDownloadManager::fetch.
    [[nodiscard]] ProgressCallback progressCallback();
    [[nodiscard]] ShouldCancel cancelPredicate() const;

private:
    mutable std::mutex mutex_;
    mutable std::condition_variable cv_;
    ProgressEvent latest_;
    std::uint64_t sequence_{0};
    bool closed_{false};
    std::atomic<bool> cancelled_{false};
};

} // namespace clawdesk::downloader
