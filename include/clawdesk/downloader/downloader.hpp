#pragma once

/*
 * clawdesk downloader - public types and interfaces (C++20)
 *
 * Streams one URL to one destination path:
 * - the HTTP transport is an IHttpAdapter (libcurl by default);
 * - the body is written chunk by chunk, at most one chunk ahead of the disk;
 * - progress is reported after every chunk write;
 * - no resume, no retry; a failed transfer leaves the partial file in place.
 */

#include <clawdesk/core/types.h>

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <filesystem>
#include <functional>
#include <memory>
#include <optional>
#include <span>
#include <string>
#include <string_view>
#include <vector>

namespace clawdesk::downloader {

inline constexpr std::size_t kDefaultChunkSize = 64 * 1024;
inline constexpr std::size_t kMinChunkSize = 4 * 1024;
inline constexpr std::size_t kMaxChunkSize = 8 * 1024 * 1024;

enum class DownloadState { InProgress, Completed, Failed };

[[nodiscard]] const char* toString(DownloadState state) noexcept;

struct Header {
    std::string name;
    std::string value;
};

/**
 * Progress after a chunk has reached the destination file.
 * `total` is 0 when the server did not declare a content length.
 */
struct ProgressEvent {
    std::string url;
    std::uint64_t downloaded{0};
    std::uint64_t total{0};

    [[nodiscard]] bool totalKnown() const noexcept { return total > 0; }

    /// 0.0 - 100.0, or nullopt when the total is unknown.
    [[nodiscard]] std::optional<double> percentage() const noexcept {
        if (total == 0)
            return std::nullopt;
        return static_cast<double>(downloaded) * 100.0 / static_cast<double>(total);
    }
};

/// State of one fetch call. `downloaded` never decreases and never exceeds a known total.
struct DownloadTask {
    std::string url;
    std::filesystem::path destination;
    std::optional<std::uint64_t> total;
    std::uint64_t downloaded{0};
    DownloadState state{DownloadState::InProgress};
};

struct DownloaderConfig {
    std::size_t chunkSizeBytes{kDefaultChunkSize};
    std::chrono::milliseconds timeout{0}; ///< whole transfer; 0 = no limit
    std::chrono::milliseconds connectTimeout{30000};
    /// Abort when less than one byte per second arrives for this long; 0 = never.
    std::chrono::milliseconds stallTimeout{60000};
    bool followRedirects{true};
    std::string userAgent;
    std::string proxy; ///< empty = libcurl default (environment proxies)
};

struct DownloadRequest {
    std::string url;
    std::filesystem::path destination;
    std::vector<Header> headers;
};

struct DownloadResult {
    std::string url;
    std::filesystem::path destination;
    std::uint64_t bytesWritten{0};
    std::optional<std::uint64_t> total;
    std::optional<int> httpStatus;
    std::chrono::milliseconds elapsed{0};
};

// ===================
// Callback signatures
// ===================

using ProgressCallback = std::function<void(const ProgressEvent&)>;
using ShouldCancel = std::function<bool()>; // return true to cancel before the next chunk

/// Final response of a GET, after redirects. `status` is 0 for non-HTTP schemes (file://).
struct HttpResponseInfo {
    int status{0};
    std::optional<std::uint64_t> contentLength;
};

using ResponseCallback = std::function<Result<void>(const HttpResponseInfo&)>;
using ByteSink = std::function<Result<void>(std::span<const std::byte>)>;

struct HttpGetOptions {
    std::vector<Header> headers;
    std::size_t receiveBufferBytes{kDefaultChunkSize};
    std::chrono::milliseconds timeout{0};
    std::chrono::milliseconds connectTimeout{30000};
    std::chrono::milliseconds stallTimeout{60000};
    bool followRedirects{true};
    std::string userAgent;
    std::string proxy;
    bool proxyTunnel{false}; ///< CONNECT through the proxy also for plain http://
};

/**
 * HTTP transport.
 *
 * get() calls onResponse exactly once before the first sink call (also for an
 * empty body), then the sink for each received block, on the calling thread.
 * An error from either callback aborts the transfer and is returned unchanged.
 * shouldCancel is polled before each block and while the transfer is idle; a
 * cancelled transfer returns OperationCancelled. A stalled body fails with Timeout.
 */
class IHttpAdapter {
public:
    virtual ~IHttpAdapter() = default;

    virtual Result<void> get(std::string_view url, const HttpGetOptions& options,
                             const ResponseCallback& onResponse, const ByteSink& sink,
                             const ShouldCancel& shouldCancel) = 0;
};

class IDownloadManager {
public:
    virtual ~IDownloadManager() = default;

    /**
     * Fetch request.url into request.destination, creating parent directories.
     * A non-2xx status fails with HttpError before the destination is touched.
     */
    virtual Result<DownloadResult> fetch(const DownloadRequest& request,
                                         const ProgressCallback& onProgress = {},
                                         const ShouldCancel& shouldCancel = {}) = 0;

    [[nodiscard]] virtual DownloaderConfig config() const = 0;
};

/// Clamp a configured chunk size into [kMinChunkSize, kMaxChunkSize]; 0 selects the default.
[[nodiscard]] std::size_t clampChunkSize(std::size_t requested) noexcept;

std::unique_ptr<IHttpAdapter> makeCurlHttpAdapter();

/// Default manager. A null adapter selects makeCurlHttpAdapter().
std::unique_ptr<IDownloadManager> makeDownloadManager(DownloaderConfig cfg,
                                                      std::unique_ptr<IHttpAdapter> http = nullptr);

} // namespace clawdesk::downloader
