/*
 * clawdesk/src/downloader/download_manager.cpp
 *
 * DownloadManager (single stream, no resume):
 * - create the destination's parent directories
 * - GET through IHttpAdapter; the declared content length becomes the total
 * - non-2xx status is rejected before the destination is opened
 * - every block from the transport is cut into chunkSizeBytes pieces; each piece
 *   is written and flushed before progress is emitted and the next is taken
 * - failures carry url, destination and byte offset; the partial file stays
 */

#include <clawdesk/downloader/downloader.hpp>
#include <clawdesk/version.hpp>

#include <spdlog/spdlog.h>

#include <algorithm>
#include <fstream>
#include <system_error>
#include <utility>

namespace clawdesk::downloader {

namespace fs = std::filesystem;

const char* toString(DownloadState state) noexcept {
    switch (state) {
        case DownloadState::InProgress:
            return "in_progress";
        case DownloadState::Completed:
            return "completed";
        case DownloadState::Failed:
            return "failed";
    }
    return "failed";
}

std::size_t clampChunkSize(std::size_t requested) noexcept {
    if (requested == 0) {
        return kDefaultChunkSize;
    }
    return std::clamp(requested, kMinChunkSize, kMaxChunkSize);
}

namespace {

bool isSuccessStatus(int status) {
    // 0: non-HTTP scheme such as file://
    return status == 0 || (status >= 200 && status < 300);
}

class DownloadManager final : public IDownloadManager {
public:
    DownloadManager(DownloaderConfig cfg, std::unique_ptr<IHttpAdapter> http)
        : config_(std::move(cfg)), http_(std::move(http)) {
        config_.chunkSizeBytes = clampChunkSize(config_.chunkSizeBytes);
        if (config_.userAgent.empty()) {
            config_.userAgent = std::string("clawdesk/") + version::string_v;
        }
        if (!http_) {
            http_ = makeCurlHttpAdapter();
        }
    }

    Result<DownloadResult> fetch(const DownloadRequest& request, const ProgressCallback& onProgress,
                                 const ShouldCancel& shouldCancel) override {
        if (request.url.empty()) {
            return Error{ErrorCode::InvalidArgument, "fetch: empty URL"};
        }
        if (request.destination.empty()) {
            return Error{ErrorCode::InvalidArgument, "fetch " + request.url + ": empty destination"};
        }

        const auto started = std::chrono::steady_clock::now();
        DownloadTask task{request.url, request.destination, std::nullopt, 0,
                          DownloadState::InProgress};
        const std::string dest = request.destination.string();

        if (auto parent = request.destination.parent_path(); !parent.empty()) {
            std::error_code ec;
            fs::create_directories(parent, ec);
            if (ec) {
                return Error{ErrorCode::IoError,
                             "fetch " + request.url + ": cannot create directory " +
                                 parent.string() + ": " + ec.message()};
            }
        }

        std::ofstream out;
        std::optional<int> httpStatus;
        bool responded = false;

        auto emit = [&]() {
            if (onProgress) {
                onProgress(ProgressEvent{request.url, task.downloaded, task.total.value_or(0)});
            }
        };

        auto onResponse = [&](const HttpResponseInfo& info) -> Result<void> {
            responded = true;
            if (info.status != 0) {
                httpStatus = info.status;
            }
            if (!isSuccessStatus(info.status)) {
                return Error{ErrorCode::HttpError,
                             "GET " + request.url + ": HTTP " + std::to_string(info.status)};
            }
            // A declared length of 0 is still "known": the body is empty.
            task.total = info.contentLength;
            out.open(request.destination, std::ios::binary | std::ios::out | std::ios::trunc);
            if (!out) {
                return Error{ErrorCode::IoError, "cannot open " + dest + " for writing"};
            }
            spdlog::debug("[Download] {} -> {} (total {})", request.url, dest,
                          task.total ? std::to_string(*task.total) : std::string("unknown"));
            emit();
            return Result<void>();
        };

        auto sink = [&](std::span<const std::byte> data) -> Result<void> {
            std::size_t offset = 0;
            while (offset < data.size()) {
                if (offset > 0 && shouldCancel && shouldCancel()) {
                    return Error{ErrorCode::OperationCancelled, "GET " + request.url + ": cancelled"};
                }
                const auto n = std::min(config_.chunkSizeBytes, data.size() - offset);
                if (task.total && task.downloaded + n > *task.total) {
                    return Error{ErrorCode::NetworkError,
                                 "GET " + request.url + ": body exceeds declared length of " +
                                     std::to_string(*task.total) + " bytes"};
                }
                out.write(reinterpret_cast<const char*>(data.data() + offset),
                          static_cast<std::streamsize>(n));
                out.flush();
                if (!out) {
                    return Error{ErrorCode::IoError, "write to " + dest + " failed"};
                }
                task.downloaded += n;
                offset += n;
                emit();
            }
            return Result<void>();
        };

        HttpGetOptions opts;
        opts.headers = request.headers;
        opts.receiveBufferBytes = config_.chunkSizeBytes;
        opts.timeout = config_.timeout;
        opts.connectTimeout = config_.connectTimeout;
        opts.stallTimeout = config_.stallTimeout;
        opts.proxy = config_.proxy;
        opts.followRedirects = config_.followRedirects;
        opts.userAgent = config_.userAgent;

        auto r = http_->get(request.url, opts, onResponse, sink, shouldCancel);

        if (out.is_open()) {
            out.close();
            if (r && out.fail()) {
                r = Error{ErrorCode::IoError, "closing " + dest + " failed"};
            }
        }
        if (r && !responded) {
            // Transport finished without ever describing a response.
            r = Error{ErrorCode::NetworkError, "GET " + request.url + ": no response"};
        }
        if (r && task.total && task.downloaded < *task.total) {
            r = Error{ErrorCode::NetworkError, "GET " + request.url + ": connection closed after " +
                                                   std::to_string(task.downloaded) + " of " +
                                                   std::to_string(*task.total) + " bytes"};
        }

        if (!r) {
            task.state = DownloadState::Failed;
            Error err = r.error();
            err.message = "fetch " + request.url + " -> " + dest + " failed at byte offset " +
                          std::to_string(task.downloaded) + ": " + err.message;
            if (err.code == ErrorCode::OperationCancelled) {
                spdlog::info("[Download] {}", err.message);
            } else {
                spdlog::error("[Download] {}", err.message);
            }
            return err;
        }

        task.state = DownloadState::Completed;
        DownloadResult result;
        result.url = request.url;
        result.destination = request.destination;
        result.bytesWritten = task.downloaded;
        result.total = task.total;
        result.httpStatus = httpStatus;
        result.elapsed = std::chrono::duration_cast<std::chrono::milliseconds>(
            std::chrono::steady_clock::now() - started);
        spdlog::info("[Download] {} complete: {} bytes in {} ms", dest, result.bytesWritten,
                     result.elapsed.count());
        return result;
    }

    [[nodiscard]] DownloaderConfig config() const override { return config_; }

private:
    DownloaderConfig config_;
    std::unique_ptr<IHttpAdapter> http_;
};

} // namespace

std::unique_ptr<IDownloadManager> makeDownloadManager(DownloaderConfig cfg,
                                                      std::unique_ptr<IHttpAdapter> http) {
    return std::make_unique<DownloadManager>(std::move(cfg), std::move(http));
}

} // namespace clawdesk::downloader
