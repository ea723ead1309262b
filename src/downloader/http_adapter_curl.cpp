/*
 * http_adapter_curl.cpp
 *
 * Notes
 * - Single streaming GET with the libcurl easy API.
 * - Blocks are handed to the sink synchronously from the write callback, so curl
 *   never reads further ahead than one receive buffer (CURLOPT_BUFFERSIZE).
 * - No Accept-Encoding: Content-Length must describe the bytes we write.
 * - The response callback fires on the first body byte (or after perform for an
 *   empty body). Status and length come from CURLINFO, which only describes the
 *   final response: proxy CONNECT, interim 1xx and followed 3xx blocks never
 *   reach the caller.
 * - Cancellation is polled from the xferinfo callback too, so an idle transfer
 *   still notices it; a body that stops flowing trips the low-speed limit.
 */

#include <clawdesk/downloader/downloader.hpp>

#include <spdlog/spdlog.h>
#include <curl/curl.h>

#include <algorithm>
#include <mutex>
#include <string_view>

namespace clawdesk::downloader {

namespace {

void ensureCurlGlobalInit() {
    static std::once_flag curlInitFlag;
    std::call_once(curlInitFlag, []() { curl_global_init(CURL_GLOBAL_ALL); });
}

Error makeCurlError(CURLcode code, std::string_view url) {
    Error err;
    err.message = "GET " + std::string(url) + ": " + curl_easy_strerror(code);
    switch (code) {
        case CURLE_OPERATION_TIMEDOUT:
            // Also the low-speed limit
            err.code = ErrorCode::Timeout;
            break;
        case CURLE_ABORTED_BY_CALLBACK:
            err.code = ErrorCode::OperationCancelled;
            break;
        case CURLE_FILE_COULDNT_READ_FILE:
            err.code = ErrorCode::FileNotFound;
            break;
        case CURLE_URL_MALFORMAT:
        case CURLE_UNSUPPORTED_PROTOCOL:
            err.code = ErrorCode::InvalidArgument;
            break;
        default:
            // DNS, connect, TLS, recv and partial-body failures
            err.code = ErrorCode::NetworkError;
            break;
    }
    return err;
}

struct TransferContext {
    CURL* curl{nullptr};

    const ResponseCallback* onResponse{nullptr};
    const ByteSink* sink{nullptr};
    const ShouldCancel* shouldCancel{nullptr};

    bool responseDelivered{false};
    bool cancelRequested{false};
    std::optional<Error> callbackError;
};

bool cancelRequested(TransferContext& ctx) {
    if (!ctx.cancelRequested && ctx.shouldCancel && *ctx.shouldCancel && (*ctx.shouldCancel)()) {
        ctx.cancelRequested = true;
    }
    return ctx.cancelRequested;
}

// Status and length of the final response (0 / unknown for file://).
Result<void> deliverResponse(TransferContext& ctx) {
    ctx.responseDelivered = true;
    long code = 0;
    curl_easy_getinfo(ctx.curl, CURLINFO_RESPONSE_CODE, &code);
    curl_off_t length = -1;
    curl_easy_getinfo(ctx.curl, CURLINFO_CONTENT_LENGTH_DOWNLOAD_T, &length);
    std::optional<std::uint64_t> total;
    if (length >= 0) {
        total = static_cast<std::uint64_t>(length);
    }
    spdlog::debug("[Download] response status={} length={}", code, length);
    if (!ctx.onResponse || !*ctx.onResponse) {
        return Result<void>();
    }
    return (*ctx.onResponse)(HttpResponseInfo{static_cast<int>(code), total});
}

size_t write_cb(char* ptr, size_t size, size_t nmemb, void* userdata) {
    const size_t total = size * nmemb;
    if (userdata == nullptr || total == 0)
        return 0;

    auto* ctx = static_cast<TransferContext*>(userdata);
    if (!ctx->responseDelivered) {
        auto r = deliverResponse(*ctx);
        if (!r) {
            ctx->callbackError = r.error();
            return 0;
        }
    }

    if (cancelRequested(*ctx)) {
        return 0;
    }

    std::span<const std::byte> bytes{reinterpret_cast<const std::byte*>(ptr), total};
    auto r = (*ctx->sink)(bytes);
    if (!r) {
        ctx->callbackError = r.error();
        return 0;
    }
    return total;
}

// Runs about once a second even when no data arrives.
int xferinfo_cb(void* userdata, curl_off_t /*dltotal*/, curl_off_t /*dlnow*/,
                curl_off_t /*ultotal*/, curl_off_t /*ulnow*/) {
    if (userdata == nullptr)
        return 0;
    return cancelRequested(*static_cast<TransferContext*>(userdata)) ? 1 : 0;
}

curl_slist* build_header_list(const std::vector<Header>& headers) {
    curl_slist* list = nullptr;
    for (const auto& h : headers) {
        std::string line = h.name;
        line.append(": ");
        line.append(h.value);
        list = curl_slist_append(list, line.c_str());
    }
    return list;
}

void configure_common(CURL* curl, const HttpGetOptions& opts) {
    curl_easy_setopt(curl, CURLOPT_TIMEOUT_MS, static_cast<long>(opts.timeout.count()));
    curl_easy_setopt(curl, CURLOPT_CONNECTTIMEOUT_MS,
                     static_cast<long>(opts.connectTimeout.count()));

    if (opts.stallTimeout.count() > 0) {
        const auto secs = std::max<long>(
            1, static_cast<long>((opts.stallTimeout.count() + 999) / 1000));
        curl_easy_setopt(curl, CURLOPT_LOW_SPEED_LIMIT, 1L);
        curl_easy_setopt(curl, CURLOPT_LOW_SPEED_TIME, secs);
    }

    curl_easy_setopt(curl, CURLOPT_FOLLOWLOCATION, opts.followRedirects ? 1L : 0L);
    curl_easy_setopt(curl, CURLOPT_MAXREDIRS, 10L);

    if (!opts.proxy.empty()) {
        curl_easy_setopt(curl, CURLOPT_PROXY, opts.proxy.c_str());
    }
    if (opts.proxyTunnel) {
        curl_easy_setopt(curl, CURLOPT_HTTPPROXYTUNNEL, 1L);
    }
    curl_easy_setopt(curl, CURLOPT_SUPPRESS_CONNECT_HEADERS, 1L);

    curl_easy_setopt(curl, CURLOPT_SSL_VERIFYPEER, 1L);
    curl_easy_setopt(curl, CURLOPT_SSL_VERIFYHOST, 2L);

    if (!opts.userAgent.empty()) {
        curl_easy_setopt(curl, CURLOPT_USERAGENT, opts.userAgent.c_str());
    }

    curl_easy_setopt(curl, CURLOPT_NOSIGNAL, 1L);
    curl_easy_setopt(curl, CURLOPT_TCP_KEEPALIVE, 1L);
    curl_easy_setopt(curl, CURLOPT_TCP_KEEPIDLE, 30L);
    curl_easy_setopt(curl, CURLOPT_TCP_KEEPINTVL, 15L);

    // libcurl accepts 1 KiB .. CURL_MAX_READ_SIZE
    const auto buffer = std::clamp<std::size_t>(opts.receiveBufferBytes, 1024, CURL_MAX_READ_SIZE);
    if (auto rc = curl_easy_setopt(curl, CURLOPT_BUFFERSIZE, static_cast<long>(buffer));
        rc != CURLE_OK) {
        spdlog::debug("[Download] receive buffer of {} bytes rejected: {}", buffer,
                      curl_easy_strerror(rc));
    }
}

class CurlHttpAdapter final : public IHttpAdapter {
public:
    CurlHttpAdapter() { ensureCurlGlobalInit(); }
    ~CurlHttpAdapter() override = default;

    Result<void> get(std::string_view url, const HttpGetOptions& options,
                     const ResponseCallback& onResponse, const ByteSink& sink,
                     const ShouldCancel& shouldCancel) override {
        if (!sink) {
            return Error{ErrorCode::InvalidArgument, "GET: no sink provided"};
        }

        CURL* curl = curl_easy_init();
        if (!curl) {
            return Error{ErrorCode::InternalError, "curl_easy_init failed"};
        }

        const std::string urlStr(url);
        curl_slist* list = build_header_list(options.headers);

        TransferContext ctx;
        ctx.curl = curl;
        ctx.onResponse = &onResponse;
        ctx.sink = &sink;
        ctx.shouldCancel = &shouldCancel;

        curl_easy_setopt(curl, CURLOPT_URL, urlStr.c_str());
        curl_easy_setopt(curl, CURLOPT_HTTPGET, 1L);
        if (list) {
            curl_easy_setopt(curl, CURLOPT_HTTPHEADER, list);
        }
        curl_easy_setopt(curl, CURLOPT_WRITEFUNCTION, write_cb);
        curl_easy_setopt(curl, CURLOPT_WRITEDATA, &ctx);
        curl_easy_setopt(curl, CURLOPT_XFERINFOFUNCTION, xferinfo_cb);
        curl_easy_setopt(curl, CURLOPT_XFERINFODATA, &ctx);
        curl_easy_setopt(curl, CURLOPT_NOPROGRESS, 0L);
        configure_common(curl, options);

        spdlog::debug("[Download] GET {}", urlStr);
        CURLcode rc = curl_easy_perform(curl);

        Result<void> result;
        if (ctx.callbackError) {
            result = *ctx.callbackError;
        } else if (ctx.cancelRequested) {
            result = Error{ErrorCode::OperationCancelled, "GET " + urlStr + ": cancelled"};
        } else if (rc != CURLE_OK) {
            result = makeCurlError(rc, urlStr);
        } else if (!ctx.responseDelivered) {
            // Empty body on a scheme without headers
            result = deliverResponse(ctx);
        }

        if (list)
            curl_slist_free_all(list);
        curl_easy_cleanup(curl);
        return result;
    }
};

} // namespace

std::unique_ptr<IHttpAdapter> makeCurlHttpAdapter() {
    return std::make_unique<CurlHttpAdapter>();
}

} // namespace clawdesk::downloader
