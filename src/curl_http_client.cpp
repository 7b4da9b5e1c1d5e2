#include "fetchkit/http_client.hpp"
#include "fetchkit/errors.hpp"

#include <algorithm>
#include <cctype>
#include <exception>
#include <memory>
#include <string>
#include <utility>

#include <curl/curl.h>
#include <fmt/format.h>
#include <spdlog/spdlog.h>

namespace fetchkit {

namespace {

using CurlHandle = std::unique_ptr<CURL, decltype(&curl_easy_cleanup)>;

// Process-wide libcurl setup, done before the first handle is created and
// torn down at exit. A failed init is retried by the next client.
class CurlGlobal {
public:
    static void ensureInitialized() { static const CurlGlobal instance; }

    CurlGlobal(const CurlGlobal&) = delete;
    CurlGlobal& operator=(const CurlGlobal&) = delete;

private:
    CurlGlobal() {
        const CURLcode rc = curl_global_init(CURL_GLOBAL_DEFAULT);
        if (rc != CURLE_OK) {
            throw TransferError(ErrorCode::NetworkError,
                                fmt::format("Failed to initialize libcurl: {}",
                                            curl_easy_strerror(rc)));
        }
    }
    ~CurlGlobal() { curl_global_cleanup(); }
};

struct TransferContext {
    CURL* curl{nullptr};
    const ResponseCallbacks* callbacks{nullptr};
    bool head_delivered{false};
    bool stopped{false};
    std::exception_ptr error;
};

ResponseHead readHead(CURL* curl) {
    ResponseHead head;
    curl_easy_getinfo(curl, CURLINFO_RESPONSE_CODE, &head.status);
    curl_off_t length = -1;
    if (curl_easy_getinfo(curl, CURLINFO_CONTENT_LENGTH_DOWNLOAD_T, &length) == CURLE_OK &&
        length >= 0) {
        head.content_length = static_cast<std::uint64_t>(length);
    }
    return head;
}

size_t writeCallback(char* ptr, size_t size, size_t nmemb, void* userdata) {
    auto* ctx = static_cast<TransferContext*>(userdata);
    const size_t total = size * nmemb;
    if (!ctx || total == 0) {
        return 0;
    }

    try {
        if (!ctx->head_delivered) {
            ctx->head_delivered = true;
            if (ctx->callbacks->on_head) {
                ctx->callbacks->on_head(readHead(ctx->curl));
            }
        }
        if (ctx->callbacks->on_data) {
            ctx->callbacks->on_data(ptr, total);
        }
    } catch (...) {
        // Rethrown by get() once curl_easy_perform has unwound.
        ctx->error = std::current_exception();
        return 0;
    }
    return total;
}

int transferInfoCallback(void* userdata, curl_off_t, curl_off_t, curl_off_t, curl_off_t) {
    auto* ctx = static_cast<TransferContext*>(userdata);
    if (ctx && ctx->callbacks->should_stop && ctx->callbacks->should_stop()) {
        ctx->stopped = true;
        return 1;
    }
    return 0;
}

size_t headerCallback(char* buffer, size_t size, size_t nitems, void* userdata) {
    const size_t total = size * nitems;
    auto* accepts_ranges = static_cast<bool*>(userdata);
    std::string line(buffer, total);
    std::transform(line.begin(), line.end(), line.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    if (line.rfind("accept-ranges:", 0) == 0 && line.find("bytes") != std::string::npos) {
        *accepts_ranges = true;
    }
    return total;
}

class CurlHttpClient final : public HttpClient {
public:
    explicit CurlHttpClient(HttpOptions options) : options_(std::move(options)) {
        CurlGlobal::ensureInitialized();
    }

    ProbeResult probe(const std::string& url) override {
        CurlHandle curl{curl_easy_init(), &curl_easy_cleanup};
        if (!curl) {
            throw TransferError(ErrorCode::NetworkError, "Failed to allocate curl handle");
        }

        bool accepts_ranges = false;
        curl_easy_setopt(curl.get(), CURLOPT_URL, url.c_str());
        curl_easy_setopt(curl.get(), CURLOPT_NOBODY, 1L);
        curl_easy_setopt(curl.get(), CURLOPT_HEADERFUNCTION, &headerCallback);
        curl_easy_setopt(curl.get(), CURLOPT_HEADERDATA, &accepts_ranges);
        configureCommon(curl.get());

        const CURLcode res = curl_easy_perform(curl.get());
        if (res != CURLE_OK) {
            throw TransferError(ErrorCode::NetworkError,
                                fmt::format("Probe of {} failed: {}", url, curl_easy_strerror(res)));
        }

        ProbeResult result;
        result.supports_range = accepts_ranges;
        result.content_length = readHead(curl.get()).content_length;
        spdlog::debug("Probed {}: {} bytes, ranges {}", url,
                      result.content_length ? std::to_string(*result.content_length) : "unknown",
                      result.supports_range ? "supported" : "unsupported");
        return result;
    }

    ResponseHead get(const HttpRequest& request, const ResponseCallbacks& callbacks) override {
        CurlHandle curl{curl_easy_init(), &curl_easy_cleanup};
        if (!curl) {
            throw TransferError(ErrorCode::NetworkError, "Failed to allocate curl handle");
        }

        TransferContext ctx;
        ctx.curl = curl.get();
        ctx.callbacks = &callbacks;

        std::string range;
        curl_easy_setopt(curl.get(), CURLOPT_URL, request.url.c_str());
        curl_easy_setopt(curl.get(), CURLOPT_HTTPGET, 1L);
        if (request.range) {
            range = fmt::format("{}-{}", request.range->first, request.range->last);
            curl_easy_setopt(curl.get(), CURLOPT_RANGE, range.c_str());
        }
        curl_easy_setopt(curl.get(), CURLOPT_WRITEFUNCTION, &writeCallback);
        curl_easy_setopt(curl.get(), CURLOPT_WRITEDATA, &ctx);
        curl_easy_setopt(curl.get(), CURLOPT_NOPROGRESS, 0L);
        curl_easy_setopt(curl.get(), CURLOPT_XFERINFOFUNCTION, &transferInfoCallback);
        curl_easy_setopt(curl.get(), CURLOPT_XFERINFODATA, &ctx);
        configureCommon(curl.get());

        const CURLcode res = curl_easy_perform(curl.get());
        if (ctx.error) {
            std::rethrow_exception(ctx.error);
        }
        if (ctx.stopped || res == CURLE_ABORTED_BY_CALLBACK) {
            throw TransferError(ErrorCode::Cancelled, "Download cancelled");
        }

        ResponseHead head = readHead(curl.get());
        if (res == CURLE_HTTP_RETURNED_ERROR) {
            throw TransferError(ErrorCode::NetworkError,
                                fmt::format("Server returned HTTP {} for {}", head.status,
                                            request.url));
        }
        if (res != CURLE_OK) {
            throw TransferError(ErrorCode::NetworkError,
                                fmt::format("curl error: {}", curl_easy_strerror(res)));
        }

        // Empty bodies never reach the write callback.
        if (!ctx.head_delivered && callbacks.on_head) {
            callbacks.on_head(head);
        }
        return head;
    }

private:
    void configureCommon(CURL* curl) const {
        curl_easy_setopt(curl, CURLOPT_FOLLOWLOCATION, options_.follow_redirects ? 1L : 0L);
        curl_easy_setopt(curl, CURLOPT_MAXREDIRS, 10L);
        curl_easy_setopt(curl, CURLOPT_FAILONERROR, 1L);
        curl_easy_setopt(curl, CURLOPT_NOSIGNAL, 1L);
        curl_easy_setopt(curl, CURLOPT_CONNECTTIMEOUT,
                         static_cast<long>(options_.connect_timeout.count()));
        curl_easy_setopt(curl, CURLOPT_LOW_SPEED_LIMIT, options_.low_speed_limit);
        curl_easy_setopt(curl, CURLOPT_LOW_SPEED_TIME,
                         static_cast<long>(options_.low_speed_time.count()));
        curl_easy_setopt(curl, CURLOPT_USERAGENT, options_.user_agent.c_str());
    }

    HttpOptions options_;
};

} // namespace

HttpClientPtr makeCurlHttpClient(HttpOptions options) {
    return std::make_shared<CurlHttpClient>(std::move(options));
}

std::uint64_t resolveTransferSize(HttpClient& client,
                                  const std::string& url,
                                  std::optional<std::uint64_t> known_size) {
    if (known_size) {
        return *known_size;
    }
    const auto head = client.probe(url);
    if (!head.supports_range) {
        spdlog::warn("{} does not advertise range support", url);
    }
    if (!head.content_length || *head.content_length == 0) {
        throw TransferError(ErrorCode::InvalidArgument,
                            fmt::format("Size of {} is unknown; pass --size", url));
    }
    return *head.content_length;
}

} // namespace fetchkit
