#pragma once

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <functional>
#include <memory>
#include <optional>
#include <string>

namespace fetchkit {

struct ByteRange {
    std::uint64_t first{0};
    std::uint64_t last{0}; // inclusive
};

struct HttpRequest {
    std::string url;
    std::optional<ByteRange> range;
};

struct ResponseHead {
    long status{0};
    std::optional<std::uint64_t> content_length;
};

// on_head runs once before the first body chunk. Any callback may throw to
// abort the transfer; the exception is rethrown from HttpClient::get().
struct ResponseCallbacks {
    std::function<void(const ResponseHead&)> on_head;
    std::function<void(const char* data, std::size_t size)> on_data;
    std::function<bool()> should_stop;
};

struct ProbeResult {
    bool supports_range{false};
    std::optional<std::uint64_t> content_length; // absent for chunked or dynamic responses
};

struct HttpOptions {
    std::chrono::seconds connect_timeout{30};
    // A transfer slower than low_speed_limit bytes/s for low_speed_time is
    // aborted, so a stalled server cannot hold a worker forever.
    long low_speed_limit{1024};
    std::chrono::seconds low_speed_time{60};
    bool follow_redirects{true};
    std::string user_agent{"fetchkit/1.0"};
};

class HttpClient {
public:
    virtual ~HttpClient() = default;

    // HEAD request; throws TransferError(NetworkError) when the server is unreachable.
    [[nodiscard]] virtual ProbeResult probe(const std::string& url) = 0;

    // Streams the body through callbacks. Throws TransferError(NetworkError)
    // on transport failure or an HTTP error status, TransferError(Cancelled)
    // when should_stop() returned true.
    virtual ResponseHead get(const HttpRequest& request, const ResponseCallbacks& callbacks) = 0;
};

using HttpClientPtr = std::shared_ptr<HttpClient>;

[[nodiscard]] HttpClientPtr makeCurlHttpClient(HttpOptions options = {});

// Size to plan a segmented download with: known_size when given, otherwise
// the probed Content-Length. Throws TransferError(InvalidArgument) when the
// server does not report a usable length.
[[nodiscard]] std::uint64_t resolveTransferSize(HttpClient& client,
                                                const std::string& url,
                                                std::optional<std::uint64_t> known_size);

} // namespace fetchkit
