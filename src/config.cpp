#include "fetchkit/config.hpp"
#include "fetchkit/detail/file_utils.hpp"
#include "fetchkit/errors.hpp"

#include <chrono>
#include <type_traits>

#include <fmt/format.h>
#include <nlohmann/json.hpp>

namespace fetchkit {

using json = nlohmann::json;

namespace {

template <typename T>
void readIfPresent(const json& object, const char* key, T& target) {
    const auto it = object.find(key);
    if (it == object.end() || it->is_null()) {
        return;
    }
    if constexpr (std::is_unsigned_v<T> && !std::is_same_v<T, bool>) {
        if (!it->is_number_unsigned()) {
            throw TransferError(ErrorCode::InvalidArgument,
                                fmt::format("{} must be a non-negative integer", key));
        }
    }
    it->get_to(target);
}

void readSeconds(const json& object, const char* key, std::chrono::seconds& target) {
    long long seconds = target.count();
    readIfPresent(object, key, seconds);
    if (seconds < 0) {
        throw TransferError(ErrorCode::InvalidArgument, fmt::format("{} must not be negative", key));
    }
    target = std::chrono::seconds{seconds};
}

} // namespace

EngineConfig parseConfig(const std::string& json_text) {
    EngineConfig config;
    try {
        const json root = json::parse(json_text);
        if (!root.is_object()) {
            throw TransferError(ErrorCode::InvalidArgument, "Config root must be an object");
        }

        readIfPresent(root, "max_concurrency", config.batch.max_concurrency);
        config.batch.max_concurrency = BatchDownloader::clampConcurrency(config.batch.max_concurrency);
        bool strict = config.batch.policy == FailurePolicy::Strict;
        readIfPresent(root, "strict", strict);
        config.batch.policy = strict ? FailurePolicy::Strict : FailurePolicy::BestEffort;
        readIfPresent(root, "verify_downloads", config.batch.verify_downloads);
        readIfPresent(root, "checkpoint_interval_bytes", config.segmented.checkpoint_interval_bytes);
        readIfPresent(root, "log_level", config.log_level);

        std::string queue_file = config.queue_file.string();
        readIfPresent(root, "queue_file", queue_file);
        config.queue_file = queue_file;

        const auto http = root.find("http");
        if (http != root.end() && http->is_object()) {
            readSeconds(*http, "connect_timeout_seconds", config.http.connect_timeout);
            readIfPresent(*http, "low_speed_limit_bytes", config.http.low_speed_limit);
            readSeconds(*http, "low_speed_time_seconds", config.http.low_speed_time);
            readIfPresent(*http, "follow_redirects", config.http.follow_redirects);
            readIfPresent(*http, "user_agent", config.http.user_agent);
        }
    } catch (const json::exception& ex) {
        throw TransferError(ErrorCode::InvalidArgument,
                            std::string{"Invalid configuration: "} + ex.what());
    }
    return config;
}

EngineConfig loadConfig(const std::filesystem::path& path) {
    try {
        return parseConfig(detail::readFile(path));
    } catch (const TransferError& ex) {
        throw TransferError(ErrorCode::InvalidArgument,
                            fmt::format("Cannot load config {}: {}", path.string(), ex.what()));
    }
}

} // namespace fetchkit
