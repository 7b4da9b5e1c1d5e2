#pragma once

#include "errors.hpp"
#include "http_client.hpp"
#include "progress.hpp"

#include <cstddef>
#include <cstdint>
#include <filesystem>
#include <optional>
#include <string>
#include <vector>

namespace fetchkit {

struct TransferTask {
    std::string url;
    std::filesystem::path path;
    std::optional<std::string> sha256; // primary
    std::optional<std::string> sha1;   // secondary
};

enum class FailurePolicy {
    BestEffort, // failures are reported in BatchResult only
    Strict      // any failure makes download() throw after the batch settles
};

struct BatchOptions {
    std::size_t max_concurrency{16};
    FailurePolicy policy{FailurePolicy::BestEffort};
    bool verify_downloads{true};
};

struct FailedTransfer {
    std::string url;
    std::filesystem::path path;
    ErrorCode code{ErrorCode::NetworkError};
    std::string message;
};

struct BatchResult {
    std::size_t total_files{0};
    std::size_t downloaded{0};
    std::size_t skipped{0};
    std::uint64_t total_bytes{0};
    std::vector<FailedTransfer> failures;

    [[nodiscard]] bool ok() const noexcept { return failures.empty(); }
};

// Fetches many independent files over a bounded worker pool. Files already on
// disk that match a supplied hash are skipped. on_progress is invoked from
// worker threads and must be thread-safe.
class BatchDownloader {
public:
    explicit BatchDownloader(HttpClientPtr client, BatchOptions options = {});

    BatchResult download(const std::vector<TransferTask>& tasks,
                         const BatchProgressCallback& on_progress = {}) const;

    [[nodiscard]] const BatchOptions& options() const noexcept { return options_; }

    static constexpr std::size_t kMinConcurrency = 1;
    static constexpr std::size_t kMaxConcurrency = 128;
    [[nodiscard]] static std::size_t clampConcurrency(std::size_t requested) noexcept;

private:
    enum class TaskOutcome { Pending, Downloaded, Skipped };

    TaskOutcome runTask(const TransferTask& task,
                        ProgressAggregator& progress,
                        const BatchProgressCallback& on_progress) const;
    bool isAlreadyValid(const TransferTask& task) const;
    void fetchInto(const TransferTask& task,
                   ProgressAggregator& progress,
                   const BatchProgressCallback& on_progress) const;

    HttpClientPtr client_;
    BatchOptions options_;
};

} // namespace fetchkit
