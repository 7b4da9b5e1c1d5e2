#pragma once

#include <atomic>
#include <cstddef>
#include <cstdint>
#include <functional>
#include <string>
#include <string_view>

namespace fetchkit {

enum class TransferStatus {
    Downloading,
    Verifying,
    Skipped,
    Finished,
    Extracting,
    Completed,
    Paused,
    Error
};

[[nodiscard]] std::string_view toString(TransferStatus status) noexcept;

// Emitted by the segmented engine for a single large file.
struct TransferProgressEvent {
    std::string file_name;
    std::uint64_t downloaded_bytes{0};
    std::uint64_t total_bytes{0};
    std::uint64_t speed_bytes_per_sec{0};
    std::uint64_t eta_seconds{0};
    TransferStatus status{TransferStatus::Downloading};
    float percentage{0.0f};
};

struct ProgressSnapshot {
    std::size_t completed_files{0};
    std::size_t total_files{0};
    std::uint64_t total_downloaded_bytes{0};
};

// Emitted by the batch orchestrator; carries the batch-wide snapshot.
struct BatchProgressEvent {
    std::string file;
    std::uint64_t downloaded{0};
    std::uint64_t total{0};
    TransferStatus status{TransferStatus::Downloading};
    std::size_t completed_files{0};
    std::size_t total_files{0};
    std::uint64_t total_downloaded_bytes{0};
};

using TransferProgressCallback = std::function<void(const TransferProgressEvent&)>;
using BatchProgressCallback = std::function<void(const BatchProgressEvent&)>;

// Lock-free counters for one batch invocation. Create one per call; sharing
// an instance between overlapping batches mixes their totals.
class ProgressAggregator {
public:
    explicit ProgressAggregator(std::size_t total_files) noexcept : total_files_(total_files) {}

    ProgressAggregator(const ProgressAggregator&) = delete;
    ProgressAggregator& operator=(const ProgressAggregator&) = delete;

    [[nodiscard]] ProgressSnapshot snapshot() const noexcept;
    ProgressSnapshot incrementCompleted() noexcept;
    ProgressSnapshot addBytes(std::uint64_t delta) noexcept;

private:
    std::atomic<std::size_t> completed_files_{0};
    std::atomic<std::uint64_t> total_downloaded_bytes_{0};
    const std::size_t total_files_;
};

[[nodiscard]] BatchProgressEvent makeBatchEvent(std::string file,
                                                TransferStatus status,
                                                std::uint64_t downloaded,
                                                std::uint64_t total,
                                                const ProgressSnapshot& snapshot);

} // namespace fetchkit
