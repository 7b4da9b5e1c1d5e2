#include "fetchkit/progress.hpp"

#include <utility>

namespace fetchkit {

std::string_view toString(TransferStatus status) noexcept {
    switch (status) {
        case TransferStatus::Downloading:
            return "Downloading";
        case TransferStatus::Verifying:
            return "Verifying";
        case TransferStatus::Skipped:
            return "Skipped";
        case TransferStatus::Finished:
            return "Finished";
        case TransferStatus::Extracting:
            return "Extracting";
        case TransferStatus::Completed:
            return "Completed";
        case TransferStatus::Paused:
            return "Paused";
        case TransferStatus::Error:
            return "Error";
    }
    return "Unknown";
}

ProgressSnapshot ProgressAggregator::snapshot() const noexcept {
    return {completed_files_.load(std::memory_order_relaxed), total_files_,
            total_downloaded_bytes_.load(std::memory_order_relaxed)};
}

ProgressSnapshot ProgressAggregator::incrementCompleted() noexcept {
    const auto completed = completed_files_.fetch_add(1, std::memory_order_relaxed) + 1;
    return {completed, total_files_, total_downloaded_bytes_.load(std::memory_order_relaxed)};
}

ProgressSnapshot ProgressAggregator::addBytes(std::uint64_t delta) noexcept {
    const auto bytes = total_downloaded_bytes_.fetch_add(delta, std::memory_order_relaxed) + delta;
    return {completed_files_.load(std::memory_order_relaxed), total_files_, bytes};
}

BatchProgressEvent makeBatchEvent(std::string file,
                                  TransferStatus status,
                                  std::uint64_t downloaded,
                                  std::uint64_t total,
                                  const ProgressSnapshot& snapshot) {
    BatchProgressEvent event;
    event.file = std::move(file);
    event.downloaded = downloaded;
    event.total = total;
    event.status = status;
    event.completed_files = snapshot.completed_files;
    event.total_files = snapshot.total_files;
    event.total_downloaded_bytes = snapshot.total_downloaded_bytes;
    return event;
}

} // namespace fetchkit
