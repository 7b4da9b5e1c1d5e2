#pragma once

#include "cancellation.hpp"
#include "http_client.hpp"
#include "progress.hpp"
#include "segment_planner.hpp"

#include <cstdint>
#include <filesystem>
#include <optional>
#include <string>

namespace fetchkit {

struct LargeFileDescriptor {
    std::string url;
    std::string file_name; // defaults to the destination's file name
    std::uint64_t total_size{0};
    std::optional<std::string> checksum; // SHA-256
};

struct SegmentedDownloadOptions {
    std::uint64_t checkpoint_interval_bytes{8 * kMiB};
    std::uint64_t progress_interval_bytes{100 * 1024};
};

// Downloads one large file as parallel byte ranges into "<destination>.part",
// keeping a "<destination>.part.meta" sidecar so an interrupted transfer
// continues where it stopped. The file only appears at destination after its
// checksum has been verified.
class SegmentedDownloader {
public:
    explicit SegmentedDownloader(HttpClientPtr client, SegmentedDownloadOptions options = {});

    // Throws TransferError: Cancelled or PartialFailure/NetworkError/IoError
    // leave the sidecar in place for a later retry; ChecksumMismatch removes
    // both the partial file and the sidecar. on_progress is invoked from the
    // segment worker threads, possibly concurrently, and must be thread-safe.
    void download(const LargeFileDescriptor& descriptor,
                  const std::filesystem::path& destination,
                  const CancellationToken& token = {},
                  const TransferProgressCallback& on_progress = {});

    [[nodiscard]] const SegmentedDownloadOptions& options() const noexcept { return options_; }

private:
    HttpClientPtr client_;
    SegmentedDownloadOptions options_;
};

} // namespace fetchkit
