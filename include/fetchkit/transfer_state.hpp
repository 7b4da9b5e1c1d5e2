#pragma once

#include "segment_planner.hpp"

#include <cstddef>
#include <cstdint>
#include <filesystem>
#include <optional>
#include <string>
#include <vector>

namespace fetchkit {

// Resumable record of one large file, stored next to the partial download.
// While the sidecar exists the ".part" file is incomplete; once the file is
// committed the sidecar is removed.
struct TransferState {
    std::string url;
    std::string file_name;
    std::uint64_t total_size{0};
    std::uint64_t downloaded_bytes{0};
    std::optional<std::string> checksum;
    std::uint64_t timestamp{0}; // seconds since the epoch
    std::vector<Segment> segments;

    [[nodiscard]] std::size_t completedSegmentCount() const noexcept;
    [[nodiscard]] bool allSegmentsCompleted() const noexcept;
    [[nodiscard]] std::uint64_t sumSegmentBytes() const noexcept;
};

[[nodiscard]] TransferState createTransferState(std::string url,
                                                std::string file_name,
                                                std::uint64_t total_size,
                                                std::optional<std::string> checksum);

[[nodiscard]] std::filesystem::path partPathFor(const std::filesystem::path& destination);
[[nodiscard]] std::filesystem::path metaPathFor(const std::filesystem::path& destination);

// Returns nullopt when the sidecar is missing or cannot be parsed.
[[nodiscard]] std::optional<TransferState> loadTransferState(const std::filesystem::path& meta_path);

void saveTransferState(const std::filesystem::path& meta_path, const TransferState& state);

[[nodiscard]] std::string serializeTransferState(const TransferState& state);
[[nodiscard]] TransferState parseTransferState(const std::string& json_text);

} // namespace fetchkit
