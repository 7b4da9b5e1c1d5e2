#pragma once

#include "batch_downloader.hpp"
#include "http_client.hpp"
#include "segmented_downloader.hpp"

#include <filesystem>
#include <string>

namespace fetchkit {

struct EngineConfig {
    BatchOptions batch{};
    SegmentedDownloadOptions segmented{};
    HttpOptions http{};
    std::filesystem::path queue_file{"download_queue.json"};
    std::string log_level{"info"};
};

// Reads a JSON config file. Absent keys keep their defaults; a missing file,
// malformed JSON or a value of the wrong type throws
// TransferError(InvalidArgument).
[[nodiscard]] EngineConfig loadConfig(const std::filesystem::path& path);
[[nodiscard]] EngineConfig parseConfig(const std::string& json_text);

} // namespace fetchkit
