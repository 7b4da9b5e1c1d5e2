#include "fetchkit/transfer_state.hpp"
#include "fetchkit/detail/file_utils.hpp"
#include "fetchkit/errors.hpp"

#include <chrono>
#include <numeric>
#include <system_error>
#include <utility>

#include <nlohmann/json.hpp>
#include <spdlog/spdlog.h>

namespace fetchkit {

using json = nlohmann::json;

void to_json(json& j, const Segment& segment) {
    j = json{{"start", segment.start},
             {"end", segment.end},
             {"downloaded", segment.downloaded},
             {"completed", segment.completed}};
}

void from_json(const json& j, Segment& segment) {
    j.at("start").get_to(segment.start);
    j.at("end").get_to(segment.end);
    segment.downloaded = j.value("downloaded", std::uint64_t{0});
    j.at("completed").get_to(segment.completed);
}

void to_json(json& j, const TransferState& state) {
    j = json{{"url", state.url},
             {"file_name", state.file_name},
             {"total_size", state.total_size},
             {"downloaded_bytes", state.downloaded_bytes},
             {"checksum", state.checksum ? json(*state.checksum) : json(nullptr)},
             {"timestamp", state.timestamp},
             {"segments", state.segments}};
}

void from_json(const json& j, TransferState& state) {
    j.at("url").get_to(state.url);
    j.at("file_name").get_to(state.file_name);
    j.at("total_size").get_to(state.total_size);
    j.at("downloaded_bytes").get_to(state.downloaded_bytes);
    const auto checksum = j.find("checksum");
    if (checksum != j.end() && checksum->is_string()) {
        state.checksum = checksum->get<std::string>();
    } else {
        state.checksum.reset();
    }
    state.timestamp = j.value("timestamp", std::uint64_t{0});
    j.at("segments").get_to(state.segments);
}

std::size_t TransferState::completedSegmentCount() const noexcept {
    std::size_t count = 0;
    for (const auto& segment : segments) {
        if (segment.completed) {
            ++count;
        }
    }
    return count;
}

bool TransferState::allSegmentsCompleted() const noexcept {
    return completedSegmentCount() == segments.size();
}

std::uint64_t TransferState::sumSegmentBytes() const noexcept {
    return std::accumulate(segments.begin(), segments.end(), std::uint64_t{0},
                           [](std::uint64_t acc, const Segment& segment) {
                               return acc + (segment.completed ? segment.length()
                                                               : segment.downloaded);
                           });
}

TransferState createTransferState(std::string url,
                                  std::string file_name,
                                  std::uint64_t total_size,
                                  std::optional<std::string> checksum) {
    TransferState state;
    state.url = std::move(url);
    state.file_name = std::move(file_name);
    state.total_size = total_size;
    state.checksum = std::move(checksum);
    state.timestamp = static_cast<std::uint64_t>(
        std::chrono::duration_cast<std::chrono::seconds>(
            std::chrono::system_clock::now().time_since_epoch())
            .count());
    state.segments = planSegments(total_size);
    return state;
}

std::filesystem::path partPathFor(const std::filesystem::path& destination) {
    std::filesystem::path part = destination;
    part += ".part";
    return part;
}

std::filesystem::path metaPathFor(const std::filesystem::path& destination) {
    std::filesystem::path meta = destination;
    meta += ".part.meta";
    return meta;
}

std::string serializeTransferState(const TransferState& state) {
    return json(state).dump(2);
}

TransferState parseTransferState(const std::string& json_text) {
    try {
        return json::parse(json_text).get<TransferState>();
    } catch (const json::exception& ex) {
        throw TransferError(ErrorCode::InvalidArgument,
                            std::string{"Malformed transfer state: "} + ex.what());
    }
}

std::optional<TransferState> loadTransferState(const std::filesystem::path& meta_path) {
    std::error_code ec;
    if (!std::filesystem::exists(meta_path, ec)) {
        return std::nullopt;
    }

    try {
        return parseTransferState(detail::readFile(meta_path));
    } catch (const TransferError& ex) {
        spdlog::warn("Ignoring unreadable transfer state {}: {}", meta_path.string(), ex.what());
        return std::nullopt;
    }
}

void saveTransferState(const std::filesystem::path& meta_path, const TransferState& state) {
    detail::writeFileAtomically(meta_path, serializeTransferState(state));
}

} // namespace fetchkit
