#include "fetchkit/pending_queue.hpp"
#include "fetchkit/detail/file_utils.hpp"
#include "fetchkit/errors.hpp"
#include "fetchkit/integrity.hpp"

#include <algorithm>
#include <system_error>
#include <utility>

#include <fmt/format.h>
#include <nlohmann/json.hpp>
#include <spdlog/spdlog.h>

namespace fetchkit {

using json = nlohmann::json;

void to_json(json& j, const PendingTransferRecord& record) {
    j = json{{"version", record.key.version},
             {"variant", record.key.variant},
             {"download_url", record.download_url},
             {"file_name", record.file_name},
             {"file_size", record.file_size},
             {"checksum", record.checksum ? json(*record.checksum) : json(nullptr)},
             {"install_path", record.install_path},
             {"created_at", record.created_at}};
}

void from_json(const json& j, PendingTransferRecord& record) {
    j.at("version").get_to(record.key.version);
    j.at("variant").get_to(record.key.variant);
    j.at("download_url").get_to(record.download_url);
    j.at("file_name").get_to(record.file_name);
    j.at("file_size").get_to(record.file_size);
    const auto checksum = j.find("checksum");
    if (checksum != j.end() && checksum->is_string()) {
        record.checksum = checksum->get<std::string>();
    } else {
        record.checksum.reset();
    }
    j.at("install_path").get_to(record.install_path);
    record.created_at = j.value("created_at", std::uint64_t{0});
}

std::string serializePendingQueue(const std::vector<PendingTransferRecord>& records) {
    return json{{"pending_downloads", records}}.dump(2);
}

std::vector<PendingTransferRecord> parsePendingQueue(const std::string& json_text) {
    try {
        return json::parse(json_text).at("pending_downloads").get<std::vector<PendingTransferRecord>>();
    } catch (const json::exception& ex) {
        throw TransferError(ErrorCode::InvalidArgument,
                            std::string{"Malformed download queue: "} + ex.what());
    }
}

PendingTransferQueue::PendingTransferQueue(std::filesystem::path file) : file_(std::move(file)) {
    reload();
}

void PendingTransferQueue::reload() {
    records_.clear();
    std::error_code ec;
    if (!std::filesystem::exists(file_, ec)) {
        return;
    }
    try {
        records_ = parsePendingQueue(detail::readFile(file_));
    } catch (const TransferError& ex) {
        spdlog::warn("Starting with an empty download queue, {} is unusable: {}", file_.string(),
                     ex.what());
    }
}

void PendingTransferQueue::add(PendingTransferRecord record) {
    records_.erase(std::remove_if(records_.begin(), records_.end(),
                                  [&](const PendingTransferRecord& existing) {
                                      return existing.key == record.key;
                                  }),
                   records_.end());
    records_.push_back(std::move(record));
    save();
}

void PendingTransferQueue::remove(const PendingTransferKey& key) {
    records_.erase(std::remove_if(records_.begin(), records_.end(),
                                  [&](const PendingTransferRecord& existing) {
                                      return existing.key == key;
                                  }),
                   records_.end());
    save();
}

std::optional<PendingTransferRecord> PendingTransferQueue::find(const PendingTransferKey& key) const {
    const auto it = std::find_if(records_.begin(), records_.end(),
                                 [&](const PendingTransferRecord& record) { return record.key == key; });
    if (it == records_.end()) {
        return std::nullopt;
    }
    return *it;
}

void PendingTransferQueue::save() const {
    detail::writeFileAtomically(file_, serializePendingQueue(records_));
}

QueuedTransferRunner::QueuedTransferRunner(PendingTransferQueue& queue,
                                           SegmentedDownloader& downloader,
                                           ArchiveInstaller installer)
    : queue_(queue), downloader_(downloader), installer_(std::move(installer)) {}

std::filesystem::path QueuedTransferRunner::archivePathFor(const PendingTransferRecord& record) {
    return std::filesystem::path(record.install_path) / record.file_name;
}

void QueuedTransferRunner::run(const PendingTransferRecord& record,
                               const CancellationToken& token,
                               const TransferProgressCallback& on_progress) {
    queue_.add(record);

    const auto archive = archivePathFor(record);
    std::error_code ec;
    bool need_download = true;
    if (std::filesystem::exists(archive, ec)) {
        need_download = record.checksum && !verifyFile(archive, record.checksum, std::nullopt);
    }

    if (need_download) {
        LargeFileDescriptor descriptor{record.download_url, record.file_name, record.file_size,
                                       record.checksum};
        downloader_.download(descriptor, archive, token, on_progress);
    } else {
        spdlog::info("{} already present and verified, skipping download", archive.string());
    }

    if (on_progress) {
        TransferProgressEvent event;
        event.file_name = record.file_name;
        event.downloaded_bytes = record.file_size;
        event.total_bytes = record.file_size;
        event.status = TransferStatus::Extracting;
        event.percentage = 100.0f;
        on_progress(event);
    }
    if (installer_) {
        installer_(record, archive);
    }

    queue_.remove(record.key);
}

std::vector<ResumeReport> QueuedTransferRunner::resumeAll(const CancellationToken& token,
                                                          const TransferProgressCallback& on_progress) {
    // run() rewrites the queue, so iterate over a copy.
    const auto pending = queue_.records();
    std::vector<ResumeReport> reports;
    reports.reserve(pending.size());

    for (const auto& record : pending) {
        if (token.isCancelled()) {
            break;
        }

        ResumeReport report;
        report.key = record.key;
        try {
            run(record, token, on_progress);
            report.succeeded = true;
        } catch (const std::exception& ex) {
            report.error = ex.what();
            spdlog::error("Failed to resume {} {} download: {}", record.key.version,
                          record.key.variant, ex.what());
        }
        reports.push_back(std::move(report));
    }
    return reports;
}

} // namespace fetchkit
