#pragma once

#include "cancellation.hpp"
#include "progress.hpp"
#include "segmented_downloader.hpp"

#include <cstdint>
#include <filesystem>
#include <functional>
#include <optional>
#include <string>
#include <vector>

namespace fetchkit {

struct PendingTransferKey {
    std::string version;
    std::string variant;

    bool operator==(const PendingTransferKey& other) const {
        return version == other.version && variant == other.variant;
    }
    bool operator!=(const PendingTransferKey& other) const { return !(*this == other); }
};

struct PendingTransferRecord {
    PendingTransferKey key;
    std::string download_url;
    std::string file_name;
    std::uint64_t file_size{0};
    std::optional<std::string> checksum; // SHA-256
    std::string install_path;
    std::uint64_t created_at{0}; // seconds since the epoch
};

// Durable list of large transfers that have not completed yet. Every
// mutation rewrites the whole file; one process is expected to own it.
class PendingTransferQueue {
public:
    explicit PendingTransferQueue(std::filesystem::path file);

    // Replaces any record with the same key, then persists.
    void add(PendingTransferRecord record);
    void remove(const PendingTransferKey& key);
    void reload();

    [[nodiscard]] const std::vector<PendingTransferRecord>& records() const noexcept {
        return records_;
    }
    [[nodiscard]] std::optional<PendingTransferRecord> find(const PendingTransferKey& key) const;
    [[nodiscard]] bool empty() const noexcept { return records_.empty(); }
    [[nodiscard]] const std::filesystem::path& file() const noexcept { return file_; }

private:
    void save() const;

    std::filesystem::path file_;
    std::vector<PendingTransferRecord> records_;
};

[[nodiscard]] std::string serializePendingQueue(const std::vector<PendingTransferRecord>& records);
[[nodiscard]] std::vector<PendingTransferRecord> parsePendingQueue(const std::string& json_text);

// Unpacks a verified archive into record.install_path.
using ArchiveInstaller =
    std::function<void(const PendingTransferRecord& record, const std::filesystem::path& archive)>;

struct ResumeReport {
    PendingTransferKey key;
    bool succeeded{false};
    std::string error;
};

// Drives queued large transfers: enqueue, download, verify, install, dequeue.
class QueuedTransferRunner {
public:
    QueuedTransferRunner(PendingTransferQueue& queue,
                         SegmentedDownloader& downloader,
                         ArchiveInstaller installer);

    // Throws on failure; the record then stays queued for the next resumeAll().
    void run(const PendingTransferRecord& record,
             const CancellationToken& token = {},
             const TransferProgressCallback& on_progress = {});

    // Retries every queued record one after another. Failures are logged and
    // left in the queue; there is no retry limit.
    std::vector<ResumeReport> resumeAll(const CancellationToken& token = {},
                                        const TransferProgressCallback& on_progress = {});

    [[nodiscard]] static std::filesystem::path archivePathFor(const PendingTransferRecord& record);

private:
    PendingTransferQueue& queue_;
    SegmentedDownloader& downloader_;
    ArchiveInstaller installer_;
};

} // namespace fetchkit
