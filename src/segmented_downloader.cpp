#include "fetchkit/segmented_downloader.hpp"
#include "fetchkit/detail/file_utils.hpp"
#include "fetchkit/detail/worker_pool.hpp"
#include "fetchkit/errors.hpp"
#include "fetchkit/integrity.hpp"
#include "fetchkit/transfer_state.hpp"

#include <algorithm>
#include <atomic>
#include <chrono>
#include <cstdio>
#include <exception>
#include <memory>
#include <mutex>
#include <stdexcept>
#include <string>
#include <system_error>
#include <utility>
#include <vector>

#include <fmt/format.h>
#include <fmt/ranges.h>
#include <spdlog/spdlog.h>
#include <unistd.h>

namespace fetchkit {

namespace {

struct FileDeleter {
    void operator()(FILE* fp) const noexcept {
        if (fp) {
            std::fclose(fp);
        }
    }
};

// State of a single download() call. Network fetches run in parallel; every
// write to the shared part file goes through file_mutex_, which also guards
// the per-segment progress fields.
class TransferRun {
public:
    TransferRun(HttpClient& client,
                const SegmentedDownloadOptions& options,
                const LargeFileDescriptor& descriptor,
                std::filesystem::path destination,
                const CancellationToken& token,
                const TransferProgressCallback& on_progress)
        : client_(client),
          options_(options),
          descriptor_(descriptor),
          destination_(std::move(destination)),
          part_path_(partPathFor(destination_)),
          meta_path_(metaPathFor(destination_)),
          file_name_(descriptor.file_name.empty() ? destination_.filename().string()
                                                  : descriptor.file_name),
          token_(token),
          on_progress_(on_progress) {}

    void execute() {
        detail::ensureParentDirectory(destination_);
        prepareState();
        openPartFile();

        std::vector<std::size_t> pending;
        for (std::size_t i = 0; i < state_.segments.size(); ++i) {
            if (!state_.segments[i].completed) {
                pending.push_back(i);
            }
        }

        spdlog::info("Downloading {} ({} bytes, {} of {} segments remaining)", file_name_,
                     state_.total_size, pending.size(), state_.segments.size());

        start_time_ = std::chrono::steady_clock::now();
        const std::size_t worker_limit = std::min(state_.segments.size(), kMaxSegmentWorkers);
        const auto errors = detail::runBounded(
            pending.size(), worker_limit, [&](std::size_t i) { downloadSegment(pending[i]); });

        closePartFile();

        std::vector<std::size_t> failed;
        std::vector<std::exception_ptr> failures;
        for (std::size_t i = 0; i < errors.size(); ++i) {
            if (errors[i]) {
                failed.push_back(pending[i]);
                failures.push_back(errors[i]);
            }
        }
        if (!failed.empty()) {
            failWithIncompleteSegments(failed, failures);
        }

        verifyAndCommit();
    }

private:
    [[nodiscard]] bool isResumable(const TransferState& loaded) const {
        if (loaded.url != descriptor_.url || loaded.total_size != descriptor_.total_size) {
            return false;
        }
        if (!isValidPartition(loaded.segments, loaded.total_size)) {
            return false;
        }
        std::error_code ec;
        const auto part_size = std::filesystem::file_size(part_path_, ec);
        return !ec && part_size == loaded.total_size;
    }

    void prepareState() {
        auto loaded = loadTransferState(meta_path_);
        if (loaded && isResumable(*loaded)) {
            state_ = std::move(*loaded);
            state_.checksum = descriptor_.checksum;
            state_.downloaded_bytes = state_.sumSegmentBytes();
            resumed_ = true;
            spdlog::info("Resuming {} ({} of {} segments complete, {} bytes on disk)", file_name_,
                         state_.completedSegmentCount(), state_.segments.size(),
                         state_.downloaded_bytes);
        } else {
            if (loaded) {
                spdlog::warn("Discarding stale transfer state {}", meta_path_.string());
            }
            state_ = createTransferState(descriptor_.url, file_name_, descriptor_.total_size,
                                         descriptor_.checksum);
            saveTransferState(meta_path_, state_);
        }

        downloaded_.store(state_.downloaded_bytes);
        last_reported_.store(state_.downloaded_bytes);
        last_checkpoint_.store(state_.downloaded_bytes);
    }

    void openPartFile() {
        // A fresh plan starts from an empty, pre-sized file; a resumed one
        // keeps what is already on disk.
        file_.reset(std::fopen(part_path_.string().c_str(), resumed_ ? "rb+" : "wb+"));
        if (!file_) {
            throw TransferError(ErrorCode::IoError,
                                fmt::format("Cannot open part file {}", part_path_.string()));
        }

        if (!resumed_ &&
            ftruncate(fileno(file_.get()), static_cast<off_t>(state_.total_size)) == -1) {
            file_.reset();
            throw TransferError(ErrorCode::IoError,
                                fmt::format("Cannot resize part file {}", part_path_.string()));
        }
    }

    void closePartFile() {
        std::lock_guard<std::mutex> lock(file_mutex_);
        if (!file_) {
            return;
        }
        const bool flushed = std::fflush(file_.get()) == 0;
        const bool closed = std::fclose(file_.release()) == 0;
        if (!flushed || !closed) {
            throw TransferError(ErrorCode::IoError,
                                fmt::format("Failed to flush part file {}", part_path_.string()));
        }
    }

    void downloadSegment(std::size_t index) {
        if (token_.isCancelled()) {
            throw TransferError(ErrorCode::Cancelled, "Download cancelled");
        }

        Segment& segment = state_.segments[index];
        std::uint64_t position = 0;
        {
            std::lock_guard<std::mutex> lock(file_mutex_);
            position = segment.start + segment.downloaded;
        }

        if (position <= segment.end) {
            HttpRequest request{descriptor_.url, ByteRange{position, segment.end}};
            spdlog::debug("{}: segment {} requesting bytes {}-{}", file_name_, index, position,
                          segment.end);

            ResponseCallbacks callbacks;
            callbacks.on_head = [&](const ResponseHead& head) {
                validateRangeResponse(head, *request.range);
            };
            callbacks.on_data = [&](const char* data, std::size_t size) {
                if (token_.isCancelled()) {
                    throw TransferError(ErrorCode::Cancelled, "Download cancelled");
                }
                writeChunk(segment, data, size);
            };
            callbacks.should_stop = [this]() { return token_.isCancelled(); };

            client_.get(request, callbacks);
        }

        {
            std::lock_guard<std::mutex> lock(file_mutex_);
            if (segment.downloaded != segment.length()) {
                throw TransferError(ErrorCode::NetworkError,
                                    fmt::format("Segment {} incomplete: {} of {} bytes", index,
                                                segment.downloaded, segment.length()));
            }
            segment.completed = true;
        }
        spdlog::debug("{}: segment {} completed", file_name_, index);
        checkpoint();
    }

    void validateRangeResponse(const ResponseHead& head, const ByteRange& range) const {
        if (head.status == 206) {
            return;
        }
        const bool whole_file = range.first == 0 && range.last + 1 == state_.total_size;
        if (head.status == 200 && whole_file) {
            return;
        }
        throw TransferError(ErrorCode::NetworkError,
                            fmt::format("Server ignored range request {}-{} (HTTP {})",
                                        range.first, range.last, head.status));
    }

    void writeChunk(Segment& segment, const char* data, std::size_t size) {
        {
            std::lock_guard<std::mutex> lock(file_mutex_);
            const std::uint64_t offset = segment.start + segment.downloaded;
            if (offset + size > segment.end + 1) {
                throw TransferError(ErrorCode::NetworkError,
                                    fmt::format("Server sent more than the requested range {}-{}",
                                                segment.start, segment.end));
            }

            FILE* file = file_.get();
            if (!file) {
                throw TransferError(ErrorCode::IoError, "Part file is closed");
            }
            if (fseeko(file, static_cast<off_t>(offset), SEEK_SET) != 0) {
                throw TransferError(ErrorCode::IoError, "Failed to seek part file");
            }
            if (std::fwrite(data, 1, size, file) != size) {
                throw TransferError(ErrorCode::IoError, "Failed to write part file");
            }
            segment.downloaded += size;
        }

        session_bytes_.fetch_add(size, std::memory_order_relaxed);
        const std::uint64_t total = downloaded_.fetch_add(size, std::memory_order_relaxed) + size;
        reportProgress(total);

        std::uint64_t last = last_checkpoint_.load(std::memory_order_relaxed);
        if (total >= last + options_.checkpoint_interval_bytes &&
            last_checkpoint_.compare_exchange_strong(last, total)) {
            checkpoint();
        }
    }

    void reportProgress(std::uint64_t total) {
        if (!on_progress_) {
            return;
        }
        const std::uint64_t last = last_reported_.load(std::memory_order_relaxed);
        if (total <= last + options_.progress_interval_bytes && total < state_.total_size) {
            return;
        }
        last_reported_.store(total, std::memory_order_relaxed);

        const double elapsed = std::chrono::duration<double>(std::chrono::steady_clock::now() -
                                                             start_time_)
                                   .count();
        const auto session = session_bytes_.load(std::memory_order_relaxed);
        const std::uint64_t speed =
            elapsed > 0.0 ? static_cast<std::uint64_t>(static_cast<double>(session) / elapsed) : 0;
        const std::uint64_t remaining = state_.total_size > total ? state_.total_size - total : 0;

        emit(TransferStatus::Downloading, total, speed, speed > 0 ? remaining / speed : 0);
    }

    void emit(TransferStatus status,
              std::uint64_t downloaded,
              std::uint64_t speed = 0,
              std::uint64_t eta = 0) const {
        if (!on_progress_) {
            return;
        }
        TransferProgressEvent event;
        event.file_name = file_name_;
        event.downloaded_bytes = downloaded;
        event.total_bytes = state_.total_size;
        event.speed_bytes_per_sec = speed;
        event.eta_seconds = eta;
        event.status = status;
        event.percentage = state_.total_size > 0
                               ? static_cast<float>(static_cast<double>(downloaded) * 100.0 /
                                                    static_cast<double>(state_.total_size))
                               : 100.0f;
        on_progress_(event);
    }

    // Flushes written data before recording it, so the sidecar never claims
    // bytes that are not in the part file.
    void checkpoint() {
        std::lock_guard<std::mutex> state_lock(state_mutex_);
        TransferState snapshot;
        {
            std::lock_guard<std::mutex> file_lock(file_mutex_);
            if (file_ && std::fflush(file_.get()) != 0) {
                throw TransferError(ErrorCode::IoError, "Failed to flush part file");
            }
            snapshot = state_;
        }
        snapshot.downloaded_bytes = snapshot.sumSegmentBytes();
        saveTransferState(meta_path_, snapshot);
    }

    [[noreturn]] void failWithIncompleteSegments(const std::vector<std::size_t>& failed,
                                                 const std::vector<std::exception_ptr>& failures) {
        state_.downloaded_bytes = state_.sumSegmentBytes();
        saveTransferState(meta_path_, state_);

        std::vector<std::size_t> incomplete;
        for (std::size_t i = 0; i < state_.segments.size(); ++i) {
            if (!state_.segments[i].completed) {
                incomplete.push_back(i);
            }
        }

        if (token_.isCancelled()) {
            spdlog::info("Download of {} cancelled with {} of {} segments incomplete", file_name_,
                         incomplete.size(), state_.segments.size());
            emit(TransferStatus::Paused, state_.downloaded_bytes);
            throw TransferError(ErrorCode::Cancelled,
                                fmt::format("Download of {} cancelled; segments [{}] incomplete",
                                            file_name_, fmt::join(incomplete, ", ")));
        }

        ErrorCode code = ErrorCode::NetworkError;
        std::string reason;
        try {
            std::rethrow_exception(failures.front());
        } catch (const TransferError& ex) {
            code = ex.code();
            reason = ex.what();
        } catch (const std::exception& ex) {
            code = ErrorCode::IoError;
            reason = ex.what();
        }
        if (failed.size() < state_.segments.size()) {
            code = ErrorCode::PartialFailure;
        }

        spdlog::error("Download of {} failed: {} segment(s) failed, first error: {}", file_name_,
                      failed.size(), reason);
        emit(TransferStatus::Error, state_.downloaded_bytes);
        throw TransferError(code,
                            fmt::format("Download of {} failed; segments [{}] incomplete: {}",
                                        file_name_, fmt::join(incomplete, ", "), reason));
    }

    void verifyAndCommit() {
        emit(TransferStatus::Verifying, state_.total_size);

        if (!verifyFile(part_path_, state_.checksum, std::nullopt)) {
            detail::removeFileQuietly(part_path_);
            detail::removeFileQuietly(meta_path_);
            spdlog::error("Checksum mismatch for {}; partial data discarded", file_name_);
            emit(TransferStatus::Error, state_.total_size);
            throw TransferError(ErrorCode::ChecksumMismatch,
                                fmt::format("Checksum verification failed for {}", file_name_));
        }

        std::error_code ec;
        std::filesystem::rename(part_path_, destination_, ec);
        if (ec) {
            throw TransferError(ErrorCode::IoError,
                                fmt::format("Failed to move {} into place: {}", part_path_.string(),
                                            ec.message()));
        }
        detail::removeFileQuietly(meta_path_);

        spdlog::info("Committed {} ({} bytes)", destination_.string(), state_.total_size);
        emit(TransferStatus::Completed, state_.total_size);
    }

    HttpClient& client_;
    const SegmentedDownloadOptions& options_;
    const LargeFileDescriptor& descriptor_;
    std::filesystem::path destination_;
    std::filesystem::path part_path_;
    std::filesystem::path meta_path_;
    std::string file_name_;
    const CancellationToken& token_;
    const TransferProgressCallback& on_progress_;

    TransferState state_;
    bool resumed_{false};

    std::unique_ptr<FILE, FileDeleter> file_{};
    std::mutex file_mutex_;
    std::mutex state_mutex_;

    std::atomic<std::uint64_t> downloaded_{0};
    std::atomic<std::uint64_t> session_bytes_{0};
    std::atomic<std::uint64_t> last_reported_{0};
    std::atomic<std::uint64_t> last_checkpoint_{0};
    std::chrono::steady_clock::time_point start_time_{};
};

} // namespace

SegmentedDownloader::SegmentedDownloader(HttpClientPtr client, SegmentedDownloadOptions options)
    : client_(std::move(client)), options_(options) {
    if (!client_) {
        throw std::invalid_argument("SegmentedDownloader requires an HTTP client");
    }
}

void SegmentedDownloader::download(const LargeFileDescriptor& descriptor,
                                   const std::filesystem::path& destination,
                                   const CancellationToken& token,
                                   const TransferProgressCallback& on_progress) {
    if (descriptor.url.empty()) {
        throw TransferError(ErrorCode::InvalidArgument, "Download URL is empty");
    }
    TransferRun run(*client_, options_, descriptor, destination, token, on_progress);
    run.execute();
}

} // namespace fetchkit
