#include "fetchkit/batch_downloader.hpp"
#include "fetchkit/detail/file_utils.hpp"
#include "fetchkit/detail/worker_pool.hpp"
#include "fetchkit/integrity.hpp"

#include <algorithm>
#include <cstdio>
#include <exception>
#include <memory>
#include <stdexcept>
#include <system_error>
#include <utility>

#include <fmt/format.h>
#include <spdlog/spdlog.h>

namespace fetchkit {

namespace {

struct FileDeleter {
    void operator()(FILE* fp) const noexcept {
        if (fp) {
            std::fclose(fp);
        }
    }
};

std::string displayName(const TransferTask& task) {
    return task.path.filename().string();
}

void notify(const BatchProgressCallback& on_progress,
            const TransferTask& task,
            TransferStatus status,
            std::uint64_t downloaded,
            std::uint64_t total,
            const ProgressSnapshot& snapshot) {
    if (on_progress) {
        on_progress(makeBatchEvent(displayName(task), status, downloaded, total, snapshot));
    }
}

} // namespace

BatchDownloader::BatchDownloader(HttpClientPtr client, BatchOptions options)
    : client_(std::move(client)), options_(options) {
    if (!client_) {
        throw std::invalid_argument("BatchDownloader requires an HTTP client");
    }
    options_.max_concurrency = clampConcurrency(options_.max_concurrency);
}

std::size_t BatchDownloader::clampConcurrency(std::size_t requested) noexcept {
    return std::clamp(requested, kMinConcurrency, kMaxConcurrency);
}

BatchResult BatchDownloader::download(const std::vector<TransferTask>& tasks,
                                      const BatchProgressCallback& on_progress) const {
    ProgressAggregator progress(tasks.size());
    std::vector<TaskOutcome> outcomes(tasks.size(), TaskOutcome::Pending);

    spdlog::info("Downloading {} files with up to {} workers", tasks.size(),
                 options_.max_concurrency);

    const auto errors = detail::runBounded(tasks.size(), options_.max_concurrency,
                                           [&](std::size_t i) {
                                               outcomes[i] = runTask(tasks[i], progress, on_progress);
                                           });

    BatchResult result;
    result.total_files = tasks.size();
    result.total_bytes = progress.snapshot().total_downloaded_bytes;
    for (std::size_t i = 0; i < tasks.size(); ++i) {
        if (errors[i]) {
            FailedTransfer failure{tasks[i].url, tasks[i].path, ErrorCode::NetworkError, {}};
            try {
                std::rethrow_exception(errors[i]);
            } catch (const TransferError& ex) {
                failure.code = ex.code();
                failure.message = ex.what();
            } catch (const std::exception& ex) {
                failure.code = ErrorCode::IoError;
                failure.message = ex.what();
            }
            result.failures.push_back(std::move(failure));
        } else if (outcomes[i] == TaskOutcome::Skipped) {
            ++result.skipped;
        } else {
            ++result.downloaded;
        }
    }

    spdlog::info("Batch finished: {} downloaded, {} skipped, {} failed", result.downloaded,
                 result.skipped, result.failures.size());

    if (!result.ok() && options_.policy == FailurePolicy::Strict) {
        throw TransferError(ErrorCode::PartialFailure,
                            fmt::format("{} of {} downloads failed, first: {}",
                                        result.failures.size(), tasks.size(),
                                        result.failures.front().message));
    }
    return result;
}

BatchDownloader::TaskOutcome BatchDownloader::runTask(const TransferTask& task,
                                                      ProgressAggregator& progress,
                                                      const BatchProgressCallback& on_progress) const {
    std::error_code ec;
    if (std::filesystem::exists(task.path, ec)) {
        notify(on_progress, task, TransferStatus::Verifying, 0, 0, progress.snapshot());
        if (isAlreadyValid(task)) {
            const auto size = std::filesystem::file_size(task.path, ec);
            if (!ec && size > 0) {
                progress.addBytes(size);
            }
            notify(on_progress, task, TransferStatus::Skipped, 0, 0, progress.incrementCompleted());
            spdlog::debug("Skipping {}, already valid", task.path.string());
            return TaskOutcome::Skipped;
        }
    }

    try {
        fetchInto(task, progress, on_progress);
    } catch (const std::exception& ex) {
        spdlog::warn("Download of {} failed: {}", task.url, ex.what());
        if (std::filesystem::is_regular_file(task.path, ec)) {
            detail::removeFileQuietly(task.path);
        }
        notify(on_progress, task, TransferStatus::Error, 0, 0, progress.snapshot());
        throw;
    }

    notify(on_progress, task, TransferStatus::Finished, 0, 0, progress.incrementCompleted());
    return TaskOutcome::Downloaded;
}

bool BatchDownloader::isAlreadyValid(const TransferTask& task) const {
    if (!task.sha256 && !task.sha1) {
        return false;
    }
    try {
        return verifyFile(task.path, task.sha256, task.sha1);
    } catch (const TransferError& ex) {
        spdlog::debug("Cannot verify existing {}: {}", task.path.string(), ex.what());
        return false;
    }
}

void BatchDownloader::fetchInto(const TransferTask& task,
                                ProgressAggregator& progress,
                                const BatchProgressCallback& on_progress) const {
    detail::ensureParentDirectory(task.path);

    std::unique_ptr<FILE, FileDeleter> file{std::fopen(task.path.string().c_str(), "wb")};
    if (!file) {
        throw TransferError(ErrorCode::IoError,
                            fmt::format("Cannot create {}", task.path.string()));
    }

    std::unique_ptr<Hasher> hasher;
    if (options_.verify_downloads && (task.sha256 || task.sha1)) {
        hasher = std::make_unique<Hasher>(task.sha256 ? HashAlgo::Sha256 : HashAlgo::Sha1);
    }

    std::uint64_t downloaded = 0;
    std::uint64_t total = 0;
    ResponseCallbacks callbacks;
    callbacks.on_head = [&](const ResponseHead& head) { total = head.content_length.value_or(0); };
    callbacks.on_data = [&](const char* data, std::size_t size) {
        if (std::fwrite(data, 1, size, file.get()) != size) {
            throw TransferError(ErrorCode::IoError,
                                fmt::format("Write error on {}", task.path.string()));
        }
        if (hasher) {
            hasher->update(data, size);
        }
        downloaded += size;
        notify(on_progress, task, TransferStatus::Downloading, downloaded, total,
               progress.addBytes(size));
    };

    client_->get(HttpRequest{task.url, std::nullopt}, callbacks);

    const bool flushed = std::fflush(file.get()) == 0;
    const bool closed = std::fclose(file.release()) == 0;
    if (!flushed || !closed) {
        throw TransferError(ErrorCode::IoError,
                            fmt::format("Failed to finish writing {}", task.path.string()));
    }

    if (hasher) {
        const auto& expected = task.sha256 ? *task.sha256 : *task.sha1;
        if (!digestEquals(hasher->finish(), expected)) {
            throw TransferError(ErrorCode::ChecksumMismatch,
                                fmt::format("Checksum mismatch for {}", task.path.string()));
        }
    }
}

} // namespace fetchkit
