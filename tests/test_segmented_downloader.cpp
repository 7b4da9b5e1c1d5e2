#include "fetchkit/errors.hpp"
#include "fetchkit/integrity.hpp"
#include "fetchkit/segmented_downloader.hpp"
#include "fetchkit/transfer_state.hpp"
#include "support/fake_http_client.hpp"
#include "support/temp_dir.hpp"

#include <algorithm>
#include <filesystem>
#include <memory>
#include <mutex>
#include <string>
#include <vector>

#include <gtest/gtest.h>

namespace fetchkit::test {

namespace {
const std::string kUrl = "https://downloads.example.com/runtime-21.tar.gz";
} // namespace

class SegmentedDownloaderTest : public TempDirTest {
protected:
    void SetUp() override {
        TempDirTest::SetUp();
        client_ = std::make_shared<FakeHttpClient>();
        destination_ = test_dir_ / "runtimes" / "runtime-21.tar.gz";
    }

    TransferProgressCallback recorder() {
        return [this](const TransferProgressEvent& event) {
            std::lock_guard<std::mutex> lock(events_mutex_);
            events_.push_back(event);
        };
    }

    std::vector<TransferStatus> statuses() {
        std::lock_guard<std::mutex> lock(events_mutex_);
        std::vector<TransferStatus> result;
        for (const auto& event : events_) {
            result.push_back(event.status);
        }
        return result;
    }

    std::size_t countStatus(TransferStatus status) {
        const auto all = statuses();
        return static_cast<std::size_t>(std::count(all.begin(), all.end(), status));
    }

    // Writes a sidecar plus a full-size part file holding the bytes each
    // segment claims to have, zeros elsewhere.
    void writeResumeFixture(const std::string& body, const std::vector<Segment>& segments,
                            const std::string& url = kUrl) {
        std::string part(body.size(), '\0');
        for (const auto& segment : segments) {
            const auto have = segment.completed ? segment.length() : segment.downloaded;
            std::copy_n(body.begin() + static_cast<std::ptrdiff_t>(segment.start),
                        static_cast<std::ptrdiff_t>(have),
                        part.begin() + static_cast<std::ptrdiff_t>(segment.start));
        }
        writeFile(partPathFor(destination_), part);

        TransferState state;
        state.url = url;
        state.file_name = destination_.filename().string();
        state.total_size = body.size();
        state.timestamp = 1700000000;
        state.segments = segments;
        state.downloaded_bytes = state.sumSegmentBytes();
        saveTransferState(metaPathFor(destination_), state);
    }

    static std::vector<Segment> evenSegments(std::uint64_t total, std::size_t count) {
        std::vector<Segment> segments;
        const auto size = total / count;
        for (std::size_t i = 0; i < count; ++i) {
            const std::uint64_t start = i * size;
            const std::uint64_t end = (i + 1 == count) ? total - 1 : (i + 1) * size - 1;
            segments.push_back({start, end, 0, false});
        }
        return segments;
    }

    std::shared_ptr<FakeHttpClient> client_;
    std::filesystem::path destination_;
    std::mutex events_mutex_;
    std::vector<TransferProgressEvent> events_;
};

TEST_F(SegmentedDownloaderTest, DownloadsVerifiesAndCommits) {
    const auto body = makeBody(1000);
    client_->serve(kUrl, body);
    client_->setChunkSize(128);

    SegmentedDownloader downloader(client_);
    downloader.download({kUrl, "", body.size(), hashPrimary(body)}, destination_, {}, recorder());

    EXPECT_EQ(readFile(destination_), body);
    EXPECT_FALSE(std::filesystem::exists(partPathFor(destination_)));
    EXPECT_FALSE(std::filesystem::exists(metaPathFor(destination_)));

    ASSERT_EQ(client_->requestCount(), 1u);
    const auto request = client_->requests().front();
    ASSERT_TRUE(request.range.has_value());
    EXPECT_EQ(request.range->first, 0u);
    EXPECT_EQ(request.range->last, 999u);

    const auto seen = statuses();
    ASSERT_GE(seen.size(), 3u);
    EXPECT_EQ(seen[seen.size() - 2], TransferStatus::Verifying);
    EXPECT_EQ(seen.back(), TransferStatus::Completed);
    EXPECT_EQ(events_.back().file_name, "runtime-21.tar.gz");
    EXPECT_FLOAT_EQ(events_.back().percentage, 100.0f);
}

TEST_F(SegmentedDownloaderTest, ReportsDownloadProgressAtMostEveryHundredKiB) {
    const auto body = makeBody(kMiB);
    client_->serve(kUrl, body);
    client_->setChunkSize(16 * 1024);

    SegmentedDownloader downloader(client_);
    downloader.download({kUrl, "runtime", body.size(), std::nullopt}, destination_, {},
                        recorder());

    std::vector<TransferProgressEvent> downloading;
    for (const auto& event : events_) {
        if (event.status == TransferStatus::Downloading) {
            downloading.push_back(event);
        }
    }
    ASSERT_FALSE(downloading.empty());
    EXPECT_LE(downloading.size(), kMiB / (100 * 1024) + 1);
    EXPECT_EQ(downloading.back().downloaded_bytes, body.size());
    EXPECT_EQ(downloading.back().total_bytes, body.size());
    EXPECT_EQ(downloading.back().file_name, "runtime");
}

TEST_F(SegmentedDownloaderTest, LargeFileUsesOneRequestPerSegment) {
    const auto body = makeBody(24 * kMiB);
    client_->serve(kUrl, body);
    client_->setChunkSize(kMiB);

    SegmentedDownloader downloader(client_);
    downloader.download({kUrl, "", body.size(), hashPrimary(body)}, destination_, {}, recorder());

    EXPECT_EQ(readFile(destination_), body);
    const auto requests = client_->requests();
    ASSERT_EQ(requests.size(), 4u);

    std::uint64_t furthest = 0;
    {
        std::lock_guard<std::mutex> lock(events_mutex_);
        for (const auto& event : events_) {
            if (event.status == TransferStatus::Downloading) {
                EXPECT_LE(event.downloaded_bytes, body.size());
                furthest = std::max(furthest, event.downloaded_bytes);
            }
        }
    }
    EXPECT_EQ(furthest, body.size());
    EXPECT_EQ(statuses().back(), TransferStatus::Completed);

    std::vector<std::uint64_t> starts;
    for (const auto& request : requests) {
        starts.push_back(request.range->first);
    }
    std::sort(starts.begin(), starts.end());
    EXPECT_EQ(starts, (std::vector<std::uint64_t>{0, 6 * kMiB, 12 * kMiB, 18 * kMiB}));
    EXPECT_LE(client_->maxInFlight(), 4u);
}

TEST_F(SegmentedDownloaderTest, ResumeFetchesOnlyIncompleteSegments) {
    const auto body = makeBody(8000);
    auto segments = evenSegments(body.size(), 8);
    for (const std::size_t done : {0u, 3u, 6u}) {
        segments[done].downloaded = segments[done].length();
        segments[done].completed = true;
    }
    writeResumeFixture(body, segments);
    client_->serve(kUrl, body);

    SegmentedDownloader downloader(client_);
    downloader.download({kUrl, "", body.size(), hashPrimary(body)}, destination_);

    EXPECT_EQ(readFile(destination_), body);
    const auto requests = client_->requests();
    ASSERT_EQ(requests.size(), 5u);
    for (const auto& request : requests) {
        const auto it = std::find_if(segments.begin(), segments.end(), [&](const Segment& s) {
            return s.start == request.range->first && s.end == request.range->last;
        });
        ASSERT_NE(it, segments.end());
        EXPECT_FALSE(it->completed);
    }
    EXPECT_FALSE(std::filesystem::exists(metaPathFor(destination_)));
}

TEST_F(SegmentedDownloaderTest, ResumeContinuesInsideAPartialSegment) {
    const auto body = makeBody(1000);
    writeResumeFixture(body, {{0, 999, 400, false}});
    client_->serve(kUrl, body);

    SegmentedDownloader downloader(client_);
    downloader.download({kUrl, "", body.size(), hashPrimary(body)}, destination_);

    EXPECT_EQ(readFile(destination_), body);
    ASSERT_EQ(client_->requestCount(), 1u);
    EXPECT_EQ(client_->requests().front().range->first, 400u);
    EXPECT_EQ(client_->requests().front().range->last, 999u);
}

TEST_F(SegmentedDownloaderTest, StaleSidecarIsReplacedByFreshPlan) {
    const auto body = makeBody(1000);
    writeResumeFixture(body, {{0, 999, 400, false}}, "https://old.example.com/other.tar.gz");
    client_->serve(kUrl, body);

    SegmentedDownloader downloader(client_);
    downloader.download({kUrl, "", body.size(), std::nullopt}, destination_);

    EXPECT_EQ(readFile(destination_), body);
    ASSERT_EQ(client_->requestCount(), 1u);
    EXPECT_EQ(client_->requests().front().range->first, 0u);
}

TEST_F(SegmentedDownloaderTest, CancellationKeepsResumableState) {
    const auto body = makeBody(4000);
    client_->serve(kUrl, body);
    client_->setChunkSize(500);

    CancellationToken token;
    client_->setBeforeChunk([token](const HttpRequest&, std::size_t chunk) mutable {
        if (chunk == 2) {
            token.cancel();
        }
    });

    SegmentedDownloader downloader(client_);
    try {
        downloader.download({kUrl, "", body.size(), hashPrimary(body)}, destination_, token,
                            recorder());
        FAIL() << "expected cancellation";
    } catch (const TransferError& ex) {
        EXPECT_EQ(ex.code(), ErrorCode::Cancelled);
    }

    EXPECT_FALSE(std::filesystem::exists(destination_));
    EXPECT_EQ(countStatus(TransferStatus::Paused), 1u);
    const auto saved = loadTransferState(metaPathFor(destination_));
    ASSERT_TRUE(saved.has_value());
    ASSERT_EQ(saved->segments.size(), 1u);
    EXPECT_FALSE(saved->segments[0].completed);
    EXPECT_EQ(saved->segments[0].downloaded, 1000u);
    EXPECT_EQ(saved->downloaded_bytes, 1000u);

    client_->setBeforeChunk({});
    client_->clearRequests();
    downloader.download({kUrl, "", body.size(), hashPrimary(body)}, destination_,
                        CancellationToken{});

    EXPECT_EQ(readFile(destination_), body);
    ASSERT_EQ(client_->requestCount(), 1u);
    EXPECT_EQ(client_->requests().front().range->first, 1000u);
}

TEST_F(SegmentedDownloaderTest, CancelledTokenStopsBeforeAnyRequest) {
    client_->serve(kUrl, makeBody(100));
    CancellationToken token;
    token.cancel();

    SegmentedDownloader downloader(client_);
    try {
        downloader.download({kUrl, "", 100, std::nullopt}, destination_, token);
        FAIL() << "expected cancellation";
    } catch (const TransferError& ex) {
        EXPECT_EQ(ex.code(), ErrorCode::Cancelled);
    }
    EXPECT_EQ(client_->requestCount(), 0u);
    EXPECT_TRUE(loadTransferState(metaPathFor(destination_)).has_value());
}

TEST_F(SegmentedDownloaderTest, ChecksumMismatchDiscardsPartialData) {
    const auto body = makeBody(2000);
    client_->serve(kUrl, body);

    SegmentedDownloader downloader(client_);
    try {
        downloader.download({kUrl, "", body.size(), hashPrimary("something else")}, destination_,
                            {}, recorder());
        FAIL() << "expected checksum mismatch";
    } catch (const TransferError& ex) {
        EXPECT_EQ(ex.code(), ErrorCode::ChecksumMismatch);
    }

    EXPECT_FALSE(std::filesystem::exists(destination_));
    EXPECT_FALSE(std::filesystem::exists(partPathFor(destination_)));
    EXPECT_FALSE(std::filesystem::exists(metaPathFor(destination_)));
    EXPECT_EQ(statuses().back(), TransferStatus::Error);

    client_->clearRequests();
    downloader.download({kUrl, "", body.size(), hashPrimary(body)}, destination_);
    EXPECT_EQ(readFile(destination_), body);
    ASSERT_EQ(client_->requestCount(), 1u);
    EXPECT_EQ(client_->requests().front().range->first, 0u);
}

TEST_F(SegmentedDownloaderTest, FailedSegmentIsRetriedAlone) {
    const auto body = makeBody(24 * kMiB);
    client_->serve(kUrl, body);
    client_->setChunkSize(kMiB);
    client_->failRangeStartingAt(kUrl, 12 * kMiB);

    SegmentedDownloader downloader(client_);
    try {
        downloader.download({kUrl, "", body.size(), hashPrimary(body)}, destination_);
        FAIL() << "expected partial failure";
    } catch (const TransferError& ex) {
        EXPECT_EQ(ex.code(), ErrorCode::PartialFailure);
        EXPECT_NE(std::string(ex.what()).find("[2]"), std::string::npos);
    }

    const auto saved = loadTransferState(metaPathFor(destination_));
    ASSERT_TRUE(saved.has_value());
    EXPECT_EQ(saved->completedSegmentCount(), 3u);
    EXPECT_FALSE(saved->segments[2].completed);
    EXPECT_EQ(saved->downloaded_bytes, 18 * kMiB);

    client_->clearRequests();
    downloader.download({kUrl, "", body.size(), hashPrimary(body)}, destination_);
    EXPECT_EQ(readFile(destination_), body);
    ASSERT_EQ(client_->requestCount(), 1u);
    EXPECT_EQ(client_->requests().front().range->first, 12 * kMiB);
    EXPECT_EQ(client_->requests().front().range->last, 18 * kMiB - 1);
}

TEST_F(SegmentedDownloaderTest, SingleFailingSegmentKeepsItsOwnErrorCode) {
    const auto body = makeBody(500);
    client_->serve(kUrl, body);
    client_->failRangeStartingAt(kUrl, 0);

    SegmentedDownloader downloader(client_);
    try {
        downloader.download({kUrl, "", body.size(), std::nullopt}, destination_);
        FAIL() << "expected network error";
    } catch (const TransferError& ex) {
        EXPECT_EQ(ex.code(), ErrorCode::NetworkError);
    }
    EXPECT_TRUE(std::filesystem::exists(metaPathFor(destination_)));
}

TEST_F(SegmentedDownloaderTest, RejectsServerIgnoringRange) {
    const auto body = makeBody(1000);
    writeResumeFixture(body, {{0, 999, 400, false}});
    client_->serve(kUrl, body);
    client_->setIgnoreRanges(true);

    SegmentedDownloader downloader(client_);
    try {
        downloader.download({kUrl, "", body.size(), std::nullopt}, destination_);
        FAIL() << "expected network error";
    } catch (const TransferError& ex) {
        EXPECT_EQ(ex.code(), ErrorCode::NetworkError);
    }

    const auto saved = loadTransferState(metaPathFor(destination_));
    ASSERT_TRUE(saved.has_value());
    EXPECT_EQ(saved->segments[0].downloaded, 400u);
}

TEST_F(SegmentedDownloaderTest, AcceptsWholeFileAnswerToFullRange) {
    const auto body = makeBody(1000);
    client_->serve(kUrl, body);
    client_->setIgnoreRanges(true);

    SegmentedDownloader downloader(client_);
    downloader.download({kUrl, "", body.size(), hashPrimary(body)}, destination_);

    EXPECT_EQ(readFile(destination_), body);
    EXPECT_FALSE(std::filesystem::exists(metaPathFor(destination_)));
    ASSERT_EQ(client_->requestCount(), 1u);
    const auto request = client_->requests().front();
    ASSERT_TRUE(request.range.has_value());
    EXPECT_EQ(request.range->first, 0u);
    EXPECT_EQ(request.range->last, 999u);
}

TEST_F(SegmentedDownloaderTest, EmptyFileCommitsWithoutRequests) {
    client_->serve(kUrl, "");

    SegmentedDownloader downloader(client_);
    downloader.download({kUrl, "", 0, hashPrimary("")}, destination_);

    EXPECT_TRUE(std::filesystem::exists(destination_));
    EXPECT_EQ(std::filesystem::file_size(destination_), 0u);
    EXPECT_EQ(client_->requestCount(), 0u);
}

TEST_F(SegmentedDownloaderTest, RejectsEmptyUrl) {
    SegmentedDownloader downloader(client_);
    try {
        downloader.download({"", "", 10, std::nullopt}, destination_);
        FAIL() << "expected invalid argument";
    } catch (const TransferError& ex) {
        EXPECT_EQ(ex.code(), ErrorCode::InvalidArgument);
    }
}

} // namespace fetchkit::test
