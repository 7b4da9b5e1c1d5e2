#pragma once

#include "progress.hpp"

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <iostream>
#include <map>
#include <mutex>
#include <string>

namespace fetchkit {

// Terminal progress panel fed by either engine's events. Safe to call from
// worker threads; redraws at most once per interval.
class ConsoleReporter {
public:
    struct FileLine {
        std::string name;
        std::uint64_t downloaded{0};
        std::uint64_t total{0};
        std::uint64_t speed{0};
        TransferStatus status{TransferStatus::Downloading};
    };

    explicit ConsoleReporter(std::ostream& out = std::cout,
                             std::chrono::milliseconds interval = std::chrono::milliseconds(200));

    void onBatchEvent(const BatchProgressEvent& event);
    void onTransferEvent(const TransferProgressEvent& event);

    // Forces a final redraw.
    void finish();

    static std::string formatLine(const FileLine& line);
    static std::string formatSize(std::uint64_t bytes);

private:
    std::string buildPanel() const;
    void redrawLocked(bool force);

    std::ostream& out_;
    std::chrono::milliseconds interval_;
    std::chrono::steady_clock::time_point last_draw_{};

    mutable std::mutex mutex_;
    std::map<std::string, FileLine> active_;
    std::size_t completed_files_{0};
    std::size_t total_files_{0};
    std::size_t failed_files_{0};
    std::uint64_t total_bytes_{0};
    std::size_t previous_lines_{0};
};

} // namespace fetchkit
