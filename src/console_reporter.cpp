#include "fetchkit/console_reporter.hpp"

#include <algorithm>
#include <filesystem>

#include <fmt/format.h>

namespace fetchkit {

namespace {

constexpr std::size_t kMaxVisibleFiles = 10;

bool isTerminal(TransferStatus status) {
    return status == TransferStatus::Finished || status == TransferStatus::Skipped ||
           status == TransferStatus::Completed || status == TransferStatus::Error;
}

} // namespace

ConsoleReporter::ConsoleReporter(std::ostream& out, std::chrono::milliseconds interval)
    : out_(out), interval_(interval) {}

void ConsoleReporter::onBatchEvent(const BatchProgressEvent& event) {
    std::lock_guard<std::mutex> lock(mutex_);
    completed_files_ = std::max(completed_files_, event.completed_files);
    total_files_ = event.total_files;
    total_bytes_ = std::max(total_bytes_, event.total_downloaded_bytes);

    if (isTerminal(event.status)) {
        active_.erase(event.file);
        if (event.status == TransferStatus::Error) {
            ++failed_files_;
        }
    } else {
        auto& line = active_[event.file];
        line.name = event.file;
        line.downloaded = event.downloaded;
        line.total = event.total;
        line.status = event.status;
    }
    redrawLocked(isTerminal(event.status) && completed_files_ == total_files_);
}

void ConsoleReporter::onTransferEvent(const TransferProgressEvent& event) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto& line = active_[event.file_name];
    line.name = event.file_name;
    line.downloaded = event.downloaded_bytes;
    line.total = event.total_bytes;
    line.speed = event.speed_bytes_per_sec;
    line.status = event.status;
    total_bytes_ = event.downloaded_bytes;
    redrawLocked(event.status != TransferStatus::Downloading);
}

void ConsoleReporter::finish() {
    std::lock_guard<std::mutex> lock(mutex_);
    redrawLocked(true);
    out_ << std::flush;
}

std::string ConsoleReporter::buildPanel() const {
    std::string panel;
    panel.reserve(kMaxVisibleFiles * 128 + 256);
    panel.append("==================================================\n");

    std::size_t shown = 0;
    for (const auto& entry : active_) {
        if (shown++ == kMaxVisibleFiles) {
            panel += fmt::format("... and {} more\n", active_.size() - kMaxVisibleFiles);
            break;
        }
        panel += formatLine(entry.second);
        panel.push_back('\n');
    }

    panel.append("--------------------------------------------------\n");
    if (total_files_ > 0) {
        panel += fmt::format("Files: {}/{}  Transferred: {}", completed_files_, total_files_,
                             formatSize(total_bytes_));
        if (failed_files_ > 0) {
            panel += fmt::format("  Failed: {}", failed_files_);
        }
    } else {
        panel += fmt::format("Transferred: {}", formatSize(total_bytes_));
    }
    panel.push_back('\n');
    panel.append("==================================================\n");
    return panel;
}

std::string ConsoleReporter::formatLine(const FileLine& line) {
    std::string display_name = std::filesystem::path{line.name}.filename().string();
    if (display_name.empty()) {
        display_name = line.name;
    }
    if (display_name.size() > 20) {
        display_name = display_name.substr(0, 20);
    }
    if (display_name.empty()) {
        display_name = "(unnamed)";
    }

    std::string text;
    if (line.total > 0) {
        const double ratio = std::min(1.0, static_cast<double>(line.downloaded) /
                                               static_cast<double>(line.total));
        const int percent = static_cast<int>(ratio * 100.0);
        constexpr int bar_width = 30;
        const int bar_pos = static_cast<int>(ratio * bar_width);

        std::string bar;
        bar.reserve(static_cast<std::size_t>(bar_width) * 3);
        for (int i = 0; i < bar_width; ++i) {
            bar += (i < bar_pos) ? "#" : ".";
        }

        text = fmt::format("{:<20} [{}] {:>3}% ({}/{})", display_name, bar, percent,
                           formatSize(line.downloaded), formatSize(line.total));
        if (line.speed > 0) {
            text += fmt::format(" {}/s", formatSize(line.speed));
        }
    } else {
        text = fmt::format("{:<20} [{}]", display_name, formatSize(line.downloaded));
    }

    if (line.status != TransferStatus::Downloading) {
        text += fmt::format("  {}", toString(line.status));
    }
    return text;
}

std::string ConsoleReporter::formatSize(std::uint64_t bytes) {
    constexpr double KB = 1024.0;
    constexpr double MB = KB * 1024.0;
    constexpr double GB = MB * 1024.0;

    const double value = static_cast<double>(bytes);
    if (bytes >= static_cast<std::uint64_t>(GB)) {
        return fmt::format("{:.1f} GB", value / GB);
    } else if (bytes >= static_cast<std::uint64_t>(MB)) {
        return fmt::format("{:.1f} MB", value / MB);
    } else if (bytes >= static_cast<std::uint64_t>(KB)) {
        return fmt::format("{:.1f} KB", value / KB);
    } else {
        return fmt::format("{} B", bytes);
    }
}

void ConsoleReporter::redrawLocked(bool force) {
    const auto now = std::chrono::steady_clock::now();
    if (!force && previous_lines_ > 0 && now - last_draw_ < interval_) {
        return;
    }
    last_draw_ = now;

    const auto panel = buildPanel();
    const auto current_lines =
        static_cast<std::size_t>(std::count(panel.begin(), panel.end(), '\n'));
    if (previous_lines_ > 0) {
        out_ << "\033[" << previous_lines_ << "F\033[J";
    }
    out_ << panel;
    previous_lines_ = current_lines;
}

} // namespace fetchkit
