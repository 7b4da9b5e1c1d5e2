#include "fetchkit/batch_downloader.hpp"
#include "fetchkit/cancellation.hpp"
#include "fetchkit/config.hpp"
#include "fetchkit/console_reporter.hpp"
#include "fetchkit/detail/file_utils.hpp"
#include "fetchkit/errors.hpp"
#include "fetchkit/http_client.hpp"
#include "fetchkit/pending_queue.hpp"
#include "fetchkit/segmented_downloader.hpp"

#include <chrono>
#include <cstdint>
#include <filesystem>
#include <iostream>
#include <memory>
#include <optional>
#include <stdexcept>
#include <string>
#include <utility>
#include <vector>

#include <fmt/format.h>
#include <nlohmann/json.hpp>
#include <spdlog/spdlog.h>

namespace {

void printUsage(const char* programName) {
    std::cerr << "Usage: " << programName << " [-c <config.json>] [-v] <command> [args]\n"
              << "Commands:\n"
              << "  batch [-j <workers>] [-d <directory>] [--strict] <manifest.json>\n"
              << "  fetch [--size <bytes>] [--sha256 <hex>] <url> <destination>\n"
              << "  install [--size <bytes>] [--sha256 <hex>] <version> <variant> <url> <install_dir>\n"
              << "  resume     Retry every queued large download\n"
              << "  pending    List queued large downloads\n"
              << "Options:\n"
              << "  -c <file>   JSON configuration file\n"
              << "  -v          Verbose logging\n"
              << "  -h, --help  Show this message" << std::endl;
}

struct CommandLine {
    std::vector<std::string> positional;
    std::optional<std::uint64_t> size;
    std::optional<std::string> sha256;
    std::optional<std::size_t> workers;
    std::filesystem::path directory{std::filesystem::current_path()};
    bool strict{false};
};

std::uint64_t parseNumber(const std::string& option, const std::string& value) {
    try {
        std::size_t consumed = 0;
        const auto number = std::stoull(value, &consumed);
        if (consumed != value.size()) {
            throw std::invalid_argument(value);
        }
        return number;
    } catch (const std::exception&) {
        throw std::runtime_error("Invalid value for " + option + ": " + value);
    }
}

CommandLine parseCommandArgs(int argc, char** argv, int arg_index) {
    CommandLine cmd;
    while (arg_index < argc) {
        const std::string arg = argv[arg_index];
        const bool has_value = arg_index + 1 < argc;
        if ((arg == "--size" || arg == "--sha256" || arg == "-j" || arg == "-d") && !has_value) {
            throw std::runtime_error("Missing value for " + arg);
        }

        if (arg == "--size") {
            cmd.size = parseNumber(arg, argv[++arg_index]);
        } else if (arg == "--sha256") {
            cmd.sha256 = argv[++arg_index];
        } else if (arg == "-j") {
            cmd.workers = static_cast<std::size_t>(parseNumber(arg, argv[++arg_index]));
        } else if (arg == "-d") {
            cmd.directory = argv[++arg_index];
        } else if (arg == "--strict") {
            cmd.strict = true;
        } else {
            cmd.positional.push_back(arg);
        }
        ++arg_index;
    }
    return cmd;
}

std::vector<fetchkit::TransferTask> loadManifest(const std::filesystem::path& manifest,
                                                 const std::filesystem::path& base_dir) {
    const auto root = nlohmann::json::parse(fetchkit::detail::readFile(manifest));
    std::vector<fetchkit::TransferTask> tasks;
    for (const auto& entry : root) {
        fetchkit::TransferTask task;
        task.url = entry.at("url").get<std::string>();
        task.path = entry.at("path").get<std::string>();
        if (task.path.is_relative()) {
            task.path = base_dir / task.path;
        }
        if (entry.contains("sha256") && entry["sha256"].is_string()) {
            task.sha256 = entry["sha256"].get<std::string>();
        }
        if (entry.contains("sha1") && entry["sha1"].is_string()) {
            task.sha1 = entry["sha1"].get<std::string>();
        }
        tasks.push_back(std::move(task));
    }
    return tasks;
}

std::string fileNameFromUrl(const std::string& url) {
    auto end = url.find_first_of("?#");
    const std::string path = url.substr(0, end);
    const auto slash = path.find_last_of('/');
    std::string name = slash == std::string::npos ? path : path.substr(slash + 1);
    if (name.empty()) {
        throw std::runtime_error("Cannot derive a file name from " + url);
    }
    return name;
}

int runBatch(const fetchkit::EngineConfig& config, const CommandLine& cmd,
             fetchkit::HttpClientPtr client) {
    if (cmd.positional.size() != 1) {
        throw std::runtime_error("batch expects exactly one manifest file");
    }

    fetchkit::BatchOptions options = config.batch;
    if (cmd.workers) {
        options.max_concurrency = *cmd.workers;
    }
    if (cmd.strict) {
        options.policy = fetchkit::FailurePolicy::Strict;
    }

    const auto tasks = loadManifest(cmd.positional[0], cmd.directory);
    fetchkit::ConsoleReporter reporter;
    fetchkit::BatchDownloader downloader(std::move(client), options);
    const auto result = downloader.download(
        tasks, [&](const fetchkit::BatchProgressEvent& event) { reporter.onBatchEvent(event); });
    reporter.finish();

    for (const auto& failure : result.failures) {
        std::cerr << fmt::format("failed: {} -> {}: {}", failure.url, failure.path.string(),
                                 failure.message)
                  << std::endl;
    }
    return result.ok() ? 0 : 2;
}

int runFetch(const fetchkit::EngineConfig& config, const CommandLine& cmd,
             fetchkit::HttpClientPtr client) {
    if (cmd.positional.size() != 2) {
        throw std::runtime_error("fetch expects <url> <destination>");
    }

    const std::string& url = cmd.positional[0];
    const std::filesystem::path destination = cmd.positional[1];
    const auto size = fetchkit::resolveTransferSize(*client, url, cmd.size);
    fetchkit::LargeFileDescriptor descriptor{url, destination.filename().string(), size,
                                             cmd.sha256};

    fetchkit::CancellationToken cancel;
    fetchkit::InterruptGuard interrupt(cancel);
    fetchkit::ConsoleReporter reporter;
    fetchkit::SegmentedDownloader downloader(std::move(client), config.segmented);
    downloader.download(descriptor, destination, cancel,
                        [&](const fetchkit::TransferProgressEvent& event) {
                            reporter.onTransferEvent(event);
                        });
    reporter.finish();
    return 0;
}

fetchkit::ArchiveInstaller makeInstaller() {
    // Unpacking belongs to the caller's installer; the CLI leaves the archive in place.
    return [](const fetchkit::PendingTransferRecord& record, const std::filesystem::path& archive) {
        spdlog::info("{} {} ready at {}", record.key.version, record.key.variant, archive.string());
    };
}

int runInstall(const fetchkit::EngineConfig& config, const CommandLine& cmd,
               fetchkit::HttpClientPtr client) {
    if (cmd.positional.size() != 4) {
        throw std::runtime_error("install expects <version> <variant> <url> <install_dir>");
    }

    fetchkit::PendingTransferRecord record;
    record.key = {cmd.positional[0], cmd.positional[1]};
    record.download_url = cmd.positional[2];
    record.file_name = fileNameFromUrl(record.download_url);
    record.file_size = fetchkit::resolveTransferSize(*client, record.download_url, cmd.size);
    record.checksum = cmd.sha256;
    record.install_path = cmd.positional[3];
    record.created_at = static_cast<std::uint64_t>(
        std::chrono::duration_cast<std::chrono::seconds>(
            std::chrono::system_clock::now().time_since_epoch())
            .count());

    fetchkit::PendingTransferQueue queue(config.queue_file);
    fetchkit::SegmentedDownloader downloader(std::move(client), config.segmented);
    fetchkit::QueuedTransferRunner runner(queue, downloader, makeInstaller());
    fetchkit::CancellationToken cancel;
    fetchkit::InterruptGuard interrupt(cancel);
    fetchkit::ConsoleReporter reporter;
    runner.run(record, cancel, [&](const fetchkit::TransferProgressEvent& event) {
        reporter.onTransferEvent(event);
    });
    reporter.finish();
    return 0;
}

int runResume(const fetchkit::EngineConfig& config, fetchkit::HttpClientPtr client) {
    fetchkit::PendingTransferQueue queue(config.queue_file);
    if (queue.empty()) {
        std::cout << "No pending downloads" << std::endl;
        return 0;
    }

    fetchkit::SegmentedDownloader downloader(std::move(client), config.segmented);
    fetchkit::QueuedTransferRunner runner(queue, downloader, makeInstaller());
    fetchkit::CancellationToken cancel;
    fetchkit::InterruptGuard interrupt(cancel);
    fetchkit::ConsoleReporter reporter;
    const auto reports = runner.resumeAll(cancel, [&](const fetchkit::TransferProgressEvent& event) {
        reporter.onTransferEvent(event);
    });
    reporter.finish();

    int status = 0;
    for (const auto& report : reports) {
        if (!report.succeeded) {
            std::cerr << fmt::format("{} {}: {}", report.key.version, report.key.variant,
                                     report.error)
                      << std::endl;
            status = 2;
        }
    }
    return status;
}

int runPending(const fetchkit::EngineConfig& config) {
    fetchkit::PendingTransferQueue queue(config.queue_file);
    for (const auto& record : queue.records()) {
        std::cout << fmt::format("{:<10} {:<8} {:>12}  {}", record.key.version,
                                 record.key.variant,
                                 fetchkit::ConsoleReporter::formatSize(record.file_size),
                                 record.download_url)
                  << std::endl;
    }
    return 0;
}

} // namespace

int main(int argc, char** argv) {
    try {
        fetchkit::EngineConfig config;
        bool verbose = false;
        int arg_index = 1;

        while (arg_index < argc && argv[arg_index][0] == '-') {
            const std::string option = argv[arg_index];

            if (option == "-c") {
                if (arg_index + 1 >= argc) {
                    printUsage(argv[0]);
                    return 1;
                }
                config = fetchkit::loadConfig(argv[arg_index + 1]);
                arg_index += 2;
            } else if (option == "-v") {
                verbose = true;
                ++arg_index;
            } else if (option == "-h" || option == "--help") {
                printUsage(argv[0]);
                return 0;
            } else {
                printUsage(argv[0]);
                return 1;
            }
        }

        if (arg_index >= argc) {
            printUsage(argv[0]);
            return 1;
        }

        spdlog::set_level(verbose ? spdlog::level::debug
                                  : spdlog::level::from_str(config.log_level));

        const std::string command = argv[arg_index];
        const auto cmd = parseCommandArgs(argc, argv, arg_index + 1);

        if (command == "pending") {
            return runPending(config);
        }

        auto client = fetchkit::makeCurlHttpClient(config.http);
        if (command == "batch") {
            return runBatch(config, cmd, std::move(client));
        }
        if (command == "fetch") {
            return runFetch(config, cmd, std::move(client));
        }
        if (command == "install") {
            return runInstall(config, cmd, std::move(client));
        }
        if (command == "resume") {
            return runResume(config, std::move(client));
        }

        printUsage(argv[0]);
        return 1;
    } catch (const fetchkit::TransferError& ex) {
        std::cerr << "Transfer failed (" << fetchkit::toString(ex.code()) << "): " << ex.what()
                  << std::endl;
        return ex.code() == fetchkit::ErrorCode::Cancelled ? 130 : 1;
    } catch (const std::exception& ex) {
        std::cerr << "Fatal error: " << ex.what() << std::endl;
        return 1;
    }
}
