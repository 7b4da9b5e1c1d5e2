#include "fetchkit/detail/file_utils.hpp"
#include "fetchkit/errors.hpp"

#include <fstream>
#include <iterator>
#include <system_error>

#include <fmt/format.h>
#include <spdlog/spdlog.h>

namespace fetchkit::detail {

void writeFileAtomically(const std::filesystem::path& path, const std::string& content) {
    ensureParentDirectory(path);

    std::filesystem::path temp = path;
    temp += ".tmp";
    {
        std::ofstream out(temp, std::ios::binary | std::ios::trunc);
        if (!out) {
            throw TransferError(ErrorCode::IoError,
                                fmt::format("Cannot open {} for writing", temp.string()));
        }
        out.write(content.data(), static_cast<std::streamsize>(content.size()));
        out.flush();
        if (!out) {
            throw TransferError(ErrorCode::IoError,
                                fmt::format("Failed to write {}", temp.string()));
        }
    }

    std::error_code ec;
    std::filesystem::rename(temp, path, ec);
    if (ec) {
        removeFileQuietly(temp);
        throw TransferError(ErrorCode::IoError,
                            fmt::format("Failed to replace {}: {}", path.string(), ec.message()));
    }
}

std::string readFile(const std::filesystem::path& path) {
    std::ifstream in(path, std::ios::binary);
    if (!in) {
        throw TransferError(ErrorCode::IoError,
                            fmt::format("Cannot open {} for reading", path.string()));
    }
    std::string content{std::istreambuf_iterator<char>(in), std::istreambuf_iterator<char>()};
    if (in.bad()) {
        throw TransferError(ErrorCode::IoError, fmt::format("Failed to read {}", path.string()));
    }
    return content;
}

void ensureParentDirectory(const std::filesystem::path& path) {
    const auto parent = path.parent_path();
    if (parent.empty()) {
        return;
    }
    std::error_code ec;
    std::filesystem::create_directories(parent, ec);
    if (ec) {
        throw TransferError(ErrorCode::IoError,
                            fmt::format("Failed to create directory {}: {}", parent.string(),
                                        ec.message()));
    }
}

bool removeFileQuietly(const std::filesystem::path& path) noexcept {
    std::error_code ec;
    std::filesystem::remove(path, ec);
    if (ec) {
        spdlog::warn("Could not remove {}: {}", path.string(), ec.message());
        return false;
    }
    return true;
}

} // namespace fetchkit::detail
