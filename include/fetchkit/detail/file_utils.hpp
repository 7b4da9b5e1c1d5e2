#pragma once

#include <filesystem>
#include <string>

namespace fetchkit::detail {

// Writes to "<path>.tmp" and renames it over path. Throws TransferError(IoError).
void writeFileAtomically(const std::filesystem::path& path, const std::string& content);

// Throws TransferError(IoError) when the file cannot be read.
[[nodiscard]] std::string readFile(const std::filesystem::path& path);

void ensureParentDirectory(const std::filesystem::path& path);

// Best effort; returns false and logs when the file exists but cannot be removed.
bool removeFileQuietly(const std::filesystem::path& path) noexcept;

} // namespace fetchkit::detail
