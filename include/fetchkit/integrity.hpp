#pragma once

#include <cstddef>
#include <filesystem>
#include <memory>
#include <optional>
#include <string>
#include <string_view>

namespace fetchkit {

enum class HashAlgo {
    Sha256, // primary
    Sha1    // secondary
};

// Incremental digest over a stream of chunks; finish() yields lower-case hex.
class Hasher {
public:
    explicit Hasher(HashAlgo algo);
    ~Hasher();

    Hasher(Hasher&&) noexcept;
    Hasher& operator=(Hasher&&) noexcept;

    void update(const char* data, std::size_t size);
    void update(std::string_view data) { update(data.data(), data.size()); }
    [[nodiscard]] std::string finish();

private:
    class Impl;
    std::unique_ptr<Impl> impl_;
};

[[nodiscard]] std::string hashPrimary(std::string_view data);
[[nodiscard]] std::string hashSecondary(std::string_view data);

// The primary expectation alone decides when present, otherwise the secondary
// one; with no expectation at all the data is trusted.
[[nodiscard]] bool verify(std::string_view data,
                          const std::optional<std::string>& expected_primary,
                          const std::optional<std::string>& expected_secondary);

[[nodiscard]] std::string hashFile(const std::filesystem::path& path, HashAlgo algo);

// Same preference order as verify(), reading the file in blocks.
[[nodiscard]] bool verifyFile(const std::filesystem::path& path,
                              const std::optional<std::string>& expected_primary,
                              const std::optional<std::string>& expected_secondary);

[[nodiscard]] bool digestEquals(std::string_view lhs, std::string_view rhs) noexcept;

} // namespace fetchkit
