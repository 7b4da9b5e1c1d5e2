#include "fetchkit/integrity.hpp"
#include "fetchkit/errors.hpp"

#include <array>
#include <cctype>
#include <cstdio>
#include <memory>
#include <string>

#include <fmt/format.h>
#include <openssl/evp.h>

namespace fetchkit {

namespace {

constexpr std::size_t kReadBlockSize = 1 << 20;

const EVP_MD* resolveAlgo(HashAlgo algo) {
    switch (algo) {
        case HashAlgo::Sha1:
            return EVP_sha1();
        case HashAlgo::Sha256:
        default:
            return EVP_sha256();
    }
}

std::string toHexLower(const unsigned char* bytes, std::size_t len) {
    static constexpr char kHex[] = "0123456789abcdef";
    std::string out(len * 2, '\0');
    for (std::size_t i = 0; i < len; ++i) {
        out[2 * i] = kHex[(bytes[i] >> 4) & 0xF];
        out[2 * i + 1] = kHex[bytes[i] & 0xF];
    }
    return out;
}

struct FileDeleter {
    void operator()(FILE* fp) const noexcept {
        if (fp) {
            std::fclose(fp);
        }
    }
};

} // namespace

class Hasher::Impl {
public:
    explicit Impl(HashAlgo algo) : ctx_(EVP_MD_CTX_new(), &EVP_MD_CTX_free) {
        if (!ctx_ || EVP_DigestInit_ex(ctx_.get(), resolveAlgo(algo), nullptr) != 1) {
            throw TransferError(ErrorCode::IoError, "Failed to initialise digest context");
        }
    }

    void update(const char* data, std::size_t size) {
        if (size == 0) {
            return;
        }
        if (EVP_DigestUpdate(ctx_.get(), data, size) != 1) {
            throw TransferError(ErrorCode::IoError, "Digest update failed");
        }
    }

    std::string finish() {
        std::array<unsigned char, EVP_MAX_MD_SIZE> digest{};
        unsigned int len = 0;
        if (EVP_DigestFinal_ex(ctx_.get(), digest.data(), &len) != 1) {
            throw TransferError(ErrorCode::IoError, "Digest finalisation failed");
        }
        return toHexLower(digest.data(), len);
    }

private:
    std::unique_ptr<EVP_MD_CTX, decltype(&EVP_MD_CTX_free)> ctx_;
};

Hasher::Hasher(HashAlgo algo) : impl_(std::make_unique<Impl>(algo)) {}

Hasher::~Hasher() = default;

Hasher::Hasher(Hasher&&) noexcept = default;

Hasher& Hasher::operator=(Hasher&&) noexcept = default;

void Hasher::update(const char* data, std::size_t size) { impl_->update(data, size); }

std::string Hasher::finish() { return impl_->finish(); }

std::string hashPrimary(std::string_view data) {
    Hasher hasher{HashAlgo::Sha256};
    hasher.update(data);
    return hasher.finish();
}

std::string hashSecondary(std::string_view data) {
    Hasher hasher{HashAlgo::Sha1};
    hasher.update(data);
    return hasher.finish();
}

bool digestEquals(std::string_view lhs, std::string_view rhs) noexcept {
    if (lhs.size() != rhs.size()) {
        return false;
    }
    for (std::size_t i = 0; i < lhs.size(); ++i) {
        if (std::tolower(static_cast<unsigned char>(lhs[i])) !=
            std::tolower(static_cast<unsigned char>(rhs[i]))) {
            return false;
        }
    }
    return true;
}

bool verify(std::string_view data,
            const std::optional<std::string>& expected_primary,
            const std::optional<std::string>& expected_secondary) {
    if (expected_primary) {
        return digestEquals(hashPrimary(data), *expected_primary);
    }
    if (expected_secondary) {
        return digestEquals(hashSecondary(data), *expected_secondary);
    }
    return true;
}

std::string hashFile(const std::filesystem::path& path, HashAlgo algo) {
    std::unique_ptr<FILE, FileDeleter> file{std::fopen(path.string().c_str(), "rb")};
    if (!file) {
        throw TransferError(ErrorCode::IoError,
                            fmt::format("Cannot open {} for hashing", path.string()));
    }

    Hasher hasher{algo};
    std::string buffer(kReadBlockSize, '\0');
    std::size_t read = 0;
    while ((read = std::fread(buffer.data(), 1, buffer.size(), file.get())) > 0) {
        hasher.update(buffer.data(), read);
    }
    if (std::ferror(file.get())) {
        throw TransferError(ErrorCode::IoError,
                            fmt::format("Read error while hashing {}", path.string()));
    }
    return hasher.finish();
}

bool verifyFile(const std::filesystem::path& path,
                const std::optional<std::string>& expected_primary,
                const std::optional<std::string>& expected_secondary) {
    if (expected_primary) {
        return digestEquals(hashFile(path, HashAlgo::Sha256), *expected_primary);
    }
    if (expected_secondary) {
        return digestEquals(hashFile(path, HashAlgo::Sha1), *expected_secondary);
    }
    return true;
}

} // namespace fetchkit
