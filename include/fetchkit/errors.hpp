#pragma once

#include <stdexcept>
#include <string>
#include <string_view>

namespace fetchkit {

enum class ErrorCode {
    NetworkError,
    ChecksumMismatch,
    IoError,
    Cancelled,
    PartialFailure,
    InvalidArgument
};

[[nodiscard]] std::string_view toString(ErrorCode code) noexcept;

class TransferError : public std::runtime_error {
public:
    TransferError(ErrorCode code, const std::string& message)
        : std::runtime_error(message), code_(code) {}

    [[nodiscard]] ErrorCode code() const noexcept { return code_; }

private:
    ErrorCode code_;
};

} // namespace fetchkit
