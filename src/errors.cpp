#include "fetchkit/errors.hpp"

namespace fetchkit {

std::string_view toString(ErrorCode code) noexcept {
    switch (code) {
        case ErrorCode::NetworkError:
            return "NetworkError";
        case ErrorCode::ChecksumMismatch:
            return "ChecksumMismatch";
        case ErrorCode::IoError:
            return "IoError";
        case ErrorCode::Cancelled:
            return "Cancelled";
        case ErrorCode::PartialFailure:
            return "PartialFailure";
        case ErrorCode::InvalidArgument:
            return "InvalidArgument";
    }
    return "Unknown";
}

} // namespace fetchkit
