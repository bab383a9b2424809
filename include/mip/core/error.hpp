#pragma once

#include "mip/core/result.hpp"

#include <string>

namespace mip {

/**
 * @brief Failure classes that callers branch on
 *
 * Validation-negative outcomes are not errors and have no code here.
 */
enum class ErrorCode {
    NotFound,
    InvalidState,
    AlreadyTracked,
    Configuration,
    RenamerFailed,
    ShareUnavailable,
    TransferFailed,
    DestinationExists,
    VerificationFailed,
    Io,
    Store
};

struct Error {
    ErrorCode code = ErrorCode::Io;
    std::string message;
};

template<typename T>
using Outcome = Result<T, Error>;

using Status = Result<void, Error>;

template<typename T>
Outcome<T> Fail(ErrorCode code, std::string message) {
    return Outcome<T>(ErrValue<Error>(Error{code, std::move(message)}));
}

inline Status Done() { return Status(); }

inline const char* to_string(ErrorCode code) {
    switch (code) {
        case ErrorCode::NotFound: return "not_found";
        case ErrorCode::InvalidState: return "invalid_state";
        case ErrorCode::AlreadyTracked: return "already_tracked";
        case ErrorCode::Configuration: return "configuration";
        case ErrorCode::RenamerFailed: return "renamer_failed";
        case ErrorCode::ShareUnavailable: return "share_unavailable";
        case ErrorCode::TransferFailed: return "transfer_failed";
        case ErrorCode::DestinationExists: return "destination_exists";
        case ErrorCode::VerificationFailed: return "verification_failed";
        case ErrorCode::Io: return "io";
        case ErrorCode::Store: return "store";
    }
    return "unknown";
}

} // namespace mip
