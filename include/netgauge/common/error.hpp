// error.hpp - Error kinds and results for NetGauge
// Copyright (C) 2025 DcruBro
// Distributed under the terms of the GNU General Public License, either version 2 only or version 3. See LICENSES/ for details.

#pragma once

#include <cstdint>
#include <string>
#include <system_error>
#include <utility>
#include <variant>

namespace NetGauge {
    enum class ErrorKind : uint8_t {
        NONE = 0,
        TOKEN_FORMAT,           // Malformed or short token buffer, bad credential string
        UNKNOWN_CLIENT,         // clientID not present in the credential table
        REPLAY_WINDOW_EXCEEDED, // Timestamp outside the +-30s tolerance
        SIGNATURE_MISMATCH,     // Recomputed digest disagrees with the supplied one
        HANDSHAKE_FAILED,       // Client side handshake failure (I/O or reply verification)
        END_OF_STREAM,          // Deadline reached, graceful end of a transfer
        CANCELLED,              // True cancellation, not a deadline
        IO,                     // Non-transient socket error
        LISTENER,               // Bind/accept hard failure, fatal for the server
        CONFIG,                 // Invalid or missing configuration
    };

    const char* errorKindName(ErrorKind kind);

    class Error {
        public:
            Error() = default;
            Error(ErrorKind kind, std::string message, std::error_code cause = {})
                : mKind(kind), mMessage(std::move(message)), mCause(cause) {}

            static Error none() { return Error(); }

            ErrorKind kind() const { return mKind; }
            const std::string& message() const { return mMessage; }
            const std::error_code& cause() const { return mCause; }

            bool ok() const { return mKind == ErrorKind::NONE; }
            explicit operator bool() const { return !ok(); } // true when an error is present
            bool is(ErrorKind kind) const { return mKind == kind; }

            // "SIGNATURE_MISMATCH: invalid token signature (cause: ...)"
            std::string toString() const;

        private:
            ErrorKind mKind = ErrorKind::NONE;
            std::string mMessage;
            std::error_code mCause;
    };

    // Value or Error; never both
    template <typename T>
    class Result {
        public:
            Result(T value) : mValue(std::move(value)) {}
            Result(Error error) : mValue(std::move(error)) {}

            bool ok() const { return std::holds_alternative<T>(mValue); }
            explicit operator bool() const { return ok(); }

            T& value() { return std::get<T>(mValue); }
            const T& value() const { return std::get<T>(mValue); }
            const Error& error() const { return std::get<Error>(mValue); }

        private:
            std::variant<T, Error> mValue;
    };
}
