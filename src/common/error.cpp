// error.cpp - Error kinds and results for NetGauge
// Copyright (C) 2025 DcruBro
// Distributed under the terms of the GNU General Public License, either version 2 only or version 3. See LICENSES/ for details.

#include <netgauge/common/error.hpp>

namespace NetGauge {
    const char* errorKindName(ErrorKind kind) {
        switch (kind) {
            case ErrorKind::NONE: return "NONE";
            case ErrorKind::TOKEN_FORMAT: return "TOKEN_FORMAT";
            case ErrorKind::UNKNOWN_CLIENT: return "UNKNOWN_CLIENT";
            case ErrorKind::REPLAY_WINDOW_EXCEEDED: return "REPLAY_WINDOW_EXCEEDED";
            case ErrorKind::SIGNATURE_MISMATCH: return "SIGNATURE_MISMATCH";
            case ErrorKind::HANDSHAKE_FAILED: return "HANDSHAKE_FAILED";
            case ErrorKind::END_OF_STREAM: return "END_OF_STREAM";
            case ErrorKind::CANCELLED: return "CANCELLED";
            case ErrorKind::IO: return "IO";
            case ErrorKind::LISTENER: return "LISTENER";
            case ErrorKind::CONFIG: return "CONFIG";
        }
        return "UNKNOWN";
    }

    std::string Error::toString() const {
        std::string out = errorKindName(mKind);
        if (!mMessage.empty()) {
            out += ": " + mMessage;
        }
        if (mCause) {
            out += " (cause: " + mCause.message() + ")";
        }
        return out;
    }
}
