// tcp_connection.hpp - TCP Connection for NetGauge
// Copyright (C) 2025 DcruBro
// Distributed under the terms of the GNU General Public License, either version 2 only or version 3. See LICENSES/ for details.

#pragma once

#include <chrono>
#include <cstdint>
#include <memory>
#include <string>
#include <netgauge/common/auth/credential_table.hpp>
#include <netgauge/common/auth/token.hpp>
#include <netgauge/common/context.hpp>
#include <netgauge/common/error.hpp>
#include <netgauge/common/net/tcp/timed_stream.hpp>

namespace NetGauge::Net::TCP {
    // Runtime state of one accepted connection
    struct Session {
        std::string client;                 // Remote address for logs
        Auth::Token token;                  // Set once the handshake succeeds
        Auth::Direction direction = Auth::Direction::DOWNLOAD;
        std::chrono::steady_clock::time_point start;
        uint64_t bytes = 0;
        bool authenticated = false;
    };

    // Handles one accepted connection on the calling thread: handshake, then one transfer.
    class TCPConnection {
        public:
            using pointer = std::unique_ptr<TCPConnection>;

            TCPConnection(TimedStream::pointer stream,
                          const Auth::CredentialTable& credentials,
                          std::chrono::milliseconds timeout,
                          std::chrono::milliseconds handshakeGrace)
                : mStream(std::move(stream)),
                  mCredentials(credentials),
                  mTimeout(timeout),
                  mHandshakeGrace(handshakeGrace)
            {}

            // Serve the connection until the transfer deadline. Closes the socket on every path.
            // Returns NONE on a completed transfer, the authentication error kind if the client was rejected.
            // Only the per-connection deadline bounds the session; server shutdown does not interrupt it.
            Error run();

            const Session& session() const { return mSession; }

        private:
            // Read and verify the client token, then write the re-signed reply
            Error mHandshake(const Context::pointer& ctx);
            // Stream pseudorandom bytes to the client
            Error mDownload(const Context::pointer& ctx);
            // Sink whatever the client sends
            Error mUpload(const Context::pointer& ctx);
            // Map a socket failure, preferring the context's own reason when it is done
            Error mSocketError(const Context::pointer& ctx, const asio::error_code& ec, const std::string& what) const;

            TimedStream::pointer mStream;
            const Auth::CredentialTable& mCredentials;
            std::chrono::milliseconds mTimeout;
            std::chrono::milliseconds mHandshakeGrace;
            Session mSession;
    };
}
