// tcp_client.hpp - TCP Client for NetGauge
// Copyright (C) 2025 DcruBro
// Distributed under the terms of the GNU General Public License, either version 2 only or version 3. See LICENSES/ for details.

#pragma once

#include <chrono>
#include <cstdint>
#include <ostream>
#include <string>
#include <netgauge/common/auth/token.hpp>
#include <netgauge/common/context.hpp>
#include <netgauge/common/error.hpp>
#include <netgauge/common/net/tcp/timed_stream.hpp>
#include <netgauge/common/utils.hpp>

namespace NetGauge::Net::TCP {
    struct ClientConfig {
        std::string server = "127.0.0.1";
        uint16_t port = Utils::serverPort();
        std::chrono::milliseconds timeout{3000}; // Server side transfer time; the client waits twice as long
        bool dot = false;
    };

    struct TransferReport {
        uint64_t bytes = 0;
        std::chrono::nanoseconds elapsed{0};
        std::string ip; // Server address as seen by the client
    };

    class TCPClient {
        public:
            TCPClient(ClientConfig config, Auth::Token token)
                : mConfig(std::move(config)), mToken(std::move(token)) {}

            // Dial, handshake and run one transfer in the given direction
            Result<TransferReport> run(const Context::pointer& ctx, Auth::Direction direction);

            // Download then upload, printing the address and both speeds to out
            Error start(const Context::pointer& ctx, std::ostream& out);

            const ClientConfig& config() const { return mConfig; }

        private:
            Error mDownload(const Context::pointer& ctx, TimedStream& stream, uint64_t& bytes);
            Error mUpload(const Context::pointer& ctx, TimedStream& stream, uint64_t& bytes);

            ClientConfig mConfig;
            Auth::Token mToken;
    };
}
