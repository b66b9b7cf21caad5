// server_config.hpp - Server settings for NetGauge
// Copyright (C) 2025 DcruBro
// Distributed under the terms of the GNU General Public License, either version 2 only or version 3. See LICENSES/ for details.

#pragma once

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <string>
#include <netgauge/common/utils.hpp>

namespace NetGauge {
    struct ServerConfig {
        std::string host;                                  // Empty listens on every interface
        uint16_t port = Utils::serverPort();               // 0 picks an ephemeral port
        std::chrono::milliseconds timeout{3000};           // Transfer duration per session
        size_t maxClients = 1;                             // Concurrent sessions
        bool ipv4Only = false;
        std::chrono::milliseconds acceptInterval{1000};    // Accept wait before re-checking cancellation
        std::chrono::milliseconds handshakeGrace{500};     // Added to timeout for the whole session

        // "host=[::]:28082 timeout=3000ms clients=1"
        std::string describe() const {
            return "host=" + (host.empty() ? std::string(ipv4Only ? "0.0.0.0" : "[::]") : host) +
                   ":" + std::to_string(port) +
                   " timeout=" + std::to_string(timeout.count()) + "ms" +
                   " clients=" + std::to_string(maxClients) +
                   (ipv4Only ? " ipv4-only" : "");
        }
    };
}
