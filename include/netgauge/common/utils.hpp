// utils.hpp - Utility functions for NetGauge
// Copyright (C) 2025 DcruBro
// Distributed under the terms of the GNU General Public License, either version 2 only or version 3. See LICENSES/ for details.

#pragma once
#include <iostream>
#include <string>
#include <cstdint>
#include <array>
#include <vector>
#include <chrono>
#include <unordered_map>

namespace NetGauge::Utils {
    // General log function. Use for logging important information.
    void log(const std::string &msg);
    // General warning function. Use for logging important warnings.
    void warn(const std::string &msg);
    // General error function. Use for logging failures and general errors.
    void error(const std::string &msg);
    // Debug log function. Use for logging non-important information. These will not print unless the binary is compiled with DEBUG=1 or debug output was enabled at runtime.
    void debug(const std::string &msg);
    // Enable or disable debug output at runtime
    void setDebug(bool enabled);
    bool isDebug();

    // Returns the version of the running release.
    std::string getVersion();
    // Default TCP port for server and client
    unsigned short serverPort();

    // Parse a TCP port in range [1, 65535]; throws std::invalid_argument otherwise
    uint16_t parsePort(const std::string& value);

    // Raw byte to hex string conversion helper
    std::string bytesToHexString(const uint8_t* bytes, size_t length);
    // Hex string to raw byte conversion helper; throws std::invalid_argument on malformed input
    std::vector<uint8_t> hexStringToBytes(const std::string& hex);

    // uint8_t to raw string conversion helper
    template <size_t N>
    inline std::string uint8ArrayToString(const std::array<uint8_t, N>& arr) {
        return std::string(reinterpret_cast<const char*>(arr.data()), N);
    }

    inline std::string uint8ArrayToString(const uint8_t* data, size_t length) {
        return std::string(reinterpret_cast<const char*>(data), length);
    }

    // Big-endian store/load helpers for the wire format
    inline void storeBE16(uint8_t* out, uint16_t v) {
        out[0] = static_cast<uint8_t>(v >> 8);
        out[1] = static_cast<uint8_t>(v & 0xFF);
    }

    inline uint16_t loadBE16(const uint8_t* in) {
        return static_cast<uint16_t>((in[0] << 8) | in[1]);
    }

    inline void storeBE64(uint8_t* out, uint64_t v) {
        for (int i = 7; i >= 0; --i) {
            out[i] = static_cast<uint8_t>(v & 0xFF);
            v >>= 8;
        }
    }

    inline uint64_t loadBE64(const uint8_t* in) {
        uint64_t v = 0;
        for (int i = 0; i < 8; ++i) {
            v = (v << 8) | in[i];
        }
        return v;
    }

    enum class SpeedUnit : uint8_t {
        MICROSECONDS,
        MILLISECONDS,
        SECONDS,
    };

    // Human readable byte count: "512 B", "1.12 KB", "10.14 GB"
    std::string byteSize(uint64_t size);
    // Human readable bit rate over the given duration: "84.00 KBits/ms"
    std::string speed(std::chrono::nanoseconds duration, uint64_t count, SpeedUnit unit = SpeedUnit::SECONDS);

    // Returns the config file in an unordered_map format. This purely reads the config file, you still need to parse it manually.
    // Missing file yields an empty map; a missing required key throws std::runtime_error.
    std::unordered_map<std::string, std::string> getConfigMap(const std::string& path, const std::vector<std::string>& requiredKeys = {});
};
