// utils.cpp - Utility functions for NetGauge
// Copyright (C) 2025 DcruBro
// Distributed under the terms of the GNU General Public License, either version 2 only or version 3. See LICENSES/ for details.

#include <netgauge/common/utils.hpp>

#include <atomic>
#include <cstdio>
#include <fstream>
#include <mutex>
#include <stdexcept>

namespace NetGauge::Utils {
    namespace {
        std::mutex gLogMutex; // Sessions log from their own threads
#if DEBUG
        std::atomic<bool> gDebug{true};
#else
        std::atomic<bool> gDebug{false};
#endif

        int hexValue(char c) {
            if (c >= '0' && c <= '9') return c - '0';
            if (c >= 'a' && c <= 'f') return c - 'a' + 10;
            if (c >= 'A' && c <= 'F') return c - 'A' + 10;
            return -1;
        }

        std::string trim(const std::string& s) {
            const char* ws = " \t\r\n";
            size_t start = s.find_first_not_of(ws);
            if (start == std::string::npos) {
                return "";
            }
            size_t end = s.find_last_not_of(ws);
            return s.substr(start, end - start + 1);
        }

        std::string format(const char* fmt, double value, const char* unit) {
            char buf[64];
            std::snprintf(buf, sizeof(buf), fmt, value, unit);
            return buf;
        }
    }

    void log(const std::string &msg) {
        std::lock_guard<std::mutex> lock(gLogMutex);
        std::cout << "[LOG] " << msg << std::endl;
    }

    void warn(const std::string &msg) {
        std::lock_guard<std::mutex> lock(gLogMutex);
        std::cerr << "[WARN] " << msg << std::endl;
    }

    void error(const std::string &msg) {
        std::lock_guard<std::mutex> lock(gLogMutex);
        std::cerr << "[ERROR] " << msg << std::endl;
    }

    void debug(const std::string &msg) {
        if (!gDebug.load(std::memory_order_relaxed)) {
            return;
        }
        std::lock_guard<std::mutex> lock(gLogMutex);
        std::cout << "[DEBUG] " << msg << std::endl;
    }

    void setDebug(bool enabled) {
        gDebug.store(enabled, std::memory_order_relaxed);
    }

    bool isDebug() {
        return gDebug.load(std::memory_order_relaxed);
    }

    std::string getVersion() {
        return "a0.3";
    }

    unsigned short serverPort() {
        return 28082;
    }

    uint16_t parsePort(const std::string& value) {
        if (value.empty() || value.find_first_not_of("0123456789") != std::string::npos) {
            throw std::invalid_argument("parse port: not a number: '" + value + "'");
        }

        unsigned long port = 0;
        try {
            port = std::stoul(value);
        } catch (const std::out_of_range&) {
            throw std::invalid_argument("port number must be in range [1, 65535]");
        }

        if (port < 1 || port > 65535) {
            throw std::invalid_argument("port number must be in range [1, 65535]");
        }

        return static_cast<uint16_t>(port);
    }

    std::string bytesToHexString(const uint8_t* bytes, size_t length) {
        const char hexChars[] = "0123456789abcdef";
        std::string hexString;
        hexString.reserve(length * 2);

        for (size_t i = 0; i < length; ++i) {
            uint8_t byte = bytes[i];
            hexString.push_back(hexChars[(byte >> 4) & 0x0F]);
            hexString.push_back(hexChars[byte & 0x0F]);
        }

        return hexString;
    }

    std::vector<uint8_t> hexStringToBytes(const std::string& hex) {
        if (hex.size() % 2 != 0) {
            throw std::invalid_argument("odd length hex string");
        }

        std::vector<uint8_t> bytes;
        bytes.reserve(hex.size() / 2);

        for (size_t i = 0; i < hex.size(); i += 2) {
            int hi = hexValue(hex[i]);
            int lo = hexValue(hex[i + 1]);
            if (hi < 0 || lo < 0) {
                throw std::invalid_argument("invalid hex byte: '" + hex.substr(i, 2) + "'");
            }
            bytes.push_back(static_cast<uint8_t>((hi << 4) | lo));
        }

        return bytes;
    }

    std::string byteSize(uint64_t size) {
        const double kb = 1024.0;
        const double mb = 1024.0 * kb;
        const double gb = 1024.0 * mb;
        double value = static_cast<double>(size);

        if (value < kb) {
            return std::to_string(size) + " B";
        }
        if (value < mb) {
            return format("%.2f %s", value / kb, "KB");
        }
        if (value < gb) {
            return format("%.2f %s", value / mb, "MB");
        }
        return format("%.2f %s", value / gb, "GB");
    }

    std::string speed(std::chrono::nanoseconds duration, uint64_t count, SpeedUnit unit) {
        const double kb = 1024.0;
        const double mb = 1024.0 * kb;
        const double gb = 1024.0 * mb;

        double elapsed = 0.0;
        std::string name = "s";

        switch (unit) {
            case SpeedUnit::MICROSECONDS:
                elapsed = static_cast<double>(std::chrono::duration_cast<std::chrono::microseconds>(duration).count());
                name = "\xCE\xBCs"; // μs
                break;
            case SpeedUnit::MILLISECONDS:
                elapsed = static_cast<double>(std::chrono::duration_cast<std::chrono::milliseconds>(duration).count());
                name = "ms";
                break;
            default:
                elapsed = std::chrono::duration<double>(duration).count();
                break;
        }

        double rate = 0.0;
        if (elapsed > 0) {
            rate = static_cast<double>(count * 8) / elapsed;
        }

        if (rate < kb) {
            return format("%.2f Bits/%s", rate, name.c_str());
        }
        if (rate < mb) {
            return format("%.2f KBits/%s", rate / kb, name.c_str());
        }
        if (rate < gb) {
            return format("%.2f MBits/%s", rate / mb, name.c_str());
        }
        return format("%.2f GBits/%s", rate / gb, name.c_str());
    }

    std::unordered_map<std::string, std::string> getConfigMap(const std::string& path, const std::vector<std::string>& requiredKeys) {
        std::unordered_map<std::string, std::string> config;

        std::ifstream file(path);
        if (!file.is_open()) {
            debug("Config file " + path + " not found, using defaults.");
        } else {
            std::string line;
            size_t lineNo = 0;
            while (std::getline(file, line)) {
                lineNo++;
                line = trim(line);
                if (line.empty() || line[0] == '#') {
                    continue;
                }

                size_t eq = line.find('=');
                if (eq == std::string::npos) {
                    warn("Config " + path + ":" + std::to_string(lineNo) + " has no '=', skipping.");
                    continue;
                }

                config[trim(line.substr(0, eq))] = trim(line.substr(eq + 1));
            }
        }

        for (const auto& key : requiredKeys) {
            if (config.find(key) == config.end()) {
                throw std::runtime_error("Config " + path + " is missing required key " + key);
            }
        }

        return config;
    }
}
