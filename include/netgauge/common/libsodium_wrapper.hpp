// libsodium_wrapper.hpp - Libsodium Wrapper for NetGauge
// Copyright (C) 2025 DcruBro
// Distributed under the terms of the GNU General Public License, either version 2 only or version 3. See LICENSES/ for details.

#pragma once

#include <sodium.h>
#include <array>
#include <cstdint>
#include <cstddef>
#include <stdexcept>
#include <string>
#include <vector>
#include <netgauge/common/utils.hpp>

namespace NetGauge {
    using Digest512 = std::array<uint8_t, crypto_hash_sha512_BYTES>;
    using Secret = std::vector<uint8_t>;
}

namespace NetGauge::Utils {

    class LibSodiumWrapper {
        public:
            // Initialize libsodium once per process; throws std::runtime_error on failure. Safe to call repeatedly.
            static void init();

            // Fill buf from the system CSPRNG
            static void randomBytes(uint8_t* buf, size_t len);

            template <size_t N>
            static std::array<uint8_t, N> randomArray() {
                std::array<uint8_t, N> out{};
                randomBytes(out.data(), out.size());
                return out;
            }

            // SHA-512 over data || key (naked-hash construction used by the wire-compatible token scheme)
            static Digest512 sha512Concat(const uint8_t* data, size_t dataLen, const uint8_t* key, size_t keyLen);
            // HMAC-SHA-512 keyed by key over data
            static Digest512 hmacSha512(const uint8_t* data, size_t dataLen, const uint8_t* key, size_t keyLen);

            // Constant-time comparison; false when lengths differ
            static bool constantTimeEqual(const uint8_t* a, size_t aLen, const uint8_t* b, size_t bLen);

            // Wipe a buffer in a way the compiler will not elide
            static void wipe(void* data, size_t len) { sodium_memzero(data, len); }
    };

    // Deterministic keystream generator owned by exactly one thread. Seeded from the CSPRNG.
    class RandomStream {
        public:
            RandomStream();
            ~RandomStream();

            RandomStream(const RandomStream&) = delete;
            RandomStream& operator=(const RandomStream&) = delete;

            // Fill buf with fresh pseudorandom bytes
            void fill(uint8_t* buf, size_t len);

        private:
            std::array<uint8_t, randombytes_SEEDBYTES> mSeed{};
    };
}
