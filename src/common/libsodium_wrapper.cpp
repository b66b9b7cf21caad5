// libsodium_wrapper.cpp - Libsodium Wrapper for NetGauge
// Copyright (C) 2025 DcruBro
// Distributed under the terms of the GNU General Public License, either version 2 only or version 3. See LICENSES/ for details.

#include <netgauge/common/libsodium_wrapper.hpp>

namespace NetGauge::Utils {

    void LibSodiumWrapper::init() {
        // sodium_init() is thread safe and returns 1 when already initialized
        if (sodium_init() < 0) {
            throw std::runtime_error("Failed to initialize libsodium");
        }
    }

    void LibSodiumWrapper::randomBytes(uint8_t* buf, size_t len) {
        randombytes_buf(buf, len);
    }

    Digest512 LibSodiumWrapper::sha512Concat(const uint8_t* data, size_t dataLen, const uint8_t* key, size_t keyLen) {
        Digest512 out{};
        crypto_hash_sha512_state state;

        crypto_hash_sha512_init(&state);
        crypto_hash_sha512_update(&state, data, dataLen);
        crypto_hash_sha512_update(&state, key, keyLen);
        crypto_hash_sha512_final(&state, out.data());

        sodium_memzero(&state, sizeof(state));
        return out;
    }

    Digest512 LibSodiumWrapper::hmacSha512(const uint8_t* data, size_t dataLen, const uint8_t* key, size_t keyLen) {
        Digest512 out{};
        crypto_auth_hmacsha512_state state;

        crypto_auth_hmacsha512_init(&state, key, keyLen);
        crypto_auth_hmacsha512_update(&state, data, dataLen);
        crypto_auth_hmacsha512_final(&state, out.data());

        sodium_memzero(&state, sizeof(state));
        return out;
    }

    bool LibSodiumWrapper::constantTimeEqual(const uint8_t* a, size_t aLen, const uint8_t* b, size_t bLen) {
        if (aLen != bLen) {
            return false;
        }
        if (aLen == 0) {
            return true;
        }
        return sodium_memcmp(a, b, aLen) == 0;
    }

    RandomStream::RandomStream() {
        LibSodiumWrapper::init();
        randombytes_buf(mSeed.data(), mSeed.size());
    }

    RandomStream::~RandomStream() {
        sodium_memzero(mSeed.data(), mSeed.size());
    }

    void RandomStream::fill(uint8_t* buf, size_t len) {
        // Each chunk comes from a distinct seed; the counter lives in the seed itself
        randombytes_buf_deterministic(buf, len, mSeed.data());
        sodium_increment(mSeed.data(), mSeed.size());
    }
}
