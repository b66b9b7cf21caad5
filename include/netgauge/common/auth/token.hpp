// token.hpp - Session Token for NetGauge
// Copyright (C) 2025 DcruBro
// Distributed under the terms of the GNU General Public License, either version 2 only or version 3. See LICENSES/ for details.
//
// Token wire format (bytes, big-endian integers):
// +-----------+----------+---------+------+-----------+-----------+
// | direction | clientID |  peerIP | salt | timestamp | signature |
// +-----------+----------+---------+------+-----------+-----------+
// |     1     |     2    |    16   |  32  |     8     |    64     |
// +-----------+----------+---------+------+-----------+-----------+
// signature = SHA-512(bytes[0, 59) || secret), or HMAC-SHA-512(secret, bytes[0, 59)) when configured.

#pragma once

#include <array>
#include <chrono>
#include <cstddef>
#include <cstdint>
#include <string>
#include <netgauge/common/error.hpp>
#include <netgauge/common/libsodium_wrapper.hpp>

namespace NetGauge::Net::TCP {
    class TimedStream;
}

namespace NetGauge::Auth {
    inline constexpr size_t kDirectionLen = 1;
    inline constexpr size_t kClientIDLen = 2;
    inline constexpr size_t kPeerIPLen = 16;
    inline constexpr size_t kSaltLen = 32;
    inline constexpr size_t kTimestampLen = 8;
    inline constexpr size_t kSignatureLen = crypto_hash_sha512_BYTES;
    inline constexpr size_t kTokenLen = kDirectionLen + kClientIDLen + kPeerIPLen + kSaltLen + kTimestampLen + kSignatureLen;

    inline constexpr size_t kClientIDOffset = kDirectionLen;
    inline constexpr size_t kPeerIPOffset = kClientIDOffset + kClientIDLen;
    inline constexpr size_t kSaltOffset = kPeerIPOffset + kPeerIPLen;
    inline constexpr size_t kTimestampOffset = kSaltOffset + kSaltLen;
    inline constexpr size_t kSignatureOffset = kTimestampOffset + kTimestampLen;

    static_assert(kTokenLen == 123, "token wire size is fixed");

    // Maximum allowed |now - timestamp| in seconds
    inline constexpr int64_t kReplayWindowSeconds = 30;

    using WireToken = std::array<uint8_t, kTokenLen>;
    using PeerIP = std::array<uint8_t, kPeerIPLen>;
    using Salt = std::array<uint8_t, kSaltLen>;
    using Signature = std::array<uint8_t, kSignatureLen>;

    enum class Direction : uint8_t {
        DOWNLOAD = 0, // Server sends
        UPLOAD = 1,   // Server receives
    };

    const char* directionName(Direction direction);

    enum class SignatureScheme : uint8_t {
        SHA512_CONCAT, // Wire compatible with existing deployments
        HMAC_SHA512,
    };

    // "sha512" or "hmac-sha512"; CONFIG error otherwise
    Result<SignatureScheme> parseSignatureScheme(const std::string& value);
    const char* signatureSchemeName(SignatureScheme scheme);

    // Current UNIX time in seconds
    int64_t unixNow();

    class CredentialTable;

    class Token {
        public:
            Token() = default;
            Token(uint16_t clientID, Secret secret, SignatureScheme scheme = SignatureScheme::SHA512_CONCAT);
            ~Token();

            Token(const Token&) = default;
            Token& operator=(const Token&) = default;
            Token(Token&&) = default;
            Token& operator=(Token&&) = default;

            // Parse "clientID:hexsecret"; TOKEN_FORMAT on malformed input
            static Result<Token> parse(const std::string& pair, SignatureScheme scheme = SignatureScheme::SHA512_CONCAT);

            // New random salt, timestamp = now. Call before every sign() that originates a credential.
            void refresh();

            // Serialize all fields, compute and store the signature, return the wire form
            WireToken sign();

            // Recompute the signature over the current fields and compare in constant time
            bool verify(const uint8_t* signature, size_t length);

            // Parse and authenticate a wire token against the table. The result carries the table's secret.
            static Result<Token> decode(const uint8_t* data, size_t length, const CredentialTable& table, int64_t now = unixNow());

            // Client side: refresh, sign and send this token, then read and verify the server's reply.
            // HANDSHAKE_FAILED with the underlying cause on any failure.
            Error handshake(Net::TCP::TimedStream& stream, std::chrono::steady_clock::time_point deadline);

            // Same client and secret; used to compare loaded credentials
            bool sameCredential(const Token& other) const;

            uint16_t clientID() const { return mClientID; }
            const Secret& secret() const { return mSecret; }
            SignatureScheme scheme() const { return mScheme; }
            Direction direction() const { return mDirection; }
            const PeerIP& peerIP() const { return mPeerIP; }
            const Salt& salt() const { return mSalt; }
            int64_t timestamp() const { return mTimestamp; }
            const Signature& signature() const { return mSignature; }

            void setDirection(Direction direction) { mDirection = direction; }
            void setPeerIP(const PeerIP& ip) { mPeerIP = ip; }
            void setTimestamp(int64_t timestamp) { mTimestamp = timestamp; }
            void setSecret(Secret secret) { mSecret = std::move(secret); }

        private:
            Signature mComputeSignature(const uint8_t* prefix) const;

            uint16_t mClientID = 0;
            Secret mSecret;
            SignatureScheme mScheme = SignatureScheme::SHA512_CONCAT;
            Direction mDirection = Direction::DOWNLOAD;
            PeerIP mPeerIP{};
            Salt mSalt{};
            int64_t mTimestamp = 0;
            Signature mSignature{};
    };
}
