// token.cpp - Session Token for NetGauge
// Copyright (C) 2025 DcruBro
// Distributed under the terms of the GNU General Public License, either version 2 only or version 3. See LICENSES/ for details.

#include <netgauge/common/auth/token.hpp>

#include <cstring>
#include <stdexcept>
#include <netgauge/common/auth/credential_table.hpp>
#include <netgauge/common/net/tcp/timed_stream.hpp>
#include <netgauge/common/utils.hpp>

namespace NetGauge::Auth {
    const char* directionName(Direction direction) {
        return direction == Direction::DOWNLOAD ? "download" : "upload";
    }

    Result<SignatureScheme> parseSignatureScheme(const std::string& value) {
        if (value.empty() || value == "sha512") {
            return SignatureScheme::SHA512_CONCAT;
        }
        if (value == "hmac-sha512") {
            return SignatureScheme::HMAC_SHA512;
        }
        return Error(ErrorKind::CONFIG, "unknown signature scheme '" + value + "', expected sha512 or hmac-sha512");
    }

    const char* signatureSchemeName(SignatureScheme scheme) {
        return scheme == SignatureScheme::HMAC_SHA512 ? "hmac-sha512" : "sha512";
    }

    int64_t unixNow() {
        return std::chrono::duration_cast<std::chrono::seconds>(
            std::chrono::system_clock::now().time_since_epoch()).count();
    }

    Token::Token(uint16_t clientID, Secret secret, SignatureScheme scheme)
        : mClientID(clientID), mSecret(std::move(secret)), mScheme(scheme) {}

    Token::~Token() {
        if (!mSecret.empty()) {
            Utils::LibSodiumWrapper::wipe(mSecret.data(), mSecret.size());
        }
    }

    Result<Token> Token::parse(const std::string& pair, SignatureScheme scheme) {
        size_t colon = pair.find(':');
        if (colon == std::string::npos || pair.find(':', colon + 1) != std::string::npos) {
            return Error(ErrorKind::TOKEN_FORMAT, "invalid pair '" + pair + "', expected clientID:secret");
        }

        std::string idPart = pair.substr(0, colon);
        std::string secretPart = pair.substr(colon + 1);

        if (idPart.empty() || idPart.size() > 5 || idPart.find_first_not_of("0123456789") != std::string::npos) {
            return Error(ErrorKind::TOKEN_FORMAT, "clientID '" + idPart + "' is not a number");
        }

        unsigned long clientID = std::stoul(idPart);
        if (clientID > 0xFFFF) {
            return Error(ErrorKind::TOKEN_FORMAT, "clientID " + idPart + " is out of range [0, 65535]");
        }

        if (secretPart.empty()) {
            return Error(ErrorKind::TOKEN_FORMAT, "empty secret for clientID " + idPart);
        }

        Secret secret;
        try {
            secret = Utils::hexStringToBytes(secretPart);
        } catch (const std::invalid_argument& e) {
            return Error(ErrorKind::TOKEN_FORMAT, "secret for clientID " + idPart + ": " + e.what());
        }

        return Token(static_cast<uint16_t>(clientID), std::move(secret), scheme);
    }

    void Token::refresh() {
        Utils::LibSodiumWrapper::randomBytes(mSalt.data(), mSalt.size());
        mTimestamp = unixNow();
    }

    Signature Token::mComputeSignature(const uint8_t* prefix) const {
        if (mScheme == SignatureScheme::HMAC_SHA512) {
            return Utils::LibSodiumWrapper::hmacSha512(prefix, kSignatureOffset, mSecret.data(), mSecret.size());
        }
        return Utils::LibSodiumWrapper::sha512Concat(prefix, kSignatureOffset, mSecret.data(), mSecret.size());
    }

    WireToken Token::sign() {
        WireToken buf{};

        buf[0] = static_cast<uint8_t>(mDirection);
        Utils::storeBE16(buf.data() + kClientIDOffset, mClientID);
        std::memcpy(buf.data() + kPeerIPOffset, mPeerIP.data(), kPeerIPLen);
        std::memcpy(buf.data() + kSaltOffset, mSalt.data(), kSaltLen);
        Utils::storeBE64(buf.data() + kTimestampOffset, static_cast<uint64_t>(mTimestamp));

        mSignature = mComputeSignature(buf.data());
        std::memcpy(buf.data() + kSignatureOffset, mSignature.data(), kSignatureLen);

        return buf;
    }

    bool Token::verify(const uint8_t* signature, size_t length) {
        sign(); // Never trust a stored signature
        return Utils::LibSodiumWrapper::constantTimeEqual(signature, length, mSignature.data(), mSignature.size());
    }

    Result<Token> Token::decode(const uint8_t* data, size_t length, const CredentialTable& table, int64_t now) {
        if (data == nullptr || length != kTokenLen) {
            return Error(ErrorKind::TOKEN_FORMAT, "invalid token length: " + std::to_string(length));
        }

        if (data[0] > static_cast<uint8_t>(Direction::UPLOAD)) {
            return Error(ErrorKind::TOKEN_FORMAT, "invalid direction byte: " + std::to_string(data[0]));
        }

        uint16_t clientID = Utils::loadBE16(data + kClientIDOffset);

        const Secret* secret = table.find(clientID);
        if (secret == nullptr) {
            return Error(ErrorKind::UNKNOWN_CLIENT, "unknown clientID: " + std::to_string(clientID));
        }

        // Compared against the bounds rather than subtracted; the wire value is untrusted
        int64_t timestamp = static_cast<int64_t>(Utils::loadBE64(data + kTimestampOffset));
        if (timestamp < now - kReplayWindowSeconds || timestamp > now + kReplayWindowSeconds) {
            return Error(ErrorKind::REPLAY_WINDOW_EXCEEDED,
                "not synchronized time, timestamp=" + std::to_string(timestamp) + ", now=" + std::to_string(now) +
                ", abs limit=" + std::to_string(kReplayWindowSeconds));
        }

        Token token(clientID, *secret, table.scheme());
        token.mDirection = static_cast<Direction>(data[0]);
        std::memcpy(token.mPeerIP.data(), data + kPeerIPOffset, kPeerIPLen);
        std::memcpy(token.mSalt.data(), data + kSaltOffset, kSaltLen);
        token.mTimestamp = timestamp;

        if (!token.verify(data + kSignatureOffset, kSignatureLen)) {
            return Error(ErrorKind::SIGNATURE_MISMATCH, "invalid token signature");
        }

        return token;
    }

    Error Token::handshake(Net::TCP::TimedStream& stream, std::chrono::steady_clock::time_point deadline) {
        refresh();
        WireToken request = sign();

        asio::error_code ec = stream.writeAll(request.data(), request.size(), deadline);
        if (ec) {
            return Error(ErrorKind::HANDSHAKE_FAILED, "failed to write token", ec);
        }

        WireToken reply{};
        size_t received = 0;
        ec = stream.readExactly(reply.data(), reply.size(), deadline, &received);
        if (ec) {
            return Error(ErrorKind::HANDSHAKE_FAILED,
                "failed to read reply token (" + std::to_string(received) + "/" + std::to_string(kTokenLen) + " bytes)", ec);
        }

        CredentialTable own(mScheme);
        own.insert(mClientID, mSecret);

        auto decoded = decode(reply.data(), reply.size(), own);
        if (!decoded) {
            return Error(ErrorKind::HANDSHAKE_FAILED, "reply rejected: " + decoded.error().toString());
        }

        if (decoded.value().direction() != mDirection) {
            return Error(ErrorKind::HANDSHAKE_FAILED, "reply direction does not match the request");
        }

        return Error::none();
    }

    bool Token::sameCredential(const Token& other) const {
        return mClientID == other.mClientID && mSecret == other.mSecret;
    }
}
