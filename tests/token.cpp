// token.cpp - Token protocol tests for NetGauge
// Copyright (C) 2025 DcruBro
// Distributed under the terms of the GNU General Public License, either version 2 only or version 3. See LICENSES/ for details.

#include <netgauge/common/auth/credential_table.hpp>
#include <netgauge/common/auth/token.hpp>
#include <netgauge/common/libsodium_wrapper.hpp>
#include <netgauge/common/utils.hpp>

#include <cassert>
#include <cstring>
#include <vector>

namespace {

using NetGauge::ErrorKind;
using NetGauge::Secret;
using namespace NetGauge::Auth;

const Secret kSecret = {0x33, 0x12, 0xa1, 0x8b};

CredentialTable makeTable(SignatureScheme scheme = SignatureScheme::SHA512_CONCAT) {
    CredentialTable table(scheme);
    table.insert(1, kSecret);
    table.insert(2, Secret{0x66, 0x6b, 0xf6, 0xa2});
    return table;
}

Token makeToken(Direction direction = Direction::UPLOAD, SignatureScheme scheme = SignatureScheme::SHA512_CONCAT) {
    Token token(1, kSecret, scheme);
    token.setDirection(direction);
    PeerIP ip{};
    ip[10] = 0xff;
    ip[11] = 0xff;
    ip[12] = 127;
    ip[15] = 1;
    token.setPeerIP(ip);
    token.refresh();
    return token;
}

void test_wire_layout() {
    Token token = makeToken(Direction::UPLOAD);
    token.setTimestamp(0x0102030405060708LL);
    WireToken wire = token.sign();

    assert(wire.size() == 123);
    assert(wire[0] == 1);
    assert(wire[1] == 0x00 && wire[2] == 0x01);
    assert(wire[3 + 10] == 0xff && wire[3 + 11] == 0xff && wire[3 + 12] == 127 && wire[3 + 15] == 1);
    assert(std::memcmp(wire.data() + 19, token.salt().data(), 32) == 0);
    for (int i = 0; i < 8; ++i) {
        assert(wire[51 + i] == static_cast<uint8_t>(i + 1));
    }
    assert(std::memcmp(wire.data() + 59, token.signature().data(), 64) == 0);
}

void test_signature_is_sha512_of_prefix_and_secret() {
    Token token = makeToken();
    WireToken wire = token.sign();

    std::vector<uint8_t> input(wire.begin(), wire.begin() + 59);
    input.insert(input.end(), kSecret.begin(), kSecret.end());

    uint8_t expected[crypto_hash_sha512_BYTES];
    crypto_hash_sha512(expected, input.data(), input.size());
    assert(std::memcmp(expected, wire.data() + 59, 64) == 0);
}

void test_hmac_scheme_differs_and_round_trips() {
    Token plain = makeToken(Direction::DOWNLOAD, SignatureScheme::SHA512_CONCAT);
    Token keyed(1, kSecret, SignatureScheme::HMAC_SHA512);
    keyed.setDirection(plain.direction());
    keyed.setPeerIP(plain.peerIP());
    keyed.setTimestamp(plain.timestamp());

    WireToken a = plain.sign();
    WireToken b = keyed.sign();
    assert(std::memcmp(a.data() + 59, b.data() + 59, 64) != 0);

    auto ok = Token::decode(b.data(), b.size(), makeTable(SignatureScheme::HMAC_SHA512));
    assert(ok);

    auto mismatch = Token::decode(b.data(), b.size(), makeTable(SignatureScheme::SHA512_CONCAT));
    assert(!mismatch);
    assert(mismatch.error().is(ErrorKind::SIGNATURE_MISMATCH));
}

void test_decode_accepts_signed_token() {
    Token token = makeToken(Direction::DOWNLOAD);
    WireToken wire = token.sign();

    auto decoded = Token::decode(wire.data(), wire.size(), makeTable());
    assert(decoded);
    const Token& got = decoded.value();
    assert(got.clientID() == 1);
    assert(got.direction() == Direction::DOWNLOAD);
    assert(got.peerIP() == token.peerIP());
    assert(got.salt() == token.salt());
    assert(got.timestamp() == token.timestamp());
    assert(got.secret() == kSecret);
    assert(got.sameCredential(token));
}

void test_verify_detects_field_changes() {
    Token token = makeToken();
    WireToken wire = token.sign();
    const uint8_t* sig = wire.data() + kSignatureOffset;

    Token copy = token;
    assert(copy.verify(sig, kSignatureLen));

    copy = token;
    copy.setSecret(Secret{0x33, 0x12, 0xa1, 0x8c});
    assert(!copy.verify(sig, kSignatureLen));

    copy = token;
    copy.setTimestamp(token.timestamp() + 1);
    assert(!copy.verify(sig, kSignatureLen));

    copy = token;
    copy.setDirection(Direction::DOWNLOAD);
    assert(!copy.verify(sig, kSignatureLen));

    copy = token;
    copy.refresh(); // New salt
    assert(!copy.verify(sig, kSignatureLen));

    // Wrong length never verifies
    assert(!token.verify(sig, kSignatureLen - 1));
}

void test_any_flipped_bit_is_rejected() {
    Token token = makeToken();
    WireToken wire = token.sign();
    CredentialTable table = makeTable();

    for (size_t i = 0; i < kTokenLen; ++i) {
        for (int bit = 0; bit < 8; ++bit) {
            WireToken bad = wire;
            bad[i] ^= static_cast<uint8_t>(1u << bit);
            auto decoded = Token::decode(bad.data(), bad.size(), table, token.timestamp());
            assert(!decoded);
        }
    }
}

void test_short_and_long_buffers() {
    Token token = makeToken();
    WireToken wire = token.sign();
    CredentialTable table = makeTable();

    auto empty = Token::decode(wire.data(), 0, table);
    assert(!empty && empty.error().is(ErrorKind::TOKEN_FORMAT));

    auto shortBuf = Token::decode(wire.data(), kTokenLen - 1, table);
    assert(!shortBuf && shortBuf.error().is(ErrorKind::TOKEN_FORMAT));

    std::vector<uint8_t> longBuf(wire.begin(), wire.end());
    longBuf.push_back(0);
    auto tooLong = Token::decode(longBuf.data(), longBuf.size(), table);
    assert(!tooLong && tooLong.error().is(ErrorKind::TOKEN_FORMAT));
}

void test_invalid_direction_byte() {
    Token token = makeToken();
    WireToken wire = token.sign();
    wire[0] = 2;

    auto decoded = Token::decode(wire.data(), wire.size(), makeTable());
    assert(!decoded && decoded.error().is(ErrorKind::TOKEN_FORMAT));
}

void test_unknown_client() {
    Token token(7, kSecret);
    token.refresh();
    WireToken wire = token.sign();

    auto decoded = Token::decode(wire.data(), wire.size(), makeTable());
    assert(!decoded && decoded.error().is(ErrorKind::UNKNOWN_CLIENT));
}

void test_wrong_secret() {
    Token token(2, kSecret); // Table holds a different secret for client 2
    token.refresh();
    WireToken wire = token.sign();

    auto decoded = Token::decode(wire.data(), wire.size(), makeTable());
    assert(!decoded && decoded.error().is(ErrorKind::SIGNATURE_MISMATCH));
}

void test_replay_window() {
    Token token = makeToken();
    WireToken wire = token.sign();
    CredentialTable table = makeTable();
    int64_t ts = token.timestamp();

    assert(Token::decode(wire.data(), wire.size(), table, ts + 30));
    assert(Token::decode(wire.data(), wire.size(), table, ts - 30));

    auto late = Token::decode(wire.data(), wire.size(), table, ts + 31);
    assert(!late && late.error().is(ErrorKind::REPLAY_WINDOW_EXCEEDED));

    auto early = Token::decode(wire.data(), wire.size(), table, ts - 31);
    assert(!early && early.error().is(ErrorKind::REPLAY_WINDOW_EXCEEDED));
}

void test_replay_checked_before_signature() {
    Token token = makeToken();
    token.setTimestamp(unixNow() - 31);
    WireToken wire = token.sign();
    wire[kSignatureOffset] ^= 0x01;

    auto decoded = Token::decode(wire.data(), wire.size(), makeTable());
    assert(!decoded && decoded.error().is(ErrorKind::REPLAY_WINDOW_EXCEEDED));
}

void test_refresh_changes_salt_and_timestamp() {
    Token token(1, kSecret);
    assert(token.timestamp() == 0);

    token.refresh();
    Salt first = token.salt();
    int64_t now = unixNow();
    assert(token.timestamp() >= now - 1 && token.timestamp() <= now + 1);

    token.refresh();
    assert(token.salt() != first);
}

void test_parse_pairs() {
    auto ok = Token::parse("1:3312a18b");
    assert(ok);
    assert(ok.value().clientID() == 1);
    assert(ok.value().secret() == kSecret);

    auto max = Token::parse("65535:ff");
    assert(max && max.value().clientID() == 65535);

    const char* bad[] = {"", "1", "1:invalid", "1:3312a18b:invalid", "invalid:3312a18b", "65536:3312a18b", "1:", "-1:3312a18b", "1:abc"};
    for (const char* pair : bad) {
        auto parsed = Token::parse(pair);
        assert(!parsed);
        assert(parsed.error().is(ErrorKind::TOKEN_FORMAT));
    }
}

void test_signature_scheme_names() {
    assert(parseSignatureScheme("").value() == SignatureScheme::SHA512_CONCAT);
    assert(parseSignatureScheme("sha512").value() == SignatureScheme::SHA512_CONCAT);
    assert(parseSignatureScheme("hmac-sha512").value() == SignatureScheme::HMAC_SHA512);

    auto bad = parseSignatureScheme("md5");
    assert(!bad && bad.error().is(ErrorKind::CONFIG));

    assert(std::string(signatureSchemeName(SignatureScheme::HMAC_SHA512)) == "hmac-sha512");
    assert(std::string(directionName(Direction::UPLOAD)) == "upload");
}

}  // namespace

int main() {
    NetGauge::Utils::LibSodiumWrapper::init();

    test_wire_layout();
    test_signature_is_sha512_of_prefix_and_secret();
    test_hmac_scheme_differs_and_round_trips();
    test_decode_accepts_signed_token();
    test_verify_detects_field_changes();
    test_any_flipped_bit_is_rejected();
    test_short_and_long_buffers();
    test_invalid_direction_byte();
    test_unknown_client();
    test_wrong_secret();
    test_replay_window();
    test_replay_checked_before_signature();
    test_refresh_changes_salt_and_timestamp();
    test_parse_pairs();
    test_signature_scheme_names();
    return 0;
}
