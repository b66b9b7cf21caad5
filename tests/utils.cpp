// utils.cpp - Utility tests for NetGauge
// Copyright (C) 2025 DcruBro
// Distributed under the terms of the GNU General Public License, either version 2 only or version 3. See LICENSES/ for details.

#include <netgauge/common/error.hpp>
#include <netgauge/common/net/tcp/net_helper.hpp>
#include <netgauge/common/utils.hpp>

#include <cassert>
#include <chrono>
#include <stdexcept>
#include <string>
#include <vector>

namespace {

using NetGauge::Error;
using NetGauge::ErrorKind;
using NetGauge::Net::TCP::NetHelper;
using namespace NetGauge::Utils;
using namespace std::chrono_literals;

constexpr uint64_t KB = 1024;
constexpr uint64_t MB = 1024 * KB;
constexpr uint64_t GB = 1024 * MB;

void test_byte_size() {
    assert(byteSize(0) == "0 B");
    assert(byteSize(1) == "1 B");
    assert(byteSize(1023) == "1023 B");
    assert(byteSize(KB) == "1.00 KB");
    assert(byteSize(KB + 120) == "1.12 KB");
    assert(byteSize(MB) == "1.00 MB");
    assert(byteSize(MB + 130 * KB) == "1.13 MB");
    assert(byteSize(GB) == "1.00 GB");
    assert(byteSize(10 * GB + 140 * MB) == "10.14 GB");
}

void test_speed() {
    assert(speed(0ns, 0, SpeedUnit::SECONDS) == "0.00 Bits/s");
    assert(speed(0ns, 0, SpeedUnit::MILLISECONDS) == "0.00 Bits/ms");
    assert(speed(0ns, 0, SpeedUnit::MICROSECONDS) == "0.00 Bits/\xCE\xBCs");
    assert(speed(5000us, 50, SpeedUnit::MICROSECONDS) == "0.08 Bits/\xCE\xBCs");
    assert(speed(10ms, 57, SpeedUnit::MILLISECONDS) == "45.60 Bits/ms");
    assert(speed(1s, 21, SpeedUnit::SECONDS) == "168.00 Bits/s");
    assert(speed(10ms, 105 * KB, SpeedUnit::MILLISECONDS) == "84.00 KBits/ms");
    assert(speed(10ms, 106 * MB, SpeedUnit::MILLISECONDS) == "84.80 MBits/ms");
    assert(speed(10ms, 107 * GB, SpeedUnit::MILLISECONDS) == "85.60 GBits/ms");
    assert(speed(1s, 21) == "168.00 Bits/s");
}

void test_parse_port() {
    assert(parsePort("8080") == 8080);
    assert(parsePort("1") == 1);
    assert(parsePort("65535") == 65535);

    const char* bad[] = {"0", "-1", "65536", "abc", "", "99999999999999999999999"};
    for (const char* value : bad) {
        bool threw = false;
        try {
            parsePort(value);
        } catch (const std::invalid_argument&) {
            threw = true;
        }
        assert(threw);
    }
}

void test_hex() {
    std::vector<uint8_t> bytes = hexStringToBytes("3312A18b");
    assert((bytes == std::vector<uint8_t>{0x33, 0x12, 0xa1, 0x8b}));
    assert(bytesToHexString(bytes.data(), bytes.size()) == "3312a18b");
    assert(hexStringToBytes("").empty());

    const char* bad[] = {"abc", "zz", "0g"};
    for (const char* value : bad) {
        bool threw = false;
        try {
            hexStringToBytes(value);
        } catch (const std::invalid_argument&) {
            threw = true;
        }
        assert(threw);
    }
}

void test_big_endian_helpers() {
    uint8_t buf[8];
    storeBE16(buf, 0x0102);
    assert(buf[0] == 0x01 && buf[1] == 0x02);
    assert(loadBE16(buf) == 0x0102);

    storeBE64(buf, 0x0102030405060708ULL);
    assert(buf[0] == 0x01 && buf[7] == 0x08);
    assert(loadBE64(buf) == 0x0102030405060708ULL);
}

void test_expected_disconnects() {
    assert(NetHelper::isExpectedDisconnect(asio::error::eof));
    assert(NetHelper::isExpectedDisconnect(asio::error::operation_aborted));
    assert(NetHelper::isExpectedDisconnect(asio::error::connection_reset));
    assert(NetHelper::isExpectedDisconnect(asio::error::broken_pipe));
    assert(NetHelper::isExpectedDisconnect(asio::error::timed_out));
    assert(!NetHelper::isExpectedDisconnect(asio::error::connection_refused));
    assert(!NetHelper::isExpectedDisconnect(asio::error::host_unreachable));

    assert(NetHelper::isTransient(asio::error::connection_aborted));
    assert(!NetHelper::isTransient(asio::error::bad_descriptor));

    assert(NetHelper::toError(asio::error_code(), "ok").ok());
    assert(NetHelper::toError(asio::error::broken_pipe, "write").is(ErrorKind::END_OF_STREAM));
    assert(NetHelper::toError(asio::error::connection_refused, "dial").is(ErrorKind::IO));
}

void test_peer_ip_forms() {
    auto v4 = NetHelper::toPeerIP(asio::ip::make_address("127.0.0.1"));
    for (int i = 0; i < 10; ++i) {
        assert(v4[i] == 0);
    }
    assert(v4[10] == 0xff && v4[11] == 0xff);
    assert(v4[12] == 127 && v4[13] == 0 && v4[14] == 0 && v4[15] == 1);

    auto v6 = NetHelper::toPeerIP(asio::ip::make_address("::1"));
    assert(v6[15] == 1 && v6[10] == 0);

    assert(NetHelper::displayAddress(asio::ip::make_address("::ffff:10.0.0.2")) == "10.0.0.2");
    assert(NetHelper::displayAddress(asio::ip::make_address("::1")) == "::1");
}

void test_error_formatting() {
    Error none;
    assert(none.ok() && !none);

    Error err(ErrorKind::SIGNATURE_MISMATCH, "invalid token signature");
    assert(err && err.is(ErrorKind::SIGNATURE_MISMATCH));
    assert(err.toString() == "SIGNATURE_MISMATCH: invalid token signature");

    Error withCause(ErrorKind::IO, "read", std::make_error_code(std::errc::connection_reset));
    assert(withCause.toString().find("IO: read (cause: ") == 0);

    NetGauge::Result<int> value(5);
    assert(value && value.value() == 5);
    NetGauge::Result<int> failed(Error(ErrorKind::CONFIG, "bad"));
    assert(!failed && failed.error().is(ErrorKind::CONFIG));
}

}  // namespace

int main() {
    test_byte_size();
    test_speed();
    test_parse_port();
    test_hex();
    test_big_endian_helpers();
    test_expected_disconnects();
    test_peer_ip_forms();
    test_error_formatting();
    return 0;
}
