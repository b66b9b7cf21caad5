// server_integration.cpp - End-to-end server tests for NetGauge
// Copyright (C) 2025 DcruBro
// Distributed under the terms of the GNU General Public License, either version 2 only or version 3. See LICENSES/ for details.

#include <netgauge/client/net/tcp/tcp_client.hpp>
#include <netgauge/common/auth/credential_table.hpp>
#include <netgauge/common/auth/token.hpp>
#include <netgauge/common/libsodium_wrapper.hpp>
#include <netgauge/common/net/tcp/net_helper.hpp>
#include <netgauge/common/net/tcp/timed_stream.hpp>
#include <netgauge/server/net/tcp/tcp_server.hpp>

#include <atomic>
#include <cassert>
#include <chrono>
#include <functional>
#include <memory>
#include <sstream>
#include <system_error>
#include <thread>

namespace {

using NetGauge::Context;
using NetGauge::Error;
using NetGauge::ErrorKind;
using NetGauge::Secret;
using NetGauge::ServerConfig;
using namespace NetGauge::Auth;
using namespace NetGauge::Net::TCP;
using namespace std::chrono_literals;

const Secret kSecret = {0x33, 0x12, 0xa1, 0x8b};

ServerConfig loopbackConfig(std::chrono::milliseconds timeout, size_t maxClients) {
    ServerConfig config;
    config.host = "127.0.0.1";
    config.port = 0;
    config.timeout = timeout;
    config.maxClients = maxClients;
    config.acceptInterval = 100ms;
    config.handshakeGrace = 500ms;
    return config;
}

std::shared_ptr<const CredentialTable> testCredentials() {
    auto table = CredentialTable::parse("1:3312a18b,2:666bf6a2");
    assert(table);
    return std::make_shared<const CredentialTable>(std::move(table.value()));
}

// Refuses to start the first session thread, as if the process ran out of threads
class ThreadStarvedServer : public TCPServer {
    public:
        using TCPServer::TCPServer;

        int refusedStarts() const { return mRefused.load(); }

    protected:
        std::thread mStartThread(std::function<void()> body) override {
            if (mRefused.fetch_add(1) == 0) {
                throw std::system_error(std::make_error_code(std::errc::resource_unavailable_try_again));
            }
            return TCPServer::mStartThread(std::move(body));
        }

    private:
        std::atomic<int> mRefused{0};
};

// Server on an ephemeral loopback port, served from its own thread
class RunningServer {
    public:
        RunningServer(std::chrono::milliseconds timeout, size_t maxClients)
            : RunningServer(std::make_unique<TCPServer>(loopbackConfig(timeout, maxClients), testCredentials())) {}

        explicit RunningServer(std::unique_ptr<TCPServer> server) : mServer(std::move(server)) {
            mCtx = Context::withCancel(Context::background());
            mThread = std::thread([this]() { mResult = mServer->run(mCtx); });
        }

        ~RunningServer() { stop(); }

        Error stop() {
            mCtx->cancel();
            if (mThread.joinable()) {
                mThread.join();
            }
            return mResult;
        }

        uint16_t port() const { return mServer->localPort(); }
        TCPServer& server() { return *mServer; }

    private:
        std::unique_ptr<TCPServer> mServer;
        Context::pointer mCtx;
        Error mResult;
        std::thread mThread;
};

TCPClient makeClient(uint16_t port, std::chrono::milliseconds timeout, Token token = Token(1, kSecret)) {
    ClientConfig config;
    config.server = "127.0.0.1";
    config.port = port;
    config.timeout = timeout;
    return TCPClient(config, std::move(token));
}

// Connect a raw stream to the server; the caller drives the protocol by hand
std::unique_ptr<TimedStream> dial(uint16_t port) {
    auto stream = std::make_unique<TimedStream>();
    asio::error_code ec = stream->connect("127.0.0.1", port, std::chrono::steady_clock::now() + 2s);
    assert(!ec);
    return stream;
}

// The server must close without sending a single byte
void expectSilentClose(TimedStream& stream) {
    uint8_t reply[kTokenLen];
    size_t received = 0;
    asio::error_code ec = stream.readExactly(reply, sizeof(reply), std::chrono::steady_clock::now() + 3s, &received);
    assert(ec);
    assert(ec != asio::error::timed_out);
    assert(received == 0);
}

void test_upload_handshake_succeeds() {
    RunningServer server(300ms, 1);
    TCPClient client = makeClient(server.port(), 300ms);

    auto report = client.run(Context::background(), Direction::UPLOAD);
    assert(report);
    assert(report.value().bytes > 0);
    assert(report.value().ip == "127.0.0.1");

    assert(server.stop().ok());
}

void test_download_handshake_succeeds() {
    RunningServer server(300ms, 1);
    TCPClient client = makeClient(server.port(), 300ms);

    auto report = client.run(Context::background(), Direction::DOWNLOAD);
    assert(report);
    assert(report.value().bytes > 0);
    assert(report.value().elapsed > 0ns);
}

void test_short_download_moves_bytes() {
    RunningServer server(50ms, 1);
    TCPClient client = makeClient(server.port(), 50ms);

    auto report = client.run(Context::background(), Direction::DOWNLOAD);
    assert(report);
    assert(report.value().bytes > 0);
}

void test_reply_token_is_signed_by_server() {
    RunningServer server(100ms, 1);
    auto stream = dial(server.port());

    Token token(1, kSecret);
    token.setDirection(Direction::DOWNLOAD);
    assert(token.handshake(*stream, std::chrono::steady_clock::now() + 2s).ok());
}

void test_backdated_token_is_rejected_silently() {
    RunningServer server(300ms, 1);
    auto stream = dial(server.port());

    Token token(1, kSecret);
    token.setDirection(Direction::UPLOAD);
    token.refresh();
    token.setTimestamp(unixNow() - 31);
    WireToken wire = token.sign();

    assert(!stream->writeAll(wire.data(), wire.size(), std::chrono::steady_clock::now() + 2s));
    expectSilentClose(*stream);
}

void test_unknown_client_is_rejected_silently() {
    RunningServer server(300ms, 1);
    auto stream = dial(server.port());

    Token token(42, kSecret);
    token.refresh();
    WireToken wire = token.sign();

    assert(!stream->writeAll(wire.data(), wire.size(), std::chrono::steady_clock::now() + 2s));
    expectSilentClose(*stream);
}

void test_wrong_secret_fails_client_handshake() {
    RunningServer server(300ms, 1);
    TCPClient client = makeClient(server.port(), 300ms, Token(2, kSecret));

    auto report = client.run(Context::background(), Direction::DOWNLOAD);
    assert(!report);
    assert(report.error().is(ErrorKind::HANDSHAKE_FAILED));
}

void test_short_token_is_dropped() {
    RunningServer server(300ms, 1);
    auto stream = dial(server.port());

    uint8_t partial[10] = {0, 0, 1};
    assert(!stream->writeAll(partial, sizeof(partial), std::chrono::steady_clock::now() + 2s));
    stream->socket().shutdown(asio::ip::tcp::socket::shutdown_send);
    expectSilentClose(*stream);
}

void test_second_client_waits_for_slot() {
    const auto serverTimeout = 300ms;
    RunningServer server(serverTimeout, 1);

    NetGauge::Result<TransferReport> first(Error(ErrorKind::IO, "not run"));
    NetGauge::Result<TransferReport> second(Error(ErrorKind::IO, "not run"));

    auto start = std::chrono::steady_clock::now();
    std::thread a([&]() {
        TCPClient client = makeClient(server.port(), 2s);
        first = client.run(Context::background(), Direction::DOWNLOAD);
    });
    std::this_thread::sleep_for(50ms);
    std::thread b([&]() {
        TCPClient client = makeClient(server.port(), 2s);
        second = client.run(Context::background(), Direction::DOWNLOAD);
    });
    a.join();
    b.join();
    auto elapsed = std::chrono::steady_clock::now() - start;

    assert(first && first.value().bytes > 0);
    assert(second && second.value().bytes > 0);
    assert(server.server().peakActiveSessions() == 1);
    // Sessions ran one after the other
    assert(elapsed >= 2 * serverTimeout);
}

void test_parallel_clients_share_slots() {
    RunningServer server(200ms, 3);

    NetGauge::Result<TransferReport> results[3] = {
        Error(ErrorKind::IO, "not run"), Error(ErrorKind::IO, "not run"), Error(ErrorKind::IO, "not run")};
    std::thread clients[3];
    for (int i = 0; i < 3; ++i) {
        clients[i] = std::thread([&, i]() {
            TCPClient client = makeClient(server.port(), 1s);
            results[i] = client.run(Context::background(), i % 2 == 0 ? Direction::DOWNLOAD : Direction::UPLOAD);
        });
    }
    for (auto& t : clients) {
        t.join();
    }

    for (auto& result : results) {
        assert(result && result.value().bytes > 0);
    }
    assert(server.server().peakActiveSessions() <= 3);
}

void test_shutdown_waits_for_session_deadline() {
    const auto serverTimeout = 1s;
    RunningServer server(serverTimeout, 1);

    NetGauge::Result<TransferReport> report(Error(ErrorKind::IO, "not run"));
    std::thread client([&]() {
        TCPClient c = makeClient(server.port(), serverTimeout);
        report = c.run(Context::background(), Direction::DOWNLOAD);
    });

    std::this_thread::sleep_for(200ms);
    auto start = std::chrono::steady_clock::now();
    Error result = server.stop();
    auto stopTime = std::chrono::steady_clock::now() - start;
    client.join();

    assert(result.ok());
    // The transfer kept going after the stop request and ended at its own deadline
    assert(report);
    assert(report.value().bytes > 0);
    assert(report.value().elapsed >= 800ms);
    // run() returned only once the session was over
    assert(stopTime >= 500ms);
    assert(stopTime < 3s);
    assert(server.server().activeSessions() == 0);
}

void test_failed_thread_start_keeps_serving() {
    auto starved = std::make_unique<ThreadStarvedServer>(loopbackConfig(200ms, 1), testCredentials());
    ThreadStarvedServer* raw = starved.get();
    RunningServer server(std::move(starved));

    // Dropped connection: the socket closes before any reply
    TCPClient first = makeClient(server.port(), 500ms);
    auto dropped = first.run(Context::background(), Direction::DOWNLOAD);
    assert(!dropped);
    assert(dropped.error().is(ErrorKind::HANDSHAKE_FAILED));
    assert(raw->refusedStarts() == 1);
    assert(server.server().activeSessions() == 0);

    // The only slot was returned, so the next client is served
    TCPClient second = makeClient(server.port(), 500ms);
    auto served = second.run(Context::background(), Direction::DOWNLOAD);
    assert(served);
    assert(served.value().bytes > 0);

    assert(server.stop().ok());
    assert(server.server().activeSessions() == 0);
}

void test_client_start_prints_report() {
    RunningServer server(100ms, 1);
    TCPClient client = makeClient(server.port(), 100ms);

    std::ostringstream out;
    Error err = client.start(Context::background(), out);
    assert(err.ok());

    std::string text = out.str();
    assert(text.find("IP address:     127.0.0.1\n") == 0);
    assert(text.find("Download speed: ") != std::string::npos);
    assert(text.find("Upload speed:   ") != std::string::npos);
    assert(text.find("Bits/s") != std::string::npos);
}

void test_bind_conflict_throws() {
    RunningServer server(100ms, 1);

    ServerConfig config;
    config.host = "127.0.0.1";
    config.port = server.port();
    auto table = CredentialTable::parse("1:3312a18b");

    bool threw = false;
    try {
        TCPServer second(config, std::make_shared<const CredentialTable>(std::move(table.value())));
    } catch (const std::runtime_error&) {
        threw = true;
    }
    assert(threw);
}

}  // namespace

int main() {
    NetGauge::Utils::LibSodiumWrapper::init();

    test_upload_handshake_succeeds();
    test_download_handshake_succeeds();
    test_short_download_moves_bytes();
    test_reply_token_is_signed_by_server();
    test_backdated_token_is_rejected_silently();
    test_unknown_client_is_rejected_silently();
    test_wrong_secret_fails_client_handshake();
    test_short_token_is_dropped();
    test_second_client_waits_for_slot();
    test_parallel_clients_share_slots();
    test_shutdown_waits_for_session_deadline();
    test_failed_thread_start_keeps_serving();
    test_client_start_prints_report();
    test_bind_conflict_throws();
    return 0;
}
