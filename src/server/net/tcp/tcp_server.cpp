// tcp_server.cpp - TCP Server for NetGauge
// Copyright (C) 2025 DcruBro
// Distributed under the terms of the GNU General Public License, either version 2 only or version 3. See LICENSES/ for details.

#include <netgauge/server/net/tcp/tcp_server.hpp>

#include <stdexcept>
#include <string>
#include <system_error>
#include <netgauge/common/net/tcp/net_helper.hpp>
#include <netgauge/common/utils.hpp>
#include <netgauge/server/net/tcp/tcp_connection.hpp>

namespace NetGauge::Net::TCP {
    TCPServer::TCPServer(ServerConfig config, std::shared_ptr<const Auth::CredentialTable> credentials)
        : mConfig(std::move(config)),
          mCredentials(std::move(credentials)),
          mAcceptor(mIoContext),
          mAdmission(mConfig.maxClients)
    {
        if (!mCredentials || mCredentials->empty()) {
            throw std::runtime_error("TCP: no client credentials configured");
        }

        mOpenListener();
        Utils::log("Started TCP server on port " + std::to_string(mLocalPort));
    }

    TCPServer::~TCPServer() {
        mCloseListener();
        mReapSessions(true);
    }

    void TCPServer::mOpenListener() {
        asio::error_code ec;

        if (!mConfig.host.empty()) {
            asio::ip::address address = asio::ip::make_address(mConfig.host, ec);
            if (ec) {
                throw std::runtime_error("TCP: invalid listen address '" + mConfig.host + "': " + ec.message());
            }
            if (mConfig.ipv4Only && address.is_v6()) {
                throw std::runtime_error("TCP: listen address " + mConfig.host + " is IPv6 but IPv4-only mode is set");
            }

            asio::ip::tcp::endpoint endpoint(address, mConfig.port);
            mAcceptor.open(endpoint.protocol(), ec);
            if (!ec) mAcceptor.set_option(asio::socket_base::reuse_address(true), ec);
            if (!ec) mAcceptor.bind(endpoint, ec);
            if (!ec) mAcceptor.listen(asio::socket_base::max_listen_connections, ec);
            if (ec) {
                throw std::runtime_error("TCP: failed to listen on " + mConfig.host + ":" + std::to_string(mConfig.port) + ": " + ec.message());
            }
        } else {
            asio::error_code ec_open, ec_v6only, ec_bind;

            if (!mConfig.ipv4Only) {
                // Try IPv6 (dual-stack if supported)
                asio::ip::tcp::endpoint endpoint_v6(asio::ip::tcp::v6(), mConfig.port);

                mAcceptor.open(endpoint_v6.protocol(), ec_open);

                if (!ec_open) {
                    // Dual-stack is best effort
                    mAcceptor.set_option(asio::ip::v6_only(false), ec_v6only);
                    mAcceptor.set_option(asio::socket_base::reuse_address(true), ec_v6only);
                    mAcceptor.bind(endpoint_v6, ec_bind);
                }
            }

            if (mConfig.ipv4Only || ec_open || ec_bind) {
                if (!mConfig.ipv4Only)
                    Utils::warn("TCP: IPv6 unavailable (open=" + ec_open.message() +
                                ", bind=" + ec_bind.message() +
                                "), falling back to IPv4 only");

                asio::ip::tcp::endpoint endpoint_v4(asio::ip::tcp::v4(), mConfig.port);

                mAcceptor.close(ec); // guarantee clean state
                mAcceptor.open(endpoint_v4.protocol(), ec);
                if (!ec) mAcceptor.set_option(asio::socket_base::reuse_address(true), ec);
                if (!ec) mAcceptor.bind(endpoint_v4, ec);
                if (ec) {
                    throw std::runtime_error("TCP: failed to bind port " + std::to_string(mConfig.port) + ": " + ec.message());
                }
            }

            mAcceptor.listen(asio::socket_base::max_listen_connections, ec);
            if (ec) {
                throw std::runtime_error("TCP: failed to listen: " + ec.message());
            }
        }

        mLocalPort = mAcceptor.local_endpoint(ec).port();
        if (ec) {
            throw std::runtime_error("TCP: failed to query listener port: " + ec.message());
        }
    }

    Error TCPServer::run(const Context::pointer& ctx) {
        Utils::log("TCP: accepting clients (" + mConfig.describe() + ")");
        Error result;

        while (mAcceptor.is_open()) {
            mReapSessions(false);

            auto permit = mAdmission.acquire(ctx);
            if (!permit) {
                break; // Cancelled while every slot was busy
            }

            auto stream = std::make_unique<TimedStream>();
            asio::error_code ec = asio::error::would_block;

            // The peer socket belongs to the stream's own io_context; the session thread runs it
            mAcceptor.async_accept(stream->socket(), [&ec](const asio::error_code& acceptEc) {
                ec = acceptEc;
            });

            mIoContext.restart();
            mIoContext.run_for(mConfig.acceptInterval);
            if (!mIoContext.stopped()) {
                asio::error_code ignored;
                mAcceptor.cancel(ignored);
                mIoContext.run();
            }

            if (ec == asio::error::operation_aborted || ec == asio::error::would_block) {
                // Accept window elapsed
                permit->release();
                if (ctx->done()) {
                    break;
                }
                continue;
            }

            if (ec) {
                permit->release();
                if (NetHelper::isTransient(ec)) {
                    Utils::warn("TCP: accept dropped a connection: " + ec.message());
                    continue;
                }
                Utils::error("Accept failed: " + ec.message());
                result = Error(ErrorKind::LISTENER, "accept failed", ec);
                break;
            }

            mSpawnSession(std::move(stream), std::move(*permit));
        }

        mCloseListener();
        if (!mSessions.empty()) {
            Utils::log("TCP: waiting for " + std::to_string(mActive.load()) + " in-flight session(s)");
        }
        mReapSessions(true);
        Utils::log("TCP server stopped.");

        return result;
    }

    std::thread TCPServer::mStartThread(std::function<void()> body) {
        return std::thread(std::move(body));
    }

    void TCPServer::mSpawnSession(TimedStream::pointer stream, AdmissionSemaphore::Permit permit) {
        auto worker = std::make_unique<SessionWorker>();
        SessionWorker* raw = worker.get();

        // Shared so the thread body stays copyable; dropping it closes the socket and frees the slot
        auto job = std::make_shared<SessionJob>(SessionJob{std::move(stream), std::move(permit)});

        size_t active = ++mActive;
        size_t peak = mPeak.load();
        while (active > peak && !mPeak.compare_exchange_weak(peak, active)) {
        }

        try {
            raw->thread = mStartThread([this, raw, job]() {
                try {
                    TCPConnection connection(std::move(job->stream), *mCredentials, mConfig.timeout, mConfig.handshakeGrace);
                    connection.run(); // Outcome is logged by the connection
                } catch (const std::exception& e) {
                    Utils::error(std::string("Session error: ") + e.what());
                }

                --mActive;
                job->permit.release(); // Slot goes back only after the session stopped counting as active
                raw->finished.store(true);
            });
        } catch (const std::system_error& e) {
            --mActive;
            job->stream.reset();
            job->permit.release();
            Utils::error(std::string("TCP: could not start a session thread: ") + e.what());
            return;
        }

        mSessions.push_back(std::move(worker));
    }

    void TCPServer::mReapSessions(bool all) {
        for (auto it = mSessions.begin(); it != mSessions.end();) {
            if (all || (*it)->finished.load()) {
                if ((*it)->thread.joinable()) {
                    (*it)->thread.join();
                }
                it = mSessions.erase(it);
            } else {
                ++it;
            }
        }
    }

    void TCPServer::mCloseListener() {
        if (mAcceptor.is_open()) {
            asio::error_code ec;
            mAcceptor.cancel(ec);
            mAcceptor.close(ec);
            Utils::log("TCP Acceptor closed.");
        }
    }
}
