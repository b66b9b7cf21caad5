// timed_stream.cpp - Deadline bound blocking TCP stream for NetGauge
// Copyright (C) 2025 DcruBro
// Distributed under the terms of the GNU General Public License, either version 2 only or version 3. See LICENSES/ for details.

#include <netgauge/common/net/tcp/timed_stream.hpp>

using asio::ip::tcp;

namespace NetGauge::Net::TCP {
    TimedStream::clock::time_point TimedStream::deadlineOf(const Context& ctx) {
        auto deadline = ctx.deadline();
        if (deadline) {
            return *deadline;
        }
        return clock::now() + std::chrono::hours(24 * 365);
    }

    void TimedStream::mRunUntil(clock::time_point deadline, asio::error_code& ec) {
        mIoContext.restart();
        mIoContext.run_until(deadline);

        if (!mIoContext.stopped()) {
            // Deadline hit with the operation still pending; cancel it and let the handler run
            asio::error_code ignored;
            mSocket.cancel(ignored);
            mIoContext.run();
            ec = asio::error::timed_out;
        }
    }

    asio::error_code TimedStream::connect(const std::string& host, uint16_t port, clock::time_point deadline) {
        asio::error_code ec = asio::error::would_block;
        tcp::resolver resolver(mIoContext);
        tcp::resolver::results_type endpoints;

        resolver.async_resolve(host, std::to_string(port),
            [&](const asio::error_code& resolveEc, tcp::resolver::results_type results) {
                ec = resolveEc;
                endpoints = std::move(results);
            });

        mIoContext.restart();
        mIoContext.run_until(deadline);
        if (!mIoContext.stopped()) {
            resolver.cancel();
            mIoContext.run();
            return asio::error::timed_out;
        }
        if (ec) {
            return ec;
        }

        ec = asio::error::would_block;
        asio::async_connect(mSocket, endpoints,
            [&](const asio::error_code& connectEc, const tcp::endpoint&) {
                ec = connectEc;
            });
        mRunUntil(deadline, ec);

        if (!ec) {
            asio::error_code ignored;
            mSocket.set_option(tcp::no_delay(true), ignored);
        }
        return ec;
    }

    asio::error_code TimedStream::readExactly(uint8_t* buf, size_t len, clock::time_point deadline, size_t* transferred) {
        asio::error_code ec = asio::error::would_block;
        size_t n = 0;

        asio::async_read(mSocket, asio::buffer(buf, len),
            [&](const asio::error_code& readEc, size_t bytes) {
                ec = readEc;
                n = bytes;
            });
        mRunUntil(deadline, ec);

        if (transferred) {
            *transferred = n;
        }
        return ec;
    }

    asio::error_code TimedStream::readSome(uint8_t* buf, size_t len, clock::time_point deadline, size_t& transferred) {
        asio::error_code ec = asio::error::would_block;
        transferred = 0;

        mSocket.async_read_some(asio::buffer(buf, len),
            [&](const asio::error_code& readEc, size_t bytes) {
                ec = readEc;
                transferred = bytes;
            });
        mRunUntil(deadline, ec);

        return ec;
    }

    asio::error_code TimedStream::writeAll(const uint8_t* data, size_t len, clock::time_point deadline, size_t* transferred) {
        asio::error_code ec = asio::error::would_block;
        size_t n = 0;

        asio::async_write(mSocket, asio::buffer(data, len),
            [&](const asio::error_code& writeEc, size_t bytes) {
                ec = writeEc;
                n = bytes;
            });
        mRunUntil(deadline, ec);

        if (transferred) {
            *transferred = n;
        }
        return ec;
    }

    Context::Subscription TimedStream::cancelOn(const Context::pointer& ctx) {
        return ctx->onCancel([this]() {
            asio::post(mIoContext, [this]() {
                asio::error_code ignored;
                mSocket.cancel(ignored);
            });
        });
    }

    void TimedStream::close() {
        if (mSocket.is_open()) {
            asio::error_code ec;
            mSocket.shutdown(tcp::socket::shutdown_both, ec);
            mSocket.close(ec);
        }
    }
}
