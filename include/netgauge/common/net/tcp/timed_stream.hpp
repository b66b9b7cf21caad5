// timed_stream.hpp - Deadline bound blocking TCP stream for NetGauge
// Copyright (C) 2025 DcruBro
// Distributed under the terms of the GNU General Public License, either version 2 only or version 3. See LICENSES/ for details.

#pragma once

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <memory>
#include <string>
#include <asio.hpp>
#include <netgauge/common/context.hpp>

namespace NetGauge::Net::TCP {
    // A TCP socket with its own io_context. Every call blocks the calling thread until the
    // operation completes or the deadline passes, in which case the operation is cancelled
    // and asio::error::timed_out is returned.
    class TimedStream {
        public:
            using pointer = std::unique_ptr<TimedStream>;
            using clock = std::chrono::steady_clock;

            TimedStream() : mSocket(mIoContext) {}
            ~TimedStream() { close(); }

            TimedStream(const TimedStream&) = delete;
            TimedStream& operator=(const TimedStream&) = delete;

            // Resolve host and connect to the first endpoint that accepts
            asio::error_code connect(const std::string& host, uint16_t port, clock::time_point deadline);

            // Read exactly len bytes; transferred receives the count even on failure
            asio::error_code readExactly(uint8_t* buf, size_t len, clock::time_point deadline, size_t* transferred = nullptr);
            // Read at least one byte
            asio::error_code readSome(uint8_t* buf, size_t len, clock::time_point deadline, size_t& transferred);
            // Write all len bytes; transferred receives the count even on failure
            asio::error_code writeAll(const uint8_t* data, size_t len, clock::time_point deadline, size_t* transferred = nullptr);

            // Cancel the in-flight and the next operation once ctx is cancelled.
            // The subscription must not outlive this stream.
            [[nodiscard]] Context::Subscription cancelOn(const Context::pointer& ctx);

            asio::ip::tcp::endpoint remoteEndpoint(asio::error_code& ec) const { return mSocket.remote_endpoint(ec); }
            asio::ip::tcp::socket& socket() { return mSocket; }
            bool isOpen() const { return mSocket.is_open(); }

            void close();

            // Deadline of ctx, or effectively never
            static clock::time_point deadlineOf(const Context& ctx);

        private:
            // Run the io_context until the pending operation completes or the deadline passes
            void mRunUntil(clock::time_point deadline, asio::error_code& ec);

            asio::io_context mIoContext;
            asio::ip::tcp::socket mSocket;
    };
}
