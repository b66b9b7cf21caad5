// tcp_connection.cpp - TCP Connection for NetGauge
// Copyright (C) 2025 DcruBro
// Distributed under the terms of the GNU General Public License, either version 2 only or version 3. See LICENSES/ for details.

#include <netgauge/server/net/tcp/tcp_connection.hpp>

#include <vector>
#include <netgauge/common/net/tcp/net_helper.hpp>
#include <netgauge/common/reader.hpp>
#include <netgauge/common/utils.hpp>
#include <netgauge/common/writer.hpp>

namespace NetGauge::Net::TCP {
    Error TCPConnection::run() {
        mSession.start = std::chrono::steady_clock::now();

        asio::error_code ec;
        auto endpoint = mStream->remoteEndpoint(ec);
        mSession.client = ec ? std::string("unknown") : NetHelper::displayAddress(endpoint.address()) + ":" + std::to_string(endpoint.port());

        // Rooted apart from the server context: shutdown waits for the session instead of cutting it short
        auto sessionCtx = Context::withTimeout(Context::background(), mTimeout + mHandshakeGrace);
        auto cancelSub = mStream->cancelOn(sessionCtx);

        Utils::log("Accepted new client connection: " + mSession.client);

        Error err = mHandshake(sessionCtx);
        if (err) {
            mStream->close();
            Utils::warn("Rejected " + mSession.client + ": " + err.toString());
            return err;
        }

        auto transferCtx = Context::withTimeout(sessionCtx, mTimeout);
        err = mSession.direction == Auth::Direction::DOWNLOAD ? mDownload(transferCtx) : mUpload(transferCtx);
        mStream->close();

        // Hitting the deadline is how a transfer ends
        if (err.is(ErrorKind::END_OF_STREAM)) {
            err = Error::none();
        }

        auto elapsed = std::chrono::steady_clock::now() - mSession.start;
        auto elapsedMs = std::chrono::duration_cast<std::chrono::milliseconds>(elapsed).count();
        std::string report = "client " + std::to_string(mSession.token.clientID()) + " (" + mSession.client + ") " +
                             Auth::directionName(mSession.direction) + " " + Utils::byteSize(mSession.bytes) +
                             " in " + std::to_string(elapsedMs) + "ms";

        if (!err) {
            Utils::log("Session done: " + report + ", " + Utils::speed(elapsed, mSession.bytes));
        } else {
            Utils::warn("Session failed: " + report + ": " + err.toString());
        }

        return err;
    }

    Error TCPConnection::mSocketError(const Context::pointer& ctx, const asio::error_code& ec, const std::string& what) const {
        if (ctx->done()) {
            return contextDoneError(*ctx);
        }
        return NetHelper::toError(ec, what);
    }

    Error TCPConnection::mHandshake(const Context::pointer& ctx) {
        auto deadline = TimedStream::deadlineOf(*ctx);

        Auth::WireToken request{};
        size_t received = 0;
        asio::error_code ec = mStream->readExactly(request.data(), request.size(), deadline, &received);
        if (ec) {
            return Error(ErrorKind::TOKEN_FORMAT,
                "short token read (" + std::to_string(received) + "/" + std::to_string(Auth::kTokenLen) + " bytes)", ec);
        }

        auto decoded = Auth::Token::decode(request.data(), request.size(), mCredentials);
        if (!decoded) {
            return decoded.error(); // Nothing is written back
        }

        mSession.token = std::move(decoded.value());
        mSession.direction = mSession.token.direction();

        mSession.token.refresh();
        Auth::WireToken reply = mSession.token.sign();

        ec = mStream->writeAll(reply.data(), reply.size(), deadline);
        if (ec) {
            return mSocketError(ctx, ec, "failed to write reply token");
        }

        mSession.authenticated = true;
        Utils::debug("Client " + std::to_string(mSession.token.clientID()) + " authenticated from " + mSession.client +
                     ", direction " + Auth::directionName(mSession.direction));
        return Error::none();
    }

    Error TCPConnection::mDownload(const Context::pointer& ctx) {
        auto deadline = TimedStream::deadlineOf(*ctx);
        Reader reader(ctx);
        std::vector<uint8_t> buf(kDefaultBufSize);

        for (;;) {
            auto n = reader.read(buf.data(), buf.size());
            if (!n) {
                return n.error();
            }

            size_t written = 0;
            asio::error_code ec = mStream->writeAll(buf.data(), n.value(), deadline, &written);
            mSession.bytes += written;
            if (ec) {
                return mSocketError(ctx, ec, "download write failed");
            }
        }
    }

    Error TCPConnection::mUpload(const Context::pointer& ctx) {
        auto deadline = TimedStream::deadlineOf(*ctx);
        Writer writer(ctx);

        auto total = drain(writer, [&](uint8_t* buf, size_t len, size_t& n) -> Error {
            asio::error_code ec = mStream->readSome(buf, len, deadline, n);
            if (!ec) {
                return Error::none();
            }
            return mSocketError(ctx, ec, "upload read failed");
        });

        mSession.bytes = writer.count();
        if (!total) {
            return total.error();
        }
        return Error::none();
    }
}
