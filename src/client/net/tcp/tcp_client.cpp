// tcp_client.cpp - TCP Client for NetGauge
// Copyright (C) 2025 DcruBro
// Distributed under the terms of the GNU General Public License, either version 2 only or version 3. See LICENSES/ for details.

#include <netgauge/client/net/tcp/tcp_client.hpp>

#include <memory>
#include <vector>
#include <netgauge/client/progress.hpp>
#include <netgauge/common/net/tcp/net_helper.hpp>
#include <netgauge/common/reader.hpp>
#include <netgauge/common/writer.hpp>

namespace NetGauge::Net::TCP {
    Result<TransferReport> TCPClient::run(const Context::pointer& ctx, Auth::Direction direction) {
        auto runCtx = Context::withTimeout(ctx, mConfig.timeout * 2);
        auto deadline = TimedStream::deadlineOf(*runCtx);

        TimedStream stream;
        auto cancelSub = stream.cancelOn(runCtx);

        asio::error_code ec = stream.connect(mConfig.server, mConfig.port, deadline);
        if (ec) {
            if (runCtx->err() == ContextError::CANCELLED) {
                return contextDoneError(*runCtx);
            }
            return Error(ErrorKind::IO, "connection failed: dial " + mConfig.server + ":" + std::to_string(mConfig.port), ec);
        }

        auto remote = stream.remoteEndpoint(ec);
        if (ec) {
            return Error(ErrorKind::IO, "connection failed: no remote address", ec);
        }

        TransferReport report;
        report.ip = NetHelper::displayAddress(remote.address());

        Auth::Token token = mToken;
        token.setDirection(direction);
        token.setPeerIP(NetHelper::toPeerIP(remote.address()));

        Error err = token.handshake(stream, deadline);
        if (err) {
            return err;
        }

        Utils::debug("Connected to " + report.ip + " as client " + std::to_string(token.clientID()) +
                     ", direction " + Auth::directionName(direction));

        auto start = std::chrono::steady_clock::now();
        err = direction == Auth::Direction::DOWNLOAD
            ? mDownload(runCtx, stream, report.bytes)
            : mUpload(runCtx, stream, report.bytes);
        report.elapsed = std::chrono::steady_clock::now() - start;
        stream.close();

        if (err && !err.is(ErrorKind::END_OF_STREAM)) {
            return err;
        }

        Utils::debug(std::string(Auth::directionName(direction)) + " " + Utils::byteSize(report.bytes) + " from " + report.ip);
        return report;
    }

    Error TCPClient::mDownload(const Context::pointer& ctx, TimedStream& stream, uint64_t& bytes) {
        auto deadline = TimedStream::deadlineOf(*ctx);
        Writer writer(ctx);

        auto total = drain(writer, [&](uint8_t* buf, size_t len, size_t& n) -> Error {
            asio::error_code ec = stream.readSome(buf, len, deadline, n);
            if (!ec) {
                return Error::none();
            }
            if (ctx->done()) {
                return contextDoneError(*ctx);
            }
            return NetHelper::toError(ec, "download read failed");
        });

        bytes = writer.count();
        if (!total) {
            return total.error();
        }
        return Error::none();
    }

    Error TCPClient::mUpload(const Context::pointer& ctx, TimedStream& stream, uint64_t& bytes) {
        auto deadline = TimedStream::deadlineOf(*ctx);
        Reader reader(ctx);
        std::vector<uint8_t> buf(kDefaultBufSize);

        for (;;) {
            auto n = reader.read(buf.data(), buf.size());
            if (!n) {
                return n.error();
            }

            size_t written = 0;
            asio::error_code ec = stream.writeAll(buf.data(), n.value(), deadline, &written);
            bytes += written;
            if (ec) {
                if (ctx->done()) {
                    return contextDoneError(*ctx);
                }
                // Server closing its end at its own deadline shows up as a broken pipe or reset
                return NetHelper::toError(ec, "upload write failed");
            }
        }
    }

    Error TCPClient::start(const Context::pointer& ctx, std::ostream& out) {
        const std::string newLine = mConfig.dot ? "\n" : "";

        std::unique_ptr<Progress> progress;
        if (mConfig.dot) {
            progress = std::make_unique<Progress>(out);
        }
        auto download = run(ctx, Auth::Direction::DOWNLOAD);
        progress.reset();
        if (!download) {
            return download.error();
        }

        const TransferReport& down = download.value();
        out << newLine << "IP address:     " << down.ip << "\n";
        out << newLine << "Download speed: " << Utils::speed(down.elapsed, down.bytes) << std::endl;

        if (mConfig.dot) {
            progress = std::make_unique<Progress>(out);
        }
        auto upload = run(ctx, Auth::Direction::UPLOAD);
        progress.reset();
        if (!upload) {
            return upload.error();
        }

        out << newLine << "Upload speed:   " << Utils::speed(upload.value().elapsed, upload.value().bytes) << std::endl;
        return Error::none();
    }
}
