// writer.hpp - Cancellable counting sink for NetGauge
// Copyright (C) 2025 DcruBro
// Distributed under the terms of the GNU General Public License, either version 2 only or version 3. See LICENSES/ for details.

#pragma once

#include <atomic>
#include <cstddef>
#include <cstdint>
#include <thread>
#include <vector>
#include <netgauge/common/channel.hpp>
#include <netgauge/common/context.hpp>
#include <netgauge/common/error.hpp>
#include <netgauge/common/reader.hpp>

namespace NetGauge {
    // Discards everything written to it and counts it.
    // Every write waits for a permit from a background thread, so it is preempted by the context exactly like a real destination.
    class Writer {
        public:
            explicit Writer(Context::pointer ctx);
            ~Writer();

            Writer(const Writer&) = delete;
            Writer& operator=(const Writer&) = delete;

            // Returns len. END_OF_STREAM once the deadline passed, CANCELLED on cancellation.
            Result<size_t> write(const uint8_t* data, size_t len);

            // Total bytes accepted by write()
            uint64_t count() const { return mCount.load(std::memory_order_relaxed); }

        private:
            void mIssuePermits();

            Context::pointer mCtx;
            Context::pointer mLifetime;
            Channel<bool> mPermits;
            std::atomic<uint64_t> mCount{0};
            std::thread mIssuer;
    };

    // Pulls from source into writer until the writer's context ends or the source does.
    // source(buf, len, n) fills n bytes and returns an Error; END_OF_STREAM from the source or the writer ends the drain normally.
    // Returns the total written count, or the first other error.
    template <typename Source>
    Result<uint64_t> drain(Writer& writer, Source&& source, size_t bufSize = kDefaultBufSize) {
        std::vector<uint8_t> buf(bufSize == 0 ? kDefaultBufSize : bufSize);

        for (;;) {
            size_t n = 0;
            Error readErr = source(buf.data(), buf.size(), n);

            if (n > 0) {
                auto written = writer.write(buf.data(), n);
                if (!written) {
                    if (written.error().is(ErrorKind::END_OF_STREAM)) {
                        return writer.count();
                    }
                    return written.error();
                }
            }

            if (readErr) {
                if (readErr.is(ErrorKind::END_OF_STREAM)) {
                    return writer.count();
                }
                return readErr;
            }
        }
    }
}
