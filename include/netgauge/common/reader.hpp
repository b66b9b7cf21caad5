// reader.hpp - Cancellable pseudorandom payload source for NetGauge
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

namespace NetGauge {
    // Transfer buffer and generated chunk size
    inline constexpr size_t kDefaultBufSize = 32 * 1024;

    // Maps a finished context to the error a transfer primitive reports:
    // deadline -> END_OF_STREAM, anything else -> CANCELLED
    Error contextDoneError(const Context& ctx);

    // Produces fresh pseudorandom bytes until its context ends.
    // A background thread generates chunks and hands them over a bounded channel,
    // so read() returns as soon as either data is ready or the context is done.
    class Reader {
        public:
            explicit Reader(Context::pointer ctx, size_t chunkSize = kDefaultBufSize);
            ~Reader();

            Reader(const Reader&) = delete;
            Reader& operator=(const Reader&) = delete;

            // Fills up to len bytes. END_OF_STREAM once the deadline passed, CANCELLED on cancellation.
            Result<size_t> read(uint8_t* buf, size_t len);

            // Total bytes handed out by read()
            uint64_t count() const { return mCount.load(std::memory_order_relaxed); }

        private:
            void mProduce();

            Context::pointer mCtx;
            Context::pointer mLifetime; // Child of mCtx, cancelled by the destructor to stop the producer
            size_t mChunkSize;
            Channel<std::vector<uint8_t>> mChannel;
            std::vector<uint8_t> mPending;
            size_t mPendingOffset = 0;
            std::atomic<uint64_t> mCount{0};
            std::thread mProducer;
    };
}
