// reader.cpp - Cancellable pseudorandom payload source for NetGauge
// Copyright (C) 2025 DcruBro
// Distributed under the terms of the GNU General Public License, either version 2 only or version 3. See LICENSES/ for details.

#include <netgauge/common/reader.hpp>

#include <algorithm>
#include <cstring>
#include <netgauge/common/libsodium_wrapper.hpp>

namespace NetGauge {
    Error contextDoneError(const Context& ctx) {
        if (ctx.err() == ContextError::DEADLINE_EXCEEDED) {
            return Error(ErrorKind::END_OF_STREAM, "deadline reached");
        }
        return Error(ErrorKind::CANCELLED, "context cancelled");
    }

    Reader::Reader(Context::pointer ctx, size_t chunkSize)
        : mCtx(std::move(ctx)),
          mLifetime(Context::withCancel(mCtx)),
          mChunkSize(chunkSize == 0 ? kDefaultBufSize : chunkSize),
          mChannel(mLifetime)
    {
        Utils::LibSodiumWrapper::init();
        mProducer = std::thread([this]() { mProduce(); });
    }

    Reader::~Reader() {
        mLifetime->cancel();
        if (mProducer.joinable()) {
            mProducer.join();
        }
    }

    void Reader::mProduce() {
        Utils::RandomStream rng; // Owned by this thread only

        for (;;) {
            std::vector<uint8_t> chunk(mChunkSize);
            rng.fill(chunk.data(), chunk.size());
            if (!mChannel.push(std::move(chunk))) {
                return;
            }
        }
    }

    Result<size_t> Reader::read(uint8_t* buf, size_t len) {
        if (mLifetime->done()) {
            return contextDoneError(*mCtx);
        }

        if (len == 0) {
            return size_t{0};
        }

        if (mPendingOffset >= mPending.size()) {
            auto chunk = mChannel.pop();
            if (!chunk) {
                return contextDoneError(*mCtx);
            }
            mPending = std::move(*chunk);
            mPendingOffset = 0;
        }

        size_t n = std::min(len, mPending.size() - mPendingOffset);
        std::memcpy(buf, mPending.data() + mPendingOffset, n);
        mPendingOffset += n;

        mCount.fetch_add(n, std::memory_order_relaxed);
        return n;
    }
}
