// writer.cpp - Cancellable counting sink for NetGauge
// Copyright (C) 2025 DcruBro
// Distributed under the terms of the GNU General Public License, either version 2 only or version 3. See LICENSES/ for details.

#include <netgauge/common/writer.hpp>

namespace NetGauge {
    Writer::Writer(Context::pointer ctx)
        : mCtx(std::move(ctx)),
          mLifetime(Context::withCancel(mCtx)),
          mPermits(mLifetime)
    {
        mIssuer = std::thread([this]() { mIssuePermits(); });
    }

    Writer::~Writer() {
        mLifetime->cancel();
        if (mIssuer.joinable()) {
            mIssuer.join();
        }
    }

    void Writer::mIssuePermits() {
        while (mPermits.push(true)) {
        }
    }

    Result<size_t> Writer::write(const uint8_t* data, size_t len) {
        (void)data; // Payload is discarded

        if (mLifetime->done()) {
            return contextDoneError(*mCtx);
        }

        if (!mPermits.pop()) {
            return contextDoneError(*mCtx);
        }

        mCount.fetch_add(len, std::memory_order_relaxed);
        return len;
    }
}
