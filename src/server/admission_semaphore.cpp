// admission_semaphore.cpp - Connection admission for NetGauge
// Copyright (C) 2025 DcruBro
// Distributed under the terms of the GNU General Public License, either version 2 only or version 3. See LICENSES/ for details.

#include <netgauge/server/admission_semaphore.hpp>

#include <stdexcept>

namespace NetGauge {
    AdmissionSemaphore::Permit& AdmissionSemaphore::Permit::operator=(Permit&& other) noexcept {
        if (this != &other) {
            release();
            mOwner = other.mOwner;
            other.mOwner = nullptr;
        }
        return *this;
    }

    void AdmissionSemaphore::Permit::release() {
        if (mOwner) {
            mOwner->mRelease();
            mOwner = nullptr;
        }
    }

    AdmissionSemaphore::AdmissionSemaphore(size_t slots) : mCapacity(slots), mAvailable(slots) {
        if (slots == 0) {
            throw std::invalid_argument("admission semaphore needs at least one slot");
        }
    }

    std::optional<AdmissionSemaphore::Permit> AdmissionSemaphore::acquire(const Context::pointer& ctx) {
        if (ctx->done()) {
            return std::nullopt;
        }

        // Wake the waiter below if ctx is cancelled while it sleeps. Subscribed before locking,
        // and released after the lock, since the callback takes the same mutex.
        auto sub = ctx->onCancel([this]() {
            std::lock_guard<std::mutex> cbLock(mMutex);
            mCv.notify_all();
        });

        std::unique_lock<std::mutex> lock(mMutex);

        if (!ctx->waitUntil(lock, mCv, [this]() { return mAvailable > 0; })) {
            return std::nullopt;
        }

        --mAvailable;
        return Permit(this);
    }

    std::optional<AdmissionSemaphore::Permit> AdmissionSemaphore::tryAcquire() {
        std::lock_guard<std::mutex> lock(mMutex);
        if (mAvailable == 0) {
            return std::nullopt;
        }
        --mAvailable;
        return Permit(this);
    }

    size_t AdmissionSemaphore::available() const {
        std::lock_guard<std::mutex> lock(mMutex);
        return mAvailable;
    }

    void AdmissionSemaphore::mRelease() {
        {
            std::lock_guard<std::mutex> lock(mMutex);
            if (mAvailable < mCapacity) {
                ++mAvailable;
            }
        }
        mCv.notify_one();
    }
}
