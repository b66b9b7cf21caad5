// progress.cpp - Progress ticker for NetGauge
// Copyright (C) 2025 DcruBro
// Distributed under the terms of the GNU General Public License, either version 2 only or version 3. See LICENSES/ for details.

#include <netgauge/client/progress.hpp>

namespace NetGauge {
    Progress::Progress(std::ostream& out, std::chrono::milliseconds interval)
        : mOut(out), mInterval(interval)
    {
        mThread = std::thread([this]() { mTick(); });
    }

    Progress::~Progress() {
        done();
    }

    void Progress::done() {
        {
            std::lock_guard<std::mutex> lock(mMutex);
            mStopped = true;
        }
        mCv.notify_all();
        if (mThread.joinable()) {
            mThread.join();
        }
    }

    void Progress::mTick() {
        std::unique_lock<std::mutex> lock(mMutex);
        auto next = std::chrono::steady_clock::now() + mInterval;

        while (!mStopped) {
            if (mCv.wait_until(lock, next, [this]() { return mStopped; })) {
                return;
            }
            mOut << ". " << std::flush;
            next += mInterval;
        }
    }
}
