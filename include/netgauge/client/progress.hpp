// progress.hpp - Progress ticker for NetGauge
// Copyright (C) 2025 DcruBro
// Distributed under the terms of the GNU General Public License, either version 2 only or version 3. See LICENSES/ for details.

#pragma once

#include <chrono>
#include <condition_variable>
#include <mutex>
#include <ostream>
#include <thread>

namespace NetGauge {
    // Prints ". " to the stream every interval until destroyed
    class Progress {
        public:
            Progress(std::ostream& out, std::chrono::milliseconds interval = std::chrono::seconds(1));
            ~Progress();

            Progress(const Progress&) = delete;
            Progress& operator=(const Progress&) = delete;

            // Stop ticking and wait for the ticker thread; idempotent
            void done();

        private:
            void mTick();

            std::ostream& mOut;
            std::chrono::milliseconds mInterval;
            std::mutex mMutex;
            std::condition_variable mCv;
            bool mStopped = false;
            std::thread mThread;
    };
}
