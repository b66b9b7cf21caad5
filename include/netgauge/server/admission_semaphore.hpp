// admission_semaphore.hpp - Connection admission for NetGauge
// Copyright (C) 2025 DcruBro
// Distributed under the terms of the GNU General Public License, either version 2 only or version 3. See LICENSES/ for details.

#pragma once

#include <condition_variable>
#include <cstddef>
#include <mutex>
#include <optional>
#include <netgauge/common/context.hpp>

namespace NetGauge {
    // Fixed pool of connection slots. A slot is held by a Permit and returned when it is destroyed.
    class AdmissionSemaphore {
        public:
            class Permit {
                public:
                    Permit() = default;
                    explicit Permit(AdmissionSemaphore* owner) : mOwner(owner) {}
                    ~Permit() { release(); }

                    Permit(Permit&& other) noexcept : mOwner(other.mOwner) { other.mOwner = nullptr; }
                    Permit& operator=(Permit&& other) noexcept;
                    Permit(const Permit&) = delete;
                    Permit& operator=(const Permit&) = delete;

                    // Return the slot early; later calls do nothing
                    void release();
                    bool held() const { return mOwner != nullptr; }

                private:
                    AdmissionSemaphore* mOwner = nullptr;
            };

            explicit AdmissionSemaphore(size_t slots);

            AdmissionSemaphore(const AdmissionSemaphore&) = delete;
            AdmissionSemaphore& operator=(const AdmissionSemaphore&) = delete;

            // Block until a slot is free. nullopt if ctx finished first.
            std::optional<Permit> acquire(const Context::pointer& ctx);
            // Non-blocking variant
            std::optional<Permit> tryAcquire();

            size_t available() const;
            size_t capacity() const { return mCapacity; }

        private:
            void mRelease();

            const size_t mCapacity;
            mutable std::mutex mMutex;
            std::condition_variable mCv;
            size_t mAvailable;
    };
}
