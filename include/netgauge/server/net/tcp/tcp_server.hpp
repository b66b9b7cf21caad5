// tcp_server.hpp - TCP Server for NetGauge
// Copyright (C) 2025 DcruBro
// Distributed under the terms of the GNU General Public License, either version 2 only or version 3. See LICENSES/ for details.

#pragma once

#include <atomic>
#include <cstddef>
#include <cstdint>
#include <functional>
#include <list>
#include <memory>
#include <thread>
#include <asio.hpp>
#include <netgauge/common/auth/credential_table.hpp>
#include <netgauge/common/context.hpp>
#include <netgauge/common/error.hpp>
#include <netgauge/common/net/tcp/timed_stream.hpp>
#include <netgauge/server/admission_semaphore.hpp>
#include <netgauge/server/server_config.hpp>

namespace NetGauge::Net::TCP {
    class TCPServer {
        public:
            // Opens and binds the listener; throws std::runtime_error if that fails
            TCPServer(ServerConfig config, std::shared_ptr<const Auth::CredentialTable> credentials);
            virtual ~TCPServer();

            TCPServer(const TCPServer&) = delete;
            TCPServer& operator=(const TCPServer&) = delete;

            // Accept and serve clients until ctx is cancelled. Returns NONE on cancellation, LISTENER on a fatal accept error.
            // Cancellation only stops accepting; in-flight sessions run to their own deadline and have finished when this returns.
            Error run(const Context::pointer& ctx);

            // Actual bound port, useful when the config asked for port 0
            uint16_t localPort() const { return mLocalPort; }

            size_t activeSessions() const { return mActive.load(); }
            // Highest number of sessions that were running at once
            size_t peakActiveSessions() const { return mPeak.load(); }

        protected:
            // Start the thread that serves one session. Throws std::system_error when no thread can be created.
            virtual std::thread mStartThread(std::function<void()> body);

        private:
            struct SessionWorker {
                std::thread thread;
                std::atomic<bool> finished{false};
            };

            struct SessionJob {
                TimedStream::pointer stream;
                AdmissionSemaphore::Permit permit;
            };

            // Bind to the configured host, or dual-stack IPv6 with IPv4 fallback
            void mOpenListener();
            // Hand an accepted connection and its slot to a new session thread.
            // A failed thread start drops the connection and frees the slot; the accept loop carries on.
            void mSpawnSession(TimedStream::pointer stream, AdmissionSemaphore::Permit permit);
            // Join finished session threads, or every thread when all is set
            void mReapSessions(bool all);
            void mCloseListener();

            ServerConfig mConfig;
            std::shared_ptr<const Auth::CredentialTable> mCredentials;
            asio::io_context mIoContext;
            asio::ip::tcp::acceptor mAcceptor;
            uint16_t mLocalPort = 0;
            AdmissionSemaphore mAdmission;
            std::list<std::unique_ptr<SessionWorker>> mSessions;
            std::atomic<size_t> mActive{0};
            std::atomic<size_t> mPeak{0};
    };
}
