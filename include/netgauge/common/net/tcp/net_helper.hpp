// net_helper.hpp - Network Helper Functions for NetGauge
// Copyright (C) 2025 DcruBro
// Distributed under the terms of the GNU General Public License, either version 2 only or version 3. See LICENSES/ for details.

#pragma once
#include <string>
#include <asio.hpp>
#include <netgauge/common/auth/token.hpp>
#include <netgauge/common/error.hpp>

namespace NetGauge::Net::TCP {
    class NetHelper {
        public:
            // Peer went away or the operation was cut short; not worth an error log
            inline static bool isExpectedDisconnect(const asio::error_code& ec) {
                using asio::error::operation_aborted;
                using asio::error::bad_descriptor;
                using asio::error::eof;
                using asio::error::connection_reset;
                using asio::error::connection_aborted;
                using asio::error::broken_pipe;
                using asio::error::timed_out;

                return ec == operation_aborted || ec == bad_descriptor || ec == eof ||
                       ec == connection_reset || ec == connection_aborted || ec == broken_pipe ||
                       ec == timed_out;
            }

            // Per-connection accept failures; the listener itself is still usable
            inline static bool isTransient(const asio::error_code& ec) {
                return ec == asio::error::connection_aborted || ec == asio::error::connection_reset ||
                       ec == asio::error::interrupted || ec == asio::error::try_again ||
                       ec == asio::error::would_block;
            }

            // Expected disconnects end a transfer (END_OF_STREAM), anything else is IO
            inline static Error toError(const asio::error_code& ec, const std::string& what) {
                if (!ec) {
                    return Error::none();
                }
                if (isExpectedDisconnect(ec)) {
                    return Error(ErrorKind::END_OF_STREAM, what, ec);
                }
                return Error(ErrorKind::IO, what, ec);
            }

            // 16-byte form carried in the token; IPv4 becomes v4-mapped IPv6
            inline static Auth::PeerIP toPeerIP(const asio::ip::address& address) {
                asio::ip::address_v6 v6 = address.is_v4()
                    ? asio::ip::make_address_v6(asio::ip::v4_mapped, address.to_v4())
                    : address.to_v6();
                return v6.to_bytes();
            }

            // Plain IP for display, unwrapping v4-mapped addresses
            inline static std::string displayAddress(const asio::ip::address& address) {
                if (address.is_v6() && address.to_v6().is_v4_mapped()) {
                    return asio::ip::make_address_v4(asio::ip::v4_mapped, address.to_v6()).to_string();
                }
                return address.to_string();
            }
    };
}
