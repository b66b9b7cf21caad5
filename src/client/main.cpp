// main.cpp - Client entry point for NetGauge
// Copyright (C) 2025 DcruBro
// Distributed under the terms of the GNU General Public License, either version 2 only or version 3. See LICENSES/ for details.

#include <asio.hpp>
#include <csignal>
#include <iostream>
#include <stdexcept>
#include <thread>
#include <cxxopts.hpp>
#include <netgauge/client/net/tcp/tcp_client.hpp>
#include <netgauge/common/auth/credential_table.hpp>
#include <netgauge/common/context.hpp>
#include <netgauge/common/libsodium_wrapper.hpp>
#include <netgauge/common/utils.hpp>

using namespace NetGauge::Utils;
using namespace NetGauge::Net::TCP;
using namespace NetGauge;

int main(int argc, char** argv) {
    cxxopts::Options options("netgauge_client", "NetGauge Throughput Client");

    options.add_options()
        ("h,help", "Print help")
        ("s,server", "Server address", cxxopts::value<std::string>()->default_value("127.0.0.1"))
        ("p,port", "Server port", cxxopts::value<std::string>()->default_value(std::to_string(serverPort())))
        ("t,timeout", "Server transfer duration in milliseconds", cxxopts::value<long>()->default_value("3000"))
        ("dot", "Show dot progress output", cxxopts::value<bool>()->default_value("false"))
        ("config", "Override config file path", cxxopts::value<std::string>()->default_value("./client_config"))
        ("d,debug", "Print debug output", cxxopts::value<bool>()->default_value("false"))
        ("v,version", "Print version and exit");

    try {
        auto optionsObj = options.parse(argc, argv);
        if (optionsObj.count("help")) {
            std::cout << options.help() << std::endl;
            std::cout << "This software is licensed under the GPLv2-only license OR the GPLv3 license.\n";
            std::cout << "Copyright (C) 2025, The NetGauge Contributors.\n";
            std::cout << "This software is provided under ABSOLUTELY NO WARRANTY, to the extent permitted by law.\n";
            return 0;
        }

        if (optionsObj.count("version")) {
            std::cout << "NetGauge Client, Version " << getVersion() << std::endl;
            return 0;
        }

        if (optionsObj["debug"].as<bool>()) {
            setDebug(true);
        }

        ClientConfig clientConfig;
        clientConfig.server = optionsObj["server"].as<std::string>();
        clientConfig.port = parsePort(optionsObj["port"].as<std::string>());
        clientConfig.dot = optionsObj["dot"].as<bool>();

        long timeout = optionsObj["timeout"].as<long>();
        if (timeout <= 0) {
            throw std::invalid_argument("timeout must be positive, got " + std::to_string(timeout));
        }
        clientConfig.timeout = std::chrono::milliseconds(timeout);

        LibSodiumWrapper::init();

        std::unordered_map<std::string, std::string> config = getConfigMap(optionsObj["config"].as<std::string>());

        auto token = Auth::loadClientToken(config);
        if (!token) {
            throw std::runtime_error("Failed to load client credential: " + token.error().toString());
        }
        debug("Using client " + std::to_string(token.value().clientID()) + ", signature " +
              Auth::signatureSchemeName(token.value().scheme()));

        auto clientCtx = Context::withCancel(Context::background());

        asio::io_context signalIo;
        asio::signal_set signals(signalIo, SIGINT, SIGTERM);
        signals.async_wait([&clientCtx](const asio::error_code& ec, int) {
            if (!ec) {
                clientCtx->cancel();
            }
        });

        std::thread signalThread([&signalIo]() {
            signalIo.run();
        });

        TCPClient client(clientConfig, std::move(token.value()));
        Error err = client.start(clientCtx, std::cout);

        signalIo.stop();
        if (signalThread.joinable()) {
            signalThread.join();
        }

        if (err) {
            error("Client failed: " + err.toString());
            return 1;
        }
    } catch (const std::exception& e) {
        error("Client error: " + std::string(e.what()));
        return 1;
    }

    return 0;
}
