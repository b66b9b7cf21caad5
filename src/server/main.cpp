// main.cpp - Server entry point for NetGauge
// Copyright (C) 2025 DcruBro
// Distributed under the terms of the GNU General Public License, either version 2 only or version 3. See LICENSES/ for details.

#include <asio.hpp>
#include <csignal>
#include <iostream>
#include <memory>
#include <stdexcept>
#include <thread>
#include <cxxopts.hpp>
#include <netgauge/common/auth/credential_table.hpp>
#include <netgauge/common/context.hpp>
#include <netgauge/common/libsodium_wrapper.hpp>
#include <netgauge/common/utils.hpp>
#include <netgauge/server/net/tcp/tcp_server.hpp>
#include <netgauge/server/server_config.hpp>

using namespace NetGauge::Utils;
using namespace NetGauge::Net::TCP;
using namespace NetGauge;

int main(int argc, char** argv) {
    cxxopts::Options options("netgauge_server", "NetGauge Throughput Server");

    options.add_options()
        ("h,help", "Print help")
        ("H,host", "Listen address (all interfaces when empty)", cxxopts::value<std::string>()->default_value(""))
        ("p,port", "Listen port", cxxopts::value<std::string>()->default_value(std::to_string(serverPort())))
        ("t,timeout", "Transfer duration in milliseconds", cxxopts::value<long>()->default_value("3000"))
        ("c,clients", "Maximum concurrent clients", cxxopts::value<int>()->default_value("1"))
        ("4,ipv4-only", "Force IPv4 only operation", cxxopts::value<bool>()->default_value("false"))
        ("config", "Override config file path", cxxopts::value<std::string>()->default_value("./server_config"))
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
            std::cout << "NetGauge Server, Version " << getVersion() << std::endl;
            return 0;
        }

        if (optionsObj["debug"].as<bool>()) {
            setDebug(true);
        }

        ServerConfig serverConfig;
        serverConfig.host = optionsObj["host"].as<std::string>();
        serverConfig.port = parsePort(optionsObj["port"].as<std::string>());
        serverConfig.ipv4Only = optionsObj["ipv4-only"].as<bool>();

        long timeout = optionsObj["timeout"].as<long>();
        if (timeout <= 0) {
            throw std::invalid_argument("timeout must be positive, got " + std::to_string(timeout));
        }
        serverConfig.timeout = std::chrono::milliseconds(timeout);

        int clients = optionsObj["clients"].as<int>();
        if (clients < 1) {
            throw std::invalid_argument("clients must be at least 1, got " + std::to_string(clients));
        }
        serverConfig.maxClients = static_cast<size_t>(clients);

        log("NetGauge Server, Version " + getVersion());
        log("This software is licensed under the GPLv2 only OR the GPLv3. See LICENSES/ for details.");

        LibSodiumWrapper::init();

        std::unordered_map<std::string, std::string> config = getConfigMap(optionsObj["config"].as<std::string>());

        auto credentials = Auth::CredentialTable::load(config);
        if (!credentials) {
            throw std::runtime_error("Failed to load client credentials: " + credentials.error().toString());
        }
        log("Loaded " + std::to_string(credentials.value().size()) + " client credential(s), signature " +
            Auth::signatureSchemeName(credentials.value().scheme()));

        auto serverCtx = Context::withCancel(Context::background());
        TCPServer server(serverConfig, std::make_shared<const Auth::CredentialTable>(std::move(credentials.value())));

        // Signals are delivered on their own io_context; the handler only cancels the server context
        asio::io_context signalIo;
        asio::signal_set signals(signalIo, SIGINT, SIGTERM);
        signals.async_wait([&serverCtx](const asio::error_code& ec, int) {
            if (ec) {
                return;
            }
            log("Received termination signal. Shutting down server gracefully.");
            serverCtx->cancel();
        });

        std::thread signalThread([&signalIo]() {
            signalIo.run();
        });

        Error err = server.run(serverCtx);

        signalIo.stop();
        if (signalThread.joinable()) {
            signalThread.join();
        }

        if (err) {
            error("Server failed: " + err.toString());
            return 1;
        }

        log("Server stopped.");
    } catch (const std::exception& e) {
        error("Server error: " + std::string(e.what()));
        return 1;
    }

    return 0;
}
