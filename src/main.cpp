#include "wifi_scanner.hpp"
#include "monitor.hpp"
#include "options.hpp"
#include "output.hpp"
#include <spdlog/spdlog.h>
#include <spdlog/sinks/stdout_color_sinks.h>
#include <csignal>
#include <iostream>
#include <memory>
#include <stdexcept>

static volatile std::sig_atomic_t stop_requested = 0;

static void handle_sigint(int) {
    stop_requested = 1;
}

static void setupLogging(bool verbose) {
    auto logger = spdlog::stderr_color_mt("wifiwatch");
    spdlog::set_default_logger(logger);
    spdlog::set_pattern("[%H:%M:%S] [%^%l%$] %v");
    spdlog::set_level(verbose ? spdlog::level::debug : spdlog::level::info);
}

int main(int argc, char* argv[]) {
    Options options;
    try {
        options = parseArguments(argc, argv);
    } catch (const std::invalid_argument& e) {
        std::cerr << "Error: " << e.what() << "\n";
        printHelp(std::cerr, argv[0]);
        return 1;
    }

    if (options.showHelp) {
        printHelp(std::cout, argv[0]);
        return 0;
    }

    try {
        setupLogging(options.verbose);

        OuiDatabase oui;
        oui.load(options.ouiFile);

        HostPlatform host = detectHostPlatform();
        std::unique_ptr<WifiScanner> scanner = makeScanner(options.backend, host);
        spdlog::debug("[Monitor] Host {}, backend {}", platformName(host), scanner->name());

        if (options.mode != OutputMode::Table) {
            std::vector<AccessPoint> networks = scanner->scanNetworks();
            enrichManufacturers(networks, oui);
            if (options.mode == OutputMode::Json) {
                printNetworksJson(std::cout, networks);
            } else {
                printNetworkList(std::cout, networks);
            }
            return 0;
        }

        SignalHistory history;
        Monitor monitor(*scanner, oui, history, std::cout);

        if (options.once) {
            monitor.refresh();
            return 0;
        }

        std::signal(SIGINT, handle_sigint);
        monitor.run(options.intervalSeconds, stop_requested);
        return 0;

    } catch (const std::exception& e) {
        spdlog::error("Error: {}", e.what());
        return 1;
    }
}
