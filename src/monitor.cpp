#include "monitor.hpp"
#include "output.hpp"
#include "signal_color.hpp"
#include <spdlog/spdlog.h>
#include <chrono>
#include <string>
#include <thread>

namespace {

const char* kClearScreen = "\x1b[2J\x1b[H";
constexpr std::chrono::milliseconds kSleepSlice(100);

}

Monitor::Monitor(WifiScanner& scanner, const OuiDatabase& oui, SignalHistory& history, std::ostream& out)
    : scanner_(scanner), oui_(oui), history_(history), out_(out) {}

TableRenderer Monitor::buildTable(const std::vector<AccessPoint>& networks) const {
    TableRenderer table({"#", "SSID", "BSSID", "Signal", "Channel", "Manufacturer", "History"});

    for (size_t i = 0; i < networks.size(); ++i) {
        const AccessPoint& network = networks[i];
        table.addRow({
            std::to_string(i + 1),
            network.ssid,
            network.bssid,
            colorize(std::to_string(network.signal) + "%", signalBand(network.signal)),
            network.channel,
            network.manufacturer,
            history_.render(network.bssid),
        });
    }
    return table;
}

std::size_t Monitor::refresh() {
    if (clearScreen_) {
        out_ << kClearScreen;
    }

    std::vector<AccessPoint> networks = scanner_.scanNetworks();
    for (const auto& network : networks) {
        history_.record(network.bssid, network.signal);
    }
    enrichManufacturers(networks, oui_);

    out_ << "Wi-Fi networks via " << scanner_.name() << " (sorted by signal strength)\n";
    buildTable(networks).render(out_);

    if (networks.empty()) {
        out_ << "No networks found.\n";
    } else {
        out_ << "\nTotal networks found: " << networks.size() << "\n";
    }
    out_.flush();
    return networks.size();
}

void Monitor::run(int intervalSeconds, const volatile std::sig_atomic_t& stopRequested) {
    spdlog::debug("[Monitor] Refreshing every {}s", intervalSeconds);

    const auto interval = std::chrono::seconds(intervalSeconds);
    while (!stopRequested) {
        refresh();

        auto waited = std::chrono::milliseconds::zero();
        while (!stopRequested && waited < interval) {
            std::this_thread::sleep_for(kSleepSlice);
            waited += kSleepSlice;
        }
    }

    out_ << "\nExiting...\n";
    out_.flush();
}
