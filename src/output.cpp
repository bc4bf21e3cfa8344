#include "output.hpp"
#include "signal_color.hpp"
#include <sstream>

void enrichManufacturers(std::vector<AccessPoint>& networks, const OuiDatabase& oui) {
    for (auto& network : networks) {
        network.manufacturer = oui.lookup(network.bssid);
    }
}

std::string formatListLine(std::size_t index, const AccessPoint& network) {
    std::ostringstream line;
    line << bandColor(signalBand(network.signal, false))
         << index << ". SSID: " << network.ssid
         << ", RSSI: " << network.signal << "%"
         << ", BSSID: " << network.bssid
         << ", Manufacturer: " << network.manufacturer
         << kColorReset;
    return line.str();
}

void printNetworkList(std::ostream& out, const std::vector<AccessPoint>& networks) {
    out << "Available Wi-Fi Networks (sorted by RSSI):\n";
    for (size_t i = 0; i < networks.size(); ++i) {
        out << formatListLine(i + 1, networks[i]) << "\n";
    }
}

void printNetworksJson(std::ostream& out, const std::vector<AccessPoint>& networks) {
    out << "[";
    for (size_t i = 0; i < networks.size(); ++i) {
        out << networks[i].toJson();
        if (i < networks.size() - 1) {
            out << ",";
        }
    }
    out << "]\n";
}
