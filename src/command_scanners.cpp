#include "command_scanners.hpp"
#include <spdlog/spdlog.h>
#include <cctype>
#include <sstream>
#include <stdexcept>
#include <utility>

namespace {

const char* kNmcliCommand = "nmcli -f SSID,BSSID,SIGNAL,CHAN dev wifi";
const char* kAirportCommand =
    "/System/Library/PrivateFrameworks/Apple80211.framework/Versions/Current/Resources/airport -s";
const char* kNetshCommand = "netsh wlan show network";

std::string trim(const std::string& text) {
    const char* whitespace = " \t\r\n";
    size_t start = text.find_first_not_of(whitespace);
    if (start == std::string::npos) return "";
    size_t end = text.find_last_not_of(whitespace);
    return text.substr(start, end - start + 1);
}

bool startsWith(const std::string& text, const std::string& prefix) {
    return text.compare(0, prefix.size(), prefix) == 0;
}

// netsh numbers repeated keys: "SSID 1", "BSSID 2".
bool isIndexedKey(const std::string& key, const std::string& name) {
    if (key == name) return true;
    if (!startsWith(key, name + " ") || key.size() == name.size() + 1) return false;
    for (size_t i = name.size() + 1; i < key.size(); ++i) {
        if (!std::isdigit(static_cast<unsigned char>(key[i]))) return false;
    }
    return true;
}

std::vector<std::string> splitWhitespace(const std::string& line) {
    std::vector<std::string> tokens;
    std::istringstream stream(line);
    std::string token;
    while (stream >> token) {
        tokens.push_back(token);
    }
    return tokens;
}

// Splits one "SSID BSSID SIGNAL [CHANNEL ...]" row. The BSSID column is found
// by its shape so an SSID may contain spaces. Without a BSSID-shaped token the
// row is split positionally unless requireBssid is set.
bool parseColumnRow(const std::string& line, bool requireBssid, AccessPoint& network,
                    std::string& signalText) {
    std::vector<std::string> tokens = splitWhitespace(line);
    if (tokens.size() < 3) {
        return false;
    }

    size_t bssidIndex = tokens.size();
    for (size_t i = 0; i + 1 < tokens.size(); ++i) {
        if (looksLikeBssid(tokens[i])) {
            bssidIndex = i;
            break;
        }
    }

    if (bssidIndex == tokens.size()) {
        if (requireBssid) return false;
        bssidIndex = 1;
    }

    std::string ssid;
    for (size_t i = 0; i < bssidIndex; ++i) {
        if (i > 0) ssid += " ";
        ssid += tokens[i];
    }

    network.ssid = ssid;
    network.bssid = tokens[bssidIndex];
    signalText = tokens[bssidIndex + 1];
    network.channel = bssidIndex + 2 < tokens.size() ? tokens[bssidIndex + 2] : "N/A";
    return true;
}

}

CommandScanner::CommandScanner(std::string commandLine, CommandRunner runner)
    : commandLine_(std::move(commandLine)), runner_(std::move(runner)) {}

std::vector<AccessPoint> CommandScanner::scanNetworks() {
    CommandResult result;
    try {
        result = runner_(commandLine_);
    } catch (const std::exception& e) {
        spdlog::error("[Scanner] {}: {}", name(), e.what());
        return {};
    }

    if (!result.ok()) {
        std::string detail = trim(result.errorOutput);
        if (detail.empty()) {
            spdlog::error("[Scanner] Failed to run command '{}' (exit code {})", commandLine_, result.exitCode);
        } else {
            spdlog::error("[Scanner] Failed to run command '{}' (exit code {}): {}", commandLine_,
                          result.exitCode, detail);
        }
        return {};
    }

    std::vector<AccessPoint> networks = parse(result.output);
    sortBySignal(networks);
    spdlog::debug("[Scanner] {} reported {} access points", name(), networks.size());
    return networks;
}

NmcliScanner::NmcliScanner(CommandRunner runner)
    : CommandScanner(kNmcliCommand, std::move(runner)) {}

std::vector<AccessPoint> NmcliScanner::parseOutput(const std::string& output) {
    std::vector<AccessPoint> networks;
    std::istringstream stream(output);
    std::string line;

    // header row
    std::getline(stream, line);

    while (std::getline(stream, line)) {
        if (trim(line).empty()) continue;

        AccessPoint network;
        std::string signalText;
        if (!parseColumnRow(line, false, network, signalText)) continue;

        network.signal = parseSignal(signalText);
        networks.push_back(network);
    }
    return networks;
}

AirportScanner::AirportScanner(CommandRunner runner)
    : CommandScanner(kAirportCommand, std::move(runner)) {}

std::vector<AccessPoint> AirportScanner::parseOutput(const std::string& output) {
    std::vector<AccessPoint> networks;
    std::istringstream stream(output);
    std::string line;

    std::getline(stream, line);

    while (std::getline(stream, line)) {
        if (trim(line).empty()) continue;

        AccessPoint network;
        std::string signalText;
        if (!parseColumnRow(line, true, network, signalText)) continue;

        int signal = parseSignal(signalText);
        // airport reports RSSI in dBm
        network.signal = signal < 0 ? signalPercentFromDbm(signal) : signal;
        networks.push_back(network);
    }
    return networks;
}

NetshScanner::NetshScanner(CommandRunner runner)
    : CommandScanner(kNetshCommand, std::move(runner)) {}

std::vector<AccessPoint> NetshScanner::parseOutput(const std::string& output) {
    std::vector<AccessPoint> networks;
    std::istringstream stream(output);
    std::string line;
    AccessPoint current;

    while (std::getline(stream, line)) {
        size_t colon = line.find(':');
        if (colon == std::string::npos) continue;

        std::string key = trim(line.substr(0, colon));
        std::string value = trim(line.substr(colon + 1));

        if (isIndexedKey(key, "SSID")) {
            current = AccessPoint();
            current.ssid = value;
        } else if (isIndexedKey(key, "BSSID")) {
            current.bssid = value;
        } else if (key == "Signal") {
            if (!value.empty() && value.back() == '%') {
                value.pop_back();
            }
            current.signal = parseSignal(value);
        } else if (key == "Channel") {
            current.channel = value.empty() ? "N/A" : value;
            networks.push_back(current);

            // further BSSIDs of the same SSID follow without a new SSID line
            AccessPoint next;
            next.ssid = current.ssid;
            current = next;
        }
    }
    return networks;
}
