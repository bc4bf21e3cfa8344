#include "access_point.hpp"
#include <algorithm>
#include <cctype>
#include <iomanip>
#include <sstream>
#include <stdexcept>

namespace {

std::string escapeJson(const std::string& text) {
    std::ostringstream out;
    for (char c : text) {
        switch (c) {
            case '"':  out << "\\\""; break;
            case '\\': out << "\\\\"; break;
            case '\n': out << "\\n"; break;
            case '\r': out << "\\r"; break;
            case '\t': out << "\\t"; break;
            default:
                if (static_cast<unsigned char>(c) < 0x20) {
                    out << "\\u" << std::hex << std::setw(4) << std::setfill('0')
                        << static_cast<int>(c) << std::dec;
                } else {
                    out << c;
                }
        }
    }
    return out.str();
}

}

std::string AccessPoint::toJson() const {
    std::ostringstream json;
    json << "{";
    json << "\"ssid\":\"" << escapeJson(ssid) << "\",";
    json << "\"bssid\":\"" << escapeJson(bssid) << "\",";
    json << "\"signal\":" << signal << ",";
    json << "\"channel\":\"" << escapeJson(channel) << "\",";
    json << "\"manufacturer\":\"" << escapeJson(manufacturer) << "\"";
    json << "}";
    return json.str();
}

int signalPercentFromDbm(int dbm) {
    if (dbm <= -100) return 0;
    if (dbm >= -50) return 100;
    return 2 * (dbm + 100);
}

int parseSignal(const std::string& text) {
    try {
        size_t consumed = 0;
        int value = std::stoi(text, &consumed);
        while (consumed < text.size() && std::isspace(static_cast<unsigned char>(text[consumed]))) {
            ++consumed;
        }
        return consumed == text.size() ? value : 0;
    } catch (const std::invalid_argument&) {
        return 0;
    } catch (const std::out_of_range&) {
        return 0;
    }
}

std::string channelFromFrequency(unsigned int frequencyMhz) {
    int channel = 0;
    if (frequencyMhz == 2484) {
        channel = 14;
    } else if (frequencyMhz >= 2412 && frequencyMhz < 2484) {
        channel = (frequencyMhz - 2407) / 5;
    } else if (frequencyMhz >= 5955 && frequencyMhz <= 7115) {
        channel = (frequencyMhz - 5950) / 5;
    } else if (frequencyMhz >= 5000 && frequencyMhz < 5955) {
        channel = (frequencyMhz - 5000) / 5;
    }
    return channel > 0 ? std::to_string(channel) : "N/A";
}

bool looksLikeBssid(const std::string& text) {
    if (text.size() != 17) return false;
    for (size_t i = 0; i < text.size(); ++i) {
        if (i % 3 == 2) {
            if (text[i] != ':') return false;
        } else if (!std::isxdigit(static_cast<unsigned char>(text[i]))) {
            return false;
        }
    }
    return true;
}

void sortBySignal(std::vector<AccessPoint>& networks) {
    std::stable_sort(networks.begin(), networks.end(),
        [](const AccessPoint& a, const AccessPoint& b) {
            return a.signal > b.signal;
        });
}
