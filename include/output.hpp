#pragma once
#include "access_point.hpp"
#include "oui_database.hpp"
#include <cstddef>
#include <ostream>
#include <string>
#include <vector>

void enrichManufacturers(std::vector<AccessPoint>& networks, const OuiDatabase& oui);

// "3. SSID: x, RSSI: 80%, BSSID: b, Manufacturer: m", colored with the
// three-band scheme.
std::string formatListLine(std::size_t index, const AccessPoint& network);

void printNetworkList(std::ostream& out, const std::vector<AccessPoint>& networks);
void printNetworksJson(std::ostream& out, const std::vector<AccessPoint>& networks);
