#pragma once

#include <cstddef>

// Compile-time defaults. Options parsed from argv start from these values.
constexpr const char* kDefaultOuiFile = "manuf";
constexpr const char* kUnknownManufacturer = "Unknown Manufacturer";
constexpr std::size_t kHistoryCapacity = 10;
constexpr int kDefaultRefreshSeconds = 5;
