#pragma once
#include "config.hpp"
#include <ostream>
#include <string>

enum class OutputMode {
    Table,
    List,
    Json,
};

struct Options {
    OutputMode mode = OutputMode::Table;
    bool once = false;
    bool verbose = false;
    bool showHelp = false;
    std::string ouiFile = kDefaultOuiFile;
    std::string backend = "auto";
    int intervalSeconds = kDefaultRefreshSeconds;
};

// Throws std::invalid_argument on unknown options or bad values.
Options parseArguments(int argc, const char* const argv[]);

void printHelp(std::ostream& out, const char* programName);
