#include "options.hpp"
#include <stdexcept>

namespace {

std::string requireValue(int argc, const char* const argv[], int& i, const std::string& option) {
    if (i + 1 >= argc) {
        throw std::invalid_argument("option " + option + " requires a value");
    }
    return argv[++i];
}

int parseInterval(const std::string& text) {
    int value = 0;
    try {
        size_t consumed = 0;
        value = std::stoi(text, &consumed);
        if (consumed != text.size()) {
            throw std::invalid_argument(text);
        }
    } catch (const std::logic_error&) {
        throw std::invalid_argument("invalid interval: " + text);
    }
    if (value <= 0) {
        throw std::invalid_argument("interval must be positive: " + text);
    }
    return value;
}

}

Options parseArguments(int argc, const char* const argv[]) {
    Options options;

    for (int i = 1; i < argc; ++i) {
        std::string arg(argv[i]);
        if (arg == "-h" || arg == "--help") {
            options.showHelp = true;
        } else if (arg == "-t" || arg == "--table") {
            options.mode = OutputMode::Table;
        } else if (arg == "-l" || arg == "--list") {
            options.mode = OutputMode::List;
        } else if (arg == "-j" || arg == "--json") {
            options.mode = OutputMode::Json;
        } else if (arg == "-1" || arg == "--once") {
            options.once = true;
        } else if (arg == "-v" || arg == "--verbose") {
            options.verbose = true;
        } else if (arg == "-f" || arg == "--oui-file") {
            options.ouiFile = requireValue(argc, argv, i, arg);
        } else if (arg == "-b" || arg == "--backend") {
            options.backend = requireValue(argc, argv, i, arg);
        } else if (arg == "-i" || arg == "--interval") {
            options.intervalSeconds = parseInterval(requireValue(argc, argv, i, arg));
        } else {
            throw std::invalid_argument("unknown option: " + arg);
        }
    }

    return options;
}

void printHelp(std::ostream& out, const char* programName) {
    out << "Usage: " << programName << " [options]\n";
    out << "Options:\n";
    out << "  -h, --help              Show this help message\n";
    out << "  -t, --table             Refreshing table with signal history (default)\n";
    out << "  -l, --list              Print the network list once\n";
    out << "  -j, --json              Print the networks once as JSON\n";
    out << "  -1, --once              Draw the table once and exit\n";
    out << "  -f, --oui-file PATH     OUI database (default: " << kDefaultOuiFile << ")\n";
    out << "  -b, --backend NAME      auto, nmcli, airport, netsh, nl80211 or dbus (default: auto)\n";
    out << "  -i, --interval SECONDS  Refresh interval (default: " << kDefaultRefreshSeconds << ")\n";
    out << "  -v, --verbose           Debug logging\n";
    out << "\nNote: the nl80211 backend requires root privileges.\n";
}
