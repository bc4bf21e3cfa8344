#include "signal_color.hpp"

const char* const kColorReset = "\x1b[0m";

namespace {
const char* const kGreen = "\x1b[32m";
const char* const kYellow = "\x1b[33m";
const char* const kMagenta = "\x1b[35m";
const char* const kRed = "\x1b[31m";
}

SignalBand signalBand(int signal, bool withFair) {
    if (signal > 70) return SignalBand::Strong;
    if (signal > 50) return SignalBand::Good;
    if (withFair && signal > 30) return SignalBand::Fair;
    return SignalBand::Weak;
}

const char* bandColor(SignalBand band) {
    switch (band) {
        case SignalBand::Strong: return kGreen;
        case SignalBand::Good:   return kYellow;
        case SignalBand::Fair:   return kMagenta;
        default:                 return kRed;
    }
}

std::string colorize(const std::string& text, SignalBand band) {
    return std::string(bandColor(band)) + text + kColorReset;
}
