#pragma once
#include <string>

enum class SignalBand {
    Strong,
    Good,
    Fair,
    Weak,
};

// Thresholds are strict: >70 strong, >50 good, >30 fair, otherwise weak.
// With withFair == false the fair band is reported as weak.
SignalBand signalBand(int signal, bool withFair = true);

// ANSI foreground color for a band.
const char* bandColor(SignalBand band);

std::string colorize(const std::string& text, SignalBand band);

extern const char* const kColorReset;
