#include "signal_color.hpp"
#include <gtest/gtest.h>

TEST(SignalColorTest, BandThresholdsAreStrict) {
    EXPECT_EQ(signalBand(71), SignalBand::Strong);
    EXPECT_EQ(signalBand(70), SignalBand::Good);
    EXPECT_EQ(signalBand(51), SignalBand::Good);
    EXPECT_EQ(signalBand(50), SignalBand::Fair);
    EXPECT_EQ(signalBand(31), SignalBand::Fair);
    EXPECT_EQ(signalBand(30), SignalBand::Weak);
    EXPECT_EQ(signalBand(0), SignalBand::Weak);
}

TEST(SignalColorTest, ListVariantCollapsesFairIntoWeak) {
    EXPECT_EQ(signalBand(71, false), SignalBand::Strong);
    EXPECT_EQ(signalBand(51, false), SignalBand::Good);
    EXPECT_EQ(signalBand(50, false), SignalBand::Weak);
    EXPECT_EQ(signalBand(31, false), SignalBand::Weak);
}

TEST(SignalColorTest, ColorizeWrapsWithReset) {
    EXPECT_EQ(colorize("80%", SignalBand::Strong), "\x1b[32m80%\x1b[0m");
    EXPECT_EQ(colorize("60%", SignalBand::Good), "\x1b[33m60%\x1b[0m");
    EXPECT_EQ(colorize("10%", SignalBand::Weak), "\x1b[31m10%\x1b[0m");
}
