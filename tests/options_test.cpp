#include "options.hpp"
#include <gtest/gtest.h>
#include <sstream>
#include <stdexcept>

TEST(OptionsTest, DefaultsMatchConstants) {
    const char* argv[] = {"wifiwatch"};
    Options options = parseArguments(1, argv);

    EXPECT_EQ(options.mode, OutputMode::Table);
    EXPECT_FALSE(options.once);
    EXPECT_FALSE(options.verbose);
    EXPECT_FALSE(options.showHelp);
    EXPECT_EQ(options.ouiFile, "manuf");
    EXPECT_EQ(options.backend, "auto");
    EXPECT_EQ(options.intervalSeconds, 5);
}

TEST(OptionsTest, ParsesAllOptions) {
    const char* argv[] = {"wifiwatch", "--list", "-1", "-v", "-f", "/tmp/oui.txt",
                          "--backend", "nl80211", "-i", "12"};
    Options options = parseArguments(10, argv);

    EXPECT_EQ(options.mode, OutputMode::List);
    EXPECT_TRUE(options.once);
    EXPECT_TRUE(options.verbose);
    EXPECT_EQ(options.ouiFile, "/tmp/oui.txt");
    EXPECT_EQ(options.backend, "nl80211");
    EXPECT_EQ(options.intervalSeconds, 12);
}

TEST(OptionsTest, LastModeWins) {
    const char* argv[] = {"wifiwatch", "-j", "-t", "--json"};
    EXPECT_EQ(parseArguments(4, argv).mode, OutputMode::Json);
}

TEST(OptionsTest, HelpFlag) {
    const char* argv[] = {"wifiwatch", "-h"};
    EXPECT_TRUE(parseArguments(2, argv).showHelp);
}

TEST(OptionsTest, RejectsBadInput) {
    const char* unknown[] = {"wifiwatch", "--frobnicate"};
    EXPECT_THROW(parseArguments(2, unknown), std::invalid_argument);

    const char* missing[] = {"wifiwatch", "--oui-file"};
    EXPECT_THROW(parseArguments(2, missing), std::invalid_argument);

    const char* zero[] = {"wifiwatch", "-i", "0"};
    EXPECT_THROW(parseArguments(3, zero), std::invalid_argument);

    const char* text[] = {"wifiwatch", "-i", "5s"};
    EXPECT_THROW(parseArguments(3, text), std::invalid_argument);

    const char* word[] = {"wifiwatch", "-i", "soon"};
    EXPECT_THROW(parseArguments(3, word), std::invalid_argument);
}

TEST(OptionsTest, HelpListsEveryOption) {
    std::ostringstream out;
    printHelp(out, "wifiwatch");

    for (const char* flag : {"--help", "--table", "--list", "--json", "--once",
                             "--oui-file", "--backend", "--interval", "--verbose"}) {
        EXPECT_NE(out.str().find(flag), std::string::npos) << flag;
    }
}
