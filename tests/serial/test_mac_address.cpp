#include <gtest/gtest.h>

#include <array>
#include <cstdint>

#include "macscout/serial/mac_address.hpp"

using namespace macscout::serial;

TEST(MacAddressTest, FormatsBareHex) {
    EXPECT_EQ(formatMac("240AC4001122"), "24:0a:c4:00:11:22");
    EXPECT_EQ(formatMac("  240ac4001122\n"), "24:0a:c4:00:11:22");
}

TEST(MacAddressTest, NormalizesSeparatedForms) {
    EXPECT_EQ(formatMac("24:0A:C4:00:11:22"), "24:0a:c4:00:11:22");
    EXPECT_EQ(formatMac(" 30:AE:A4:FF:EE:DD\r\n"), "30:ae:a4:ff:ee:dd");
}

TEST(MacAddressTest, LeavesOtherTextTrimmed) {
    EXPECT_EQ(formatMac("  Not A Mac "), "not a mac");
    EXPECT_EQ(formatMac("240AC40011"), "240ac40011");
    EXPECT_EQ(formatMac(""), "");
}

TEST(MacAddressTest, FormatsBytes) {
    std::array<uint8_t, 6> bytes{0x24, 0x0A, 0xC4, 0x00, 0x11, 0xFF};
    EXPECT_EQ(formatMac(bytes), "24:0a:c4:00:11:ff");
    EXPECT_EQ(formatMac(std::span<const uint8_t>{}), "");
}

TEST(MacAddressTest, ValidatesColonForm) {
    EXPECT_TRUE(isValidMac("24:0a:c4:00:11:22"));
    EXPECT_TRUE(isValidMac("24:0A:C4:00:11:22"));
    EXPECT_FALSE(isValidMac(""));
    EXPECT_FALSE(isValidMac("240ac4001122"));
    EXPECT_FALSE(isValidMac("24-0a-c4-00-11-22"));
    EXPECT_FALSE(isValidMac("24:0a:c4:00:11:2g"));
    EXPECT_FALSE(isValidMac("24:0a:c4:00:11:22:33"));
}

TEST(MacAddressTest, ExtractsFromEsptoolOutput) {
    constexpr auto output =
        "esptool.py v4.7.0\n"
        "Serial port /dev/ttyUSB0\n"
        "Connecting....\n"
        "Chip is ESP32-D0WD-V3 (revision v3.1)\n"
        "MAC: 24:0a:c4:00:11:22\n"
        "Hard resetting via RTS pin...\n";
    EXPECT_EQ(extractMac(output), "24:0a:c4:00:11:22");
}

TEST(MacAddressTest, ExtractsFirstMatchAnyCase) {
    EXPECT_EQ(extractMac("mac:   30-AE-A4-01-02-03\nMAC: 00:00:00:00:00:00"),
              "30:ae:a4:01:02:03");
}

TEST(MacAddressTest, NoMacLine) {
    EXPECT_FALSE(extractMac("").has_value());
    EXPECT_FALSE(extractMac("A fatal error occurred: Failed to connect")
                     .has_value());
    EXPECT_FALSE(extractMac("MAC: 24:0a:c4").has_value());
}
