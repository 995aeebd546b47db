#include <gmock/gmock.h>
#include <gtest/gtest.h>

#include "macscout/serial/scanner.hpp"

#include <memory>
#include <stdexcept>
#include <string>
#include <variant>

using namespace macscout::serial;
using ::testing::HasSubstr;

class SerialPortScannerTest : public ::testing::Test {
protected:
    void SetUp() override { scanner = std::make_unique<SerialPortScanner>(); }

    std::unique_ptr<SerialPortScanner> scanner;
};

// Known VID/PID pairs of the usual ESP32 dev board bridges
TEST_F(SerialPortScannerTest, IdentifiesKnownBridges) {
    auto ch340 = scanner->is_bridge_device(0x1a86, 0x7523, "");
    EXPECT_TRUE(ch340.first);
    EXPECT_EQ(ch340.second, "CH340");

    auto ch9102 = scanner->is_bridge_device(0x1a86, 0x55d4, "");
    EXPECT_TRUE(ch9102.first);
    EXPECT_EQ(ch9102.second, "CH9102");

    auto cp210x = scanner->is_bridge_device(0x10c4, 0xea60, "CP2102N");
    EXPECT_TRUE(cp210x.first);
    EXPECT_EQ(cp210x.second, "CP210x");

    auto ftdi = scanner->is_bridge_device(0x0403, 0x6001, "FT232R USB UART");
    EXPECT_TRUE(ftdi.first);
    EXPECT_EQ(ftdi.second, "FT232R");

    auto native = scanner->is_bridge_device(0x303a, 0x1001, "");
    EXPECT_TRUE(native.first);
    EXPECT_THAT(native.second, HasSubstr("JTAG"));
}

TEST_F(SerialPortScannerTest, IdentifiesBridgeByDescription) {
    auto ch341 = scanner->is_bridge_device(0xffff, 0xffff, "USB2.0-Ser CH341");
    EXPECT_TRUE(ch341.first);
    EXPECT_THAT(ch341.second, HasSubstr("CH34x"));

    auto cp = scanner->is_bridge_device(0xffff, 0xffff, "cp2104 bridge");
    EXPECT_TRUE(cp.first);
    EXPECT_THAT(cp.second, HasSubstr("CP210x"));
}

TEST_F(SerialPortScannerTest, RejectsUnknownDevices) {
    auto unknown = scanner->is_bridge_device(0x1a86, 0x0001, "Mystery");
    EXPECT_FALSE(unknown.first);
    EXPECT_TRUE(unknown.second.empty());

    auto empty = scanner->is_bridge_device(0, 0, "");
    EXPECT_FALSE(empty.first);
}

TEST_F(SerialPortScannerTest, CustomBridgeDetector) {
    EXPECT_TRUE(scanner->register_bridge_detector(
        "pl2303", [](uint16_t vid, uint16_t pid, std::string_view) {
            return std::make_pair(vid == 0x067b && pid == 0x2303,
                                  std::string("PL2303"));
        }));
    EXPECT_FALSE(scanner->register_bridge_detector(
        "pl2303", [](uint16_t, uint16_t, std::string_view) {
            return std::make_pair(true, std::string("duplicate"));
        }));

    auto result = scanner->is_bridge_device(0x067b, 0x2303, "");
    EXPECT_TRUE(result.first);
    EXPECT_EQ(result.second, "PL2303");

    EXPECT_FALSE(scanner->is_bridge_device(0x067b, 0x0001, "").first);
}

TEST_F(SerialPortScannerTest, ThrowingDetectorIsSkipped) {
    ASSERT_TRUE(scanner->register_bridge_detector(
        "broken", [](uint16_t, uint16_t, std::string_view)
                      -> std::pair<bool, std::string> {
            throw std::runtime_error("detector failure");
        }));
    EXPECT_FALSE(scanner->is_bridge_device(0x1234, 0x5678, "").first);
}

TEST_F(SerialPortScannerTest, ClassifiesVirtualPorts) {
    EXPECT_TRUE(SerialPortScanner::is_virtual_port("/dev/ttyS0"));
    EXPECT_TRUE(SerialPortScanner::is_virtual_port("/dev/pts/3"));
    EXPECT_TRUE(SerialPortScanner::is_virtual_port("/dev/tty1"));
    EXPECT_TRUE(SerialPortScanner::is_virtual_port("/dev/tty"));
    EXPECT_TRUE(SerialPortScanner::is_virtual_port("/dev/console"));

    EXPECT_FALSE(SerialPortScanner::is_virtual_port("/dev/ttyUSB0"));
    EXPECT_FALSE(SerialPortScanner::is_virtual_port("/dev/ttyACM1"));
}

TEST_F(SerialPortScannerTest, ConfigDefaultsAndUpdate) {
    auto config = scanner->get_config();
    EXPECT_FALSE(config.include_virtual_ports);
    EXPECT_TRUE(config.usb_only);
    EXPECT_TRUE(config.detect_bridges);

    config.usb_only = false;
    config.enable_performance_logging = true;
    scanner->set_config(config);
    EXPECT_FALSE(scanner->get_config().usb_only);
    EXPECT_TRUE(scanner->get_config().enable_performance_logging);
}

// Runs against whatever udev sees on the host, which may be nothing
TEST_F(SerialPortScannerTest, ScanUpdatesStatistics) {
    auto result = scanner->list_available_ports();
    auto stats = scanner->get_statistics();
    EXPECT_EQ(stats.total_scans.load(), 1u);

    if (auto* ports =
            std::get_if<std::vector<SerialPortScanner::PortInfo>>(&result)) {
        EXPECT_EQ(stats.successful_scans.load(), 1u);
        for (const auto& port : *ports) {
            EXPECT_EQ(port.bus, "usb");
            EXPECT_FALSE(port.is_virtual);
        }
    } else {
        EXPECT_EQ(stats.failed_scans.load(), 1u);
    }

    scanner->reset_statistics();
    EXPECT_EQ(scanner->get_statistics().total_scans.load(), 0u);
    EXPECT_DOUBLE_EQ(scanner->get_statistics().get_average_scan_time(), 0.0);
}

TEST_F(SerialPortScannerTest, ListPortsMatchesDetailedScan) {
    try {
        auto ports = scanner->list_ports();
        for (const auto& port : ports) {
            EXPECT_FALSE(SerialPortScanner::is_virtual_port(port)) << port;
        }
        EXPECT_FALSE(scanner->get_last_error().has_value());
    } catch (const EnumerationError& e) {
        ASSERT_TRUE(scanner->get_last_error().has_value());
        EXPECT_EQ(scanner->get_last_error()->message, e.what());
    }
}
