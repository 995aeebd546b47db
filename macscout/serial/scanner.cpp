#include "scanner.hpp"

#include <algorithm>
#include <cctype>
#include <cerrno>
#include <memory>
#include <sstream>

#include <libudev.h>

#include "spdlog/spdlog.h"

namespace macscout::serial {

namespace {

std::string format_duration(std::chrono::microseconds duration) {
    auto us = duration.count();
    if (us < 1000) {
        return std::to_string(us) + "us";
    } else if (us < 1000000) {
        return std::to_string(us / 1000) + "ms";
    } else {
        return std::to_string(us / 1000000) + "s";
    }
}

uint16_t parse_hex(const std::string& hex_str) {
    try {
        return static_cast<uint16_t>(std::stoul(hex_str, nullptr, 16));
    } catch (const std::exception&) {
        return 0;
    }
}

std::string property(udev_device* device, const char* key) {
    const char* value = udev_device_get_property_value(device, key);
    return value != nullptr ? value : "";
}

struct UdevDeleter {
    void operator()(udev* ctx) const noexcept { udev_unref(ctx); }
    void operator()(udev_enumerate* e) const noexcept {
        udev_enumerate_unref(e);
    }
    void operator()(udev_device* d) const noexcept { udev_device_unref(d); }
};

template <typename T>
using UdevPtr = std::unique_ptr<T, UdevDeleter>;

}  // anonymous namespace

SerialPortScanner::SerialPortScanner() noexcept {
    initialize_bridge_identifiers();
    spdlog::debug("SerialPortScanner initialized with default configuration");
}

SerialPortScanner::SerialPortScanner(const ScannerConfig& config) noexcept
    : config_(config) {
    initialize_bridge_identifiers();
    if (!config_.is_valid()) {
        spdlog::warn(
            "Invalid scanner configuration provided, using default values");
        config_ = ScannerConfig{};
    }
    spdlog::debug("SerialPortScanner initialized (usb_only={}, virtual={})",
                  config_.usb_only, config_.include_virtual_ports);
}

void SerialPortScanner::set_config(const ScannerConfig& config) noexcept {
    std::unique_lock<std::shared_mutex> lock(mutex_);
    if (!config.is_valid()) {
        spdlog::warn("Attempted to set invalid configuration, ignoring");
        return;
    }
    config_ = config;
}

ScannerConfig SerialPortScanner::get_config() const noexcept {
    std::shared_lock<std::shared_mutex> lock(mutex_);
    return config_;
}

void SerialPortScanner::initialize_bridge_identifiers() {
    // WCH
    bridge_identifiers_[0x1A86] = {{0x7523, "CH340"},  {0x5523, "CH341A"},
                                   {0x7522, "CH340K"}, {0x55D4, "CH9102"},
                                   {0x55D3, "CH343"},  {0x55D2, "CH9102X"}};
    // Silicon Labs
    bridge_identifiers_[0x10C4] = {{0xEA60, "CP210x"}, {0xEA70, "CP2105"},
                                   {0xEA71, "CP2108"}};
    // FTDI
    bridge_identifiers_[0x0403] = {{0x6001, "FT232R"},
                                   {0x6010, "FT2232"},
                                   {0x6014, "FT232H"},
                                   {0x6015, "FT231X"}};
    // Espressif native USB-Serial/JTAG and USB-OTG CDC
    bridge_identifiers_[0x303A] = {{0x1001, "ESP USB-Serial/JTAG"},
                                   {0x0002, "ESP USB CDC"}};
}

std::pair<bool, std::string> SerialPortScanner::is_bridge_device(
    uint16_t vid, uint16_t pid, std::string_view description) const {
    auto vid_it = bridge_identifiers_.find(vid);
    if (vid_it != bridge_identifiers_.end()) {
        auto pid_it = vid_it->second.find(pid);
        if (pid_it != vid_it->second.end()) {
            return {true, pid_it->second};
        }
    }

    std::string desc_lower(description);
    std::transform(desc_lower.begin(), desc_lower.end(), desc_lower.begin(),
                   [](unsigned char c) { return std::tolower(c); });

    if (desc_lower.find("ch340") != std::string::npos ||
        desc_lower.find("ch341") != std::string::npos) {
        return {true, "CH34x (detected by description)"};
    }
    if (desc_lower.find("cp210") != std::string::npos) {
        return {true, "CP210x (detected by description)"};
    }

    std::shared_lock<std::shared_mutex> lock(mutex_);
    for (const auto& [name, detector] : bridge_detectors_) {
        try {
            auto result = detector(vid, pid, description);
            if (result.first) {
                return result;
            }
        } catch (const std::exception& e) {
            spdlog::warn("Bridge detector '{}' threw exception: {}", name,
                         e.what());
        }
    }

    return {false, ""};
}

bool SerialPortScanner::register_bridge_detector(const std::string& name,
                                                 BridgeDetector detector) {
    std::unique_lock<std::shared_mutex> lock(mutex_);
    if (bridge_detectors_.find(name) != bridge_detectors_.end()) {
        spdlog::warn("Bridge detector '{}' already exists", name);
        return false;
    }
    bridge_detectors_[name] = std::move(detector);
    return true;
}

bool SerialPortScanner::is_virtual_port(std::string_view device_path) {
    return device_path == "/dev/tty" || device_path.starts_with("/dev/ptmx") ||
           device_path.starts_with("/dev/pts") ||
           device_path.starts_with("/dev/ttyS") ||
           device_path.starts_with("/dev/console") ||
           (device_path.starts_with("/dev/tty") && device_path.size() > 8 &&
            std::isdigit(static_cast<unsigned char>(device_path[8])));
}

SerialPortScanner::Result<std::vector<SerialPortScanner::PortInfo>>
SerialPortScanner::list_available_ports() {
    auto scan_start = std::chrono::steady_clock::now();
    const auto config = get_config();

    UdevPtr<udev> udev_context(udev_new());
    if (!udev_context) {
        auto error_msg = format_error("list_available_ports",
                                      "Failed to create udev context");
        spdlog::error(error_msg);
        update_statistics(std::chrono::microseconds(0), false);
        return ErrorInfo(error_msg, errno, "udev_new");
    }

    UdevPtr<udev_enumerate> enumerate(udev_enumerate_new(udev_context.get()));
    if (!enumerate) {
        auto error_msg = format_error("list_available_ports",
                                      "Failed to create udev enumerator");
        spdlog::error(error_msg);
        update_statistics(std::chrono::microseconds(0), false);
        return ErrorInfo(error_msg, errno, "udev_enumerate_new");
    }

    udev_enumerate_add_match_subsystem(enumerate.get(), "tty");
    if (int rc = udev_enumerate_scan_devices(enumerate.get()); rc < 0) {
        auto error_msg = format_error("list_available_ports",
                                      "udev_enumerate_scan_devices failed");
        spdlog::error(error_msg);
        update_statistics(std::chrono::microseconds(0), false);
        return ErrorInfo(error_msg, -rc, "udev_enumerate_scan_devices");
    }

    std::vector<PortInfo> ports;
    udev_list_entry* entry = nullptr;
    udev_list_entry_foreach(entry,
                            udev_enumerate_get_list_entry(enumerate.get())) {
        const char* path = udev_list_entry_get_name(entry);
        UdevPtr<udev_device> device(
            udev_device_new_from_syspath(udev_context.get(), path));
        if (!device) {
            continue;
        }

        const char* devnode = udev_device_get_devnode(device.get());
        if (devnode == nullptr) {
            continue;
        }

        PortInfo port_info;
        port_info.device = devnode;
        port_info.description = property(device.get(), "ID_MODEL");
        port_info.vendor_id = property(device.get(), "ID_VENDOR_ID");
        port_info.product_id = property(device.get(), "ID_MODEL_ID");
        port_info.serial_number = property(device.get(), "ID_SERIAL_SHORT");
        port_info.manufacturer = property(device.get(), "ID_VENDOR");
        port_info.bus = property(device.get(), "ID_BUS");
        port_info.is_virtual = is_virtual_port(port_info.device);
        port_info.last_seen = std::chrono::steady_clock::now();

        if (port_info.is_virtual && !config.include_virtual_ports) {
            continue;
        }
        if (config.usb_only && port_info.bus != "usb") {
            continue;
        }

        if (config.detect_bridges && !port_info.vendor_id.empty() &&
            !port_info.product_id.empty()) {
            auto [bridge, model] =
                is_bridge_device(parse_hex(port_info.vendor_id),
                                 parse_hex(port_info.product_id),
                                 port_info.description);
            port_info.is_bridge = bridge;
            port_info.bridge_model = std::move(model);
            if (bridge) {
                stats_.bridge_devices_found.fetch_add(1);
            }
        }

        ports.push_back(std::move(port_info));
    }

    auto scan_duration = std::chrono::duration_cast<std::chrono::microseconds>(
        std::chrono::steady_clock::now() - scan_start);
    update_statistics(scan_duration, true);

    if (config.enable_performance_logging) {
        spdlog::info("Port scan completed: found {} ports in {}", ports.size(),
                     format_duration(scan_duration));
    }

    return ports;
}

auto SerialPortScanner::list_ports() -> device::PortSet {
    auto result = list_available_ports();
    if (auto* error = std::get_if<ErrorInfo>(&result)) {
        {
            std::lock_guard<std::mutex> lock(error_mutex_);
            last_error_ = *error;
        }
        throw EnumerationError(error->message);
    }

    device::PortSet ports;
    for (const auto& port : std::get<std::vector<PortInfo>>(result)) {
        if (port.is_bridge) {
            spdlog::trace("{}: {} ({})", port.device, port.bridge_model,
                          port.description);
        }
        ports.insert(port.device);
    }
    return ports;
}

ScannerStats SerialPortScanner::get_statistics() const noexcept {
    return stats_;
}

void SerialPortScanner::reset_statistics() noexcept { stats_.reset(); }

std::optional<SerialPortScanner::ErrorInfo> SerialPortScanner::get_last_error()
    const {
    std::lock_guard<std::mutex> lock(error_mutex_);
    return last_error_;
}

void SerialPortScanner::update_statistics(std::chrono::microseconds scan_time,
                                          bool success) const noexcept {
    stats_.total_scans.fetch_add(1);
    if (success) {
        stats_.successful_scans.fetch_add(1);
    } else {
        stats_.failed_scans.fetch_add(1);
    }
    auto time_us = static_cast<uint64_t>(scan_time.count());
    stats_.total_scan_time.fetch_add(time_us);
    stats_.last_scan_time.store(time_us);
}

std::string SerialPortScanner::format_error(const std::string& operation,
                                            const std::string& details) const {
    std::ostringstream oss;
    oss << "SerialPortScanner::" << operation << " failed: " << details;
    return oss.str();
}

}  // namespace macscout::serial
