#ifndef MACSCOUT_SERIAL_SCANNER_HPP
#define MACSCOUT_SERIAL_SCANNER_HPP

#include <atomic>
#include <chrono>
#include <cstdint>
#include <functional>
#include <mutex>
#include <optional>
#include <shared_mutex>
#include <string>
#include <string_view>
#include <unordered_map>
#include <utility>
#include <variant>
#include <vector>

#include "port_lister.hpp"

namespace macscout::serial {

/**
 * @brief Counters for the serial port scanner
 */
struct ScannerStats {
    std::atomic<uint64_t> total_scans{0};
    std::atomic<uint64_t> successful_scans{0};
    std::atomic<uint64_t> failed_scans{0};
    std::atomic<uint64_t> bridge_devices_found{0};

    // Timing statistics (in microseconds)
    std::atomic<uint64_t> last_scan_time{0};
    std::atomic<uint64_t> total_scan_time{0};

    ScannerStats() noexcept = default;

    ScannerStats(const ScannerStats& other) noexcept
        : total_scans(other.total_scans.load()),
          successful_scans(other.successful_scans.load()),
          failed_scans(other.failed_scans.load()),
          bridge_devices_found(other.bridge_devices_found.load()),
          last_scan_time(other.last_scan_time.load()),
          total_scan_time(other.total_scan_time.load()) {}

    void reset() noexcept {
        total_scans = 0;
        successful_scans = 0;
        failed_scans = 0;
        bridge_devices_found = 0;
        last_scan_time = 0;
        total_scan_time = 0;
    }

    [[nodiscard]] double get_average_scan_time() const noexcept {
        auto total = total_scans.load();
        return total > 0 ? static_cast<double>(total_scan_time.load()) / total
                         : 0.0;
    }
};

/**
 * @brief Configuration options for the serial port scanner
 */
struct ScannerConfig {
    bool include_virtual_ports{false};  ///< Keep /dev/ttyS*, /dev/pts/*
    bool usb_only{true};                ///< Keep only ports on the USB bus
    bool detect_bridges{true};  ///< Annotate known USB-serial bridge chips
    bool enable_performance_logging{false};  ///< Log every scan duration

    [[nodiscard]] bool is_valid() const noexcept { return true; }
};

/**
 * @brief Lists serial ports through libudev.
 *
 * Ports are not opened during a scan: on many ESP32 boards opening the port
 * toggles DTR/RTS and resets the chip.
 *
 * @example
 * ```cpp
 * macscout::serial::SerialPortScanner scanner;
 * for (const auto& port : scanner.list_ports()) {
 *     std::cout << port << std::endl;
 * }
 * ```
 */
class SerialPortScanner : public PortLister {
public:
    /**
     * @brief Basic information about one serial port.
     */
    struct PortInfo {
        std::string device;       ///< Device node, e.g. /dev/ttyUSB0
        std::string description;  ///< ID_MODEL
        std::string vendor_id;    ///< Vendor ID in hex format
        std::string product_id;   ///< Product ID in hex format
        std::string serial_number;
        std::string manufacturer;
        std::string bus;          ///< ID_BUS, e.g. "usb"
        bool is_virtual{false};
        bool is_bridge{false};    ///< Known USB-serial bridge chip
        std::string bridge_model;
        std::chrono::steady_clock::time_point last_seen;
    };

    /**
     * @brief Error information returned instead of a value
     */
    struct ErrorInfo {
        std::string message;
        int error_code{0};
        std::chrono::steady_clock::time_point timestamp;
        std::string context;

        ErrorInfo() = default;
        ErrorInfo(std::string msg, int code = 0, std::string ctx = "")
            : message(std::move(msg)),
              error_code(code),
              timestamp(std::chrono::steady_clock::now()),
              context(std::move(ctx)) {}
    };

    template <typename T>
    using Result = std::variant<T, ErrorInfo>;

    using BridgeDetector = std::function<std::pair<bool, std::string>(
        uint16_t, uint16_t, std::string_view)>;

    SerialPortScanner() noexcept;

    explicit SerialPortScanner(const ScannerConfig& config) noexcept;

    ~SerialPortScanner() override = default;

    SerialPortScanner(const SerialPortScanner&) = delete;
    SerialPortScanner& operator=(const SerialPortScanner&) = delete;

    void set_config(const ScannerConfig& config) noexcept;

    [[nodiscard]] ScannerConfig get_config() const noexcept;

    /**
     * @brief Check VID/PID and description against known bridge chips
     *
     * Covers the CH34x, CP210x, FTDI and Espressif native USB families.
     *
     * @return {true, model} when the device is a known bridge
     */
    [[nodiscard]] std::pair<bool, std::string> is_bridge_device(
        uint16_t vid, uint16_t pid, std::string_view description) const;

    /**
     * @brief Register an extra bridge detector
     *
     * @return false if a detector with that name already exists
     */
    bool register_bridge_detector(const std::string& name,
                                  BridgeDetector detector);

    /**
     * @brief Scan the tty subsystem and return matching ports
     */
    [[nodiscard]] Result<std::vector<PortInfo>> list_available_ports();

    /**
     * @brief Device nodes of all matching ports
     *
     * @throws EnumerationError if udev enumeration fails
     */
    [[nodiscard]] auto list_ports() -> device::PortSet override;

    [[nodiscard]] ScannerStats get_statistics() const noexcept;

    void reset_statistics() noexcept;

    [[nodiscard]] std::optional<ErrorInfo> get_last_error() const;

    /**
     * @brief Whether a device node names a virtual or on-board UART
     */
    [[nodiscard]] static bool is_virtual_port(std::string_view device_path);

private:
    void initialize_bridge_identifiers();
    void update_statistics(std::chrono::microseconds scan_time,
                           bool success) const noexcept;
    [[nodiscard]] std::string format_error(const std::string& operation,
                                           const std::string& details) const;

    /**
     * @brief Known bridge chips: VID -> (PID -> model)
     */
    std::unordered_map<uint16_t, std::unordered_map<uint16_t, std::string>>
        bridge_identifiers_;

    ScannerConfig config_{};

    std::unordered_map<std::string, BridgeDetector> bridge_detectors_;

    mutable std::shared_mutex mutex_;

    mutable ScannerStats stats_;

    mutable std::mutex error_mutex_;
    std::optional<ErrorInfo> last_error_;
};

}  // namespace macscout::serial

#endif  // MACSCOUT_SERIAL_SCANNER_HPP
