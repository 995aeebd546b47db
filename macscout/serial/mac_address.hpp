#ifndef MACSCOUT_SERIAL_MAC_ADDRESS_HPP
#define MACSCOUT_SERIAL_MAC_ADDRESS_HPP

#include <cstdint>
#include <optional>
#include <span>
#include <string>
#include <string_view>

namespace macscout::serial {

/**
 * @brief Normalize a MAC reported as text.
 *
 * Trims and lowercases. Twelve bare hex digits become colon-separated
 * pairs; anything else is returned trimmed and lowercased.
 */
[[nodiscard]] auto formatMac(std::string_view text) -> std::string;

/**
 * @brief Format raw MAC bytes as lowercase colon-separated hex.
 */
[[nodiscard]] auto formatMac(std::span<const uint8_t> bytes) -> std::string;

/**
 * @brief Whether `text` is six colon-separated hex pairs.
 */
[[nodiscard]] auto isValidMac(std::string_view text) -> bool;

/**
 * @brief Find the first "MAC: xx:xx:xx:xx:xx:xx" line in tool output.
 *
 * @return The normalized MAC, or std::nullopt when no line matches
 */
[[nodiscard]] auto extractMac(std::string_view output)
    -> std::optional<std::string>;

}  // namespace macscout::serial

#endif  // MACSCOUT_SERIAL_MAC_ADDRESS_HPP
