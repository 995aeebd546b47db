#ifndef MACSCOUT_DEVICE_PORT_DIFF_HPP
#define MACSCOUT_DEVICE_PORT_DIFF_HPP

#include "device_record.hpp"

namespace macscout::device {

/**
 * @brief Ports that appeared and disappeared between two observations.
 */
struct PortDiff {
    PortSet appeared;
    PortSet disappeared;

    [[nodiscard]] auto empty() const noexcept -> bool {
        return appeared.empty() && disappeared.empty();
    }
};

/**
 * @brief Compute `snapshot - known` and `known - snapshot`.
 *
 * Pure function: no registry access, no timing.
 *
 * @param snapshot Ports currently reported by the OS
 * @param known Ports the registry considers attached
 */
[[nodiscard]] auto computePortDiff(const PortSet& snapshot,
                                   const PortSet& known) -> PortDiff;

}  // namespace macscout::device

#endif  // MACSCOUT_DEVICE_PORT_DIFF_HPP
