#include "port_diff.hpp"

#include <algorithm>
#include <iterator>

namespace macscout::device {

auto computePortDiff(const PortSet& snapshot, const PortSet& known)
    -> PortDiff {
    PortDiff diff;
    std::set_difference(snapshot.begin(), snapshot.end(), known.begin(),
                        known.end(),
                        std::inserter(diff.appeared, diff.appeared.end()));
    std::set_difference(known.begin(), known.end(), snapshot.begin(),
                        snapshot.end(),
                        std::inserter(diff.disappeared, diff.disappeared.end()));
    return diff;
}

}  // namespace macscout::device
