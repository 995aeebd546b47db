#include <gtest/gtest.h>

#include "macscout/device/port_diff.hpp"

using namespace macscout::device;

TEST(PortDiffTest, EmptyInputs) {
    auto diff = computePortDiff({}, {});
    EXPECT_TRUE(diff.empty());
}

TEST(PortDiffTest, NewPortsAppear) {
    auto diff = computePortDiff({"/dev/ttyUSB0", "/dev/ttyUSB1"}, {});
    EXPECT_EQ(diff.appeared, (PortSet{"/dev/ttyUSB0", "/dev/ttyUSB1"}));
    EXPECT_TRUE(diff.disappeared.empty());
}

TEST(PortDiffTest, MissingPortsDisappear) {
    auto diff = computePortDiff({"/dev/ttyUSB1"},
                                {"/dev/ttyUSB0", "/dev/ttyUSB1"});
    EXPECT_TRUE(diff.appeared.empty());
    EXPECT_EQ(diff.disappeared, (PortSet{"/dev/ttyUSB0"}));
}

TEST(PortDiffTest, SameSnapshotIsIdempotent) {
    PortSet ports{"/dev/ttyACM0", "/dev/ttyUSB0"};
    EXPECT_TRUE(computePortDiff(ports, ports).empty());
}

TEST(PortDiffTest, MixedChanges) {
    auto diff = computePortDiff({"/dev/ttyUSB1", "/dev/ttyUSB2"},
                                {"/dev/ttyUSB0", "/dev/ttyUSB1"});
    EXPECT_EQ(diff.appeared, (PortSet{"/dev/ttyUSB2"}));
    EXPECT_EQ(diff.disappeared, (PortSet{"/dev/ttyUSB0"}));
    EXPECT_FALSE(diff.empty());
}
