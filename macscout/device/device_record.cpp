/*
 * device_record.cpp
 *
 * Copyright (C) 2023-2024 Max Qian <lightapt.com>
 */

/*************************************************

Date: 2026-09-03

Description: Device record and identification state machine

**************************************************/

#include "device_record.hpp"

#include <algorithm>
#include <cctype>
#include <string>

namespace macscout::device {

auto statusToString(DeviceStatus status) noexcept -> std::string_view {
    switch (status) {
        case DeviceStatus::Pending:
            return "pending";
        case DeviceStatus::Reading:
            return "reading";
        case DeviceStatus::Success:
            return "success";
        case DeviceStatus::Failed:
            return "failed";
        case DeviceStatus::Removed:
            return "removed";
    }
    return "unknown";
}

auto statusFromString(std::string_view label) -> std::optional<DeviceStatus> {
    std::string lower(label);
    std::transform(lower.begin(), lower.end(), lower.begin(),
                   [](unsigned char c) { return std::tolower(c); });

    for (auto status : {DeviceStatus::Pending, DeviceStatus::Reading,
                        DeviceStatus::Success, DeviceStatus::Failed,
                        DeviceStatus::Removed}) {
        if (statusToString(status) == lower) {
            return status;
        }
    }
    return std::nullopt;
}

auto reasonToString(MutationReason reason) noexcept -> std::string_view {
    switch (reason) {
        case MutationReason::SchedulerDispatch:
            return "scheduler-dispatch";
        case MutationReason::WorkerResult:
            return "worker-result";
        case MutationReason::SchedulerRemoval:
            return "scheduler-removal";
        case MutationReason::EngineStop:
            return "engine-stop";
        case MutationReason::ExplicitReset:
            return "explicit-reset";
    }
    return "unknown";
}

auto isValidTransition(DeviceStatus from, DeviceStatus to,
                       MutationReason reason) noexcept -> bool {
    using S = DeviceStatus;
    using R = MutationReason;

    if (to == S::Removed) {
        return reason == R::SchedulerRemoval && isActive(from);
    }

    switch (from) {
        case S::Pending:
            return to == S::Reading && reason == R::SchedulerDispatch;
        case S::Reading:
            if (reason == R::WorkerResult) {
                return to == S::Success || to == S::Failed;
            }
            return to == S::Pending &&
                   (reason == R::EngineStop || reason == R::SchedulerDispatch);
        case S::Success:
        case S::Failed:
            return to == S::Pending && reason == R::ExplicitReset;
        case S::Removed:
            return to == S::Pending && reason == R::SchedulerDispatch;
    }
    return false;
}

}  // namespace macscout::device
