/*
 * scan_scheduler.cpp
 *
 * Copyright (C) 2023-2024 Max Qian <lightapt.com>
 */

/*************************************************

Date: 2026-09-07

Description: Periodic port scan feeding the registry and the worker pool

**************************************************/

#include "scan_scheduler.hpp"

#include <exception>
#include <utility>

#include <spdlog/spdlog.h>

#include "macscout/device/port_diff.hpp"
#include "macscout/error/exception.hpp"

namespace macscout::engine {

ScanScheduler::ScanScheduler(device::DeviceRegistry& registry,
                             std::shared_ptr<serial::PortLister> lister,
                             async::IdentificationPool& pool,
                             ScanConfig config)
    : registry_(registry),
      lister_(std::move(lister)),
      pool_(pool),
      config_(config) {
    if (!lister_) {
        THROW_INVALID_ARGUMENT("Scan scheduler needs a port lister");
    }
    if (!config_.isValid()) {
        THROW_INVALID_ARGUMENT("Invalid poll interval: ",
                               config_.poll_interval.count(), " ms");
    }
}

ScanScheduler::~ScanScheduler() { stop(); }

auto ScanScheduler::tick() -> TickReport {
    std::lock_guard<std::mutex> guard(tick_mutex_);
    TickReport report;
    ticks_.fetch_add(1);

    device::PortSet snapshot;
    try {
        snapshot = lister_->list_ports();
    } catch (const serial::EnumerationError& e) {
        report.enumeration_failed = true;
        auto errors = consecutive_errors_.fetch_add(1) + 1;
        spdlog::warn("Port enumeration failed ({} consecutive): {}", errors,
                     e.what());
        return report;
    } catch (const std::exception& e) {
        report.enumeration_failed = true;
        auto errors = consecutive_errors_.fetch_add(1) + 1;
        spdlog::error("Port lister error ({} consecutive): {}", errors,
                      e.what());
        return report;
    }
    if (consecutive_errors_.exchange(0) > 0) {
        spdlog::info("Port enumeration recovered");
    }

    auto diff = device::computePortDiff(snapshot, registry_.activePorts());

    for (const auto& port : diff.disappeared) {
        if (registry_.markRemoved(port)) {
            pool_.cancel(port);
        }
    }

    if (!pool_.running()) {
        if (!diff.appeared.empty()) {
            spdlog::warn("Worker pool stopped, {} new port(s) left unqueued",
                         diff.appeared.size());
        }
        report.appeared = std::move(diff.appeared);
        report.disappeared = std::move(diff.disappeared);
        return report;
    }

    // Pending records of attached ports (reset or interrupted by a stop)
    // are dispatched together with the new arrivals, in port order.
    device::PortSet to_dispatch = diff.appeared;
    for (const auto& port : registry_.pendingPorts()) {
        if (snapshot.contains(port)) {
            to_dispatch.insert(port);
        }
    }

    for (const auto& port : to_dispatch) {
        auto ticket = registry_.dispatch(port);
        if (!ticket) {
            continue;
        }
        if (pool_.submit(*ticket)) {
            report.dispatched.push_back(port);
        } else if (registry_.abandonDispatch(*ticket)) {
            spdlog::warn("Could not queue identification of {}, left pending",
                         port);
        }
    }

    if (!diff.empty()) {
        spdlog::info("Scan: {} appeared, {} disappeared, {} dispatched",
                     diff.appeared.size(), diff.disappeared.size(),
                     report.dispatched.size());
    }
    report.appeared = std::move(diff.appeared);
    report.disappeared = std::move(diff.disappeared);
    return report;
}

void ScanScheduler::start() {
    if (running_.exchange(true)) {
        spdlog::warn("Scan scheduler is already running");
        return;
    }
    thread_ = std::jthread([this](std::stop_token stop) { loop(stop); });
    spdlog::info("Scan scheduler started ({} ms interval)",
                 config_.poll_interval.count());
}

void ScanScheduler::stop() {
    if (!running_.exchange(false)) {
        return;
    }
    thread_.request_stop();
    wait_cv_.notify_all();
    if (thread_.joinable()) {
        thread_.join();
    }
    thread_ = std::jthread();
    spdlog::info("Scan scheduler stopped after {} tick(s)", ticks_.load());
}

void ScanScheduler::loop(std::stop_token stop) {
    while (!stop.stop_requested()) {
        try {
            tick();
        } catch (const std::exception& e) {
            spdlog::error("Scan tick failed: {}", e.what());
        }

        std::unique_lock<std::mutex> lock(wait_mutex_);
        wait_cv_.wait_for(lock, stop, config_.poll_interval,
                          [] { return false; });
    }
}

}  // namespace macscout::engine
