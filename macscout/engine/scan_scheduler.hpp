/*
 * scan_scheduler.hpp
 *
 * Copyright (C) 2023-2024 Max Qian <lightapt.com>
 */

/*************************************************

Date: 2026-09-07

Description: Periodic port scan feeding the registry and the worker pool

**************************************************/

#ifndef MACSCOUT_ENGINE_SCAN_SCHEDULER_HPP
#define MACSCOUT_ENGINE_SCAN_SCHEDULER_HPP

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <cstdint>
#include <memory>
#include <mutex>
#include <stop_token>
#include <thread>
#include <vector>

#include "macscout/async/identification_pool.hpp"
#include "macscout/device/registry.hpp"
#include "macscout/serial/port_lister.hpp"

namespace macscout::engine {

struct ScanConfig {
    std::chrono::milliseconds poll_interval{1000};

    [[nodiscard]] bool isValid() const noexcept {
        return poll_interval.count() > 0;
    }
};

/**
 * @brief What one scan tick observed and did.
 */
struct TickReport {
    device::PortSet appeared;
    device::PortSet disappeared;
    std::vector<device::PortId> dispatched;
    bool enumeration_failed{false};
};

/**
 * @brief Diffs port snapshots against the registry once per poll interval.
 *
 * Removals are applied to the registry before the pool is told to cancel,
 * so a late worker result never overrides a removal. The scheduler never
 * waits for identification results.
 */
class ScanScheduler {
public:
    /**
     * @throws macscout::error::InvalidArgument if the lister is null or the
     * config is invalid
     */
    ScanScheduler(device::DeviceRegistry& registry,
                  std::shared_ptr<serial::PortLister> lister,
                  async::IdentificationPool& pool, ScanConfig config = {});

    ~ScanScheduler();

    ScanScheduler(const ScanScheduler&) = delete;
    ScanScheduler& operator=(const ScanScheduler&) = delete;

    /**
     * @brief Run one scan synchronously.
     *
     * Safe to call while the loop runs; ticks never overlap.
     */
    auto tick() -> TickReport;

    /**
     * @brief Start the control loop. The first tick runs immediately.
     */
    void start();

    /**
     * @brief Stop the control loop and join it.
     */
    void stop();

    [[nodiscard]] auto running() const noexcept -> bool {
        return running_.load();
    }

    [[nodiscard]] auto tickCount() const noexcept -> uint64_t {
        return ticks_.load();
    }

    [[nodiscard]] auto consecutiveErrors() const noexcept -> uint32_t {
        return consecutive_errors_.load();
    }

private:
    void loop(std::stop_token stop);

    device::DeviceRegistry& registry_;
    std::shared_ptr<serial::PortLister> lister_;
    async::IdentificationPool& pool_;
    ScanConfig config_;

    std::mutex tick_mutex_;
    std::mutex wait_mutex_;
    std::condition_variable_any wait_cv_;
    std::jthread thread_;
    std::atomic<bool> running_{false};
    std::atomic<uint64_t> ticks_{0};
    std::atomic<uint32_t> consecutive_errors_{0};
};

}  // namespace macscout::engine

#endif  // MACSCOUT_ENGINE_SCAN_SCHEDULER_HPP
