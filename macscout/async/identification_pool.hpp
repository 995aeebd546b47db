/*
 * identification_pool.hpp
 *
 * Copyright (C) 2023-2024 Max Qian <lightapt.com>
 */

/*************************************************

Date: 2026-09-06

Description: Bounded worker pool running identification jobs

**************************************************/

#ifndef MACSCOUT_ASYNC_IDENTIFICATION_POOL_HPP
#define MACSCOUT_ASYNC_IDENTIFICATION_POOL_HPP

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <cstddef>
#include <cstdint>
#include <deque>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <stop_token>
#include <thread>
#include <unordered_map>
#include <vector>

#include "backoff.hpp"
#include "macscout/device/registry.hpp"
#include "macscout/serial/identifier.hpp"

namespace macscout::async {

struct PoolConfig {
    std::size_t workers{4};  ///< Maximum simultaneous attempts (K)
    std::chrono::milliseconds attempt_timeout{5000};
    uint32_t max_attempts{3};
    std::chrono::milliseconds shutdown_grace{2000};

    [[nodiscard]] bool isValid() const noexcept {
        return workers > 0 && attempt_timeout.count() > 0 &&
               max_attempts > 0 && shutdown_grace.count() >= 0;
    }
};

/**
 * @brief Job counters, readable while the pool runs.
 */
struct PoolStats {
    std::atomic<uint64_t> started{0};    ///< Attempts begun
    std::atomic<uint64_t> succeeded{0};  ///< Records moved to Success
    std::atomic<uint64_t> failed{0};     ///< Records moved to Failed
    std::atomic<uint64_t> retried{0};    ///< Attempts re-queued after backoff
    std::atomic<uint64_t> cancelled{0};  ///< Jobs stopped or dropped
    std::atomic<uint64_t> discarded{0};  ///< Results for a superseded cycle

    PoolStats() noexcept = default;

    PoolStats(const PoolStats& other) noexcept
        : started(other.started.load()),
          succeeded(other.succeeded.load()),
          failed(other.failed.load()),
          retried(other.retried.load()),
          cancelled(other.cancelled.load()),
          discarded(other.discarded.load()) {}
};

/**
 * @brief Runs identification cycles on a fixed set of worker threads.
 *
 * Fresh dispatches are served in FIFO order before any retry. Retries wait
 * in a queue ordered by due time. A port is held by at most one job at a
 * time; a job for a busy port stays queued until the port is released.
 *
 * All results go through the registry, which drops those whose cycle has
 * ended. The pool never changes a record's status on its own.
 */
class IdentificationPool {
public:
    /**
     * @throws macscout::error::InvalidArgument if the identifier is null or
     * the config is invalid
     */
    IdentificationPool(device::DeviceRegistry& registry,
                       std::shared_ptr<serial::DeviceIdentifier> identifier,
                       PoolConfig config = {}, BackoffPolicy backoff = {});

    ~IdentificationPool();

    IdentificationPool(const IdentificationPool&) = delete;
    IdentificationPool& operator=(const IdentificationPool&) = delete;

    /**
     * @brief Spawn the worker threads. No-op if already running.
     */
    void start();

    [[nodiscard]] auto running() const noexcept -> bool {
        return running_.load();
    }

    /**
     * @brief Queue the first attempt of an identification cycle.
     *
     * @return false if the pool is not running or the ticket is queued
     */
    auto submit(const device::DispatchTicket& ticket) -> bool;

    /**
     * @brief Drop queued jobs for a port and signal its running job.
     *
     * Idempotent; unknown ports are ignored.
     *
     * @return true if anything was dropped or signalled
     */
    auto cancel(const device::PortId& port) -> bool;

    /**
     * @brief Stop accepting jobs, signal running ones and join the workers.
     *
     * Waits up to `grace` for running jobs to finish. Results arriving after
     * that are abandoned. Workers are joined either way.
     *
     * @return true if every job finished within the grace period
     */
    auto shutdown(std::chrono::milliseconds grace) -> bool;

    /**
     * @brief Block until no job is queued, waiting for retry or running.
     *
     * @return false on timeout
     */
    auto waitIdle(std::chrono::milliseconds timeout) -> bool;

    [[nodiscard]] auto queuedJobs() const -> std::size_t;
    [[nodiscard]] auto activeJobs() const -> std::size_t;

    [[nodiscard]] auto statistics() const noexcept -> PoolStats {
        return stats_;
    }

    [[nodiscard]] auto config() const noexcept -> const PoolConfig& {
        return config_;
    }

private:
    using SteadyClock = std::chrono::steady_clock;

    struct Job {
        device::DispatchTicket ticket;
        std::stop_token stop;
    };

    void workerLoop(std::stop_token stop);
    [[nodiscard]] auto nextJob(std::stop_token stop) -> std::optional<Job>;
    [[nodiscard]] auto takeReadyLocked(SteadyClock::time_point now)
        -> std::optional<device::DispatchTicket>;
    [[nodiscard]] auto nextDueLocked() const
        -> std::optional<SteadyClock::time_point>;
    void runJob(const Job& job);
    [[nodiscard]] auto attempt(const Job& job) -> serial::IdentifyResult;
    void release(const device::PortId& port);
    [[nodiscard]] auto idleLocked() const -> bool;

    device::DeviceRegistry& registry_;
    std::shared_ptr<serial::DeviceIdentifier> identifier_;
    PoolConfig config_;
    BackoffPolicy backoff_;

    mutable std::mutex mutex_;
    std::condition_variable_any work_cv_;
    std::condition_variable idle_cv_;
    std::deque<device::DispatchTicket> fresh_;
    std::multimap<SteadyClock::time_point, device::DispatchTicket> retries_;
    std::unordered_map<device::PortId, std::stop_source> busy_;
    uint64_t generation_{0};

    std::vector<std::jthread> workers_;
    std::atomic<bool> running_{false};

    mutable PoolStats stats_;
};

}  // namespace macscout::async

#endif  // MACSCOUT_ASYNC_IDENTIFICATION_POOL_HPP
