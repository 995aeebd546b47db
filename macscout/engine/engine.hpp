/*
 * engine.hpp
 *
 * Copyright (C) 2023-2024 Max Qian <lightapt.com>
 */

/*************************************************

Date: 2026-09-09

Description: Owns the registry, worker pool and scan scheduler

**************************************************/

#ifndef MACSCOUT_ENGINE_ENGINE_HPP
#define MACSCOUT_ENGINE_ENGINE_HPP

#include <chrono>
#include <cstddef>
#include <memory>
#include <mutex>

#include "macscout/async/identification_pool.hpp"
#include "macscout/config/engine_config.hpp"
#include "macscout/device/registry.hpp"
#include "macscout/query/record_query.hpp"
#include "macscout/serial/identifier.hpp"
#include "macscout/serial/port_lister.hpp"
#include "scan_scheduler.hpp"

namespace macscout::engine {

/**
 * @brief Discovery and identification engine.
 *
 * Start order is pool then scheduler; stop order is the reverse, after
 * which records still Reading are moved back to Pending. The engine can be
 * started again after a stop and keeps its registry.
 *
 * @example
 * ```cpp
 * macscout::engine::Engine engine(config, scanner, identifier);
 * engine.query().subscribe([](const auto& event) { ... });
 * engine.start();
 * ...
 * engine.stop();
 * ```
 */
class Engine {
public:
    /**
     * @throws macscout::error::InvalidArgument on a null collaborator or an
     * invalid config section
     */
    Engine(const config::EngineConfig& config,
           std::shared_ptr<serial::PortLister> lister,
           std::shared_ptr<serial::DeviceIdentifier> identifier);

    ~Engine();

    Engine(const Engine&) = delete;
    Engine& operator=(const Engine&) = delete;

    void start();

    /**
     * @return true if every running job finished within the grace period
     */
    auto stop() -> bool;

    [[nodiscard]] auto running() const noexcept -> bool;

    /**
     * @brief One scan outside the control loop. Starts the pool if needed.
     */
    auto tickOnce() -> TickReport;

    /**
     * @brief Single scan, then wait until every job has settled.
     *
     * @return false if jobs were still outstanding after `timeout`
     */
    auto runOnce(std::chrono::milliseconds timeout) -> bool;

    auto resetRecord(const device::PortId& port) -> bool;
    auto resetFailed() -> std::size_t;

    [[nodiscard]] auto registry() noexcept -> device::DeviceRegistry& {
        return registry_;
    }

    [[nodiscard]] auto query() noexcept -> query::RecordQuery& {
        return query_;
    }

    [[nodiscard]] auto poolStatistics() const noexcept -> async::PoolStats {
        return pool_.statistics();
    }

private:
    std::mutex lifecycle_mutex_;
    device::DeviceRegistry registry_;
    query::RecordQuery query_;
    async::IdentificationPool pool_;
    ScanScheduler scheduler_;
    std::chrono::milliseconds shutdown_grace_;
};

}  // namespace macscout::engine

#endif  // MACSCOUT_ENGINE_ENGINE_HPP
