#include "engine.hpp"

#include <utility>

#include <spdlog/spdlog.h>

namespace macscout::engine {

Engine::Engine(const config::EngineConfig& config,
               std::shared_ptr<serial::PortLister> lister,
               std::shared_ptr<serial::DeviceIdentifier> identifier)
    : query_(registry_),
      pool_(registry_, std::move(identifier), config.pool,
            async::BackoffPolicy(config.backoff)),
      scheduler_(registry_, std::move(lister), pool_, config.scan),
      shutdown_grace_(config.pool.shutdown_grace) {}

Engine::~Engine() {
    try {
        stop();
    } catch (const std::exception& e) {
        spdlog::error("Engine shutdown failed: {}", e.what());
    }
}

void Engine::start() {
    std::lock_guard<std::mutex> lock(lifecycle_mutex_);
    if (scheduler_.running()) {
        return;
    }
    pool_.start();
    scheduler_.start();
    spdlog::info("Engine started");
}

auto Engine::stop() -> bool {
    std::lock_guard<std::mutex> lock(lifecycle_mutex_);
    if (!scheduler_.running() && !pool_.running()) {
        return true;
    }
    scheduler_.stop();
    const bool clean = pool_.shutdown(shutdown_grace_);
    auto interrupted = registry_.interruptInFlight();
    spdlog::info("Engine stopped ({} identification(s) interrupted)",
                 interrupted.size());
    return clean;
}

auto Engine::running() const noexcept -> bool { return scheduler_.running(); }

auto Engine::tickOnce() -> TickReport {
    {
        std::lock_guard<std::mutex> lock(lifecycle_mutex_);
        pool_.start();
    }
    return scheduler_.tick();
}

auto Engine::runOnce(std::chrono::milliseconds timeout) -> bool {
    auto report = tickOnce();
    if (report.enumeration_failed) {
        return false;
    }
    return pool_.waitIdle(timeout);
}

auto Engine::resetRecord(const device::PortId& port) -> bool {
    return registry_.resetRecord(port);
}

auto Engine::resetFailed() -> std::size_t { return registry_.resetFailed(); }

}  // namespace macscout::engine
