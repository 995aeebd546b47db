/*
 * identification_pool.cpp
 *
 * Copyright (C) 2023-2024 Max Qian <lightapt.com>
 */

/*************************************************

Date: 2026-09-06

Description: Bounded worker pool running identification jobs

**************************************************/

#include "identification_pool.hpp"

#include <algorithm>
#include <functional>
#include <system_error>
#include <utility>
#include <variant>

#include <spdlog/spdlog.h>

#include "macscout/error/exception.hpp"
#include "macscout/serial/mac_address.hpp"

namespace macscout::async {

IdentificationPool::IdentificationPool(
    device::DeviceRegistry& registry,
    std::shared_ptr<serial::DeviceIdentifier> identifier, PoolConfig config,
    BackoffPolicy backoff)
    : registry_(registry),
      identifier_(std::move(identifier)),
      config_(config),
      backoff_(std::move(backoff)) {
    if (!identifier_) {
        THROW_INVALID_ARGUMENT("Identification pool needs an identifier");
    }
    if (!config_.isValid()) {
        THROW_INVALID_ARGUMENT("Invalid pool config: workers=",
                               config_.workers, ", timeout=",
                               config_.attempt_timeout.count(),
                               " ms, max_attempts=", config_.max_attempts);
    }
}

IdentificationPool::~IdentificationPool() {
    try {
        shutdown(config_.shutdown_grace);
    } catch (const std::exception& e) {
        spdlog::error("Identification pool shutdown failed: {}", e.what());
    }
}

void IdentificationPool::start() {
    if (running_.exchange(true)) {
        return;
    }

    try {
        workers_.reserve(config_.workers);
        for (std::size_t i = 0; i < config_.workers; ++i) {
            workers_.emplace_back(
                [this](std::stop_token stop) { workerLoop(stop); });
        }
    } catch (const std::system_error& e) {
        spdlog::error("Cannot spawn identification worker: {}", e.what());
        shutdown(std::chrono::milliseconds(0));
        throw;
    }

    spdlog::info("Identification pool started: {} worker(s), {} ms timeout, "
                 "{} attempt(s)",
                 config_.workers, config_.attempt_timeout.count(),
                 config_.max_attempts);
}

auto IdentificationPool::submit(const device::DispatchTicket& ticket) -> bool {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (!running_.load()) {
            spdlog::warn("Pool not running, dropping job for {}",
                         ticket.port_id);
            return false;
        }
        const bool queued =
            std::find(fresh_.begin(), fresh_.end(), ticket) != fresh_.end() ||
            std::any_of(retries_.begin(), retries_.end(),
                        [&](const auto& entry) {
                            return entry.second == ticket;
                        });
        if (queued) {
            return false;
        }
        fresh_.push_back(ticket);
        ++generation_;
    }
    work_cv_.notify_all();
    return true;
}

auto IdentificationPool::cancel(const device::PortId& port) -> bool {
    std::size_t dropped = 0;
    bool signalled = false;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        dropped += std::erase_if(fresh_, [&](const device::DispatchTicket& t) {
            return t.port_id == port;
        });
        dropped += std::erase_if(retries_, [&](const auto& entry) {
            return entry.second.port_id == port;
        });
        if (auto it = busy_.find(port); it != busy_.end()) {
            signalled = it->second.request_stop();
        }
        if (dropped > 0) {
            ++generation_;
        }
    }

    if (dropped > 0) {
        stats_.cancelled.fetch_add(dropped);
        work_cv_.notify_all();
        idle_cv_.notify_all();
    }
    if (dropped > 0 || signalled) {
        spdlog::debug("Cancelled {} ({} queued, running job {})", port,
                      dropped, signalled ? "signalled" : "none");
    }
    return dropped > 0 || signalled;
}

auto IdentificationPool::shutdown(std::chrono::milliseconds grace) -> bool {
    if (!running_.exchange(false)) {
        return true;
    }

    std::size_t dropped = 0;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        dropped = fresh_.size() + retries_.size();
        fresh_.clear();
        retries_.clear();
        for (auto& [port, source] : busy_) {
            source.request_stop();
        }
        ++generation_;
    }
    stats_.cancelled.fetch_add(dropped);

    for (auto& worker : workers_) {
        worker.request_stop();
    }
    work_cv_.notify_all();
    idle_cv_.notify_all();

    bool finished = false;
    std::size_t outstanding = 0;
    {
        std::unique_lock<std::mutex> lock(mutex_);
        finished =
            idle_cv_.wait_for(lock, grace, [this] { return busy_.empty(); });
        outstanding = busy_.size();
    }
    if (!finished) {
        spdlog::warn("{} identification job(s) still running after {} ms, "
                     "abandoning their results",
                     outstanding, grace.count());
    }

    workers_.clear();
    spdlog::info("Identification pool stopped ({} queued job(s) dropped)",
                 dropped);
    return finished;
}

auto IdentificationPool::waitIdle(std::chrono::milliseconds timeout) -> bool {
    std::unique_lock<std::mutex> lock(mutex_);
    return idle_cv_.wait_for(lock, timeout, [this] { return idleLocked(); });
}

auto IdentificationPool::queuedJobs() const -> std::size_t {
    std::lock_guard<std::mutex> lock(mutex_);
    return fresh_.size() + retries_.size();
}

auto IdentificationPool::activeJobs() const -> std::size_t {
    std::lock_guard<std::mutex> lock(mutex_);
    return busy_.size();
}

void IdentificationPool::workerLoop(std::stop_token stop) {
    spdlog::debug("Identification worker {} started",
                  std::hash<std::thread::id>{}(std::this_thread::get_id()));
    while (auto job = nextJob(stop)) {
        try {
            runJob(*job);
        } catch (const std::exception& e) {
            spdlog::error("Identification job for {} failed: {}",
                          job->ticket.port_id, e.what());
        }
        release(job->ticket.port_id);
    }
    spdlog::debug("Identification worker {} stopped",
                  std::hash<std::thread::id>{}(std::this_thread::get_id()));
}

auto IdentificationPool::nextJob(std::stop_token stop) -> std::optional<Job> {
    std::unique_lock<std::mutex> lock(mutex_);
    while (!stop.stop_requested()) {
        if (auto ticket = takeReadyLocked(SteadyClock::now())) {
            std::stop_source source;
            auto token = source.get_token();
            busy_.emplace(ticket->port_id, std::move(source));
            return Job{std::move(*ticket), std::move(token)};
        }

        const auto seen = generation_;
        auto changed = [this, seen] { return generation_ != seen; };
        if (auto due = nextDueLocked()) {
            work_cv_.wait_until(lock, stop, *due, changed);
        } else {
            work_cv_.wait(lock, stop, changed);
        }
    }
    return std::nullopt;
}

auto IdentificationPool::takeReadyLocked(SteadyClock::time_point now)
    -> std::optional<device::DispatchTicket> {
    for (auto it = fresh_.begin(); it != fresh_.end(); ++it) {
        if (!busy_.contains(it->port_id)) {
            auto ticket = std::move(*it);
            fresh_.erase(it);
            return ticket;
        }
    }
    for (auto it = retries_.begin(); it != retries_.end() && it->first <= now;
         ++it) {
        if (!busy_.contains(it->second.port_id)) {
            auto ticket = std::move(it->second);
            retries_.erase(it);
            return ticket;
        }
    }
    return std::nullopt;
}

auto IdentificationPool::nextDueLocked() const
    -> std::optional<SteadyClock::time_point> {
    for (const auto& [due, ticket] : retries_) {
        if (!busy_.contains(ticket.port_id)) {
            return due;
        }
    }
    return std::nullopt;
}

void IdentificationPool::runJob(const Job& job) {
    const auto& ticket = job.ticket;
    auto attempt_no = registry_.beginAttempt(ticket);
    if (!attempt_no) {
        stats_.discarded.fetch_add(1);
        spdlog::debug("Skipping {}: cycle {} superseded", ticket.port_id,
                      ticket.cycle);
        return;
    }
    stats_.started.fetch_add(1);
    spdlog::debug("Identifying {} (attempt {}/{})", ticket.port_id,
                  *attempt_no, config_.max_attempts);

    auto result = attempt(job);

    if (job.stop.stop_requested()) {
        stats_.cancelled.fetch_add(1);
        spdlog::debug("Identification of {} cancelled", ticket.port_id);
        return;
    }

    if (const auto* reply = std::get_if<std::string>(&result)) {
        auto mac = serial::formatMac(*reply);
        if (serial::isValidMac(mac)) {
            if (registry_.completeSuccess(ticket, mac)) {
                stats_.succeeded.fetch_add(1);
            } else {
                stats_.discarded.fetch_add(1);
            }
            return;
        }
        spdlog::warn("Malformed MAC '{}' from {}", *reply, ticket.port_id);
        result = serial::IdentifyFailure{serial::IdentifyError::ProtocolError,
                                         "mac not found"};
    }

    const auto& failure = std::get<serial::IdentifyFailure>(result);
    switch (registry_.recordFailure(ticket, failure.describe(),
                                    config_.max_attempts)) {
        case device::FailureOutcome::Retry: {
            const auto delay = backoff_.delay(*attempt_no);
            {
                std::lock_guard<std::mutex> lock(mutex_);
                if (!running_.load()) {
                    return;
                }
                retries_.emplace(SteadyClock::now() + delay, ticket);
                ++generation_;
            }
            stats_.retried.fetch_add(1);
            work_cv_.notify_all();
            spdlog::debug("Retrying {} in {} ms", ticket.port_id,
                          delay.count());
            break;
        }
        case device::FailureOutcome::Exhausted:
            stats_.failed.fetch_add(1);
            break;
        case device::FailureOutcome::Stale:
            stats_.discarded.fetch_add(1);
            break;
    }
}

auto IdentificationPool::attempt(const Job& job) -> serial::IdentifyResult {
    try {
        return identifier_->identify(job.ticket.port_id,
                                     config_.attempt_timeout, job.stop);
    } catch (const std::exception& e) {
        spdlog::error("Identifier threw for {}: {}", job.ticket.port_id,
                      e.what());
        return serial::IdentifyFailure{serial::IdentifyError::ProtocolError,
                                       e.what()};
    }
}

void IdentificationPool::release(const device::PortId& port) {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        busy_.erase(port);
        ++generation_;
    }
    work_cv_.notify_all();
    idle_cv_.notify_all();
}

auto IdentificationPool::idleLocked() const -> bool {
    return fresh_.empty() && retries_.empty() && busy_.empty();
}

}  // namespace macscout::async
