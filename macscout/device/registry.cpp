/*
 * registry.cpp
 *
 * Copyright (C) 2023-2024 Max Qian <lightapt.com>
 */

/*************************************************

Date: 2026-09-03

Description: Authoritative table of every port ever seen

**************************************************/

#include "registry.hpp"

#include <algorithm>
#include <iterator>
#include <utility>

#include <spdlog/spdlog.h>

#include "macscout/error/exception.hpp"

namespace macscout::device {

template <typename Fn>
auto DeviceRegistry::mutate(Fn&& fn) {
    EventList events;
    std::unique_lock<std::shared_mutex> lock(mutex_);
    auto result = fn(events);
    if (events.empty()) {
        return result;
    }
    publish(events);
    lock.unlock();

    drainEvents();
    return result;
}

void DeviceRegistry::transition(DeviceRecord& record, DeviceStatus to,
                                MutationReason reason, EventList& events) {
    const auto from = record.status;
    if (!isValidTransition(from, to, reason)) {
        THROW_LOGIC_ERROR("Invalid transition for ", record.port_id, ": ",
                          statusToString(from), " -> ", statusToString(to),
                          " (", reasonToString(reason), ")");
    }
    record.status = to;
    spdlog::debug("{}: {} -> {} ({})", record.port_id, statusToString(from),
                  statusToString(to), reasonToString(reason));
    emit(RegistryEvent::Type::StatusChanged, record, from, reason, events);
}

void DeviceRegistry::emit(RegistryEvent::Type type, const DeviceRecord& record,
                          std::optional<DeviceStatus> previous,
                          MutationReason reason, EventList& events) {
    ++version_;
    events.push_back(RegistryEvent{type, record, previous, reason, version_});
}

void DeviceRegistry::publish(EventList& events) {
    std::lock_guard<std::mutex> lock(events_mutex_);
    std::move(events.begin(), events.end(),
              std::back_inserter(pending_events_));
}

void DeviceRegistry::drainEvents() {
    {
        std::lock_guard<std::mutex> lock(events_mutex_);
        if (delivering_ || pending_events_.empty()) {
            return;
        }
        delivering_ = true;
    }

    while (true) {
        EventList batch;
        {
            std::lock_guard<std::mutex> lock(events_mutex_);
            if (pending_events_.empty()) {
                delivering_ = false;
                return;
            }
            batch.assign(std::make_move_iterator(pending_events_.begin()),
                         std::make_move_iterator(pending_events_.end()));
            pending_events_.clear();
        }

        try {
            deliver(batch);
        } catch (...) {
            std::lock_guard<std::mutex> lock(events_mutex_);
            delivering_ = false;
            throw;
        }
    }
}

void DeviceRegistry::deliver(const EventList& events) {
    std::vector<Listener> listeners;
    {
        std::lock_guard<std::mutex> lock(listeners_mutex_);
        listeners.reserve(listeners_.size());
        for (const auto& [token, listener] : listeners_) {
            listeners.push_back(listener);
        }
    }

    for (const auto& event : events) {
        for (const auto& listener : listeners) {
            try {
                listener(event);
            } catch (const std::exception& e) {
                spdlog::error("Registry listener threw for {}: {}",
                              event.record.port_id, e.what());
            }
        }
    }
}

auto DeviceRegistry::findCurrent(const DispatchTicket& ticket)
    -> DeviceRecord* {
    auto it = records_.find(ticket.port_id);
    if (it == records_.end()) {
        return nullptr;
    }
    auto& record = it->second;
    if (record.status != DeviceStatus::Reading ||
        record.cycle != ticket.cycle) {
        return nullptr;
    }
    return &record;
}

auto DeviceRegistry::activePorts() const -> PortSet {
    std::shared_lock<std::shared_mutex> lock(mutex_);
    PortSet ports;
    for (const auto& [port, record] : records_) {
        if (isActive(record.status)) {
            ports.insert(port);
        }
    }
    return ports;
}

auto DeviceRegistry::pendingPorts() const -> PortSet {
    std::shared_lock<std::shared_mutex> lock(mutex_);
    PortSet ports;
    for (const auto& [port, record] : records_) {
        if (record.status == DeviceStatus::Pending) {
            ports.insert(port);
        }
    }
    return ports;
}

auto DeviceRegistry::dispatch(const PortId& port)
    -> std::optional<DispatchTicket> {
    return mutate([&](EventList& events) -> std::optional<DispatchTicket> {
        auto it = records_.find(port);
        if (it == records_.end()) {
            DeviceRecord record;
            record.port_id = port;
            record.first_seen = Clock::now();
            record.sequence = next_sequence_++;
            record.appearances = 1;
            it = records_.emplace(port, std::move(record)).first;
            emit(RegistryEvent::Type::Added, it->second, std::nullopt,
                 MutationReason::SchedulerDispatch, events);
            spdlog::info("Port {} registered", port);
        }

        auto& record = it->second;
        switch (record.status) {
            case DeviceStatus::Removed:
                ++record.appearances;
                record.attempt_count = 0;
                transition(record, DeviceStatus::Pending,
                           MutationReason::SchedulerDispatch, events);
                spdlog::info("Port {} reappeared (appearance {})", port,
                             record.appearances);
                break;
            case DeviceStatus::Pending:
                break;
            case DeviceStatus::Reading:
            case DeviceStatus::Success:
            case DeviceStatus::Failed:
                return std::nullopt;
        }

        transition(record, DeviceStatus::Reading,
                   MutationReason::SchedulerDispatch, events);
        return DispatchTicket{port, record.cycle};
    });
}

auto DeviceRegistry::markRemoved(const PortId& port) -> bool {
    return mutate([&](EventList& events) {
        auto it = records_.find(port);
        if (it == records_.end() || !isActive(it->second.status)) {
            return false;
        }
        auto& record = it->second;
        const bool in_flight = record.status == DeviceStatus::Reading;
        record.mac.reset();
        record.last_error.reset();
        ++record.cycle;
        transition(record, DeviceStatus::Removed,
                   MutationReason::SchedulerRemoval, events);
        spdlog::info("Port {} removed{}", port,
                     in_flight ? " during identification" : "");
        return true;
    });
}

auto DeviceRegistry::interruptInFlight() -> std::vector<PortId> {
    return mutate([&](EventList& events) {
        std::vector<PortId> interrupted;
        for (auto& [port, record] : records_) {
            if (record.status != DeviceStatus::Reading) {
                continue;
            }
            record.attempt_count = 0;
            ++record.cycle;
            transition(record, DeviceStatus::Pending,
                       MutationReason::EngineStop, events);
            interrupted.push_back(port);
        }
        if (!interrupted.empty()) {
            spdlog::info("Interrupted {} identification(s) in flight",
                         interrupted.size());
        }
        return interrupted;
    });
}

auto DeviceRegistry::abandonDispatch(const DispatchTicket& ticket) -> bool {
    return mutate([&](EventList& events) {
        auto* record = findCurrent(ticket);
        if (record == nullptr || record->status != DeviceStatus::Reading ||
            record->attempt_count > 0) {
            return false;
        }
        ++record->cycle;
        transition(*record, DeviceStatus::Pending,
                   MutationReason::SchedulerDispatch, events);
        spdlog::debug("Dispatch of {} rolled back", ticket.port_id);
        return true;
    });
}

auto DeviceRegistry::resetRecord(const PortId& port) -> bool {
    return mutate([&](EventList& events) {
        auto it = records_.find(port);
        if (it == records_.end()) {
            return false;
        }
        auto& record = it->second;
        if (record.status != DeviceStatus::Success &&
            record.status != DeviceStatus::Failed) {
            return false;
        }
        record.mac.reset();
        record.last_error.reset();
        record.attempt_count = 0;
        ++record.cycle;
        transition(record, DeviceStatus::Pending,
                   MutationReason::ExplicitReset, events);
        spdlog::info("Port {} reset for re-identification", port);
        return true;
    });
}

auto DeviceRegistry::resetFailed() -> std::size_t {
    return mutate([&](EventList& events) {
        std::size_t count = 0;
        for (auto& [port, record] : records_) {
            if (record.status != DeviceStatus::Failed) {
                continue;
            }
            record.last_error.reset();
            record.attempt_count = 0;
            ++record.cycle;
            transition(record, DeviceStatus::Pending,
                       MutationReason::ExplicitReset, events);
            ++count;
        }
        if (count > 0) {
            spdlog::info("Reset {} failed port(s) for retry", count);
        }
        return count;
    });
}

auto DeviceRegistry::beginAttempt(const DispatchTicket& ticket)
    -> std::optional<uint32_t> {
    return mutate([&](EventList& events) -> std::optional<uint32_t> {
        auto* record = findCurrent(ticket);
        if (record == nullptr) {
            return std::nullopt;
        }
        ++record->attempt_count;
        record->last_attempt = Clock::now();
        emit(RegistryEvent::Type::Updated, *record, record->status,
             MutationReason::WorkerResult, events);
        return record->attempt_count;
    });
}

auto DeviceRegistry::completeSuccess(const DispatchTicket& ticket,
                                     const std::string& mac) -> bool {
    return mutate([&](EventList& events) {
        auto* record = findCurrent(ticket);
        if (record == nullptr) {
            discarded_results_.fetch_add(1);
            spdlog::debug("Discarding MAC {} for {}: cycle {} superseded", mac,
                          ticket.port_id, ticket.cycle);
            return false;
        }
        if (record->last_known_mac && *record->last_known_mac != mac) {
            spdlog::warn("Port {} now hosts a different device ({} -> {})",
                         record->port_id, *record->last_known_mac, mac);
        }
        record->mac = mac;
        record->last_known_mac = mac;
        record->last_error.reset();
        transition(*record, DeviceStatus::Success,
                   MutationReason::WorkerResult, events);
        spdlog::info("Port {} identified: {} (attempt {})", record->port_id,
                     mac, record->attempt_count);
        return true;
    });
}

auto DeviceRegistry::recordFailure(const DispatchTicket& ticket,
                                   const std::string& error,
                                   uint32_t max_attempts) -> FailureOutcome {
    return mutate([&](EventList& events) {
        auto* record = findCurrent(ticket);
        if (record == nullptr) {
            discarded_results_.fetch_add(1);
            spdlog::debug("Discarding failure for {}: cycle {} superseded",
                          ticket.port_id, ticket.cycle);
            return FailureOutcome::Stale;
        }
        if (record->attempt_count < max_attempts) {
            spdlog::warn("Port {} attempt {}/{} failed: {}", record->port_id,
                         record->attempt_count, max_attempts, error);
            return FailureOutcome::Retry;
        }
        record->last_error = error;
        transition(*record, DeviceStatus::Failed,
                   MutationReason::WorkerResult, events);
        spdlog::error("Port {} failed after {} attempt(s): {}",
                      record->port_id, record->attempt_count, error);
        return FailureOutcome::Exhausted;
    });
}

auto DeviceRegistry::isCurrent(const DispatchTicket& ticket) const -> bool {
    std::shared_lock<std::shared_mutex> lock(mutex_);
    auto it = records_.find(ticket.port_id);
    return it != records_.end() &&
           it->second.status == DeviceStatus::Reading &&
           it->second.cycle == ticket.cycle;
}

auto DeviceRegistry::get(const PortId& port) const
    -> std::optional<DeviceRecord> {
    std::shared_lock<std::shared_mutex> lock(mutex_);
    auto it = records_.find(port);
    if (it == records_.end()) {
        return std::nullopt;
    }
    return it->second;
}

auto DeviceRegistry::snapshot() const -> RegistrySnapshot {
    RegistrySnapshot snap;
    {
        std::shared_lock<std::shared_mutex> lock(mutex_);
        snap.records.reserve(records_.size());
        for (const auto& [port, record] : records_) {
            snap.records.push_back(record);
        }
        snap.version = version_;
    }
    snap.taken_at = Clock::now();
    std::sort(snap.records.begin(), snap.records.end(),
              [](const DeviceRecord& a, const DeviceRecord& b) {
                  return a.sequence < b.sequence;
              });
    return snap;
}

auto DeviceRegistry::size() const -> std::size_t {
    std::shared_lock<std::shared_mutex> lock(mutex_);
    return records_.size();
}

auto DeviceRegistry::version() const -> uint64_t {
    std::shared_lock<std::shared_mutex> lock(mutex_);
    return version_;
}

auto DeviceRegistry::discardedResults() const noexcept -> uint64_t {
    return discarded_results_.load();
}

auto DeviceRegistry::subscribe(Listener listener) -> Token {
    if (!listener) {
        THROW_INVALID_ARGUMENT("Registry listener must not be empty");
    }
    std::lock_guard<std::mutex> lock(listeners_mutex_);
    const auto token = next_token_++;
    listeners_.emplace(token, std::move(listener));
    return token;
}

void DeviceRegistry::unsubscribe(Token token) {
    std::lock_guard<std::mutex> lock(listeners_mutex_);
    listeners_.erase(token);
}

}  // namespace macscout::device
