/*
 * registry.hpp
 *
 * Copyright (C) 2023-2024 Max Qian <lightapt.com>
 */

/*************************************************

Date: 2026-09-03

Description: Authoritative table of every port ever seen

**************************************************/

#ifndef MACSCOUT_DEVICE_REGISTRY_HPP
#define MACSCOUT_DEVICE_REGISTRY_HPP

#include <atomic>
#include <cstddef>
#include <cstdint>
#include <deque>
#include <functional>
#include <map>
#include <mutex>
#include <optional>
#include <shared_mutex>
#include <string>
#include <unordered_map>
#include <vector>

#include "device_record.hpp"

namespace macscout::device {

/**
 * @brief Handle for one identification cycle of one port.
 *
 * A worker result is applied only while the record is still in the cycle
 * named by its ticket. Removal, reset and engine stop all start a new cycle,
 * which turns any outstanding ticket stale.
 */
struct DispatchTicket {
    PortId port_id;
    uint64_t cycle{0};

    bool operator==(const DispatchTicket& other) const noexcept {
        return port_id == other.port_id && cycle == other.cycle;
    }
};

/**
 * @brief Change notification published after every registry mutation.
 */
struct RegistryEvent {
    enum class Type {
        Added,          ///< A record was created
        StatusChanged,  ///< The record moved to another status
        Updated         ///< Same status, other fields changed (attempt start)
    };

    Type type;
    DeviceRecord record;  ///< State after the mutation
    std::optional<DeviceStatus> previous;
    MutationReason reason;
    uint64_t version{0};  ///< Registry version after the mutation
};

/**
 * @brief Point-in-time copy of the whole registry.
 *
 * Records are ordered by creation sequence. The copy is taken under a
 * single shared lock, so no record is observed half-written.
 */
struct RegistrySnapshot {
    std::vector<DeviceRecord> records;
    TimePoint taken_at{};
    uint64_t version{0};
};

/**
 * @brief What the pool should do after a failed attempt.
 */
enum class FailureOutcome {
    Retry,      ///< Budget left, re-queue after backoff
    Exhausted,  ///< Recorded as Failed
    Stale       ///< Ticket superseded, result discarded
};

/**
 * @brief Registry of device records and sole writer of their state.
 *
 * Thread safety: every public method may be called concurrently. All fields
 * of a record change together under one exclusive lock. Listeners are
 * called in mutation order with no registry lock held, so they may query
 * the registry. Events raised by a listener are delivered after the
 * current batch.
 */
class DeviceRegistry {
public:
    using Listener = std::function<void(const RegistryEvent&)>;
    using Token = std::size_t;

    DeviceRegistry() = default;
    ~DeviceRegistry() = default;

    DeviceRegistry(const DeviceRegistry&) = delete;
    DeviceRegistry& operator=(const DeviceRegistry&) = delete;

    /**
     * @brief Ports whose status is Pending, Reading, Success or Failed.
     */
    [[nodiscard]] auto activePorts() const -> PortSet;

    /**
     * @brief Active ports left in Pending without a job.
     */
    [[nodiscard]] auto pendingPorts() const -> PortSet;

    /**
     * @brief Start an identification cycle for a port.
     *
     * Creates the record on first sight, reopens a Removed record, and moves
     * the record to Reading in the same critical section.
     *
     * @return The ticket for the new cycle, or std::nullopt if the record is
     * already Reading, Success or Failed.
     */
    [[nodiscard]] auto dispatch(const PortId& port)
        -> std::optional<DispatchTicket>;

    /**
     * @brief Mark a port as physically removed.
     *
     * Always wins over worker results of the current cycle.
     *
     * @return true if the record changed, false if unknown or already Removed
     */
    auto markRemoved(const PortId& port) -> bool;

    /**
     * @brief Move every Reading record back to Pending.
     *
     * Used when the engine stops so that a restart dispatches them again.
     *
     * @return Ports that were interrupted
     */
    auto interruptInFlight() -> std::vector<PortId>;

    /**
     * @brief Undo a dispatch whose job could not be queued.
     *
     * The record goes back to Pending in a new cycle, so the next tick
     * dispatches it again.
     *
     * @return false if the ticket is stale or an attempt already began
     */
    auto abandonDispatch(const DispatchTicket& ticket) -> bool;

    /**
     * @brief Explicitly reset a Success or Failed record to Pending.
     */
    auto resetRecord(const PortId& port) -> bool;

    /**
     * @brief Reset every Failed record of an attached port.
     *
     * @return Number of records reset
     */
    auto resetFailed() -> std::size_t;

    /**
     * @brief Count one identification attempt for the ticket's cycle.
     *
     * @return The new attempt count, or std::nullopt if the ticket is stale
     */
    [[nodiscard]] auto beginAttempt(const DispatchTicket& ticket)
        -> std::optional<uint32_t>;

    /**
     * @brief Record a confirmed MAC.
     *
     * @return false if the ticket is stale and the result was discarded
     */
    auto completeSuccess(const DispatchTicket& ticket, const std::string& mac)
        -> bool;

    /**
     * @brief Record a failed attempt.
     *
     * The record becomes Failed once attempt_count reaches max_attempts.
     */
    auto recordFailure(const DispatchTicket& ticket, const std::string& error,
                       uint32_t max_attempts) -> FailureOutcome;

    [[nodiscard]] auto isCurrent(const DispatchTicket& ticket) const -> bool;

    [[nodiscard]] auto get(const PortId& port) const
        -> std::optional<DeviceRecord>;

    [[nodiscard]] auto snapshot() const -> RegistrySnapshot;

    [[nodiscard]] auto size() const -> std::size_t;

    [[nodiscard]] auto version() const -> uint64_t;

    /**
     * @brief Number of worker results dropped because their cycle ended.
     */
    [[nodiscard]] auto discardedResults() const noexcept -> uint64_t;

    /**
     * @brief Register a change listener.
     *
     * @return Token to pass to unsubscribe()
     */
    auto subscribe(Listener listener) -> Token;

    void unsubscribe(Token token);

private:
    using EventList = std::vector<RegistryEvent>;

    template <typename Fn>
    auto mutate(Fn&& fn);

    void transition(DeviceRecord& record, DeviceStatus to,
                    MutationReason reason, EventList& events);
    void emit(RegistryEvent::Type type, const DeviceRecord& record,
              std::optional<DeviceStatus> previous, MutationReason reason,
              EventList& events);
    void publish(EventList& events);
    void drainEvents();
    void deliver(const EventList& events);

    [[nodiscard]] auto findCurrent(const DispatchTicket& ticket)
        -> DeviceRecord*;

    mutable std::shared_mutex mutex_;
    std::unordered_map<PortId, DeviceRecord> records_;
    uint64_t next_sequence_{1};
    uint64_t version_{0};

    // Events are queued under the record lock and drained by one thread at
    // a time, which keeps delivery in mutation order.
    std::mutex events_mutex_;
    std::deque<RegistryEvent> pending_events_;
    bool delivering_{false};

    std::mutex listeners_mutex_;
    std::map<Token, Listener> listeners_;
    Token next_token_{1};

    std::atomic<uint64_t> discarded_results_{0};
};

}  // namespace macscout::device

#endif  // MACSCOUT_DEVICE_REGISTRY_HPP
