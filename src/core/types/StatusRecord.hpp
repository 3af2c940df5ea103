/**
 * @file StatusRecord.hpp
 * @brief Probe outcome and per-host status types.
 *
 * This file defines the result of a single reachability probe and the
 * status record the dashboard keeps for every host in the list.
 */

#pragma once

#include <chrono>
#include <optional>

namespace mping::core {

using Clock = std::chrono::system_clock;
using TimePoint = Clock::time_point;

/**
 * @brief Duration a row stays highlighted after a reachability transition.
 */
inline constexpr std::chrono::milliseconds kFlashDuration{2000};

/**
 * @brief Result of a single reachability probe.
 */
struct ProbeOutcome {
    bool reachable{false};           ///< Whether the host answered before the deadline
    std::optional<double> latencyMs; ///< Round-trip time, absent when it could not be parsed

    /**
     * @brief Creates an unreachable outcome.
     */
    static ProbeOutcome unreachable() { return ProbeOutcome{}; }

    bool operator==(const ProbeOutcome& other) const = default;
};

/**
 * @brief Current status of a monitored host.
 *
 * One record exists per host, index-aligned with the host list. A record
 * that has never been reconciled has no lastChangeAt.
 */
struct StatusRecord {
    bool reachable{false};                 ///< Reachability from the latest observation
    std::optional<double> latencyMs;       ///< Present only when reachable and parsed
    std::optional<TimePoint> lastChangeAt; ///< First observation or latest transition
    std::optional<TimePoint> flashUntil;   ///< End of the highlight window after a transition

    /**
     * @brief Checks whether the host has been probed at least once.
     */
    [[nodiscard]] bool observed() const { return lastChangeAt.has_value(); }

    /**
     * @brief Checks whether the row is inside its highlight window.
     * @param now Current time.
     * @return True if a flash window is set and has not lapsed yet.
     */
    [[nodiscard]] bool isFlashing(TimePoint now) const {
        return flashUntil.has_value() && now < *flashUntil;
    }

    /**
     * @brief Time elapsed since the last status change.
     * @param now Current time.
     * @return Elapsed time, zero for hosts that were never observed.
     */
    [[nodiscard]] std::chrono::milliseconds age(TimePoint now) const {
        if (!lastChangeAt) {
            return std::chrono::milliseconds{0};
        }
        return std::chrono::duration_cast<std::chrono::milliseconds>(now - *lastChangeAt);
    }

    bool operator==(const StatusRecord& other) const = default;
};

} // namespace mping::core
