/**
 * @file IProber.hpp
 * @brief Interface for single-host reachability probes.
 *
 * This file defines the abstract probing primitive the probe round
 * coordinator fans out over the host list.
 */

#pragma once

#include "core/types/StatusRecord.hpp"

#include <string>

namespace mping::core {

/**
 * @brief Interface for reachability probes.
 *
 * Implementations must bound their own execution time and must not throw:
 * every failure is reported as an unreachable outcome.
 */
class IProber {
public:
    virtual ~IProber() = default;

    /**
     * @brief Checks whether a host answers and how fast.
     * @param address IP address or hostname to probe.
     * @return The outcome; unreachable on timeout, process error or unparsable output.
     */
    virtual ProbeOutcome probe(const std::string& address) = 0;

    /**
     * @brief Aborts in-flight probes and makes further probes fail immediately.
     */
    virtual void cancel() = 0;
};

} // namespace mping::core
