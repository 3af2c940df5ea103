/**
 * @file IEngineScheduler.hpp
 * @brief Interface the dashboard state machine uses to schedule asynchronous work.
 *
 * The state machine never blocks. Every timer and probe round it needs is
 * requested through this interface and comes back later as an event.
 */

#pragma once

#include "core/types/Host.hpp"

#include <chrono>
#include <cstdint>
#include <string>
#include <vector>

namespace mping::core {

class IEngineScheduler {
public:
    virtual ~IEngineScheduler() = default;

    /**
     * @brief Requests a tick event after the given delay.
     * @param delay Time until the tick is delivered.
     */
    virtual void armTick(std::chrono::milliseconds delay) = 0;

    /**
     * @brief Requests a probe round over the given hosts.
     *
     * The resulting batch must be delivered back tagged with the same version.
     *
     * @param hosts Hosts in table order.
     * @param version Table version the round was started against.
     */
    virtual void armRound(std::vector<Host> hosts, uint64_t version) = 0;

    /**
     * @brief Requests name lookups for the given addresses.
     *
     * Answers land in the resolver cache and an AddressesResolvedEvent is
     * delivered once they are all in.
     */
    virtual void armResolve(std::vector<std::string> addresses) = 0;
};

} // namespace mping::core
