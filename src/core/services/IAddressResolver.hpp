/**
 * @file IAddressResolver.hpp
 * @brief Interface for hostname resolution used by the address sort key.
 *
 * Lookups themselves are started through IEngineScheduler::armResolve. This
 * interface only answers from what is already known, so sorting never waits
 * on the network.
 */

#pragma once

#include <optional>
#include <string>

namespace mping::core {

class IAddressResolver {
public:
    virtual ~IAddressResolver() = default;

    /**
     * @brief Returns the known network address of a hostname without blocking.
     * @param address Hostname or literal address.
     * @return Textual network address, or std::nullopt if it is not known (yet).
     */
    virtual std::optional<std::string> cached(const std::string& address) const = 0;

    /**
     * @brief Tells whether a lookup for the address should be started.
     *
     * False while a lookup is in flight, after it succeeded, and until a
     * recent failure has expired.
     */
    virtual bool needsLookup(const std::string& address) const = 0;
};

} // namespace mping::core
