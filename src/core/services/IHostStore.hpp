/**
 * @file IHostStore.hpp
 * @brief Interface for host list persistence.
 */

#pragma once

#include "core/types/Host.hpp"

#include <vector>

namespace mping::core {

/**
 * @brief Loads and saves the host list as a whole.
 *
 * Both operations are all-or-nothing and throw std::runtime_error on I/O
 * failure. Callers surface failures to the user; they are never fatal.
 */
class IHostStore {
public:
    virtual ~IHostStore() = default;

    /**
     * @brief Reads the stored host list.
     * @return Hosts sorted case-insensitively by address; empty if nothing is stored yet.
     */
    virtual std::vector<Host> load() = 0;

    /**
     * @brief Replaces the stored host list.
     * @param hosts Hosts in display order.
     */
    virtual void save(const std::vector<Host>& hosts) = 0;
};

} // namespace mping::core
