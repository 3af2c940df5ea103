/**
 * @file OrderingEngine.hpp
 * @brief Stable ordering of the host table by the active sort key.
 */

#pragma once

#include "core/services/IAddressResolver.hpp"
#include "core/types/Host.hpp"
#include "core/types/SortKey.hpp"
#include "core/types/StatusRecord.hpp"

#include <cstddef>
#include <memory>
#include <vector>

namespace mping::core {

/**
 * @brief Computes the display order of hosts.
 *
 * The result is a permutation: element i is the index of the host that
 * should appear at row i. Sorting is stable, so rows that compare equal on
 * every rule keep their relative order. All keys except Name fall back to
 * the Name rule on ties; the Name rule itself falls back to the description.
 */
class OrderingEngine {
public:
    /**
     * @brief Constructs an engine.
     * @param resolver Resolver used by SortKey::Address; may be null, in which
     *        case raw addresses are compared. Only cached answers are used,
     *        unresolved hosts sort by their raw address.
     */
    explicit OrderingEngine(std::shared_ptr<IAddressResolver> resolver = nullptr);

    /**
     * @brief Computes the order for the given rows.
     * @param hosts Hosts in current row order.
     * @param statuses Status records aligned with hosts.
     * @param key Active sort key.
     * @param now Reference time for age comparisons.
     * @return Permutation of [0, hosts.size()).
     * @throws std::invalid_argument if hosts and statuses differ in length.
     */
    [[nodiscard]] std::vector<std::size_t> order(const std::vector<Host>& hosts,
                                                 const std::vector<StatusRecord>& statuses,
                                                 SortKey key, TimePoint now) const;

private:
    std::vector<std::string> addressKeys(const std::vector<Host>& hosts) const;

    std::shared_ptr<IAddressResolver> resolver_;
};

} // namespace mping::core
