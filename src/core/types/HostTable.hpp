/**
 * @file HostTable.hpp
 * @brief Index-aligned host and status sequences.
 *
 * The table keeps one StatusRecord per Host at the same position. Every
 * operation that changes row identity or row order touches both sequences in
 * a single step and advances the table version, so probe rounds started
 * against an older layout can be recognised and dropped.
 */

#pragma once

#include "core/types/Host.hpp"
#include "core/types/StatusRecord.hpp"

#include <cstddef>
#include <cstdint>
#include <vector>

namespace mping::core {

class HostTable {
public:
    HostTable() = default;

    /**
     * @brief Builds a table whose statuses are all unobserved.
     */
    explicit HostTable(std::vector<Host> hosts);

    [[nodiscard]] std::size_t size() const { return hosts_.size(); }
    [[nodiscard]] bool empty() const { return hosts_.empty(); }

    [[nodiscard]] const std::vector<Host>& hosts() const { return hosts_; }
    [[nodiscard]] const std::vector<StatusRecord>& statuses() const { return statuses_; }

    [[nodiscard]] const Host& host(std::size_t index) const { return hosts_.at(index); }
    [[nodiscard]] const StatusRecord& status(std::size_t index) const {
        return statuses_.at(index);
    }

    /**
     * @brief Layout version, advanced by every structural edit and reordering.
     */
    [[nodiscard]] uint64_t version() const { return version_; }

    /**
     * @brief Replaces all rows; statuses start unobserved.
     */
    void reset(std::vector<Host> hosts);

    /**
     * @brief Appends a row with an unobserved status.
     * @return Index of the new row.
     */
    std::size_t append(Host host);

    /**
     * @brief Overwrites the host at index and clears its status.
     * @throws std::out_of_range if index is not a valid row.
     */
    void replace(std::size_t index, Host host);

    /**
     * @brief Removes the host and its status at index.
     * @throws std::out_of_range if index is not a valid row.
     */
    void remove(std::size_t index);

    /**
     * @brief Reorders both sequences so that new row i is old row order[i].
     * @throws std::invalid_argument if order is not a permutation of the rows.
     */
    void applyOrder(const std::vector<std::size_t>& order);

    /**
     * @brief Replaces the status sequence without changing the layout.
     * @return False, leaving the table untouched, if the length does not match.
     */
    bool updateStatuses(std::vector<StatusRecord> statuses);

private:
    std::vector<Host> hosts_;
    std::vector<StatusRecord> statuses_;
    uint64_t version_{0};
};

} // namespace mping::core
