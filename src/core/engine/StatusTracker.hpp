/**
 * @file StatusTracker.hpp
 * @brief Reconciliation of probe batches into per-host status history.
 */

#pragma once

#include "core/types/StatusRecord.hpp"

#include <chrono>
#include <cstddef>
#include <optional>
#include <vector>

namespace mping::core {

/**
 * @brief Output of a successful reconciliation.
 */
struct ReconcileResult {
    std::vector<StatusRecord> records;    ///< New status sequence, aligned with the input
    std::vector<std::size_t> transitions; ///< Rows whose reachability flipped in this batch
};

/**
 * @brief Folds probe outcomes into the previous status records.
 *
 * Rules applied per row:
 * - the first observation sets lastChangeAt to now without flashing;
 * - a reachability flip sets lastChangeAt to now and opens a flash window;
 * - otherwise lastChangeAt is carried over and a flash window is kept only while it is active;
 * - latency is kept only for reachable outcomes.
 */
class StatusTracker {
public:
    explicit StatusTracker(std::chrono::milliseconds flashDuration = kFlashDuration);

    /**
     * @brief Reconciles a batch against the previous records.
     * @param previous Records the batch should be applied to.
     * @param batch Outcomes in the same row order as previous.
     * @param now Time the batch is applied.
     * @return The new records and transitioned rows, or std::nullopt if the
     *         batch length does not match and the batch was discarded.
     */
    [[nodiscard]] std::optional<ReconcileResult>
    reconcile(const std::vector<StatusRecord>& previous, const std::vector<ProbeOutcome>& batch,
              TimePoint now) const;

    [[nodiscard]] std::chrono::milliseconds flashDuration() const { return flashDuration_; }

private:
    StatusRecord reconcileOne(const StatusRecord& previous, const ProbeOutcome& outcome,
                              TimePoint now, bool& transitioned) const;

    std::chrono::milliseconds flashDuration_;
};

} // namespace mping::core
