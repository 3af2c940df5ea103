#include "core/engine/StatusTracker.hpp"

#include <spdlog/spdlog.h>

namespace mping::core {

StatusTracker::StatusTracker(std::chrono::milliseconds flashDuration)
    : flashDuration_(flashDuration) {}

std::optional<ReconcileResult> StatusTracker::reconcile(const std::vector<StatusRecord>& previous,
                                                        const std::vector<ProbeOutcome>& batch,
                                                        TimePoint now) const {
    if (batch.size() != previous.size()) {
        spdlog::debug("Discarding probe batch of {} results for {} hosts", batch.size(),
                      previous.size());
        return std::nullopt;
    }

    ReconcileResult result;
    result.records.reserve(batch.size());

    for (std::size_t i = 0; i < batch.size(); ++i) {
        bool transitioned = false;
        result.records.push_back(reconcileOne(previous[i], batch[i], now, transitioned));
        if (transitioned) {
            result.transitions.push_back(i);
        }
    }

    return result;
}

StatusRecord StatusTracker::reconcileOne(const StatusRecord& previous, const ProbeOutcome& outcome,
                                         TimePoint now, bool& transitioned) const {
    StatusRecord record;
    record.reachable = outcome.reachable;
    if (outcome.reachable) {
        record.latencyMs = outcome.latencyMs;
    }

    if (!previous.observed()) {
        record.lastChangeAt = now;
        transitioned = false;
        return record;
    }

    if (previous.reachable != outcome.reachable) {
        record.lastChangeAt = now;
        record.flashUntil = now + flashDuration_;
        transitioned = true;
        return record;
    }

    record.lastChangeAt = previous.lastChangeAt;
    if (previous.isFlashing(now)) {
        record.flashUntil = previous.flashUntil;
    }
    transitioned = false;
    return record;
}

} // namespace mping::core
