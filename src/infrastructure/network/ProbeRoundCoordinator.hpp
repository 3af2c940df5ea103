#pragma once

#include "core/services/IProber.hpp"
#include "core/types/Host.hpp"
#include "infrastructure/network/WorkerPool.hpp"

#include <functional>
#include <memory>
#include <mutex>
#include <vector>

namespace mping::infra {

/**
 * @brief Runs one probe per host concurrently and joins the results.
 *
 * Probes run on a worker pool. A round returns only after every probe has
 * finished, and the outcomes are in the order of the input hosts regardless
 * of completion order. runRoundAsync() moves the whole round onto a dedicated
 * dispatch thread so the caller never waits on the join.
 */
class ProbeRoundCoordinator {
public:
    using RoundCallback = std::function<void(std::vector<core::ProbeOutcome>)>;

    /**
     * @brief Constructs a ProbeRoundCoordinator.
     * @param prober Probe used for every host.
     * @param workerCount Number of probe worker threads.
     */
    ProbeRoundCoordinator(std::shared_ptr<core::IProber> prober, size_t workerCount);

    /**
     * @brief Destructor. Calls shutdown().
     */
    ~ProbeRoundCoordinator();

    ProbeRoundCoordinator(const ProbeRoundCoordinator&) = delete;
    ProbeRoundCoordinator& operator=(const ProbeRoundCoordinator&) = delete;

    /**
     * @brief Starts the worker pool and the dispatch thread.
     */
    void start();

    /**
     * @brief Probes all hosts and blocks until every probe has finished.
     * @param hosts Hosts in table order.
     * @return One outcome per host, index-aligned with hosts.
     */
    std::vector<core::ProbeOutcome> runRound(const std::vector<core::Host>& hosts);

    /**
     * @brief Runs a round on the dispatch thread.
     *
     * The callback is invoked on the dispatch thread; marshalling the
     * outcomes back to the caller's thread is up to the callback. Rounds
     * requested after shutdown() are dropped.
     */
    void runRoundAsync(std::vector<core::Host> hosts, RoundCallback callback);

    /**
     * @brief Cancels the prober, then stops the dispatch thread and the pool.
     *
     * Returns without waiting for the probe deadline.
     */
    void shutdown();

private:
    std::shared_ptr<core::IProber> prober_;
    WorkerPool dispatch_;
    WorkerPool workers_;
    std::mutex mutex_;
    bool shutDown_{false};
};

} // namespace mping::infra
