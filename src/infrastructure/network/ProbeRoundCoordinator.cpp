#include "infrastructure/network/ProbeRoundCoordinator.hpp"

#include <spdlog/spdlog.h>

#include <future>
#include <stdexcept>

namespace mping::infra {

ProbeRoundCoordinator::ProbeRoundCoordinator(std::shared_ptr<core::IProber> prober,
                                             size_t workerCount)
    : prober_(std::move(prober)), dispatch_(1, "round-dispatch"), workers_(workerCount, "probe") {
    if (!prober_) {
        throw std::invalid_argument("ProbeRoundCoordinator requires a prober");
    }
}

ProbeRoundCoordinator::~ProbeRoundCoordinator() {
    shutdown();
}

void ProbeRoundCoordinator::start() {
    std::lock_guard lock(mutex_);
    if (shutDown_) {
        return;
    }
    workers_.start();
    dispatch_.start();
}

std::vector<core::ProbeOutcome>
ProbeRoundCoordinator::runRound(const std::vector<core::Host>& hosts) {
    std::vector<std::future<core::ProbeOutcome>> futures;
    futures.reserve(hosts.size());

    for (const auto& host : hosts) {
        auto promise = std::make_shared<std::promise<core::ProbeOutcome>>();
        futures.push_back(promise->get_future());

        bool queued = workers_.post([prober = prober_, address = host.address, promise]() {
            try {
                promise->set_value(prober->probe(address));
            } catch (const std::exception& e) {
                spdlog::debug("Probe of {} threw: {}", address, e.what());
                promise->set_value(core::ProbeOutcome::unreachable());
            }
        });
        if (!queued) {
            promise->set_value(core::ProbeOutcome::unreachable());
        }
    }

    std::vector<core::ProbeOutcome> outcomes;
    outcomes.reserve(futures.size());
    for (auto& future : futures) {
        try {
            outcomes.push_back(future.get());
        } catch (const std::future_error& e) {
            // The pool was stopped before the task ran.
            spdlog::debug("Probe task abandoned: {}", e.what());
            outcomes.push_back(core::ProbeOutcome::unreachable());
        }
    }

    spdlog::debug("Probe round of {} hosts complete", outcomes.size());
    return outcomes;
}

void ProbeRoundCoordinator::runRoundAsync(std::vector<core::Host> hosts, RoundCallback callback) {
    {
        std::lock_guard lock(mutex_);
        if (shutDown_) {
            return;
        }
    }

    auto task = [this, hosts = std::move(hosts), callback = std::move(callback)]() {
        auto outcomes = runRound(hosts);
        if (callback) {
            callback(std::move(outcomes));
        }
    };
    if (!dispatch_.post(std::move(task))) {
        spdlog::debug("Round dispatch is not running, dropping probe round");
    }
}

void ProbeRoundCoordinator::shutdown() {
    {
        std::lock_guard lock(mutex_);
        if (shutDown_) {
            return;
        }
        shutDown_ = true;
    }

    prober_->cancel();
    dispatch_.stop();
    workers_.stop();
    spdlog::info("Probe round coordinator shut down");
}

} // namespace mping::infra
