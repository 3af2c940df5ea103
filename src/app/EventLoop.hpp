#pragma once

#include "core/services/IEngineScheduler.hpp"
#include "infrastructure/network/ProbeRoundCoordinator.hpp"
#include "infrastructure/network/SystemResolver.hpp"
#include "viewmodels/DashboardState.hpp"

#include <asio.hpp>
#include <functional>
#include <memory>

namespace mping::app {

/**
 * @brief Scheduler that turns tick and round requests into dashboard events.
 *
 * Ticks are driven by a single steady_timer, so re-arming replaces the
 * pending tick. Rounds run on the coordinator and their outcomes are posted
 * back to the io_context as ProbeBatchEvents. Name lookups go to the resolver
 * and finish with an AddressesResolvedEvent. Every event is delivered to the
 * handler on the thread running the io_context.
 */
class EventLoop : public core::IEngineScheduler {
public:
    using EventHandler = std::function<void(const viewmodels::DashboardEvent&)>;

    EventLoop(asio::io_context& io, infra::ProbeRoundCoordinator& coordinator,
              std::shared_ptr<infra::SystemResolver> resolver = nullptr);

    /**
     * @brief Sets the receiver of all events produced by this loop.
     */
    void setHandler(EventHandler handler) { handler_ = std::move(handler); }

    void armTick(std::chrono::milliseconds delay) override;
    void armRound(std::vector<core::Host> hosts, uint64_t version) override;
    void armResolve(std::vector<std::string> addresses) override;

    /**
     * @brief Cancels the pending tick and any name lookups.
     */
    void cancel();

private:
    void deliver(const viewmodels::DashboardEvent& event);

    asio::io_context& io_;
    infra::ProbeRoundCoordinator& coordinator_;
    std::shared_ptr<infra::SystemResolver> resolver_;
    asio::steady_timer tickTimer_;
    EventHandler handler_;
};

} // namespace mping::app
