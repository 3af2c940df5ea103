#pragma once

#include "app/EventLoop.hpp"
#include "infrastructure/config/ConfigManager.hpp"
#include "infrastructure/network/PingProber.hpp"
#include "infrastructure/network/ProbeRoundCoordinator.hpp"
#include "infrastructure/network/SystemResolver.hpp"
#include "infrastructure/notifications/TerminalBellAlert.hpp"
#include "infrastructure/storage/HostFileStore.hpp"
#include "ui/TerminalRenderer.hpp"
#include "viewmodels/DashboardViewModel.hpp"

#include <asio.hpp>
#include <memory>

namespace mping::app {

/**
 * @brief Owns every component of the program and runs the interaction loop.
 *
 * All dashboard events are applied on the thread that calls run(). Probe
 * rounds execute on the coordinator's threads.
 */
class Application {
public:
    explicit Application(infra::AppConfig config);
    ~Application();

    Application(const Application&) = delete;
    Application& operator=(const Application&) = delete;

    /**
     * @brief Takes over the terminal and runs until the user quits or a signal arrives.
     * @return Process exit code.
     */
    int run();

    const infra::AppConfig& config() const { return config_; }

private:
    void initializeLogging();
    void initializeComponents();

    void watchInput();
    void drainInput();
    void watchSignals();
    void scheduleRepaint();
    void handleResize();

    void dispatch(const viewmodels::DashboardEvent& event);
    void render();
    void stop();
    void shutdown();

    infra::AppConfig config_;
    asio::io_context io_;

    std::shared_ptr<infra::PingProber> prober_;
    std::unique_ptr<infra::ProbeRoundCoordinator> coordinator_;
    std::shared_ptr<infra::HostFileStore> hostStore_;
    std::shared_ptr<infra::TerminalBellAlert> alertSink_;
    std::shared_ptr<infra::SystemResolver> resolver_;
    std::shared_ptr<EventLoop> eventLoop_;
    std::unique_ptr<viewmodels::DashboardViewModel> dashboard_;
    std::unique_ptr<ui::TerminalRenderer> renderer_;

    asio::posix::stream_descriptor input_;
    asio::signal_set signals_;
    asio::steady_timer repaintTimer_;
    bool stopped_{false};
};

} // namespace mping::app
