#include "app/Application.hpp"

#include "ui/KeyDecoder.hpp"

#include <curses.h>
#include <spdlog/sinks/rotating_file_sink.h>
#include <spdlog/spdlog.h>

#include <csignal>
#include <stdexcept>
#include <sys/ioctl.h>
#include <unistd.h>

namespace mping::app {

namespace {

constexpr std::chrono::seconds kRepaintInterval{1};

} // namespace

Application::Application(infra::AppConfig config)
    : config_(std::move(config)), input_(io_), signals_(io_, SIGINT, SIGTERM, SIGWINCH),
      repaintTimer_(io_) {
    initializeLogging();
    initializeComponents();
}

Application::~Application() {
    spdlog::info("Application shutting down...");
    shutdown();
}

void Application::initializeLogging() {
    auto fileSink = std::make_shared<spdlog::sinks::rotating_file_sink_mt>(
        config_.logFile.string(), 5 * 1024 * 1024, 3);
    fileSink->set_level(config_.logLevel);

    auto logger = std::make_shared<spdlog::logger>("mping", fileSink);
    logger->set_level(config_.logLevel);
    logger->flush_on(spdlog::level::warn);
    spdlog::set_default_logger(logger);

    spdlog::info("mping starting...");
    spdlog::info("Log file: {}", config_.logFile.string());
}

void Application::initializeComponents() {
    prober_ = std::make_shared<infra::PingProber>(config_.probeTimeout);
    coordinator_ =
        std::make_unique<infra::ProbeRoundCoordinator>(prober_, config_.workerCount);

    hostStore_ = std::make_shared<infra::HostFileStore>(config_.hostsFile);
    alertSink_ = std::make_shared<infra::TerminalBellAlert>();
    resolver_ = std::make_shared<infra::SystemResolver>(io_);

    eventLoop_ = std::make_shared<EventLoop>(io_, *coordinator_, resolver_);
    eventLoop_->setHandler([this](const viewmodels::DashboardEvent& event) { dispatch(event); });

    viewmodels::DashboardSettings settings;
    settings.interval = config_.interval;
    settings.sortKey = config_.sortKey;
    dashboard_ = std::make_unique<viewmodels::DashboardViewModel>(
        hostStore_, eventLoop_, alertSink_, resolver_, settings);

    renderer_ = std::make_unique<ui::TerminalRenderer>(config_.color);

    spdlog::info("Hosts file: {}, interval {} ms, sort by {}, timeout {} ms, {} workers",
                 config_.hostsFile.string(), config_.interval.count(),
                 core::sortKeyToString(config_.sortKey), config_.probeTimeout.count(),
                 config_.workerCount);
    spdlog::info("Application components initialized");
}

int Application::run() {
    renderer_->open();
    coordinator_->start();

    auto [width, height] = renderer_->size();
    dashboard_->apply(viewmodels::ResizeEvent{width, height});
    dashboard_->start();
    render();

    watchInput();
    watchSignals();
    scheduleRepaint();

    io_.run();

    shutdown();
    return 0;
}

void Application::watchInput() {
    if (!input_.is_open()) {
        int fd = dup(STDIN_FILENO);
        if (fd < 0) {
            throw std::runtime_error("Failed to watch standard input");
        }
        input_.assign(fd);
    }

    input_.async_wait(asio::posix::stream_descriptor::wait_read,
                      [this](const asio::error_code& ec) {
                          if (ec || stopped_) {
                              return;
                          }
                          drainInput();
                          if (!stopped_) {
                              watchInput();
                          }
                      });
}

void Application::drainInput() {
    int ch = ERR;
    while (!stopped_ && (ch = renderer_->readKey()) != ERR) {
        if (ch == KEY_RESIZE) {
            handleResize();
            continue;
        }
        if (auto key = ui::decodeKey(ch)) {
            dispatch(*key);
        }
    }
}

void Application::watchSignals() {
    signals_.async_wait([this](const asio::error_code& ec, int signal) {
        if (ec || stopped_) {
            return;
        }
        if (signal == SIGWINCH) {
            handleResize();
            watchSignals();
            return;
        }
        spdlog::info("Received signal {}, exiting", signal);
        stop();
    });
}

void Application::scheduleRepaint() {
    repaintTimer_.expires_after(kRepaintInterval);
    repaintTimer_.async_wait([this](const asio::error_code& ec) {
        if (ec || stopped_) {
            return;
        }
        render();
        scheduleRepaint();
    });
}

void Application::handleResize() {
    struct winsize ws {};
    if (ioctl(STDOUT_FILENO, TIOCGWINSZ, &ws) == 0 && ws.ws_col > 0 && ws.ws_row > 0) {
        renderer_->resize(ws.ws_col, ws.ws_row);
    }
    auto [width, height] = renderer_->size();
    dispatch(viewmodels::ResizeEvent{width, height});
}

void Application::dispatch(const viewmodels::DashboardEvent& event) {
    if (stopped_) {
        return;
    }
    dashboard_->apply(event);
    if (dashboard_->quitRequested()) {
        stop();
        return;
    }
    render();
}

void Application::render() {
    renderer_->render(dashboard_->table(), dashboard_->ui(), core::Clock::now());
}

void Application::stop() {
    if (stopped_) {
        return;
    }
    stopped_ = true;
    io_.stop();
}

void Application::shutdown() {
    stopped_ = true;
    if (eventLoop_) {
        eventLoop_->cancel();
    }
    if (coordinator_) {
        coordinator_->shutdown();
    }
    if (renderer_) {
        renderer_->close();
    }
    spdlog::default_logger()->flush();
}

} // namespace mping::app
