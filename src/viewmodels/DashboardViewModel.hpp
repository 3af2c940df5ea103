/**
 * @file DashboardViewModel.hpp
 * @brief State machine behind the monitoring dashboard.
 *
 * This file defines the DashboardViewModel class which owns the host table,
 * the UI state and the sort preference, and applies every external event
 * (timer ticks, probe batches, key presses, resizes, finished name lookups)
 * one at a time.
 */

#pragma once

#include "core/engine/OrderingEngine.hpp"
#include "core/engine/StatusTracker.hpp"
#include "core/services/IAddressResolver.hpp"
#include "core/services/IAlertSink.hpp"
#include "core/services/IEngineScheduler.hpp"
#include "core/services/IHostStore.hpp"
#include "core/types/HostTable.hpp"
#include "viewmodels/DashboardState.hpp"

#include <functional>
#include <memory>
#include <optional>

namespace mping::viewmodels {

/**
 * @brief Initial settings of the dashboard.
 */
struct DashboardSettings {
    std::chrono::milliseconds interval{kDefaultInterval};
    core::SortKey sortKey{core::SortKey::Name};
    std::chrono::milliseconds flashDuration{core::kFlashDuration};
};

/**
 * @brief Interaction state machine of the dashboard.
 *
 * The view model is the only writer of the host table and the UI state. It
 * must be driven from a single thread: apply() handles exactly one event,
 * never blocks, and requests further work (ticks, probe rounds) through the
 * scheduler. Probe batches carry the table version they were started against
 * and are dropped when the table has changed since.
 */
class DashboardViewModel {
public:
    using ClockFunction = std::function<core::TimePoint()>;

    /**
     * @brief Constructs a DashboardViewModel.
     * @param store Persistence collaborator for load, save and reload.
     * @param scheduler Receives tick and probe round requests.
     * @param alertSink Optional receiver of transition alerts.
     * @param resolver Optional resolver for the address sort key.
     * @param settings Initial interval and sort preference.
     * @param clock Time source, replaceable in tests.
     */
    DashboardViewModel(std::shared_ptr<core::IHostStore> store,
                       std::shared_ptr<core::IEngineScheduler> scheduler,
                       std::shared_ptr<core::IAlertSink> alertSink = nullptr,
                       std::shared_ptr<core::IAddressResolver> resolver = nullptr,
                       DashboardSettings settings = {}, ClockFunction clock = core::Clock::now);

    /**
     * @brief Loads the host list, sorts it and arms the first probe round and tick.
     *
     * A load failure leaves the table empty and shows a message.
     */
    void start();

    /**
     * @brief Applies a single event to the model.
     * @param event The event to apply.
     */
    void apply(const DashboardEvent& event);

    const core::HostTable& table() const { return table_; }
    const UiState& ui() const { return ui_; }
    bool quitRequested() const { return ui_.quitRequested; }

private:
    void onTick();
    void onProbeBatch(const ProbeBatchEvent& event);
    void onKey(const KeyEvent& key);
    void onResize(const ResizeEvent& event);
    void onAddressesResolved();

    void handleListKey(const KeyEvent& key);
    void handleHostFormKey(const KeyEvent& key);
    void handleConfirmDeleteKey(const KeyEvent& key);
    void handleOptionsKey(const KeyEvent& key);

    void moveCursor(int delta);
    void beginAdd();
    void beginEdit();
    void beginDelete();
    void openOptions();
    void saveHosts();
    void reloadHosts();
    void submitHostForm();
    void confirmDelete();
    void submitOptions();

    /**
     * @brief Reorders the table by the current sort key.
     *
     * The cursor and any row held by an open dialog follow their host.
     */
    void resort();

    /**
     * @brief Asks the scheduler to look up addresses the address sort key lacks.
     */
    void requestResolution();

    void armRound();
    void setMessage(std::string message);

    std::shared_ptr<core::IHostStore> store_;
    std::shared_ptr<core::IEngineScheduler> scheduler_;
    std::shared_ptr<core::IAlertSink> alertSink_;
    std::shared_ptr<core::IAddressResolver> resolver_;
    core::StatusTracker tracker_;
    core::OrderingEngine ordering_;
    ClockFunction clock_;

    core::HostTable table_;
    UiState ui_;
    std::optional<uint64_t> roundInFlight_;
};

/**
 * @brief Parses an interval typed in seconds, accepting ',' as decimal separator.
 * @return Seconds, or std::nullopt if the text is not a finite number.
 */
std::optional<double> parseIntervalSeconds(const std::string& text);

/**
 * @brief Formats an interval as seconds with one decimal, e.g. "2.5".
 */
std::string formatIntervalSeconds(std::chrono::milliseconds interval);

} // namespace mping::viewmodels
