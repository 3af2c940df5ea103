#include "viewmodels/DashboardViewModel.hpp"

#include "core/types/Alert.hpp"

#include <algorithm>
#include <charconv>
#include <cmath>
#include <iomanip>
#include <sstream>
#include <spdlog/spdlog.h>
#include <stdexcept>
#include <type_traits>

namespace mping::viewmodels {

namespace {

bool isUpKey(const KeyEvent& key) {
    return key.code == KeyCode::Up ||
           (key.code == KeyCode::Character && (key.ch == 'k' || key.ch == 'K'));
}

bool isDownKey(const KeyEvent& key) {
    return key.code == KeyCode::Down ||
           (key.code == KeyCode::Character && (key.ch == 'j' || key.ch == 'J'));
}

bool isIdentity(const std::vector<std::size_t>& order) {
    for (std::size_t i = 0; i < order.size(); ++i) {
        if (order[i] != i) {
            return false;
        }
    }
    return true;
}

} // namespace

std::optional<double> parseIntervalSeconds(const std::string& text) {
    auto value = core::trim(text);
    std::replace(value.begin(), value.end(), ',', '.');
    if (value.empty()) {
        return std::nullopt;
    }

    double seconds = 0.0;
    const char* first = value.data();
    const char* last = value.data() + value.size();
    auto [ptr, ec] = std::from_chars(first, last, seconds);
    if (ec != std::errc{} || ptr != last || !std::isfinite(seconds)) {
        return std::nullopt;
    }
    return seconds;
}

std::string formatIntervalSeconds(std::chrono::milliseconds interval) {
    std::ostringstream oss;
    oss << std::fixed << std::setprecision(1) << static_cast<double>(interval.count()) / 1000.0;
    return oss.str();
}

DashboardViewModel::DashboardViewModel(std::shared_ptr<core::IHostStore> store,
                                       std::shared_ptr<core::IEngineScheduler> scheduler,
                                       std::shared_ptr<core::IAlertSink> alertSink,
                                       std::shared_ptr<core::IAddressResolver> resolver,
                                       DashboardSettings settings, ClockFunction clock)
    : store_(std::move(store)), scheduler_(std::move(scheduler)),
      alertSink_(std::move(alertSink)), resolver_(resolver), tracker_(settings.flashDuration),
      ordering_(std::move(resolver)), clock_(std::move(clock)) {
    if (!store_ || !scheduler_) {
        throw std::invalid_argument("DashboardViewModel requires a host store and a scheduler");
    }
    if (settings.interval < kMinInterval || settings.interval > kMaxInterval) {
        throw std::invalid_argument("Interval must be between 0.5 and 5 seconds");
    }
    ui_.interval = settings.interval;
    ui_.sortKey = settings.sortKey;
}

void DashboardViewModel::start() {
    std::vector<core::Host> hosts;
    try {
        hosts = store_->load();
    } catch (const std::exception& e) {
        spdlog::warn("Failed to load hosts: {}", e.what());
        setMessage(std::string("Failed to load hosts: ") + e.what());
    }

    table_.reset(std::move(hosts));
    resort();
    ui_.cursor = 0;

    spdlog::info("Dashboard started with {} hosts, interval {} ms, sort by {}", table_.size(),
                 ui_.interval.count(), core::sortKeyToString(ui_.sortKey));

    armRound();
    scheduler_->armTick(ui_.interval);
}

void DashboardViewModel::apply(const DashboardEvent& event) {
    std::visit(
        [this](const auto& e) {
            using T = std::decay_t<decltype(e)>;
            if constexpr (std::is_same_v<T, TickEvent>) {
                onTick();
            } else if constexpr (std::is_same_v<T, ProbeBatchEvent>) {
                onProbeBatch(e);
            } else if constexpr (std::is_same_v<T, KeyEvent>) {
                onKey(e);
            } else if constexpr (std::is_same_v<T, ResizeEvent>) {
                onResize(e);
            } else if constexpr (std::is_same_v<T, AddressesResolvedEvent>) {
                onAddressesResolved();
            }
        },
        event);
}

void DashboardViewModel::onTick() {
    if (roundInFlight_ && *roundInFlight_ == table_.version()) {
        spdlog::debug("Probe round for version {} still in flight, skipping tick",
                      table_.version());
    } else {
        armRound();
    }
    scheduler_->armTick(ui_.interval);
}

void DashboardViewModel::onProbeBatch(const ProbeBatchEvent& event) {
    if (roundInFlight_ && *roundInFlight_ == event.version) {
        roundInFlight_.reset();
    }

    if (event.version != table_.version()) {
        spdlog::debug("Discarding stale probe batch (version {}, table version {})",
                      event.version, table_.version());
        return;
    }

    auto result = tracker_.reconcile(table_.statuses(), event.outcomes, event.receivedAt);
    if (!result) {
        return;
    }

    if (!table_.updateStatuses(std::move(result->records))) {
        spdlog::debug("Discarding probe batch with mismatched size");
        return;
    }

    for (auto row : result->transitions) {
        auto alert = core::Alert::fromTransition(table_.host(row), table_.status(row));
        spdlog::info("{}", alert.message());
        if (alertSink_) {
            alertSink_->notify(alert);
        }
    }

    if (core::sortKeyDependsOnStatus(ui_.sortKey) && !table_.empty()) {
        resort();
    }
}

void DashboardViewModel::onKey(const KeyEvent& key) {
    switch (ui_.mode) {
    case Mode::List:
        handleListKey(key);
        break;
    case Mode::Add:
    case Mode::Edit:
        handleHostFormKey(key);
        break;
    case Mode::ConfirmDelete:
        handleConfirmDeleteKey(key);
        break;
    case Mode::Options:
        handleOptionsKey(key);
        break;
    }
}

void DashboardViewModel::onResize(const ResizeEvent& event) {
    ui_.width = event.width;
    ui_.height = event.height;
}

void DashboardViewModel::onAddressesResolved() {
    if (ui_.sortKey == core::SortKey::Address) {
        spdlog::debug("Addresses resolved, resorting");
        resort();
    }
}

void DashboardViewModel::handleListKey(const KeyEvent& key) {
    if (isUpKey(key)) {
        moveCursor(-1);
        return;
    }
    if (isDownKey(key)) {
        moveCursor(1);
        return;
    }
    if (key.code != KeyCode::Character) {
        return;
    }

    switch (key.ch) {
    case 'q':
    case 'Q':
        spdlog::info("Quit requested");
        ui_.quitRequested = true;
        break;
    case 'a':
    case 'A':
        beginAdd();
        break;
    case 'e':
    case 'E':
        beginEdit();
        break;
    case 'd':
    case 'D':
        beginDelete();
        break;
    case 's':
    case 'S':
        saveHosts();
        break;
    case 'r':
    case 'R':
        reloadHosts();
        break;
    case 'o':
    case 'O':
        openOptions();
        break;
    default:
        break;
    }
}

void DashboardViewModel::handleHostFormKey(const KeyEvent& key) {
    auto& form = ui_.hostForm;
    auto& buffer = form.focus == HostField::Address ? form.address : form.description;

    switch (key.code) {
    case KeyCode::Escape:
        ui_.mode = Mode::List;
        form = HostForm{};
        break;
    case KeyCode::Tab:
        form.focus =
            form.focus == HostField::Address ? HostField::Description : HostField::Address;
        break;
    case KeyCode::Enter:
        if (form.focus == HostField::Address) {
            form.focus = HostField::Description;
        } else {
            submitHostForm();
        }
        break;
    case KeyCode::Backspace:
        if (!buffer.empty()) {
            buffer.pop_back();
        }
        break;
    case KeyCode::Character:
        if (key.ch >= 0x20 && key.ch < 0x7f) {
            buffer.push_back(key.ch);
        }
        break;
    case KeyCode::Up:
    case KeyCode::Down:
        break;
    }
}

void DashboardViewModel::handleConfirmDeleteKey(const KeyEvent& key) {
    if (key.code == KeyCode::Escape ||
        (key.code == KeyCode::Character && (key.ch == 'n' || key.ch == 'N'))) {
        ui_.mode = Mode::List;
        ui_.confirmIndex.reset();
        return;
    }
    if (key.code == KeyCode::Character && (key.ch == 'y' || key.ch == 'Y')) {
        confirmDelete();
    }
}

void DashboardViewModel::handleOptionsKey(const KeyEvent& key) {
    auto& options = ui_.options;

    if (key.code == KeyCode::Escape) {
        ui_.mode = Mode::List;
        return;
    }
    if (key.code == KeyCode::Tab) {
        options.focus = options.focus == OptionsField::Interval ? OptionsField::SortKey
                                                                : OptionsField::Interval;
        return;
    }

    if (options.focus == OptionsField::Interval) {
        switch (key.code) {
        case KeyCode::Enter:
            options.focus = OptionsField::SortKey;
            break;
        case KeyCode::Backspace:
            if (!options.interval.empty()) {
                options.interval.pop_back();
            }
            break;
        case KeyCode::Character:
            if (key.ch >= 0x20 && key.ch < 0x7f) {
                options.interval.push_back(key.ch);
            }
            break;
        default:
            break;
        }
        return;
    }

    if (key.code == KeyCode::Enter) {
        submitOptions();
    } else if (isUpKey(key)) {
        if (options.sortIndex > 0) {
            --options.sortIndex;
        }
    } else if (isDownKey(key)) {
        if (options.sortIndex + 1 < core::kSortKeys.size()) {
            ++options.sortIndex;
        }
    }
}

void DashboardViewModel::moveCursor(int delta) {
    if (table_.empty()) {
        ui_.cursor = 0;
        return;
    }
    if (delta < 0 && ui_.cursor > 0) {
        --ui_.cursor;
    } else if (delta > 0 && ui_.cursor + 1 < table_.size()) {
        ++ui_.cursor;
    }
}

void DashboardViewModel::beginAdd() {
    ui_.hostForm = HostForm{};
    ui_.mode = Mode::Add;
}

void DashboardViewModel::beginEdit() {
    if (table_.empty()) {
        return;
    }
    const auto& host = table_.host(ui_.cursor);
    ui_.hostForm = HostForm{host.address, host.description, HostField::Address, ui_.cursor};
    ui_.mode = Mode::Edit;
}

void DashboardViewModel::beginDelete() {
    if (table_.empty()) {
        return;
    }
    ui_.confirmIndex = ui_.cursor;
    ui_.mode = Mode::ConfirmDelete;
}

void DashboardViewModel::openOptions() {
    ui_.options.interval = formatIntervalSeconds(ui_.interval);
    ui_.options.sortIndex = core::sortKeyIndex(ui_.sortKey);
    ui_.options.focus = OptionsField::Interval;
    ui_.mode = Mode::Options;
}

void DashboardViewModel::saveHosts() {
    try {
        store_->save(table_.hosts());
        spdlog::info("Saved {} hosts", table_.size());
        setMessage("Hosts saved");
    } catch (const std::exception& e) {
        spdlog::warn("Failed to save hosts: {}", e.what());
        setMessage(std::string("Failed to save: ") + e.what());
    }
}

void DashboardViewModel::reloadHosts() {
    std::vector<core::Host> hosts;
    try {
        hosts = store_->load();
    } catch (const std::exception& e) {
        spdlog::warn("Failed to reload hosts: {}", e.what());
        setMessage(std::string("Failed to reload: ") + e.what());
        return;
    }

    table_.reset(std::move(hosts));
    resort();
    ui_.cursor = 0;
    spdlog::info("Reloaded {} hosts", table_.size());
    setMessage("Hosts reloaded");
    armRound();
}

void DashboardViewModel::submitHostForm() {
    core::Host host = core::Host{ui_.hostForm.address, ui_.hostForm.description}.trimmed();
    if (!host.isValid()) {
        setMessage("Host cannot be empty");
        return;
    }

    std::size_t row = 0;
    if (ui_.mode == Mode::Edit && ui_.hostForm.editIndex &&
        *ui_.hostForm.editIndex < table_.size()) {
        row = *ui_.hostForm.editIndex;
        spdlog::info("Updated host {} -> {}", table_.host(row).address, host.address);
        table_.replace(row, std::move(host));
    } else {
        spdlog::info("Added host {}", host.address);
        row = table_.append(std::move(host));
    }

    ui_.hostForm = HostForm{};
    ui_.cursor = row;
    resort();
    ui_.mode = Mode::List;
    setMessage("");
    armRound();
}

void DashboardViewModel::confirmDelete() {
    ui_.mode = Mode::List;
    auto index = ui_.confirmIndex;
    ui_.confirmIndex.reset();
    if (!index || *index >= table_.size()) {
        return;
    }

    spdlog::info("Deleted host {}", table_.host(*index).address);
    table_.remove(*index);

    if (ui_.cursor >= table_.size() && ui_.cursor > 0) {
        ui_.cursor = table_.empty() ? 0 : table_.size() - 1;
    }
    setMessage("Host deleted");
    armRound();
}

void DashboardViewModel::submitOptions() {
    auto seconds = parseIntervalSeconds(ui_.options.interval);
    if (!seconds) {
        setMessage("Invalid interval; please specify seconds between 0.5 and 5");
        return;
    }

    if (*seconds < 0.5 || *seconds > 5.0) {
        setMessage("Interval must be between 0.5 and 5 seconds");
        return;
    }

    ui_.interval = std::chrono::milliseconds(std::llround(*seconds * 1000.0));
    ui_.sortKey = core::kSortKeys.at(ui_.options.sortIndex);
    spdlog::info("Options changed: interval {} ms, sort by {}", ui_.interval.count(),
                 core::sortKeyToString(ui_.sortKey));

    resort();
    ui_.cursor = 0;
    ui_.mode = Mode::List;
    setMessage("");
    armRound();
}

void DashboardViewModel::resort() {
    if (table_.empty()) {
        return;
    }
    requestResolution();

    auto order = ordering_.order(table_.hosts(), table_.statuses(), ui_.sortKey, clock_());
    if (isIdentity(order)) {
        return;
    }
    table_.applyOrder(order);

    std::vector<std::size_t> newIndex(order.size());
    for (std::size_t i = 0; i < order.size(); ++i) {
        newIndex[order[i]] = i;
    }
    if (ui_.cursor < newIndex.size()) {
        ui_.cursor = newIndex[ui_.cursor];
    }
    if (ui_.hostForm.editIndex && *ui_.hostForm.editIndex < newIndex.size()) {
        ui_.hostForm.editIndex = newIndex[*ui_.hostForm.editIndex];
    }
    if (ui_.confirmIndex && *ui_.confirmIndex < newIndex.size()) {
        ui_.confirmIndex = newIndex[*ui_.confirmIndex];
    }
}

void DashboardViewModel::requestResolution() {
    if (!resolver_ || ui_.sortKey != core::SortKey::Address) {
        return;
    }

    std::vector<std::string> pending;
    for (const auto& host : table_.hosts()) {
        if (resolver_->needsLookup(host.address) &&
            std::find(pending.begin(), pending.end(), host.address) == pending.end()) {
            pending.push_back(host.address);
        }
    }
    if (!pending.empty()) {
        scheduler_->armResolve(std::move(pending));
    }
}

void DashboardViewModel::armRound() {
    if (table_.empty()) {
        return;
    }
    roundInFlight_ = table_.version();
    spdlog::debug("Arming probe round for {} hosts (version {})", table_.size(),
                  table_.version());
    scheduler_->armRound(table_.hosts(), table_.version());
}

void DashboardViewModel::setMessage(std::string message) {
    ui_.message = std::move(message);
}

} // namespace mping::viewmodels
