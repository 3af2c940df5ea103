/**
 * @file DashboardState.hpp
 * @brief UI state and input events of the dashboard state machine.
 */

#pragma once

#include "core/types/SortKey.hpp"
#include "core/types/StatusRecord.hpp"

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>
#include <variant>
#include <vector>

namespace mping::viewmodels {

inline constexpr std::chrono::milliseconds kMinInterval{500};
inline constexpr std::chrono::milliseconds kMaxInterval{5000};
inline constexpr std::chrono::milliseconds kDefaultInterval{5000};

/**
 * @brief High-level mode of the dashboard.
 */
enum class Mode : int { List = 0, Add, Edit, ConfirmDelete, Options };

enum class HostField : int { Address = 0, Description };

enum class OptionsField : int { Interval = 0, SortKey };

/**
 * @brief Draft of the add/edit dialog.
 */
struct HostForm {
    std::string address;
    std::string description;
    HostField focus{HostField::Address};
    std::optional<std::size_t> editIndex; ///< Row being edited, empty when adding
};

/**
 * @brief Draft of the options dialog.
 */
struct OptionsForm {
    std::string interval;       ///< Interval in seconds as typed by the user
    std::size_t sortIndex{0};   ///< Index into core::kSortKeys
    OptionsField focus{OptionsField::Interval};
};

/**
 * @brief Everything the renderer needs besides the host table.
 */
struct UiState {
    Mode mode{Mode::List};
    std::size_t cursor{0};
    HostForm hostForm;
    OptionsForm options;
    std::optional<std::size_t> confirmIndex; ///< Row awaiting delete confirmation
    std::string message;                     ///< Transient message shown below the table
    std::chrono::milliseconds interval{kDefaultInterval};
    core::SortKey sortKey{core::SortKey::Name};
    int width{0};
    int height{0};
    bool quitRequested{false};
};

enum class KeyCode : int { Character = 0, Enter, Tab, Escape, Backspace, Up, Down };

/**
 * @brief A decoded key press.
 */
struct KeyEvent {
    KeyCode code{KeyCode::Character};
    char ch{0}; ///< Printable character for KeyCode::Character

    static KeyEvent character(char c) { return KeyEvent{KeyCode::Character, c}; }
    static KeyEvent of(KeyCode code) { return KeyEvent{code, 0}; }

    bool operator==(const KeyEvent& other) const = default;
};

/**
 * @brief The poll timer fired.
 */
struct TickEvent {};

/**
 * @brief A probe round finished.
 */
struct ProbeBatchEvent {
    uint64_t version{0};                    ///< Table version the round was started against
    std::vector<core::ProbeOutcome> outcomes; ///< Outcomes in row order of that version
    core::TimePoint receivedAt;             ///< Time the batch reached the interaction thread
};

/**
 * @brief Name lookups requested through armResolve have completed.
 */
struct AddressesResolvedEvent {};

/**
 * @brief The terminal was resized.
 */
struct ResizeEvent {
    int width{0};
    int height{0};
};

using DashboardEvent =
    std::variant<TickEvent, ProbeBatchEvent, KeyEvent, ResizeEvent, AddressesResolvedEvent>;

} // namespace mping::viewmodels
