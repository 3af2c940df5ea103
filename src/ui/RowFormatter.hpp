/**
 * @file RowFormatter.hpp
 * @brief Text of the dashboard table cells.
 */

#pragma once

#include "core/types/Host.hpp"
#include "core/types/StatusRecord.hpp"

#include <array>
#include <cstddef>
#include <optional>
#include <string>
#include <vector>

namespace mping::ui {

/// "UP", "DOWN", or "-" before the first probe.
std::string formatStatus(const core::StatusRecord& record);

/// Latency with one decimal, or "-".
std::string formatLatency(const std::optional<double>& latencyMs);

/// Local wall-clock time as HH:MM:SS, or "-".
std::string formatClock(const std::optional<core::TimePoint>& time);

/// Whole seconds since the last change, or "-" before the first probe.
std::string formatAge(const core::StatusRecord& record, core::TimePoint now);

inline constexpr std::size_t kColumnCount = 6;
inline constexpr std::size_t kColumnGap = 2;

/// Cell texts of one table row, in column order.
using RowCells = std::array<std::string, kColumnCount>;
using ColumnWidths = std::array<std::size_t, kColumnCount>;

/// HOST, DESC, STATUS, REPLY(ms), LAST STATUS CHANGE, AGE.
const RowCells& columnTitles();

RowCells formatRow(const core::Host& host, const core::StatusRecord& status, core::TimePoint now);

/**
 * @brief Computes column widths that fit the longest cell of every column.
 *
 * Each column is at least as wide as its title. When the table does not fit
 * in the available width, DESC shrinks first and HOST next, each down to its
 * title width; the other columns keep their natural width.
 *
 * @param rows Cells of every row, visible or not, so widths do not change while scrolling.
 * @param available Terminal width.
 */
ColumnWidths columnWidths(const std::vector<RowCells>& rows, std::size_t available);

/// Sum of the widths plus the gaps between columns.
std::size_t tableWidth(const ColumnWidths& widths);

/**
 * @brief Pads or truncates text to exactly width characters.
 */
std::string fitColumn(const std::string& text, std::size_t width);

/**
 * @brief Computes the first table row to draw so that the cursor stays visible.
 * @param cursor Selected row.
 * @param rowCount Number of rows in the table.
 * @param visibleRows Rows that fit on screen.
 * @param previousFirst First row drawn in the previous frame.
 */
std::size_t firstVisibleRow(std::size_t cursor, std::size_t rowCount, std::size_t visibleRows,
                            std::size_t previousFirst);

} // namespace mping::ui
