#include "ui/RowFormatter.hpp"

#include <algorithm>
#include <ctime>
#include <iomanip>
#include <sstream>

namespace mping::ui {

std::string formatStatus(const core::StatusRecord& record) {
    if (!record.observed()) {
        return "-";
    }
    return record.reachable ? "UP" : "DOWN";
}

std::string formatLatency(const std::optional<double>& latencyMs) {
    if (!latencyMs) {
        return "-";
    }
    std::ostringstream oss;
    oss << std::fixed << std::setprecision(1) << *latencyMs;
    return oss.str();
}

std::string formatClock(const std::optional<core::TimePoint>& time) {
    if (!time) {
        return "-";
    }
    auto t = core::Clock::to_time_t(*time);
    std::tm tm{};
    localtime_r(&t, &tm);
    char buffer[16];
    std::strftime(buffer, sizeof(buffer), "%H:%M:%S", &tm);
    return buffer;
}

std::string formatAge(const core::StatusRecord& record, core::TimePoint now) {
    if (!record.observed()) {
        return "-";
    }
    auto seconds = std::chrono::duration_cast<std::chrono::seconds>(record.age(now)).count();
    return std::to_string(seconds);
}

const RowCells& columnTitles() {
    static const RowCells titles{
        "HOST", "DESC", "STATUS", "REPLY(ms)", "LAST STATUS CHANGE", "AGE",
    };
    return titles;
}

RowCells formatRow(const core::Host& host, const core::StatusRecord& status, core::TimePoint now) {
    return RowCells{
        host.address,
        host.description,
        formatStatus(status),
        formatLatency(status.latencyMs),
        formatClock(status.lastChangeAt),
        formatAge(status, now),
    };
}

ColumnWidths columnWidths(const std::vector<RowCells>& rows, std::size_t available) {
    const auto& titles = columnTitles();

    ColumnWidths widths{};
    for (std::size_t col = 0; col < kColumnCount; ++col) {
        widths[col] = titles[col].size();
        for (const auto& row : rows) {
            widths[col] = std::max(widths[col], row[col].size());
        }
    }

    // DESC gives way first, then HOST.
    for (std::size_t col : {std::size_t{1}, std::size_t{0}}) {
        auto total = tableWidth(widths);
        if (total <= available) {
            break;
        }
        auto excess = total - available;
        auto spare = widths[col] - titles[col].size();
        widths[col] -= std::min(excess, spare);
    }
    return widths;
}

std::size_t tableWidth(const ColumnWidths& widths) {
    std::size_t total = kColumnGap * (kColumnCount - 1);
    for (auto width : widths) {
        total += width;
    }
    return total;
}

std::string fitColumn(const std::string& text, std::size_t width) {
    if (text.size() >= width) {
        return text.substr(0, width);
    }
    return text + std::string(width - text.size(), ' ');
}

std::size_t firstVisibleRow(std::size_t cursor, std::size_t rowCount, std::size_t visibleRows,
                            std::size_t previousFirst) {
    if (visibleRows == 0 || rowCount <= visibleRows) {
        return 0;
    }
    auto first = previousFirst;
    if (cursor < first) {
        first = cursor;
    } else if (cursor >= first + visibleRows) {
        first = cursor - visibleRows + 1;
    }
    return std::min(first, rowCount - visibleRows);
}

} // namespace mping::ui
