#include "infrastructure/network/PingOutputParser.hpp"

#include "core/types/Host.hpp"

#include <charconv>
#include <string>

namespace mping::infra {

namespace {

bool isNumberChar(char c) {
    return c == '.' || (c >= '0' && c <= '9');
}

/// Parses the number after "time=" or "time<" in a reply line.
std::optional<double> parseReplyTime(std::string_view line) {
    auto lowered = core::toLower(std::string(line));

    std::size_t pos = std::string::npos;
    for (auto marker : {"time=", "time<"}) {
        auto found = lowered.find(marker);
        if (found != std::string::npos && (pos == std::string::npos || found < pos)) {
            pos = found;
        }
    }
    if (pos == std::string::npos) {
        return std::nullopt;
    }

    pos += 5;
    while (pos < line.size() && line[pos] == ' ') {
        ++pos;
    }

    auto start = pos;
    while (pos < line.size() && isNumberChar(line[pos])) {
        ++pos;
    }
    if (start == pos) {
        return std::nullopt;
    }

    double latency = 0.0;
    auto [ptr, ec] = std::from_chars(line.data() + start, line.data() + pos, latency);
    if (ec != std::errc{} || ptr != line.data() + pos) {
        return std::nullopt;
    }
    return latency;
}

} // namespace

core::ProbeOutcome parsePingOutput(std::string_view output) {
    core::ProbeOutcome outcome;

    std::size_t lineStart = 0;
    while (lineStart <= output.size()) {
        auto lineEnd = output.find('\n', lineStart);
        if (lineEnd == std::string_view::npos) {
            lineEnd = output.size();
        }
        auto line = output.substr(lineStart, lineEnd - lineStart);

        if (core::toLower(std::string(line)).find("ttl=") != std::string::npos) {
            outcome.reachable = true;
            outcome.latencyMs = parseReplyTime(line);
            return outcome;
        }
        lineStart = lineEnd + 1;
    }

    return outcome;
}

} // namespace mping::infra
