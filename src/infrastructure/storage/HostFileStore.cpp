#include "infrastructure/storage/HostFileStore.hpp"

#include "core/engine/OrderingEngine.hpp"

#include <spdlog/spdlog.h>

#include <fstream>
#include <sstream>
#include <stdexcept>
#include <system_error>

namespace mping::infra {

HostFileStore::HostFileStore(std::filesystem::path path) : path_(std::move(path)) {}

std::vector<core::Host> HostFileStore::parse(const std::string& contents) {
    std::vector<core::Host> hosts;
    std::istringstream stream(contents);
    std::string line;

    while (std::getline(stream, line)) {
        if (!line.empty() && line.back() == '\r') {
            line.pop_back();
        }
        if (core::trim(line).empty()) {
            continue;
        }

        core::Host host;
        auto comma = line.find(',');
        if (comma == std::string::npos) {
            host.address = line;
        } else {
            host.address = line.substr(0, comma);
            host.description = line.substr(comma + 1);
        }
        host = host.trimmed();

        if (host.isValid()) {
            hosts.push_back(std::move(host));
        }
    }

    return hosts;
}

std::string HostFileStore::format(const std::vector<core::Host>& hosts) {
    std::string out;
    for (std::size_t i = 0; i < hosts.size(); ++i) {
        if (i > 0) {
            out += '\n';
        }
        out += hosts[i].address;
        if (!hosts[i].description.empty()) {
            out += ',';
            out += hosts[i].description;
        }
    }
    return out;
}

std::vector<core::Host> HostFileStore::load() {
    std::error_code ec;
    if (!std::filesystem::exists(path_, ec)) {
        spdlog::info("Host file {} not found, starting with an empty list", path_.string());
        return {};
    }
    if (std::filesystem::is_directory(path_, ec)) {
        throw std::runtime_error(path_.string() + " is a directory");
    }

    std::ifstream file(path_, std::ios::binary);
    if (!file) {
        throw std::runtime_error("cannot open " + path_.string());
    }

    std::ostringstream buffer;
    buffer << file.rdbuf();
    if (file.bad()) {
        throw std::runtime_error("error reading " + path_.string());
    }

    auto hosts = parse(buffer.str());

    core::OrderingEngine ordering;
    std::vector<core::StatusRecord> statuses(hosts.size());
    auto order = ordering.order(hosts, statuses, core::SortKey::Name, core::Clock::now());

    std::vector<core::Host> sorted;
    sorted.reserve(hosts.size());
    for (auto index : order) {
        sorted.push_back(std::move(hosts[index]));
    }

    spdlog::info("Loaded {} hosts from {}", sorted.size(), path_.string());
    return sorted;
}

void HostFileStore::save(const std::vector<core::Host>& hosts) {
    auto tempPath = path_;
    tempPath += ".tmp";

    {
        std::ofstream file(tempPath, std::ios::binary | std::ios::trunc);
        if (!file) {
            throw std::runtime_error("cannot open " + tempPath.string() + " for writing");
        }
        file << format(hosts);
        file.flush();
        if (!file) {
            file.close();
            std::error_code ignored;
            std::filesystem::remove(tempPath, ignored);
            throw std::runtime_error("error writing " + tempPath.string());
        }
    }

    std::error_code ec;
    std::filesystem::rename(tempPath, path_, ec);
    if (ec) {
        std::error_code ignored;
        std::filesystem::remove(tempPath, ignored);
        throw std::runtime_error("cannot replace " + path_.string() + ": " + ec.message());
    }

    spdlog::info("Saved {} hosts to {}", hosts.size(), path_.string());
}

} // namespace mping::infra
