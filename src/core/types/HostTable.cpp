#include "core/types/HostTable.hpp"

#include <stdexcept>
#include <string>

namespace mping::core {

HostTable::HostTable(std::vector<Host> hosts)
    : hosts_(std::move(hosts)), statuses_(hosts_.size()) {}

void HostTable::reset(std::vector<Host> hosts) {
    hosts_ = std::move(hosts);
    statuses_.assign(hosts_.size(), StatusRecord{});
    ++version_;
}

std::size_t HostTable::append(Host host) {
    hosts_.push_back(std::move(host));
    statuses_.emplace_back();
    ++version_;
    return hosts_.size() - 1;
}

void HostTable::replace(std::size_t index, Host host) {
    if (index >= hosts_.size()) {
        throw std::out_of_range("Host index out of range: " + std::to_string(index));
    }
    hosts_[index] = std::move(host);
    statuses_[index] = StatusRecord{};
    ++version_;
}

void HostTable::remove(std::size_t index) {
    if (index >= hosts_.size()) {
        throw std::out_of_range("Host index out of range: " + std::to_string(index));
    }
    auto offset = static_cast<std::ptrdiff_t>(index);
    hosts_.erase(hosts_.begin() + offset);
    statuses_.erase(statuses_.begin() + offset);
    ++version_;
}

void HostTable::applyOrder(const std::vector<std::size_t>& order) {
    if (order.size() != hosts_.size()) {
        throw std::invalid_argument("Order size does not match table size");
    }

    std::vector<bool> seen(order.size(), false);
    for (auto from : order) {
        if (from >= hosts_.size() || seen[from]) {
            throw std::invalid_argument("Order is not a permutation of the table rows");
        }
        seen[from] = true;
    }

    std::vector<Host> hosts;
    std::vector<StatusRecord> statuses;
    hosts.reserve(order.size());
    statuses.reserve(order.size());

    for (auto from : order) {
        hosts.push_back(std::move(hosts_[from]));
        statuses.push_back(std::move(statuses_[from]));
    }

    hosts_ = std::move(hosts);
    statuses_ = std::move(statuses);
    ++version_;
}

bool HostTable::updateStatuses(std::vector<StatusRecord> statuses) {
    if (statuses.size() != hosts_.size()) {
        return false;
    }
    statuses_ = std::move(statuses);
    return true;
}

} // namespace mping::core
