#include "core/types/Alert.hpp"

namespace mping::core {

std::string Alert::typeToString() const {
    switch (type) {
    case AlertType::HostDown:
        return "HostDown";
    case AlertType::HostRecovered:
        return "HostRecovered";
    }
    return "Unknown";
}

std::string Alert::message() const {
    std::string text = host.address;
    if (!host.description.empty()) {
        text += " (" + host.description + ")";
    }
    text += type == AlertType::HostRecovered ? " is UP" : " is DOWN";
    return text;
}

Alert Alert::fromTransition(const Host& host, const StatusRecord& record) {
    Alert alert;
    alert.type = record.reachable ? AlertType::HostRecovered : AlertType::HostDown;
    alert.host = host;
    alert.timestamp = record.lastChangeAt.value_or(Clock::now());
    return alert;
}

} // namespace mping::core
