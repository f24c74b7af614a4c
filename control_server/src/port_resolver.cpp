#include "port_resolver.hpp"

#include <algorithm>
#include <system_error>
#include <utility>

namespace academy::control {

PortResolver::PortResolver(std::filesystem::path by_id_dir) : by_id_dir_(std::move(by_id_dir)) {}

// by-id links look like usb-<vendor>_<product>_<serial>-if00[-port0].
std::string PortResolver::serial_from_link_name(const std::string& name) {
    std::string stem = name;
    if (stem.rfind("usb-", 0) == 0) {
        stem = stem.substr(4);
    }
    const auto iface = stem.rfind("-if");
    if (iface != std::string::npos) {
        stem = stem.substr(0, iface);
    }
    const auto underscore = stem.rfind('_');
    if (underscore != std::string::npos) {
        stem = stem.substr(underscore + 1);
    }
    return stem;
}

std::optional<std::string> PortResolver::resolve(const std::string& serial_locator) const {
    if (serial_locator.empty()) {
        return std::nullopt;
    }
    if (serial_locator == kEmulatorLocator) {
        return serial_locator;
    }

    std::error_code ec;
    const std::filesystem::path as_path(serial_locator);
    if (as_path.is_absolute()) {
        if (std::filesystem::exists(as_path, ec)) {
            return serial_locator;
        }
        return std::nullopt;
    }

    if (!std::filesystem::is_directory(by_id_dir_, ec)) {
        return std::nullopt;
    }
    for (const auto& entry : std::filesystem::directory_iterator(by_id_dir_, ec)) {
        const auto name = entry.path().filename().string();
        if (name.find(serial_locator) == std::string::npos) {
            continue;
        }
        auto target = std::filesystem::canonical(entry.path(), ec);
        if (ec) {
            return std::nullopt;
        }
        return target.string();
    }
    return std::nullopt;
}

std::vector<PortResolver::PortInfo> PortResolver::list_ports() const {
    std::vector<PortInfo> ports;
    std::error_code ec;
    if (!std::filesystem::is_directory(by_id_dir_, ec)) {
        return ports;
    }
    for (const auto& entry : std::filesystem::directory_iterator(by_id_dir_, ec)) {
        std::error_code link_ec;
        auto target = std::filesystem::canonical(entry.path(), link_ec);
        if (link_ec) {
            continue;
        }
        ports.push_back(PortInfo{serial_from_link_name(entry.path().filename().string()), target.string()});
    }
    std::sort(ports.begin(), ports.end(),
              [](const PortInfo& a, const PortInfo& b) { return a.port < b.port; });
    return ports;
}

}  // namespace academy::control
