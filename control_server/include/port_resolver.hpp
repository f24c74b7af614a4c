#pragma once

#include <filesystem>
#include <optional>
#include <string>
#include <vector>

namespace academy::control {

// EMU resolves to itself, absolute paths are used when they exist, and anything
// else is a USB serial number looked up in the by-id directory.
class PortResolver {
public:
    struct PortInfo {
        std::string serial_number;
        std::string port;
    };

    static constexpr const char* kEmulatorLocator = "EMU";

    explicit PortResolver(std::filesystem::path by_id_dir = "/dev/serial/by-id");

    std::optional<std::string> resolve(const std::string& serial_locator) const;
    std::vector<PortInfo> list_ports() const;

private:
    static std::string serial_from_link_name(const std::string& name);

    std::filesystem::path by_id_dir_;
};

}  // namespace academy::control
