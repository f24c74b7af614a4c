#include "academy/common/device_state.hpp"

#include <array>
#include <utility>

namespace academy::common {

namespace {

constexpr std::array<std::pair<DeviceStatus, std::string_view>, 5> kDeviceStatusNames{{
    {DeviceStatus::Stopped, "stopped"},
    {DeviceStatus::Starting, "starting"},
    {DeviceStatus::Idle, "idle"},
    {DeviceStatus::RunningProtocol, "running_protocol"},
    {DeviceStatus::Error, "error"},
}};

constexpr std::array<std::pair<SessionStatus, std::string_view>, 4> kSessionStatusNames{{
    {SessionStatus::Running, "running"},
    {SessionStatus::Completed, "completed"},
    {SessionStatus::Failed, "failed"},
    {SessionStatus::StoppedByUser, "stopped_by_user"},
}};

constexpr std::array<std::pair<ClientRole, std::string_view>, 2> kRoleNames{{
    {ClientRole::Local, "local"},
    {ClientRole::Remote, "remote"},
}};

constexpr std::array<std::pair<Verb, std::string_view>, 11> kVerbNames{{
    {Verb::Start, "start"},
    {Verb::Stop, "stop"},
    {Verb::SetConsoleVisible, "set_console_visible"},
    {Verb::Calibrate, "calibrate"},
    {Verb::RunProtocol, "run_protocol"},
    {Verb::StopProtocol, "stop_protocol"},
    {Verb::Query, "query"},
    {Verb::AddDevice, "add_device"},
    {Verb::RemoveDevice, "remove_device"},
    {Verb::ChangeLocator, "change_locator"},
    {Verb::ListPorts, "list_ports"},
}};

template <typename Enum, std::size_t N>
std::string_view lookup_name(const std::array<std::pair<Enum, std::string_view>, N>& table, Enum value) {
    for (const auto& [candidate, name] : table) {
        if (candidate == value) {
            return name;
        }
    }
    return "unknown";
}

template <typename Enum, std::size_t N>
std::optional<Enum> lookup_value(const std::array<std::pair<Enum, std::string_view>, N>& table,
                                 std::string_view name) {
    for (const auto& [value, candidate] : table) {
        if (candidate == name) {
            return value;
        }
    }
    return std::nullopt;
}

}  // namespace

std::string_view to_string(DeviceStatus status) { return lookup_name(kDeviceStatusNames, status); }
std::string_view to_string(SessionStatus status) { return lookup_name(kSessionStatusNames, status); }
std::string_view to_string(ClientRole role) { return lookup_name(kRoleNames, role); }
std::string_view to_string(Verb verb) { return lookup_name(kVerbNames, verb); }

std::optional<DeviceStatus> device_status_from_string(std::string_view name) {
    return lookup_value(kDeviceStatusNames, name);
}

std::optional<SessionStatus> session_status_from_string(std::string_view name) {
    return lookup_value(kSessionStatusNames, name);
}

std::optional<ClientRole> client_role_from_string(std::string_view name) {
    return lookup_value(kRoleNames, name);
}

std::optional<Verb> verb_from_string(std::string_view name) {
    return lookup_value(kVerbNames, name);
}

bool requires_local_role(Verb verb) {
    return verb == Verb::SetConsoleVisible || verb == Verb::Calibrate;
}

bool is_registry_verb(Verb verb) {
    return verb == Verb::AddDevice || verb == Verb::RemoveDevice || verb == Verb::ChangeLocator ||
           verb == Verb::ListPorts;
}

CommandResult CommandResult::success(std::string request_id, nlohmann::json result) {
    CommandResult out;
    out.request_id = std::move(request_id);
    out.ok = true;
    out.result = std::move(result);
    return out;
}

CommandResult CommandResult::failure(std::string request_id, ErrorCode code, std::string message) {
    CommandResult out;
    out.request_id = std::move(request_id);
    out.ok = false;
    out.error = code;
    out.message = std::move(message);
    return out;
}

}  // namespace academy::common
