#pragma once

#include <chrono>
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>

#include <nlohmann/json.hpp>

#include "academy/common/errors.hpp"

namespace academy::common {

enum class DeviceStatus { Stopped, Starting, Idle, RunningProtocol, Error };

enum class SessionStatus { Running, Completed, Failed, StoppedByUser };

enum class ClientRole { Local, Remote };

enum class Verb {
    Start,
    Stop,
    SetConsoleVisible,
    Calibrate,
    RunProtocol,
    StopProtocol,
    Query,
    AddDevice,
    RemoveDevice,
    ChangeLocator,
    ListPorts,
};

std::string_view to_string(DeviceStatus status);
std::string_view to_string(SessionStatus status);
std::string_view to_string(ClientRole role);
std::string_view to_string(Verb verb);

std::optional<DeviceStatus> device_status_from_string(std::string_view name);
std::optional<SessionStatus> session_status_from_string(std::string_view name);
std::optional<ClientRole> client_role_from_string(std::string_view name);
std::optional<Verb> verb_from_string(std::string_view name);

bool requires_local_role(Verb verb);

bool is_registry_verb(Verb verb);

struct ProtocolSession {
    std::uint64_t session_id{0};
    std::string box_id;
    std::string protocol;
    std::string subject;
    std::string settings_file;
    std::chrono::system_clock::time_point started_at{};
    std::optional<std::chrono::system_clock::time_point> finished_at;
    SessionStatus status{SessionStatus::Running};
    std::string detail;
};

struct StateSnapshot {
    std::string box_id;
    std::string serial_locator;
    DeviceStatus state{DeviceStatus::Stopped};
    bool gui_visible{false};
    std::optional<std::string> last_error;
    bool calibration_available{false};
    std::uint64_t version{0};
    std::chrono::system_clock::time_point updated_at{};
    std::optional<ProtocolSession> active_session;
    std::optional<ProtocolSession> last_session;
};

struct CommandRequest {
    std::string request_id;
    std::string device;
    Verb verb{Verb::Query};
    nlohmann::json args = nlohmann::json::object();
    std::uint64_t origin_client{0};
    ClientRole origin_role{ClientRole::Remote};
};

struct CommandResult {
    std::string request_id;
    bool ok{false};
    std::optional<ErrorCode> error;
    std::string message;
    nlohmann::json result = nlohmann::json::object();

    static CommandResult success(std::string request_id, nlohmann::json result = nlohmann::json::object());
    static CommandResult failure(std::string request_id, ErrorCode code, std::string message);
};

}  // namespace academy::common
