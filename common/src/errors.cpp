#include "academy/common/errors.hpp"

#include <array>
#include <utility>

namespace academy::common {

namespace {

constexpr std::array<std::pair<ErrorCode, std::string_view>, 19> kErrorNames{{
    {ErrorCode::ConfigCorrupt, "config_corrupt"},
    {ErrorCode::DuplicateBoxId, "duplicate_box_id"},
    {ErrorCode::UnknownDevice, "unknown_device"},
    {ErrorCode::DeviceBusy, "device_busy"},
    {ErrorCode::PortUnavailable, "port_unavailable"},
    {ErrorCode::EngineLaunchFailed, "engine_launch_failed"},
    {ErrorCode::Timeout, "timeout"},
    {ErrorCode::AlreadyStopped, "already_stopped"},
    {ErrorCode::InvalidState, "invalid_state"},
    {ErrorCode::PermissionDenied, "permission_denied"},
    {ErrorCode::AlreadyRunning, "already_running"},
    {ErrorCode::UnknownProtocol, "unknown_protocol"},
    {ErrorCode::UnknownSubject, "unknown_subject"},
    {ErrorCode::UnknownSettings, "unknown_settings"},
    {ErrorCode::NotRunning, "not_running"},
    {ErrorCode::UnknownStatus, "unknown_status"},
    {ErrorCode::EngineCrashed, "engine_crashed"},
    {ErrorCode::BadRequest, "bad_request"},
    {ErrorCode::Internal, "internal_error"},
}};

}  // namespace

std::string_view to_string(ErrorCode code) {
    for (const auto& [value, name] : kErrorNames) {
        if (value == code) {
            return name;
        }
    }
    return "unknown";
}

std::optional<ErrorCode> error_code_from_string(std::string_view name) {
    for (const auto& [value, text] : kErrorNames) {
        if (text == name) {
            return value;
        }
    }
    return std::nullopt;
}

AcademyError::AcademyError(ErrorCode code, const std::string& message)
    : std::runtime_error(message), code_(code) {}

}  // namespace academy::common
