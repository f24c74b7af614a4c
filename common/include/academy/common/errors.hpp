#pragma once

#include <optional>
#include <stdexcept>
#include <string>
#include <string_view>

namespace academy::common {

enum class ErrorCode {
    ConfigCorrupt,
    DuplicateBoxId,
    UnknownDevice,
    DeviceBusy,
    PortUnavailable,
    EngineLaunchFailed,
    Timeout,
    AlreadyStopped,
    InvalidState,
    PermissionDenied,
    AlreadyRunning,
    UnknownProtocol,
    UnknownSubject,
    UnknownSettings,
    NotRunning,
    UnknownStatus,
    EngineCrashed,
    BadRequest,
    Internal,
};

std::string_view to_string(ErrorCode code);
std::optional<ErrorCode> error_code_from_string(std::string_view name);

class AcademyError : public std::runtime_error {
public:
    AcademyError(ErrorCode code, const std::string& message);

    ErrorCode code() const noexcept { return code_; }

private:
    ErrorCode code_;
};

}  // namespace academy::common
