#include "academy/common/wire_format.hpp"

#include <ctime>
#include <iomanip>
#include <sstream>
#include <stdexcept>

namespace academy::common {

namespace {

std::time_t to_utc_time_t(std::tm tm) {
#if defined(_WIN32)
    return _mkgmtime(&tm);
#else
    return timegm(&tm);
#endif
}

Json optional_string(const std::optional<std::string>& value) {
    if (!value) {
        return nullptr;
    }
    return *value;
}

Json optional_session(const std::optional<ProtocolSession>& session) {
    if (!session) {
        return nullptr;
    }
    return to_json(*session);
}

std::string require_string(const Json& message, const char* field) {
    auto it = message.find(field);
    if (it == message.end() || !it->is_string()) {
        throw AcademyError(ErrorCode::BadRequest, std::string("field '") + field + "' must be a string");
    }
    return it->get<std::string>();
}

}  // namespace

std::string format_timestamp(std::chrono::system_clock::time_point tp) {
    const auto millis =
        std::chrono::duration_cast<std::chrono::milliseconds>(tp.time_since_epoch()).count() % 1000;
    std::time_t tt = std::chrono::system_clock::to_time_t(tp);
    std::tm tm{};
#if defined(_WIN32)
    gmtime_s(&tm, &tt);
#else
    gmtime_r(&tt, &tm);
#endif
    std::ostringstream oss;
    oss << std::put_time(&tm, "%Y-%m-%dT%H:%M:%S") << '.' << std::setw(3) << std::setfill('0')
        << (millis < 0 ? millis + 1000 : millis) << 'Z';
    return oss.str();
}

std::chrono::system_clock::time_point parse_timestamp(const std::string& iso) {
    std::tm tm{};
    std::istringstream iss(iso);
    iss >> std::get_time(&tm, "%Y-%m-%dT%H:%M:%S");
    if (iss.fail()) {
        throw std::runtime_error("Failed to parse ISO8601 timestamp: " + iso);
    }
    int millis = 0;
    if (iss.peek() == '.') {
        iss.get();
        iss >> millis;
    }
    auto tp = std::chrono::system_clock::from_time_t(to_utc_time_t(tm));
    return tp + std::chrono::milliseconds(millis);
}

Json to_json(const ProtocolSession& session) {
    Json node;
    node["session_id"] = session.session_id;
    node["box_id"] = session.box_id;
    node["protocol"] = session.protocol;
    node["subject"] = session.subject;
    node["settings_file"] = session.settings_file;
    node["started_at"] = format_timestamp(session.started_at);
    if (session.finished_at) {
        node["finished_at"] = format_timestamp(*session.finished_at);
    } else {
        node["finished_at"] = nullptr;
    }
    node["status"] = std::string(to_string(session.status));
    node["detail"] = session.detail;
    return node;
}

ProtocolSession session_from_json(const Json& node) {
    ProtocolSession session;
    session.session_id = node.value("session_id", std::uint64_t{0});
    session.box_id = node.value("box_id", "");
    session.protocol = node.at("protocol").get<std::string>();
    session.subject = node.at("subject").get<std::string>();
    session.settings_file = node.value("settings_file", "");
    session.started_at = parse_timestamp(node.at("started_at").get<std::string>());
    if (node.contains("finished_at") && node.at("finished_at").is_string()) {
        session.finished_at = parse_timestamp(node.at("finished_at").get<std::string>());
    }
    auto status = session_status_from_string(node.value("status", "running"));
    if (!status) {
        throw std::runtime_error("Unknown session status in snapshot");
    }
    session.status = *status;
    session.detail = node.value("detail", "");
    return session;
}

Json to_json(const StateSnapshot& snapshot) {
    Json node;
    node["box_id"] = snapshot.box_id;
    node["serial_locator"] = snapshot.serial_locator;
    node["state"] = std::string(to_string(snapshot.state));
    node["gui_visible"] = snapshot.gui_visible;
    node["last_error"] = optional_string(snapshot.last_error);
    node["calibration_available"] = snapshot.calibration_available;
    node["version"] = snapshot.version;
    node["updated_at"] = format_timestamp(snapshot.updated_at);
    node["active_session"] = optional_session(snapshot.active_session);
    node["last_session"] = optional_session(snapshot.last_session);
    return node;
}

StateSnapshot snapshot_from_json(const Json& node) {
    StateSnapshot snapshot;
    snapshot.box_id = node.at("box_id").get<std::string>();
    snapshot.serial_locator = node.value("serial_locator", "");
    auto state = device_status_from_string(node.at("state").get<std::string>());
    if (!state) {
        throw std::runtime_error("Unknown device state in snapshot for " + snapshot.box_id);
    }
    snapshot.state = *state;
    snapshot.gui_visible = node.value("gui_visible", false);
    if (node.contains("last_error") && node.at("last_error").is_string()) {
        snapshot.last_error = node.at("last_error").get<std::string>();
    }
    snapshot.calibration_available = node.value("calibration_available", false);
    snapshot.version = node.value("version", std::uint64_t{0});
    if (node.contains("updated_at") && node.at("updated_at").is_string()) {
        snapshot.updated_at = parse_timestamp(node.at("updated_at").get<std::string>());
    }
    if (node.contains("active_session") && node.at("active_session").is_object()) {
        snapshot.active_session = session_from_json(node.at("active_session"));
    }
    if (node.contains("last_session") && node.at("last_session").is_object()) {
        snapshot.last_session = session_from_json(node.at("last_session"));
    }
    return snapshot;
}

Json make_hello_message(std::uint64_t connection_id, ClientRole role) {
    return Json{{"type", "hello"}, {"connection_id", connection_id}, {"role", std::string(to_string(role))}};
}

Json make_full_sync_message(const std::vector<StateSnapshot>& snapshots) {
    Json devices = Json::array();
    for (const auto& snapshot : snapshots) {
        devices.push_back(to_json(snapshot));
    }
    return Json{{"type", "full_sync"}, {"devices", std::move(devices)}};
}

Json make_state_message(const StateSnapshot& snapshot) {
    return Json{{"type", "state"}, {"device", to_json(snapshot)}};
}

Json make_removed_message(const std::string& box_id) {
    return Json{{"type", "device_removed"}, {"box_id", box_id}};
}

Json make_ack_message(const CommandResult& result) {
    Json message{{"type", "ack"}, {"request_id", result.request_id}, {"ok", result.ok}};
    if (result.ok) {
        message["result"] = result.result;
    } else {
        message["error"] = std::string(to_string(result.error.value_or(ErrorCode::BadRequest)));
        message["message"] = result.message;
    }
    return message;
}

Json make_server_closing_message() {
    return Json{{"type", "server_closing"}};
}

Json make_command_message(const std::string& request_id,
                          const std::string& device,
                          Verb verb,
                          const Json& args) {
    return Json{
        {"type", "command"},
        {"request_id", request_id},
        {"device", device},
        {"verb", std::string(to_string(verb))},
        {"args", args.is_null() ? Json::object() : args},
    };
}

Json make_sync_request() {
    return Json{{"type", "sync"}};
}

CommandRequest parse_command_message(const Json& message) {
    if (!message.is_object()) {
        throw AcademyError(ErrorCode::BadRequest, "command message must be a JSON object");
    }
    CommandRequest request;
    if (auto it = message.find("request_id"); it != message.end() && it->is_string()) {
        request.request_id = it->get<std::string>();
    }
    const auto verb_name = require_string(message, "verb");
    auto verb = verb_from_string(verb_name);
    if (!verb) {
        throw AcademyError(ErrorCode::BadRequest, "unknown verb '" + verb_name + "'");
    }
    request.verb = *verb;
    if (auto it = message.find("device"); it != message.end() && it->is_string()) {
        request.device = it->get<std::string>();
    }
    if (request.device.empty() && request.verb != Verb::ListPorts) {
        throw AcademyError(ErrorCode::BadRequest, "verb '" + verb_name + "' requires a device");
    }
    if (auto it = message.find("args"); it != message.end() && !it->is_null()) {
        if (!it->is_object()) {
            throw AcademyError(ErrorCode::BadRequest, "field 'args' must be an object");
        }
        request.args = *it;
    }
    return request;
}

CommandResult parse_ack_message(const Json& message) {
    CommandResult result;
    result.request_id = message.value("request_id", "");
    result.ok = message.value("ok", false);
    if (result.ok) {
        if (message.contains("result")) {
            result.result = message.at("result");
        }
    } else {
        result.error = error_code_from_string(message.value("error", "")).value_or(ErrorCode::BadRequest);
        result.message = message.value("message", "");
    }
    return result;
}

}  // namespace academy::common
