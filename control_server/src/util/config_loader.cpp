#include "util/config_loader.hpp"

#include <cstdlib>
#include <stdexcept>

#include <yaml-cpp/yaml.h>

namespace academy::control {

namespace {

template <typename T>
T scalar_or_throw(const YAML::Node& node, const std::string& field) {
    if (!node.IsScalar()) {
        throw std::runtime_error("Field '" + field + "' must be a scalar");
    }
    try {
        return node.as<T>();
    } catch (const YAML::BadConversion&) {
        throw std::runtime_error("Field '" + field + "' has an invalid value");
    }
}

template <typename T>
void read_optional(const YAML::Node& parent, const char* key, const std::string& path, T& out) {
    if (auto node = parent[key]; node && !node.IsNull()) {
        out = scalar_or_throw<T>(node, path + "." + key);
    }
}

std::vector<std::string> string_list(const YAML::Node& node, const std::string& field) {
    if (!node.IsSequence()) {
        throw std::runtime_error("Field '" + field + "' must be a sequence");
    }
    std::vector<std::string> out;
    for (const auto& item : node) {
        out.push_back(scalar_or_throw<std::string>(item, field + "[]"));
    }
    return out;
}

void parse_server(const YAML::Node& node, ServerSection& server) {
    read_optional(node, "host", "server", server.host);
    int port = server.port;
    read_optional(node, "port", "server", port);
    if (port <= 0 || port > 65535) {
        throw std::runtime_error("Field 'server.port' must be in 1..65535");
    }
    server.port = static_cast<std::uint16_t>(port);
    if (auto addresses = node["local_addresses"]; addresses && !addresses.IsNull()) {
        server.local_addresses = string_list(addresses, "server.local_addresses");
    }
    read_optional(node, "send_queue_limit", "server", server.send_queue_limit);
    if (server.send_queue_limit == 0) {
        throw std::runtime_error("Field 'server.send_queue_limit' must be positive");
    }
}

void parse_engine(const YAML::Node& node, EngineSection& engine) {
    if (auto command = node["command"]; command && !command.IsNull()) {
        engine.command = string_list(command, "engine.command");
        if (engine.command.empty()) {
            throw std::runtime_error("Field 'engine.command' must not be empty");
        }
    }
    long long launch_ms = engine.launch_timeout.count();
    read_optional(node, "launch_timeout_ms", "engine", launch_ms);
    engine.launch_timeout = std::chrono::milliseconds(launch_ms);
    long long grace_ms = engine.stop_grace.count();
    read_optional(node, "stop_grace_ms", "engine", grace_ms);
    engine.stop_grace = std::chrono::milliseconds(grace_ms);
    read_optional(node, "interrupt_on_stop_protocol", "engine", engine.interrupt_on_stop_protocol);
    read_optional(node, "console_visible_on_start", "engine", engine.console_visible_on_start);

    if (auto templates = node["templates"]; templates && templates.IsMap()) {
        auto& t = engine.templates;
        read_optional(templates, "start", "engine.templates", t.start);
        read_optional(templates, "stop", "engine.templates", t.stop);
        read_optional(templates, "toggle_console", "engine.templates", t.toggle_console);
        read_optional(templates, "calibrate", "engine.templates", t.calibrate);
        read_optional(templates, "run_protocol", "engine.templates", t.run_protocol);
        read_optional(templates, "stop_protocol", "engine.templates", t.stop_protocol);
    }
    if (auto markers = node["markers"]; markers && markers.IsMap()) {
        read_optional(markers, "ready", "engine.markers", engine.ready_marker);
        read_optional(markers, "launch_failed", "engine.markers", engine.launch_failed_marker);
    }
    if (engine.launch_timeout.count() <= 0 || engine.stop_grace.count() <= 0) {
        throw std::runtime_error("Engine timeouts must be positive");
    }
}

void parse_watcher(const YAML::Node& node, WatcherSection& watcher) {
    long long poll_ms = watcher.poll_interval.count();
    read_optional(node, "poll_interval_ms", "watcher", poll_ms);
    if (poll_ms <= 0) {
        throw std::runtime_error("Field 'watcher.poll_interval_ms' must be positive");
    }
    watcher.poll_interval = std::chrono::milliseconds(poll_ms);
    long long timeout_s = watcher.protocol_timeout.count();
    read_optional(node, "protocol_timeout_s", "watcher", timeout_s);
    if (timeout_s <= 0) {
        throw std::runtime_error("Field 'watcher.protocol_timeout_s' must be positive");
    }
    watcher.protocol_timeout = std::chrono::seconds(timeout_s);
    read_optional(node, "completion_marker", "watcher", watcher.completion_marker);
    read_optional(node, "failure_marker", "watcher", watcher.failure_marker);
}

ControlServerConfig from_root(const YAML::Node& root) {
    ControlServerConfig config;
    if (!root || root.IsNull()) {
        return config;
    }
    if (!root.IsMap()) {
        throw std::runtime_error("Academy configuration must be a mapping");
    }

    if (auto dir = root["academy_dir"]; dir && !dir.IsNull()) {
        config.academy_dir = scalar_or_throw<std::string>(dir, "academy_dir");
    }
    if (auto node = root["server"]; node && node.IsMap()) {
        parse_server(node, config.server);
    }
    if (auto node = root["engine"]; node && node.IsMap()) {
        parse_engine(node, config.engine);
    }
    if (auto node = root["watcher"]; node && node.IsMap()) {
        parse_watcher(node, config.watcher);
    }
    if (auto node = root["ports"]; node && node.IsMap()) {
        std::string by_id = config.ports.by_id_dir.string();
        read_optional(node, "by_id_dir", "ports", by_id);
        config.ports.by_id_dir = by_id;
    }
    if (auto node = root["logging"]; node && node.IsMap()) {
        read_optional(node, "level", "logging", config.logging.level);
        read_optional(node, "file", "logging", config.logging.file);
    }
    return config;
}

}  // namespace

std::filesystem::path ControlServerConfig::registry_file() const {
    return academy_dir / "Academy" / "AcademyConfig.csv";
}

std::filesystem::path ControlServerConfig::log_dir() const {
    return academy_dir / "Academy" / "logs";
}

std::filesystem::path ControlServerConfig::server_log_file() const {
    if (!logging.file.empty()) {
        return logging.file;
    }
    return log_dir() / "Academy.log";
}

ControlServerConfig load_config(const std::string& path) {
    YAML::Node root;
    try {
        root = YAML::LoadFile(path);
    } catch (const YAML::Exception& ex) {
        throw std::runtime_error("Failed to read config " + path + ": " + ex.what());
    }
    return from_root(root);
}

ControlServerConfig parse_config(const std::string& yaml_text) {
    YAML::Node root;
    try {
        root = YAML::Load(yaml_text);
    } catch (const YAML::Exception& ex) {
        throw std::runtime_error(std::string("Failed to parse config: ") + ex.what());
    }
    return from_root(root);
}

void resolve_academy_dir(ControlServerConfig& config) {
    if (!config.academy_dir.empty()) {
        return;
    }
    for (const char* name : {"ACADEMY_DIR", "BPOD_DIR"}) {
        if (const char* value = std::getenv(name); value != nullptr && *value != '\0') {
            config.academy_dir = value;
            return;
        }
    }
    throw std::runtime_error(
        "Academy directory not specified: set academy_dir in the config or the ACADEMY_DIR / BPOD_DIR "
        "environment variable");
}

}  // namespace academy::control
