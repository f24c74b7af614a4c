#pragma once

#include <chrono>
#include <cstdint>
#include <filesystem>
#include <string>
#include <vector>

namespace academy::control {

struct ServerSection {
    std::string host{"0.0.0.0"};
    std::uint16_t port{5555};
    std::vector<std::string> local_addresses;
    std::size_t send_queue_limit{256};
};

struct EngineTemplates {
    std::string start{
        "try, Bpod('{port}', 0, 0, '{box_id}'); disp('ACADEMY_READY'); "
        "catch e, disp(['ACADEMY_LAUNCH_FAILED ' e.message]); end"};
    std::string stop{"EndBpod; exit"};
    std::string toggle_console{"BpodSystem.SwitchGUI();"};
    std::string calibrate{"BpodLiquidCalibration('Calibrate');"};
    std::string run_protocol{
        "try, RunProtocol('StartSafe', '{protocol}', '{subject}', '{settings}'); "
        "disp('ACADEMY_PROTOCOL_COMPLETE'); "
        "catch e, disp(['ACADEMY_PROTOCOL_FAILED ' e.message]); end"};
    std::string stop_protocol{"RunProtocol('Stop');"};
};

struct EngineSection {
    std::vector<std::string> command{"matlab", "-nodesktop", "-nosplash"};
    std::chrono::milliseconds launch_timeout{30000};
    std::chrono::milliseconds stop_grace{10000};
    bool interrupt_on_stop_protocol{true};
    bool console_visible_on_start{true};
    EngineTemplates templates;
    std::string ready_marker{"ACADEMY_READY"};
    std::string launch_failed_marker{"ACADEMY_LAUNCH_FAILED"};
};

struct WatcherSection {
    std::chrono::milliseconds poll_interval{250};
    std::chrono::seconds protocol_timeout{86400};
    std::string completion_marker{"ACADEMY_PROTOCOL_COMPLETE"};
    std::string failure_marker{"ACADEMY_PROTOCOL_FAILED"};
};

struct PortsSection {
    std::filesystem::path by_id_dir{"/dev/serial/by-id"};
};

struct LoggingSection {
    std::string level{"info"};
    std::string file;
};

struct ControlServerConfig {
    std::filesystem::path academy_dir;
    ServerSection server;
    EngineSection engine;
    WatcherSection watcher;
    PortsSection ports;
    LoggingSection logging;

    std::filesystem::path registry_file() const;
    std::filesystem::path log_dir() const;
    std::filesystem::path server_log_file() const;
};

ControlServerConfig load_config(const std::string& path);

ControlServerConfig parse_config(const std::string& yaml_text);

void resolve_academy_dir(ControlServerConfig& config);

}  // namespace academy::control
