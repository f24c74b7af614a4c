#include "util/config_loader.hpp"
#include "test_support.hpp"

#include <cstdlib>
#include <stdexcept>

using academy::control::ControlServerConfig;
using academy::control::parse_config;

TEST_CASE("Config defaults apply when keys are missing", "[config]") {
    const auto config = parse_config("academy_dir: /srv/bpod\n");
    REQUIRE(config.academy_dir == "/srv/bpod");
    REQUIRE(config.server.port == 5555);
    REQUIRE(config.server.send_queue_limit == 256);
    REQUIRE(config.engine.command.front() == "matlab");
    REQUIRE(config.watcher.poll_interval == std::chrono::milliseconds(250));
    REQUIRE(config.registry_file() == std::filesystem::path("/srv/bpod/Academy/AcademyConfig.csv"));
    REQUIRE(config.log_dir() == std::filesystem::path("/srv/bpod/Academy/logs"));
}

TEST_CASE("Config reads every section", "[config]") {
    const auto config = parse_config(R"(
academy_dir: /data
server:
  host: 127.0.0.1
  port: 6000
  local_addresses: [10.0.0.5]
  send_queue_limit: 32
engine:
  command: [/bin/sh, engine.sh]
  launch_timeout_ms: 1500
  stop_grace_ms: 200
  interrupt_on_stop_protocol: false
  templates:
    start: "start {port}"
  markers:
    ready: READY
watcher:
  poll_interval_ms: 50
  protocol_timeout_s: 30
  completion_marker: DONE
ports:
  by_id_dir: /tmp/by-id
logging:
  level: debug
)");
    REQUIRE(config.server.host == "127.0.0.1");
    REQUIRE(config.server.port == 6000);
    REQUIRE(config.server.local_addresses == std::vector<std::string>{"10.0.0.5"});
    REQUIRE(config.server.send_queue_limit == 32);
    REQUIRE(config.engine.command == std::vector<std::string>{"/bin/sh", "engine.sh"});
    REQUIRE(config.engine.launch_timeout == std::chrono::milliseconds(1500));
    REQUIRE(config.engine.stop_grace == std::chrono::milliseconds(200));
    REQUIRE_FALSE(config.engine.interrupt_on_stop_protocol);
    REQUIRE(config.engine.templates.start == "start {port}");
    REQUIRE(config.engine.ready_marker == "READY");
    REQUIRE(config.watcher.poll_interval == std::chrono::milliseconds(50));
    REQUIRE(config.watcher.protocol_timeout == std::chrono::seconds(30));
    REQUIRE(config.watcher.completion_marker == "DONE");
    REQUIRE(config.ports.by_id_dir == "/tmp/by-id");
    REQUIRE(config.logging.level == "debug");
}

TEST_CASE("Config rejects wrong types", "[config]") {
    REQUIRE_THROWS_AS(parse_config("server:\n  port: [1, 2]\n"), std::runtime_error);
    REQUIRE_THROWS_AS(parse_config("server:\n  port: 70000\n"), std::runtime_error);
    REQUIRE_THROWS_AS(parse_config("engine:\n  command: matlab\n"), std::runtime_error);
    REQUIRE_THROWS_AS(parse_config("watcher:\n  poll_interval_ms: soon\n"), std::runtime_error);
}

TEST_CASE("Academy dir falls back to the environment", "[config]") {
    ControlServerConfig config;
    ::setenv("ACADEMY_DIR", "/from/env", 1);
    academy::control::resolve_academy_dir(config);
    ::unsetenv("ACADEMY_DIR");
    REQUIRE(config.academy_dir == "/from/env");
}
