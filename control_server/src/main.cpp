#include <cstdint>
#include <iostream>
#include <stdexcept>
#include <string>
#include <utility>

#include <CLI/CLI.hpp>

#include "app.hpp"
#include "util/config_loader.hpp"

int main(int argc, char** argv) {
    CLI::App app{"Academy control server"};

    std::string config_path;
    std::string academy_dir;
    std::string host;
    std::uint16_t port = 0;
    std::string log_level;

    app.add_option("-c,--config", config_path, "YAML configuration file")->check(CLI::ExistingFile);
    app.add_option("--academy-dir", academy_dir, "Academy root (overrides config, ACADEMY_DIR and BPOD_DIR)");
    app.add_option("--host", host, "Listen address");
    app.add_option("-p,--port", port, "Listen port");
    app.add_option("--log-level", log_level, "trace, debug, info, warn, error");

    try {
        app.parse(argc, argv);
    } catch (const CLI::ParseError& e) {
        return app.exit(e);
    }

    academy::control::ControlServerConfig config;
    try {
        if (!config_path.empty()) {
            config = academy::control::load_config(config_path);
        }
    } catch (const std::exception& ex) {
        std::cerr << ex.what() << std::endl;
        return 1;
    }
    if (!academy_dir.empty()) {
        config.academy_dir = academy_dir;
    }
    if (!host.empty()) {
        config.server.host = host;
    }
    if (port != 0) {
        config.server.port = port;
    }
    if (!log_level.empty()) {
        config.logging.level = log_level;
    }

    return academy::control::run(std::move(config));
}
