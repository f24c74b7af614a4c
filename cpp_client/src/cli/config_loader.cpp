#include "academy/cli/config_loader.hpp"

#include <cstdlib>
#include <iostream>
#include <optional>
#include <stdexcept>

#include <yaml-cpp/yaml.h>

namespace academy::cli {

namespace {

template <typename T>
T scalar_or_throw(const YAML::Node &node, const std::string &field) {
  if (!node || !node.IsScalar()) {
    throw std::runtime_error("Field '" + field + "' must be a scalar");
  }
  return node.as<T>();
}

} // namespace

void print_usage(const char *argv0) {
  std::cout << "Usage: " << argv0
            << " [--config client.yaml] [--host H] [--port P]"
               " [--endpoint /ws] [--timeout-ms N]\n";
}

void load_client_config(const std::string &path, Options &options) {
  YAML::Node root = YAML::LoadFile(path);
  if (!root.IsMap()) {
    throw std::runtime_error(path + " must contain a mapping");
  }
  if (root["host"]) {
    options.host = scalar_or_throw<std::string>(root["host"], "host");
  }
  if (root["port"]) {
    options.port = scalar_or_throw<std::string>(root["port"], "port");
  }
  if (root["endpoint"]) {
    options.endpoint = scalar_or_throw<std::string>(root["endpoint"], "endpoint");
  }
  if (root["command_timeout_ms"]) {
    options.command_timeout = std::chrono::milliseconds(
        scalar_or_throw<long>(root["command_timeout_ms"], "command_timeout_ms"));
  }
}

Options parse_options(int argc, char **argv) {
  Options opt;
  std::optional<std::string> config_path;
  std::optional<std::string> host;
  std::optional<std::string> port;
  std::optional<std::string> endpoint;
  std::optional<long> timeout_ms;

  for (int i = 1; i < argc; ++i) {
    std::string arg = argv[i];
    if (arg == "--config" && i + 1 < argc) {
      config_path = argv[++i];
    } else if (arg == "--host" && i + 1 < argc) {
      host = argv[++i];
    } else if ((arg == "--port" || arg == "-p") && i + 1 < argc) {
      port = argv[++i];
    } else if (arg == "--endpoint" && i + 1 < argc) {
      endpoint = argv[++i];
    } else if (arg == "--timeout-ms" && i + 1 < argc) {
      timeout_ms = std::stol(argv[++i]);
    } else if (arg == "--help" || arg == "-h") {
      print_usage(argv[0]);
      std::exit(0);
    } else {
      throw std::runtime_error("Unknown argument: " + arg);
    }
  }

  if (config_path) {
    load_client_config(*config_path, opt);
  }
  if (host) {
    opt.host = *host;
  }
  if (port) {
    opt.port = *port;
  }
  if (endpoint) {
    opt.endpoint = *endpoint;
  }
  if (timeout_ms) {
    if (*timeout_ms <= 0) {
      throw std::runtime_error("--timeout-ms must be positive");
    }
    opt.command_timeout = std::chrono::milliseconds(*timeout_ms);
  }
  return opt;
}

} // namespace academy::cli
