#pragma once

#include <chrono>
#include <string>

namespace academy::cli {

struct Options {
  std::string host = "127.0.0.1";
  std::string port = "5555";
  std::string endpoint = "/ws";
  std::chrono::milliseconds command_timeout{40000};
};

Options parse_options(int argc, char **argv);
void load_client_config(const std::string &path, Options &options);
void print_usage(const char *argv0);

} // namespace academy::cli
