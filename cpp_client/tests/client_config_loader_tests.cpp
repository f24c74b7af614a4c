#include <catch2/catch_test_macros.hpp>

#include <chrono>
#include <filesystem>
#include <fstream>
#include <stdexcept>
#include <string>
#include <vector>

#include "academy/cli/config_loader.hpp"

namespace {

class ConfigFile {
public:
  explicit ConfigFile(const std::string &content) {
    path_ = std::filesystem::temp_directory_path() /
            ("academy-client-" +
             std::to_string(std::chrono::steady_clock::now()
                                .time_since_epoch()
                                .count()) +
             ".yaml");
    std::ofstream out(path_);
    out << content;
  }
  ~ConfigFile() {
    std::error_code ec;
    std::filesystem::remove(path_, ec);
  }
  std::string path() const { return path_.string(); }

private:
  std::filesystem::path path_;
};

academy::cli::Options parse(std::vector<std::string> args) {
  args.insert(args.begin(), "academy-client");
  std::vector<char *> argv;
  for (auto &arg : args) {
    argv.push_back(arg.data());
  }
  return academy::cli::parse_options(static_cast<int>(argv.size()),
                                     argv.data());
}

} // namespace

TEST_CASE("Defaults target the local server", "[client_config]") {
  const auto options = parse({});
  CHECK(options.host == "127.0.0.1");
  CHECK(options.port == "5555");
  CHECK(options.endpoint == "/ws");
  CHECK(options.command_timeout == std::chrono::milliseconds(40000));
}

TEST_CASE("Command-line values override the config file", "[client_config]") {
  ConfigFile file("host: rig-01.lab\n"
                  "port: 6000\n"
                  "endpoint: /academy\n"
                  "command_timeout_ms: 1500\n");

  const auto from_file = parse({"--config", file.path()});
  CHECK(from_file.host == "rig-01.lab");
  CHECK(from_file.port == "6000");
  CHECK(from_file.endpoint == "/academy");
  CHECK(from_file.command_timeout == std::chrono::milliseconds(1500));

  const auto overridden =
      parse({"-p", "7000", "--config", file.path(), "--timeout-ms", "250"});
  CHECK(overridden.host == "rig-01.lab");
  CHECK(overridden.port == "7000");
  CHECK(overridden.command_timeout == std::chrono::milliseconds(250));
}

TEST_CASE("Bad client configuration is rejected", "[client_config]") {
  CHECK_THROWS_AS(parse({"--verbose"}), std::runtime_error);
  CHECK_THROWS_AS(parse({"--timeout-ms", "0"}), std::runtime_error);

  ConfigFile nested("host:\n  name: rig\n");
  CHECK_THROWS_AS(parse({"--config", nested.path()}), std::runtime_error);

  ConfigFile list("- 127.0.0.1\n");
  CHECK_THROWS_AS(parse({"--config", list.path()}), std::runtime_error);
}
