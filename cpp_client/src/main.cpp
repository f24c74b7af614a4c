#include "academy/cli/config_loader.hpp"
#include "academy/client/client_session.hpp"
#include "academy/common/errors.hpp"

#include <iomanip>
#include <iostream>
#include <sstream>
#include <string>
#include <vector>

#include <nlohmann/json.hpp>

using Json = nlohmann::json;
using academy::client::ClientSession;
using academy::common::CommandResult;
using academy::common::StateSnapshot;
using academy::common::Verb;

namespace {

std::vector<std::string> tokenize(const std::string &line) {
  std::istringstream iss(line);
  std::vector<std::string> tokens;
  std::string token;
  while (iss >> token) {
    tokens.push_back(token);
  }
  return tokens;
}

void print_help() {
  std::cout
      << "Commands:\n"
      << "  help                               Show this message\n"
      << "  status                             Show every known device\n"
      << "  start <box>                        Launch the engine for a box\n"
      << "  stop <box>                         Stop the engine\n"
      << "  run <box> <protocol> <subject> [settings]\n"
      << "                                     Run a protocol\n"
      << "  stop-protocol <box>                Stop the running protocol\n"
      << "  console <box> on|off               Show or hide the engine console\n"
      << "  calibrate <box>                    Open the calibration tool\n"
      << "  query <box>                        Print the server's snapshot\n"
      << "  add <box> <locator>                Register a device\n"
      << "  remove <box>                       Unregister a stopped device\n"
      << "  locator <box> <locator>            Change a device's serial locator\n"
      << "  ports                              List serial ports on the server\n"
      << "  sync                               Request a full snapshot\n"
      << "  reconnect                          Reconnect and resync\n"
      << "  exit / quit                        Close the session\n";
}

std::string describe_session(const StateSnapshot &snapshot) {
  if (snapshot.active_session) {
    const auto &session = *snapshot.active_session;
    return session.protocol + "/" + session.subject;
  }
  if (snapshot.last_session) {
    const auto &session = *snapshot.last_session;
    return "(" + std::string(academy::common::to_string(session.status)) + " " +
           session.protocol + ")";
  }
  return "-";
}

void print_status(const std::vector<StateSnapshot> &snapshots) {
  if (snapshots.empty()) {
    std::cout << "No device state available yet.\n";
    return;
  }
  std::cout << std::left << std::setw(10) << "Box" << std::setw(22)
            << "Locator" << std::setw(18) << "State" << std::setw(9)
            << "Console" << std::setw(26) << "Session"
            << "Last error\n";
  for (const auto &snapshot : snapshots) {
    std::cout << std::left << std::setw(10) << snapshot.box_id
              << std::setw(22) << snapshot.serial_locator << std::setw(18)
              << academy::common::to_string(snapshot.state) << std::setw(9)
              << (snapshot.gui_visible ? "shown" : "hidden") << std::setw(26)
              << describe_session(snapshot)
              << snapshot.last_error.value_or("-") << "\n";
  }
}

void print_received(const Json &json) {
  const auto type = json.value("type", "");
  if (type == "state" && json.contains("device")) {
    const auto &device = json["device"];
    std::cout << "[STATE][" << device.value("box_id", "?") << "] "
              << device.value("state", "?");
    if (device.contains("last_error") && device["last_error"].is_string()) {
      std::cout << " error=" << device["last_error"].get<std::string>();
    }
    std::cout << std::endl;
  } else if (type == "ack") {
    // Acknowledgments are printed by the command that sent them.
  } else {
    std::cout << "[RECV] " << json.dump() << std::endl;
  }
}

void print_result(const CommandResult &result) {
  if (result.ok) {
    std::cout << "OK";
    if (!result.result.empty()) {
      std::cout << " " << result.result.dump();
    }
    std::cout << std::endl;
  } else {
    std::cout << "FAILED "
              << (result.error ? academy::common::to_string(*result.error)
                               : std::string_view("unknown"))
              << ": " << result.message << std::endl;
  }
}

bool parse_on_off(const std::string &value) {
  if (value == "on" || value == "1" || value == "true") {
    return true;
  }
  if (value == "off" || value == "0" || value == "false") {
    return false;
  }
  throw std::runtime_error("Expected on or off, got: " + value);
}

} // namespace

int main(int argc, char **argv) {
  try {
    const auto options = academy::cli::parse_options(argc, argv);

    ClientSession session(options.host, options.port, options.endpoint);
    session.set_message_handler([](const Json &json) { print_received(json); });
    session.connect();

    auto execute = [&](const std::string &device, Verb verb,
                       const Json &args = Json::object()) {
      print_result(
          session.execute(device, verb, args, options.command_timeout));
    };

    print_help();
    std::string line;
    while (std::cout << "> " && std::getline(std::cin, line)) {
      auto tokens = tokenize(line);
      if (tokens.empty()) {
        continue;
      }
      const std::string &cmd = tokens.front();
      try {
        if (cmd == "help") {
          print_help();
        } else if (cmd == "status") {
          print_status(session.view().devices());
        } else if (cmd == "start" && tokens.size() >= 2) {
          execute(tokens[1], Verb::Start);
        } else if (cmd == "stop" && tokens.size() >= 2) {
          execute(tokens[1], Verb::Stop);
        } else if (cmd == "run" && tokens.size() >= 4) {
          Json args{{"protocol", tokens[2]}, {"subject", tokens[3]}};
          if (tokens.size() >= 5) {
            args["settings"] = tokens[4];
          }
          execute(tokens[1], Verb::RunProtocol, args);
        } else if (cmd == "stop-protocol" && tokens.size() >= 2) {
          execute(tokens[1], Verb::StopProtocol);
        } else if (cmd == "console" && tokens.size() >= 3) {
          execute(tokens[1], Verb::SetConsoleVisible,
                  Json{{"visible", parse_on_off(tokens[2])}});
        } else if (cmd == "calibrate" && tokens.size() >= 2) {
          execute(tokens[1], Verb::Calibrate);
        } else if (cmd == "query" && tokens.size() >= 2) {
          execute(tokens[1], Verb::Query);
        } else if (cmd == "add" && tokens.size() >= 3) {
          execute(tokens[1], Verb::AddDevice,
                  Json{{"serial_locator", tokens[2]}});
        } else if (cmd == "remove" && tokens.size() >= 2) {
          execute(tokens[1], Verb::RemoveDevice);
        } else if (cmd == "locator" && tokens.size() >= 3) {
          execute(tokens[1], Verb::ChangeLocator,
                  Json{{"serial_locator", tokens[2]}});
        } else if (cmd == "ports") {
          execute("", Verb::ListPorts);
        } else if (cmd == "sync") {
          session.request_sync();
        } else if (cmd == "reconnect") {
          session.reconnect();
        } else if (cmd == "exit" || cmd == "quit") {
          break;
        } else {
          std::cout << "Unknown command. Type 'help' for options.\n";
        }
      } catch (const std::exception &ex) {
        std::cout << "Command error: " << ex.what() << std::endl;
      }
      if (session.server_closing()) {
        std::cout << "Server is shutting down.\n";
      }
    }
    session.close();
  } catch (const std::exception &ex) {
    std::cerr << "Fatal error: " << ex.what() << std::endl;
    academy::cli::print_usage(argv[0]);
    return 1;
  }

  return 0;
}
