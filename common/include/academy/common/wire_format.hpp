#pragma once

#include <chrono>
#include <cstdint>
#include <string>
#include <vector>

#include <nlohmann/json.hpp>

#include "academy/common/device_state.hpp"

namespace academy::common {

using Json = nlohmann::json;

std::string format_timestamp(std::chrono::system_clock::time_point tp);
std::chrono::system_clock::time_point parse_timestamp(const std::string& iso);

Json to_json(const ProtocolSession& session);
ProtocolSession session_from_json(const Json& node);

Json to_json(const StateSnapshot& snapshot);
StateSnapshot snapshot_from_json(const Json& node);

// Server -> client messages.
Json make_hello_message(std::uint64_t connection_id, ClientRole role);
Json make_full_sync_message(const std::vector<StateSnapshot>& snapshots);
Json make_state_message(const StateSnapshot& snapshot);
Json make_removed_message(const std::string& box_id);
Json make_ack_message(const CommandResult& result);
Json make_server_closing_message();

// Client -> server messages.
Json make_command_message(const std::string& request_id,
                          const std::string& device,
                          Verb verb,
                          const Json& args = Json::object());
Json make_sync_request();

// Builds a CommandRequest from a "command" message; throws AcademyError(BadRequest).
CommandRequest parse_command_message(const Json& message);

CommandResult parse_ack_message(const Json& message);

}  // namespace academy::common
