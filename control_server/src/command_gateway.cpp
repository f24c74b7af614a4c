#include "command_gateway.hpp"

#include "academy/common/errors.hpp"
#include "academy/common/wire_format.hpp"
#include "util/logging.hpp"

namespace academy::control {

CommandGateway::CommandGateway(WsServer& ws_server, CommandRouter& router)
    : ws_server_(ws_server), router_(router) {}

// Hello and the full snapshot are sent on the router strand, and the session joins the
// broadcast stream there too, so no state change falls between the two.
void CommandGateway::handle_open(WsServer::SessionId session_id, common::ClientRole role) {
    router_.post([this, session_id, role] {
        ws_server_.send(session_id, common::make_hello_message(session_id, role));
        ws_server_.send(session_id, full_sync());
        ws_server_.mark_joined(session_id);
    });
}

void CommandGateway::handle_close(WsServer::SessionId session_id) {
    util::log::debug("Session " + std::to_string(session_id) + " closed; " +
                     std::to_string(ws_server_.session_count()) + " remaining");
}

void CommandGateway::handle_message(const nlohmann::json& message, WsServer::SessionId session_id) {
    const auto type = message.is_object() ? message.value("type", "") : std::string();
    if (type == "command") {
        handle_command(message, session_id);
    } else if (type == "sync") {
        router_.post([this, session_id] { ws_server_.send(session_id, full_sync()); });
    } else {
        util::log::warn("Session " + std::to_string(session_id) + " sent unsupported message type '" + type + "'");
        send_error(session_id, "", common::ErrorCode::BadRequest, "unsupported message type '" + type + "'");
    }
}

void CommandGateway::handle_command(const nlohmann::json& message, WsServer::SessionId session_id) {
    const auto role = ws_server_.role(session_id);
    if (!role) {
        return;
    }

    common::CommandRequest request;
    try {
        request = common::parse_command_message(message);
    } catch (const common::AcademyError& e) {
        std::string request_id;
        if (auto it = message.find("request_id"); it != message.end() && it->is_string()) {
            request_id = it->get<std::string>();
        }
        send_error(session_id, request_id, e.code(), e.what());
        return;
    }
    request.origin_client = session_id;
    request.origin_role = *role;

    util::log::info("Session " + std::to_string(session_id) + " -> " + std::string(common::to_string(request.verb)) +
                    (request.device.empty() ? std::string() : " " + request.device));
    router_.submit(std::move(request), [this, session_id](const common::CommandResult& result) {
        ws_server_.send(session_id, common::make_ack_message(result));
    });
}

void CommandGateway::publish_snapshot(const common::StateSnapshot& snapshot) {
    ws_server_.broadcast(common::make_state_message(snapshot));
}

void CommandGateway::publish_removed(const std::string& box_id) {
    ws_server_.broadcast(common::make_removed_message(box_id));
}

void CommandGateway::publish_closing() {
    ws_server_.broadcast(common::make_server_closing_message());
}

nlohmann::json CommandGateway::full_sync() const {
    return common::make_full_sync_message(router_.snapshots());
}

void CommandGateway::send_error(WsServer::SessionId session_id, const std::string& request_id,
                                common::ErrorCode code, const std::string& message) {
    ws_server_.send(session_id, common::make_ack_message(common::CommandResult::failure(request_id, code, message)));
}

}  // namespace academy::control
