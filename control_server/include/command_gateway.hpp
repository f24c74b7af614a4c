#pragma once

#include <string>

#include <nlohmann/json.hpp>

#include "academy/common/device_state.hpp"
#include "command_router.hpp"
#include "ws_server.hpp"

namespace academy::control {

class CommandGateway {
public:
    CommandGateway(WsServer& ws_server, CommandRouter& router);

    void handle_open(WsServer::SessionId session_id, common::ClientRole role);
    void handle_close(WsServer::SessionId session_id);
    void handle_message(const nlohmann::json& message, WsServer::SessionId session_id);

    void publish_snapshot(const common::StateSnapshot& snapshot);
    void publish_removed(const std::string& box_id);
    void publish_closing();

    nlohmann::json full_sync() const;

private:
    void handle_command(const nlohmann::json& message, WsServer::SessionId session_id);
    void send_error(WsServer::SessionId session_id, const std::string& request_id, common::ErrorCode code,
                    const std::string& message);

    WsServer& ws_server_;
    CommandRouter& router_;
};

}  // namespace academy::control
