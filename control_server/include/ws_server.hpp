#pragma once

#include <atomic>
#include <cstdint>
#include <functional>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <unordered_map>
#include <vector>

#include <boost/asio/io_context.hpp>
#include <boost/asio/ip/tcp.hpp>
#include <nlohmann/json.hpp>

#include "academy/common/device_state.hpp"

namespace academy::control {

// WebSocket endpoint. Each connection runs on its own strand with a bounded send queue;
// broadcasts reach a connection only after it has been marked joined.
class WsServer {
public:
    using SessionId = std::uint64_t;
    using Json = nlohmann::json;
    using OpenHandler = std::function<void(SessionId, common::ClientRole)>;
    using CloseHandler = std::function<void(SessionId)>;
    using MessageHandler = std::function<void(const Json&, SessionId)>;
    using ResyncProvider = std::function<Json()>;

    WsServer(boost::asio::io_context& io_context,
             std::size_t send_queue_limit = 256,
             std::vector<std::string> local_addresses = {});
    ~WsServer();

    WsServer(const WsServer&) = delete;
    WsServer& operator=(const WsServer&) = delete;

    void set_open_handler(OpenHandler handler);
    void set_close_handler(CloseHandler handler);
    void set_message_handler(MessageHandler handler);

    void set_resync_provider(ResyncProvider provider);

    void start(const std::string& host, std::uint16_t port);
    void stop();

    // Port actually bound; differs from the requested one when that was 0.
    std::uint16_t port() const;

    void send(SessionId session_id, const Json& message);
    void broadcast(const Json& message);
    void mark_joined(SessionId session_id);

    std::optional<common::ClientRole> role(SessionId session_id) const;
    std::size_t session_count() const;

private:
    class Session;

    void do_accept();
    void on_session_open(SessionId session_id, common::ClientRole role);
    void on_session_message(SessionId session_id, const std::string& text);
    void on_session_closed(SessionId session_id);
    common::ClientRole classify(const boost::asio::ip::address& address) const;

    boost::asio::io_context& io_context_;
    boost::asio::ip::tcp::acceptor acceptor_;
    const std::size_t send_queue_limit_;
    std::vector<std::string> local_addresses_;

    OpenHandler open_handler_;
    CloseHandler close_handler_;
    MessageHandler message_handler_;
    ResyncProvider resync_provider_;

    mutable std::mutex sessions_mutex_;
    std::unordered_map<SessionId, std::shared_ptr<Session>> sessions_;
    std::atomic_uint64_t next_session_id_{0};
    std::atomic_bool running_{false};
};

}  // namespace academy::control
