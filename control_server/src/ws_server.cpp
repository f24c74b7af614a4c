#include "ws_server.hpp"

#include <deque>
#include <utility>

#include <boost/asio/dispatch.hpp>
#include <boost/asio/post.hpp>
#include <boost/asio/strand.hpp>
#include <boost/beast/core.hpp>
#include <boost/beast/http.hpp>
#include <boost/beast/websocket.hpp>

#include "academy/common/wire_format.hpp"
#include "util/logging.hpp"

namespace academy::control {

namespace {
namespace beast = boost::beast;
namespace websocket = beast::websocket;
namespace asio = boost::asio;
using tcp = asio::ip::tcp;

std::shared_ptr<const std::string> serialize(const nlohmann::json& message) {
    return std::make_shared<const std::string>(
        message.dump(-1, ' ', false, nlohmann::json::error_handler_t::replace));
}
}  // namespace

class WsServer::Session : public std::enable_shared_from_this<WsServer::Session> {
public:
    Session(WsServer& server, tcp::socket socket, SessionId id, common::ClientRole role)
        : server_(server), ws_(std::move(socket)), id_(id), role_(role) {}

    common::ClientRole role() const { return role_; }
    bool joined() const { return joined_.load(); }
    void set_joined() { joined_ = true; }

    void run() {
        asio::dispatch(ws_.get_executor(), [self = shared_from_this()] { self->do_handshake(); });
    }

    void send(std::shared_ptr<const std::string> payload) {
        asio::post(ws_.get_executor(), [self = shared_from_this(), payload = std::move(payload)]() mutable {
            self->enqueue(std::move(payload));
        });
    }

    void close() {
        asio::post(ws_.get_executor(), [self = shared_from_this()] {
            if (self->closing_ || self->finished_) {
                return;
            }
            self->closing_ = true;
            if (!self->open_) {
                beast::error_code ec;
                beast::get_lowest_layer(self->ws_).socket().close(ec);
                return;
            }
            if (!self->writing_) {
                self->do_close();
            }
        });
    }

private:
    void do_handshake() {
        ws_.set_option(websocket::stream_base::timeout::suggested(beast::role_type::server));
        ws_.set_option(websocket::stream_base::decorator([](websocket::response_type& res) {
            res.set(beast::http::field::server, "academy-control-server");
        }));
        ws_.async_accept(beast::bind_front_handler(&Session::on_handshake, shared_from_this()));
    }

    void on_handshake(beast::error_code ec) {
        if (ec) {
            util::log::warn("Client " + std::to_string(id_) + " handshake failed: " + ec.message());
            finish();
            return;
        }
        ws_.text(true);
        open_ = true;
        server_.on_session_open(id_, role_);
        if (!queue_.empty()) {
            do_write();
        }
        do_read();
    }

    void do_read() {
        ws_.async_read(buffer_, beast::bind_front_handler(&Session::on_read, shared_from_this()));
    }

    void on_read(beast::error_code ec, std::size_t) {
        if (ec) {
            if (ec != websocket::error::closed && ec != asio::error::operation_aborted) {
                util::log::debug("Client " + std::to_string(id_) + " read error: " + ec.message());
            }
            finish();
            return;
        }
        auto text = beast::buffers_to_string(buffer_.data());
        buffer_.consume(buffer_.size());
        server_.on_session_message(id_, text);
        do_read();
    }

    void enqueue(std::shared_ptr<const std::string> payload) {
        if (closing_ || finished_) {
            return;
        }
        if (queue_.size() >= server_.send_queue_limit_) {
            util::log::warn("Client " + std::to_string(id_) + " send queue overflow, resyncing");
            std::shared_ptr<const std::string> in_flight;
            if (writing_) {
                in_flight = queue_.front();
            }
            queue_.clear();
            if (in_flight) {
                queue_.push_back(std::move(in_flight));
            }
            if (server_.resync_provider_) {
                queue_.push_back(serialize(server_.resync_provider_()));
            }
        }
        queue_.push_back(std::move(payload));
        if (open_ && !writing_) {
            do_write();
        }
    }

    void do_write() {
        writing_ = true;
        ws_.async_write(asio::buffer(*queue_.front()),
                        beast::bind_front_handler(&Session::on_write, shared_from_this()));
    }

    void on_write(beast::error_code ec, std::size_t) {
        writing_ = false;
        if (ec) {
            util::log::debug("Client " + std::to_string(id_) + " write error: " + ec.message());
            finish();
            return;
        }
        queue_.pop_front();
        if (!queue_.empty()) {
            do_write();
        } else if (closing_) {
            do_close();
        }
    }

    void do_close() {
        ws_.async_close(websocket::close_code::going_away, [self = shared_from_this()](beast::error_code ec) {
            if (ec) {
                util::log::debug("Client " + std::to_string(self->id_) + " close error: " + ec.message());
            }
        });
    }

    void finish() {
        if (finished_) {
            return;
        }
        finished_ = true;
        open_ = false;
        queue_.clear();
        server_.on_session_closed(id_);
    }

    WsServer& server_;
    websocket::stream<beast::tcp_stream> ws_;
    beast::flat_buffer buffer_;
    std::deque<std::shared_ptr<const std::string>> queue_;
    const SessionId id_;
    const common::ClientRole role_;
    std::atomic_bool joined_{false};
    bool open_{false};
    bool writing_{false};
    bool closing_{false};
    bool finished_{false};
};

WsServer::WsServer(boost::asio::io_context& io_context,
                   std::size_t send_queue_limit,
                   std::vector<std::string> local_addresses)
    : io_context_(io_context),
      acceptor_(io_context_),
      send_queue_limit_(send_queue_limit == 0 ? 1 : send_queue_limit),
      local_addresses_(std::move(local_addresses)) {}

WsServer::~WsServer() {
    stop();
}

void WsServer::set_open_handler(OpenHandler handler) {
    open_handler_ = std::move(handler);
}

void WsServer::set_close_handler(CloseHandler handler) {
    close_handler_ = std::move(handler);
}

void WsServer::set_message_handler(MessageHandler handler) {
    message_handler_ = std::move(handler);
}

void WsServer::set_resync_provider(ResyncProvider provider) {
    resync_provider_ = std::move(provider);
}

void WsServer::start(const std::string& host, std::uint16_t port) {
    const tcp::endpoint endpoint(asio::ip::make_address(host), port);
    acceptor_.open(endpoint.protocol());
    acceptor_.set_option(asio::socket_base::reuse_address(true));
    acceptor_.bind(endpoint);
    acceptor_.listen(asio::socket_base::max_listen_connections);
    running_ = true;
    util::log::info("WebSocket server listening on " + host + ":" + std::to_string(this->port()));
    do_accept();
}

void WsServer::stop() {
    bool expected = true;
    if (!running_.compare_exchange_strong(expected, false)) {
        return;
    }
    beast::error_code ec;
    acceptor_.close(ec);
    if (ec) {
        util::log::warn("Failed to close acceptor: " + ec.message());
    }

    std::vector<std::shared_ptr<Session>> sessions;
    {
        std::lock_guard lock(sessions_mutex_);
        for (auto& [id, session] : sessions_) {
            sessions.push_back(session);
        }
    }
    for (auto& session : sessions) {
        session->close();
    }
}

std::uint16_t WsServer::port() const {
    beast::error_code ec;
    const auto endpoint = acceptor_.local_endpoint(ec);
    return ec ? 0 : endpoint.port();
}

void WsServer::do_accept() {
    acceptor_.async_accept(asio::make_strand(io_context_), [this](beast::error_code ec, tcp::socket socket) {
        if (ec) {
            if (ec == asio::error::operation_aborted || !running_) {
                return;
            }
            util::log::warn("Accept failed: " + ec.message());
        } else {
            beast::error_code endpoint_ec;
            const auto remote = socket.remote_endpoint(endpoint_ec);
            if (endpoint_ec) {
                util::log::warn("Dropping connection without peer address: " + endpoint_ec.message());
            } else {
                const auto role = classify(remote.address());
                const auto id = ++next_session_id_;
                auto session = std::make_shared<Session>(*this, std::move(socket), id, role);
                {
                    std::lock_guard lock(sessions_mutex_);
                    sessions_[id] = session;
                }
                util::log::info("Client " + std::to_string(id) + " connected from " + remote.address().to_string() +
                                " (" + std::string(common::to_string(role)) + ")");
                session->run();
            }
        }
        if (running_) {
            do_accept();
        }
    });
}

void WsServer::send(SessionId session_id, const Json& message) {
    std::shared_ptr<Session> session;
    {
        std::lock_guard lock(sessions_mutex_);
        auto it = sessions_.find(session_id);
        if (it == sessions_.end()) {
            return;
        }
        session = it->second;
    }
    session->send(serialize(message));
}

void WsServer::broadcast(const Json& message) {
    const auto payload = serialize(message);
    std::lock_guard lock(sessions_mutex_);
    for (auto& [id, session] : sessions_) {
        if (session->joined()) {
            session->send(payload);
        }
    }
}

void WsServer::mark_joined(SessionId session_id) {
    std::lock_guard lock(sessions_mutex_);
    auto it = sessions_.find(session_id);
    if (it != sessions_.end()) {
        it->second->set_joined();
    }
}

std::optional<common::ClientRole> WsServer::role(SessionId session_id) const {
    std::lock_guard lock(sessions_mutex_);
    auto it = sessions_.find(session_id);
    if (it == sessions_.end()) {
        return std::nullopt;
    }
    return it->second->role();
}

std::size_t WsServer::session_count() const {
    std::lock_guard lock(sessions_mutex_);
    return sessions_.size();
}

void WsServer::on_session_open(SessionId session_id, common::ClientRole role) {
    if (open_handler_) {
        open_handler_(session_id, role);
    }
}

void WsServer::on_session_message(SessionId session_id, const std::string& text) {
    auto message = Json::parse(text, nullptr, false);
    if (message.is_discarded()) {
        util::log::warn("Client " + std::to_string(session_id) + " sent malformed JSON");
        send(session_id, common::make_ack_message(common::CommandResult::failure(
                             "", common::ErrorCode::BadRequest, "malformed JSON")));
        return;
    }
    if (message_handler_) {
        message_handler_(message, session_id);
    }
}

void WsServer::on_session_closed(SessionId session_id) {
    {
        std::lock_guard lock(sessions_mutex_);
        if (sessions_.erase(session_id) == 0) {
            return;
        }
    }
    util::log::info("Client " + std::to_string(session_id) + " disconnected");
    if (close_handler_) {
        close_handler_(session_id);
    }
}

common::ClientRole WsServer::classify(const boost::asio::ip::address& address) const {
    auto normalized = address;
    if (address.is_v6() && address.to_v6().is_v4_mapped()) {
        normalized = asio::ip::make_address_v4(asio::ip::v4_mapped, address.to_v6());
    }
    if (normalized.is_loopback()) {
        return common::ClientRole::Local;
    }
    const auto text = normalized.to_string();
    for (const auto& local : local_addresses_) {
        if (local == text) {
            return common::ClientRole::Local;
        }
    }
    return common::ClientRole::Remote;
}

}  // namespace academy::control
