#include "academy/client/client_session.hpp"

#include <iostream>
#include <stdexcept>
#include <unistd.h>

#include <boost/asio/connect.hpp>
#include <boost/beast/core.hpp>
#include <boost/beast/http.hpp>

#include "academy/common/errors.hpp"
#include "academy/common/wire_format.hpp"

namespace academy::client {

namespace {
namespace beast = boost::beast;
namespace websocket = beast::websocket;
namespace asio = boost::asio;
using tcp = asio::ip::tcp;
} // namespace

ClientSession::ClientSession(std::string host, std::string port,
                             std::string endpoint)
    : host_(std::move(host)),
      port_(std::move(port)),
      endpoint_(std::move(endpoint)),
      resolver_(io_context_) {}

ClientSession::~ClientSession() {
  try {
    close();
  } catch (const std::exception &ex) {
    log(std::string("Error while closing session: ") + ex.what());
  }
}

void ClientSession::set_message_handler(MessageHandler handler) {
  message_handler_ = std::move(handler);
}

void ClientSession::set_log_handler(LogHandler handler) {
  log_handler_ = std::move(handler);
}

void ClientSession::connect() {
  if (connected_) {
    return;
  }
  if (reader_thread_.joinable()) {
    reader_thread_.join();
  }

  websocket_ = std::make_unique<websocket_t>(io_context_);
  auto const results = resolver_.resolve(host_, port_);
  auto const endpoint = asio::connect(websocket_->next_layer(), results);
  std::string host_header = host_ + ":" + std::to_string(endpoint.port());

  websocket_->set_option(
      websocket::stream_base::timeout::suggested(beast::role_type::client));
  websocket_->set_option(websocket::stream_base::decorator(
      [](websocket::request_type &req) {
        req.set(beast::http::field::user_agent, "academy-client/1.0");
      }));
  websocket_->handshake(host_header, endpoint_);
  websocket_->text(true);

  server_closing_ = false;
  connected_ = true;
  running_ = true;
  reader_thread_ = std::thread([this] { reader_loop(); });

  log("WebSocket connected to " + host_header + endpoint_);
  request_sync();
}

void ClientSession::reconnect() {
  close();
  connect();
}

void ClientSession::close() {
  if (!connected_) {
    if (reader_thread_.joinable()) {
      reader_thread_.join();
    }
    return;
  }

  running_ = false;
  beast::error_code ec;
  {
    std::lock_guard<std::mutex> lock(write_mutex_);
    websocket_->close(websocket::close_code::normal, ec);
  }
  if (ec) {
    log("WebSocket close error: " + ec.message());
  }

  if (reader_thread_.joinable()) {
    reader_thread_.join();
  }

  connected_ = false;
  fail_pending("connection closed");
  log("WebSocket closed");
}

void ClientSession::ensure_connected() const {
  if (!connected_) {
    throw std::runtime_error("WebSocket is not connected");
  }
}

std::string ClientSession::next_request_id() {
  std::lock_guard<std::mutex> lock(state_mutex_);
  return "c" + std::to_string(::getpid()) + "-" +
         std::to_string(++request_counter_);
}

std::string ClientSession::send(const std::string &device, common::Verb verb,
                                const Json &args) {
  ensure_connected();
  const auto request_id = next_request_id();
  send_json(common::make_command_message(request_id, device, verb, args));
  return request_id;
}

common::CommandResult ClientSession::execute(const std::string &device,
                                             common::Verb verb,
                                             const Json &args,
                                             std::chrono::milliseconds timeout) {
  ensure_connected();
  const auto request_id = next_request_id();
  std::future<common::CommandResult> result;
  {
    std::lock_guard<std::mutex> lock(state_mutex_);
    result = pending_[request_id].get_future();
  }

  try {
    send_json(common::make_command_message(request_id, device, verb, args));
  } catch (...) {
    std::lock_guard<std::mutex> lock(state_mutex_);
    pending_.erase(request_id);
    throw;
  }

  if (result.wait_for(timeout) != std::future_status::ready) {
    std::lock_guard<std::mutex> lock(state_mutex_);
    pending_.erase(request_id);
    throw common::AcademyError(common::ErrorCode::Timeout,
                               "no acknowledgment for " + request_id);
  }
  return result.get();
}

void ClientSession::request_sync() {
  ensure_connected();
  send_json(common::make_sync_request());
}

std::optional<std::uint64_t> ClientSession::connection_id() const {
  std::lock_guard<std::mutex> lock(state_mutex_);
  return connection_id_;
}

std::optional<common::ClientRole> ClientSession::role() const {
  std::lock_guard<std::mutex> lock(state_mutex_);
  return role_;
}

void ClientSession::reader_loop() {
  beast::flat_buffer buffer;
  while (running_) {
    beast::error_code ec;
    websocket_->read(buffer, ec);
    if (ec == websocket::error::closed) {
      break;
    }
    if (ec) {
      if (running_) {
        log("WebSocket read error: " + ec.message());
      }
      break;
    }

    auto payload_text = beast::buffers_to_string(buffer.data());
    buffer.consume(buffer.size());
    dispatch_message(payload_text);
  }

  running_ = false;
  connected_ = false;
  fail_pending("connection lost");
}

void ClientSession::dispatch_message(const std::string &payload_text) {
  Json json;
  try {
    json = Json::parse(payload_text);
    const auto type = json.value("type", "");
    if (type == "ack") {
      auto result = common::parse_ack_message(json);
      std::lock_guard<std::mutex> lock(state_mutex_);
      auto it = pending_.find(result.request_id);
      if (it != pending_.end()) {
        it->second.set_value(std::move(result));
        pending_.erase(it);
      }
    } else if (type == "hello") {
      std::lock_guard<std::mutex> lock(state_mutex_);
      connection_id_ = json.value("connection_id", std::uint64_t{0});
      role_ = common::client_role_from_string(json.value("role", ""));
    } else if (type == "server_closing") {
      server_closing_ = true;
    } else {
      view_.apply(json);
    }
  } catch (const std::exception &ex) {
    log(std::string("Failed to handle message: ") + ex.what());
    return;
  }

  if (message_handler_) {
    message_handler_(json);
  }
}

void ClientSession::send_json(const Json &message) {
  const std::string serialized = message.dump();
  std::lock_guard<std::mutex> lock(write_mutex_);
  beast::error_code ec;
  websocket_->write(boost::asio::buffer(serialized), ec);
  if (ec) {
    throw beast::system_error(ec);
  }
}

void ClientSession::fail_pending(const std::string &reason) {
  std::lock_guard<std::mutex> lock(state_mutex_);
  for (auto &[request_id, promise] : pending_) {
    promise.set_exception(
        std::make_exception_ptr(std::runtime_error(reason)));
  }
  pending_.clear();
}

void ClientSession::log(const std::string &message) const {
  if (log_handler_) {
    log_handler_(message);
  } else {
    std::cout << "[academy-client] " << message << std::endl;
  }
}

} // namespace academy::client
