#pragma once

#include <atomic>
#include <chrono>
#include <cstdint>
#include <functional>
#include <future>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <thread>
#include <unordered_map>

#include <boost/asio/io_context.hpp>
#include <boost/asio/ip/tcp.hpp>
#include <boost/beast/websocket.hpp>
#include <nlohmann/json.hpp>

#include "academy/client/client_state_view.hpp"
#include "academy/common/device_state.hpp"

namespace academy::client {

class ClientSession {
public:
  using Json = nlohmann::json;
  using MessageHandler = std::function<void(const Json &)>;
  using LogHandler = std::function<void(const std::string &)>;

  ClientSession(std::string host, std::string port, std::string endpoint = "/ws");
  ~ClientSession();

  ClientSession(const ClientSession &) = delete;
  ClientSession &operator=(const ClientSession &) = delete;

  // Called from the reader thread after the view has been updated.
  void set_message_handler(MessageHandler handler);
  void set_log_handler(LogHandler handler);

  void connect();
  void reconnect();
  void close();
  bool connected() const { return connected_; }

  std::string send(const std::string &device, common::Verb verb,
                   const Json &args = Json::object());

  // Sends and waits for the acknowledgment; throws common::AcademyError(Timeout).
  common::CommandResult execute(const std::string &device, common::Verb verb,
                                const Json &args,
                                std::chrono::milliseconds timeout);

  void request_sync();

  const ClientStateView &view() const { return view_; }
  std::optional<std::uint64_t> connection_id() const;
  std::optional<common::ClientRole> role() const;
  bool server_closing() const { return server_closing_; }

private:
  using websocket_t =
      boost::beast::websocket::stream<boost::asio::ip::tcp::socket>;

  void ensure_connected() const;
  void reader_loop();
  void dispatch_message(const std::string &payload_text);
  void send_json(const Json &message);
  void fail_pending(const std::string &reason);
  std::string next_request_id();
  void log(const std::string &message) const;

  std::string host_;
  std::string port_;
  std::string endpoint_;

  boost::asio::io_context io_context_;
  boost::asio::ip::tcp::resolver resolver_;
  std::unique_ptr<websocket_t> websocket_;

  std::atomic<bool> connected_{false};
  std::atomic<bool> running_{false};
  std::atomic<bool> server_closing_{false};
  std::thread reader_thread_;
  mutable std::mutex write_mutex_;

  mutable std::mutex state_mutex_;
  std::optional<std::uint64_t> connection_id_;
  std::optional<common::ClientRole> role_;
  std::unordered_map<std::string, std::promise<common::CommandResult>> pending_;
  std::uint64_t request_counter_{0};

  ClientStateView view_;
  MessageHandler message_handler_;
  LogHandler log_handler_;
};

} // namespace academy::client
