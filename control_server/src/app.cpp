#include "app.hpp"

#include <chrono>
#include <csignal>
#include <filesystem>
#include <utility>

#include <boost/asio/signal_set.hpp>
#include <boost/asio/steady_timer.hpp>

#include "subprocess_worker.hpp"
#include "util/logging.hpp"

namespace academy::control {

namespace {

constexpr std::chrono::seconds kShutdownDrain{2};

CommandRouter::WorkerFactory subprocess_factory(const EngineSection& engine) {
    return [engine](const std::string& box_id, ExecutionLog& log) -> std::unique_ptr<EngineWorker> {
        return std::make_unique<SubprocessWorker>(box_id, engine, log);
    };
}

}  // namespace

ControlServerApp::ControlServerApp(boost::asio::io_context& io_context,
                                   ControlServerConfig config,
                                   CommandRouter::WorkerFactory worker_factory)
    : io_context_(io_context),
      config_(std::move(config)),
      registry_(config_.registry_file()),
      catalog_(config_.academy_dir),
      ports_(config_.ports.by_id_dir),
      ws_server_(io_context_, config_.server.send_queue_limit, config_.server.local_addresses),
      router_(io_context_,
              registry_,
              catalog_,
              ports_,
              CommandRouter::Options{config_.log_dir(), config_.watcher, "DefaultSettings"},
              worker_factory ? std::move(worker_factory) : subprocess_factory(config_.engine)),
      command_gateway_(ws_server_, router_) {}

void ControlServerApp::start() {
    std::filesystem::create_directories(config_.log_dir());
    const bool fresh = !std::filesystem::exists(registry_.storage_path());
    const auto report = registry_.load();
    if (fresh) {
        registry_.save();
        util::log::info("Created empty registry " + registry_.storage_path().string());
    }
    util::log::info("Loaded " + std::to_string(report.loaded) + " device(s) from " +
                    registry_.storage_path().string());
    if (!report.skipped_rows.empty()) {
        util::log::warn(std::to_string(report.skipped_rows.size()) + " malformed registry row(s) skipped");
    }

    ws_server_.set_open_handler([this](WsServer::SessionId session_id, common::ClientRole role) {
        command_gateway_.handle_open(session_id, role);
    });
    ws_server_.set_close_handler([this](WsServer::SessionId session_id) { command_gateway_.handle_close(session_id); });
    ws_server_.set_message_handler([this](const nlohmann::json& message, WsServer::SessionId session_id) {
        command_gateway_.handle_message(message, session_id);
    });
    ws_server_.set_resync_provider([this] { return command_gateway_.full_sync(); });

    router_.set_snapshot_handler(
        [this](const common::StateSnapshot& snapshot) { command_gateway_.publish_snapshot(snapshot); });
    router_.set_removal_handler([this](const std::string& box_id) { command_gateway_.publish_removed(box_id); });

    router_.start();
    ws_server_.start(config_.server.host, config_.server.port);
}

void ControlServerApp::stop() {
    if (stopped_) {
        return;
    }
    stopped_ = true;
    command_gateway_.publish_closing();
    router_.shutdown();
    ws_server_.stop();
}

int run(ControlServerConfig config) {
    try {
        resolve_academy_dir(config);
        util::log::init(config.logging.level, config.server_log_file().string());
        util::log::info("Academy directory: " + config.academy_dir.string());

        boost::asio::io_context io_context;
        ControlServerApp app(io_context, config);
        app.start();

        boost::asio::steady_timer drain_timer(io_context);
        boost::asio::signal_set signals(io_context, SIGINT, SIGTERM);
        signals.async_wait([&](const boost::system::error_code& ec, int) {
            if (ec) {
                return;
            }
            util::log::info("Signal received, shutting down...");
            app.stop();
            drain_timer.expires_after(kShutdownDrain);
            drain_timer.async_wait([&](const boost::system::error_code&) { io_context.stop(); });
        });

        io_context.run();
    } catch (const std::exception& ex) {
        util::log::error(std::string("Fatal error: ") + ex.what());
        return 1;
    }
    return 0;
}

}  // namespace academy::control
