#pragma once

#include <atomic>
#include <cstdint>
#include <filesystem>
#include <functional>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

#include <boost/asio/io_context.hpp>
#include <boost/asio/strand.hpp>
#include <boost/asio/thread_pool.hpp>

#include "academy/common/device_state.hpp"
#include "completion_watcher.hpp"
#include "device_registry.hpp"
#include "engine_worker.hpp"
#include "execution_log.hpp"
#include "experiment_catalog.hpp"
#include "port_resolver.hpp"

namespace academy::control {

// Requests, worker outcomes and watcher events are all applied on one strand; blocking
// engine calls run on a per-device executor so devices never wait on each other.
class CommandRouter {
public:
    using WorkerFactory = std::function<std::unique_ptr<EngineWorker>(const std::string& box_id, ExecutionLog& log)>;
    using AckHandler = std::function<void(const common::CommandResult&)>;
    using SnapshotHandler = std::function<void(const common::StateSnapshot&)>;
    using RemovalHandler = std::function<void(const std::string& box_id)>;

    struct Options {
        std::filesystem::path log_dir;
        WatcherSection watcher;
        std::string default_settings{"DefaultSettings"};
    };

    CommandRouter(boost::asio::io_context& io_context,
                  DeviceRegistry& registry,
                  const ExperimentCatalog& catalog,
                  const PortResolver& ports,
                  Options options,
                  WorkerFactory worker_factory);
    ~CommandRouter();

    CommandRouter(const CommandRouter&) = delete;
    CommandRouter& operator=(const CommandRouter&) = delete;

    void set_snapshot_handler(SnapshotHandler handler);
    void set_removal_handler(RemovalHandler handler);

    void start();

    void shutdown();

    // Queues a request; `on_done` runs on the router strand once the outcome is known.
    void submit(common::CommandRequest request, AckHandler on_done);

    void post(std::function<void()> fn);

    std::vector<common::StateSnapshot> snapshots() const;
    std::optional<common::StateSnapshot> snapshot(const std::string& box_id) const;

private:
    struct DeviceSlot {
        DeviceIdentity identity;
        common::DeviceStatus state{common::DeviceStatus::Stopped};
        bool busy{false};
        bool gui_visible{false};
        std::optional<std::string> last_error;
        std::uint64_t version{0};
        std::optional<common::ProtocolSession> active_session;
        std::optional<common::ProtocolSession> last_session;
        std::unique_ptr<ExecutionLog> log;
        std::shared_ptr<EngineWorker> worker;
        std::uint64_t worker_generation{0};
        std::unique_ptr<boost::asio::thread_pool> executor;
    };

    using Outcome = std::optional<common::AcademyError>;
    using Completion = std::function<void(DeviceSlot&, const Outcome&, bool worker_lost)>;

    void handle_request(const common::CommandRequest& request, const AckHandler& on_done);
    common::CommandResult handle_registry_verb(const common::CommandRequest& request);
    void handle_device_verb(DeviceSlot& slot, const common::CommandRequest& request, const AckHandler& on_done);

    void do_start(DeviceSlot& slot, const common::CommandRequest& request, const AckHandler& on_done);
    void do_stop(DeviceSlot& slot, const common::CommandRequest& request, const AckHandler& on_done);
    void do_set_console_visible(DeviceSlot& slot, const common::CommandRequest& request, const AckHandler& on_done);
    void do_calibrate(DeviceSlot& slot, const common::CommandRequest& request, const AckHandler& on_done);
    void do_run_protocol(DeviceSlot& slot, const common::CommandRequest& request, const AckHandler& on_done);
    void do_stop_protocol(DeviceSlot& slot, const common::CommandRequest& request, const AckHandler& on_done);

    void dispatch(DeviceSlot& slot,
                  std::function<void(EngineWorker&)> work,
                  common::ErrorCode fallback,
                  Completion done);

    void on_worker_exit(const std::string& box_id, std::uint64_t generation, const std::string& detail);
    void on_completion(const CompletionEvent& event);

    DeviceSlot& create_slot(const DeviceIdentity& identity);
    DeviceSlot* find_slot(const std::string& box_id);
    std::shared_ptr<EngineWorker> ensure_worker(DeviceSlot& slot);
    void guarded(const std::string& box_id, const char* context, const std::function<void()>& fn);
    void fail_device(DeviceSlot& slot, const std::string& message);
    void finalize_session(DeviceSlot& slot, common::SessionStatus status, const std::string& detail);
    void record(DeviceSlot& slot, const common::CommandRequest& request, const std::string& outcome);
    void publish(DeviceSlot& slot);
    common::StateSnapshot make_snapshot(const DeviceSlot& slot) const;
    void persist_registry();

    boost::asio::io_context& io_context_;
    boost::asio::strand<boost::asio::io_context::executor_type> strand_;
    DeviceRegistry& registry_;
    const ExperimentCatalog& catalog_;
    const PortResolver& ports_;
    Options options_;
    WorkerFactory worker_factory_;
    CompletionWatcher watcher_;

    SnapshotHandler snapshot_handler_;
    RemovalHandler removal_handler_;

    std::map<std::string, std::unique_ptr<DeviceSlot>> slots_;
    std::uint64_t next_session_id_{0};
    std::atomic_uint64_t next_request_id_{0};
    std::atomic_bool shutting_down_{false};

    mutable std::mutex snapshot_mutex_;
    std::map<std::string, common::StateSnapshot> published_;
};

}  // namespace academy::control
