#include "command_router.hpp"

#include <chrono>
#include <exception>
#include <utility>

#include <boost/asio/post.hpp>

#include "academy/common/wire_format.hpp"
#include "util/logging.hpp"

namespace academy::control {

using common::AcademyError;
using common::CommandRequest;
using common::CommandResult;
using common::DeviceStatus;
using common::ErrorCode;
using common::SessionStatus;
using common::Verb;

namespace {

std::string require_string_arg(const CommandRequest& request, const char* name) {
    const auto it = request.args.find(name);
    if (it == request.args.end() || !it->is_string() || it->get<std::string>().empty()) {
        throw AcademyError(ErrorCode::BadRequest,
                           std::string(common::to_string(request.verb)) + " requires string argument '" + name + "'");
    }
    return it->get<std::string>();
}

std::string optional_string_arg(const CommandRequest& request, const char* name, const std::string& fallback) {
    const auto it = request.args.find(name);
    if (it == request.args.end() || it->is_null()) {
        return fallback;
    }
    if (!it->is_string()) {
        throw AcademyError(ErrorCode::BadRequest, std::string("argument '") + name + "' must be a string");
    }
    const auto value = it->get<std::string>();
    return value.empty() ? fallback : value;
}

bool is_valid_box_id(const std::string& box_id) {
    return !box_id.empty() && box_id != "." && box_id != ".." &&
           box_id.find_first_of("/\\, \t\r\n") == std::string::npos;
}

std::string describe(const CommandRequest& request) {
    return std::string(common::to_string(request.verb)) + " " + request.device + " (" + request.request_id + ")";
}

}  // namespace

CommandRouter::CommandRouter(boost::asio::io_context& io_context,
                             DeviceRegistry& registry,
                             const ExperimentCatalog& catalog,
                             const PortResolver& ports,
                             Options options,
                             WorkerFactory worker_factory)
    : io_context_(io_context),
      strand_(boost::asio::make_strand(io_context_)),
      registry_(registry),
      catalog_(catalog),
      ports_(ports),
      options_(std::move(options)),
      worker_factory_(std::move(worker_factory)),
      watcher_(options_.watcher, [this](const CompletionEvent& event) {
          boost::asio::post(strand_, [this, event] {
              guarded(event.box_id, "completion handling", [&] { on_completion(event); });
          });
      }) {}

CommandRouter::~CommandRouter() {
    shutdown();
}

void CommandRouter::set_snapshot_handler(SnapshotHandler handler) {
    snapshot_handler_ = std::move(handler);
}

void CommandRouter::set_removal_handler(RemovalHandler handler) {
    removal_handler_ = std::move(handler);
}

void CommandRouter::start() {
    for (const auto& identity : registry_.devices()) {
        publish(create_slot(identity));
    }
    watcher_.start();
    util::log::info("Command router managing " + std::to_string(slots_.size()) + " device(s)");
}

void CommandRouter::shutdown() {
    bool expected = false;
    if (!shutting_down_.compare_exchange_strong(expected, true)) {
        return;
    }
    watcher_.stop();

    for (auto& [box_id, slot] : slots_) {
        auto worker = slot->worker;
        if (!worker) {
            continue;
        }
        boost::asio::post(*slot->executor, [worker, id = box_id] {
            if (!worker->is_active()) {
                return;
            }
            util::log::info("[" + id + "] stopping engine for shutdown");
            try {
                if (worker->stop() == EngineWorker::StopOutcome::Forced) {
                    util::log::warn("[" + id + "] engine killed during shutdown");
                }
            } catch (const std::exception& ex) {
                util::log::error("[" + id + "] engine stop failed during shutdown: " + ex.what());
            }
        });
    }
    for (auto& [box_id, slot] : slots_) {
        slot->executor->join();
    }
}

void CommandRouter::submit(CommandRequest request, AckHandler on_done) {
    if (request.request_id.empty()) {
        request.request_id = "srv-" + std::to_string(++next_request_id_);
    }
    boost::asio::post(strand_, [this, request = std::move(request), on_done = std::move(on_done)] {
        handle_request(request, on_done);
    });
}

void CommandRouter::post(std::function<void()> fn) {
    boost::asio::post(strand_, std::move(fn));
}

std::vector<common::StateSnapshot> CommandRouter::snapshots() const {
    std::lock_guard lock(snapshot_mutex_);
    std::vector<common::StateSnapshot> out;
    out.reserve(published_.size());
    for (const auto& [box_id, snapshot] : published_) {
        out.push_back(snapshot);
    }
    return out;
}

std::optional<common::StateSnapshot> CommandRouter::snapshot(const std::string& box_id) const {
    std::lock_guard lock(snapshot_mutex_);
    auto it = published_.find(box_id);
    if (it == published_.end()) {
        return std::nullopt;
    }
    return it->second;
}

void CommandRouter::handle_request(const CommandRequest& request, const AckHandler& on_done) {
    DeviceSlot* slot = nullptr;
    try {
        if (shutting_down_) {
            throw AcademyError(ErrorCode::InvalidState, "server is shutting down");
        }
        if (common::is_registry_verb(request.verb)) {
            on_done(handle_registry_verb(request));
            return;
        }
        slot = find_slot(request.device);
        if (slot == nullptr) {
            throw AcademyError(ErrorCode::UnknownDevice, "unknown device " + request.device);
        }
        handle_device_verb(*slot, request, on_done);
    } catch (const AcademyError& e) {
        util::log::warn("Rejected " + describe(request) + ": " + std::string(common::to_string(e.code())) + " " +
                        e.what());
        if (slot != nullptr) {
            record(*slot, request, "rejected " + std::string(common::to_string(e.code())));
        }
        on_done(CommandResult::failure(request.request_id, e.code(), e.what()));
    } catch (const std::exception& e) {
        util::log::error("Failed " + describe(request) + ": " + e.what());
        on_done(CommandResult::failure(request.request_id, ErrorCode::Internal, e.what()));
    }
}

CommandResult CommandRouter::handle_registry_verb(const CommandRequest& request) {
    switch (request.verb) {
    case Verb::ListPorts: {
        auto ports = common::Json::array();
        for (const auto& info : ports_.list_ports()) {
            ports.push_back(common::Json{{"serial_number", info.serial_number}, {"port", info.port}});
        }
        return CommandResult::success(request.request_id, {{"ports", ports}});
    }
    case Verb::AddDevice: {
        const auto locator = require_string_arg(request, "serial_locator");
        if (!is_valid_box_id(request.device)) {
            throw AcademyError(ErrorCode::BadRequest, "invalid box id '" + request.device + "'");
        }
        registry_.add(request.device, locator);
        try {
            create_slot(DeviceIdentity{request.device, locator});
            persist_registry();
        } catch (const std::exception&) {
            slots_.erase(request.device);
            registry_.remove(request.device);
            throw;
        }
        auto& slot = *slots_.at(request.device);
        util::log::info("Added device " + request.device + " (" + locator + ")");
        publish(slot);
        return CommandResult::success(request.request_id, common::to_json(make_snapshot(slot)));
    }
    case Verb::RemoveDevice: {
        auto* slot = find_slot(request.device);
        if (slot == nullptr) {
            throw AcademyError(ErrorCode::UnknownDevice, "unknown device " + request.device);
        }
        if (slot->state != DeviceStatus::Stopped || slot->busy) {
            throw AcademyError(ErrorCode::DeviceBusy, "device " + request.device + " is " +
                                                          std::string(common::to_string(slot->state)));
        }
        const auto identity = slot->identity;
        registry_.remove(request.device);
        try {
            persist_registry();
        } catch (const std::exception&) {
            registry_.add(identity.box_id, identity.serial_locator);
            throw;
        }
        watcher_.disarm(request.device);
        slots_.erase(request.device);
        {
            std::lock_guard lock(snapshot_mutex_);
            published_.erase(request.device);
        }
        util::log::info("Removed device " + request.device);
        if (removal_handler_) {
            removal_handler_(request.device);
        }
        return CommandResult::success(request.request_id);
    }
    case Verb::ChangeLocator: {
        const auto locator = require_string_arg(request, "serial_locator");
        auto* slot = find_slot(request.device);
        if (slot == nullptr) {
            throw AcademyError(ErrorCode::UnknownDevice, "unknown device " + request.device);
        }
        if (slot->state != DeviceStatus::Stopped || slot->busy) {
            throw AcademyError(ErrorCode::DeviceBusy, "device " + request.device + " is " +
                                                          std::string(common::to_string(slot->state)));
        }
        const auto previous = slot->identity.serial_locator;
        registry_.change_locator(request.device, locator);
        try {
            persist_registry();
        } catch (const std::exception&) {
            registry_.change_locator(request.device, previous);
            throw;
        }
        slot->identity.serial_locator = locator;
        record(*slot, request, "ok");
        util::log::info("Device " + request.device + " locator changed to " + locator);
        publish(*slot);
        return CommandResult::success(request.request_id, common::to_json(make_snapshot(*slot)));
    }
    default:
        throw AcademyError(ErrorCode::BadRequest, "not a registry verb");
    }
}

void CommandRouter::handle_device_verb(DeviceSlot& slot, const CommandRequest& request, const AckHandler& on_done) {
    if (request.verb == Verb::Query) {
        auto current = snapshot(slot.identity.box_id);
        on_done(CommandResult::success(request.request_id,
                                       current ? common::to_json(*current) : common::Json::object()));
        return;
    }
    if (common::requires_local_role(request.verb) && request.origin_role != common::ClientRole::Local) {
        throw AcademyError(ErrorCode::PermissionDenied,
                           std::string(common::to_string(request.verb)) + " is only allowed from a local client");
    }
    if (slot.busy) {
        throw AcademyError(ErrorCode::InvalidState, "a command for " + slot.identity.box_id + " is in progress");
    }

    const auto state_error = [&] {
        return AcademyError(ErrorCode::InvalidState, std::string(common::to_string(request.verb)) +
                                                         " not allowed while " +
                                                         std::string(common::to_string(slot.state)));
    };

    switch (request.verb) {
    case Verb::Start:
        if (slot.state != DeviceStatus::Stopped) {
            throw state_error();
        }
        do_start(slot, request, on_done);
        break;
    case Verb::Stop:
        if (slot.state == DeviceStatus::Stopped) {
            throw AcademyError(ErrorCode::AlreadyStopped, "device " + slot.identity.box_id + " is already stopped");
        }
        if (slot.state == DeviceStatus::Starting) {
            throw state_error();
        }
        do_stop(slot, request, on_done);
        break;
    case Verb::SetConsoleVisible:
        if (slot.state != DeviceStatus::Idle) {
            throw state_error();
        }
        do_set_console_visible(slot, request, on_done);
        break;
    case Verb::Calibrate:
        if (slot.state != DeviceStatus::Idle) {
            throw state_error();
        }
        do_calibrate(slot, request, on_done);
        break;
    case Verb::RunProtocol:
        if (slot.state != DeviceStatus::Idle) {
            throw state_error();
        }
        do_run_protocol(slot, request, on_done);
        break;
    case Verb::StopProtocol:
        if (slot.state == DeviceStatus::Idle) {
            throw AcademyError(ErrorCode::NotRunning, "no protocol is running on " + slot.identity.box_id);
        }
        if (slot.state != DeviceStatus::RunningProtocol) {
            throw state_error();
        }
        do_stop_protocol(slot, request, on_done);
        break;
    default:
        throw AcademyError(ErrorCode::BadRequest, "unsupported verb");
    }
}

void CommandRouter::do_start(DeviceSlot& slot, const CommandRequest& request, const AckHandler& on_done) {
    const auto port = ports_.resolve(slot.identity.serial_locator);
    if (!port) {
        const std::string message = "no serial port for " + slot.identity.serial_locator;
        record(slot, request, "failed port_unavailable");
        fail_device(slot, message);
        publish(slot);
        on_done(CommandResult::failure(request.request_id, ErrorCode::PortUnavailable, message));
        return;
    }

    slot.state = DeviceStatus::Starting;
    slot.last_error.reset();
    ensure_worker(slot);
    publish(slot);

    dispatch(
        slot, [port = *port](EngineWorker& worker) { worker.start(port); }, ErrorCode::EngineLaunchFailed,
        [this, request, on_done, port = *port](DeviceSlot& slot, const Outcome& error, bool worker_lost) {
            if (error || worker_lost) {
                const auto code = error ? error->code() : ErrorCode::EngineCrashed;
                const std::string message = error ? error->what() : "engine exited during launch";
                record(slot, request, "failed " + std::string(common::to_string(code)) + " " + message);
                slot.worker.reset();
                fail_device(slot, message);
                publish(slot);
                on_done(CommandResult::failure(request.request_id, code, message));
                return;
            }
            record(slot, request, "ok port=" + port);
            slot.state = DeviceStatus::Idle;
            slot.gui_visible = slot.worker->gui_visible();
            publish(slot);
            on_done(CommandResult::success(request.request_id, {{"port", port}}));
        });
}

void CommandRouter::do_stop(DeviceSlot& slot, const CommandRequest& request, const AckHandler& on_done) {
    if (slot.state == DeviceStatus::RunningProtocol) {
        watcher_.disarm(slot.identity.box_id);
        finalize_session(slot, SessionStatus::StoppedByUser, "device stopped");
    }

    const auto finish = [this, request, on_done](DeviceSlot& slot, bool forced) {
        slot.worker.reset();
        slot.gui_visible = false;
        if (forced) {
            record(slot, request, "ok forced");
            fail_device(slot, "engine did not exit within the grace period and was killed");
        } else {
            record(slot, request, "ok");
            slot.state = DeviceStatus::Stopped;
            slot.last_error.reset();
        }
        publish(slot);
        on_done(CommandResult::success(request.request_id, {{"forced", forced}}));
    };

    if (!slot.worker) {
        finish(slot, false);
        return;
    }

    auto outcome = std::make_shared<EngineWorker::StopOutcome>(EngineWorker::StopOutcome::Graceful);
    dispatch(
        slot, [outcome](EngineWorker& worker) { *outcome = worker.stop(); }, ErrorCode::EngineCrashed,
        [finish, outcome](DeviceSlot& slot, const Outcome& error, bool) {
            if (error) {
                util::log::warn("[" + slot.identity.box_id + "] stop reported " + error->what());
            }
            finish(slot, *outcome == EngineWorker::StopOutcome::Forced);
        });
}

void CommandRouter::do_set_console_visible(DeviceSlot& slot, const CommandRequest& request, const AckHandler& on_done) {
    const auto it = request.args.find("visible");
    if (it == request.args.end() || !it->is_boolean()) {
        throw AcademyError(ErrorCode::BadRequest, "set_console_visible requires boolean argument 'visible'");
    }
    const bool visible = it->get<bool>();

    dispatch(
        slot, [visible](EngineWorker& worker) { worker.set_console_visible(visible); }, ErrorCode::EngineCrashed,
        [this, request, on_done](DeviceSlot& slot, const Outcome& error, bool worker_lost) {
            if (error || worker_lost) {
                const auto code = error ? error->code() : ErrorCode::EngineCrashed;
                const std::string message = error ? error->what() : "engine exited";
                record(slot, request, "failed " + std::string(common::to_string(code)));
                fail_device(slot, message);
                publish(slot);
                on_done(CommandResult::failure(request.request_id, code, message));
                return;
            }
            record(slot, request, "ok");
            slot.gui_visible = slot.worker->gui_visible();
            publish(slot);
            on_done(CommandResult::success(request.request_id, {{"gui_visible", slot.gui_visible}}));
        });
}

void CommandRouter::do_calibrate(DeviceSlot& slot, const CommandRequest& request, const AckHandler& on_done) {
    dispatch(
        slot, [](EngineWorker& worker) { worker.calibrate(); }, ErrorCode::EngineCrashed,
        [this, request, on_done](DeviceSlot& slot, const Outcome& error, bool worker_lost) {
            if (error || worker_lost) {
                const auto code = error ? error->code() : ErrorCode::EngineCrashed;
                const std::string message = error ? error->what() : "engine exited";
                record(slot, request, "failed " + std::string(common::to_string(code)));
                fail_device(slot, message);
                publish(slot);
                on_done(CommandResult::failure(request.request_id, code, message));
                return;
            }
            record(slot, request, "ok");
            publish(slot);
            on_done(CommandResult::success(request.request_id));
        });
}

void CommandRouter::do_run_protocol(DeviceSlot& slot, const CommandRequest& request, const AckHandler& on_done) {
    const auto protocol = require_string_arg(request, "protocol");
    const auto subject = require_string_arg(request, "subject");
    const auto settings = optional_string_arg(request, "settings", options_.default_settings);
    if (!catalog_.has_protocol(protocol)) {
        throw AcademyError(ErrorCode::UnknownProtocol, "unknown protocol " + protocol);
    }
    if (!catalog_.has_subject(protocol, subject)) {
        throw AcademyError(ErrorCode::UnknownSubject, "unknown subject " + subject + " for protocol " + protocol);
    }
    if (!catalog_.has_settings(protocol, subject, settings)) {
        throw AcademyError(ErrorCode::UnknownSettings, "unknown settings " + settings + " for " + subject);
    }

    const auto offset = slot.log->size();
    common::ProtocolSession session;
    session.session_id = ++next_session_id_;
    session.box_id = slot.identity.box_id;
    session.protocol = protocol;
    session.subject = subject;
    session.settings_file = catalog_.settings_file(protocol, subject, settings).string();

    dispatch(
        slot,
        [protocol, subject, settings](EngineWorker& worker) { worker.run_protocol(protocol, subject, settings); },
        ErrorCode::EngineCrashed,
        [this, request, on_done, session, offset](DeviceSlot& slot, const Outcome& error, bool worker_lost) mutable {
            if (error || worker_lost) {
                const auto code = error ? error->code() : ErrorCode::EngineCrashed;
                const std::string message = error ? error->what() : "engine exited";
                record(slot, request, "failed " + std::string(common::to_string(code)));
                fail_device(slot, message);
                publish(slot);
                on_done(CommandResult::failure(request.request_id, code, message));
                return;
            }
            record(slot, request, "accepted session=" + std::to_string(session.session_id));
            session.started_at = std::chrono::system_clock::now();
            session.status = SessionStatus::Running;
            slot.active_session = session;
            slot.state = DeviceStatus::RunningProtocol;
            slot.last_error.reset();
            watcher_.arm(slot.identity.box_id, session.session_id, slot.log->path(), offset);
            publish(slot);
            on_done(CommandResult::success(request.request_id, {{"session_id", session.session_id}}));
        });
}

void CommandRouter::do_stop_protocol(DeviceSlot& slot, const CommandRequest& request, const AckHandler& on_done) {
    dispatch(
        slot, [](EngineWorker& worker) { worker.stop_protocol(); }, ErrorCode::EngineCrashed,
        [this, request, on_done](DeviceSlot& slot, const Outcome& error, bool worker_lost) {
            watcher_.disarm(slot.identity.box_id);
            if (error || worker_lost) {
                const auto code = error ? error->code() : ErrorCode::EngineCrashed;
                const std::string message = error ? error->what() : "engine exited";
                record(slot, request, "failed " + std::string(common::to_string(code)));
                finalize_session(slot, SessionStatus::Failed, message);
                fail_device(slot, message);
                publish(slot);
                on_done(CommandResult::failure(request.request_id, code, message));
                return;
            }
            record(slot, request, "ok");
            if (slot.state == DeviceStatus::RunningProtocol) {
                finalize_session(slot, SessionStatus::StoppedByUser, "stopped by user");
                slot.state = DeviceStatus::Idle;
            }
            publish(slot);
            on_done(CommandResult::success(request.request_id));
        });
}

void CommandRouter::dispatch(DeviceSlot& slot,
                             std::function<void(EngineWorker&)> work,
                             ErrorCode fallback,
                             Completion done) {
    auto worker = slot.worker;
    if (!worker) {
        throw AcademyError(ErrorCode::InvalidState, "no engine for " + slot.identity.box_id);
    }
    slot.busy = true;
    const auto box_id = slot.identity.box_id;
    boost::asio::post(*slot.executor, [this, worker, box_id, fallback, work = std::move(work),
                                       done = std::move(done)] {
        Outcome error;
        try {
            work(*worker);
        } catch (const AcademyError& e) {
            error = e;
        } catch (const std::exception& e) {
            error = AcademyError(fallback, e.what());
        }
        boost::asio::post(strand_, [this, worker, box_id, error, done] {
            DeviceSlot* slot = find_slot(box_id);
            if (slot == nullptr) {
                util::log::warn("Dropping worker outcome for removed device " + box_id);
                return;
            }
            slot->busy = false;
            guarded(box_id, "command completion", [&] { done(*slot, error, slot->worker != worker); });
        });
    });
}

void CommandRouter::on_worker_exit(const std::string& box_id, std::uint64_t generation, const std::string& detail) {
    DeviceSlot* slot = find_slot(box_id);
    if (slot == nullptr || !slot->worker || slot->worker_generation != generation) {
        return;
    }
    slot->log->append_command("engine_exit", "", detail);
    slot->worker.reset();
    if (slot->active_session) {
        watcher_.disarm(box_id);
        finalize_session(*slot, SessionStatus::Failed, detail);
    }
    fail_device(*slot, std::string(common::to_string(ErrorCode::EngineCrashed)) + ": " + detail);
    publish(*slot);
}

void CommandRouter::on_completion(const CompletionEvent& event) {
    DeviceSlot* slot = find_slot(event.box_id);
    if (slot == nullptr || !slot->active_session || slot->active_session->session_id != event.session_id) {
        util::log::debug("Ignoring stale completion event for " + event.box_id);
        return;
    }
    switch (event.kind) {
    case CompletionEvent::Kind::Completed:
        util::log::info("[" + event.box_id + "] protocol session " + std::to_string(event.session_id) + " completed");
        finalize_session(*slot, SessionStatus::Completed, {});
        slot->state = DeviceStatus::Idle;
        break;
    case CompletionEvent::Kind::Failed:
        util::log::warn("[" + event.box_id + "] protocol session " + std::to_string(event.session_id) +
                        " failed: " + event.detail);
        finalize_session(*slot, SessionStatus::Failed, event.detail);
        fail_device(*slot, event.detail.empty() ? "protocol failed" : event.detail);
        break;
    case CompletionEvent::Kind::UnknownStatus:
        slot->last_error = std::string(common::to_string(ErrorCode::UnknownStatus)) + ": " + event.detail;
        break;
    }
    publish(*slot);
}

CommandRouter::DeviceSlot& CommandRouter::create_slot(const DeviceIdentity& identity) {
    auto slot = std::make_unique<DeviceSlot>();
    slot->identity = identity;
    slot->log = std::make_unique<ExecutionLog>(options_.log_dir / (identity.box_id + ".log"), identity.box_id);
    slot->executor = std::make_unique<boost::asio::thread_pool>(1);
    auto& ref = *slot;
    slots_[identity.box_id] = std::move(slot);
    return ref;
}

CommandRouter::DeviceSlot* CommandRouter::find_slot(const std::string& box_id) {
    auto it = slots_.find(box_id);
    return it == slots_.end() ? nullptr : it->second.get();
}

std::shared_ptr<EngineWorker> CommandRouter::ensure_worker(DeviceSlot& slot) {
    if (slot.worker) {
        return slot.worker;
    }
    slot.worker = std::shared_ptr<EngineWorker>(worker_factory_(slot.identity.box_id, *slot.log));
    const auto generation = ++slot.worker_generation;
    const auto box_id = slot.identity.box_id;
    slot.worker->set_exit_handler([this, box_id, generation](const std::string& detail) {
        boost::asio::post(strand_, [this, box_id, generation, detail] {
            guarded(box_id, "engine exit handling", [&] { on_worker_exit(box_id, generation, detail); });
        });
    });
    return slot.worker;
}

// Strand handlers must not unwind out of io_context::run.
void CommandRouter::guarded(const std::string& box_id, const char* context, const std::function<void()>& fn) {
    try {
        fn();
    } catch (const std::exception& e) {
        util::log::error("[" + box_id + "] " + context + " failed: " + e.what());
        DeviceSlot* slot = find_slot(box_id);
        if (slot == nullptr) {
            return;
        }
        fail_device(*slot, std::string(common::to_string(ErrorCode::Internal)) + ": " + context + " failed");
        try {
            publish(*slot);
        } catch (const std::exception& inner) {
            util::log::error("[" + box_id + "] publishing the fault failed: " + inner.what());
        }
    }
}

void CommandRouter::fail_device(DeviceSlot& slot, const std::string& message) {
    util::log::error("[" + slot.identity.box_id + "] " + message);
    slot.state = DeviceStatus::Error;
    slot.last_error = message;
    if (!slot.worker) {
        slot.gui_visible = false;
    }
}

void CommandRouter::finalize_session(DeviceSlot& slot, SessionStatus status, const std::string& detail) {
    if (!slot.active_session) {
        return;
    }
    auto session = std::move(*slot.active_session);
    slot.active_session.reset();
    session.status = status;
    session.finished_at = std::chrono::system_clock::now();
    session.detail = detail;
    slot.log->append_command("session_end", std::to_string(session.session_id),
                             std::string(common::to_string(status)));
    slot.last_session = std::move(session);
}

void CommandRouter::record(DeviceSlot& slot, const CommandRequest& request, const std::string& outcome) {
    std::string args;
    for (const auto& [key, value] : request.args.items()) {
        if (!args.empty()) {
            args += ' ';
        }
        args += key + "=" + (value.is_string() ? value.get<std::string>() : value.dump());
    }
    slot.log->append_command(std::string(common::to_string(request.verb)), args, outcome);
}

void CommandRouter::publish(DeviceSlot& slot) {
    ++slot.version;
    auto snapshot = make_snapshot(slot);
    {
        std::lock_guard lock(snapshot_mutex_);
        published_[slot.identity.box_id] = snapshot;
    }
    if (snapshot_handler_) {
        snapshot_handler_(snapshot);
    }
}

common::StateSnapshot CommandRouter::make_snapshot(const DeviceSlot& slot) const {
    common::StateSnapshot snapshot;
    snapshot.box_id = slot.identity.box_id;
    snapshot.serial_locator = slot.identity.serial_locator;
    snapshot.state = slot.state;
    snapshot.gui_visible = slot.gui_visible;
    snapshot.last_error = slot.last_error;
    snapshot.calibration_available = catalog_.has_calibration(slot.identity.box_id);
    snapshot.version = slot.version;
    snapshot.updated_at = std::chrono::system_clock::now();
    snapshot.active_session = slot.active_session;
    snapshot.last_session = slot.last_session;
    return snapshot;
}

void CommandRouter::persist_registry() {
    try {
        registry_.save();
    } catch (const std::exception& ex) {
        throw AcademyError(ErrorCode::ConfigCorrupt, std::string("failed to save registry: ") + ex.what());
    }
}

}  // namespace academy::control
