#pragma once

#include <condition_variable>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

#include "academy/common/errors.hpp"
#include "command_router.hpp"
#include "engine_worker.hpp"
#include "execution_log.hpp"
#include "test_support.hpp"

namespace academy::test {

using control::EngineWorker;
using control::ExecutionLog;

// Test-side handle on one fake engine; outlives the worker the router owns.
class FakeEngine {
public:
    void hold_start() {
        std::lock_guard lock(mutex_);
        start_held_ = true;
    }

    void release_start() {
        {
            std::lock_guard lock(mutex_);
            start_held_ = false;
        }
        cv_.notify_all();
    }

    void fail_start_with(common::ErrorCode code, const std::string& message) {
        std::lock_guard lock(mutex_);
        start_error_ = common::AcademyError(code, message);
    }

    void force_stop() {
        std::lock_guard lock(mutex_);
        forced_stop_ = true;
    }

    void emit(const std::string& line) {
        ExecutionLog* log = nullptr;
        {
            std::lock_guard lock(mutex_);
            log = log_;
        }
        REQUIRE(log != nullptr);
        log->append_output(line);
    }

    void crash(const std::string& detail) {
        EngineWorker::ExitHandler handler;
        {
            std::lock_guard lock(mutex_);
            active_ = false;
            handler = exit_handler_;
        }
        REQUIRE(handler);
        handler(detail);
    }

    std::vector<std::string> calls() const {
        std::lock_guard lock(mutex_);
        return calls_;
    }

private:
    friend class FakeWorker;

    mutable std::mutex mutex_;
    std::condition_variable cv_;
    bool start_held_{false};
    bool forced_stop_{false};
    bool active_{false};
    bool gui_visible_{false};
    std::optional<common::AcademyError> start_error_;
    std::vector<std::string> calls_;
    ExecutionLog* log_{nullptr};
    EngineWorker::ExitHandler exit_handler_;
};

class FakeWorker : public EngineWorker {
public:
    FakeWorker(std::shared_ptr<FakeEngine> engine, ExecutionLog& log) : engine_(std::move(engine)) {
        std::lock_guard lock(engine_->mutex_);
        engine_->log_ = &log;
    }

    void start(const std::string& port) override {
        std::unique_lock lock(engine_->mutex_);
        engine_->calls_.push_back("start " + port);
        engine_->cv_.wait(lock, [this] { return !engine_->start_held_; });
        if (engine_->start_error_) {
            auto error = *engine_->start_error_;
            engine_->start_error_.reset();
            throw error;
        }
        engine_->active_ = true;
        engine_->gui_visible_ = true;
    }

    StopOutcome stop() override {
        std::lock_guard lock(engine_->mutex_);
        engine_->calls_.push_back("stop");
        engine_->active_ = false;
        engine_->gui_visible_ = false;
        return engine_->forced_stop_ ? StopOutcome::Forced : StopOutcome::Graceful;
    }

    void set_console_visible(bool visible) override {
        std::lock_guard lock(engine_->mutex_);
        engine_->calls_.push_back(visible ? "console on" : "console off");
        engine_->gui_visible_ = visible;
    }

    void calibrate() override {
        std::lock_guard lock(engine_->mutex_);
        engine_->calls_.push_back("calibrate");
    }

    void run_protocol(const std::string& protocol, const std::string& subject, const std::string& settings) override {
        std::lock_guard lock(engine_->mutex_);
        engine_->calls_.push_back("run " + protocol + " " + subject + " " + settings);
    }

    void stop_protocol() override {
        std::lock_guard lock(engine_->mutex_);
        engine_->calls_.push_back("stop_protocol");
    }

    bool is_active() const override {
        std::lock_guard lock(engine_->mutex_);
        return engine_->active_;
    }

    bool gui_visible() const override {
        std::lock_guard lock(engine_->mutex_);
        return engine_->gui_visible_;
    }

    void set_exit_handler(ExitHandler handler) override {
        std::lock_guard lock(engine_->mutex_);
        engine_->exit_handler_ = std::move(handler);
    }

private:
    std::shared_ptr<FakeEngine> engine_;
};

class FakeEngineFactory {
public:
    std::shared_ptr<FakeEngine> engine(const std::string& box_id) {
        std::lock_guard lock(mutex_);
        auto& engine = engines_[box_id];
        if (!engine) {
            engine = std::make_shared<FakeEngine>();
        }
        return engine;
    }

    control::CommandRouter::WorkerFactory worker_factory() {
        return [this](const std::string& box_id, ExecutionLog& log) -> std::unique_ptr<EngineWorker> {
            return std::make_unique<FakeWorker>(engine(box_id), log);
        };
    }

private:
    std::mutex mutex_;
    std::map<std::string, std::shared_ptr<FakeEngine>> engines_;
};

}  // namespace academy::test
