#pragma once

#include <sys/types.h>

#include <chrono>
#include <condition_variable>
#include <map>
#include <mutex>
#include <string>
#include <thread>

#include "engine_worker.hpp"
#include "execution_log.hpp"
#include "util/config_loader.hpp"

namespace academy::control {

class SubprocessWorker : public EngineWorker {
public:
    SubprocessWorker(std::string box_id, EngineSection config, ExecutionLog& log);
    ~SubprocessWorker() override;

    SubprocessWorker(const SubprocessWorker&) = delete;
    SubprocessWorker& operator=(const SubprocessWorker&) = delete;

    void start(const std::string& port) override;
    StopOutcome stop() override;

    void set_console_visible(bool visible) override;
    void calibrate() override;
    void run_protocol(const std::string& protocol,
                      const std::string& subject,
                      const std::string& settings) override;
    void stop_protocol() override;

    bool is_active() const override;
    bool gui_visible() const override;

    void set_exit_handler(ExitHandler handler) override;

    pid_t pid() const;

    static std::string render(const std::string& tmpl, const std::map<std::string, std::string>& values);

private:
    enum class LaunchState { Pending, Ready, Failed };

    void spawn();
    void reader_loop(int fd, pid_t pid);
    void send_line(const std::string& line);
    void signal_group(int signal_number) const;
    bool wait_for_exit(std::chrono::milliseconds timeout);
    void force_kill();
    void reap();

    std::string box_id_;
    EngineSection config_;
    ExecutionLog& log_;

    mutable std::mutex mutex_;
    std::condition_variable cv_;
    pid_t pid_{-1};
    int stdin_fd_{-1};
    std::thread reader_;
    LaunchState launch_state_{LaunchState::Pending};
    std::string launch_detail_;
    bool exited_{true};
    bool expecting_exit_{false};
    bool gui_visible_{false};
    ExitHandler exit_handler_;
};

}  // namespace academy::control
