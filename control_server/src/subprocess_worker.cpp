#include "subprocess_worker.hpp"

#include <fcntl.h>
#include <signal.h>
#include <sys/wait.h>
#include <unistd.h>

#include <cerrno>
#include <cstring>
#include <utility>
#include <vector>

#include "academy/common/errors.hpp"
#include "util/logging.hpp"

namespace academy::control {

using common::AcademyError;
using common::ErrorCode;

namespace {

constexpr std::chrono::milliseconds kKillWait{5000};

std::string errno_text(int err) {
    return std::strerror(err);
}

// Engines may echo an interactive prompt before their output.
std::string strip_prompt(const std::string& line) {
    std::size_t pos = 0;
    while (pos < line.size() && (line[pos] == '>' || line[pos] == ' ' || line[pos] == '\t')) {
        ++pos;
    }
    return line.substr(pos);
}

bool starts_with(const std::string& text, const std::string& prefix) {
    return !prefix.empty() && text.rfind(prefix, 0) == 0;
}

std::string describe_exit(int status) {
    if (WIFEXITED(status)) {
        return "engine exited with code " + std::to_string(WEXITSTATUS(status));
    }
    if (WIFSIGNALED(status)) {
        return "engine killed by signal " + std::to_string(WTERMSIG(status));
    }
    return "engine exited";
}

void close_fd(int& fd) {
    if (fd >= 0) {
        ::close(fd);
        fd = -1;
    }
}

}  // namespace

SubprocessWorker::SubprocessWorker(std::string box_id, EngineSection config, ExecutionLog& log)
    : box_id_(std::move(box_id)), config_(std::move(config)), log_(log) {
    // Writes to a dead engine must surface as EPIPE instead of terminating the server.
    ::signal(SIGPIPE, SIG_IGN);
}

SubprocessWorker::~SubprocessWorker() {
    bool alive = false;
    {
        std::lock_guard lock(mutex_);
        alive = pid_ > 0 && !exited_;
        expecting_exit_ = true;
    }
    if (alive) {
        util::log::warn("[" + box_id_ + "] engine still running at shutdown, killing");
        force_kill();
    }
    reap();
}

std::string SubprocessWorker::render(const std::string& tmpl, const std::map<std::string, std::string>& values) {
    std::string out;
    out.reserve(tmpl.size());
    std::size_t pos = 0;
    while (pos < tmpl.size()) {
        const auto open = tmpl.find('{', pos);
        if (open == std::string::npos) {
            out.append(tmpl, pos, std::string::npos);
            break;
        }
        const auto close = tmpl.find('}', open);
        if (close == std::string::npos) {
            out.append(tmpl, pos, std::string::npos);
            break;
        }
        out.append(tmpl, pos, open - pos);
        const auto it = values.find(tmpl.substr(open + 1, close - open - 1));
        if (it == values.end()) {
            out.append(tmpl, open, close - open + 1);
        } else {
            for (char c : it->second) {
                if (c == '\'') {
                    out.push_back('\'');
                }
                out.push_back(c);
            }
        }
        pos = close + 1;
    }
    return out;
}


void SubprocessWorker::spawn() {
    if (config_.command.empty()) {
        throw AcademyError(ErrorCode::EngineLaunchFailed, "engine command is empty");
    }

    int in_pipe[2] = {-1, -1};
    int out_pipe[2] = {-1, -1};
    int err_pipe[2] = {-1, -1};
    auto close_all = [&] {
        for (int* fds : {in_pipe, out_pipe, err_pipe}) {
            close_fd(fds[0]);
            close_fd(fds[1]);
        }
    };
    if (::pipe2(in_pipe, O_CLOEXEC) != 0 || ::pipe2(out_pipe, O_CLOEXEC) != 0 || ::pipe2(err_pipe, O_CLOEXEC) != 0) {
        const int err = errno;
        close_all();
        throw AcademyError(ErrorCode::EngineLaunchFailed, "pipe failed: " + errno_text(err));
    }

    std::vector<char*> argv;
    argv.reserve(config_.command.size() + 1);
    for (auto& arg : config_.command) {
        argv.push_back(arg.data());
    }
    argv.push_back(nullptr);

    const pid_t pid = ::fork();
    if (pid < 0) {
        const int err = errno;
        close_all();
        throw AcademyError(ErrorCode::EngineLaunchFailed, "fork failed: " + errno_text(err));
    }

    if (pid == 0) {
        ::setpgid(0, 0);
        ::dup2(in_pipe[0], STDIN_FILENO);
        ::dup2(out_pipe[1], STDOUT_FILENO);
        ::dup2(out_pipe[1], STDERR_FILENO);
        ::close(in_pipe[0]);
        ::close(in_pipe[1]);
        ::close(out_pipe[0]);
        ::close(out_pipe[1]);
        ::close(err_pipe[0]);
        ::execvp(argv[0], argv.data());
        const int err = errno;
        (void)!::write(err_pipe[1], &err, sizeof(err));
        ::_exit(127);
    }

    close_fd(in_pipe[0]);
    close_fd(out_pipe[1]);
    close_fd(err_pipe[1]);

    int child_errno = 0;
    ssize_t n = 0;
    do {
        n = ::read(err_pipe[0], &child_errno, sizeof(child_errno));
    } while (n < 0 && errno == EINTR);
    close_fd(err_pipe[0]);

    if (n > 0) {
        int status = 0;
        ::waitpid(pid, &status, 0);
        close_all();
        throw AcademyError(ErrorCode::EngineLaunchFailed,
                           "cannot execute " + config_.command.front() + ": " + errno_text(child_errno));
    }

    util::log::info("[" + box_id_ + "] engine started with pid " + std::to_string(pid));
    {
        std::lock_guard lock(mutex_);
        pid_ = pid;
        stdin_fd_ = in_pipe[1];
        exited_ = false;
        expecting_exit_ = false;
        launch_state_ = LaunchState::Pending;
        launch_detail_.clear();
    }
    reader_ = std::thread(&SubprocessWorker::reader_loop, this, out_pipe[0], pid);
}

void SubprocessWorker::reader_loop(int fd, pid_t pid) {
    std::string pending;
    char buffer[4096];
    auto handle_line = [this](std::string line) {
        if (!line.empty() && line.back() == '\r') {
            line.pop_back();
        }
        log_.append_output(line);
        const auto text = strip_prompt(line);
        std::lock_guard lock(mutex_);
        if (launch_state_ != LaunchState::Pending) {
            return;
        }
        if (starts_with(text, config_.ready_marker)) {
            launch_state_ = LaunchState::Ready;
            cv_.notify_all();
        } else if (starts_with(text, config_.launch_failed_marker)) {
            launch_state_ = LaunchState::Failed;
            launch_detail_ = text;
            cv_.notify_all();
        }
    };

    while (true) {
        const ssize_t n = ::read(fd, buffer, sizeof(buffer));
        if (n < 0 && errno == EINTR) {
            continue;
        }
        if (n <= 0) {
            break;
        }
        pending.append(buffer, static_cast<std::size_t>(n));
        std::size_t newline = 0;
        while ((newline = pending.find('\n')) != std::string::npos) {
            handle_line(pending.substr(0, newline));
            pending.erase(0, newline + 1);
        }
    }
    if (!pending.empty()) {
        handle_line(pending);
    }
    ::close(fd);

    int status = 0;
    pid_t waited = 0;
    do {
        waited = ::waitpid(pid, &status, 0);
    } while (waited < 0 && errno == EINTR);
    const std::string detail = waited == pid ? describe_exit(status) : "engine exited";

    ExitHandler handler;
    {
        std::lock_guard lock(mutex_);
        exited_ = true;
        if (!expecting_exit_ && launch_state_ == LaunchState::Ready) {
            handler = exit_handler_;
        }
        cv_.notify_all();
    }
    if (handler) {
        util::log::error("[" + box_id_ + "] " + detail);
        handler(detail);
    } else {
        util::log::info("[" + box_id_ + "] " + detail);
    }
}

void SubprocessWorker::send_line(const std::string& line) {
    int fd = -1;
    {
        std::lock_guard lock(mutex_);
        if (!exited_) {
            fd = stdin_fd_;
        }
    }
    if (fd < 0) {
        throw AcademyError(ErrorCode::EngineCrashed, "engine is not running");
    }
    const std::string payload = line + "\n";
    std::size_t written = 0;
    while (written < payload.size()) {
        const ssize_t n = ::write(fd, payload.data() + written, payload.size() - written);
        if (n < 0) {
            if (errno == EINTR) {
                continue;
            }
            throw AcademyError(ErrorCode::EngineCrashed, "engine input closed: " + errno_text(errno));
        }
        written += static_cast<std::size_t>(n);
    }
}

void SubprocessWorker::signal_group(int signal_number) const {
    pid_t pid = -1;
    {
        std::lock_guard lock(mutex_);
        pid = pid_;
    }
    if (pid <= 0) {
        return;
    }
    if (::kill(-pid, signal_number) != 0 && errno != ESRCH) {
        util::log::warn("[" + box_id_ + "] failed to signal engine group: " + errno_text(errno));
    }
}

bool SubprocessWorker::wait_for_exit(std::chrono::milliseconds timeout) {
    std::unique_lock lock(mutex_);
    return cv_.wait_for(lock, timeout, [this] { return exited_; });
}

void SubprocessWorker::force_kill() {
    signal_group(SIGKILL);
    if (!wait_for_exit(kKillWait)) {
        util::log::error("[" + box_id_ + "] engine did not exit after SIGKILL");
    }
}

void SubprocessWorker::reap() {
    if (reader_.joinable()) {
        reader_.join();
    }
    std::lock_guard lock(mutex_);
    close_fd(stdin_fd_);
    pid_ = -1;
}

void SubprocessWorker::start(const std::string& port) {
    {
        std::lock_guard lock(mutex_);
        if (pid_ > 0 && !exited_) {
            throw AcademyError(ErrorCode::InvalidState, "engine already running");
        }
    }
    reap();
    spawn();

    try {
        send_line(render(config_.templates.start, {{"port", port}, {"box_id", box_id_}}));
    } catch (const AcademyError& e) {
        {
            std::lock_guard lock(mutex_);
            expecting_exit_ = true;
        }
        force_kill();
        reap();
        throw AcademyError(ErrorCode::EngineLaunchFailed, e.what());
    }

    std::unique_lock lock(mutex_);
    const bool settled = cv_.wait_for(lock, config_.launch_timeout,
                                      [this] { return launch_state_ != LaunchState::Pending || exited_; });
    if (settled && launch_state_ == LaunchState::Ready && !exited_) {
        gui_visible_ = config_.console_visible_on_start;
        return;
    }
    const LaunchState state = launch_state_;
    const std::string detail = launch_detail_;
    expecting_exit_ = true;
    lock.unlock();

    force_kill();
    reap();

    if (!settled) {
        throw AcademyError(ErrorCode::Timeout, "engine did not report ready within " +
                                                   std::to_string(config_.launch_timeout.count()) + " ms");
    }
    if (state == LaunchState::Failed) {
        throw AcademyError(ErrorCode::EngineLaunchFailed, detail);
    }
    throw AcademyError(ErrorCode::EngineLaunchFailed, "engine exited during launch");
}

EngineWorker::StopOutcome SubprocessWorker::stop() {
    {
        std::lock_guard lock(mutex_);
        expecting_exit_ = true;
        if (pid_ <= 0 || exited_) {
            gui_visible_ = false;
        }
    }
    if (!is_active()) {
        reap();
        return StopOutcome::Graceful;
    }

    try {
        send_line(config_.templates.stop);
    } catch (const AcademyError& e) {
        util::log::warn("[" + box_id_ + "] stop command not delivered: " + e.what());
    }
    {
        std::lock_guard lock(mutex_);
        close_fd(stdin_fd_);
    }

    StopOutcome outcome = StopOutcome::Graceful;
    if (!wait_for_exit(config_.stop_grace)) {
        util::log::warn("[" + box_id_ + "] engine ignored stop for " +
                        std::to_string(config_.stop_grace.count()) + " ms, killing");
        force_kill();
        outcome = StopOutcome::Forced;
    }
    reap();
    std::lock_guard lock(mutex_);
    gui_visible_ = false;
    return outcome;
}

void SubprocessWorker::set_console_visible(bool visible) {
    {
        std::lock_guard lock(mutex_);
        if (gui_visible_ == visible) {
            return;
        }
    }
    send_line(render(config_.templates.toggle_console, {{"box_id", box_id_}}));
    std::lock_guard lock(mutex_);
    gui_visible_ = visible;
}

void SubprocessWorker::calibrate() {
    send_line(render(config_.templates.calibrate, {{"box_id", box_id_}}));
}

void SubprocessWorker::run_protocol(const std::string& protocol,
                                    const std::string& subject,
                                    const std::string& settings) {
    send_line(render(config_.templates.run_protocol,
                     {{"box_id", box_id_}, {"protocol", protocol}, {"subject", subject}, {"settings", settings}}));
}

void SubprocessWorker::stop_protocol() {
    if (config_.interrupt_on_stop_protocol) {
        signal_group(SIGINT);
    }
    send_line(render(config_.templates.stop_protocol, {{"box_id", box_id_}}));
}

bool SubprocessWorker::is_active() const {
    std::lock_guard lock(mutex_);
    return pid_ > 0 && !exited_;
}

bool SubprocessWorker::gui_visible() const {
    std::lock_guard lock(mutex_);
    return gui_visible_;
}

void SubprocessWorker::set_exit_handler(ExitHandler handler) {
    std::lock_guard lock(mutex_);
    exit_handler_ = std::move(handler);
}

pid_t SubprocessWorker::pid() const {
    std::lock_guard lock(mutex_);
    return pid_;
}

}  // namespace academy::control
