#include "subprocess_worker.hpp"
#include "test_support.hpp"

#include "academy/common/errors.hpp"

#include <atomic>
#include <csignal>

#include <sys/types.h>

using academy::common::AcademyError;
using academy::common::ErrorCode;
using academy::control::EngineSection;
using academy::control::EngineWorker;
using academy::control::ExecutionLog;
using academy::control::SubprocessWorker;
using academy::test::eventually;
using academy::test::read_file;
using academy::test::TempDir;

namespace {

EngineSection fake_engine(const std::string& mode = "") {
    EngineSection config;
    config.command = {"/bin/sh", std::string(ACADEMY_TEST_FIXTURE_DIR) + "/fake_engine.sh"};
    if (!mode.empty()) {
        config.command.push_back(mode);
    }
    config.launch_timeout = std::chrono::milliseconds(3000);
    config.stop_grace = std::chrono::milliseconds(2000);
    config.interrupt_on_stop_protocol = false;
    config.templates.start = "start {port}";
    config.templates.stop = "quit";
    config.templates.toggle_console = "toggle";
    config.templates.calibrate = "calibrate";
    config.templates.run_protocol = "run {protocol} {subject} {settings}";
    config.templates.stop_protocol = "stop_protocol";
    return config;
}

ErrorCode start_error(SubprocessWorker& worker, const std::string& port) {
    try {
        worker.start(port);
    } catch (const AcademyError& e) {
        return e.code();
    }
    FAIL("start succeeded unexpectedly");
    return ErrorCode::BadRequest;
}

}  // namespace

TEST_CASE("Templates substitute placeholders and double quotes", "[worker]") {
    REQUIRE(SubprocessWorker::render("Bpod('{port}', '{box_id}')", {{"port", "/dev/ttyACM0"}, {"box_id", "B1"}}) ==
            "Bpod('/dev/ttyACM0', 'B1')");
    REQUIRE(SubprocessWorker::render("disp('{subject}')", {{"subject", "O'Neil"}}) == "disp('O''Neil')");
    REQUIRE(SubprocessWorker::render("{unknown} {", {}) == "{unknown} {");
}

TEST_CASE("Worker starts, drives and stops the engine", "[worker]") {
    TempDir dir;
    ExecutionLog log(dir / "B1.log", "B1");
    SubprocessWorker worker("B1", fake_engine(), log);

    worker.start("EMU");
    REQUIRE(worker.is_active());
    REQUIRE(worker.gui_visible());
    const pid_t pid = worker.pid();
    REQUIRE(pid > 0);

    worker.set_console_visible(false);
    REQUIRE_FALSE(worker.gui_visible());
    worker.set_console_visible(false);
    worker.calibrate();
    worker.run_protocol("Licking", "M01", "DefaultSettings");
    REQUIRE(eventually([&] { return read_file(log.path()).find("running Licking M01 DefaultSettings") !=
                                    std::string::npos; }));

    REQUIRE(worker.stop() == EngineWorker::StopOutcome::Graceful);
    REQUIRE_FALSE(worker.is_active());
    REQUIRE(::kill(pid, 0) != 0);

    const auto text = read_file(log.path());
    REQUIRE(text.find("B1 OUT >> ACADEMY_READY") != std::string::npos);
    REQUIRE(text.find("B1 OUT ok toggle") != std::string::npos);
    REQUIRE(text.find("B1 OUT ok calibrate") != std::string::npos);
    // Second hide request was a no-op.
    REQUIRE(text.find("ok toggle") == text.rfind("ok toggle"));
}

TEST_CASE("Launch failure marker is reported with its detail", "[worker]") {
    TempDir dir;
    ExecutionLog log(dir / "B1.log", "B1");
    SubprocessWorker worker("B1", fake_engine(), log);

    try {
        worker.start("/dev/ttyACM7");
        FAIL("start succeeded unexpectedly");
    } catch (const AcademyError& e) {
        REQUIRE(e.code() == ErrorCode::EngineLaunchFailed);
        REQUIRE(std::string(e.what()).find("no device on /dev/ttyACM7") != std::string::npos);
    }
    REQUIRE_FALSE(worker.is_active());
}

TEST_CASE("Silent engine times out and is killed", "[worker]") {
    TempDir dir;
    ExecutionLog log(dir / "B1.log", "B1");
    auto config = fake_engine();
    config.templates.start = "hello {port}";
    config.launch_timeout = std::chrono::milliseconds(300);
    SubprocessWorker worker("B1", config, log);

    REQUIRE(start_error(worker, "EMU") == ErrorCode::Timeout);
    REQUIRE_FALSE(worker.is_active());
}

TEST_CASE("Missing executable is a launch failure", "[worker]") {
    TempDir dir;
    ExecutionLog log(dir / "B1.log", "B1");
    auto config = fake_engine();
    config.command = {(dir / "no-such-engine").string()};
    SubprocessWorker worker("B1", config, log);

    REQUIRE(start_error(worker, "EMU") == ErrorCode::EngineLaunchFailed);
}

TEST_CASE("Engine that ignores stop is killed", "[worker]") {
    TempDir dir;
    ExecutionLog log(dir / "B1.log", "B1");
    auto config = fake_engine("stubborn");
    config.stop_grace = std::chrono::milliseconds(300);
    SubprocessWorker worker("B1", config, log);

    worker.start("EMU");
    const pid_t pid = worker.pid();
    REQUIRE(worker.stop() == EngineWorker::StopOutcome::Forced);
    REQUIRE_FALSE(worker.is_active());
    REQUIRE(::kill(pid, 0) != 0);
}

TEST_CASE("Unexpected exit reaches the exit handler", "[worker]") {
    TempDir dir;
    ExecutionLog log(dir / "B1.log", "B1");
    auto config = fake_engine();
    config.templates.calibrate = "crash";
    SubprocessWorker worker("B1", config, log);

    std::atomic_bool exited{false};
    std::string detail;
    std::mutex mutex;
    worker.set_exit_handler([&](const std::string& text) {
        std::lock_guard lock(mutex);
        detail = text;
        exited = true;
    });

    worker.start("EMU");
    worker.calibrate();
    REQUIRE(eventually([&] { return exited.load(); }));
    REQUIRE_FALSE(worker.is_active());
    {
        std::lock_guard lock(mutex);
        REQUIRE(detail.find('3') != std::string::npos);
    }

    try {
        worker.calibrate();
        FAIL("write to exited engine succeeded");
    } catch (const AcademyError& e) {
        REQUIRE(e.code() == ErrorCode::EngineCrashed);
    }
    REQUIRE(worker.stop() == EngineWorker::StopOutcome::Graceful);
}

TEST_CASE("Engines do not hold each other's stdin open", "[worker]") {
    TempDir dir;
    ExecutionLog log_a(dir / "A.log", "A");
    ExecutionLog log_b(dir / "B.log", "B");
    // Without a quit command the engine only leaves on stdin EOF.
    auto config = fake_engine();
    config.templates.stop = "noop";
    config.stop_grace = std::chrono::milliseconds(1500);
    SubprocessWorker first("A", config, log_a);
    SubprocessWorker second("B", config, log_b);

    first.start("EMU");
    second.start("EMU");
    REQUIRE(first.stop() == EngineWorker::StopOutcome::Graceful);
    REQUIRE(second.is_active());
    REQUIRE(second.stop() == EngineWorker::StopOutcome::Graceful);
}
