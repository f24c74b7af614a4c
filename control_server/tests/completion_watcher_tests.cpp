#include "completion_watcher.hpp"
#include "execution_log.hpp"
#include "test_support.hpp"

#include <mutex>
#include <vector>

using academy::control::CompletionEvent;
using academy::control::CompletionWatcher;
using academy::control::ExecutionLog;
using academy::control::WatcherSection;
using academy::test::TempDir;

namespace {

struct Recorder {
    std::mutex mutex;
    std::vector<CompletionEvent> events;

    CompletionWatcher::EventHandler handler() {
        return [this](const CompletionEvent& event) {
            std::lock_guard lock(mutex);
            events.push_back(event);
        };
    }

    std::size_t size() {
        std::lock_guard lock(mutex);
        return events.size();
    }
};

}  // namespace

TEST_CASE("Watcher reports completion after the armed offset", "[watcher]") {
    TempDir dir;
    ExecutionLog log(dir / "B1.log", "B1");
    log.append_output("ACADEMY_PROTOCOL_COMPLETE");

    Recorder recorder;
    CompletionWatcher watcher(WatcherSection{}, recorder.handler());
    watcher.arm("B1", 7, log.path(), log.size());

    watcher.poll();
    REQUIRE(recorder.size() == 0);

    log.append_command("run_protocol", "protocol=Licking", "ok");
    log.append_output(">> disp('ACADEMY_PROTOCOL_COMPLETE')");
    log.append_output("running");
    watcher.poll();
    REQUIRE(recorder.size() == 0);

    log.append_output(">> ACADEMY_PROTOCOL_COMPLETE");
    watcher.poll();
    REQUIRE(recorder.size() == 1);
    REQUIRE(recorder.events[0].kind == CompletionEvent::Kind::Completed);
    REQUIRE(recorder.events[0].session_id == 7);
    REQUIRE_FALSE(watcher.armed("B1"));
}

TEST_CASE("Watcher carries the failure detail", "[watcher]") {
    TempDir dir;
    ExecutionLog log(dir / "B2.log", "B2");

    Recorder recorder;
    CompletionWatcher watcher(WatcherSection{}, recorder.handler());
    watcher.arm("B2", 1, log.path(), log.size());
    log.append_output("ACADEMY_PROTOCOL_FAILED Undefined function 'Foo'");
    watcher.poll();

    REQUIRE(recorder.size() == 1);
    REQUIRE(recorder.events[0].kind == CompletionEvent::Kind::Failed);
    REQUIRE(recorder.events[0].detail == "Undefined function 'Foo'");
}

TEST_CASE("Watcher ignores other devices sharing a log", "[watcher]") {
    TempDir dir;
    ExecutionLog other(dir / "shared.log", "B9");

    Recorder recorder;
    CompletionWatcher watcher(WatcherSection{}, recorder.handler());
    watcher.arm("B1", 1, other.path(), 0);
    other.append_output("ACADEMY_PROTOCOL_COMPLETE");
    watcher.poll();
    REQUIRE(recorder.size() == 0);
    REQUIRE(watcher.armed("B1"));
}

TEST_CASE("Watcher rereads a truncated log from the start", "[watcher]") {
    TempDir dir;
    const auto path = dir / "B3.log";
    {
        ExecutionLog log(path, "B3");
        for (int i = 0; i < 20; ++i) {
            log.append_output("noise line " + std::to_string(i));
        }
    }

    Recorder recorder;
    CompletionWatcher watcher(WatcherSection{}, recorder.handler());
    watcher.arm("B3", 2, path, std::filesystem::file_size(path));

    academy::test::write_file(path, "2026-01-01T00:00:00.000Z B3 OUT ACADEMY_PROTOCOL_COMPLETE\n");
    watcher.poll();
    REQUIRE(recorder.size() == 1);
    REQUIRE(recorder.events[0].kind == CompletionEvent::Kind::Completed);
}

TEST_CASE("Watcher follows a log rotated by rename", "[watcher]") {
    TempDir dir;
    const auto path = dir / "B1.log";
    ExecutionLog log(path, "B1");
    log.append_output("protocol starting");

    Recorder recorder;
    CompletionWatcher watcher(WatcherSection{}, recorder.handler());
    watcher.arm("B1", 4, path, log.size());

    SECTION("rotator creates the new file") {
        std::filesystem::rename(path, dir / "B1.log.1");
        academy::test::write_file(path, "");
        watcher.poll();
    }
    SECTION("writer creates the new file") {
        std::filesystem::rename(path, dir / "B1.log.1");
    }

    log.append_output("ACADEMY_PROTOCOL_COMPLETE");
    watcher.poll();
    watcher.poll();

    REQUIRE(std::filesystem::file_size(path) > 0);
    REQUIRE(academy::test::read_file(dir / "B1.log.1").find("ACADEMY_PROTOCOL_COMPLETE") == std::string::npos);
    REQUIRE(recorder.size() == 1);
    REQUIRE(recorder.events[0].kind == CompletionEvent::Kind::Completed);
    REQUIRE_FALSE(watcher.armed("B1"));
}

TEST_CASE("Watcher reports an unreadable log once", "[watcher]") {
    TempDir dir;
    Recorder recorder;
    CompletionWatcher watcher(WatcherSection{}, recorder.handler());
    watcher.arm("B4", 3, dir / "missing.log", 0);

    watcher.poll();
    watcher.poll();
    REQUIRE(recorder.size() == 1);
    REQUIRE(recorder.events[0].kind == CompletionEvent::Kind::UnknownStatus);
    REQUIRE(watcher.armed("B4"));

    academy::test::write_file(dir / "missing.log", "2026-01-01T00:00:00.000Z B4 OUT ACADEMY_PROTOCOL_COMPLETE\n");
    watcher.poll();
    REQUIRE(recorder.size() == 2);
    REQUIRE(recorder.events[1].kind == CompletionEvent::Kind::Completed);
}

TEST_CASE("Watcher gives up after the protocol timeout", "[watcher]") {
    TempDir dir;
    ExecutionLog log(dir / "B5.log", "B5");

    WatcherSection config;
    config.protocol_timeout = std::chrono::seconds(0);
    Recorder recorder;
    CompletionWatcher watcher(config, recorder.handler());
    watcher.arm("B5", 4, log.path(), log.size());
    watcher.poll();

    REQUIRE(recorder.size() == 1);
    REQUIRE(recorder.events[0].kind == CompletionEvent::Kind::UnknownStatus);
    REQUIRE_FALSE(watcher.armed("B5"));
}

TEST_CASE("Watcher thread polls on its own", "[watcher]") {
    TempDir dir;
    ExecutionLog log(dir / "B6.log", "B6");

    WatcherSection config;
    config.poll_interval = std::chrono::milliseconds(20);
    Recorder recorder;
    CompletionWatcher watcher(config, recorder.handler());
    watcher.start();
    watcher.arm("B6", 5, log.path(), log.size());
    log.append_output("ACADEMY_PROTOCOL_COMPLETE");

    REQUIRE(academy::test::eventually([&] { return recorder.size() == 1; }));
    watcher.stop();
}
