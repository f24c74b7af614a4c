#include "academy/sync/relay_device.hpp"
#include "academy/sync/sync_relay_client.hpp"

#include <catch2/catch_test_macros.hpp>

#include <atomic>
#include <chrono>
#include <cstdlib>
#include <mutex>
#include <stdexcept>
#include <string>
#include <thread>

#include <fcntl.h>
#include <poll.h>
#include <unistd.h>

using namespace academy::sync;
using namespace std::chrono_literals;

namespace {

class EmulatedRelay {
public:
    EmulatedRelay() {
        master_ = ::posix_openpt(O_RDWR | O_NOCTTY);
        if (master_ < 0 || ::grantpt(master_) != 0 || ::unlockpt(master_) != 0) {
            throw std::runtime_error("cannot allocate pseudo-terminal");
        }
        slave_path_ = ::ptsname(master_);
        pump_ = std::thread([this] { run(); });
    }

    ~EmulatedRelay() {
        running_ = false;
        pump_.join();
        ::close(master_);
    }

    const std::string& port() const { return slave_path_; }

    void edge(std::uint16_t channel, std::uint8_t level, std::uint32_t after_ticks) {
        std::lock_guard lock(mutex_);
        device_.advance(after_ticks);
        REQUIRE(write_all(device_.edge(channel, level)));
    }

    void advance(std::uint32_t ticks) {
        std::lock_guard lock(mutex_);
        device_.advance(ticks);
    }

    bool channel_started(std::uint16_t channel) {
        std::lock_guard lock(mutex_);
        return device_.channel_started(channel);
    }

    void set_silent(bool silent) { silent_ = silent; }
    bool write_failed() const { return write_failed_; }

private:
    void run() {
        pollfd pfd{master_, POLLIN, 0};
        while (running_) {
            if (::poll(&pfd, 1, 20) <= 0) {
                continue;
            }
            if (!(pfd.revents & POLLIN)) {
                // No slave open yet.
                std::this_thread::sleep_for(5ms);
                continue;
            }
            std::uint8_t buffer[64];
            const auto n = ::read(master_, buffer, sizeof(buffer));
            if (n <= 0) {
                continue;
            }
            std::lock_guard lock(mutex_);
            const auto reply = device_.receive(Bytes(buffer, buffer + n));
            if (!silent_ && !write_all(reply)) {
                write_failed_ = true;
            }
        }
    }

    bool write_all(const Bytes& bytes) {
        return bytes.empty() || ::write(master_, bytes.data(), bytes.size()) == static_cast<ssize_t>(bytes.size());
    }

    int master_{-1};
    std::string slave_path_;
    std::mutex mutex_;
    RelayDevice device_;
    std::atomic_bool running_{true};
    std::atomic_bool silent_{false};
    std::atomic_bool write_failed_{false};
    std::thread pump_;
};

template <typename Predicate>
bool eventually(Predicate predicate) {
    const auto deadline = std::chrono::steady_clock::now() + 3s;
    while (std::chrono::steady_clock::now() < deadline) {
        if (predicate()) {
            return true;
        }
        std::this_thread::sleep_for(10ms);
    }
    return predicate();
}

}  // namespace

TEST_CASE("SyncRelayClient records edges for a started channel", "[sync][client]") {
    EmulatedRelay relay;
    SyncRelayClient client(relay.port());

    client.connect();
    REQUIRE(client.active());

    client.start_channel(3);
    REQUIRE(client.channel_active(3));
    REQUIRE(relay.channel_started(3));

    relay.edge(3, 1, 150);
    relay.edge(3, 0, 50);

    std::vector<TtlEvent> events;
    REQUIRE(eventually([&] {
        auto taken = client.take_events(3);
        events.insert(events.end(), taken.begin(), taken.end());
        return events.size() >= 2;
    }));
    REQUIRE(events.size() == 2);
    REQUIRE(events[0].level == 1);
    REQUIRE(events[0].device_ticks == 150);
    REQUIRE(events[1].level == 0);
    REQUIRE(events[1].device_ticks == 200);
    REQUIRE(client.take_events(3).empty());

    client.stop_channel(3);
    REQUIRE_FALSE(client.channel_active(3));
    REQUIRE_FALSE(relay.channel_started(3));

    client.disconnect();
    REQUIRE_FALSE(client.active());
    REQUIRE_FALSE(relay.write_failed());
}

TEST_CASE("SyncRelayClient keeps events newer than the cutoff", "[sync][client]") {
    EmulatedRelay relay;
    SyncRelayClient client(relay.port());
    client.connect();
    client.start_channel(0);

    relay.edge(0, 1, 10);
    REQUIRE(eventually([&] { return !client.take_events(0).empty(); }));

    const auto cutoff = std::chrono::system_clock::now();
    std::this_thread::sleep_for(5ms);
    relay.edge(0, 0, 10);

    std::this_thread::sleep_for(200ms);
    REQUIRE(client.take_events(0, cutoff).empty());
    const auto later = client.take_events(0);
    REQUIRE(later.size() == 1);
    REQUIRE(later[0].device_ticks == 20);

    client.disconnect();
}

TEST_CASE("SyncRelayClient rejects commands it cannot send", "[sync][client]") {
    EmulatedRelay relay;
    SyncRelayClient client(relay.port());

    REQUIRE_THROWS_AS(client.start_channel(kChannelCount), std::invalid_argument);
    REQUIRE_THROWS_AS(client.start_channel(1), std::runtime_error);

    client.connect();
    REQUIRE_THROWS_AS(client.stop_channel(1), std::runtime_error);
    client.disconnect();
}

TEST_CASE("SyncRelayClient times out on a silent relay", "[sync][client]") {
    EmulatedRelay relay;
    relay.set_silent(true);

    SyncRelayClient::Options options;
    options.ack_timeout = 200ms;
    SyncRelayClient client(relay.port(), options);

    REQUIRE_THROWS_AS(client.connect(), std::runtime_error);
    REQUIRE_FALSE(client.active());
}
