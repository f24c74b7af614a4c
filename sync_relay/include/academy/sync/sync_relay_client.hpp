#pragma once

#include <array>
#include <atomic>
#include <chrono>
#include <condition_variable>
#include <cstdint>
#include <memory>
#include <mutex>
#include <string>
#include <thread>
#include <vector>

#include "academy/sync/relay_protocol.hpp"
#include "academy/sync/serial_channel.hpp"

namespace academy::sync {

struct TtlEvent {
    std::uint16_t channel{0};
    std::uint8_t level{0};
    std::uint32_t device_ticks{0};
    std::chrono::system_clock::time_point host_time{};
};

class SyncRelayClient {
public:
    struct Options {
        int baud{9600};
        std::chrono::milliseconds ack_timeout{std::chrono::seconds(10)};
        std::chrono::milliseconds poll_interval{std::chrono::milliseconds(50)};
    };

    explicit SyncRelayClient(std::string port);
    SyncRelayClient(std::string port, Options options, std::unique_ptr<SerialChannel> channel = nullptr);
    ~SyncRelayClient();

    SyncRelayClient(const SyncRelayClient&) = delete;
    SyncRelayClient& operator=(const SyncRelayClient&) = delete;

    void connect();
    void start_channel(std::uint16_t channel);
    void stop_channel(std::uint16_t channel);
    void disconnect();

    bool active() const;
    bool channel_active(std::uint16_t channel) const;

    // Removes and returns the channel's events recorded before `max_host_time`.
    std::vector<TtlEvent> take_events(std::uint16_t channel, std::chrono::system_clock::time_point max_host_time);
    std::vector<TtlEvent> take_events(std::uint16_t channel);

private:
    struct ChannelState {
        bool active{false};
        std::uint64_t start_acks{0};
        std::uint64_t stop_acks{0};
        std::vector<TtlEvent> events;
    };

    void reader_loop();
    void apply(const Frame& frame, std::chrono::system_clock::time_point host_time);
    void send(const Command& command);
    template <typename Predicate>
    void wait_for(std::unique_lock<std::mutex>& lock, Predicate done, const std::string& what);
    void stop_reader();
    static void check_channel(std::uint16_t channel);

    std::string port_;
    Options options_;
    std::unique_ptr<SerialChannel> channel_;
    FrameDecoder decoder_;

    std::thread reader_;
    std::atomic_bool reading_{false};

    mutable std::mutex mutex_;
    std::condition_variable cv_;
    bool active_{false};
    std::uint64_t connect_acks_{0};
    std::uint64_t disconnect_acks_{0};
    std::array<ChannelState, kChannelCount> channels_{};
};

}  // namespace academy::sync
