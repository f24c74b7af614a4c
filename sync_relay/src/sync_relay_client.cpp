#include "academy/sync/sync_relay_client.hpp"

#include <algorithm>
#include <stdexcept>
#include <utility>

#include <spdlog/spdlog.h>

namespace academy::sync {

SyncRelayClient::SyncRelayClient(std::string port) : SyncRelayClient(std::move(port), Options{}) {}

SyncRelayClient::SyncRelayClient(std::string port, Options options, std::unique_ptr<SerialChannel> channel)
    : port_(std::move(port)),
      options_(options),
      channel_(channel ? std::move(channel) : std::make_unique<SerialChannel>()) {}

SyncRelayClient::~SyncRelayClient() {
    try {
        if (active()) {
            disconnect();
        }
    } catch (const std::exception& ex) {
        spdlog::warn("sync relay: disconnect on destruction failed: {}", ex.what());
    }
    stop_reader();
    channel_->close();
}

void SyncRelayClient::connect() {
    if (!channel_->is_open()) {
        stop_reader();
        if (!channel_->open(port_, to_speed(options_.baud))) {
            throw std::runtime_error("cannot open sync relay port " + port_);
        }
        decoder_ = FrameDecoder{};
        reading_ = true;
        reader_ = std::thread([this] { reader_loop(); });
    }

    std::unique_lock lock(mutex_);
    const auto before = connect_acks_;
    lock.unlock();
    send(Command{Tag::Connect});
    lock.lock();
    wait_for(lock, [&] { return connect_acks_ > before; }, "relay activation");
    spdlog::info("sync relay: connected on {}", port_);
}

void SyncRelayClient::start_channel(std::uint16_t channel) {
    check_channel(channel);
    std::unique_lock lock(mutex_);
    if (!active_) {
        throw std::runtime_error("sync relay is not connected");
    }
    const auto before = channels_[channel].start_acks;
    lock.unlock();
    send(Command{Tag::Start, channel});
    lock.lock();
    wait_for(lock, [&] { return channels_[channel].start_acks > before; },
             "start of channel " + std::to_string(channel));
}

void SyncRelayClient::stop_channel(std::uint16_t channel) {
    check_channel(channel);
    std::unique_lock lock(mutex_);
    if (!channels_[channel].active) {
        throw std::runtime_error("sync channel " + std::to_string(channel) + " is not started");
    }
    const auto before = channels_[channel].stop_acks;
    lock.unlock();
    send(Command{Tag::Stop, channel});
    lock.lock();
    wait_for(lock, [&] { return channels_[channel].stop_acks > before; },
             "stop of channel " + std::to_string(channel));
}

void SyncRelayClient::disconnect() {
    if (!channel_->is_open()) {
        return;
    }
    std::unique_lock lock(mutex_);
    const auto before = disconnect_acks_;
    lock.unlock();
    send(Command{Tag::Disconnect});
    lock.lock();
    wait_for(lock, [&] { return disconnect_acks_ > before; }, "relay deactivation");
    lock.unlock();

    stop_reader();
    channel_->close();
    spdlog::info("sync relay: disconnected from {}", port_);
}

bool SyncRelayClient::active() const {
    std::lock_guard lock(mutex_);
    return active_;
}

bool SyncRelayClient::channel_active(std::uint16_t channel) const {
    check_channel(channel);
    std::lock_guard lock(mutex_);
    return channels_[channel].active;
}

std::vector<TtlEvent> SyncRelayClient::take_events(std::uint16_t channel,
                                                   std::chrono::system_clock::time_point max_host_time) {
    check_channel(channel);
    std::lock_guard lock(mutex_);
    auto& events = channels_[channel].events;
    const auto split = std::stable_partition(events.begin(), events.end(), [&](const TtlEvent& event) {
        return event.host_time < max_host_time;
    });
    std::vector<TtlEvent> taken(events.begin(), split);
    events.erase(events.begin(), split);
    return taken;
}

std::vector<TtlEvent> SyncRelayClient::take_events(std::uint16_t channel) {
    return take_events(channel, std::chrono::system_clock::time_point::max());
}

void SyncRelayClient::reader_loop() {
    while (reading_ && channel_->is_open()) {
        auto bytes = channel_->read(options_.poll_interval);
        if (!bytes) {
            continue;
        }
        const auto host_time = std::chrono::system_clock::now();
        for (const auto& frame : decoder_.feed(*bytes)) {
            apply(frame, host_time);
        }
    }
    std::lock_guard lock(mutex_);
    reading_ = false;
    active_ = false;
    cv_.notify_all();
}

void SyncRelayClient::apply(const Frame& frame, std::chrono::system_clock::time_point host_time) {
    spdlog::debug("sync relay: received {}", describe(frame));
    std::lock_guard lock(mutex_);
    switch (frame.tag) {
    case Tag::Connect:
        active_ = true;
        ++connect_acks_;
        break;
    case Tag::Disconnect:
        active_ = false;
        ++disconnect_acks_;
        for (auto& state : channels_) {
            state.active = false;
        }
        break;
    case Tag::Start:
        if (is_valid_channel(frame.channel)) {
            auto& state = channels_[frame.channel];
            state.active = true;
            state.events.clear();
            ++state.start_acks;
        }
        break;
    case Tag::Stop:
        if (is_valid_channel(frame.channel)) {
            auto& state = channels_[frame.channel];
            state.active = false;
            ++state.stop_acks;
        }
        break;
    case Tag::Edge:
        if (is_valid_channel(frame.channel)) {
            channels_[frame.channel].events.push_back(
                TtlEvent{frame.channel, frame.value, frame.elapsed, host_time});
        } else {
            spdlog::warn("sync relay: edge on invalid channel {}", frame.channel);
        }
        break;
    case Tag::Reboot:
        break;
    }
    cv_.notify_all();
}

void SyncRelayClient::send(const Command& command) {
    if (!channel_->write(encode_command(command))) {
        throw std::runtime_error("write to sync relay on " + port_ + " failed");
    }
}

template <typename Predicate>
void SyncRelayClient::wait_for(std::unique_lock<std::mutex>& lock, Predicate done, const std::string& what) {
    if (!cv_.wait_for(lock, options_.ack_timeout, [&] { return done() || !reading_; }) || !done()) {
        throw std::runtime_error("sync relay did not acknowledge " + what);
    }
}

void SyncRelayClient::stop_reader() {
    reading_ = false;
    if (reader_.joinable()) {
        reader_.join();
    }
}

void SyncRelayClient::check_channel(std::uint16_t channel) {
    if (!is_valid_channel(channel)) {
        throw std::invalid_argument("sync channel " + std::to_string(channel) + " out of range");
    }
}

}  // namespace academy::sync
