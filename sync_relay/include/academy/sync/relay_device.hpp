#pragma once

#include <array>
#include <cstdint>
#include <functional>
#include <optional>

#include "academy/sync/relay_protocol.hpp"

namespace academy::sync {

class RelayDevice {
public:
    RelayDevice();

    Bytes receive(const Bytes& bytes);
    Bytes handle(const Command& command);

    Bytes edge(std::uint16_t channel, std::uint8_t level);

    void set_clock(std::uint32_t ticks) { now_ = ticks; }
    void advance(std::uint32_t ticks) { now_ += ticks; }
    std::uint32_t clock() const { return now_; }

    bool connected() const { return connected_; }
    bool indicator_on() const { return connected_; }
    bool channel_started(std::uint16_t channel) const;
    std::uint32_t reboot_count() const { return reboots_; }

private:
    using EdgeHandler = std::function<Bytes(std::uint8_t level)>;

    Bytes on_connect();
    Bytes on_disconnect();
    Bytes on_start(std::uint16_t channel);
    Bytes on_stop(std::uint16_t channel);
    void on_reboot();
    void reset_channels();

    CommandDecoder decoder_;
    std::array<EdgeHandler, kChannelCount> edge_handlers_{};
    std::array<std::optional<std::uint32_t>, kChannelCount> started_at_{};
    std::uint32_t now_{0};
    std::uint32_t reboots_{0};
    bool connected_{false};
};

}  // namespace academy::sync
