#include "academy/sync/relay_device.hpp"

#include <spdlog/spdlog.h>

namespace academy::sync {

RelayDevice::RelayDevice() = default;

Bytes RelayDevice::receive(const Bytes& bytes) {
    Bytes out;
    for (const auto& command : decoder_.feed(bytes)) {
        auto reply = handle(command);
        out.insert(out.end(), reply.begin(), reply.end());
    }
    return out;
}

Bytes RelayDevice::handle(const Command& command) {
    switch (command.tag) {
    case Tag::Connect:
        return on_connect();
    case Tag::Disconnect:
        return on_disconnect();
    case Tag::Start:
        return on_start(command.channel);
    case Tag::Stop:
        return on_stop(command.channel);
    case Tag::Reboot:
        on_reboot();
        return {};
    case Tag::Edge:
        break;
    }
    return {};
}

Bytes RelayDevice::edge(std::uint16_t channel, std::uint8_t level) {
    if (!is_valid_channel(channel) || !edge_handlers_[channel]) {
        return {};
    }
    return edge_handlers_[channel](level ? 1 : 0);
}

bool RelayDevice::channel_started(std::uint16_t channel) const {
    return is_valid_channel(channel) && started_at_[channel].has_value();
}

Bytes RelayDevice::on_connect() {
    connected_ = true;
    return encode_frame(Frame{Tag::Connect});
}

Bytes RelayDevice::on_disconnect() {
    connected_ = false;
    reset_channels();
    return encode_frame(Frame{Tag::Disconnect});
}

Bytes RelayDevice::on_start(std::uint16_t channel) {
    if (!connected_ || !is_valid_channel(channel)) {
        return {};
    }
    started_at_[channel] = now_;
    edge_handlers_[channel] = [this, channel](std::uint8_t level) {
        const std::uint32_t elapsed = now_ - *started_at_[channel];
        return encode_frame(Frame{Tag::Edge, channel, level, elapsed});
    };
    return encode_frame(Frame{Tag::Start, channel, 1, 0});
}

Bytes RelayDevice::on_stop(std::uint16_t channel) {
    if (!connected_ || !channel_started(channel)) {
        return {};
    }
    const std::uint32_t elapsed = now_ - *started_at_[channel];
    started_at_[channel].reset();
    edge_handlers_[channel] = nullptr;
    return encode_frame(Frame{Tag::Stop, channel, 0, elapsed});
}

void RelayDevice::on_reboot() {
    if (connected_) {
        return;
    }
    ++reboots_;
    reset_channels();
    decoder_ = CommandDecoder{};
    now_ = 0;
    spdlog::info("sync relay: rebooted ({} total)", reboots_);
}

void RelayDevice::reset_channels() {
    for (std::uint16_t channel = 0; channel < kChannelCount; ++channel) {
        started_at_[channel].reset();
        edge_handlers_[channel] = nullptr;
    }
}

}  // namespace academy::sync
