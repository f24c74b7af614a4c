#include "academy/sync/relay_protocol.hpp"

#include <spdlog/spdlog.h>

namespace academy::sync {

namespace {

constexpr std::size_t kPayloadFrameSize = 8;
constexpr std::size_t kChannelCommandSize = 3;

bool has_payload(std::uint8_t tag) {
    return tag == static_cast<std::uint8_t>(Tag::Start) || tag == static_cast<std::uint8_t>(Tag::Stop) ||
           tag == static_cast<std::uint8_t>(Tag::Edge);
}

bool is_single_byte_output(std::uint8_t tag) {
    return tag == static_cast<std::uint8_t>(Tag::Connect) || tag == static_cast<std::uint8_t>(Tag::Disconnect);
}

std::uint16_t read_u16(const std::uint8_t* p) {
    return static_cast<std::uint16_t>(p[0] | (p[1] << 8));
}

std::uint32_t read_u32(const std::uint8_t* p) {
    return static_cast<std::uint32_t>(p[0]) | (static_cast<std::uint32_t>(p[1]) << 8) |
           (static_cast<std::uint32_t>(p[2]) << 16) | (static_cast<std::uint32_t>(p[3]) << 24);
}

void write_u16(Bytes& out, std::uint16_t value) {
    out.push_back(static_cast<std::uint8_t>(value & 0xff));
    out.push_back(static_cast<std::uint8_t>(value >> 8));
}

void write_u32(Bytes& out, std::uint32_t value) {
    for (int shift = 0; shift < 32; shift += 8) {
        out.push_back(static_cast<std::uint8_t>((value >> shift) & 0xff));
    }
}

}  // namespace

bool is_valid_channel(std::uint16_t channel) {
    return channel < kChannelCount;
}

std::string describe(const Frame& frame) {
    std::string text(1, static_cast<char>(frame.tag));
    if (has_payload(static_cast<std::uint8_t>(frame.tag))) {
        text += "," + std::to_string(frame.channel) + "," + std::to_string(frame.value) + "," +
                std::to_string(frame.elapsed);
    }
    return text;
}

Bytes encode_command(const Command& command) {
    Bytes out{static_cast<std::uint8_t>(command.tag)};
    if (command.tag == Tag::Start || command.tag == Tag::Stop) {
        write_u16(out, command.channel);
    }
    return out;
}

Bytes encode_frame(const Frame& frame) {
    Bytes out{static_cast<std::uint8_t>(frame.tag)};
    if (has_payload(out.front())) {
        write_u16(out, frame.channel);
        out.push_back(frame.value);
        write_u32(out, frame.elapsed);
    }
    return out;
}

std::vector<Frame> FrameDecoder::feed(const std::uint8_t* data, std::size_t size) {
    pending_.insert(pending_.end(), data, data + size);

    std::vector<Frame> frames;
    std::size_t pos = 0;
    while (pos < pending_.size()) {
        const auto tag = pending_[pos];
        if (is_single_byte_output(tag)) {
            frames.push_back(Frame{static_cast<Tag>(tag)});
            ++pos;
        } else if (has_payload(tag)) {
            if (pending_.size() - pos < kPayloadFrameSize) {
                break;
            }
            const auto* p = pending_.data() + pos;
            frames.push_back(Frame{static_cast<Tag>(tag), read_u16(p + 1), p[3], read_u32(p + 4)});
            pos += kPayloadFrameSize;
        } else {
            spdlog::debug("sync relay: skipping unexpected byte 0x{:02x}", tag);
            ++skipped_;
            ++pos;
        }
    }
    pending_.erase(pending_.begin(), pending_.begin() + static_cast<std::ptrdiff_t>(pos));
    return frames;
}

std::vector<Command> CommandDecoder::feed(const std::uint8_t* data, std::size_t size) {
    pending_.insert(pending_.end(), data, data + size);

    std::vector<Command> commands;
    std::size_t pos = 0;
    while (pos < pending_.size()) {
        const auto tag = pending_[pos];
        switch (static_cast<Tag>(tag)) {
        case Tag::Connect:
        case Tag::Disconnect:
        case Tag::Reboot:
            commands.push_back(Command{static_cast<Tag>(tag)});
            ++pos;
            continue;
        case Tag::Start:
        case Tag::Stop:
            if (pending_.size() - pos < kChannelCommandSize) {
                break;
            }
            commands.push_back(Command{static_cast<Tag>(tag), read_u16(pending_.data() + pos + 1)});
            pos += kChannelCommandSize;
            continue;
        default:
            ++pos;
            continue;
        }
        break;
    }
    pending_.erase(pending_.begin(), pending_.begin() + static_cast<std::ptrdiff_t>(pos));
    return commands;
}

}  // namespace academy::sync
