#pragma once

#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace academy::sync {

using Bytes = std::vector<std::uint8_t>;

inline constexpr std::uint16_t kChannelCount = 13;

enum class Tag : std::uint8_t {
    Connect = 'A',
    Disconnect = 'Z',
    Start = 'S',
    Stop = 'E',
    Edge = 'T',
    Reboot = 'Y',
};

// One relay-to-host frame. Only Start, Stop and Edge carry a payload.
struct Frame {
    Tag tag{Tag::Connect};
    std::uint16_t channel{0};
    std::uint8_t value{0};
    std::uint32_t elapsed{0};

    bool operator==(const Frame& other) const = default;
};

struct Command {
    Tag tag{Tag::Connect};
    std::uint16_t channel{0};

    bool operator==(const Command& other) const = default;
};

bool is_valid_channel(std::uint16_t channel);
std::string describe(const Frame& frame);

// Host -> relay.
Bytes encode_command(const Command& command);

// Relay -> host. Single-byte tags encode to one byte, the rest to eight.
Bytes encode_frame(const Frame& frame);

// Incremental parser for the relay's output stream. Unknown bytes are skipped.
class FrameDecoder {
public:
    std::vector<Frame> feed(const std::uint8_t* data, std::size_t size);
    std::vector<Frame> feed(const Bytes& bytes) { return feed(bytes.data(), bytes.size()); }

    std::size_t skipped() const { return skipped_; }
    bool idle() const { return pending_.empty(); }

private:
    Bytes pending_;
    std::size_t skipped_{0};
};

class CommandDecoder {
public:
    std::vector<Command> feed(const std::uint8_t* data, std::size_t size);
    std::vector<Command> feed(const Bytes& bytes) { return feed(bytes.data(), bytes.size()); }

private:
    Bytes pending_;
};

}  // namespace academy::sync
