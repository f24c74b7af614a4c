#pragma once

#include <atomic>
#include <chrono>
#include <optional>
#include <string>

#include <termios.h>

#include "academy/sync/relay_protocol.hpp"

namespace academy::sync {

class SerialChannel {
public:
    SerialChannel() = default;
    virtual ~SerialChannel();

    virtual bool open(const std::string& device, speed_t baud);
    virtual bool write(const Bytes& bytes);
    // Waits up to `timeout` for input; nullopt on timeout, hangup or error.
    virtual std::optional<Bytes> read(std::chrono::milliseconds timeout);
    void close();
    bool is_open() const { return fd_ >= 0; }

    SerialChannel(const SerialChannel&) = delete;
    SerialChannel& operator=(const SerialChannel&) = delete;

private:
    std::atomic_int fd_{-1};
};

speed_t to_speed(int baud);

}  // namespace academy::sync
