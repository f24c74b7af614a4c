#include "academy/sync/serial_channel.hpp"

#include <algorithm>
#include <cerrno>
#include <cstdint>
#include <cstring>
#include <stdexcept>

#include <fcntl.h>
#include <poll.h>
#include <unistd.h>

#include <spdlog/spdlog.h>

namespace academy::sync {

SerialChannel::~SerialChannel() {
    close();
}

bool SerialChannel::open(const std::string& device, speed_t baud) {
    close();
    fd_ = ::open(device.c_str(), O_RDWR | O_NOCTTY | O_NONBLOCK);
    if (fd_ < 0) {
        spdlog::error("sync relay: open {} failed: {}", device, std::strerror(errno));
        return false;
    }

    struct termios tty {};
    if (::tcgetattr(fd_, &tty) != 0) {
        spdlog::error("sync relay: tcgetattr {} failed: {}", device, std::strerror(errno));
        close();
        return false;
    }

    ::cfmakeraw(&tty);
    tty.c_cflag &= ~(CSIZE | PARENB | CSTOPB | CRTSCTS);
    tty.c_cflag |= CS8 | CLOCAL | CREAD;
    tty.c_iflag &= ~(IXON | IXOFF | IXANY);
    ::cfsetispeed(&tty, baud);
    ::cfsetospeed(&tty, baud);

    if (::tcsetattr(fd_, TCSANOW, &tty) != 0) {
        spdlog::error("sync relay: tcsetattr {} failed: {}", device, std::strerror(errno));
        close();
        return false;
    }
    return true;
}

bool SerialChannel::write(const Bytes& bytes) {
    if (fd_ < 0) {
        return false;
    }

    std::size_t total = 0;
    while (total < bytes.size()) {
        const ssize_t written = ::write(fd_, bytes.data() + total, bytes.size() - total);
        if (written > 0) {
            total += static_cast<std::size_t>(written);
        } else if (written == -1 && errno == EINTR) {
            continue;
        } else if (written == -1 && (errno == EAGAIN || errno == EWOULDBLOCK)) {
            pollfd pfd{fd_, POLLOUT, 0};
            ::poll(&pfd, 1, 100);
        } else {
            spdlog::error("sync relay: write failed: {}", std::strerror(errno));
            return false;
        }
    }
    return true;
}

std::optional<Bytes> SerialChannel::read(std::chrono::milliseconds timeout) {
    if (fd_ < 0) {
        return std::nullopt;
    }

    pollfd pfd{fd_, POLLIN, 0};
    const auto deadline = std::chrono::steady_clock::now() + timeout;
    while (true) {
        const auto left = std::chrono::duration_cast<std::chrono::milliseconds>(
            deadline - std::chrono::steady_clock::now());
        const int rc = ::poll(&pfd, 1, static_cast<int>(std::max<std::int64_t>(left.count(), 0)));
        if (rc == -1) {
            if (errno == EINTR) {
                continue;
            }
            spdlog::error("sync relay: poll failed: {}", std::strerror(errno));
            return std::nullopt;
        }
        if (rc == 0) {
            return std::nullopt;
        }
        if (pfd.revents & POLLIN) {
            std::uint8_t buffer[256];
            const ssize_t n = ::read(fd_, buffer, sizeof(buffer));
            if (n > 0) {
                return Bytes(buffer, buffer + n);
            }
            if (n == -1 && (errno == EINTR || errno == EAGAIN || errno == EWOULDBLOCK)) {
                continue;
            }
            if (n == 0) {
                spdlog::warn("sync relay: serial device hung up");
                close();
            } else {
                spdlog::error("sync relay: read failed: {}", std::strerror(errno));
            }
            return std::nullopt;
        }
        if (pfd.revents & (POLLHUP | POLLERR | POLLNVAL)) {
            spdlog::warn("sync relay: serial device hung up");
            close();
            return std::nullopt;
        }
    }
}

void SerialChannel::close() {
    const int fd = fd_.exchange(-1);
    if (fd >= 0) {
        ::close(fd);
    }
}

speed_t to_speed(int baud) {
    switch (baud) {
    case 9600:
        return B9600;
    case 19200:
        return B19200;
    case 38400:
        return B38400;
    case 57600:
        return B57600;
    case 115200:
        return B115200;
    default:
        throw std::invalid_argument("unsupported baud rate " + std::to_string(baud));
    }
}

}  // namespace academy::sync
