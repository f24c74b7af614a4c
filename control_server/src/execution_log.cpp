#include "execution_log.hpp"

#include <sys/stat.h>

#include <chrono>
#include <stdexcept>
#include <system_error>
#include <utility>

#include "academy/common/wire_format.hpp"
#include "util/logging.hpp"

namespace academy::control {

ExecutionLog::ExecutionLog(std::filesystem::path path, std::string box_id)
    : path_(std::move(path)), box_id_(std::move(box_id)) {
    const auto parent = path_.parent_path();
    if (!parent.empty()) {
        std::filesystem::create_directories(parent);
    }
    open_stream();
}

void ExecutionLog::open_stream() {
    stream_.open(path_, std::ios::app);
    if (!stream_) {
        throw std::runtime_error("Failed to open execution log: " + path_.string());
    }
    struct stat info {};
    if (::stat(path_.c_str(), &info) == 0) {
        device_ = info.st_dev;
        inode_ = info.st_ino;
    }
}

// A log renamed away or deleted by rotation is replaced by a fresh file at the same path.
void ExecutionLog::reopen_if_rotated() {
    struct stat info {};
    if (::stat(path_.c_str(), &info) == 0 && info.st_dev == device_ && info.st_ino == inode_) {
        return;
    }
    std::error_code ec;
    const auto parent = path_.parent_path();
    if (!parent.empty()) {
        std::filesystem::create_directories(parent, ec);
    }
    std::ofstream fresh(path_, std::ios::app);
    if (!fresh) {
        util::log::warn("[" + box_id_ + "] cannot reopen execution log " + path_.string() +
                        "; writing to the previous file");
        return;
    }
    stream_ = std::move(fresh);
    if (::stat(path_.c_str(), &info) == 0) {
        device_ = info.st_dev;
        inode_ = info.st_ino;
    }
}

void ExecutionLog::append_command(const std::string& verb, const std::string& args, const std::string& outcome) {
    std::string body = verb;
    if (!args.empty()) {
        body += ' ';
        body += args;
    }
    body += " -> ";
    body += outcome;
    write_line("CMD", body);
}

void ExecutionLog::append_output(const std::string& line) {
    write_line("OUT", line);
}

void ExecutionLog::write_line(const std::string& kind, const std::string& body) {
    const auto stamp = common::format_timestamp(std::chrono::system_clock::now());
    std::lock_guard lock(mutex_);
    reopen_if_rotated();
    stream_ << stamp << ' ' << box_id_ << ' ' << kind << ' ' << body << '\n';
    stream_.flush();
}

std::uintmax_t ExecutionLog::size() const {
    std::lock_guard lock(mutex_);
    std::error_code ec;
    const auto bytes = std::filesystem::file_size(path_, ec);
    return ec ? 0 : bytes;
}

}  // namespace academy::control
