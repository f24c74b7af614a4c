#include "completion_watcher.hpp"

#include <sys/stat.h>

#include <cerrno>
#include <cstring>
#include <exception>
#include <fstream>
#include <utility>

#include <boost/asio/post.hpp>

#include "util/logging.hpp"

namespace academy::control {

namespace {

std::string trim(const std::string& text) {
    const auto begin = text.find_first_not_of(" \t>");
    if (begin == std::string::npos) {
        return {};
    }
    const auto end = text.find_last_not_of(" \t\r");
    return text.substr(begin, end - begin + 1);
}

bool starts_with(const std::string& text, const std::string& prefix) {
    return !prefix.empty() && text.rfind(prefix, 0) == 0;
}

}  // namespace

CompletionWatcher::CompletionWatcher(WatcherSection config, EventHandler handler)
    : config_(std::move(config)), handler_(std::move(handler)), timer_(io_context_) {}

CompletionWatcher::~CompletionWatcher() {
    stop();
}

void CompletionWatcher::start() {
    bool expected = false;
    if (!running_.compare_exchange_strong(expected, true)) {
        return;
    }
    io_context_.restart();
    boost::asio::post(io_context_, [this] { schedule(); });
    thread_ = std::thread([this] {
        try {
            io_context_.run();
        } catch (const std::exception& ex) {
            util::log::error(std::string("Completion watcher stopped: ") + ex.what());
        }
    });
}

void CompletionWatcher::stop() {
    bool expected = true;
    if (!running_.compare_exchange_strong(expected, false)) {
        return;
    }
    boost::asio::post(io_context_, [this] { timer_.cancel(); });
    if (thread_.joinable()) {
        thread_.join();
    }
}

void CompletionWatcher::schedule() {
    timer_.expires_after(config_.poll_interval);
    timer_.async_wait([this](const boost::system::error_code& ec) {
        if (ec == boost::asio::error::operation_aborted || !running_) {
            return;
        }
        poll();
        schedule();
    });
}

void CompletionWatcher::arm(const std::string& box_id,
                            std::uint64_t session_id,
                            std::filesystem::path log_path,
                            std::uintmax_t offset) {
    Watch watch;
    watch.session_id = session_id;
    watch.path = std::move(log_path);
    watch.offset = offset;
    watch.armed_at = std::chrono::steady_clock::now();
    struct stat info {};
    if (::stat(watch.path.c_str(), &info) == 0) {
        watch.identity = static_cast<std::uintmax_t>(info.st_ino);
    }

    std::lock_guard lock(mutex_);
    watches_[box_id] = std::move(watch);
}

void CompletionWatcher::disarm(const std::string& box_id) {
    std::lock_guard lock(mutex_);
    watches_.erase(box_id);
}

bool CompletionWatcher::armed(const std::string& box_id) const {
    std::lock_guard lock(mutex_);
    return watches_.count(box_id) != 0;
}

void CompletionWatcher::poll() {
    std::vector<CompletionEvent> events;
    {
        std::lock_guard lock(mutex_);
        for (auto it = watches_.begin(); it != watches_.end();) {
            if (scan(it->first, it->second, events) == ScanResult::Finished) {
                it = watches_.erase(it);
            } else {
                ++it;
            }
        }
    }
    for (const auto& event : events) {
        handler_(event);
    }
}

CompletionWatcher::ScanResult CompletionWatcher::scan(const std::string& box_id,
                                                      Watch& watch,
                                                      std::vector<CompletionEvent>& events) {
    auto report_unreadable = [&](const std::string& reason) {
        if (watch.unreadable_reported) {
            return;
        }
        watch.unreadable_reported = true;
        util::log::warn("[" + box_id + "] cannot read execution log " + watch.path.string() + ": " + reason);
        events.push_back(CompletionEvent{box_id, watch.session_id, CompletionEvent::Kind::UnknownStatus,
                                         "execution log unreadable: " + reason});
    };

    struct stat info {};
    if (::stat(watch.path.c_str(), &info) != 0) {
        report_unreadable(std::strerror(errno));
    } else {
        const auto identity = static_cast<std::uintmax_t>(info.st_ino);
        const auto size = static_cast<std::uintmax_t>(info.st_size);
        if ((watch.identity != 0 && identity != watch.identity) || size < watch.offset) {
            util::log::info("[" + box_id + "] execution log rotated, rereading from start");
            watch.offset = 0;
            watch.partial.clear();
        }
        watch.identity = identity;

        if (size > watch.offset) {
            std::ifstream input(watch.path, std::ios::binary);
            if (!input) {
                report_unreadable("open failed");
            } else {
                input.seekg(static_cast<std::streamoff>(watch.offset));
                std::string chunk(static_cast<std::size_t>(size - watch.offset), '\0');
                input.read(chunk.data(), static_cast<std::streamsize>(chunk.size()));
                chunk.resize(static_cast<std::size_t>(input.gcount()));
                watch.offset += chunk.size();
                watch.unreadable_reported = false;
                watch.partial += chunk;

                std::size_t newline = 0;
                while ((newline = watch.partial.find('\n')) != std::string::npos) {
                    const std::string line = watch.partial.substr(0, newline);
                    watch.partial.erase(0, newline + 1);
                    if (auto event = match_line(box_id, watch, line)) {
                        events.push_back(std::move(*event));
                        return ScanResult::Finished;
                    }
                }
            }
        }
    }

    if (std::chrono::steady_clock::now() - watch.armed_at >= config_.protocol_timeout) {
        util::log::warn("[" + box_id + "] no protocol outcome after " +
                        std::to_string(config_.protocol_timeout.count()) + " s");
        events.push_back(CompletionEvent{box_id, watch.session_id, CompletionEvent::Kind::UnknownStatus,
                                         "no protocol outcome within " +
                                             std::to_string(config_.protocol_timeout.count()) + " s"});
        return ScanResult::Finished;
    }
    return ScanResult::Pending;
}

std::optional<CompletionEvent> CompletionWatcher::match_line(const std::string& box_id,
                                                             const Watch& watch,
                                                             const std::string& line) const {
    const std::string tag = " " + box_id + " OUT ";
    const auto pos = line.find(tag);
    if (pos == std::string::npos) {
        return std::nullopt;
    }
    const std::string text = trim(line.substr(pos + tag.size()));
    if (starts_with(text, config_.completion_marker)) {
        return CompletionEvent{box_id, watch.session_id, CompletionEvent::Kind::Completed, {}};
    }
    if (starts_with(text, config_.failure_marker)) {
        return CompletionEvent{box_id, watch.session_id, CompletionEvent::Kind::Failed,
                               trim(text.substr(config_.failure_marker.size()))};
    }
    return std::nullopt;
}

}  // namespace academy::control
