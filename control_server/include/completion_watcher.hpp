#pragma once

#include <atomic>
#include <chrono>
#include <cstdint>
#include <filesystem>
#include <functional>
#include <map>
#include <mutex>
#include <optional>
#include <string>
#include <thread>
#include <vector>

#include <boost/asio/io_context.hpp>
#include <boost/asio/steady_timer.hpp>

#include "util/config_loader.hpp"

namespace academy::control {

struct CompletionEvent {
    enum class Kind { Completed, Failed, UnknownStatus };

    std::string box_id;
    std::uint64_t session_id{0};
    Kind kind{Kind::Completed};
    std::string detail;
};

class CompletionWatcher {
public:
    using EventHandler = std::function<void(const CompletionEvent&)>;

    CompletionWatcher(WatcherSection config, EventHandler handler);
    ~CompletionWatcher();

    CompletionWatcher(const CompletionWatcher&) = delete;
    CompletionWatcher& operator=(const CompletionWatcher&) = delete;

    void start();
    void stop();

    // Starts watching `log_path` from `offset`; replaces any existing watch for the device.
    void arm(const std::string& box_id,
             std::uint64_t session_id,
             std::filesystem::path log_path,
             std::uintmax_t offset);
    void disarm(const std::string& box_id);
    bool armed(const std::string& box_id) const;

    void poll();

private:
    struct Watch {
        std::uint64_t session_id{0};
        std::filesystem::path path;
        std::uintmax_t offset{0};
        std::uintmax_t identity{0};
        std::string partial;
        std::chrono::steady_clock::time_point armed_at;
        bool unreadable_reported{false};
    };

    enum class ScanResult { Pending, Finished };

    void schedule();
    ScanResult scan(const std::string& box_id, Watch& watch, std::vector<CompletionEvent>& events);
    std::optional<CompletionEvent> match_line(const std::string& box_id, const Watch& watch,
                                              const std::string& line) const;

    WatcherSection config_;
    EventHandler handler_;
    boost::asio::io_context io_context_;
    boost::asio::steady_timer timer_;
    std::thread thread_;
    std::atomic_bool running_{false};

    mutable std::mutex mutex_;
    std::map<std::string, Watch> watches_;
};

}  // namespace academy::control
