#pragma once

#include <functional>
#include <string>

namespace academy::control {

class EngineWorker {
public:
    enum class StopOutcome { Graceful, Forced };

    // Invoked from an internal thread when the engine exits without being asked to.
    using ExitHandler = std::function<void(const std::string& detail)>;

    virtual ~EngineWorker() = default;

    virtual void start(const std::string& port) = 0;
    virtual StopOutcome stop() = 0;

    virtual void set_console_visible(bool visible) = 0;
    virtual void calibrate() = 0;
    virtual void run_protocol(const std::string& protocol,
                              const std::string& subject,
                              const std::string& settings) = 0;
    virtual void stop_protocol() = 0;

    virtual bool is_active() const = 0;
    virtual bool gui_visible() const = 0;

    virtual void set_exit_handler(ExitHandler handler) = 0;
};

}  // namespace academy::control
