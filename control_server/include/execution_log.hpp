#pragma once

#include <cstdint>
#include <filesystem>
#include <fstream>
#include <mutex>
#include <string>

#include <sys/types.h>

namespace academy::control {

// Line formats:
//   <timestamp> <box_id> CMD <verb> <args> -> <outcome>
//   <timestamp> <box_id> OUT <engine line>
class ExecutionLog {
public:
    ExecutionLog(std::filesystem::path path, std::string box_id);

    void append_command(const std::string& verb, const std::string& args, const std::string& outcome);
    void append_output(const std::string& line);

    std::uintmax_t size() const;

    const std::filesystem::path& path() const { return path_; }

private:
    void write_line(const std::string& kind, const std::string& body);
    void open_stream();
    void reopen_if_rotated();

    std::filesystem::path path_;
    std::string box_id_;
    mutable std::mutex mutex_;
    std::ofstream stream_;
    dev_t device_{0};
    ino_t inode_{0};
};

}  // namespace academy::control
