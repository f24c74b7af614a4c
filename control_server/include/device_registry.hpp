#pragma once

#include <filesystem>
#include <mutex>
#include <optional>
#include <string>
#include <string_view>
#include <unordered_map>
#include <vector>

namespace academy::control {

struct DeviceIdentity {
    std::string box_id;
    std::string serial_locator;

    bool operator==(const DeviceIdentity& other) const {
        return box_id == other.box_id && serial_locator == other.serial_locator;
    }
};

class DeviceRegistry {
public:
    struct LoadReport {
        std::size_t loaded{0};
        std::vector<std::string> skipped_rows;
    };

    explicit DeviceRegistry(std::filesystem::path storage_path);

    // Replaces the in-memory set with the file contents; malformed rows are skipped.
    LoadReport load();

    void save() const;

    void add(const std::string& box_id, const std::string& serial_locator);
    void remove(const std::string& box_id);
    void change_locator(const std::string& box_id, const std::string& serial_locator);

    bool contains(std::string_view box_id) const;
    std::optional<DeviceIdentity> find(std::string_view box_id) const;
    std::vector<DeviceIdentity> devices() const;

    const std::filesystem::path& storage_path() const { return storage_path_; }

private:
    static std::vector<std::string> split_row(const std::string& line);
    static std::string escape_field(const std::string& field);

    std::filesystem::path storage_path_;
    mutable std::mutex mutex_;
    std::unordered_map<std::string, DeviceIdentity> devices_;
};

}  // namespace academy::control
