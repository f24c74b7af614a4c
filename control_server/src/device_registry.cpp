#include "device_registry.hpp"

#include <algorithm>
#include <fstream>
#include <utility>

#include "academy/common/errors.hpp"
#include "util/logging.hpp"

namespace academy::control {

using common::AcademyError;
using common::ErrorCode;

namespace {

// Rows are newline-delimited, so no field may carry a control character.
void check_field(const std::string& name, const std::string& value) {
    if (value.empty()) {
        throw AcademyError(ErrorCode::BadRequest, name + " must not be empty");
    }
    const bool has_control = std::any_of(value.begin(), value.end(), [](char c) {
        const auto byte = static_cast<unsigned char>(c);
        return byte < 0x20 || byte == 0x7f;
    });
    if (has_control) {
        throw AcademyError(ErrorCode::BadRequest, name + " must not contain control characters");
    }
}

}  // namespace

DeviceRegistry::DeviceRegistry(std::filesystem::path storage_path)
    : storage_path_(std::move(storage_path)) {}

std::vector<std::string> DeviceRegistry::split_row(const std::string& line) {
    std::vector<std::string> fields;
    std::string current;
    bool quoted = false;
    for (std::size_t i = 0; i < line.size(); ++i) {
        const char c = line[i];
        if (quoted) {
            if (c == '"' && i + 1 < line.size() && line[i + 1] == '"') {
                current.push_back('"');
                ++i;
            } else if (c == '"') {
                quoted = false;
            } else {
                current.push_back(c);
            }
        } else if (c == '"') {
            quoted = true;
        } else if (c == ',') {
            fields.push_back(std::move(current));
            current.clear();
        } else {
            current.push_back(c);
        }
    }
    if (quoted) {
        // Unterminated quote marks the whole row malformed.
        return {};
    }
    fields.push_back(std::move(current));
    return fields;
}

std::string DeviceRegistry::escape_field(const std::string& field) {
    if (field.find_first_of(",\"\n") == std::string::npos) {
        return field;
    }
    std::string out = "\"";
    for (char c : field) {
        if (c == '"') {
            out.push_back('"');
        }
        out.push_back(c);
    }
    out.push_back('"');
    return out;
}

DeviceRegistry::LoadReport DeviceRegistry::load() {
    LoadReport report;
    std::unordered_map<std::string, DeviceIdentity> loaded;

    if (std::filesystem::exists(storage_path_)) {
        std::ifstream input(storage_path_);
        if (!input) {
            throw std::runtime_error("Failed to open registry file: " + storage_path_.string());
        }

        std::string line;
        std::size_t line_number = 0;
        while (std::getline(input, line)) {
            ++line_number;
            if (!line.empty() && line.back() == '\r') {
                line.pop_back();
            }
            if (line.empty()) {
                continue;
            }
            auto fields = split_row(line);
            std::string reason;
            if (fields.size() != 2) {
                reason = "expected 2 fields";
            } else if (fields[0].empty() || fields[1].empty()) {
                reason = "empty box id or serial locator";
            } else if (loaded.count(fields[0]) != 0) {
                reason = "duplicate box id " + fields[0];
            }
            if (!reason.empty()) {
                util::log::warn(std::string(common::to_string(ErrorCode::ConfigCorrupt)) + ": skipping " +
                                storage_path_.string() + ":" + std::to_string(line_number) + " (" + reason +
                                ")");
                report.skipped_rows.push_back(line);
                continue;
            }
            DeviceIdentity identity{fields[0], fields[1]};
            loaded.emplace(identity.box_id, std::move(identity));
        }
    }

    report.loaded = loaded.size();
    std::lock_guard lock(mutex_);
    devices_ = std::move(loaded);
    return report;
}

void DeviceRegistry::save() const {
    std::vector<DeviceIdentity> rows = devices();

    const auto parent = storage_path_.parent_path();
    if (!parent.empty()) {
        std::filesystem::create_directories(parent);
    }

    auto temp_path = storage_path_;
    temp_path += ".tmp";
    {
        std::ofstream output(temp_path, std::ios::trunc);
        if (!output) {
            throw std::runtime_error("Failed to write registry file: " + temp_path.string());
        }
        for (const auto& row : rows) {
            output << escape_field(row.box_id) << ',' << escape_field(row.serial_locator) << '\n';
        }
        output.flush();
        if (!output) {
            throw std::runtime_error("Failed to write registry file: " + temp_path.string());
        }
    }
    std::filesystem::rename(temp_path, storage_path_);
}

void DeviceRegistry::add(const std::string& box_id, const std::string& serial_locator) {
    check_field("box id", box_id);
    check_field("serial locator", serial_locator);
    std::lock_guard lock(mutex_);
    auto [it, inserted] = devices_.try_emplace(box_id, DeviceIdentity{box_id, serial_locator});
    if (!inserted) {
        throw AcademyError(ErrorCode::DuplicateBoxId, "device " + box_id + " already exists");
    }
}

void DeviceRegistry::remove(const std::string& box_id) {
    std::lock_guard lock(mutex_);
    if (devices_.erase(box_id) == 0) {
        throw AcademyError(ErrorCode::UnknownDevice, "unknown device " + box_id);
    }
}

void DeviceRegistry::change_locator(const std::string& box_id, const std::string& serial_locator) {
    check_field("serial locator", serial_locator);
    std::lock_guard lock(mutex_);
    auto it = devices_.find(box_id);
    if (it == devices_.end()) {
        throw AcademyError(ErrorCode::UnknownDevice, "unknown device " + box_id);
    }
    it->second.serial_locator = serial_locator;
}

bool DeviceRegistry::contains(std::string_view box_id) const {
    std::lock_guard lock(mutex_);
    return devices_.count(std::string(box_id)) != 0;
}

std::optional<DeviceIdentity> DeviceRegistry::find(std::string_view box_id) const {
    std::lock_guard lock(mutex_);
    auto it = devices_.find(std::string(box_id));
    if (it == devices_.end()) {
        return std::nullopt;
    }
    return it->second;
}

std::vector<DeviceIdentity> DeviceRegistry::devices() const {
    std::lock_guard lock(mutex_);
    std::vector<DeviceIdentity> out;
    out.reserve(devices_.size());
    for (const auto& [_, identity] : devices_) {
        out.push_back(identity);
    }
    std::sort(out.begin(), out.end(),
              [](const DeviceIdentity& a, const DeviceIdentity& b) { return a.box_id < b.box_id; });
    return out;
}

}  // namespace academy::control
