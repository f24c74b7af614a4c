#include "experiment_catalog.hpp"

#include <system_error>
#include <utility>

namespace academy::control {

ExperimentCatalog::ExperimentCatalog(std::filesystem::path academy_dir)
    : academy_dir_(std::move(academy_dir)) {}

// Names arrive from remote clients; anything that could escape the academy tree is unknown.
bool ExperimentCatalog::is_plain_name(const std::string& name) {
    return !name.empty() && name != "." && name != ".." && name.find('/') == std::string::npos &&
           name.find('\\') == std::string::npos;
}

std::filesystem::path ExperimentCatalog::protocol_file(const std::string& protocol) const {
    return academy_dir_ / "Protocols" / protocol / (protocol + ".m");
}

std::filesystem::path ExperimentCatalog::settings_file(const std::string& protocol,
                                                       const std::string& subject,
                                                       const std::string& settings) const {
    return academy_dir_ / "Data" / subject / protocol / "Session Settings" / (settings + ".mat");
}

std::filesystem::path ExperimentCatalog::calibration_file(const std::string& box_id) const {
    return academy_dir_ / "Calibration Files" / ("LiquidCalibration_" + box_id + ".mat");
}

bool ExperimentCatalog::has_protocol(const std::string& protocol) const {
    if (!is_plain_name(protocol)) {
        return false;
    }
    std::error_code ec;
    return std::filesystem::is_regular_file(protocol_file(protocol), ec);
}

bool ExperimentCatalog::has_subject(const std::string& protocol, const std::string& subject) const {
    if (!is_plain_name(protocol) || !is_plain_name(subject)) {
        return false;
    }
    std::error_code ec;
    return std::filesystem::is_directory(academy_dir_ / "Data" / subject / protocol, ec);
}

bool ExperimentCatalog::has_settings(const std::string& protocol,
                                     const std::string& subject,
                                     const std::string& settings) const {
    if (!is_plain_name(protocol) || !is_plain_name(subject) || !is_plain_name(settings)) {
        return false;
    }
    std::error_code ec;
    return std::filesystem::is_regular_file(settings_file(protocol, subject, settings), ec);
}

bool ExperimentCatalog::has_calibration(const std::string& box_id) const {
    if (!is_plain_name(box_id)) {
        return false;
    }
    std::error_code ec;
    return std::filesystem::is_regular_file(calibration_file(box_id), ec);
}

}  // namespace academy::control
