#pragma once

#include <filesystem>
#include <string>

namespace academy::control {

class ExperimentCatalog {
public:
    explicit ExperimentCatalog(std::filesystem::path academy_dir);

    bool has_protocol(const std::string& protocol) const;
    bool has_subject(const std::string& protocol, const std::string& subject) const;
    bool has_settings(const std::string& protocol, const std::string& subject, const std::string& settings) const;
    bool has_calibration(const std::string& box_id) const;

    std::filesystem::path protocol_file(const std::string& protocol) const;
    std::filesystem::path settings_file(const std::string& protocol,
                                        const std::string& subject,
                                        const std::string& settings) const;
    std::filesystem::path calibration_file(const std::string& box_id) const;

private:
    static bool is_plain_name(const std::string& name);

    std::filesystem::path academy_dir_;
};

}  // namespace academy::control
