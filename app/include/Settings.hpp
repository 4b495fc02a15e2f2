#ifndef SETTINGS_HPP
#define SETTINGS_HPP

#include <IniConfig.hpp>
#include <filesystem>
#include <optional>
#include <string>
#include <vector>

#include <spdlog/common.h>


class Settings
{
public:
    // An empty override selects the per-user default location.
    explicit Settings(std::string config_path_override = "");

    // Missing file keeps the defaults and returns true; throws AppException on invalid values.
    bool load();
    // Throws AppException when the file cannot be written.
    void save();

    std::vector<std::string> get_extensions() const;
    void set_extensions(std::vector<std::string> values);

    bool get_eof_newline_normalization() const;
    void set_eof_newline_normalization(bool value);

    bool get_case_sensitive_extensions() const;
    void set_case_sensitive_extensions(bool value);

    spdlog::level::level_enum get_log_level() const;
    void set_log_level(spdlog::level::level_enum level);

    bool get_log_to_file() const;
    void set_log_to_file(bool value);

    static std::string define_config_path();
    std::string get_config_path() const;
    std::filesystem::path get_config_dir() const;
    std::filesystem::path get_log_dir() const;

private:
    bool read_bool(const std::string& section, const std::string& key, bool fallback) const;

    std::string config_path;
    std::filesystem::path config_dir;
    IniConfig config;

    std::vector<std::string> extensions;
    bool eof_newline_normalization{true};
    bool case_sensitive_extensions{true};
    spdlog::level::level_enum log_level{spdlog::level::info};
    bool log_to_file{true};
};

#endif
