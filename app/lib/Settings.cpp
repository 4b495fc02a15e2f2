#include "Settings.hpp"
#include "AppException.hpp"
#include "Logger.hpp"
#include "Utils.hpp"
#include <cstdio>
#include <cstdlib>
#include <system_error>
#include <utility>
#include <spdlog/spdlog.h>
#include <fmt/format.h>
#ifdef _WIN32
    #include <shlobj.h>
    #include <windows.h>
#endif


namespace {
constexpr const char* kAppName = "StripTrailingWhitespace";
constexpr const char* kConfigDirEnv = "STRIP_TRAILING_WHITESPACE_CONFIG_DIR";
constexpr const char* kNormalizationSection = "Normalization";
constexpr const char* kLoggingSection = "Logging";

template <typename... Args>
void settings_log(spdlog::level::level_enum level, fmt::format_string<Args...> fmt, Args&&... args) {
    auto message = fmt::format(fmt, std::forward<Args>(args)...);
    if (auto logger = Logger::get_logger("core_logger")) {
        logger->log(level, "{}", message);
    } else {
        std::fprintf(stderr, "%s\n", message.c_str());
    }
}

std::string join_list(const std::vector<std::string>& items) {
    std::string joined;
    for (const auto& item : items) {
        if (!joined.empty()) {
            joined += ", ";
        }
        joined += item;
    }
    return joined;
}
}


Settings::Settings(std::string config_path_override)
    : config_path(config_path_override.empty() ? define_config_path() : std::move(config_path_override))
{
    config_dir = std::filesystem::path(config_path).parent_path();
}


std::string Settings::define_config_path()
{
    if (const char* override_root = std::getenv(kConfigDirEnv)) {
        std::filesystem::path base = override_root;
        return (base / kAppName / "config.ini").string();
    }
#ifdef _WIN32
    char appDataPath[MAX_PATH];
    if (SUCCEEDED(SHGetFolderPathA(NULL, CSIDL_APPDATA, NULL, 0, appDataPath))) {
        return (std::filesystem::path(appDataPath) / kAppName / "config.ini").string();
    }
#elif defined(__APPLE__)
    if (const char* home = std::getenv("HOME")) {
        return (std::filesystem::path(home) / "Library" / "Application Support" / kAppName / "config.ini").string();
    }
#else
    if (const char* home = std::getenv("HOME")) {
        return (std::filesystem::path(home) / ".config" / kAppName / "config.ini").string();
    }
#endif
    return "config.ini";
}


std::string Settings::get_config_path() const
{
    return config_path;
}


std::filesystem::path Settings::get_config_dir() const
{
    return config_dir;
}


std::filesystem::path Settings::get_log_dir() const
{
    return config_dir / "logs";
}


bool Settings::load()
{
    std::error_code ec;
    if (!std::filesystem::exists(config_path, ec)) {
        settings_log(spdlog::level::debug, "No configuration at '{}'; using defaults", config_path);
        return true;
    }

    if (!config.load(config_path)) {
        return false;
    }

    if (config.hasValue(kNormalizationSection, "Extensions")) {
        extensions.clear();
        for (const auto& item : Utils::split_list(config.getValue(kNormalizationSection, "Extensions"))) {
            std::string extension = Utils::normalize_extension(item);
            if (!extension.empty()) {
                extensions.push_back(std::move(extension));
            }
        }
    }
    eof_newline_normalization = read_bool(kNormalizationSection, "EofNewlineNormalization", eof_newline_normalization);
    case_sensitive_extensions = read_bool(kNormalizationSection, "CaseSensitiveExtensions", case_sensitive_extensions);
    log_to_file = read_bool(kLoggingSection, "LogToFile", log_to_file);

    if (config.hasValue(kLoggingSection, "Level")) {
        const std::string value = config.getValue(kLoggingSection, "Level");
        const auto level = Logger::parse_level(Utils::to_lower_ascii(Utils::trim_copy(value)));
        if (!level) {
            THROW_APP_ERROR(ErrorCodes::Code::CONFIG_INVALID_VALUE,
                            fmt::format("[{}] Level = '{}' in {}", kLoggingSection, value, config_path));
        }
        log_level = *level;
    }

    settings_log(spdlog::level::debug,
                 "Loaded settings from '{}' (extensions: [{}], eof normalization: {}, case sensitive: {})",
                 config_path, join_list(extensions), eof_newline_normalization, case_sensitive_extensions);
    return true;
}


void Settings::save()
{
    std::error_code ec;
    std::filesystem::create_directories(config_dir, ec);
    if (ec) {
        THROW_APP_ERROR(ErrorCodes::Code::CONFIG_SAVE_FAILED, config_dir.string() + ": " + ec.message());
    }

    config.setValue(kNormalizationSection, "Extensions", join_list(extensions));
    config.setValue(kNormalizationSection, "EofNewlineNormalization", eof_newline_normalization ? "true" : "false");
    config.setValue(kNormalizationSection, "CaseSensitiveExtensions", case_sensitive_extensions ? "true" : "false");
    const auto level_name = spdlog::level::to_string_view(log_level);
    config.setValue(kLoggingSection, "Level", std::string(level_name.data(), level_name.size()));
    config.setValue(kLoggingSection, "LogToFile", log_to_file ? "true" : "false");

    if (!config.save(config_path)) {
        THROW_APP_ERROR(ErrorCodes::Code::CONFIG_SAVE_FAILED, config_path);
    }
    settings_log(spdlog::level::info, "Saved settings to '{}'", config_path);
}


bool Settings::read_bool(const std::string& section, const std::string& key, bool fallback) const
{
    if (!config.hasValue(section, key)) {
        return fallback;
    }
    const std::string value = config.getValue(section, key);
    const auto parsed = Utils::parse_bool(value);
    if (!parsed) {
        THROW_APP_ERROR(ErrorCodes::Code::CONFIG_INVALID_VALUE,
                        fmt::format("[{}] {} = '{}' in {}", section, key, value, config_path));
    }
    return *parsed;
}


std::vector<std::string> Settings::get_extensions() const { return extensions; }
void Settings::set_extensions(std::vector<std::string> values) { extensions = std::move(values); }

bool Settings::get_eof_newline_normalization() const { return eof_newline_normalization; }
void Settings::set_eof_newline_normalization(bool value) { eof_newline_normalization = value; }

bool Settings::get_case_sensitive_extensions() const { return case_sensitive_extensions; }
void Settings::set_case_sensitive_extensions(bool value) { case_sensitive_extensions = value; }

spdlog::level::level_enum Settings::get_log_level() const { return log_level; }
void Settings::set_log_level(spdlog::level::level_enum level) { log_level = level; }

bool Settings::get_log_to_file() const { return log_to_file; }
void Settings::set_log_to_file(bool value) { log_to_file = value; }
