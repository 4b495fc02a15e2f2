#ifndef LOGGER_HPP
#define LOGGER_HPP

#include <filesystem>
#include <memory>
#include <optional>
#include <string>

#include <spdlog/spdlog.h>

class Logger {
public:
    // Registers "core_logger" with a console sink; replaces any previous registration.
    // Throws ErrorCodes::AppException (SYSTEM_INIT_FAILED) when spdlog rejects the setup.
    static void setup_loggers();

    // Attaches a rotating file sink under log_dir. Returns false when the directory is unusable.
    static bool add_file_sink(const std::filesystem::path& log_dir);

    static std::shared_ptr<spdlog::logger> get_logger(const std::string& name);

    static void set_level(spdlog::level::level_enum level);

    // Accepts spdlog level names ("trace" .. "off"); std::nullopt for anything else.
    static std::optional<spdlog::level::level_enum> parse_level(const std::string& name);

    static constexpr const char* kLogFileName = "strip-trailing-whitespace.log";
};

#endif
