#include "Logger.hpp"
#include "AppException.hpp"

#include <spdlog/sinks/rotating_file_sink.h>
#include <spdlog/sinks/stdout_color_sinks.h>

#include <array>
#include <system_error>
#include <utility>

namespace {
constexpr const char* kCoreLoggerName = "core_logger";
constexpr std::size_t kMaxLogFileSize = 5 * 1024 * 1024;
constexpr std::size_t kMaxLogFiles = 3;
}


void Logger::setup_loggers()
{
    spdlog::drop(kCoreLoggerName);

    try {
        auto console_sink = std::make_shared<spdlog::sinks::stdout_color_sink_mt>();
        console_sink->set_pattern("[%^%l%$] %v");

        auto core_logger = std::make_shared<spdlog::logger>(kCoreLoggerName, console_sink);
        core_logger->set_level(spdlog::level::info);
        core_logger->flush_on(spdlog::level::warn);
        spdlog::register_logger(core_logger);
    } catch (const spdlog::spdlog_ex& ex) {
        THROW_APP_ERROR(ErrorCodes::Code::SYSTEM_INIT_FAILED, std::string("core_logger: ") + ex.what());
    }
}


bool Logger::add_file_sink(const std::filesystem::path& log_dir)
{
    auto logger = get_logger(kCoreLoggerName);
    if (!logger) {
        return false;
    }

    std::error_code ec;
    std::filesystem::create_directories(log_dir, ec);
    if (ec) {
        logger->warn("Cannot create log directory '{}': {}", log_dir.string(), ec.message());
        return false;
    }

    try {
        auto file_sink = std::make_shared<spdlog::sinks::rotating_file_sink_mt>(
            (log_dir / kLogFileName).string(), kMaxLogFileSize, kMaxLogFiles);
        file_sink->set_pattern("[%Y-%m-%d %H:%M:%S.%e] [%l] %v");
        logger->sinks().push_back(std::move(file_sink));
    } catch (const spdlog::spdlog_ex& ex) {
        logger->warn("File logging disabled: {}", ex.what());
        return false;
    }
    return true;
}


std::shared_ptr<spdlog::logger> Logger::get_logger(const std::string& name)
{
    return spdlog::get(name);
}


void Logger::set_level(spdlog::level::level_enum level)
{
    if (auto logger = get_logger(kCoreLoggerName)) {
        logger->set_level(level);
    }
}


std::optional<spdlog::level::level_enum> Logger::parse_level(const std::string& name)
{
    static const std::array<std::pair<const char*, spdlog::level::level_enum>, 8> levels = {{
        {"trace", spdlog::level::trace},
        {"debug", spdlog::level::debug},
        {"info", spdlog::level::info},
        {"warn", spdlog::level::warn},
        {"warning", spdlog::level::warn},
        {"error", spdlog::level::err},
        {"critical", spdlog::level::critical},
        {"off", spdlog::level::off},
    }};
    for (const auto& [level_name, level] : levels) {
        if (name == level_name) {
            return level;
        }
    }
    return std::nullopt;
}
