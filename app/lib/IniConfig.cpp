#include "IniConfig.hpp"
#include "Logger.hpp"
#include "Utils.hpp"
#include <cstdio>
#include <fstream>
#include <optional>
#include <sstream>
#include <utility>
#include <spdlog/spdlog.h>
#include <fmt/format.h>

namespace {
template <typename... Args>
void ini_log(spdlog::level::level_enum level, fmt::format_string<Args...> fmt, Args&&... args) {
    auto message = fmt::format(fmt, std::forward<Args>(args)...);
    if (auto logger = Logger::get_logger("core_logger")) {
        logger->log(level, "{}", message);
    } else {
        std::fprintf(stderr, "%s\n", message.c_str());
    }
}

bool should_skip_line(const std::string& line)
{
    return line.empty() || line.front() == ';' || line.front() == '#';
}

// Inline comments need whitespace before the marker so values like "C#" survive.
std::string strip_inline_comment(const std::string& value)
{
    for (std::size_t i = 1; i < value.size(); ++i) {
        if ((value[i] == ';' || value[i] == '#') && (value[i - 1] == ' ' || value[i - 1] == '\t')) {
            return Utils::trim_copy(value.substr(0, i));
        }
    }
    return value;
}

bool parse_section_header(const std::string& line, std::string& section)
{
    if (line.size() >= 2 && line.front() == '[' && line.back() == ']') {
        section = Utils::trim_copy(line.substr(1, line.size() - 2));
        return true;
    }
    return false;
}

std::optional<std::pair<std::string, std::string>> parse_key_value(const std::string& line)
{
    const auto delimiter = line.find('=');
    if (delimiter == std::string::npos) {
        return std::nullopt;
    }
    std::string key = Utils::trim_copy(line.substr(0, delimiter));
    std::string value = strip_inline_comment(Utils::trim_copy(line.substr(delimiter + 1)));
    if (key.empty()) {
        return std::nullopt;
    }
    return std::make_pair(std::move(key), std::move(value));
}
}


bool IniConfig::load(const std::string &filename) {
    std::ifstream file(filename);
    if (!file.is_open()) {
        ini_log(spdlog::level::err, "Failed to open config file: {}", filename);
        return false;
    }

    std::ostringstream buffer;
    buffer << file.rdbuf();
    parse(buffer.str());
    return true;
}


void IniConfig::parse(const std::string& text)
{
    std::istringstream stream(text);
    std::string raw_line;
    std::string section;
    std::size_t line_number = 0;
    while (std::getline(stream, raw_line)) {
        ++line_number;
        const std::string line = Utils::trim_copy(raw_line);
        if (should_skip_line(line)) {
            continue;
        }
        if (parse_section_header(line, section)) {
            continue;
        }
        if (auto key_value = parse_key_value(line)) {
            data[section][key_value->first] = key_value->second;
        } else {
            ini_log(spdlog::level::warn, "Ignoring malformed config line {}: '{}'", line_number, line);
        }
    }
}


std::string IniConfig::getValue(const std::string &section, const std::string &key, const std::string &default_value) const {
    auto sec_it = data.find(section);
    if (sec_it != data.end()) {
        auto key_it = sec_it->second.find(key);
        if (key_it != sec_it->second.end()) {
            return key_it->second;
        }
    }
    return default_value;
}


void IniConfig::setValue(const std::string &section, const std::string &key, const std::string &value) {
    data[section][key] = value;
}


bool IniConfig::save(const std::string &filename) const
{
    std::ofstream file(filename);

    if (!file.is_open()) {
        ini_log(spdlog::level::err, "Failed to open config file: {}", filename);
        return false;
    }

    for (const auto &section : data) {
        file << "[" << section.first << "]\n";
        for (const auto &pair : section.second) {
            file << pair.first << " = " << pair.second << "\n";
        }
        file << "\n";
    }

    return static_cast<bool>(file);
}

bool IniConfig::hasValue(const std::string& section, const std::string& key) const
{
    const auto sec_it = data.find(section);
    if (sec_it == data.end()) {
        return false;
    }
    const auto key_it = sec_it->second.find(key);
    return key_it != sec_it->second.end();
}

std::vector<std::string> IniConfig::sections() const
{
    std::vector<std::string> names;
    names.reserve(data.size());
    for (const auto& section : data) {
        names.push_back(section.first);
    }
    return names;
}
