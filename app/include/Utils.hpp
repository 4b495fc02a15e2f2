#ifndef UTILS_HPP
#define UTILS_HPP

#include <filesystem>
#include <optional>
#include <string>
#include <vector>

namespace Utils {

std::string path_to_utf8(const std::filesystem::path& path);
std::filesystem::path utf8_to_path(const std::string& value);

// Lower-cases ASCII letters only; other bytes are left untouched.
std::string to_lower_ascii(std::string value);

std::string trim_copy(const std::string& value);

// Splits a comma separated list, trimming items and dropping empty ones.
std::vector<std::string> split_list(const std::string& value);

// Accepts true/false, yes/no, on/off and 1/0 in any letter case.
std::optional<bool> parse_bool(const std::string& value);

// Strips one leading dot so ".rs" and "rs" name the same extension.
std::string normalize_extension(const std::string& extension);

} // namespace Utils

#endif
