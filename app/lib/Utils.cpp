#include "Utils.hpp"

#include <algorithm>
#include <sstream>


std::string Utils::path_to_utf8(const std::filesystem::path& path)
{
    const auto utf8 = path.u8string();
    return std::string(utf8.begin(), utf8.end());
}


std::filesystem::path Utils::utf8_to_path(const std::string& value)
{
    return std::filesystem::path(std::u8string(value.begin(), value.end()));
}


std::string Utils::to_lower_ascii(std::string value)
{
    std::transform(value.begin(), value.end(), value.begin(), [](unsigned char ch) {
        return (ch >= 'A' && ch <= 'Z') ? static_cast<char>(ch - 'A' + 'a') : static_cast<char>(ch);
    });
    return value;
}


std::string Utils::trim_copy(const std::string& value)
{
    const auto begin = value.find_first_not_of(" \t\r\n");
    if (begin == std::string::npos) {
        return {};
    }
    const auto end = value.find_last_not_of(" \t\r\n");
    return value.substr(begin, end - begin + 1);
}


std::vector<std::string> Utils::split_list(const std::string& value)
{
    std::vector<std::string> result;
    std::stringstream ss(value);
    std::string item;
    while (std::getline(ss, item, ',')) {
        item = trim_copy(item);
        if (!item.empty()) {
            result.push_back(item);
        }
    }
    return result;
}


std::optional<bool> Utils::parse_bool(const std::string& value)
{
    const std::string lowered = to_lower_ascii(trim_copy(value));
    if (lowered == "true" || lowered == "yes" || lowered == "on" || lowered == "1") {
        return true;
    }
    if (lowered == "false" || lowered == "no" || lowered == "off" || lowered == "0") {
        return false;
    }
    return std::nullopt;
}


std::string Utils::normalize_extension(const std::string& extension)
{
    std::string result = trim_copy(extension);
    if (!result.empty() && result.front() == '.') {
        result.erase(result.begin());
    }
    return result;
}
