#ifndef INICONFIG_HPP
#define INICONFIG_HPP

#include <map>
#include <string>
#include <vector>

// Minimal INI reader/writer: [sections], key = value, ';' and '#' comments.
class IniConfig {
public:
    bool load(const std::string& filename);
    // Parses INI text directly; used by load() and by tests.
    void parse(const std::string& text);
    bool save(const std::string& filename) const;

    std::string getValue(const std::string& section, const std::string& key, const std::string& default_value = "") const;
    void setValue(const std::string& section, const std::string& key, const std::string& value);
    bool hasValue(const std::string& section, const std::string& key) const;
    std::vector<std::string> sections() const;

private:
    std::map<std::string, std::map<std::string, std::string>> data;
};

#endif
